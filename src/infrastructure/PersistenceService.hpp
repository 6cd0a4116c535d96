/**
 * @file PersistenceService.hpp
 * @brief Background writer for the engine's data files (expenses, metrics, vector snapshot).
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace ledgerlens::infrastructure {

/**
 * @class PersistenceService
 * @brief One worker thread replacing whole files atomically (temp file, then rename).
 *
 * All stores share one instance, so writes to a file are serialized and a
 * reader never observes a partial file. Stores always hand over the complete
 * file content; while a path is still queued a newer content replaces the
 * pending one, and only the latest version reaches the disk.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues the full new content of `path`.
     *
     * Ignored with a warning once stop() has been called.
     */
    void enqueueWrite(const std::filesystem::path& path, std::string content);

    /** @brief Blocks until every queued write has been performed. */
    void flush();

    /** @brief Drains the queue and joins the worker. Idempotent. */
    void stop();

    /** @brief Number of writes that failed since startup. */
    int failedWrites() const { return m_failedWrites.load(); }

    /** @brief Number of queued contents superseded before they were written. */
    int coalescedWrites() const { return m_coalescedWrites.load(); }

private:
    void workerLoop();
    static bool replaceFile(const std::filesystem::path& path, const std::string& content);

    std::map<std::string, std::string> m_pending; ///< path -> latest content
    std::deque<std::string> m_order;              ///< paths in first-queued order
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;
    bool m_running = true;

    std::thread m_worker;
    std::atomic<int> m_failedWrites{0};
    std::atomic<int> m_coalescedWrites{0};
};

} // namespace ledgerlens::infrastructure
