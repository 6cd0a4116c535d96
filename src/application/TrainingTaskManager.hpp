/**
 * @file TrainingTaskManager.hpp
 * @brief Runs training off the request path with progress, cancellation and status tracking.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "application/CategorizationEngine.hpp"

namespace ledgerlens::application {

/**
 * @struct TrainingTaskStatus
 * @brief Information about a running or completed training task.
 */
struct TrainingTaskStatus {
    int id = 0;
    domain::TrainingType type = domain::TrainingType::Full;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    CancellationToken token;

    /** @brief Current stage, outcome message or error. Guarded by `mutex`. */
    std::string message;
    std::optional<domain::MetricsSnapshot> snapshot;
    mutable std::mutex mutex;

    std::string Message() const {
        std::lock_guard<std::mutex> lock(mutex);
        return message;
    }
};

/**
 * @class TrainingTaskManager
 * @brief One background thread per submitted training run.
 *
 * Threads are joined on destruction after their tokens are cancelled, so the
 * engine always outlives the work it runs.
 */
class TrainingTaskManager {
public:
    explicit TrainingTaskManager(std::shared_ptr<CategorizationEngine> engine)
        : m_engine(std::move(engine)) {}

    ~TrainingTaskManager() {
        CancelAll();
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            workers.swap(m_workers);
        }
        for (auto& w : workers) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    TrainingTaskManager(const TrainingTaskManager&) = delete;
    TrainingTaskManager& operator=(const TrainingTaskManager&) = delete;

    /**
     * @brief Submits a training run.
     * @param timeout Optional deadline after which the run aborts between folds or batches.
     */
    std::shared_ptr<TrainingTaskStatus> SubmitTraining(domain::TrainingType type,
                                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        ReapFinished();

        auto status = std::make_shared<TrainingTaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        if (timeout) {
            status->token = CancellationToken::withTimeout(*timeout);
        }

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.push_back(status);
        m_workers.push_back(Worker{status, std::thread([this, status]() { Run(status); })});
        return status;
    }

    /** @brief Blocks until the task has completed. */
    void Wait(const std::shared_ptr<TrainingTaskStatus>& status) {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_completedCv.wait(lock, [&status] { return status->isCompleted.load(); });
    }

    void CancelAll() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        for (auto& task : m_activeTasks) {
            task->token.cancel();
        }
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TrainingTaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Threads not yet joined, finished ones included until the next submission. */
    std::size_t GetRetainedThreadCount() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_workers.size();
    }

private:
    struct Worker {
        std::shared_ptr<TrainingTaskStatus> status;
        std::thread thread;
    };

    /** @brief Joins the threads of completed tasks. */
    void ReapFinished() {
        std::vector<Worker> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto split = std::stable_partition(m_workers.begin(), m_workers.end(),
                [](const Worker& w) { return !w.status->isCompleted.load(); });
            std::move(split, m_workers.end(), std::back_inserter(finished));
            m_workers.erase(split, m_workers.end());
        }
        for (auto& w : finished) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    void Run(const std::shared_ptr<TrainingTaskStatus>& status) {
        auto onProgress = [status](float progress, const std::string& stage) {
            status->progress = progress;
            std::lock_guard<std::mutex> lock(status->mutex);
            status->message = stage;
        };

        try {
            TrainingOutcome outcome = m_engine->train(status->type, status->token, onProgress);
            std::lock_guard<std::mutex> lock(status->mutex);
            status->failed = !outcome.success;
            status->message = outcome.message;
            status->snapshot = std::move(outcome.snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[TrainingTaskManager] Task " << status->id << " failed: " << e.what() << std::endl;
            std::lock_guard<std::mutex> lock(status->mutex);
            status->failed = true;
            status->message = e.what();
        }
        status->progress = 1.0f;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            status->isCompleted = true;
            m_activeTasks.erase(
                std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                    [](const auto& s) { return s->isCompleted.load(); }),
                m_activeTasks.end()
            );
        }
        m_completedCv.notify_all();
    }

    std::shared_ptr<CategorizationEngine> m_engine;
    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TrainingTaskStatus>> m_activeTasks;
    std::vector<Worker> m_workers;
    std::mutex m_tasksMutex;
    std::condition_variable m_completedCv;
};

} // namespace ledgerlens::application
