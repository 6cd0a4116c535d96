/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace ledgerlens::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::enqueueWrite(const fs::path& path, std::string content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Stopped, dropping write to " << path << std::endl;
            return;
        }
        const std::string key = path.string();
        auto it = m_pending.find(key);
        if (it != m_pending.end()) {
            it->second = std::move(content);
            m_coalescedWrites++;
        } else {
            m_pending.emplace(key, std::move(content));
            m_order.push_back(key);
        }
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_order.empty() && !m_busy; });
}

void PersistenceService::workerLoop() {
    while (true) {
        std::string path;
        std::string content;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_order.empty() || !m_running; });

            if (m_order.empty()) {
                m_idleCv.notify_all();
                return;
            }

            path = std::move(m_order.front());
            m_order.pop_front();
            auto it = m_pending.find(path);
            content = std::move(it->second);
            m_pending.erase(it);
            m_busy = true;
        }

        if (!replaceFile(path, content)) {
            m_failedWrites++;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::replaceFile(const fs::path& path, const std::string& content) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(stamp) + ".tmp";

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Cannot create " << path.parent_path() << ": " << ec.message()
                      << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Cannot open " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Short write to " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Cannot replace " << path << ": " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace ledgerlens::infrastructure
