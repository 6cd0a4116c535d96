/**
 * @file MetricsStoreFs.cpp
 * @brief Implementation of MetricsStoreFs.
 */

#include "infrastructure/MetricsStoreFs.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace ledgerlens::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

MetricsStoreFs::MetricsStoreFs(fs::path file, std::shared_ptr<PersistenceService> persistence)
    : m_file(std::move(file)), m_persistence(std::move(persistence)) {
    load();
}

void MetricsStoreFs::load() {
    if (!fs::exists(m_file)) return;

    std::ifstream inFile(m_file);
    std::string line;
    int lineNo = 0;
    while (std::getline(inFile, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            m_snapshots.push_back(JsonCodec::SnapshotFromJson(json::parse(line)));
            m_content += line + "\n";
        } catch (const json::exception& e) {
            std::cerr << "[MetricsStore] Ignoring malformed line " << lineNo << " of " << m_file << ": "
                      << e.what() << std::endl;
        }
    }
}

void MetricsStoreFs::append(const domain::MetricsSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshots.push_back(snapshot);
    m_content += JsonCodec::SnapshotToJson(snapshot).dump() + "\n";
    if (m_persistence) {
        m_persistence->enqueueWrite(m_file, m_content);
    }
    std::cout << "[MetricsStore] Recorded " << domain::TrainingTypeToString(snapshot.trainingType)
              << " snapshot, accuracy " << snapshot.accuracy << std::endl;
}

std::vector<domain::MetricsSnapshot> MetricsStoreFs::recent(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::MetricsSnapshot> out;
    for (auto it = m_snapshots.rbegin(); it != m_snapshots.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::optional<domain::MetricsSnapshot> MetricsStoreFs::latest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_snapshots.empty()) return std::nullopt;
    return m_snapshots.back();
}

} // namespace ledgerlens::infrastructure
