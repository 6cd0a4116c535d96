/**
 * @file LocalVectorStore.cpp
 * @brief Implementation of LocalVectorStore.
 */

#include "infrastructure/LocalVectorStore.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace ledgerlens::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

LocalVectorStore::LocalVectorStore(std::size_t dimension,
                                   std::shared_ptr<PersistenceService> persistence,
                                   fs::path snapshotPath,
                                   std::set<std::string> durablePartitions)
    : m_dimension(dimension),
      m_persistence(std::move(persistence)),
      m_snapshotPath(std::move(snapshotPath)),
      m_durablePartitions(std::move(durablePartitions)) {
    if (m_dimension == 0) {
        throw std::invalid_argument("LocalVectorStore dimension must be positive");
    }
    load();
}

double LocalVectorStore::CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (std::size_t i = 0; i < a.size() && i < b.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

void LocalVectorStore::checkDimension(const std::vector<float>& vector, const char* operation) const {
    if (vector.size() != m_dimension) {
        throw std::invalid_argument(std::string(operation) + ": vector has " + std::to_string(vector.size()) +
                                    " dimensions, index expects " + std::to_string(m_dimension));
    }
}

void LocalVectorStore::createPartition(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_partitions.emplace(name, Partition{}).second) {
        persistLocked(name);
    }
}

void LocalVectorStore::deletePartition(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_partitions.erase(name) > 0) {
        persistLocked(name);
    }
}

void LocalVectorStore::upsert(const std::string& partition, const std::vector<domain::VectorPoint>& points) {
    for (const auto& p : points) checkDimension(p.vector, "upsert");

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& target = m_partitions[partition];
    for (const auto& p : points) {
        target[p.id] = p;
    }
    persistLocked(partition);
}

std::vector<domain::Neighbor> LocalVectorStore::query(const std::string& partition,
                                                      const std::vector<float>& vector,
                                                      std::size_t k) {
    checkDimension(vector, "query");

    std::vector<domain::Neighbor> results;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_partitions.find(partition);
        if (it == m_partitions.end() || k == 0) return results;

        results.reserve(it->second.size());
        for (const auto& [id, point] : it->second) {
            domain::Neighbor n;
            n.id = id;
            n.similarity = static_cast<float>(CosineSimilarity(vector, point.vector));
            n.payload = point.payload;
            results.push_back(std::move(n));
        }
    }

    auto byScore = [](const domain::Neighbor& a, const domain::Neighbor& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.id < b.id;
    };
    if (results.size() > k) {
        std::partial_sort(results.begin(), results.begin() + k, results.end(), byScore);
        results.resize(k);
    } else {
        std::sort(results.begin(), results.end(), byScore);
    }
    return results;
}

std::size_t LocalVectorStore::pointCount(const std::string& partition) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_partitions.find(partition);
    return it == m_partitions.end() ? 0 : it->second.size();
}

std::vector<std::string> LocalVectorStore::partitions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& [name, points] : m_partitions) names.push_back(name);
    return names;
}

void LocalVectorStore::persistLocked(const std::string& partition) {
    if (!m_persistence || m_snapshotPath.empty() || !m_durablePartitions.count(partition)) return;

    json j;
    j["dimension"] = m_dimension;
    j["partitions"] = json::object();
    for (const auto& name : m_durablePartitions) {
        auto it = m_partitions.find(name);
        if (it == m_partitions.end()) continue;

        json points = json::array();
        for (const auto& [id, point] : it->second) {
            points.push_back({
                {"id", id},
                {"vector", point.vector},
                {"payload", JsonCodec::PayloadToJson(point.payload)}
            });
        }
        j["partitions"][name] = points;
    }
    m_persistence->enqueueWrite(m_snapshotPath, j.dump());
}

void LocalVectorStore::load() {
    if (m_snapshotPath.empty() || !fs::exists(m_snapshotPath)) return;

    try {
        std::ifstream f(m_snapshotPath);
        json j = json::parse(f);

        std::size_t stored = j.value("dimension", std::size_t{0});
        if (stored != m_dimension) {
            std::cerr << "[LocalVectorStore] Snapshot has dimension " << stored << ", index uses "
                      << m_dimension << "; ignoring " << m_snapshotPath << std::endl;
            return;
        }

        if (!j.contains("partitions") || !j["partitions"].is_object()) return;

        std::size_t loaded = 0;
        for (auto it = j["partitions"].begin(); it != j["partitions"].end(); ++it) {
            auto& partition = m_partitions[it.key()];
            for (const auto& item : it.value()) {
                domain::VectorPoint p;
                p.id = item.at("id").get<domain::ExpenseId>();
                p.vector = item.at("vector").get<std::vector<float>>();
                if (p.vector.size() != m_dimension) continue;
                p.payload = JsonCodec::PayloadFromJson(item.value("payload", json::object()));
                partition[p.id] = std::move(p);
                ++loaded;
            }
        }
        std::cout << "[LocalVectorStore] Loaded " << loaded << " points from " << m_snapshotPath << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[LocalVectorStore] Error reading snapshot: " << e.what() << std::endl;
    }
}

} // namespace ledgerlens::infrastructure
