/**
 * @file LocalVectorStore.hpp
 * @brief In-process SimilarityIndex with an optional JSON snapshot on disk.
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include "domain/SimilarityIndex.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ledgerlens::infrastructure {

/**
 * @class LocalVectorStore
 * @brief Brute-force cosine k-NN over partitions held in memory.
 *
 * Partitions named in `durablePartitions` are written to the snapshot file
 * through the PersistenceService after every change and reloaded on
 * construction. All other partitions (fold partitions) live in memory only.
 */
class LocalVectorStore : public domain::SimilarityIndex {
public:
    explicit LocalVectorStore(std::size_t dimension,
                              std::shared_ptr<PersistenceService> persistence = nullptr,
                              std::filesystem::path snapshotPath = {},
                              std::set<std::string> durablePartitions = {});

    void createPartition(const std::string& name) override;
    void deletePartition(const std::string& name) override;
    void upsert(const std::string& partition, const std::vector<domain::VectorPoint>& points) override;
    std::vector<domain::Neighbor> query(const std::string& partition,
                                        const std::vector<float>& vector,
                                        std::size_t k) override;
    std::size_t pointCount(const std::string& partition) override;
    std::size_t dimension() const override { return m_dimension; }

    /** @brief Names of the partitions currently held. */
    std::vector<std::string> partitions() const;

    static double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

private:
    using Partition = std::map<domain::ExpenseId, domain::VectorPoint>;

    void checkDimension(const std::vector<float>& vector, const char* operation) const;
    void persistLocked(const std::string& partition);
    void load();

    std::size_t m_dimension;
    std::shared_ptr<PersistenceService> m_persistence;
    std::filesystem::path m_snapshotPath;
    std::set<std::string> m_durablePartitions;

    std::map<std::string, Partition> m_partitions;
    mutable std::mutex m_mutex;
};

} // namespace ledgerlens::infrastructure
