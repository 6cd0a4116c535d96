/**
 * @file MetricsStoreFs.hpp
 * @brief Append-only MetricsRepository stored as newline-delimited JSON.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/ExpenseRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ledgerlens::infrastructure {

/**
 * @class MetricsStoreFs
 * @brief One snapshot per line in `metrics.ndjson`, oldest first.
 */
class MetricsStoreFs : public domain::MetricsRepository {
public:
    MetricsStoreFs(std::filesystem::path file, std::shared_ptr<PersistenceService> persistence);

    void append(const domain::MetricsSnapshot& snapshot) override;
    std::vector<domain::MetricsSnapshot> recent(std::size_t limit) const override;
    std::optional<domain::MetricsSnapshot> latest() const override;

private:
    void load();

    std::filesystem::path m_file;
    std::shared_ptr<PersistenceService> m_persistence;

    std::vector<domain::MetricsSnapshot> m_snapshots;
    std::string m_content; ///< Serialized lines, so appends never re-encode old snapshots.
    mutable std::mutex m_mutex;
};

} // namespace ledgerlens::infrastructure
