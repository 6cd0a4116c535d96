/**
 * @file JsonCodec.hpp
 * @brief Manual JSON mapping of the domain types stored on disk or printed by the CLI.
 */

#pragma once
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/Categorization.hpp"
#include "domain/Expense.hpp"
#include "domain/MetricsSnapshot.hpp"
#include "domain/VectorPoint.hpp"

namespace ledgerlens::infrastructure {

class JsonCodec {
public:
    static nlohmann::json ExpenseToJson(const domain::ExpenseRecord& expense);
    /** @throws nlohmann::json::exception if `id` is missing or a field has the wrong type. */
    static domain::ExpenseRecord ExpenseFromJson(const nlohmann::json& j);

    static domain::CandidateExpense CandidateFromJson(const nlohmann::json& j);

    static nlohmann::json SnapshotToJson(const domain::MetricsSnapshot& snapshot);
    static domain::MetricsSnapshot SnapshotFromJson(const nlohmann::json& j);

    /** @brief Only the payload fields that are set are written. */
    static nlohmann::json PayloadToJson(const domain::PointPayload& payload);
    /** @brief Fields that are missing or of the wrong type are left unset. */
    static domain::PointPayload PayloadFromJson(const nlohmann::json& j);

    /** @brief One entry of a Qdrant search result; empty without an integer id and numeric score. */
    static std::optional<domain::Neighbor> NeighborFromSearchHit(const nlohmann::json& hit);

    static nlohmann::json PredictionToJson(const domain::Prediction& prediction);
    static nlohmann::json DecisionToJson(const domain::Decision& decision);
    static nlohmann::json CategorizationToJson(const domain::Categorization& result);
};

} // namespace ledgerlens::infrastructure
