/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"

namespace ledgerlens::infrastructure {

using json = nlohmann::json;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> OptionalStringFrom(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

json JsonCodec::ExpenseToJson(const domain::ExpenseRecord& e) {
    return {
        {"id", e.id},
        {"date", e.date},
        {"amount", e.amount},
        {"vendor", e.vendor},
        {"category", e.category},
        {"description", e.description},
        {"transcription", e.transcription},
        {"confidence_score", e.confidenceScore},
        {"ml_prediction", OptionalString(e.mlPrediction)},
        {"llm_category", e.llmCategory},
        {"needs_confirmation", e.needsConfirmation}
    };
}

domain::ExpenseRecord JsonCodec::ExpenseFromJson(const json& j) {
    domain::ExpenseRecord e;
    e.id = j.at("id").get<domain::ExpenseId>();
    e.date = j.value("date", "");
    e.amount = j.value("amount", 0.0);
    e.vendor = j.value("vendor", "");
    e.category = j.value("category", "");
    e.description = j.value("description", "");
    e.transcription = j.value("transcription", "");
    e.confidenceScore = j.value("confidence_score", 0.0);
    e.mlPrediction = OptionalStringFrom(j, "ml_prediction");
    e.llmCategory = j.value("llm_category", "");
    e.needsConfirmation = j.value("needs_confirmation", false);
    return e;
}

domain::CandidateExpense JsonCodec::CandidateFromJson(const json& j) {
    domain::CandidateExpense c;
    c.transcription = j.value("transcription", "");
    c.vendor = j.value("vendor", "");
    c.description = j.value("description", "");
    c.amount = j.value("amount", 0.0);
    c.date = j.value("date", "");
    c.llmCategory = j.value("llm_category", "");
    return c;
}

json JsonCodec::SnapshotToJson(const domain::MetricsSnapshot& s) {
    json perCategory = json::array();
    for (const auto& m : s.perCategory) {
        perCategory.push_back({
            {"category", m.category},
            {"precision", m.precision},
            {"recall", m.recall},
            {"f1", m.f1},
            {"accuracy", m.accuracy},
            {"mean_confidence", m.meanConfidence},
            {"support", m.support}
        });
    }

    json pairs = json::array();
    for (const auto& p : s.confusedPairs) {
        pairs.push_back({{"true", p.trueCategory}, {"predicted", p.predictedCategory}, {"count", p.count}});
    }

    return {
        {"timestamp", s.timestamp},
        {"training_type", domain::TrainingTypeToString(s.trainingType)},
        {"accuracy", s.accuracy},
        {"sample_count", s.sampleCount},
        {"category_count", s.categoryCount},
        {"cv_scores", s.foldAccuracies},
        {"confusion_labels", s.confusionLabels},
        {"confusion_matrix", s.confusionMatrix},
        {"per_category", perCategory},
        {"best_category", s.bestCategory},
        {"worst_category", s.worstCategory},
        {"top_categories", s.topCategories},
        {"confused_pairs", pairs},
        {"notes", s.notes}
    };
}

domain::MetricsSnapshot JsonCodec::SnapshotFromJson(const json& j) {
    domain::MetricsSnapshot s;
    s.timestamp = j.value("timestamp", "");
    s.trainingType = domain::TrainingTypeFromString(j.value("training_type", "full"));
    s.accuracy = j.value("accuracy", 0.0);
    s.sampleCount = j.value("sample_count", 0);
    s.categoryCount = j.value("category_count", 0);
    s.foldAccuracies = j.value("cv_scores", std::vector<double>{});
    s.confusionLabels = j.value("confusion_labels", std::vector<std::string>{});
    s.confusionMatrix = j.value("confusion_matrix", std::vector<std::vector<int>>{});

    if (j.contains("per_category")) {
        for (const auto& item : j["per_category"]) {
            domain::CategoryMetrics m;
            m.category = item.value("category", "");
            m.precision = item.value("precision", 0.0);
            m.recall = item.value("recall", 0.0);
            m.f1 = item.value("f1", 0.0);
            m.accuracy = item.value("accuracy", 0.0);
            m.meanConfidence = item.value("mean_confidence", 0.0);
            m.support = item.value("support", 0);
            s.perCategory.push_back(m);
        }
    }

    s.bestCategory = j.value("best_category", "");
    s.worstCategory = j.value("worst_category", "");
    s.topCategories = j.value("top_categories", std::vector<std::string>{});

    if (j.contains("confused_pairs")) {
        for (const auto& item : j["confused_pairs"]) {
            s.confusedPairs.push_back({item.value("true", ""), item.value("predicted", ""), item.value("count", 0)});
        }
    }

    s.notes = j.value("notes", "");
    return s;
}

json JsonCodec::PayloadToJson(const domain::PointPayload& payload) {
    json j = json::object();
    if (payload.category) j["category"] = *payload.category;
    if (payload.amount) j["amount"] = *payload.amount;
    if (payload.date) j["date"] = *payload.date;
    return j;
}

domain::PointPayload JsonCodec::PayloadFromJson(const json& j) {
    domain::PointPayload payload;
    if (!j.is_object()) return payload;
    payload.category = OptionalStringFrom(j, "category");
    if (j.contains("amount") && j["amount"].is_number()) payload.amount = j["amount"].get<double>();
    payload.date = OptionalStringFrom(j, "date");
    return payload;
}

std::optional<domain::Neighbor> JsonCodec::NeighborFromSearchHit(const json& hit) {
    if (!hit.is_object()) return std::nullopt;
    auto id = hit.find("id");
    auto score = hit.find("score");
    if (id == hit.end() || !id->is_number_integer()) return std::nullopt;
    if (score == hit.end() || !score->is_number()) return std::nullopt;

    domain::Neighbor n;
    n.id = id->get<domain::ExpenseId>();
    n.similarity = score->get<float>();
    auto payload = hit.find("payload");
    if (payload != hit.end()) n.payload = PayloadFromJson(*payload);
    return n;
}

json JsonCodec::PredictionToJson(const domain::Prediction& p) {
    return {
        {"category", OptionalString(p.category)},
        {"confidence", p.confidence},
        {"available", p.available}
    };
}

json JsonCodec::DecisionToJson(const domain::Decision& d) {
    return {
        {"final_category", d.finalCategory},
        {"confidence", d.confidence},
        {"ml_prediction", OptionalString(d.mlPrediction)},
        {"llm_category", d.llmCategory},
        {"source", domain::DecisionSourceToString(d.source)},
        {"needs_confirmation", d.needsConfirmation}
    };
}

json JsonCodec::CategorizationToJson(const domain::Categorization& r) {
    json j = DecisionToJson(r.decision);
    j["ml_confidence"] = r.mlConfidence;
    j["vendor"] = r.vendor;
    j["canonical_text"] = r.canonicalText;
    j["rule_category"] = OptionalString(r.ruleCategory);
    return j;
}

} // namespace ledgerlens::infrastructure
