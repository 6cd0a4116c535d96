#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/CategorizationEngine.hpp"
#include "application/TextNormalizer.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "TestDoubles.hpp"

using namespace ledgerlens;
using application::CancellationToken;
using application::CategorizationEngine;
using domain::TrainingType;

namespace {

/** @brief Index answering every query with a fixed search reply, decoded like the Qdrant adapter does. */
class ScriptedReplyIndex : public domain::SimilarityIndex {
public:
    ScriptedReplyIndex(std::size_t dimension, nlohmann::json reply) : m_dimension(dimension), m_reply(std::move(reply)) {}

    void createPartition(const std::string&) override {}
    void deletePartition(const std::string&) override {}
    void upsert(const std::string&, const std::vector<domain::VectorPoint>&) override {}

    std::vector<domain::Neighbor> query(const std::string&, const std::vector<float>&, std::size_t) override {
        if (throwDecodeError) {
            // Same failure as reading a number field with get<std::string>().
            std::string category = m_reply.at("result").at(0).at("payload").at("category").get<std::string>();
            (void)category;
        }
        std::vector<domain::Neighbor> out;
        for (const auto& hit : m_reply.at("result")) {
            if (auto n = infrastructure::JsonCodec::NeighborFromSearchHit(hit)) out.push_back(*n);
        }
        return out;
    }

    std::size_t pointCount(const std::string&) override { return m_reply.at("result").size(); }
    std::size_t dimension() const override { return m_dimension; }

    bool throwDecodeError = false;

private:
    std::size_t m_dimension;
    nlohmann::json m_reply;
};

struct Fixture {
    std::shared_ptr<test::HashingEmbedder> embedder = std::make_shared<test::HashingEmbedder>();
    std::shared_ptr<test::FlakyIndex> index = std::make_shared<test::FlakyIndex>(embedder->dimension());
    std::shared_ptr<test::InMemoryExpenseRepository> expenses = std::make_shared<test::InMemoryExpenseRepository>();
    std::shared_ptr<test::InMemoryMetricsRepository> metrics = std::make_shared<test::InMemoryMetricsRepository>();
    std::shared_ptr<CategorizationEngine> engine;

    Fixture() {
        engine = std::make_shared<CategorizationEngine>(embedder, index, expenses, metrics,
                                                        application::EngineConfig{}, test::CountingNamer("cv"));
        expenses->vendors = {"Lidl", "Orlen"};
    }

    /** 8 Groceries + 4 Fuel. */
    void seedHistory() {
        expenses->add(1, "Groceries", "bought milk at lidl", "Lidl", "milk");
        expenses->add(2, "Groceries", "bread and milk from lidl", "Lidl", "bread");
        expenses->add(3, "Groceries", "eggs and butter lidl shopping", "Lidl", "eggs");
        expenses->add(4, "Groceries", "cheese milk lidl shopping", "Lidl", "cheese");
        expenses->add(5, "Groceries", "bread butter lidl", "Lidl", "butter");
        expenses->add(6, "Groceries", "tomatoes and milk at lidl", "Lidl", "tomatoes");
        expenses->add(7, "Groceries", "apples bread lidl shopping", "Lidl", "apples");
        expenses->add(8, "Groceries", "rice pasta lidl", "Lidl", "rice");
        expenses->add(9, "Fuel", "diesel at orlen station", "Orlen", "diesel");
        expenses->add(10, "Fuel", "petrol orlen station tank", "Orlen", "petrol");
        expenses->add(11, "Fuel", "full tank diesel orlen", "Orlen", "diesel");
        expenses->add(12, "Fuel", "petrol station orlen", "Orlen", "petrol");
    }

    std::string mainPartition() const { return engine->config().training.mainPartition; }
};

void TestTrainingRetainsEligibleCategories() {
    Fixture f;
    f.seedHistory();

    auto outcome = f.engine->train(TrainingType::Full, CancellationToken());
    assert(outcome.success);
    assert(outcome.snapshot);

    const auto& s = *outcome.snapshot;
    assert(s.categoryCount == 2);
    assert(s.sampleCount == 12);
    assert((s.confusionLabels == std::vector<std::string>{"Fuel", "Groceries", domain::kUnknownLabel}));
    assert(s.foldAccuracies.size() == 5);
    assert(s.accuracy >= 0.0 && s.accuracy <= 1.0);
    assert(s.trainingType == TrainingType::Full);
    assert(s.notes.find("Initial model") != std::string::npos);
    assert(s.notes.find("Embedding model: hashing-bow-v1") != std::string::npos);
    assert(s.perCategory.size() == 2);

    int confusionTotal = 0;
    for (const auto& row : s.confusionMatrix) for (int v : row) confusionTotal += v;
    assert(confusionTotal == 12);

    assert(f.metrics->snapshots.size() == 1);
    assert(f.index->pointCount(f.mainPartition()) == 12);
    assert((f.index->livePartitions() == std::vector<std::string>{f.mainPartition()}));
    std::cout << "[PASS] 8 Groceries + 4 Fuel trains with both categories" << std::endl;

    auto second = f.engine->train(TrainingType::Full, CancellationToken());
    assert(second.success);
    assert(second.snapshot->notes.rfind("Accuracy change: +0.0000 (", 0) == 0);
    assert(f.metrics->snapshots.size() == 2);
    assert(f.index->pointCount(f.mainPartition()) == 12);
    std::cout << "[PASS] Retraining records the accuracy change and keeps one point per expense" << std::endl;
}

void TestInsufficientData() {
    Fixture single;
    for (int i = 1; i <= 12; ++i) single.expenses->add(i, "Groceries", "milk purchase " + std::to_string(i));
    auto outcome = single.engine->train(TrainingType::Full, CancellationToken());
    assert(!outcome.success && !outcome.snapshot);
    assert(!outcome.message.empty());
    assert(single.metrics->snapshots.empty());
    assert(single.index->pointCount(single.mainPartition()) == 0);

    Fixture few;
    for (int i = 1; i <= 5; ++i) few.expenses->add(i, "Groceries", "milk " + std::to_string(i));
    for (int i = 6; i <= 9; ++i) few.expenses->add(i, "Fuel", "diesel " + std::to_string(i));
    assert(!few.engine->train(TrainingType::Full, CancellationToken()).success);
    std::cout << "[PASS] One eligible category or fewer than 10 expenses fails explicitly" << std::endl;
}

void TestPreparationFiltersAndCorrects() {
    Fixture f;
    f.seedHistory();
    f.expenses->add(20, "Alcohol", "beer at the pub");
    f.expenses->add(21, "Alcohol", "wine bottle");
    f.expenses->add(22, "Household Chemicals", "cucumber from the market", "", "cucumber");
    f.expenses->add(23, "", "receipt without a category");

    auto outcome = f.engine->train(TrainingType::Full, CancellationToken());
    assert(outcome.success);
    assert(outcome.snapshot->categoryCount == 2);
    assert(outcome.snapshot->sampleCount == 13);
    assert(outcome.snapshot->notes.find("1 label(s) corrected") != std::string::npos);
    assert(outcome.snapshot->notes.find("1 invalid record(s) skipped") != std::string::npos);

    auto hits = f.index->query(f.mainPartition(), f.embedder->embed("cucumber from the market cucumber"), 1);
    assert(hits.size() == 1 && hits[0].id == 22);
    assert(*hits[0].payload.category == "Groceries");
    assert(hits[0].payload.amount && hits[0].payload.date);

    auto wine = f.index->query(f.mainPartition(), f.embedder->embed("wine bottle"), 20);
    for (const auto& n : wine) assert(*n.payload.category != "Alcohol");
    std::cout << "[PASS] Small categories excluded, rule labels applied, invalid records skipped" << std::endl;
}

void TestCategorizeUsesModelWhenConfident() {
    Fixture f;
    f.seedHistory();
    assert(f.engine->train(TrainingType::Full, CancellationToken()).success);

    domain::CandidateExpense candidate;
    candidate.transcription = "bought milk at lidl";
    candidate.vendor = "Lidl";
    candidate.description = "milk";
    candidate.llmCategory = "Dairy";

    auto result = f.engine->categorize(candidate);
    assert(result.decision.source == domain::DecisionSource::Model);
    assert(result.decision.finalCategory == "Groceries");
    assert(result.decision.confidence >= 0.85);
    assert(!result.decision.needsConfirmation);
    std::cout << "[PASS] Confident model prediction wins" << std::endl;
}

void TestRuleCorrectionAndVendorFuzzyMatch() {
    Fixture f;
    f.seedHistory();
    assert(f.engine->train(TrainingType::Full, CancellationToken()).success);

    domain::CandidateExpense candidate;
    candidate.transcription = "cucumber";
    candidate.vendor = "Lidll";
    candidate.description = "cucumber";
    candidate.llmCategory = "Household Chemicals";

    auto result = f.engine->categorize(candidate);
    assert(result.ruleCategory && *result.ruleCategory == "Groceries");
    assert(result.vendor == "Lidl");
    assert(result.canonicalText == "cucumber Lidl cucumber");
    assert(result.decision.finalCategory == "Groceries");
    assert(result.decision.llmCategory == "Groceries");
    std::cout << "[PASS] 'cucumber' suggested as Household Chemicals is corrected to Groceries" << std::endl;
}

void TestDegradedWhenIndexUnreachable() {
    Fixture f;
    f.seedHistory();
    assert(f.engine->train(TrainingType::Full, CancellationToken()).success);

    f.index->failAllQueries = true;
    domain::CandidateExpense candidate;
    candidate.transcription = "bought milk at lidl";
    candidate.llmCategory = "Groceries";

    auto result = f.engine->categorize(candidate);
    assert(result.decision.finalCategory == "Groceries");
    assert(result.decision.confidence == 0.0);
    assert(result.decision.source == domain::DecisionSource::Degraded);
    assert(!f.engine->classify("bought milk").available);

    f.index->failAllQueries = false;
    f.embedder->failAll = true;
    auto offline = f.engine->categorize(candidate);
    assert(offline.decision.source == domain::DecisionSource::Degraded);
    assert(offline.decision.confidence == 0.0);
    f.embedder->failAll = false;

    f.index->queryFailuresRemaining = 1;
    auto retried = f.engine->classify("bought milk at lidl");
    assert(retried.available);
    assert(retried.category && *retried.category == "Groceries");

    auto untrained = Fixture().engine->classify("bought milk");
    assert(untrained.available && !untrained.category && untrained.confidence == 0.0);
    std::cout << "[PASS] Unreachable index or model degrades to the suggestion at 0.0" << std::endl;
}

void TestMalformedSearchReplyDegrades() {
    auto embedder = std::make_shared<test::HashingEmbedder>();
    auto reply = nlohmann::json::parse(R"({"result":[
        {"id":7,"score":0.9,"payload":{"category":5}},
        {"id":8,"score":null,"payload":{"category":"Fuel"}},
        {"id":9,"score":0.4,"payload":{"category":"Groceries","date":17}}
    ]})");
    auto index = std::make_shared<ScriptedReplyIndex>(embedder->dimension(), reply);
    CategorizationEngine engine(embedder, index, std::make_shared<test::InMemoryExpenseRepository>(),
                                std::make_shared<test::InMemoryMetricsRepository>(), application::EngineConfig{},
                                test::CountingNamer("cv"));

    domain::CandidateExpense candidate;
    candidate.transcription = "bought milk at lidl";
    candidate.llmCategory = "Dairy";

    auto result = engine.categorize(candidate);
    assert(result.decision.source == domain::DecisionSource::Model);
    assert(result.decision.finalCategory == "Groceries");
    assert(result.decision.confidence == 1.0);

    index->throwDecodeError = true;
    auto degraded = engine.categorize(candidate);
    assert(degraded.decision.source == domain::DecisionSource::Degraded);
    assert(degraded.decision.finalCategory == "Dairy");
    assert(degraded.decision.confidence == 0.0);
    assert(!engine.classify("bought milk").available);
    std::cout << "[PASS] Badly typed search hits are skipped and decode errors degrade to the suggestion" << std::endl;
}

void TestIncrementalUpdateRaisesScore() {
    Fixture f;
    f.seedHistory();
    assert(f.engine->train(TrainingType::Full, CancellationToken()).success);

    f.expenses->add(100, "Other", "zorblax gizmo purchase", "GadgetHub", "");
    std::string text = application::TextNormalizer::canonicalText(*f.expenses->findExpense(100));

    auto before = f.engine->classify(text);
    assert(!before.category || *before.category != "Electronics");

    assert(f.engine->incrementalUpdate(100, "Electronics"));
    auto after = f.engine->classify(text);
    assert(after.category && *after.category == "Electronics");
    assert(after.confidence > 0.5);
    assert(f.index->pointCount(f.mainPartition()) == 13);
    assert(f.metrics->snapshots.size() == 1);

    assert(!f.engine->incrementalUpdate(999, "Electronics"));
    assert(!f.engine->incrementalUpdate(100, "   "));

    f.embedder->failAll = true;
    assert(!f.engine->incrementalUpdate(100, "Electronics"));
    f.embedder->failAll = false;
    std::cout << "[PASS] Incremental update makes the confirmed category win" << std::endl;
}

void TestConfirmationTriggersInitialTraining() {
    Fixture f;
    f.seedHistory();
    assert(f.index->pointCount(f.mainPartition()) == 0);

    assert(f.engine->confirmCategory(3, "Groceries"));
    assert(f.expenses->findExpense(3)->confidenceScore == 1.0);
    assert(!f.expenses->findExpense(3)->needsConfirmation);
    assert(f.index->pointCount(f.mainPartition()) == 12);

    auto latest = f.engine->latestMetrics();
    assert(latest && latest->trainingType == TrainingType::Incremental);
    assert(f.engine->recentMetrics(5).size() == 1);

    assert(!f.engine->confirmCategory(404, "Groceries"));
    assert(!f.engine->confirmCategory(3, ""));
    std::cout << "[PASS] First confirmation on an empty index runs an incremental-type training" << std::endl;
}

void TestEvaluateHasNoSideEffects() {
    Fixture f;
    f.seedHistory();
    auto snapshot = f.engine->evaluate(CancellationToken());
    assert(snapshot);
    assert(snapshot->categoryCount == 2);
    assert(f.metrics->snapshots.empty());
    assert(f.index->pointCount(f.mainPartition()) == 0);
    assert(f.index->livePartitions().empty());

    Fixture empty;
    assert(!empty.engine->evaluate(CancellationToken()));
    std::cout << "[PASS] evaluate() writes neither the index nor metrics" << std::endl;
}

void TestTrainingFailuresAreReported() {
    Fixture cancelled;
    cancelled.seedHistory();
    CancellationToken token;
    token.cancel();
    auto outcome = cancelled.engine->train(TrainingType::Full, token);
    assert(!outcome.success);
    assert(cancelled.metrics->snapshots.empty());
    assert(cancelled.index->livePartitions().empty());

    Fixture offline;
    offline.seedHistory();
    offline.embedder->failAll = true;
    assert(!offline.engine->train(TrainingType::Full, CancellationToken()).success);
    assert(offline.metrics->snapshots.empty());

    Fixture indexDown;
    indexDown.seedHistory();
    indexDown.index->failAllQueries = true;
    auto down = indexDown.engine->train(TrainingType::Full, CancellationToken());
    assert(!down.success);
    assert(indexDown.index->livePartitions().empty());
    std::cout << "[PASS] Cancellation and outages yield a failed outcome, never an exception" << std::endl;
}

void TestKnownCategories() {
    Fixture f;
    f.seedHistory();
    f.expenses->add(30, "  ", "blank category");
    f.expenses->add(31, "Alcohol", "beer");
    auto categories = f.engine->knownCategories();
    assert((categories == std::vector<std::string>{"Alcohol", "Fuel", "Groceries"}));
    std::cout << "[PASS] Category taxonomy is sorted and skips blanks" << std::endl;
}

void TestDecideIsExposed() {
    Fixture f;
    auto d = f.engine->decide(std::string("Alcohol"), 0.6, "Groceries");
    assert(d.finalCategory == "Groceries" && d.confidence == 0.6);
    std::cout << "[PASS] decide() applies the decision table" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CategorizationEngine Test..." << std::endl;
    TestTrainingRetainsEligibleCategories();
    TestInsufficientData();
    TestPreparationFiltersAndCorrects();
    TestCategorizeUsesModelWhenConfident();
    TestRuleCorrectionAndVendorFuzzyMatch();
    TestDegradedWhenIndexUnreachable();
    TestMalformedSearchReplyDegrades();
    TestIncrementalUpdateRaisesScore();
    TestConfirmationTriggersInitialTraining();
    TestEvaluateHasNoSideEffects();
    TestTrainingFailuresAreReported();
    TestKnownCategories();
    TestDecideIsExposed();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
