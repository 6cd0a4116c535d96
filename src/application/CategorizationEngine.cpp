/**
 * @file CategorizationEngine.cpp
 * @brief Implementation of CategorizationEngine.
 */

#include "application/CategorizationEngine.hpp"
#include "application/TextNormalizer.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ledgerlens::application {

namespace {

template <typename T>
T& Require(const std::shared_ptr<T>& ptr, const char* what) {
    if (!ptr) {
        throw domain::ConfigurationError(std::string("CategorizationEngine requires a ") + what);
    }
    return *ptr;
}

std::string FormatAccuracy(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

std::string FormatDelta(double value) {
    std::ostringstream ss;
    ss << std::showpos << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

} // namespace

CategorizationEngine::CategorizationEngine(std::shared_ptr<domain::EmbeddingGenerator> embedder,
                                           std::shared_ptr<domain::SimilarityIndex> index,
                                           std::shared_ptr<domain::ExpenseRepository> expenses,
                                           std::shared_ptr<domain::MetricsRepository> metrics,
                                           EngineConfig config,
                                           CrossValidationEvaluator::PartitionNamer partitionNamer)
    : m_embedder(std::move(embedder)),
      m_index(std::move(index)),
      m_expenses(std::move(expenses)),
      m_metrics(std::move(metrics)),
      m_config(std::move(config)),
      m_corrector(m_config.corrector),
      m_policy(m_config.policy),
      m_classifier(Require(m_index, "similarity index"), m_config.classifier),
      m_evaluator(*m_index, m_config.classifier, m_config.training, std::move(partitionNamer)),
      m_updater(Require(m_embedder, "embedding generator"),
                *m_index,
                Require(m_expenses, "expense repository"),
                m_corrector,
                m_config.training) {
    Require(m_metrics, "metrics repository");
}

// --- Inference ---

domain::Prediction CategorizationEngine::classify(const std::string& text) {
    domain::Prediction prediction;
    if (TextNormalizer::trim(text).empty()) {
        return prediction;
    }

    for (int attempt = 1; attempt <= 2; ++attempt) {
        try {
            auto vector = m_embedder->embed(text);
            return m_classifier.classify(m_config.training.mainPartition, vector);
        } catch (const domain::TransientInfraError& e) {
            std::cerr << "[Classifier] Attempt " << attempt << " failed: " << e.what() << std::endl;
        } catch (const std::invalid_argument& e) {
            // Dimension mismatch between model and index: retrying cannot help.
            std::cerr << "[Classifier] Rejected query: " << e.what() << std::endl;
            break;
        } catch (const std::exception& e) {
            std::cerr << "[Classifier] Unexpected failure, degrading: " << e.what() << std::endl;
            break;
        }
    }

    prediction.available = false;
    return prediction;
}

domain::Decision CategorizationEngine::decide(const std::optional<std::string>& mlPrediction,
                                              double mlConfidence,
                                              const std::string& llmCategory) const {
    return m_policy.decide(mlPrediction, mlConfidence, llmCategory);
}

domain::Categorization CategorizationEngine::categorize(const domain::CandidateExpense& candidate) {
    domain::Categorization result;
    result.vendor = m_corrector.normalizeVendor(candidate.vendor, knownVendors());

    std::string suggestion = candidate.llmCategory;
    if (auto forced = m_corrector.correctCategory(candidate.description)) {
        if (*forced != TextNormalizer::trim(suggestion)) {
            std::cout << "[Categorizer] '" << candidate.description << "' corrected from '" << suggestion
                      << "' to '" << *forced << "'" << std::endl;
        }
        result.ruleCategory = forced;
        suggestion = *forced;
    }

    result.canonicalText = TextNormalizer::canonicalText(candidate.transcription, result.vendor, candidate.description);

    domain::Prediction prediction = classify(result.canonicalText);
    result.mlConfidence = prediction.confidence;
    result.decision = m_policy.decide(prediction, suggestion);
    return result;
}

// --- Online learning ---

bool CategorizationEngine::incrementalUpdate(domain::ExpenseId expenseId, const std::string& confirmedCategory) {
    try {
        if (m_index->pointCount(m_config.training.mainPartition) == 0) {
            std::cout << "[IncrementalUpdater] Main partition is empty, running initial training." << std::endl;
            auto outcome = train(domain::TrainingType::Incremental, CancellationToken());
            if (!outcome.success) {
                std::cerr << "[IncrementalUpdater] Initial training failed: " << outcome.message << std::endl;
            }
        }
        return m_updater.apply(expenseId, confirmedCategory);
    } catch (const domain::TransientInfraError& e) {
        std::cerr << "[IncrementalUpdater] Update of expense " << expenseId << " skipped: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[IncrementalUpdater] Update of expense " << expenseId << " rejected: " << e.what() << std::endl;
    }
    return false;
}

bool CategorizationEngine::confirmCategory(domain::ExpenseId expenseId, const std::string& category) {
    std::string confirmed = TextNormalizer::trim(category);
    if (confirmed.empty()) {
        std::cerr << "[Categorizer] Refusing to confirm an empty category for expense " << expenseId << std::endl;
        return false;
    }
    if (!m_expenses->updateCategory(expenseId, confirmed, 1.0)) {
        std::cerr << "[Categorizer] Expense " << expenseId << " not found." << std::endl;
        return false;
    }

    // The confirmation is stored even if the index cannot learn from it right now.
    if (!incrementalUpdate(expenseId, confirmed)) {
        std::cerr << "[Categorizer] Expense " << expenseId << " confirmed but not yet learned." << std::endl;
    }
    return true;
}

// --- Training ---

TrainingOutcome CategorizationEngine::train(domain::TrainingType type,
                                            const CancellationToken& token,
                                            ProgressCallback onProgress) {
    TrainingOutcome outcome;
    std::unique_lock<std::mutex> lock(m_trainingMutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        outcome.message = "A training run is already in progress";
        std::cerr << "[Trainer] " << outcome.message << std::endl;
        return outcome;
    }

    auto started = std::chrono::steady_clock::now();
    std::cout << "[Trainer] Starting " << domain::TrainingTypeToString(type) << " training..." << std::endl;

    try {
        TrainingData data = prepareTrainingData(token, onProgress);

        if (onProgress) onProgress(0.5f, "Cross-validating");
        std::vector<LabeledSample> labeled;
        labeled.reserve(data.samples.size());
        for (const auto& s : data.samples) labeled.push_back(s.labeled);
        EvaluationReport report = m_evaluator.evaluate(labeled, data.categories, token);

        if (onProgress) onProgress(0.8f, "Publishing model");
        publish(data.samples, token);

        domain::MetricsSnapshot snapshot = buildSnapshot(report, data, type);
        m_metrics->append(snapshot);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        outcome.success = true;
        outcome.message = "Trained on " + std::to_string(data.samples.size()) + " expenses across " +
                          std::to_string(data.categories.size()) + " categories, accuracy " +
                          FormatAccuracy(snapshot.accuracy);
        outcome.snapshot = std::move(snapshot);
        std::cout << "[Trainer] " << outcome.message << " (" << elapsed << " ms)" << std::endl;
        if (onProgress) onProgress(1.0f, "Done");
    } catch (const domain::InsufficientDataError& e) {
        outcome.message = e.what();
        std::cerr << "[Trainer] Not enough data: " << e.what() << std::endl;
    } catch (const domain::TransientInfraError& e) {
        outcome.message = e.what();
        std::cerr << "[Trainer] Infrastructure unavailable: " << e.what() << std::endl;
    } catch (const domain::OperationCancelled& e) {
        outcome.message = e.what();
        std::cerr << "[Trainer] " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        outcome.message = e.what();
        std::cerr << "[Trainer] Index rejected the vectors: " << e.what() << std::endl;
    }
    return outcome;
}

std::optional<domain::MetricsSnapshot> CategorizationEngine::evaluate(const CancellationToken& token) {
    try {
        TrainingData data = prepareTrainingData(token, nullptr);
        std::vector<LabeledSample> labeled;
        labeled.reserve(data.samples.size());
        for (const auto& s : data.samples) labeled.push_back(s.labeled);

        EvaluationReport report = m_evaluator.evaluate(labeled, data.categories, token);
        return buildSnapshot(report, data, domain::TrainingType::Full);
    } catch (const domain::InsufficientDataError& e) {
        std::cerr << "[Evaluator] Not enough data: " << e.what() << std::endl;
    } catch (const domain::TransientInfraError& e) {
        std::cerr << "[Evaluator] Infrastructure unavailable: " << e.what() << std::endl;
    } catch (const domain::OperationCancelled& e) {
        std::cerr << "[Evaluator] " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::MetricsSnapshot> CategorizationEngine::latestMetrics() const {
    return m_metrics->latest();
}

std::vector<domain::MetricsSnapshot> CategorizationEngine::recentMetrics(std::size_t limit) const {
    return m_metrics->recent(limit);
}

std::vector<std::string> CategorizationEngine::knownCategories() {
    std::vector<std::string> categories;
    try {
        categories = m_expenses->fetchCategories();
    } catch (const std::runtime_error& e) {
        std::cerr << "[Categorizer] Categories unavailable: " << e.what() << std::endl;
        return categories;
    }
    categories.erase(std::remove_if(categories.begin(), categories.end(),
                                    [](const std::string& c) { return TextNormalizer::trim(c).empty(); }),
                     categories.end());
    std::sort(categories.begin(), categories.end());
    categories.erase(std::unique(categories.begin(), categories.end()), categories.end());
    return categories;
}

// --- Internals ---

void CategorizationEngine::validateRecord(const domain::ExpenseRecord& record, const std::string& text) {
    if (TextNormalizer::trim(record.category).empty()) {
        throw domain::ValidationError("expense " + std::to_string(record.id) + " has no category");
    }
    if (text.empty()) {
        throw domain::ValidationError("expense " + std::to_string(record.id) + " has no text");
    }
}

std::vector<std::string> CategorizationEngine::knownVendors() {
    try {
        return m_expenses->fetchKnownVendors();
    } catch (const std::runtime_error& e) {
        std::cerr << "[Categorizer] Known vendors unavailable: " << e.what() << std::endl;
        return {};
    }
}

CategorizationEngine::TrainingData CategorizationEngine::prepareTrainingData(const CancellationToken& token,
                                                                             const ProgressCallback& onProgress) {
    const auto& cfg = m_config.training;
    TrainingData data;

    if (onProgress) onProgress(0.0f, "Loading expenses");
    auto records = m_expenses->fetchTrainingExpenses();
    auto vendors = knownVendors();

    std::vector<TrainingSample> valid;
    valid.reserve(records.size());
    for (auto& record : records) {
        record.vendor = m_corrector.normalizeVendor(record.vendor, vendors);
        std::string text = TextNormalizer::canonicalText(record);
        try {
            validateRecord(record, text);
        } catch (const domain::ValidationError& e) {
            std::cerr << "[Trainer] Skipping record: " << e.what() << std::endl;
            data.skippedRecords += 1;
            continue;
        }

        std::string label = TextNormalizer::trim(record.category);
        if (auto forced = m_corrector.correctCategory(record.description)) {
            if (*forced != label) {
                data.correctedLabels += 1;
                label = *forced;
            }
        }

        TrainingSample sample;
        sample.labeled.id = record.id;
        sample.labeled.category = label;
        sample.text = std::move(text);
        sample.amount = record.amount;
        sample.date = record.date;
        valid.push_back(std::move(sample));
    }
    data.validRecords = static_cast<int>(valid.size());

    if (data.validRecords < cfg.minTrainingSamples) {
        throw domain::InsufficientDataError("need at least " + std::to_string(cfg.minTrainingSamples) +
                                            " valid expenses, found " + std::to_string(data.validRecords));
    }

    std::map<std::string, int> counts;
    for (const auto& s : valid) counts[s.labeled.category] += 1;
    for (const auto& [category, count] : counts) {
        if (count >= cfg.minSamplesPerCategory) data.categories.push_back(category);
    }

    if (data.categories.size() < 2) {
        throw domain::InsufficientDataError("need at least 2 categories with " +
                                            std::to_string(cfg.minSamplesPerCategory) + " or more samples, found " +
                                            std::to_string(data.categories.size()));
    }

    for (auto& s : valid) {
        if (counts[s.labeled.category] >= cfg.minSamplesPerCategory) {
            data.samples.push_back(std::move(s));
        }
    }

    std::cout << "[Trainer] " << data.samples.size() << " samples in " << data.categories.size()
              << " eligible categories (" << data.skippedRecords << " skipped, " << data.correctedLabels
              << " labels corrected)" << std::endl;

    embedSamples(data.samples, token, onProgress);
    return data;
}

void CategorizationEngine::embedSamples(std::vector<TrainingSample>& samples,
                                        const CancellationToken& token,
                                        const ProgressCallback& onProgress) {
    const std::size_t batch = std::max<std::size_t>(1, m_config.training.embeddingBatchSize);
    for (std::size_t start = 0; start < samples.size(); start += batch) {
        token.throwIfCancelled("embedding batch " + std::to_string(start / batch + 1));

        std::size_t end = std::min(samples.size(), start + batch);
        for (std::size_t i = start; i < end; ++i) {
            samples[i].labeled.vector = m_embedder->embed(samples[i].text);
        }

        if (onProgress) {
            float fraction = static_cast<float>(end) / static_cast<float>(samples.size());
            onProgress(0.1f + 0.4f * fraction, "Embedding expenses");
        }
    }
}

void CategorizationEngine::publish(const std::vector<TrainingSample>& samples, const CancellationToken& token) {
    const auto& partition = m_config.training.mainPartition;
    token.throwIfCancelled("publishing");
    m_index->createPartition(partition);

    const std::size_t batch = std::max<std::size_t>(1, m_config.training.embeddingBatchSize);
    std::vector<domain::VectorPoint> points;
    for (std::size_t start = 0; start < samples.size(); start += batch) {
        points.clear();
        std::size_t end = std::min(samples.size(), start + batch);
        for (std::size_t i = start; i < end; ++i) {
            domain::VectorPoint p;
            p.id = samples[i].labeled.id;
            p.vector = samples[i].labeled.vector;
            p.payload.category = samples[i].labeled.category;
            p.payload.amount = samples[i].amount;
            if (!samples[i].date.empty()) p.payload.date = samples[i].date;
            points.push_back(std::move(p));
        }
        m_index->upsert(partition, points);
    }
}

domain::MetricsSnapshot CategorizationEngine::buildSnapshot(const EvaluationReport& report,
                                                            const TrainingData& data,
                                                            domain::TrainingType type) const {
    domain::MetricsSnapshot snapshot;
    snapshot.timestamp = utcTimestamp();
    snapshot.trainingType = type;
    snapshot.accuracy = report.meanAccuracy;
    snapshot.sampleCount = static_cast<int>(data.samples.size());
    snapshot.categoryCount = static_cast<int>(data.categories.size());
    snapshot.foldAccuracies = report.foldAccuracies;
    report.confusion.fillSnapshot(snapshot);

    std::vector<std::string> notes;
    if (auto previous = m_metrics->latest()) {
        notes.push_back("Accuracy change: " + FormatDelta(snapshot.accuracy - previous->accuracy) + " (" +
                        FormatAccuracy(previous->accuracy) + " -> " + FormatAccuracy(snapshot.accuracy) + ")");
    } else {
        notes.push_back("Initial model");
    }
    notes.push_back("Embedding model: " + m_embedder->modelVersion());
    if (report.failedFolds > 0) {
        notes.push_back(std::to_string(report.failedFolds) + " fold(s) dropped after infrastructure failures");
    }
    if (data.correctedLabels > 0) {
        notes.push_back(std::to_string(data.correctedLabels) + " label(s) corrected by rules");
    }
    if (data.skippedRecords > 0) {
        notes.push_back(std::to_string(data.skippedRecords) + " invalid record(s) skipped");
    }

    for (std::size_t i = 0; i < notes.size(); ++i) {
        if (i > 0) snapshot.notes += "; ";
        snapshot.notes += notes[i];
    }
    return snapshot;
}

std::string CategorizationEngine::utcTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace ledgerlens::application
