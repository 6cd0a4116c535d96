/**
 * @file CrossValidationEvaluator.cpp
 * @brief Implementation of CrossValidationEvaluator.
 */

#include "application/CrossValidationEvaluator.hpp"
#include "application/ScopedPartition.hpp"
#include "application/VotingClassifier.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <utility>

namespace ledgerlens::application {

CrossValidationEvaluator::CrossValidationEvaluator(domain::SimilarityIndex& index,
                                                   ClassifierConfig classifier,
                                                   TrainingConfig training,
                                                   PartitionNamer namer)
    : m_index(index), m_classifier(classifier), m_training(std::move(training)), m_namer(std::move(namer)) {}

std::vector<std::vector<std::size_t>> CrossValidationEvaluator::splitFolds(std::size_t sampleCount,
                                                                           int folds,
                                                                           unsigned int seed) {
    std::vector<std::size_t> order(sampleCount);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    std::size_t k = std::min<std::size_t>(static_cast<std::size_t>(std::max(folds, 2)), sampleCount);
    std::vector<std::vector<std::size_t>> out(k);

    // First (n % k) folds take one extra sample.
    std::size_t base = sampleCount / k;
    std::size_t extra = sampleCount % k;
    std::size_t pos = 0;
    for (std::size_t f = 0; f < k; ++f) {
        std::size_t size = base + (f < extra ? 1 : 0);
        out[f].assign(order.begin() + pos, order.begin() + pos + size);
        pos += size;
    }
    return out;
}

EvaluationReport CrossValidationEvaluator::evaluate(const std::vector<LabeledSample>& samples,
                                                    const std::vector<std::string>& categories,
                                                    const CancellationToken& token) const {
    if (samples.size() < 2) {
        throw domain::InsufficientDataError("Cross-validation needs at least 2 samples, got " +
                                            std::to_string(samples.size()));
    }

    EvaluationReport report(categories);
    VotingClassifier classifier(m_index, m_classifier);
    auto folds = splitFolds(samples.size(), m_training.folds, m_training.seed);

    for (std::size_t f = 0; f < folds.size(); ++f) {
        token.throwIfCancelled("fold " + std::to_string(f + 1));

        const auto& testIdx = folds[f];
        std::vector<bool> isTest(samples.size(), false);
        for (std::size_t i : testIdx) isTest[i] = true;

        std::vector<domain::VectorPoint> trainPoints;
        trainPoints.reserve(samples.size() - testIdx.size());
        for (std::size_t i = 0; i < samples.size(); ++i) {
            if (isTest[i]) continue;
            domain::VectorPoint p;
            p.id = samples[i].id;
            p.vector = samples[i].vector;
            p.payload.category = samples[i].category;
            trainPoints.push_back(std::move(p));
        }

        ConfusionMatrix foldMatrix(categories);
        int correct = 0;
        try {
            ScopedPartition partition(m_index, m_namer());
            if (!trainPoints.empty()) {
                m_index.upsert(partition.name(), trainPoints);
            }

            for (std::size_t i : testIdx) {
                token.throwIfCancelled("fold " + std::to_string(f + 1) + " queries");
                const auto& sample = samples[i];
                auto prediction = classifier.classify(partition.name(), sample.vector);
                foldMatrix.record(sample.category, prediction.category, prediction.confidence);
                if (prediction.category && *prediction.category == sample.category) ++correct;
            }
        } catch (const domain::TransientInfraError& e) {
            report.failedFolds += 1;
            std::cerr << "[CrossValidation] Fold " << (f + 1) << "/" << folds.size()
                      << " dropped after infrastructure failure: " << e.what() << std::endl;
            continue;
        }

        double accuracy = testIdx.empty() ? 0.0 : static_cast<double>(correct) / testIdx.size();
        report.foldAccuracies.push_back(accuracy);
        report.confusion.merge(foldMatrix);
        report.sampleCount += static_cast<int>(testIdx.size());
        report.completedFolds += 1;

        std::cout << "[CrossValidation] Fold " << (f + 1) << "/" << folds.size()
                  << " accuracy=" << std::fixed << std::setprecision(4) << accuracy << std::endl;
    }

    if (report.completedFolds == 0) {
        throw domain::TransientInfraError("All " + std::to_string(folds.size()) +
                                          " cross-validation folds failed");
    }

    double sum = std::accumulate(report.foldAccuracies.begin(), report.foldAccuracies.end(), 0.0);
    report.meanAccuracy = sum / report.foldAccuracies.size();
    return report;
}

} // namespace ledgerlens::application
