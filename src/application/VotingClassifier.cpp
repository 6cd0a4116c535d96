/**
 * @file VotingClassifier.cpp
 * @brief Implementation of VotingClassifier.
 */

#include "application/VotingClassifier.hpp"
#include <algorithm>

namespace ledgerlens::application {

VotingClassifier::VotingClassifier(domain::SimilarityIndex& index, ClassifierConfig config)
    : m_index(index), m_config(config) {}

domain::Prediction VotingClassifier::classify(const std::string& partition,
                                              const std::vector<float>& vector) const {
    auto neighbors = m_index.query(partition, vector, m_config.neighbors);
    return vote(neighbors).prediction;
}

VoteTally VotingClassifier::vote(const std::vector<domain::Neighbor>& neighbors) {
    VoteTally tally;
    for (const auto& n : neighbors) {
        if (!n.payload.category || n.payload.category->empty()) continue;
        double weight = std::max(0.0, static_cast<double>(n.similarity));
        tally.scores[*n.payload.category] += weight;
        tally.voters[*n.payload.category] += 1;
        tally.total += weight;
    }

    if (tally.scores.empty() || tally.total <= 0.0) {
        return tally; // no evidence: (none, 0.0)
    }

    // std::map iterates by name, so strict comparisons keep the smaller name on full ties.
    auto best = tally.scores.begin();
    for (auto it = tally.scores.begin(); it != tally.scores.end(); ++it) {
        if (it->second > best->second ||
            (it->second == best->second && tally.voters[it->first] > tally.voters[best->first])) {
            best = it;
        }
    }

    tally.prediction.category = best->first;
    tally.prediction.confidence = std::clamp(best->second / tally.total, 0.0, 1.0);
    return tally;
}

} // namespace ledgerlens::application
