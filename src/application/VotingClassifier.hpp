/**
 * @file VotingClassifier.hpp
 * @brief Similarity-weighted k-NN voting over the similarity index.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "application/EngineConfig.hpp"
#include "domain/Categorization.hpp"
#include "domain/SimilarityIndex.hpp"

namespace ledgerlens::application {

/**
 * @struct VoteTally
 * @brief Raw and normalized per-category scores of one vote.
 */
struct VoteTally {
    std::map<std::string, double> scores;     ///< Sum of similarities per category.
    std::map<std::string, int> voters;        ///< Neighbors per category.
    double total = 0.0;
    domain::Prediction prediction;
};

/**
 * @class VotingClassifier
 * @brief Turns the k nearest neighbors of a query into a category and a confidence.
 *
 * score[c] is the sum of similarities of the neighbors labeled c; confidence is
 * score[winner] / sum(score). Negative similarities carry no vote. Equal top
 * scores go to the category with more neighbors, then to the smaller name.
 */
class VotingClassifier {
public:
    VotingClassifier(domain::SimilarityIndex& index, ClassifierConfig config);

    /**
     * @brief Queries the index and votes.
     * @throws TransientInfraError if the index is unavailable.
     */
    domain::Prediction classify(const std::string& partition, const std::vector<float>& vector) const;

    /** @brief Votes over an already fetched neighbor list. */
    static VoteTally vote(const std::vector<domain::Neighbor>& neighbors);

    std::size_t neighbors() const { return m_config.neighbors; }

private:
    domain::SimilarityIndex& m_index;
    ClassifierConfig m_config;
};

} // namespace ledgerlens::application
