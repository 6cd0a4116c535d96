/**
 * @file SimilarityIndex.hpp
 * @brief Interface for the vector store holding one point per expense.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "VectorPoint.hpp"

namespace ledgerlens::domain {

/**
 * @class SimilarityIndex
 * @brief Named partitions of vectors answering cosine k-NN queries.
 *
 * The dimension is fixed for the lifetime of the index. All operations that
 * reach a remote store throw TransientInfraError when it is unavailable.
 */
class SimilarityIndex {
public:
    virtual ~SimilarityIndex() = default;

    /** @brief Creates the partition if it does not exist yet. */
    virtual void createPartition(const std::string& name) = 0;

    /** @brief Drops the partition and all its points. Unknown names are ignored. */
    virtual void deletePartition(const std::string& name) = 0;

    /**
     * @brief Inserts or replaces points by id (last write wins).
     * @throws std::invalid_argument if a vector has the wrong dimension.
     */
    virtual void upsert(const std::string& partition, const std::vector<VectorPoint>& points) = 0;

    /**
     * @brief Returns up to k neighbors ordered by descending cosine similarity.
     * @throws std::invalid_argument if the query has the wrong dimension.
     */
    virtual std::vector<Neighbor> query(const std::string& partition,
                                        const std::vector<float>& vector,
                                        std::size_t k) = 0;

    /** @brief Number of points stored in a partition (0 if it does not exist). */
    virtual std::size_t pointCount(const std::string& partition) = 0;

    virtual std::size_t dimension() const = 0;
};

} // namespace ledgerlens::domain
