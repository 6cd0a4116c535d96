/**
 * @file QdrantIndex.hpp
 * @brief SimilarityIndex backed by a Qdrant server's REST API.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/SimilarityIndex.hpp"

namespace httplib {
class Client;
}

namespace ledgerlens::infrastructure {

/**
 * @class QdrantIndex
 * @brief Maps partitions to Qdrant collections (cosine distance).
 *
 * Unreachable server and non-2xx replies raise domain::TransientInfraError.
 * A missing collection reads as empty.
 */
class QdrantIndex : public domain::SimilarityIndex {
public:
    /**
     * @param url Base URL, e.g. "http://localhost:6333".
     * @param apiKey Sent as the `api-key` header when not empty.
     */
    QdrantIndex(const std::string& url, const std::string& apiKey, std::size_t dimension, int timeoutSeconds = 10);
    ~QdrantIndex() override;

    void createPartition(const std::string& name) override;
    void deletePartition(const std::string& name) override;
    void upsert(const std::string& partition, const std::vector<domain::VectorPoint>& points) override;
    std::vector<domain::Neighbor> query(const std::string& partition,
                                        const std::vector<float>& vector,
                                        std::size_t k) override;
    std::size_t pointCount(const std::string& partition) override;
    std::size_t dimension() const override { return m_dimension; }

private:
    void checkDimension(const std::vector<float>& vector, const char* operation) const;

    std::string m_url;
    std::size_t m_dimension;
    std::unique_ptr<httplib::Client> m_client;
};

} // namespace ledgerlens::infrastructure
