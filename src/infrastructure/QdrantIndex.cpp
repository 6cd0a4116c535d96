/**
 * @file QdrantIndex.cpp
 * @brief Implementation of QdrantIndex.
 */

#include "infrastructure/QdrantIndex.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace ledgerlens::infrastructure {

using json = nlohmann::json;

namespace {

std::string CollectionPath(const std::string& name) {
    return "/collections/" + name;
}

[[noreturn]] void ThrowHttpFailure(const std::string& what, const httplib::Result& res) {
    std::string detail = res ? ("HTTP " + std::to_string(res->status) + ": " + res->body)
                             : ("connection failed: " + httplib::to_string(res.error()));
    std::cerr << "[QdrantIndex] " << what << " " << detail << std::endl;
    throw domain::TransientInfraError("Qdrant " + what + " " + detail);
}

bool IsSuccess(const httplib::Result& res) {
    return res && res->status >= 200 && res->status < 300;
}

json ParseBody(const std::string& what, const httplib::Result& res) {
    try {
        return json::parse(res->body);
    } catch (const json::exception& e) {
        throw domain::TransientInfraError("Qdrant " + what + " returned malformed JSON: " + e.what());
    }
}

} // namespace

QdrantIndex::QdrantIndex(const std::string& url, const std::string& apiKey, std::size_t dimension, int timeoutSeconds)
    : m_url(url), m_dimension(dimension), m_client(std::make_unique<httplib::Client>(url)) {
    if (m_dimension == 0) {
        throw domain::ConfigurationError("Qdrant index needs a positive vector dimension");
    }
    m_client->set_connection_timeout(timeoutSeconds);
    m_client->set_read_timeout(timeoutSeconds);
    m_client->set_write_timeout(timeoutSeconds);
    if (!apiKey.empty()) {
        m_client->set_default_headers({{"api-key", apiKey}});
    }
}

QdrantIndex::~QdrantIndex() = default;

void QdrantIndex::checkDimension(const std::vector<float>& vector, const char* operation) const {
    if (vector.size() != m_dimension) {
        throw std::invalid_argument(std::string(operation) + ": vector has " + std::to_string(vector.size()) +
                                    " dimensions, index expects " + std::to_string(m_dimension));
    }
}

void QdrantIndex::createPartition(const std::string& name) {
    auto existing = m_client->Get(CollectionPath(name));
    if (IsSuccess(existing)) return;
    if (existing && existing->status != 404) {
        ThrowHttpFailure("lookup of '" + name + "'", existing);
    }

    json body = {{"vectors", {{"size", m_dimension}, {"distance", "Cosine"}}}};
    auto res = m_client->Put(CollectionPath(name), body.dump(), "application/json");
    if (!IsSuccess(res)) {
        ThrowHttpFailure("create of '" + name + "'", res);
    }
    std::cout << "[QdrantIndex] Created collection '" << name << "'" << std::endl;
}

void QdrantIndex::deletePartition(const std::string& name) {
    auto res = m_client->Delete(CollectionPath(name));
    if (res && res->status == 404) return;
    if (!IsSuccess(res)) {
        ThrowHttpFailure("delete of '" + name + "'", res);
    }
}

void QdrantIndex::upsert(const std::string& partition, const std::vector<domain::VectorPoint>& points) {
    for (const auto& p : points) checkDimension(p.vector, "upsert");
    if (points.empty()) return;

    json items = json::array();
    for (const auto& p : points) {
        items.push_back({
            {"id", p.id},
            {"vector", p.vector},
            {"payload", JsonCodec::PayloadToJson(p.payload)}
        });
    }
    json body = {{"points", items}};

    auto res = m_client->Put(CollectionPath(partition) + "/points?wait=true", body.dump(), "application/json");
    if (!IsSuccess(res)) {
        ThrowHttpFailure("upsert into '" + partition + "'", res);
    }
}

std::vector<domain::Neighbor> QdrantIndex::query(const std::string& partition,
                                                 const std::vector<float>& vector,
                                                 std::size_t k) {
    checkDimension(vector, "query");
    std::vector<domain::Neighbor> neighbors;
    if (k == 0) return neighbors;

    json body = {{"vector", vector}, {"limit", k}, {"with_payload", true}};
    auto res = m_client->Post(CollectionPath(partition) + "/points/search", body.dump(), "application/json");
    if (res && res->status == 404) return neighbors;
    if (!IsSuccess(res)) {
        ThrowHttpFailure("search in '" + partition + "'", res);
    }

    json reply = ParseBody("search", res);
    if (!reply.contains("result") || !reply["result"].is_array()) {
        throw domain::TransientInfraError("Qdrant search reply without a result list");
    }

    try {
        for (const auto& hit : reply["result"]) {
            if (auto n = JsonCodec::NeighborFromSearchHit(hit)) {
                neighbors.push_back(std::move(*n));
            } else {
                std::cerr << "[QdrantIndex] Skipping malformed hit in '" << partition << "'" << std::endl;
            }
        }
    } catch (const json::exception& e) {
        throw domain::TransientInfraError("Qdrant search reply could not be decoded: " + std::string(e.what()));
    }
    return neighbors;
}

std::size_t QdrantIndex::pointCount(const std::string& partition) {
    auto res = m_client->Get(CollectionPath(partition));
    if (res && res->status == 404) return 0;
    if (!IsSuccess(res)) {
        ThrowHttpFailure("lookup of '" + partition + "'", res);
    }

    json reply = ParseBody("collection info", res);
    const auto& result = reply.value("result", json::object());
    if (result.contains("points_count") && result["points_count"].is_number_integer()) {
        return result["points_count"].get<std::size_t>();
    }
    return 0;
}

} // namespace ledgerlens::infrastructure
