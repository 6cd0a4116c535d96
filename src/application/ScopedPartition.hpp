/**
 * @file ScopedPartition.hpp
 * @brief RAII ownership of an ephemeral index partition.
 */

#pragma once
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include "domain/SimilarityIndex.hpp"

namespace ledgerlens::application {

/**
 * @class ScopedPartition
 * @brief Creates a partition on construction and deletes it when the scope exits,
 *        whether by return, exception or cancellation.
 */
class ScopedPartition {
public:
    ScopedPartition(domain::SimilarityIndex& index, std::string name)
        : m_index(index), m_name(std::move(name)) {
        m_index.createPartition(m_name);
    }

    ~ScopedPartition() {
        try {
            m_index.deletePartition(m_name);
        } catch (const std::exception& e) {
            std::cerr << "[ScopedPartition] Failed to delete partition '" << m_name << "': " << e.what() << std::endl;
        }
    }

    ScopedPartition(const ScopedPartition&) = delete;
    ScopedPartition& operator=(const ScopedPartition&) = delete;

    const std::string& name() const { return m_name; }

private:
    domain::SimilarityIndex& m_index;
    std::string m_name;
};

} // namespace ledgerlens::application
