/**
 * @file UuidGenerator.hpp
 * @brief Random identifiers backed by libuuid.
 */

#pragma once
#include <string>

namespace ledgerlens::infrastructure {

class UuidGenerator {
public:
    /** @brief Random (v4) UUID as 32 lowercase hex characters, no dashes. */
    static std::string NewHex();

    /** @brief Collision-free name for an ephemeral cross-validation partition. */
    static std::string NewPartitionName(const std::string& prefix = "cv_");
};

} // namespace ledgerlens::infrastructure
