/**
 * @file UuidGenerator.cpp
 * @brief Implementation of UuidGenerator.
 */

#include "infrastructure/UuidGenerator.hpp"
#include <uuid/uuid.h>

namespace ledgerlens::infrastructure {

std::string UuidGenerator::NewHex() {
    uuid_t raw;
    uuid_generate_random(raw);

    char text[37];
    uuid_unparse_lower(raw, text);

    std::string out;
    out.reserve(32);
    for (const char* p = text; *p; ++p) {
        if (*p != '-') out.push_back(*p);
    }
    return out;
}

std::string UuidGenerator::NewPartitionName(const std::string& prefix) {
    return prefix + NewHex();
}

} // namespace ledgerlens::infrastructure
