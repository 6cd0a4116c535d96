/**
 * @file Errors.hpp
 * @brief Error taxonomy of the categorization engine.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace ledgerlens::domain {

/**
 * @class TransientInfraError
 * @brief The embedding model or the similarity index could not be reached.
 *
 * Always recoverable: inference falls back to the suggested category with
 * confidence 0.0, training drops the affected fold.
 */
class TransientInfraError : public std::runtime_error {
public:
    explicit TransientInfraError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class InsufficientDataError
 * @brief Too few samples or eligible categories to build a model.
 */
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class ValidationError
 * @brief A malformed expense record (missing category or text).
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class ConfigurationError
 * @brief Missing or invalid embedding-model / index settings. Raised at startup only.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief A training run was cancelled or exceeded its deadline. */
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ledgerlens::domain
