/**
 * @file CancellationToken.hpp
 * @brief Coarse-grained cancellation and deadline for long-running training.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include "domain/Errors.hpp"

namespace ledgerlens::application {

/**
 * @class CancellationToken
 * @brief Checked between folds and embedding batches; never inside a single index call.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /** @brief Token that expires `timeout` from now. */
    static CancellationToken withTimeout(std::chrono::milliseconds timeout) {
        CancellationToken token;
        token.m_deadline = Clock::now() + timeout;
        return token;
    }

    CancellationToken(const CancellationToken& other)
        : m_cancelled(other.m_cancelled.load()), m_deadline(other.m_deadline) {}

    CancellationToken& operator=(const CancellationToken& other) {
        m_cancelled = other.m_cancelled.load();
        m_deadline = other.m_deadline;
        return *this;
    }

    void cancel() { m_cancelled = true; }

    bool isCancelled() const {
        if (m_cancelled.load()) return true;
        return m_deadline && Clock::now() >= *m_deadline;
    }

    /** @throws domain::OperationCancelled when cancelled or past the deadline. */
    void throwIfCancelled(const std::string& where) const {
        if (isCancelled()) {
            throw domain::OperationCancelled("Training cancelled during " + where);
        }
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::optional<Clock::time_point> m_deadline;
};

} // namespace ledgerlens::application
