#pragma once

#include "core/types.hpp"
#include <chrono>
#include <stop_token>

namespace sqlguard {

/**
 * @brief Per-call execution options supplied by the caller
 */
struct ExecutionOptions {
    std::chrono::milliseconds timeout{0};   // 0 = executor default
    std::stop_token stop_token;             // Cancellation from the caller
};

/**
 * @brief Abstract query executor interface
 *
 * Pipeline holds shared_ptr<IQueryExecutor>; tests substitute a mock.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a normalized statement
     * @param stmt Statement whose row limit is already enforced
     * @param options Timeout and cancellation
     * @return Execution result (never throws)
     */
    [[nodiscard]] virtual ExecutionResult execute(
        const NormalizedStatement& stmt, const ExecutionOptions& options) = 0;
};

} // namespace sqlguard
