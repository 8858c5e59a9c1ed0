#pragma once

#include "db/iquery_executor.hpp"
#include "db/iconnection_pool.hpp"
#include <cstdint>
#include <memory>

namespace sqlguard {

/**
 * @brief Execution gateway - runs normalized statements on pooled read-only connections
 *
 * - Acquires a connection (bounded wait); failure is EXECUTION_ERROR
 * - Applies the deadline (caller timeout, else the configured default) and
 *   the caller's stop token; an interrupted statement is TIMEOUT
 * - Any failed or interrupted connection is discarded, never reused
 * - More rows than the ceiling: extra rows dropped, truncated=true, logged
 *
 * Never throws; exceptions from drivers are mapped to EXECUTION_ERROR.
 */
class ExecutionGateway : public IQueryExecutor {
public:
    struct Config {
        uint32_t query_timeout_ms = 30000;
        uint32_t pool_acquire_timeout_ms = 5000;
        uint64_t row_limit_ceiling = 100;
    };

    ExecutionGateway(std::shared_ptr<IConnectionPool> pool, const Config& config);

    explicit ExecutionGateway(std::shared_ptr<IConnectionPool> pool)
        : ExecutionGateway(std::move(pool), Config{}) {}

    ~ExecutionGateway() override = default;

    [[nodiscard]] ExecutionResult execute(
        const NormalizedStatement& stmt, const ExecutionOptions& options) override;

    const std::shared_ptr<IConnectionPool>& pool() const { return pool_; }

private:
    ExecutionResult run_on_connection(const NormalizedStatement& stmt,
                                      const ExecutionOptions& options);

    std::shared_ptr<IConnectionPool> pool_;
    Config config_;
};

} // namespace sqlguard
