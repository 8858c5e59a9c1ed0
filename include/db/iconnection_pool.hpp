#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlguard {

class PooledConnection;

/**
 * @brief Sizing and upkeep of a pool of read-only connections
 *
 * Filled from [database] by PipelineBuilder; the acquire wait itself comes
 * from ExecutionGateway::Config::pool_acquire_timeout_ms.
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;                  // Opened eagerly; 0 defers every connect
    size_t max_connections = 4;                  // Upper bound on concurrent statements
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};   // Idle longer than this -> health check
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};     // 0 = never recycle
};

/**
 * @brief Counters reported when the CLI shuts down
 *
 * A connection returned through PooledConnection::discard() counts as
 * released and discarded; it is closed instead of going back to idle.
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;         // Waited past the timeout or could not connect
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;    // Replaced after max_lifetime
    size_t connections_discarded = 0;   // Closed after an error, timeout or cancel
};

/**
 * @brief One connection per statement, bounded by max_connections
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Wait up to timeout for a free slot
     * @return Connection handle, or nullptr when the pool is exhausted,
     *         drained, or the driver could not connect
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close idle connections and refuse further acquires
     */
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlguard
