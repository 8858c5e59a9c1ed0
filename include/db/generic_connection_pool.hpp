#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqlguard {

/**
 * @brief Database-agnostic bounded connection pool
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Lazy growth: connections created on demand up to max, min pre-warmed
 * - Recycling: connections older than max_lifetime are replaced on acquire
 * - Health checking: connections idle longer than idle_timeout are probed
 * - Discard: connections returned as non-reusable (error, timeout) are closed
 * - RAII: PooledConnection returns the connection on destruction
 *
 * Thread-safe: mutex protects the idle deque, semaphore prevents oversubscription.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @brief Construct pool with connection factory
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    struct ConnectionTimes {
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    /**
     * @brief Create new connection via factory and start tracking it
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Close a connection and stop tracking it
     */
    void destroy_connection(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, ConnectionTimes> times_;
    mutable std::mutex mutex_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_discarded_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace sqlguard
