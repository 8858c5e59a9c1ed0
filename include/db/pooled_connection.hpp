#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlguard {

/**
 * @brief RAII wrapper for database connection
 *
 * Hands the connection back to its pool on destruction. A connection that
 * saw an error or was interrupted is marked with discard() and the pool
 * closes it instead of reusing it.
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    // reusable == false: pool must close the connection
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function to call on destruction (returns to pool)
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    /**
     * @brief Destructor - returns (or discards) the connection
     */
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    /**
     * @brief Access the underlying connection
     */
    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    /**
     * @brief Check if connection is valid
     */
    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Never return this connection to the idle set
     */
    void discard() { discarded_ = true; }

    bool is_discarded() const { return discarded_; }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool discarded_ = false;
};

} // namespace sqlguard
