#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // Statement was interrupted (deadline or stop request)
    bool timed_out = false;
    bool cancelled = false;

    std::vector<std::string> column_names;
    std::vector<Row> rows;                  // NULL cells are std::nullopt

    bool has_rows = false;
};

/**
 * @brief Interruption controls for a single execute() call
 *
 * Drivers poll both while the statement runs and interrupt it natively
 * (PQcancel, sqlite3 progress handler) once either fires.
 */
struct ExecuteControl {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    std::stop_token stop_token;

    [[nodiscard]] bool should_interrupt() const {
        return stop_token.stop_requested() || std::chrono::steady_clock::now() >= deadline;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, sqlite3*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 * Implementations never throw; failures are reported in DbResultSet.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a single read-only SQL statement
     * @param sql SQL text
     * @param control Deadline and stop token
     * @return Result set with rows, or error/timeout flags
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, const ExecuteControl& control) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set server-side timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     * SQLite: busy timeout for lock waits
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlguard
