#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <string>

namespace sqlguard {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* opened with SQLITE_OPEN_READONLY. Only the first statement
 * of the SQL text is prepared; trailing text or a statement that would write
 * (sqlite3_stmt_readonly) is refused before stepping. While stepping, a
 * progress handler polls the deadline and stop token and interrupts the
 * statement (SQLITE_INTERRUPT) when either fires.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql, const ExecuteControl& control) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    // sqlite3_progress_handler callback; ctx is the ExecuteControl
    static int progress_callback(void* ctx);

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * Accepts "sqlite:///relative.db", "sqlite:////abs/path.db", "sqlite://path",
 * "file:" URIs and plain paths. The database must already exist.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

    /**
     * @brief Strip the sqlite:// scheme, leaving a path or file: URI for sqlite3_open_v2
     */
    [[nodiscard]] static std::string to_sqlite_path(const std::string& connection_string);
};

} // namespace sqlguard
