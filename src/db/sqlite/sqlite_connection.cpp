#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlguard {

namespace {

// VM instructions between progress handler calls
constexpr int kProgressOps = 1000;

std::string column_text(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
}

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

int SqliteConnection::progress_callback(void* ctx) {
    const auto* control = static_cast<const ExecuteControl*>(ctx);
    return control->should_interrupt() ? 1 : 0;
}

DbResultSet SqliteConnection::execute(const std::string& sql, const ExecuteControl& control) {
    DbResultSet result;

    if (!db_) {
        result.error_message = "Connection is null";
        return result;
    }

    if (control.should_interrupt()) {
        result.timed_out = true;
        result.cancelled = control.stop_token.stop_requested();
        result.error_message = result.cancelled ? "query cancelled" : "query exceeded deadline";
        return result;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, &tail);
    if (rc != SQLITE_OK) {
        result.error_message = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return result;
    }
    if (!stmt) {
        result.error_message = "empty statement";
        return result;
    }
    if (tail != nullptr && !utils::trim(tail).empty()) {
        sqlite3_finalize(stmt);
        result.error_message = "trailing SQL after the first statement";
        return result;
    }
    if (!sqlite3_stmt_readonly(stmt)) {
        sqlite3_finalize(stmt);
        result.error_message = "statement would modify the database";
        return result;
    }

    sqlite3_progress_handler(db_, kProgressOps, &SqliteConnection::progress_callback,
                             const_cast<void*>(static_cast<const void*>(&control)));

    const int ncols = sqlite3_column_count(stmt);
    result.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        result.column_names.emplace_back(name ? name : "");
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int i = 0; i < ncols; ++i) {
            if (sqlite3_column_type(stmt, i) == SQLITE_NULL) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(column_text(stmt, i));
            }
        }
        result.rows.push_back(std::move(row));
    }

    sqlite3_progress_handler(db_, 0, nullptr, nullptr);

    if (rc == SQLITE_DONE) {
        result.success = true;
        result.has_rows = ncols > 0;
    } else if (rc == SQLITE_INTERRUPT) {
        result.rows.clear();
        result.timed_out = true;
        result.cancelled = control.stop_token.stop_requested();
        result.error_message = result.cancelled ? "query cancelled" : "query exceeded deadline";
    } else {
        result.rows.clear();
        result.error_message = sqlite3_errmsg(db_);
    }

    sqlite3_finalize(stmt);
    return result;
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, health_check_query.c_str(), -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
        sqlite3_finalize(stmt);
        return false;
    }
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_ROW || rc == SQLITE_DONE;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

bool SqliteConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!db_) {
        return false;
    }
    // Bounds lock waits; execution time itself is bounded by the progress handler
    return sqlite3_busy_timeout(db_, static_cast<int>(timeout_ms)) == SQLITE_OK;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::string SqliteConnectionFactory::to_sqlite_path(const std::string& connection_string) {
    constexpr std::string_view kTripleSlash = "sqlite:///";
    constexpr std::string_view kDoubleSlash = "sqlite://";
    constexpr std::string_view kScheme = "sqlite:";

    const std::string_view cs(connection_string);
    if (cs.starts_with(kTripleSlash)) return std::string(cs.substr(kTripleSlash.size()));
    if (cs.starts_with(kDoubleSlash)) return std::string(cs.substr(kDoubleSlash.size()));
    if (cs.starts_with(kScheme)) return std::string(cs.substr(kScheme.size()));
    return connection_string;
}

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    const auto path = to_sqlite_path(connection_string);

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db,
        SQLITE_OPEN_READONLY | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX, nullptr);

    if (rc != SQLITE_OK) {
        utils::log::error(std::format("Failed to open SQLite database '{}': {}",
            path, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
        sqlite3_close_v2(db);
        return nullptr;
    }

    // No ATTACH of other (possibly writable) databases on this handle
    sqlite3_limit(db, SQLITE_LIMIT_ATTACHED, 0);

    return std::make_unique<SqliteConnection>(db);
}

} // namespace sqlguard
