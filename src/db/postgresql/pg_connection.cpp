#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <format>

namespace sqlguard {

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

// query_canceled: raised for both PQcancel and statement_timeout
constexpr std::string_view kSqlStateQueryCanceled = "57014";

std::string pg_error(PGconn* conn) {
    return utils::trim(PQerrorMessage(conn));
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const ExecuteControl& control) {
    DbResultSet result;

    if (!conn_) {
        result.error_message = "Connection is null";
        return result;
    }

    if (control.should_interrupt()) {
        result.timed_out = true;
        result.cancelled = control.stop_token.stop_requested();
        result.error_message = result.cancelled ? "query cancelled" : "query exceeded deadline";
        return result;
    }

    if (PQsendQueryParams(conn_, sql.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0) == 0) {
        result.error_message = pg_error(conn_);
        return result;
    }

    const int sock = PQsocket(conn_);
    while (PQisBusy(conn_)) {
        if (control.should_interrupt()) {
            // The caller discards this connection, so nothing is drained here
            send_cancel();
            result.timed_out = true;
            result.cancelled = control.stop_token.stop_requested();
            result.error_message = result.cancelled ? "query cancelled" : "query exceeded deadline";
            return result;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            control.deadline - std::chrono::steady_clock::now());
        const auto wait = std::clamp(remaining + std::chrono::milliseconds{1},
                                     std::chrono::milliseconds{1}, kPollInterval);

        pollfd pfd{};
        pfd.fd = sock;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, static_cast<int>(wait.count())) < 0 && errno != EINTR) {
            result.error_message = std::format("poll() failed on PostgreSQL socket (errno {})", errno);
            return result;
        }

        if (PQconsumeInput(conn_) == 0) {
            result.error_message = pg_error(conn_);
            return result;
        }
    }

    bool first = true;
    while (PGresult* res = PQgetResult(conn_)) {
        if (first) {
            first = false;
            const ExecStatusType status = PQresultStatus(res);
            if (status == PGRES_TUPLES_OK) {
                process_tuples_result(res, result);
            } else if (status == PGRES_COMMAND_OK) {
                result.success = true;
                result.has_rows = false;
            } else {
                const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
                result.timed_out = (sqlstate != nullptr && kSqlStateQueryCanceled == sqlstate);
                result.error_message = utils::trim(PQresultErrorMessage(res));
            }
        }
        PQclear(res);
    }

    if (first) {
        result.error_message = pg_error(conn_);
    }
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void PgConnection::send_cancel() {
    PGcancel* cancel = PQgetCancel(conn_);
    if (!cancel) {
        utils::log::warn("PQgetCancel failed; statement will run until the connection closes");
        return;
    }
    char errbuf[256];
    if (PQcancel(cancel, errbuf, sizeof(errbuf)) == 0) {
        utils::log::warn(std::format("PQcancel failed: {}", errbuf));
    }
    PQfreeCancel(cancel);
}

void PgConnection::process_tuples_result(PGresult* res, DbResultSet& out) {
    out.success = true;
    out.has_rows = true;

    const int ncols = PQnfields(res);
    out.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; i++) {
        out.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    out.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        out.rows.push_back(std::move(row));
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", pg_error(conn)));
        PQfinish(conn);
        return nullptr;
    }

    // Session default: every transaction is read-only
    PGresult* res = PQexec(conn, "SET SESSION CHARACTERISTICS AS TRANSACTION READ ONLY");
    const bool read_only = res != nullptr && PQresultStatus(res) == PGRES_COMMAND_OK;
    if (res) PQclear(res);
    if (!read_only) {
        utils::log::error(std::format("Failed to make session read-only: {}", pg_error(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace sqlguard
