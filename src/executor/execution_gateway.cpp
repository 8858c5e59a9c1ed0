#include "executor/execution_gateway.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlguard {

namespace {

ExecutionResult failure(ErrorKind kind, std::string message) {
    ExecutionResult result;
    result.success = false;
    result.error_kind = kind;
    result.error = std::move(message);
    return result;
}

} // anonymous namespace

ExecutionGateway::ExecutionGateway(std::shared_ptr<IConnectionPool> pool, const Config& config)
    : pool_(std::move(pool)), config_(config) {}

ExecutionResult ExecutionGateway::execute(const NormalizedStatement& stmt,
                                          const ExecutionOptions& options) {
    utils::Timer timer;
    ExecutionResult result;

    try {
        result = run_on_connection(stmt, options);
    } catch (const std::exception& e) {
        result = failure(ErrorKind::EXECUTION_ERROR, std::format("Database error: {}", e.what()));
        utils::log::warn(std::format("Execution failed: {}", e.what()));
    }

    result.execution_time = timer.elapsed_us();
    return result;
}

ExecutionResult ExecutionGateway::run_on_connection(const NormalizedStatement& stmt,
                                                    const ExecutionOptions& options) {
    if (options.stop_token.stop_requested()) {
        return failure(ErrorKind::TIMEOUT, "query cancelled");
    }

    const auto timeout = options.timeout.count() > 0
        ? options.timeout
        : std::chrono::milliseconds{config_.query_timeout_ms};
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto conn = pool_->acquire(std::chrono::milliseconds{config_.pool_acquire_timeout_ms});
    if (!conn || !conn->is_valid()) {
        return failure(ErrorKind::EXECUTION_ERROR, "Failed to acquire database connection from pool");
    }

    if (!conn->get()->set_query_timeout(static_cast<uint32_t>(timeout.count()))) {
        utils::log::warn("Could not set server-side query timeout, relying on client deadline");
    }

    ExecuteControl control;
    control.deadline = deadline;
    control.stop_token = options.stop_token;

    DbResultSet db_result;
    try {
        db_result = conn->get()->execute(stmt.sql, control);
    } catch (...) {
        conn->discard();
        throw;
    }

    if (!db_result.success) {
        // Connection state is unknown after an error or interrupt
        conn->discard();

        if (db_result.timed_out) {
            const bool cancelled = db_result.cancelled || options.stop_token.stop_requested();
            auto message = cancelled
                ? std::string("query cancelled")
                : std::format("query exceeded timeout of {}ms", timeout.count());
            utils::log::warn(std::format("Execution interrupted: {}", message));
            return failure(ErrorKind::TIMEOUT, std::move(message));
        }

        utils::log::warn(std::format("Execution failed: {}", db_result.error_message));
        return failure(ErrorKind::EXECUTION_ERROR, std::move(db_result.error_message));
    }

    ExecutionResult result;
    result.success = true;
    result.column_names = std::move(db_result.column_names);
    result.rows = std::move(db_result.rows);

    const uint64_t ceiling = stmt.effective_limit > 0
        ? std::min(stmt.effective_limit, config_.row_limit_ceiling)
        : config_.row_limit_ceiling;
    if (result.rows.size() > ceiling) {
        utils::log::error(std::format("Database returned {} rows for a statement limited to {}; truncating",
            result.rows.size(), ceiling));
        result.rows.resize(static_cast<size_t>(ceiling));
        result.truncated = true;
    }
    result.row_count = result.rows.size();

    return result;
}

} // namespace sqlguard
