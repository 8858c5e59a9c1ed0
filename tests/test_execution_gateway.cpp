#include <catch2/catch_test_macros.hpp>
#include "executor/execution_gateway.hpp"
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"

#include <thread>

using namespace sqlguard;
using sqlguard::testing::MockConnectionFactory;
using sqlguard::testing::MockDbScript;

namespace {

struct GatewayFixture {
    std::shared_ptr<MockDbScript> script = std::make_shared<MockDbScript>();
    std::shared_ptr<GenericConnectionPool> pool;
    std::unique_ptr<ExecutionGateway> gateway;

    explicit GatewayFixture(ExecutionGateway::Config config = {}, size_t max_connections = 2) {
        PoolConfig pool_config;
        pool_config.connection_string = "mock://";
        pool_config.min_connections = 1;
        pool_config.max_connections = max_connections;
        pool = std::make_shared<GenericConnectionPool>(
            "mock", pool_config, std::make_shared<MockConnectionFactory>(script));
        gateway = std::make_unique<ExecutionGateway>(pool, config);
    }

    void set_rows(size_t n) {
        script->rows.clear();
        for (size_t i = 0; i < n; ++i) {
            script->rows.push_back({std::to_string(i + 1), "row" + std::to_string(i + 1)});
        }
    }
};

NormalizedStatement statement(std::string sql, uint64_t limit = 100) {
    NormalizedStatement stmt;
    stmt.sql = std::move(sql);
    stmt.effective_limit = limit;
    stmt.action = LimitAction::UNCHANGED;
    return stmt;
}

} // anonymous namespace

TEST_CASE("ExecutionGateway: rows and columns are returned", "[gateway]") {
    GatewayFixture f;
    f.set_rows(2);
    f.script->rows.push_back({"3", std::nullopt});

    const auto r = f.gateway->execute(statement("SELECT id, name FROM t LIMIT 100"), {});
    REQUIRE(r.success);
    CHECK(r.error_kind == ErrorKind::NONE);
    CHECK(r.column_names == std::vector<std::string>{"id", "name"});
    REQUIRE(r.row_count == 3);
    CHECK(r.rows[0][1] == "row1");
    CHECK_FALSE(r.rows[2][1].has_value());
    CHECK_FALSE(r.truncated);

    std::lock_guard lock(f.script->mutex);
    CHECK(f.script->last_sql == "SELECT id, name FROM t LIMIT 100");
}

TEST_CASE("ExecutionGateway: excess rows are truncated", "[gateway]") {
    GatewayFixture f(ExecutionGateway::Config{.row_limit_ceiling = 3});
    f.set_rows(5);

    const auto r = f.gateway->execute(statement("SELECT * FROM t LIMIT 3", 3), {});
    REQUIRE(r.success);
    CHECK(r.truncated);
    CHECK(r.row_count == 3);
    CHECK(r.rows.size() == 3);
    CHECK(r.rows.back()[0] == "3");
}

TEST_CASE("ExecutionGateway: statement limit below the ceiling also bounds rows", "[gateway]") {
    GatewayFixture f;
    f.set_rows(5);

    const auto r = f.gateway->execute(statement("SELECT * FROM t LIMIT 2", 2), {});
    REQUIRE(r.success);
    CHECK(r.truncated);
    CHECK(r.row_count == 2);
}

TEST_CASE("ExecutionGateway: driver error is reported and the connection discarded", "[gateway]") {
    GatewayFixture f;
    f.script->mode = MockDbScript::Mode::ERROR;

    const auto r = f.gateway->execute(statement("SELECT * FROM missing LIMIT 100"), {});
    CHECK_FALSE(r.success);
    CHECK(r.error_kind == ErrorKind::EXECUTION_ERROR);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "relation \"missing\" does not exist");
    CHECK(r.rows.empty());

    const auto stats = f.pool->get_stats();
    CHECK(stats.connections_discarded == 1);
    CHECK(f.script->closed.load() == 1);

    // Next call gets a fresh connection
    f.script->mode = MockDbScript::Mode::ROWS;
    CHECK(f.gateway->execute(statement("SELECT 1"), {}).success);
    CHECK(f.script->created.load() == 2);
}

TEST_CASE("ExecutionGateway: deadline interrupts a long query", "[gateway][timeout]") {
    GatewayFixture f;
    f.script->mode = MockDbScript::Mode::BLOCK;

    ExecutionOptions options;
    options.timeout = std::chrono::milliseconds(50);

    const auto start = std::chrono::steady_clock::now();
    const auto r = f.gateway->execute(statement("SELECT slow()"), options);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(r.success);
    CHECK(r.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "query exceeded timeout of 50ms");
    CHECK(elapsed < std::chrono::seconds(5));
    CHECK(f.pool->get_stats().connections_discarded == 1);
}

TEST_CASE("ExecutionGateway: configured timeout applies when the caller sets none", "[gateway][timeout]") {
    GatewayFixture f(ExecutionGateway::Config{.query_timeout_ms = 30});
    f.script->mode = MockDbScript::Mode::BLOCK;

    const auto r = f.gateway->execute(statement("SELECT slow()"), {});
    CHECK(r.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "query exceeded timeout of 30ms");
}

TEST_CASE("ExecutionGateway: stop request cancels a running query", "[gateway][timeout]") {
    GatewayFixture f;
    f.script->mode = MockDbScript::Mode::BLOCK;

    std::stop_source source;
    ExecutionOptions options;
    options.timeout = std::chrono::milliseconds(10000);
    options.stop_token = source.get_token();

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        source.request_stop();
    });
    const auto r = f.gateway->execute(statement("SELECT slow()"), options);
    canceller.join();

    CHECK(r.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "query cancelled");
    CHECK(f.pool->get_stats().connections_discarded == 1);
}

TEST_CASE("ExecutionGateway: already-cancelled request never reaches the database", "[gateway][timeout]") {
    GatewayFixture f;
    std::stop_source source;
    source.request_stop();

    ExecutionOptions options;
    options.stop_token = source.get_token();

    const auto r = f.gateway->execute(statement("SELECT 1"), options);
    CHECK(r.error_kind == ErrorKind::TIMEOUT);
    CHECK(f.script->executed.load() == 0);
}

TEST_CASE("ExecutionGateway: exhausted pool is an execution error", "[gateway]") {
    GatewayFixture f(ExecutionGateway::Config{.pool_acquire_timeout_ms = 20}, 1);

    auto held = f.pool->acquire(std::chrono::milliseconds(100));
    REQUIRE(held);

    const auto r = f.gateway->execute(statement("SELECT 1"), {});
    CHECK_FALSE(r.success);
    CHECK(r.error_kind == ErrorKind::EXECUTION_ERROR);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "Failed to acquire database connection from pool");
}

TEST_CASE("ExecutionGateway: driver exceptions do not escape", "[gateway]") {
    GatewayFixture f;
    f.script->mode = MockDbScript::Mode::THROW;

    ExecutionResult r;
    REQUIRE_NOTHROW(r = f.gateway->execute(statement("SELECT 1"), {}));
    CHECK(r.error_kind == ErrorKind::EXECUTION_ERROR);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "Database error: driver exploded");
    CHECK(f.pool->get_stats().connections_discarded == 1);
}
