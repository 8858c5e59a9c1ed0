#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/pipeline.hpp"
#include "config/config_types.hpp"
#include "db/iconnection_pool.hpp"
#include "mocks/mock_query_executor.hpp"
#include "mocks/temp_sqlite_db.hpp"

#include <thread>

using namespace sqlguard;
using sqlguard::testing::MockQueryExecutor;
using sqlguard::testing::TempSqliteDb;
using Catch::Matchers::StartsWith;

namespace {

std::shared_ptr<GuardConfig> make_config() {
    auto config = std::make_shared<GuardConfig>();
    config->row_limit_ceiling = 100;
    config->schema_whitelist = {"customers", "orders"};
    return config;
}

struct PipelineFixture {
    std::shared_ptr<MockQueryExecutor> executor = std::make_shared<MockQueryExecutor>();
    std::shared_ptr<GuardPipeline> pipeline;

    explicit PipelineFixture(std::shared_ptr<GuardConfig> config = make_config()) {
        pipeline = PipelineBuilder()
            .with_config(std::move(config))
            .with_executor(executor)
            .build();
    }
};

} // anonymous namespace

// ============================================================================
// End-to-end decisions
// ============================================================================

TEST_CASE("Pipeline: whitelisted SELECT gets a LIMIT and runs", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT * FROM customers");

    CHECK(r.accepted);
    CHECK(r.reason == RejectReason::OK);
    CHECK(r.reason_text == "ok");
    CHECK(r.error_kind == ErrorKind::NONE);
    CHECK_FALSE(r.error.has_value());
    CHECK(r.sql == "SELECT * FROM customers LIMIT 100");
    CHECK(r.final_state == RequestState::RETURNED);
    REQUIRE(r.rows.has_value());
    CHECK(r.rows->size() == 1);
    CHECK(r.row_count == 1);
    CHECK_FALSE(r.request_id.empty());

    CHECK(f.executor->execute_count() == 1);
    CHECK(f.executor->last_sql() == "SELECT * FROM customers LIMIT 100");
}

TEST_CASE("Pipeline: DELETE is rejected before execution", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("DELETE FROM customers WHERE id=1");

    CHECK_FALSE(r.accepted);
    CHECK(r.reason == RejectReason::NON_SELECT);
    CHECK(r.matched_rule == "non_select");
    CHECK(r.error_kind == ErrorKind::VALIDATION_REJECTED);
    CHECK(r.reason_text == "query rejected: only SELECT statements are allowed (got DELETE)");
    CHECK(r.error == r.reason_text);
    CHECK(r.final_state == RequestState::REJECTED);
    CHECK_FALSE(r.rows.has_value());
    CHECK_FALSE(r.sql.has_value());
    CHECK(f.executor->execute_count() == 0);
}

TEST_CASE("Pipeline: stacked statements are rejected", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT * FROM orders; DROP TABLE orders;");

    CHECK_FALSE(r.accepted);
    CHECK(r.reason == RejectReason::MULTIPLE_STATEMENTS);
    CHECK(r.final_state == RequestState::REJECTED);
    CHECK(f.executor->execute_count() == 0);
}

TEST_CASE("Pipeline: LIMIT under the ceiling is kept", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT name FROM customers LIMIT 50");

    CHECK(r.accepted);
    CHECK(r.sql == "SELECT name FROM customers LIMIT 50");
    CHECK(f.executor->last_sql() == "SELECT name FROM customers LIMIT 50");
}

TEST_CASE("Pipeline: LIMIT over the ceiling is clamped", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT name FROM customers LIMIT 500");

    CHECK(r.accepted);
    CHECK(r.sql == "SELECT name FROM customers LIMIT 100");
    CHECK(f.executor->last_sql() == "SELECT name FROM customers LIMIT 100");
}

TEST_CASE("Pipeline: table outside the whitelist is rejected", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT * FROM secret_table");

    CHECK_FALSE(r.accepted);
    CHECK(r.reason == RejectReason::TABLE_NOT_WHITELISTED);
    CHECK(r.reason_text == "query rejected: table secret_table is not whitelisted");
    CHECK(f.executor->execute_count() == 0);
}

TEST_CASE("Pipeline: a subquery inside array brackets is still checked", "[pipeline][dialect]") {
    PipelineFixture f;
    const auto r = f.pipeline->run(
        "SELECT ARRAY[(SELECT password FROM secret_table LIMIT 1)] FROM customers");

    CHECK_FALSE(r.accepted);
    CHECK(r.reason == RejectReason::TABLE_NOT_WHITELISTED);
    CHECK(f.executor->execute_count() == 0);
}

TEST_CASE("Pipeline: dialect follows the configured database", "[pipeline][dialect]") {
    auto config = make_config();
    config->database.connection_string = "sqlite:///shop.db";

    SECTION("SQLite reads brackets as quoted names") {
        auto pipeline = PipelineBuilder().with_config(config).with_dialect_from_config().build();
        const auto r = pipeline->evaluate("SELECT [name] FROM [customers]");
        CHECK(r.accepted);
        CHECK(r.sql == "SELECT [name] FROM [customers] LIMIT 100");
    }
    SECTION("Explicit type wins over the connection string") {
        config->database.type_str = "postgresql";
        auto pipeline = PipelineBuilder().with_config(config).with_dialect_from_config().build();
        const auto r = pipeline->evaluate("SELECT [name] FROM [customers]");
        CHECK_FALSE(r.accepted);
    }
}

TEST_CASE("Pipeline: forbidden keyword is rejected", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT * FROM customers -- sneaky");

    CHECK_FALSE(r.accepted);
    CHECK(r.reason == RejectReason::FORBIDDEN_KEYWORD);
    CHECK(r.matched_rule == "forbidden_keyword");
}

// ============================================================================
// Ambiguous input
// ============================================================================

TEST_CASE("Pipeline: unparseable SQL is rejected as ambiguous", "[pipeline][ambiguous]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT 'abc FROM customers");

    CHECK_FALSE(r.accepted);
    CHECK(r.error_kind == ErrorKind::PARSE_AMBIGUOUS);
    CHECK(r.final_state == RequestState::REJECTED);
    CHECK(r.matched_rule.empty());
    CHECK_THAT(r.reason_text, StartsWith("query rejected: ambiguous SQL: "));
    CHECK(f.executor->execute_count() == 0);
}

TEST_CASE("Pipeline: empty SQL is rejected as ambiguous", "[pipeline][ambiguous]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("   ");
    CHECK_FALSE(r.accepted);
    CHECK(r.error_kind == ErrorKind::PARSE_AMBIGUOUS);
    CHECK(r.reason_text == "query rejected: ambiguous SQL: empty statement");
}

TEST_CASE("Pipeline: non-literal LIMIT is rejected as ambiguous", "[pipeline][ambiguous]") {
    PipelineFixture f;
    const auto r = f.pipeline->run("SELECT * FROM customers LIMIT $1");

    CHECK_FALSE(r.accepted);
    CHECK(r.error_kind == ErrorKind::PARSE_AMBIGUOUS);
    CHECK(r.reason_text == "query rejected: LIMIT must be an integer literal (got $1)");
    CHECK(r.final_state == RequestState::REJECTED);
    CHECK(f.executor->execute_count() == 0);
}

// ============================================================================
// Execution outcomes
// ============================================================================

TEST_CASE("Pipeline: execution failure is accepted but carries the error", "[pipeline][execution]") {
    PipelineFixture f;
    f.executor->set_should_succeed(false);

    const auto r = f.pipeline->run("SELECT * FROM customers");
    CHECK(r.accepted);
    CHECK(r.error_kind == ErrorKind::EXECUTION_ERROR);
    CHECK(r.error == "Mock failure: mock");
    CHECK_FALSE(r.rows.has_value());
    CHECK(r.final_state == RequestState::RETURNED);
    CHECK(r.sql == "SELECT * FROM customers LIMIT 100");
}

TEST_CASE("Pipeline: timeout is reported as TIMEOUT", "[pipeline][execution]") {
    PipelineFixture f;
    f.executor->set_should_succeed(false);
    f.executor->set_failure_kind(ErrorKind::TIMEOUT);

    const auto r = f.pipeline->run("SELECT * FROM customers");
    CHECK(r.error_kind == ErrorKind::TIMEOUT);
    CHECK(r.final_state == RequestState::RETURNED);
}

TEST_CASE("Pipeline: dry run validates without executing", "[pipeline]") {
    PipelineFixture f;
    const auto r = f.pipeline->evaluate("SELECT * FROM orders");

    CHECK(r.accepted);
    CHECK(r.sql == "SELECT * FROM orders LIMIT 100");
    CHECK_FALSE(r.rows.has_value());
    CHECK(r.final_state == RequestState::RETURNED);
    CHECK(f.executor->execute_count() == 0);
}

TEST_CASE("Pipeline: without a database, accepted statements report an error", "[pipeline]") {
    auto pipeline = PipelineBuilder().with_config(make_config()).build();
    CHECK_FALSE(pipeline->can_execute());

    const auto r = pipeline->run("SELECT * FROM customers");
    CHECK(r.accepted);
    CHECK(r.error_kind == ErrorKind::EXECUTION_ERROR);
    CHECK(r.error == "no database configured");
}

TEST_CASE("Pipeline: missing config is an error", "[pipeline]") {
    CHECK_THROWS(PipelineBuilder().build());

    PipelineComponents components;
    CHECK_THROWS_AS(GuardPipeline(components), std::invalid_argument);
}

TEST_CASE("Pipeline: statistics count each outcome", "[pipeline]") {
    PipelineFixture f;
    (void)f.pipeline->run("SELECT * FROM customers");
    (void)f.pipeline->run("DROP TABLE customers");
    (void)f.pipeline->run("SELECT 'x");
    f.executor->set_should_succeed(false);
    (void)f.pipeline->run("SELECT * FROM orders");

    const auto stats = f.pipeline->get_stats();
    CHECK(stats.total_requests == 4);
    CHECK(stats.requests_executed == 1);
    CHECK(stats.requests_rejected == 2);
    CHECK(stats.requests_failed == 1);
}

TEST_CASE("Pipeline: each request gets its own id", "[pipeline]") {
    PipelineFixture f;
    const auto a = f.pipeline->run("SELECT 1");
    const auto b = f.pipeline->run("SELECT 1");
    CHECK(a.request_id != b.request_id);
}

TEST_CASE("Pipeline: concurrent requests", "[pipeline]") {
    PipelineFixture f;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                if (f.pipeline->run("SELECT * FROM customers").accepted) {
                    accepted.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(accepted.load() == kThreads * kPerThread);
    CHECK(f.executor->execute_count() == kThreads * kPerThread);
}

// ============================================================================
// SQLite end to end
// ============================================================================

TEST_CASE("Pipeline: SQLite database from config", "[pipeline][sqlite]") {
    TempSqliteDb db;
    auto config = make_config();
    config->row_limit_ceiling = 2;
    config->database.connection_string = db.url();
    config->database.max_connections = 2;

    auto pipeline = PipelineBuilder()
        .with_config(config)
        .with_database_from_config()
        .build();
    REQUIRE(pipeline->can_execute());
    REQUIRE(pipeline->get_connection_pool());

    SECTION("Rows come back limited by the ceiling") {
        const auto r = pipeline->run("SELECT id, name, email FROM customers ORDER BY id");
        CHECK(r.accepted);
        CHECK(r.sql == "SELECT id, name, email FROM customers ORDER BY id LIMIT 2");
        CHECK(r.error_kind == ErrorKind::NONE);
        CHECK(r.column_names == std::vector<std::string>{"id", "name", "email"});
        REQUIRE(r.rows.has_value());
        REQUIRE(r.rows->size() == 2);
        CHECK((*r.rows)[1][1] == "Grace");
        CHECK_FALSE((*r.rows)[1][2].has_value());
        CHECK_FALSE(r.truncated);
    }

    SECTION("Unknown table is a database error") {
        auto open = make_config();
        open->schema_whitelist.clear();
        open->database.connection_string = db.url();
        auto unrestricted = PipelineBuilder().with_config(open).with_database_from_config().build();

        const auto r = unrestricted->run("SELECT * FROM missing");
        CHECK(r.accepted);
        CHECK(r.error_kind == ErrorKind::EXECUTION_ERROR);
        REQUIRE(r.error.has_value());
        CHECK(r.error->find("no such table") != std::string::npos);
        CHECK(unrestricted->get_connection_pool()->get_stats().connections_discarded == 1);
    }

    SECTION("Bracketed names are SQLite identifiers") {
        const auto r = pipeline->run("SELECT [name] FROM [customers] ORDER BY id");
        CHECK(r.accepted);
        CHECK(r.error_kind == ErrorKind::NONE);
        REQUIRE(r.rows.has_value());
        CHECK(r.rows->size() == 2);
    }

    SECTION("Rejected writes never touch the file") {
        const auto r = pipeline->run("DELETE FROM customers");
        CHECK_FALSE(r.accepted);
        CHECK(db.count("customers") == 3);
    }

    SECTION("Caller timeout interrupts a runaway query") {
        auto open = make_config();
        open->schema_whitelist.clear();
        open->database.connection_string = db.url();
        auto unrestricted = PipelineBuilder().with_config(open).with_database_from_config().build();

        ExecutionOptions options;
        options.timeout = std::chrono::milliseconds(100);
        const auto r = unrestricted->run(
            "SELECT count(*) FROM (SELECT 1 FROM customers a, customers b, customers c, "
            "customers d, customers e, customers f, customers g, customers h, customers i, "
            "customers j, customers k, customers l, customers m, customers n, customers o, "
            "customers p, customers q, customers r, customers s, customers t)",
            options);
        CHECK(r.accepted);
        CHECK(r.error_kind == ErrorKind::TIMEOUT);
        CHECK(r.error == "query exceeded timeout of 100ms");
    }
}

TEST_CASE("Pipeline: unknown database type fails at build time", "[pipeline]") {
    auto config = make_config();
    config->database.connection_string = "mystery-db";
    CHECK_THROWS(PipelineBuilder().with_config(config).with_database_from_config());
}
