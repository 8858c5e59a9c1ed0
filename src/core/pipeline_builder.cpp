#include "core/pipeline_builder.hpp"
#include "core/pipeline.hpp"
#include "core/database_type.hpp"
#include "core/query_normalizer.hpp"
#include "core/utils.hpp"
#include "config/config_types.hpp"
#include "db/backend_registry.hpp"
#include "executor/execution_gateway.hpp"
#include "policy/policy_validator.hpp"

#include <format>
#include <stdexcept>

namespace sqlguard {

namespace {

PoolConfig to_pool_config(const DatabaseConfig& db) {
    PoolConfig pool;
    pool.connection_string = db.connection_string;
    pool.min_connections = db.min_connections;
    pool.max_connections = db.max_connections;
    pool.connection_timeout = db.connection_timeout;
    pool.idle_timeout = std::chrono::seconds(db.idle_timeout_seconds);
    pool.health_check_query = db.health_check_query;
    pool.max_lifetime = std::chrono::seconds(db.max_lifetime_seconds);
    return pool;
}

DatabaseType resolve_database_type(const DatabaseConfig& db) {
    if (db.type_str) {
        return parse_database_type(*db.type_str);
    }
    if (const auto inferred = infer_database_type(db.connection_string)) {
        return *inferred;
    }
    throw std::runtime_error(
        std::format("Cannot infer database type for '{}'; set database.type", db.name));
}

} // anonymous namespace

PipelineBuilder& PipelineBuilder::with_dialect_from_config() {
    if (!c_.config) throw std::runtime_error("PipelineBuilder: config is required");

    const auto& db = c_.config->database;
    if (db.type_str) {
        c_.dialect = parse_database_type(*db.type_str);
    } else if (const auto inferred = infer_database_type(db.connection_string)) {
        c_.dialect = *inferred;
    }
    return *this;
}

PipelineBuilder& PipelineBuilder::with_database_from_config() {
    if (!c_.config) throw std::runtime_error("PipelineBuilder: config is required");

    const auto& db = c_.config->database;
    if (db.connection_string.empty()) {
        with_dialect_from_config();
        utils::log::info("No database configured: statements are validated and normalized only");
        return *this;
    }

    register_builtin_backends();
    const auto type = resolve_database_type(db);
    c_.dialect = type;
    const auto backend = BackendRegistry::instance().create(type);

    auto pool = backend->create_pool(db.name, to_pool_config(db));

    ExecutionGateway::Config gateway_config;
    gateway_config.query_timeout_ms = static_cast<uint32_t>(db.query_timeout.count());
    gateway_config.pool_acquire_timeout_ms = static_cast<uint32_t>(db.pool_acquire_timeout.count());
    gateway_config.row_limit_ceiling = c_.config->row_limit_ceiling;

    c_.executor = std::make_shared<ExecutionGateway>(pool, gateway_config);
    c_.connection_pool = std::move(pool);

    utils::log::info(std::format("Execution gateway ready: {} database '{}'",
        database_type_to_string(type), db.name));
    return *this;
}

std::shared_ptr<GuardPipeline> PipelineBuilder::build() {
    if (!c_.config) throw std::runtime_error("PipelineBuilder: config is required");

    if (!c_.validator) {
        c_.validator = std::make_shared<const PolicyValidator>(
            c_.config->schema_whitelist, c_.config->forbidden_keywords);
    }
    if (!c_.normalizer) {
        c_.normalizer = std::make_shared<const QueryNormalizer>(c_.config->row_limit_ceiling);
    }

    return std::make_shared<GuardPipeline>(std::move(c_));
}

} // namespace sqlguard
