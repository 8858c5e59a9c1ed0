#pragma once

#include "core/database_type.hpp"

#include <memory>

namespace sqlguard {

// Forward declarations
struct GuardConfig;
class PolicyValidator;
class QueryNormalizer;
class IQueryExecutor;
class IConnectionPool;
class GuardPipeline;

/**
 * @brief All components that GuardPipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<const GuardConfig> config;
    std::shared_ptr<const PolicyValidator> validator;
    std::shared_ptr<const QueryNormalizer> normalizer;

    // SQL dialect used for lexing; PostgreSQL unless the database says otherwise
    DatabaseType dialect = DatabaseType::POSTGRESQL;

    // Optional (nullptr = validate and normalize only)
    std::shared_ptr<IQueryExecutor> executor;
    std::shared_ptr<IConnectionPool> connection_pool;
};

/**
 * @brief Builder pattern for GuardPipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_config(config)
 *       .with_executor(executor)    // optional
 *       .build();
 *
 * Validator and normalizer are derived from the config unless supplied.
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_config(std::shared_ptr<const GuardConfig> p)          { c_.config = std::move(p); return *this; }
    PipelineBuilder& with_validator(std::shared_ptr<const PolicyValidator> p)   { c_.validator = std::move(p); return *this; }
    PipelineBuilder& with_normalizer(std::shared_ptr<const QueryNormalizer> p)  { c_.normalizer = std::move(p); return *this; }
    PipelineBuilder& with_executor(std::shared_ptr<IQueryExecutor> p)           { c_.executor = std::move(p); return *this; }
    PipelineBuilder& with_connection_pool(std::shared_ptr<IConnectionPool> p)   { c_.connection_pool = std::move(p); return *this; }
    PipelineBuilder& with_dialect(DatabaseType d)                               { c_.dialect = d; return *this; }

    /**
     * @brief Take the SQL dialect from config.database (explicit type, else
     *        inferred from the connection string, else PostgreSQL)
     * @throws std::runtime_error if config is missing or database.type is unknown
     */
    PipelineBuilder& with_dialect_from_config();

    /**
     * @brief Create the connection pool and execution gateway described by
     *        config.database (only the dialect is set when connection_string is empty)
     * @throws std::runtime_error if config is missing or the backend is unknown
     */
    PipelineBuilder& with_database_from_config();

    /**
     * @brief Build the GuardPipeline from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<GuardPipeline> build();

private:
    PipelineComponents c_;
};

} // namespace sqlguard
