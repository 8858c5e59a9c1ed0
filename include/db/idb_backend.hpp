#pragma once

#include "core/database_type.hpp"
#include "db/iconnection_pool.hpp"
#include <memory>
#include <string>

namespace sqlguard {

/**
 * @brief Abstract database backend
 *
 * Each database type (PostgreSQL, SQLite) provides a concrete implementation
 * that creates a pool of read-only connections for that driver.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::SQLITE);
 *   auto pool = backend->create_pool("default", config);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Create a connection pool */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) = 0;
};

} // namespace sqlguard
