#pragma once

#include "db/idb_backend.hpp"

namespace sqlguard {

/**
 * @brief PostgreSQL backend
 *
 * Creates PgConnectionFactory -> GenericConnectionPool. Every connection is
 * switched to read-only transactions before it enters the pool.
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;
};

} // namespace sqlguard
