#pragma once

#include "db/idb_backend.hpp"

namespace sqlguard {

/**
 * @brief SQLite backend
 *
 * Creates SqliteConnectionFactory -> GenericConnectionPool over a
 * read-only database file.
 */
class SqliteBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::SQLITE;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;
};

} // namespace sqlguard
