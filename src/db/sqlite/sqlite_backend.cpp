#include "db/sqlite/sqlite_backend.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "db/generic_connection_pool.hpp"

namespace sqlguard {

std::shared_ptr<IConnectionPool> SqliteBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    auto factory = std::make_shared<SqliteConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

} // namespace sqlguard
