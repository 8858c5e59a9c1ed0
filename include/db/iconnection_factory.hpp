#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlguard {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native
 * open function (PQconnectdb, sqlite3_open_v2) and puts the session
 * into read-only mode before handing it out.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new read-only database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace sqlguard
