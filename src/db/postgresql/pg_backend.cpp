#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"

#include <libpq-fe.h>

#include <cstring>
#include <format>
#include <stdexcept>

namespace sqlguard {

namespace {

// host[:port]/dbname for logging; never includes the password
std::string describe_target(PQconninfoOption* options) {
    std::string host = "localhost";
    std::string port;
    std::string dbname;
    for (auto* opt = options; opt->keyword != nullptr; ++opt) {
        if (opt->val == nullptr || *opt->val == '\0') continue;
        if (std::strcmp(opt->keyword, "host") == 0) host = opt->val;
        else if (std::strcmp(opt->keyword, "port") == 0) port = opt->val;
        else if (std::strcmp(opt->keyword, "dbname") == 0) dbname = opt->val;
    }
    return port.empty()
        ? std::format("{}/{}", host, dbname)
        : std::format("{}:{}/{}", host, port, dbname);
}

} // anonymous namespace

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    // Reject malformed conninfo here instead of on every acquire
    char* parse_error = nullptr;
    PQconninfoOption* options = PQconninfoParse(config.connection_string.c_str(), &parse_error);
    if (options == nullptr) {
        std::string message = parse_error != nullptr ? utils::trim(parse_error) : "out of memory";
        if (parse_error != nullptr) PQfreemem(parse_error);
        throw std::runtime_error(std::format(
            "Invalid PostgreSQL connection string for '{}': {}", db_name, message));
    }
    const auto target = describe_target(options);
    PQconninfoFree(options);

    utils::log::info(std::format("PostgreSQL database '{}' at {} (read-only sessions)", db_name, target));

    auto factory = std::make_shared<PgConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

} // namespace sqlguard
