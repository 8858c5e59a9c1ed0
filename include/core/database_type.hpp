#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <format>
#include <optional>
#include <unordered_map>

namespace sqlguard {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
}

enum class DatabaseType {
    POSTGRESQL,
    SQLITE,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::SQLITE: return keys::SQLITE;
        default: return "unknown";
    }
}

[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

/**
 * @brief Guess the backend from a connection string
 *
 * sqlite://..., file:..., *.db / *.sqlite / *.sqlite3 and ":memory:" are SQLite;
 * postgres://, postgresql:// and libpq key=value strings are PostgreSQL.
 * Returns std::nullopt when nothing matches.
 */
[[nodiscard]] inline std::optional<DatabaseType> infer_database_type(std::string_view conn_str) {
    if (conn_str.starts_with("sqlite:") || conn_str.starts_with("file:") || conn_str == ":memory:") {
        return DatabaseType::SQLITE;
    }
    if (conn_str.ends_with(".db") || conn_str.ends_with(".sqlite") || conn_str.ends_with(".sqlite3")) {
        return DatabaseType::SQLITE;
    }
    if (conn_str.starts_with("postgres://") || conn_str.starts_with("postgresql://")
        || conn_str.find('=') != std::string_view::npos) {
        return DatabaseType::POSTGRESQL;
    }
    return std::nullopt;
}

} // namespace sqlguard
