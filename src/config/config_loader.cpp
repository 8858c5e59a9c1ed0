#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <optional>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlguard {

// Environment override names
static constexpr const char* kEnvRowLimitCeiling  = "ROW_LIMIT_CEILING";
static constexpr const char* kEnvSchemaWhitelist  = "SCHEMA_WHITELIST";
static constexpr const char* kEnvForbiddenKeywords = "FORBIDDEN_KEYWORDS";
static constexpr const char* kEnvConnectionString = "DB_CONNECTION_STRING";
static constexpr const char* kEnvDbType           = "DB_TYPE";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Accepts either an array of strings or one comma-separated string
std::optional<std::vector<std::string>> toml_string_list(const toml::table& tbl,
                                                         const std::string_view key) {
    if (const auto* arr = tbl[key].as_array()) {
        std::vector<std::string> result;
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(utils::trim(s->get()));
            } else {
                throw std::runtime_error(std::format("{} must contain only strings", key));
            }
        }
        return result;
    }
    if (const auto* s = tbl[key].as_string()) {
        return utils::split_list(s->get());
    }
    return std::nullopt;
}

// Negative values clamp to zero so validation reports them
uint64_t non_negative(int64_t value) {
    return static_cast<uint64_t>(std::max<int64_t>(0, value));
}

std::optional<std::string> env_value(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return std::nullopt;
    auto value = utils::trim(raw);
    if (value.empty()) return std::nullopt;
    return value;
}

bool valid_table_entry(const std::string& entry) {
    if (entry.empty()) return false;
    const auto dot = entry.find('.');
    if (dot == std::string::npos) return true;
    return dot > 0 && dot + 1 < entry.size() && entry.find('.', dot + 1) == std::string::npos;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

void ConfigLoader::extract_guard(const toml::table& root, GuardConfig& config) {
    const auto* guard = root["guard"].as_table();
    if (!guard) return;
    const auto& g = *guard;

    if (const auto v = g["row_limit_ceiling"].value<int64_t>()) {
        config.row_limit_ceiling = non_negative(*v);
    }
    if (auto list = toml_string_list(g, "schema_whitelist")) {
        config.schema_whitelist = std::move(*list);
    }
    if (auto list = toml_string_list(g, "forbidden_keywords")) {
        config.forbidden_keywords = std::move(*list);
    }
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& db = *database;

    cfg.name = db["name"].value_or("default"s);
    if (const auto* type = db["type"].as_string()) {
        cfg.type_str = std::string(type->get());
    }
    cfg.connection_string = db["connection_string"].value_or(""s);
    cfg.min_connections = static_cast<size_t>(non_negative(db["min_connections"].value_or(int64_t{1})));
    cfg.max_connections = static_cast<size_t>(non_negative(db["max_connections"].value_or(int64_t{4})));
    cfg.connection_timeout = std::chrono::milliseconds(db["connection_timeout_ms"].value_or(int64_t{5000}));
    cfg.query_timeout = std::chrono::milliseconds(db["query_timeout_ms"].value_or(int64_t{30000}));
    cfg.pool_acquire_timeout = std::chrono::milliseconds(db["pool_acquire_timeout_ms"].value_or(int64_t{5000}));
    cfg.health_check_query = db["health_check_query"].value_or("SELECT 1"s);
    cfg.idle_timeout_seconds = db["idle_timeout_seconds"].value_or(300);
    cfg.max_lifetime_seconds = db["max_lifetime_seconds"].value_or(3600);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

GuardConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    GuardConfig config;
    extract_guard(root, config);
    config.database = extract_database(root);
    config.logging = extract_logging(root);
    return config;
}

void ConfigLoader::apply_env_overrides(GuardConfig& config) {
    if (const auto v = env_value(kEnvRowLimitCeiling)) {
        const auto parsed = utils::try_parse_int<uint64_t>(*v);
        if (!parsed) {
            throw std::runtime_error(
                std::format("{} must be a non-negative integer, got '{}'", kEnvRowLimitCeiling, *v));
        }
        config.row_limit_ceiling = *parsed;
    }
    if (const auto v = env_value(kEnvSchemaWhitelist)) {
        config.schema_whitelist = utils::split_list(*v);
    }
    if (const auto v = env_value(kEnvForbiddenKeywords)) {
        config.forbidden_keywords = utils::split_list(*v);
    }
    if (const auto v = env_value(kEnvConnectionString)) {
        config.database.connection_string = *v;
    }
    if (const auto v = env_value(kEnvDbType)) {
        config.database.type_str = *v;
    }
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        auto config = extract_all_sections(tbl);
        apply_env_overrides(config);
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        auto config = extract_all_sections(tbl);
        apply_env_overrides(config);
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    try {
        GuardConfig config;
        apply_env_overrides(config);
        return validate_and_return(std::move(config));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> errors;

    if (config.row_limit_ceiling == 0) {
        errors.emplace_back("guard.row_limit_ceiling must be > 0");
    }

    for (const auto& entry : config.schema_whitelist) {
        if (!valid_table_entry(entry)) {
            errors.push_back(std::format(
                "guard.schema_whitelist entry '{}' must be 'table' or 'schema.table'", entry));
        }
    }

    for (const auto& keyword : config.forbidden_keywords) {
        if (keyword.empty()) {
            errors.emplace_back("guard.forbidden_keywords must not contain empty entries");
            break;
        }
    }

    const auto& db = config.database;
    if (db.max_connections == 0) {
        errors.emplace_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format(
            "database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.query_timeout.count() <= 0) {
        errors.emplace_back("database.query_timeout_ms must be > 0");
    }
    if (db.pool_acquire_timeout.count() <= 0) {
        errors.emplace_back("database.pool_acquire_timeout_ms must be > 0");
    }
    if (db.connection_timeout.count() <= 0) {
        errors.emplace_back("database.connection_timeout_ms must be > 0");
    }

    if (db.type_str) {
        try {
            (void)parse_database_type(*db.type_str);
        } catch (const std::exception& e) {
            errors.push_back(std::format("database.type: {}", e.what()));
        }
    } else if (!db.connection_string.empty() && !infer_database_type(db.connection_string)) {
        errors.emplace_back("database.type is required when it cannot be inferred from connection_string");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    return errors;
}

} // namespace sqlguard
