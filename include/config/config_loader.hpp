#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace sqlguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads GuardConfig from TOML and the environment
 *
 * Order of precedence (last wins):
 * 1. Built-in defaults
 * 2. TOML sections [guard], [database], [logging]; string values may
 *    reference ${VAR} environment variables
 * 3. Environment overrides: ROW_LIMIT_CEILING, SCHEMA_WHITELIST,
 *    FORBIDDEN_KEYWORDS (comma-separated), DB_CONNECTION_STRING, DB_TYPE
 *
 * Every validation error is collected and reported together.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GuardConfig config;

        static LoadResult ok(GuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sqlguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Defaults plus environment overrides only
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Validate a config, returning every problem found
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);

private:
    static void extract_guard(const toml::table& root, GuardConfig& config);
    static DatabaseConfig extract_database(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static GuardConfig extract_all_sections(const toml::table& root);

    /**
     * @brief Apply environment overrides in place
     * @throws std::runtime_error on malformed numeric values
     */
    static void apply_env_overrides(GuardConfig& config);

    static LoadResult validate_and_return(GuardConfig config);
};

} // namespace sqlguard
