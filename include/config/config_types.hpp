#pragma once

#include "policy/policy_constants.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string name;
    std::optional<std::string> type_str;    // Inferred from connection_string when absent
    std::string connection_string;
    size_t min_connections;
    size_t max_connections;
    std::chrono::milliseconds connection_timeout;
    std::chrono::milliseconds query_timeout;
    std::chrono::milliseconds pool_acquire_timeout;
    std::string health_check_query;
    int idle_timeout_seconds;
    int max_lifetime_seconds;

    DatabaseConfig()
        : name("default"),
          min_connections(1),
          max_connections(4),
          connection_timeout(5000),
          query_timeout(30000),
          pool_acquire_timeout(5000),
          health_check_query("SELECT 1"),
          idle_timeout_seconds(300),
          max_lifetime_seconds(3600) {}
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// GuardConfig - Complete parsed configuration
// ============================================================================

/**
 * @brief Immutable guard configuration
 *
 * Built once by ConfigLoader and shared as shared_ptr<const GuardConfig>.
 */
struct GuardConfig {
    uint64_t row_limit_ceiling = policy::kDefaultRowLimitCeiling;
    std::vector<std::string> schema_whitelist;      // Empty = whitelist rule skipped
    std::vector<std::string> forbidden_keywords;
    DatabaseConfig database;
    LoggingConfig logging;

    GuardConfig()
        : forbidden_keywords(policy::kDefaultForbiddenKeywords.begin(),
                             policy::kDefaultForbiddenKeywords.end()) {}
};

} // namespace sqlguard
