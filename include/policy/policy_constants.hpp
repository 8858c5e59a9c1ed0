#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace sqlguard::policy {

inline constexpr uint64_t kDefaultRowLimitCeiling = 100;

// Denylist applied when the configuration does not supply one
inline constexpr std::array<std::string_view, 11> kDefaultForbiddenKeywords = {
    "DROP", "DELETE", "UPDATE", "INSERT", "ALTER", "TRUNCATE",
    "ATTACH", "PRAGMA", "EXEC", "--", "/*"
};

inline constexpr std::string_view kLineCommentMarker = "--";
inline constexpr std::string_view kBlockCommentMarker = "/*";

// Rule names, in evaluation order
inline constexpr std::string_view kRuleNonSelect = "non_select";
inline constexpr std::string_view kRuleMultipleStatements = "multiple_statements";
inline constexpr std::string_view kRuleForbiddenKeyword = "forbidden_keyword";
inline constexpr std::string_view kRuleTableWhitelist = "table_not_whitelisted";

inline constexpr std::string_view kRejectPrefix = "query rejected: ";

} // namespace sqlguard::policy
