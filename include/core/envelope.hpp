#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief JSON serialization of the response envelope
 *
 *   {
 *     "accepted": true,
 *     "reason": "ok" | "query rejected: ...",
 *     "reason_code": "ok" | "non_select" | ... | "parse_ambiguous",
 *     "rows": [ {"col": value, ...}, ... ] | null,
 *     "row_count": 3,
 *     "truncated": false,
 *     "error": null | "message",
 *     "request_id", "error_kind", "matched_rule", "sql", "columns",
 *     "execution_time_us"
 *   }
 *
 * Rows are objects keyed by column name in result order; SQL NULL is JSON
 * null. A repeated column name gets a "_2", "_3", ... suffix.
 */
namespace envelope {

/**
 * @brief Machine-readable reason ("parse_ambiguous" when parsing failed)
 */
[[nodiscard]] std::string reason_code(const GuardResponse& response);

/**
 * @brief Distinct object keys for a result's column names
 */
[[nodiscard]] std::vector<std::string> unique_column_keys(const std::vector<std::string>& columns);

[[nodiscard]] nlohmann::ordered_json to_json(const GuardResponse& response);

/**
 * @brief Serialize to a string (indent < 0: single line)
 */
[[nodiscard]] std::string to_json_string(const GuardResponse& response, int indent = -1);

} // namespace envelope

} // namespace sqlguard
