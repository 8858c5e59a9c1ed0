#include "core/envelope.hpp"

#include <format>
#include <unordered_set>

namespace sqlguard::envelope {

using json = nlohmann::ordered_json;

std::string reason_code(const GuardResponse& response) {
    if (response.error_kind == ErrorKind::PARSE_AMBIGUOUS) {
        return error_kind_to_string(ErrorKind::PARSE_AMBIGUOUS);
    }
    return reject_reason_to_string(response.reason);
}

std::vector<std::string> unique_column_keys(const std::vector<std::string>& columns) {
    std::vector<std::string> keys;
    keys.reserve(columns.size());
    std::unordered_set<std::string> used;

    for (const auto& name : columns) {
        std::string key = name;
        for (int n = 2; used.contains(key); ++n) {
            key = std::format("{}_{}", name, n);
        }
        used.insert(key);
        keys.emplace_back(std::move(key));
    }
    return keys;
}

json to_json(const GuardResponse& response) {
    json j;
    j["accepted"] = response.accepted;
    j["reason"] = response.reason_text;
    j["reason_code"] = reason_code(response);

    if (response.rows) {
        const auto keys = unique_column_keys(response.column_names);
        json rows = json::array();
        for (const auto& row : *response.rows) {
            json obj = json::object();
            for (size_t i = 0; i < keys.size(); ++i) {
                if (i < row.size() && row[i]) {
                    obj[keys[i]] = *row[i];
                } else {
                    obj[keys[i]] = nullptr;
                }
            }
            rows.push_back(std::move(obj));
        }
        j["rows"] = std::move(rows);
    } else {
        j["rows"] = nullptr;
    }

    j["row_count"] = response.row_count;
    j["truncated"] = response.truncated;
    j["error"] = response.error ? json(*response.error) : json(nullptr);

    j["request_id"] = response.request_id;
    j["error_kind"] = response.error_kind == ErrorKind::NONE
        ? json(nullptr)
        : json(error_kind_to_string(response.error_kind));
    j["matched_rule"] = response.matched_rule.empty()
        ? json(nullptr)
        : json(response.matched_rule);
    j["sql"] = response.sql ? json(*response.sql) : json(nullptr);
    j["columns"] = response.column_names;
    j["execution_time_us"] = response.execution_time.count();
    return j;
}

std::string to_json_string(const GuardResponse& response, int indent) {
    // Replace invalid UTF-8 from the database rather than throwing
    return to_json(response).dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace sqlguard::envelope
