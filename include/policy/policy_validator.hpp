#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sqlguard {

/**
 * @brief Normalized lookup sets built once from the configuration
 */
struct PolicySettings {
    std::unordered_set<std::string> whitelist_tables;       // Unqualified entries, lowercase
    std::unordered_set<std::string> whitelist_qualified;    // schema.table entries, lowercase
    std::unordered_set<std::string> whitelist_qualified_tables; // Table part of qualified entries
    std::unordered_set<std::string> forbidden_words;        // Uppercase keywords
    std::unordered_set<std::string> forbidden_symbols;      // Non-word entries other than comment markers
    bool forbid_line_comments = false;
    bool forbid_block_comments = false;

    [[nodiscard]] bool whitelist_enabled() const {
        return !whitelist_tables.empty() || !whitelist_qualified.empty();
    }

    [[nodiscard]] bool is_whitelisted(const TableRef& ref) const;

    [[nodiscard]] static PolicySettings build(const std::vector<std::string>& schema_whitelist,
                                              const std::vector<std::string>& forbidden_keywords);
};

/**
 * @brief One validation rule
 *
 * check() returns the rejection detail when the statement violates the rule,
 * std::nullopt when it passes. Rules are pure and never throw.
 */
struct PolicyRule {
    std::string_view name;
    RejectReason reason;
    std::optional<std::string> (*check)(const CandidateStatement&, const PolicySettings&);
};

/**
 * @brief Policy Validator - accept/reject gate for candidate statements
 *
 * Rules run in a fixed order and the first failing rule wins:
 * 1. non_select             verb must be SELECT
 * 2. multiple_statements    exactly one statement
 * 3. forbidden_keyword      no denylisted keyword or comment marker
 * 4. table_not_whitelisted  every source is whitelisted (skipped when the list is empty)
 *
 * Thread-safety: immutable after construction, safe for concurrent use
 */
class PolicyValidator {
public:
    /**
     * @brief Construct validator
     * @param schema_whitelist Permitted tables ("table" or "schema.table")
     * @param forbidden_keywords Denylist (keywords, "--", "/*")
     */
    PolicyValidator(const std::vector<std::string>& schema_whitelist,
                    const std::vector<std::string>& forbidden_keywords);

    /**
     * @brief Evaluate statement against the ordered rule list
     * @param stmt Classified statement
     * @return Verdict (accepted, or the first rule that fired)
     */
    [[nodiscard]] ValidationVerdict validate(const CandidateStatement& stmt) const;

    /**
     * @brief Ordered rule list
     */
    [[nodiscard]] static const std::vector<PolicyRule>& rules();

    const PolicySettings& settings() const { return settings_; }

private:
    PolicySettings settings_;
};

} // namespace sqlguard
