#include "policy/policy_validator.hpp"
#include "policy/policy_constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace sqlguard {

namespace {

bool is_word_entry(std::string_view entry) {
    return !entry.empty() && std::all_of(entry.begin(), entry.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_' || uc == '$' || uc >= 0x80;
    });
}

// ============================================================================
// Rules
// ============================================================================

std::optional<std::string> check_select_only(const CandidateStatement& stmt, const PolicySettings&) {
    if (stmt.verb == StatementVerb::SELECT) return std::nullopt;
    const std::string_view got = stmt.leading_keyword.empty()
        ? std::string_view(statement_verb_to_string(stmt.verb))
        : std::string_view(stmt.leading_keyword);
    return std::format("only SELECT statements are allowed (got {})", got);
}

std::optional<std::string> check_single_statement(const CandidateStatement& stmt, const PolicySettings&) {
    if (stmt.statement_count == 1) return std::nullopt;
    return std::format("multiple statements are not allowed (found {})", stmt.statement_count);
}

std::optional<std::string> check_forbidden_keywords(const CandidateStatement& stmt,
                                                    const PolicySettings& settings) {
    for (const auto& tok : stmt.tokens) {
        switch (tok.type) {
            case TokenType::WORD:
                if (settings.forbidden_words.contains(tok.value)) {
                    return std::format("contains forbidden keyword {}", tok.value);
                }
                break;
            case TokenType::LINE_COMMENT:
                if (settings.forbid_line_comments) {
                    return std::format("contains forbidden keyword {}", policy::kLineCommentMarker);
                }
                break;
            case TokenType::BLOCK_COMMENT:
                if (settings.forbid_block_comments) {
                    return std::format("contains forbidden keyword {}", policy::kBlockCommentMarker);
                }
                break;
            case TokenType::STRING:
            case TokenType::QUOTED_IDENTIFIER:
                break;
            default:
                if (!settings.forbidden_symbols.empty() && settings.forbidden_symbols.contains(tok.value)) {
                    return std::format("contains forbidden keyword {}", tok.value);
                }
                break;
        }
    }
    return std::nullopt;
}

std::optional<std::string> check_table_whitelist(const CandidateStatement& stmt,
                                                 const PolicySettings& settings) {
    if (!settings.whitelist_enabled()) return std::nullopt;
    for (const auto& ref : stmt.tables) {
        if (!settings.is_whitelisted(ref)) {
            return std::format("table {} is not whitelisted", ref.full_name());
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// PolicySettings
// ============================================================================

bool PolicySettings::is_whitelisted(const TableRef& ref) const {
    const auto table = utils::to_lower(ref.table);
    if (whitelist_tables.contains(table)) return true;
    if (ref.schema.empty()) {
        return whitelist_qualified_tables.contains(table);
    }
    return whitelist_qualified.contains(utils::to_lower(ref.full_name()));
}

PolicySettings PolicySettings::build(const std::vector<std::string>& schema_whitelist,
                                     const std::vector<std::string>& forbidden_keywords) {
    PolicySettings settings;

    for (const auto& raw : schema_whitelist) {
        auto entry = utils::to_lower(utils::trim(raw));
        if (entry.empty()) continue;
        const auto dot = entry.rfind('.');
        if (dot == std::string::npos) {
            settings.whitelist_tables.insert(std::move(entry));
        } else {
            settings.whitelist_qualified_tables.insert(entry.substr(dot + 1));
            settings.whitelist_qualified.insert(std::move(entry));
        }
    }

    for (const auto& raw : forbidden_keywords) {
        const auto entry = utils::trim(raw);
        if (entry.empty()) continue;
        if (entry == policy::kLineCommentMarker) {
            settings.forbid_line_comments = true;
        } else if (entry == policy::kBlockCommentMarker) {
            settings.forbid_block_comments = true;
        } else if (is_word_entry(entry)) {
            settings.forbidden_words.insert(utils::to_upper(entry));
        } else {
            settings.forbidden_symbols.insert(entry);
        }
    }

    return settings;
}

// ============================================================================
// PolicyValidator
// ============================================================================

PolicyValidator::PolicyValidator(const std::vector<std::string>& schema_whitelist,
                                 const std::vector<std::string>& forbidden_keywords)
    : settings_(PolicySettings::build(schema_whitelist, forbidden_keywords)) {}

const std::vector<PolicyRule>& PolicyValidator::rules() {
    static const std::vector<PolicyRule> kRules = {
        {policy::kRuleNonSelect, RejectReason::NON_SELECT, &check_select_only},
        {policy::kRuleMultipleStatements, RejectReason::MULTIPLE_STATEMENTS, &check_single_statement},
        {policy::kRuleForbiddenKeyword, RejectReason::FORBIDDEN_KEYWORD, &check_forbidden_keywords},
        {policy::kRuleTableWhitelist, RejectReason::TABLE_NOT_WHITELISTED, &check_table_whitelist},
    };
    return kRules;
}

ValidationVerdict PolicyValidator::validate(const CandidateStatement& stmt) const {
    for (const auto& rule : rules()) {
        if (auto detail = rule.check(stmt, settings_)) {
            return ValidationVerdict::reject(rule.reason, std::string(rule.name),
                std::format("{}{}", policy::kRejectPrefix, *detail));
        }
    }
    return ValidationVerdict::ok();
}

} // namespace sqlguard
