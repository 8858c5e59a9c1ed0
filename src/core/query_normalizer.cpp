#include "core/query_normalizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <limits>

namespace sqlguard {

QueryNormalizer::QueryNormalizer(uint64_t row_limit_ceiling)
    : ceiling_(row_limit_ceiling) {}

std::optional<uint64_t> QueryNormalizer::parse_count(const Token& tok) {
    const auto& digits = tok.value;
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    // Out-of-range literals are still valid row counts; they just clamp
    const auto parsed = utils::try_parse_int<uint64_t>(digits);
    return parsed.value_or(std::numeric_limits<uint64_t>::max());
}

Result<QueryNormalizer::LimitClause> QueryNormalizer::parse_limit_args(
    const std::vector<const Token*>& args) {

    if (args.empty()) {
        return Result<LimitClause>::error(ErrorCategory::PARSE_AMBIGUOUS,
            "LIMIT without a row count");
    }

    const Token* count = nullptr;
    if (args.size() == 1) {
        count = args[0];                                        // LIMIT n
    } else if (args.size() >= 3 && args[1]->is_word("OFFSET")) {
        count = args[0];                                        // LIMIT n OFFSET m
    } else if (args.size() == 3 && args[1]->type == TokenType::COMMA
               && (args[0]->type == TokenType::NUMBER || args[0]->type == TokenType::PARAMETER)) {
        count = args[2];                                        // LIMIT m, n
    } else {
        return Result<LimitClause>::error(ErrorCategory::PARSE_AMBIGUOUS,
            "unsupported LIMIT clause");
    }

    if (count->type != TokenType::NUMBER) {
        return Result<LimitClause>::error(ErrorCategory::PARSE_AMBIGUOUS,
            std::format("LIMIT must be an integer literal (got {})", count->value));
    }
    const auto value = parse_count(*count);
    if (!value) {
        return Result<LimitClause>::error(ErrorCategory::PARSE_AMBIGUOUS,
            std::format("LIMIT must be an integer literal (got {})", count->value));
    }

    LimitClause clause;
    clause.count = count;
    clause.value = *value;
    return Result<LimitClause>::ok(clause);
}

Result<NormalizedStatement> QueryNormalizer::normalize(
    std::shared_ptr<const CandidateStatement> stmt) const {

    if (!stmt) {
        return Result<NormalizedStatement>::error(ErrorCategory::INTERNAL_ERROR,
            "no statement to normalize");
    }
    const std::string& text = stmt->text;

    // Significant tokens with their paren depth
    std::vector<const Token*> sig;
    std::vector<int> depth;
    sig.reserve(stmt->tokens.size());
    depth.reserve(stmt->tokens.size());
    int d = 0;
    for (const auto& tok : stmt->tokens) {
        if (tok.is_comment()) continue;
        if (tok.type == TokenType::RPAREN && d > 0) --d;
        sig.push_back(&tok);
        depth.push_back(d);
        if (tok.type == TokenType::LPAREN) ++d;
    }
    while (!sig.empty() && sig.back()->type == TokenType::SEMICOLON) {
        sig.pop_back();
        depth.pop_back();
    }
    if (sig.empty()) {
        return Result<NormalizedStatement>::error(ErrorCategory::PARSE_AMBIGUOUS,
            "empty statement");
    }

    std::optional<size_t> limit_idx;
    std::optional<size_t> offset_idx;
    for (size_t i = 0; i < sig.size(); ++i) {
        if (depth[i] != 0 || sig[i]->type != TokenType::WORD) continue;
        if (sig[i]->value == "LIMIT") {
            limit_idx = i;
        } else if (sig[i]->value == "OFFSET" && !offset_idx) {
            offset_idx = i;
        } else if (sig[i]->value == "FETCH") {
            return Result<NormalizedStatement>::error(ErrorCategory::PARSE_AMBIGUOUS,
                "FETCH FIRST row limits are not supported, use LIMIT");
        }
    }

    NormalizedStatement out;
    out.candidate = stmt;

    if (limit_idx) {
        const std::vector<const Token*> args(sig.begin() + static_cast<std::ptrdiff_t>(*limit_idx) + 1, sig.end());
        auto clause = parse_limit_args(args);
        if (clause.is_error()) {
            return Result<NormalizedStatement>::error(clause.error_category(), clause.error_message());
        }
        const auto& limit = clause.value();

        if (limit.value <= ceiling_) {
            out.sql = text;
            out.effective_limit = limit.value;
            out.action = LimitAction::UNCHANGED;
        } else {
            out.sql.reserve(text.size());
            out.sql.append(text, 0, limit.count->offset);
            out.sql += std::to_string(ceiling_);
            out.sql.append(text, limit.count->offset + limit.count->length);
            out.effective_limit = ceiling_;
            out.action = LimitAction::CLAMPED;
            utils::log::debug(std::format("LIMIT {} clamped to {}", limit.count->value, ceiling_));
        }
        return Result<NormalizedStatement>::ok(std::move(out));
    }

    if (offset_idx) {
        // ... OFFSET m  ->  ... LIMIT <ceiling> OFFSET m
        const size_t pos = sig[*offset_idx]->offset;
        out.sql = text.substr(0, pos) + std::format("LIMIT {} ", ceiling_) + text.substr(pos);
    } else {
        // Insert after the last significant token so a trailing ';' or comment stays last
        const size_t end = sig.back()->offset + sig.back()->length;
        out.sql = text.substr(0, end) + std::format(" LIMIT {}", ceiling_) + text.substr(end);
    }
    out.effective_limit = ceiling_;
    out.action = LimitAction::APPENDED;
    return Result<NormalizedStatement>::ok(std::move(out));
}

} // namespace sqlguard
