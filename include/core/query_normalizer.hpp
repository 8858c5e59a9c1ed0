#pragma once

#include "core/types.hpp"
#include "core/error.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief Query normalizer - row ceiling enforcement
 *
 * Rewrites an accepted SELECT so that it can never return more rows than the
 * configured ceiling. Only the top-level (not parenthesized) LIMIT clause is
 * touched; WHERE/JOIN/GROUP BY text is left byte-for-byte intact.
 *
 *   LIMIT n            n <= ceiling: unchanged, otherwise n -> ceiling
 *   LIMIT n OFFSET m   same, offset kept
 *   LIMIT m, n         n is the row count, m kept
 *   (no LIMIT)         " LIMIT <ceiling>" after the last significant token,
 *                      or before a top-level OFFSET
 *
 * Anything else in LIMIT position (parameters, ALL, expressions, negative
 * numbers, subqueries) and top-level FETCH FIRST are PARSE_AMBIGUOUS.
 *
 * normalize(normalize(x)) == normalize(x).
 *
 * Thread-safety: immutable after construction, safe for concurrent use
 */
class QueryNormalizer {
public:
    explicit QueryNormalizer(uint64_t row_limit_ceiling);

    /**
     * @brief Enforce the row ceiling on an accepted statement
     * @param stmt Candidate that passed validation
     * @return Normalized statement, or PARSE_AMBIGUOUS error
     */
    [[nodiscard]] Result<NormalizedStatement> normalize(
        std::shared_ptr<const CandidateStatement> stmt) const;

    uint64_t ceiling() const { return ceiling_; }

private:
    /**
     * @brief Parsed top-level LIMIT clause
     */
    struct LimitClause {
        const Token* count = nullptr;       // Row-count literal to clamp
        uint64_t value = 0;                 // Parsed row count (saturated)
    };

    /**
     * @brief Parse the tokens following a top-level LIMIT keyword
     * @param args Significant tokens after LIMIT, trailing ';' removed
     * @return Clause, or error message
     */
    static Result<LimitClause> parse_limit_args(const std::vector<const Token*>& args);

    /**
     * @brief Parse an unsigned integer literal; saturates at UINT64_MAX
     */
    static std::optional<uint64_t> parse_count(const Token& tok);

    uint64_t ceiling_;
};

} // namespace sqlguard
