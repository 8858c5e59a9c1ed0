#pragma once

#include "core/types.hpp"
#include "parser/sql_tokenizer.hpp"
#include <string_view>
#include <memory>
#include <vector>

namespace sqlguard {

/**
 * @brief Statement classifier - turns raw SQL into a CandidateStatement
 *
 * Built on SqlTokenizer, so keywords inside string literals, quoted
 * identifiers and comments never affect the verdict. Determines:
 * - the leading verb (first keyword, skipping comments and opening parens)
 * - the number of statements (any token after a ';' starts another one)
 * - the FROM/JOIN sources, including those inside subqueries, compound
 *   queries and the TABLE name shorthand
 *
 * Classification is conservative: input that cannot be lexed reliably is
 * reported as an error and must be treated as a rejection by the caller.
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class StatementClassifier {
public:
    /**
     * @brief Error category for classification failures (all are parse-ambiguous)
     */
    enum class ErrorCode {
        SUCCESS = 0,
        EMPTY_STATEMENT,
        UNTERMINATED_LITERAL,
        AMBIGUOUS_COMMENT,
        INVALID_CHARACTER
    };

    /**
     * @brief Parse result
     */
    struct ParseResult {
        bool success;
        ErrorCode error_code;
        std::string error_message;
        std::shared_ptr<const CandidateStatement> statement;

        ParseResult()
            : success(false), error_code(ErrorCode::SUCCESS) {}

        static ParseResult ok(std::shared_ptr<const CandidateStatement> stmt) {
            ParseResult result;
            result.success = true;
            result.error_code = ErrorCode::SUCCESS;
            result.statement = std::move(stmt);
            return result;
        }

        static ParseResult error(ErrorCode code, std::string message) {
            ParseResult result;
            result.success = false;
            result.error_code = code;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Classify raw SQL
     * @param sql SQL text as received from the agent
     * @param dialect Database the statement is meant for (lexing differs slightly)
     * @return Candidate statement or a parse-ambiguous error
     */
    [[nodiscard]] static ParseResult classify(std::string_view sql,
                                              DatabaseType dialect = DatabaseType::POSTGRESQL);

    /**
     * @brief Map a leading keyword (uppercase) to a verb
     */
    [[nodiscard]] static StatementVerb classify_verb(std::string_view keyword);

    /**
     * @brief Count statements: 1 + number of ';' followed by any further token
     */
    [[nodiscard]] static size_t count_statements(const std::vector<Token>& tokens);

    /**
     * @brief Extract FROM/JOIN sources at every nesting level
     * @param sql Source text the tokens were produced from (names keep their original case)
     * @param tokens Token stream of sql
     */
    [[nodiscard]] static std::vector<TableRef> extract_tables(std::string_view sql,
                                                              const std::vector<Token>& tokens);
};

} // namespace sqlguard
