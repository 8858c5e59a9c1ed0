#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace sqlguard {

/**
 * @brief Single-pass SQL lexer
 *
 * Splits SQL text into tokens while tracking quoting and comment state so
 * that keywords, semicolons and parentheses inside literals or comments are
 * never mistaken for syntax. Dialect coverage is the common subset of
 * PostgreSQL and SQLite:
 * - 'string' with '' escapes, E'string' with backslash escapes
 * - $tag$ dollar-quoted $tag$ strings
 * - "identifier", `identifier`; [identifier] for SQLite only, since
 *   PostgreSQL uses brackets for array constructors and subscripts
 * - -- line comments, slash-star block comments (nesting is rejected)
 * - ?, $1, :name, @name parameters
 *
 * Whitespace is discarded; comments are kept as tokens so callers can
 * inspect them.
 *
 * Example:
 *   Input:  "SELECT a FROM t; -- done"
 *   Tokens: WORD(SELECT) WORD(A) WORD(FROM) WORD(T) SEMICOLON LINE_COMMENT
 */
class SqlTokenizer {
public:
    enum class ErrorCode {
        NONE,
        UNTERMINATED_STRING,
        UNTERMINATED_IDENTIFIER,
        UNTERMINATED_COMMENT,
        NESTED_COMMENT,
        NUL_BYTE
    };

    struct TokenizeResult {
        bool success;
        ErrorCode error_code;
        std::string error_message;
        size_t error_offset;
        std::vector<Token> tokens;

        TokenizeResult() : success(false), error_code(ErrorCode::NONE), error_offset(0) {}

        static TokenizeResult ok(std::vector<Token> toks) {
            TokenizeResult r;
            r.success = true;
            r.tokens = std::move(toks);
            return r;
        }

        static TokenizeResult error(ErrorCode code, std::string msg, size_t offset) {
            TokenizeResult r;
            r.success = false;
            r.error_code = code;
            r.error_message = std::move(msg);
            r.error_offset = offset;
            return r;
        }
    };

    /**
     * @brief Tokenize SQL text
     * @param sql Raw SQL
     * @param dialect Target database; decides whether '[' quotes an identifier
     * @return Tokens, or an error describing the first lexical ambiguity
     */
    [[nodiscard]] static TokenizeResult tokenize(std::string_view sql,
                                                 DatabaseType dialect = DatabaseType::POSTGRESQL);

private:
    /**
     * @brief Lexer states
     */
    enum class State {
        NORMAL,              // Between tokens
        IN_SINGLE_QUOTE,     // Inside 'string literal'
        IN_ESCAPE_STRING,    // Inside E'string' (backslash escapes)
        IN_DOLLAR_QUOTE,     // Inside $tag$ ... $tag$
        IN_QUOTED_IDENT,     // Inside "identifier", `identifier` or [identifier] (SQLite)
        IN_BLOCK_COMMENT,    // Inside slash-star comment
        IN_LINE_COMMENT      // Inside -- line comment
    };

    // Returns the "$tag$" delimiter starting at pos, or empty if pos is not a dollar-quote opener
    static std::string_view dollar_tag_at(std::string_view sql, size_t pos);
};

} // namespace sqlguard
