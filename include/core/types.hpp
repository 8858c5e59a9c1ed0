#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <memory>

namespace sqlguard {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Leading verb of a candidate statement
 *
 * DDL covers CREATE/ALTER/DROP/TRUNCATE/RENAME/COMMENT. Anything that is not
 * recognised (WITH, PRAGMA, EXPLAIN, VALUES, ...) is UNKNOWN.
 */
enum class StatementVerb {
    UNKNOWN,
    SELECT,
    INSERT,
    UPDATE,
    DELETE,
    DDL
};

/**
 * @brief Machine-readable verdict reason
 */
enum class RejectReason {
    OK,
    NON_SELECT,
    MULTIPLE_STATEMENTS,
    FORBIDDEN_KEYWORD,
    TABLE_NOT_WHITELISTED
};

/**
 * @brief Failure taxonomy surfaced in the response envelope
 */
enum class ErrorKind {
    NONE,
    PARSE_AMBIGUOUS,        // Unreliable verb/boundary detection, treated as reject
    VALIDATION_REJECTED,    // One of the RejectReason rules fired
    EXECUTION_ERROR,        // Driver/database failure, connection discarded
    TIMEOUT,                // Deadline exceeded or caller cancelled
    INTERNAL_ERROR
};

/**
 * @brief Per-request state machine
 *
 * RECEIVED -> PARSED -> {REJECTED | VALIDATED} -> NORMALIZED -> EXECUTED -> RETURNED
 * Terminal states: REJECTED, RETURNED.
 */
enum class RequestState {
    RECEIVED,
    PARSED,
    REJECTED,
    VALIDATED,
    NORMALIZED,
    EXECUTED,
    RETURNED
};

enum class LimitAction {
    UNCHANGED,      // Existing LIMIT <= ceiling
    CLAMPED,        // Existing LIMIT rewritten down to the ceiling
    APPENDED        // No LIMIT present, ceiling inserted
};

// ============================================================================
// Token Types
// ============================================================================

enum class TokenType : uint8_t {
    WORD,               // Unquoted keyword or identifier
    QUOTED_IDENTIFIER,  // "name", `name`, [name]
    STRING,             // 'text', E'text', $tag$text$tag$, X'00'
    NUMBER,
    PARAMETER,          // ?, $1, :name, @name
    OPERATOR,
    LPAREN,
    RPAREN,
    COMMA,
    DOT,
    SEMICOLON,
    LINE_COMMENT,       // -- ...
    BLOCK_COMMENT       // /* ... */
};

struct Token {
    TokenType type;
    size_t offset;          // Byte offset into the source text
    size_t length;          // Byte length in the source text
    std::string value;      // WORD: uppercased; QUOTED_IDENTIFIER: unquoted; else raw text

    Token() : type(TokenType::OPERATOR), offset(0), length(0) {}
    Token(TokenType t, size_t off, size_t len, std::string v)
        : type(t), offset(off), length(len), value(std::move(v)) {}

    [[nodiscard]] bool is_comment() const {
        return type == TokenType::LINE_COMMENT || type == TokenType::BLOCK_COMMENT;
    }

    [[nodiscard]] bool is_word(std::string_view upper) const {
        return type == TokenType::WORD && value == upper;
    }
};

// ============================================================================
// Parsed Statement Metadata
// ============================================================================

struct TableRef {
    std::string schema;         // Qualifier (empty = unqualified)
    std::string table;          // Table, function or file name as written

    TableRef() = default;
    TableRef(std::string t) : table(std::move(t)) {}
    TableRef(std::string s, std::string t) : schema(std::move(s)), table(std::move(t)) {}

    std::string full_name() const {
        return schema.empty() ? table : (schema + "." + table);
    }
};

/**
 * @brief Output of the statement classifier
 *
 * Shared as shared_ptr<const CandidateStatement>; never mutated after
 * classification.
 */
struct CandidateStatement {
    std::string text;                   // Raw SQL as received
    StatementVerb verb;
    std::string leading_keyword;        // Uppercased first keyword ("SELECT", "WITH", ...)
    size_t statement_count;             // Must be exactly 1 to proceed
    std::vector<Token> tokens;          // Full token stream, comments included
    std::vector<TableRef> tables;       // FROM/JOIN sources

    CandidateStatement() : verb(StatementVerb::UNKNOWN), statement_count(0) {}
};

// ============================================================================
// Policy Types
// ============================================================================

struct ValidationVerdict {
    bool accepted;
    RejectReason reason;
    std::string matched_rule;       // Rule that fired (empty when accepted)
    std::string message;            // Human-readable, suitable for the agent/user

    ValidationVerdict() : accepted(false), reason(RejectReason::OK) {}

    static ValidationVerdict ok() {
        ValidationVerdict v;
        v.accepted = true;
        v.reason = RejectReason::OK;
        v.message = "ok";
        return v;
    }

    static ValidationVerdict reject(RejectReason reason, std::string rule, std::string message) {
        ValidationVerdict v;
        v.accepted = false;
        v.reason = reason;
        v.matched_rule = std::move(rule);
        v.message = std::move(message);
        return v;
    }
};

// ============================================================================
// Normalization Types
// ============================================================================

struct NormalizedStatement {
    std::shared_ptr<const CandidateStatement> candidate;
    std::string sql;                // SQL sent to the database
    uint64_t effective_limit;       // Always <= configured ceiling
    LimitAction action;

    NormalizedStatement() : effective_limit(0), action(LimitAction::UNCHANGED) {}
};

// ============================================================================
// Execution Types
// ============================================================================

// One record; std::nullopt is SQL NULL
using Row = std::vector<std::optional<std::string>>;

struct ExecutionResult {
    bool success;
    ErrorKind error_kind;
    std::optional<std::string> error;

    std::vector<std::string> column_names;
    std::vector<Row> rows;
    uint64_t row_count;             // Rows handed back (after truncation)
    bool truncated;                 // Database returned more rows than the ceiling

    std::chrono::microseconds execution_time;

    ExecutionResult()
        : success(false),
          error_kind(ErrorKind::NONE),
          row_count(0),
          truncated(false),
          execution_time(0) {}
};

// ============================================================================
// Request/Response Types
// ============================================================================

/**
 * @brief Structured envelope returned for every request
 *
 * Serialized by to_json() in core/envelope.hpp.
 */
struct GuardResponse {
    std::string request_id;
    bool accepted;
    RejectReason reason;
    std::string reason_text;        // "ok" or "query rejected: ..."
    std::string matched_rule;
    ErrorKind error_kind;
    std::optional<std::string> error;

    std::optional<std::string> sql; // Normalized SQL, when normalization ran
    std::vector<std::string> column_names;
    std::optional<std::vector<Row>> rows;
    uint64_t row_count;
    bool truncated;

    RequestState final_state;
    std::chrono::microseconds execution_time;

    GuardResponse()
        : accepted(false),
          reason(RejectReason::OK),
          error_kind(ErrorKind::NONE),
          row_count(0),
          truncated(false),
          final_state(RequestState::RECEIVED),
          execution_time(0) {}
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* statement_verb_to_string(StatementVerb verb) {
    switch (verb) {
        case StatementVerb::SELECT: return "SELECT";
        case StatementVerb::INSERT: return "INSERT";
        case StatementVerb::UPDATE: return "UPDATE";
        case StatementVerb::DELETE: return "DELETE";
        case StatementVerb::DDL: return "DDL";
        default: return "UNKNOWN";
    }
}

inline const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::OK: return "ok";
        case RejectReason::NON_SELECT: return "non_select";
        case RejectReason::MULTIPLE_STATEMENTS: return "multiple_statements";
        case RejectReason::FORBIDDEN_KEYWORD: return "forbidden_keyword";
        case RejectReason::TABLE_NOT_WHITELISTED: return "table_not_whitelisted";
        default: return "unknown";
    }
}

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::PARSE_AMBIGUOUS: return "parse_ambiguous";
        case ErrorKind::VALIDATION_REJECTED: return "validation_rejected";
        case ErrorKind::EXECUTION_ERROR: return "execution_error";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

inline const char* request_state_to_string(RequestState state) {
    switch (state) {
        case RequestState::RECEIVED: return "received";
        case RequestState::PARSED: return "parsed";
        case RequestState::REJECTED: return "rejected";
        case RequestState::VALIDATED: return "validated";
        case RequestState::NORMALIZED: return "normalized";
        case RequestState::EXECUTED: return "executed";
        case RequestState::RETURNED: return "returned";
        default: return "unknown";
    }
}

inline const char* limit_action_to_string(LimitAction action) {
    switch (action) {
        case LimitAction::UNCHANGED: return "unchanged";
        case LimitAction::CLAMPED: return "clamped";
        case LimitAction::APPENDED: return "appended";
        default: return "unknown";
    }
}

} // namespace sqlguard
