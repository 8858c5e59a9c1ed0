#include "parser/statement_classifier.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>
#include <unordered_set>

namespace sqlguard {

namespace {

// Transparent hash/equal for heterogeneous lookup (avoids temporary std::string from string_view)
struct StringViewHash {
    using is_transparent = void;
    size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};
struct StringViewEqual {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

const std::unordered_map<std::string, StatementVerb, StringViewHash, StringViewEqual> VERB_KEYWORDS = {
    {"SELECT",   StatementVerb::SELECT},
    {"INSERT",   StatementVerb::INSERT},
    {"REPLACE",  StatementVerb::INSERT},
    {"UPDATE",   StatementVerb::UPDATE},
    {"DELETE",   StatementVerb::DELETE},
    {"CREATE",   StatementVerb::DDL},
    {"ALTER",    StatementVerb::DDL},
    {"DROP",     StatementVerb::DDL},
    {"TRUNCATE", StatementVerb::DDL},
    {"RENAME",   StatementVerb::DDL},
    {"COMMENT",  StatementVerb::DDL},
};

// Keywords that close a FROM list at the current nesting level
const std::unordered_set<std::string, StringViewHash, StringViewEqual> FROM_LIST_TERMINATORS = {
    "WHERE", "GROUP", "ORDER", "HAVING", "LIMIT", "OFFSET", "UNION", "INTERSECT",
    "EXCEPT", "WINDOW", "FETCH", "FOR", "SELECT", "RETURNING", "QUALIFY"
};

// Set operators; a parenthesized expression that reaches one of these is a query
const std::unordered_set<std::string, StringViewHash, StringViewEqual> SET_OPERATORS = {
    "UNION", "INTERSECT", "EXCEPT"
};

// Words that may precede a source without being one
const std::unordered_set<std::string, StringViewHash, StringViewEqual> SOURCE_MODIFIERS = {
    "LATERAL", "ONLY"
};

enum class FrameKind {
    TOP,        // Statement level
    SUBQUERY,   // ( SELECT | WITH | VALUES | TABLE ...
    GROUP,      // Parenthesized join group in FROM: ( a JOIN b ... )
    EXPR        // Function call, expression, column list
};

struct Frame {
    FrameKind kind;
    bool in_from_list;
};

bool starts_query(const Token* tok) {
    return tok != nullptr && tok->type == TokenType::WORD
        && (tok->value == "SELECT" || tok->value == "WITH" || tok->value == "VALUES"
            || tok->value == "TABLE");
}

// TABLE name is shorthand for SELECT * FROM name where a query may start
bool is_table_shorthand(const Token& tok, const Token* prev) {
    if (!tok.is_word("TABLE")) return false;
    if (prev == nullptr || prev->type == TokenType::LPAREN) return true;
    return prev->type == TokenType::WORD
        && (SET_OPERATORS.contains(prev->value) || prev->value == "ALL" || prev->value == "DISTINCT");
}

std::string name_of(std::string_view sql, const Token& tok) {
    if (tok.type == TokenType::WORD) {
        return std::string(sql.substr(tok.offset, tok.length));
    }
    return tok.value;
}

bool is_name(const Token& tok) {
    return tok.type == TokenType::WORD || tok.type == TokenType::QUOTED_IDENTIFIER;
}

} // anonymous namespace

// ============================================================================
// Classification
// ============================================================================

StatementClassifier::ParseResult StatementClassifier::classify(std::string_view sql,
                                                              DatabaseType dialect) {
    auto lexed = SqlTokenizer::tokenize(sql, dialect);
    if (!lexed.success) {
        ErrorCode code = ErrorCode::INVALID_CHARACTER;
        switch (lexed.error_code) {
            case SqlTokenizer::ErrorCode::UNTERMINATED_STRING:
            case SqlTokenizer::ErrorCode::UNTERMINATED_IDENTIFIER:
                code = ErrorCode::UNTERMINATED_LITERAL;
                break;
            case SqlTokenizer::ErrorCode::UNTERMINATED_COMMENT:
            case SqlTokenizer::ErrorCode::NESTED_COMMENT:
                code = ErrorCode::AMBIGUOUS_COMMENT;
                break;
            default:
                break;
        }
        return ParseResult::error(code, std::move(lexed.error_message));
    }

    // Leading verb: first token that is not a comment or an opening paren
    const Token* leading = nullptr;
    bool has_content = false;
    for (const auto& tok : lexed.tokens) {
        if (tok.is_comment() || tok.type == TokenType::SEMICOLON) continue;
        has_content = true;
        if (tok.type == TokenType::LPAREN) continue;
        leading = &tok;
        break;
    }

    if (!has_content) {
        return ParseResult::error(ErrorCode::EMPTY_STATEMENT, "empty statement");
    }

    auto stmt = std::make_shared<CandidateStatement>();
    stmt->text = std::string(sql);
    if (leading != nullptr) {
        stmt->leading_keyword = leading->value;
        stmt->verb = (leading->type == TokenType::WORD)
            ? classify_verb(leading->value)
            : StatementVerb::UNKNOWN;
    }
    stmt->statement_count = count_statements(lexed.tokens);
    stmt->tables = extract_tables(sql, lexed.tokens);
    stmt->tokens = std::move(lexed.tokens);

    utils::log::debug(std::format("classified: verb={} statements={} tables={}",
        statement_verb_to_string(stmt->verb), stmt->statement_count, stmt->tables.size()));

    return ParseResult::ok(std::move(stmt));
}

StatementVerb StatementClassifier::classify_verb(std::string_view keyword) {
    const auto it = VERB_KEYWORDS.find(keyword);
    return it != VERB_KEYWORDS.end() ? it->second : StatementVerb::UNKNOWN;
}

size_t StatementClassifier::count_statements(const std::vector<Token>& tokens) {
    size_t count = 1;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i].type == TokenType::SEMICOLON) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Table Extraction
// ============================================================================

std::vector<TableRef> StatementClassifier::extract_tables(std::string_view sql,
                                                          const std::vector<Token>& tokens) {
    std::vector<const Token*> sig;
    sig.reserve(tokens.size());
    for (const auto& tok : tokens) {
        if (!tok.is_comment()) sig.push_back(&tok);
    }

    std::vector<TableRef> tables;
    std::vector<Frame> frames{{FrameKind::TOP, false}};
    bool expect_source = false;

    for (size_t i = 0; i < sig.size(); ++i) {
        const Token& tok = *sig[i];
        const Token* next = (i + 1 < sig.size()) ? sig[i + 1] : nullptr;
        const Token* prev = (i > 0) ? sig[i - 1] : nullptr;

        if (expect_source) {
            expect_source = false;

            if (tok.type == TokenType::WORD && SOURCE_MODIFIERS.contains(tok.value)) {
                expect_source = true;
                continue;
            }

            if (is_name(tok)) {
                // [catalog.][schema.]name; a following '(' makes it a table function
                std::vector<std::string> parts{name_of(sql, tok)};
                while (i + 2 < sig.size() && sig[i + 1]->type == TokenType::DOT && is_name(*sig[i + 2])) {
                    parts.push_back(name_of(sql, *sig[i + 2]));
                    i += 2;
                }
                TableRef ref;
                ref.table = std::move(parts.back());
                parts.pop_back();
                for (size_t p = 0; p < parts.size(); ++p) {
                    if (p > 0) ref.schema += '.';
                    ref.schema += parts[p];
                }
                tables.push_back(std::move(ref));
                continue;
            }

            if (tok.type != TokenType::LPAREN) {
                // String or other literal used as a source (file paths and the like)
                tables.emplace_back(tok.value);
                continue;
            }

            const FrameKind kind = starts_query(next) ? FrameKind::SUBQUERY : FrameKind::GROUP;
            frames.push_back({kind, kind == FrameKind::GROUP});
            expect_source = (kind == FrameKind::GROUP);
            continue;
        }

        switch (tok.type) {
            case TokenType::LPAREN:
                frames.push_back({starts_query(next) ? FrameKind::SUBQUERY : FrameKind::EXPR, false});
                break;

            case TokenType::RPAREN:
                if (frames.size() > 1) frames.pop_back();
                break;

            case TokenType::COMMA:
                if (frames.back().in_from_list) expect_source = true;
                break;

            case TokenType::WORD: {
                Frame& frame = frames.back();
                if (frame.kind == FrameKind::EXPR) {
                    // EXTRACT(x FROM y), SUBSTRING(s FROM n) stay expressions;
                    // ((SELECT ...) UNION SELECT ...) turns into a query here
                    if (!SET_OPERATORS.contains(tok.value) && tok.value != "SELECT") break;
                    frame.kind = FrameKind::SUBQUERY;
                }
                if (is_table_shorthand(tok, prev)) {
                    expect_source = true;
                } else if (tok.value == "FROM") {
                    frame.in_from_list = true;
                    expect_source = true;
                } else if (tok.value == "JOIN") {
                    expect_source = true;
                } else if (FROM_LIST_TERMINATORS.contains(tok.value)) {
                    frame.in_from_list = false;
                }
                break;
            }

            default:
                break;
        }
    }

    return tables;
}

} // namespace sqlguard
