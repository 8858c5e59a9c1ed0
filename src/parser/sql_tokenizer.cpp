#include "parser/sql_tokenizer.hpp"

#include <format>

namespace sqlguard {

// ============================================================================
// Lookup table for character classification. Locale-independent; bytes
// >= 0x80 are treated as identifier characters so UTF-8 names lex as words.
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER   = 0,
    CC_SPACE   = 1,
    CC_DIGIT   = 2,
    CC_ALPHA   = 4,
    CC_IDENT   = 8,   // _ and $
};

struct CharTable {
    uint8_t cls[256];
    char    upper[256];

    constexpr CharTable() : cls{}, upper{} {
        for (int i = 0; i < 256; ++i) {
            upper[i] = static_cast<char>(i);
            cls[i] = (i >= 0x80) ? CC_ALPHA : CC_OTHER;
        }
        cls[' '] = CC_SPACE; cls['\t'] = CC_SPACE;
        cls['\n'] = CC_SPACE; cls['\r'] = CC_SPACE;
        cls['\f'] = CC_SPACE; cls['\v'] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'A'; i <= 'Z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'a'; i <= 'z'; ++i) {
            cls[i] = CC_ALPHA;
            upper[i] = static_cast<char>(i - 32);
        }
        cls['_'] = CC_IDENT;
        cls['$'] = CC_IDENT;
    }
};

static constexpr CharTable CT{};

inline bool ct_space(unsigned char c)       { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c)       { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) { return CT.cls[c] == CC_ALPHA || c == '_'; }
inline bool ct_ident_cont(unsigned char c)  { auto v = CT.cls[c]; return v == CC_ALPHA || v == CC_DIGIT || v == CC_IDENT; }
inline char ct_upper(unsigned char c)       { return CT.upper[c]; }

inline unsigned char at(std::string_view sql, size_t i) {
    return i < sql.size() ? static_cast<unsigned char>(sql[i]) : static_cast<unsigned char>('\0');
}

std::string upper_copy(std::string_view word) {
    std::string out;
    out.reserve(word.size());
    for (const char c : word) {
        out += ct_upper(static_cast<unsigned char>(c));
    }
    return out;
}

// Strip surrounding quotes and collapse doubled closing quotes
std::string unquote_identifier(std::string_view raw, char close) {
    std::string out;
    if (raw.size() < 2) return out;
    const auto inner = raw.substr(1, raw.size() - 2);
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        out += inner[i];
        if (inner[i] == close && i + 1 < inner.size() && inner[i + 1] == close) {
            ++i;
        }
    }
    return out;
}

} // anonymous namespace

std::string_view SqlTokenizer::dollar_tag_at(std::string_view sql, size_t pos) {
    if (at(sql, pos) != '$') return {};
    if (at(sql, pos + 1) == '$') return sql.substr(pos, 2);
    if (!ct_ident_start(at(sql, pos + 1))) return {};

    size_t j = pos + 2;
    while (j < sql.size() && ct_ident_cont(at(sql, j)) && at(sql, j) != '$') {
        ++j;
    }
    if (at(sql, j) != '$') return {};
    return sql.substr(pos, j - pos + 1);
}

SqlTokenizer::TokenizeResult SqlTokenizer::tokenize(std::string_view sql, DatabaseType dialect) {
    // The driver sees a C string; anything after a NUL would be invisible to it
    if (const auto nul = sql.find('\0'); nul != std::string_view::npos) {
        return TokenizeResult::error(ErrorCode::NUL_BYTE,
            std::format("NUL byte at offset {}", nul), nul);
    }

    std::vector<Token> tokens;
    tokens.reserve(sql.size() / 4 + 1);

    State state = State::NORMAL;
    size_t token_start = 0;
    char quote_close = '"';
    std::string_view dollar_tag;
    const bool bracket_quotes = (dialect == DatabaseType::SQLITE);

    auto emit = [&](TokenType type, size_t start, size_t end, std::string value) {
        tokens.emplace_back(type, start, end - start, std::move(value));
    };
    auto emit_raw = [&](TokenType type, size_t start, size_t end) {
        tokens.emplace_back(type, start, end - start, std::string(sql.substr(start, end - start)));
    };

    const size_t len = sql.size();
    size_t i = 0;
    while (i < len) {
        const auto c = at(sql, i);
        const auto next_c = at(sql, i + 1);

        switch (state) {
            case State::NORMAL: {
                if (ct_space(c)) {
                    ++i;
                    break;
                }

                // Comments
                if (c == '-' && next_c == '-') {
                    state = State::IN_LINE_COMMENT;
                    token_start = i;
                    i += 2;
                    break;
                }
                if (c == '/' && next_c == '*') {
                    state = State::IN_BLOCK_COMMENT;
                    token_start = i;
                    i += 2;
                    break;
                }

                // Quoted literals and identifiers
                if (c == '\'') {
                    state = State::IN_SINGLE_QUOTE;
                    token_start = i++;
                    break;
                }
                // In PostgreSQL '[' ']' fall through to OPERATOR so subscripts are scanned
                if (c == '"' || c == '`' || (c == '[' && bracket_quotes)) {
                    state = State::IN_QUOTED_IDENT;
                    quote_close = (c == '[') ? ']' : static_cast<char>(c);
                    token_start = i++;
                    break;
                }

                // $1 parameters and $tag$ dollar quotes
                if (c == '$') {
                    if (ct_digit(next_c)) {
                        size_t j = i + 1;
                        while (ct_digit(at(sql, j))) ++j;
                        emit_raw(TokenType::PARAMETER, i, j);
                        i = j;
                        break;
                    }
                    const auto tag = dollar_tag_at(sql, i);
                    if (!tag.empty()) {
                        state = State::IN_DOLLAR_QUOTE;
                        dollar_tag = tag;
                        token_start = i;
                        i += tag.size();
                        break;
                    }
                }

                // ?, ?NNN, :name, @name
                if (c == '?') {
                    size_t j = i + 1;
                    while (ct_digit(at(sql, j))) ++j;
                    emit_raw(TokenType::PARAMETER, i, j);
                    i = j;
                    break;
                }
                if ((c == ':' || c == '@') && ct_ident_start(next_c)
                    && !(i > 0 && at(sql, i - 1) == ':')) {
                    size_t j = i + 1;
                    while (ct_ident_cont(at(sql, j))) ++j;
                    emit_raw(TokenType::PARAMETER, i, j);
                    i = j;
                    break;
                }

                // Numeric literal; trailing identifier chars stay glued (0x1F, 10abc)
                if (ct_digit(c) || (c == '.' && ct_digit(next_c))) {
                    size_t j = i;
                    while (ct_digit(at(sql, j))) ++j;
                    if (at(sql, j) == '.') {
                        ++j;
                        while (ct_digit(at(sql, j))) ++j;
                    }
                    const auto e = at(sql, j);
                    if (e == 'e' || e == 'E') {
                        const auto sign = at(sql, j + 1);
                        if (ct_digit(sign)) {
                            j += 1;
                        } else if ((sign == '+' || sign == '-') && ct_digit(at(sql, j + 2))) {
                            j += 2;
                        }
                    }
                    while (ct_ident_cont(at(sql, j))) ++j;
                    emit_raw(TokenType::NUMBER, i, j);
                    i = j;
                    break;
                }

                // Keyword or identifier, or a prefixed string (E'..', X'..', B'..', N'..')
                if (ct_ident_start(c)) {
                    size_t j = i + 1;
                    while (ct_ident_cont(at(sql, j))) ++j;

                    if (j == i + 1 && at(sql, j) == '\'') {
                        const char prefix = ct_upper(c);
                        if (prefix == 'E') {
                            state = State::IN_ESCAPE_STRING;
                            token_start = i;
                            i = j + 1;
                            break;
                        }
                        if (prefix == 'X' || prefix == 'B' || prefix == 'N') {
                            state = State::IN_SINGLE_QUOTE;
                            token_start = i;
                            i = j + 1;
                            break;
                        }
                    }

                    emit(TokenType::WORD, i, j, upper_copy(sql.substr(i, j - i)));
                    i = j;
                    break;
                }

                switch (c) {
                    case '(': emit_raw(TokenType::LPAREN, i, i + 1); break;
                    case ')': emit_raw(TokenType::RPAREN, i, i + 1); break;
                    case ',': emit_raw(TokenType::COMMA, i, i + 1); break;
                    case '.': emit_raw(TokenType::DOT, i, i + 1); break;
                    case ';': emit_raw(TokenType::SEMICOLON, i, i + 1); break;
                    default:  emit_raw(TokenType::OPERATOR, i, i + 1); break;
                }
                ++i;
                break;
            }

            case State::IN_SINGLE_QUOTE:
            case State::IN_ESCAPE_STRING: {
                if (state == State::IN_ESCAPE_STRING && c == '\\') {
                    i += 2;
                    break;
                }
                if (c == '\'') {
                    if (next_c == '\'') {
                        i += 2;
                        break;
                    }
                    emit_raw(TokenType::STRING, token_start, i + 1);
                    state = State::NORMAL;
                }
                ++i;
                break;
            }

            case State::IN_DOLLAR_QUOTE: {
                if (c == '$' && sql.substr(i).starts_with(dollar_tag)) {
                    emit_raw(TokenType::STRING, token_start, i + dollar_tag.size());
                    i += dollar_tag.size();
                    state = State::NORMAL;
                    break;
                }
                ++i;
                break;
            }

            case State::IN_QUOTED_IDENT: {
                if (c == static_cast<unsigned char>(quote_close)) {
                    if (next_c == static_cast<unsigned char>(quote_close)) {
                        i += 2;
                        break;
                    }
                    emit(TokenType::QUOTED_IDENTIFIER, token_start, i + 1,
                         unquote_identifier(sql.substr(token_start, i + 1 - token_start), quote_close));
                    state = State::NORMAL;
                }
                ++i;
                break;
            }

            case State::IN_BLOCK_COMMENT: {
                if (c == '/' && next_c == '*') {
                    return TokenizeResult::error(ErrorCode::NESTED_COMMENT,
                        std::format("nested block comment at offset {}", i), i);
                }
                if (c == '*' && next_c == '/') {
                    emit_raw(TokenType::BLOCK_COMMENT, token_start, i + 2);
                    state = State::NORMAL;
                    i += 2;
                    break;
                }
                ++i;
                break;
            }

            case State::IN_LINE_COMMENT: {
                if (c == '\n') {
                    emit_raw(TokenType::LINE_COMMENT, token_start, i);
                    state = State::NORMAL;
                }
                ++i;
                break;
            }
        }
    }

    switch (state) {
        case State::NORMAL:
            break;
        case State::IN_LINE_COMMENT:
            emit_raw(TokenType::LINE_COMMENT, token_start, len);
            break;
        case State::IN_SINGLE_QUOTE:
        case State::IN_ESCAPE_STRING:
        case State::IN_DOLLAR_QUOTE:
            return TokenizeResult::error(ErrorCode::UNTERMINATED_STRING,
                std::format("unterminated string literal starting at offset {}", token_start),
                token_start);
        case State::IN_QUOTED_IDENT:
            return TokenizeResult::error(ErrorCode::UNTERMINATED_IDENTIFIER,
                std::format("unterminated quoted identifier starting at offset {}", token_start),
                token_start);
        case State::IN_BLOCK_COMMENT:
            return TokenizeResult::error(ErrorCode::UNTERMINATED_COMMENT,
                std::format("unterminated block comment starting at offset {}", token_start),
                token_start);
    }

    return TokenizeResult::ok(std::move(tokens));
}

} // namespace sqlguard
