#include <catch2/catch_test_macros.hpp>
#include "parser/sql_tokenizer.hpp"

using namespace sqlguard;

namespace {

std::vector<Token> lex(std::string_view sql, DatabaseType dialect = DatabaseType::POSTGRESQL) {
    auto result = SqlTokenizer::tokenize(sql, dialect);
    REQUIRE(result.success);
    return std::move(result.tokens);
}

} // anonymous namespace

TEST_CASE("Tokenizer: keywords are uppercased, whitespace dropped", "[tokenizer]") {
    const auto tokens = lex("  select a\n\tFROM t; -- done");
    REQUIRE(tokens.size() == 6);
    CHECK(tokens[0].is_word("SELECT"));
    CHECK(tokens[1].is_word("A"));
    CHECK(tokens[2].is_word("FROM"));
    CHECK(tokens[3].is_word("T"));
    CHECK(tokens[4].type == TokenType::SEMICOLON);
    CHECK(tokens[5].type == TokenType::LINE_COMMENT);
    CHECK(tokens[5].value == "-- done");
}

TEST_CASE("Tokenizer: offsets point into the source text", "[tokenizer]") {
    const std::string sql = "SELECT name FROM users";
    const auto tokens = lex(sql);
    REQUIRE(tokens.size() == 4);
    CHECK(sql.substr(tokens[1].offset, tokens[1].length) == "name");
    CHECK(sql.substr(tokens[3].offset, tokens[3].length) == "users");
}

TEST_CASE("Tokenizer: semicolon inside a string is part of the literal", "[tokenizer]") {
    const auto tokens = lex("SELECT 'a;b', 'it''s'");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[1].type == TokenType::STRING);
    CHECK(tokens[1].value == "'a;b'");
    CHECK(tokens[3].type == TokenType::STRING);
    CHECK(tokens[3].value == "'it''s'");
}

TEST_CASE("Tokenizer: escape strings honour backslashes", "[tokenizer]") {
    const auto tokens = lex(R"(SELECT E'it\'s; DROP' AS x)");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[1].type == TokenType::STRING);
    CHECK(tokens[2].is_word("AS"));
}

TEST_CASE("Tokenizer: prefixed literals", "[tokenizer]") {
    const auto tokens = lex("SELECT X'00ff', N'text', B'101'");
    REQUIRE(tokens.size() == 6);
    CHECK(tokens[1].type == TokenType::STRING);
    CHECK(tokens[3].type == TokenType::STRING);
    CHECK(tokens[5].type == TokenType::STRING);
}

TEST_CASE("Tokenizer: dollar-quoted strings", "[tokenizer]") {
    SECTION("Tagged") {
        const auto tokens = lex("SELECT $body$ ; DROP TABLE t; $body$");
        REQUIRE(tokens.size() == 2);
        CHECK(tokens[1].type == TokenType::STRING);
    }
    SECTION("Anonymous") {
        const auto tokens = lex("SELECT $$it's$$");
        REQUIRE(tokens.size() == 2);
        CHECK(tokens[1].type == TokenType::STRING);
        CHECK(tokens[1].value == "$$it's$$");
    }
}

TEST_CASE("Tokenizer: quoted identifiers are unquoted", "[tokenizer]") {
    SECTION("Double quotes") {
        const auto tokens = lex(R"(SELECT "My ""Col""" FROM t)");
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[1].type == TokenType::QUOTED_IDENTIFIER);
        CHECK(tokens[1].value == R"(My "Col")");
    }
    SECTION("Backticks") {
        const auto tokens = lex("SELECT `drop` FROM t");
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[1].type == TokenType::QUOTED_IDENTIFIER);
        CHECK(tokens[1].value == "drop");
    }
    SECTION("Brackets in SQLite") {
        const auto tokens = lex("SELECT [a]]b] FROM t", DatabaseType::SQLITE);
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[1].type == TokenType::QUOTED_IDENTIFIER);
        CHECK(tokens[1].value == "a]b");
    }
}

TEST_CASE("Tokenizer: PostgreSQL brackets are subscripts, not quotes", "[tokenizer][dialect]") {
    const auto tokens = lex("SELECT ARRAY[(SELECT pw FROM secret)]");
    REQUIRE(tokens.size() == 10);
    CHECK(tokens[1].is_word("ARRAY"));
    CHECK(tokens[2].type == TokenType::OPERATOR);
    CHECK(tokens[2].value == "[");
    CHECK(tokens[3].type == TokenType::LPAREN);
    CHECK(tokens[4].is_word("SELECT"));
    CHECK(tokens[6].is_word("FROM"));
    CHECK(tokens[7].is_word("SECRET"));
    CHECK(tokens[8].type == TokenType::RPAREN);
    CHECK(tokens[9].type == TokenType::OPERATOR);
    CHECK(tokens[9].value == "]");

    SECTION("Unbalanced bracket is not an unterminated identifier") {
        CHECK(SqlTokenizer::tokenize("SELECT arr[1 FROM t").success);
        CHECK_FALSE(SqlTokenizer::tokenize("SELECT [x FROM t", DatabaseType::SQLITE).success);
    }
}

TEST_CASE("Tokenizer: parameters", "[tokenizer]") {
    const auto tokens = lex("SELECT * FROM t WHERE a = $1 AND b = ? AND c = :name AND d = @v");
    size_t params = 0;
    for (const auto& tok : tokens) {
        if (tok.type == TokenType::PARAMETER) ++params;
    }
    CHECK(params == 4);
}

TEST_CASE("Tokenizer: :: cast is not a parameter", "[tokenizer]") {
    const auto tokens = lex("SELECT x::int");
    REQUIRE(tokens.size() == 5);
    CHECK(tokens[2].type == TokenType::OPERATOR);
    CHECK(tokens[3].type == TokenType::OPERATOR);
    CHECK(tokens[4].is_word("INT"));
}

TEST_CASE("Tokenizer: numbers", "[tokenizer]") {
    const auto tokens = lex("SELECT 42, 3.14, 1e10, .5");
    REQUIRE(tokens.size() == 8);
    CHECK(tokens[1].type == TokenType::NUMBER);
    CHECK(tokens[1].value == "42");
    CHECK(tokens[3].value == "3.14");
    CHECK(tokens[5].value == "1e10");
    CHECK(tokens[7].value == ".5");
}

TEST_CASE("Tokenizer: identifiers keep embedded keywords intact", "[tokenizer]") {
    const auto tokens = lex("SELECT dropdown_id, user$name FROM t");
    REQUIRE(tokens.size() == 6);
    CHECK(tokens[1].is_word("DROPDOWN_ID"));
    CHECK(tokens[3].is_word("USER$NAME"));
}

TEST_CASE("Tokenizer: block comment is one token", "[tokenizer]") {
    const auto tokens = lex("SELECT /* ; DROP */ 1");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[1].type == TokenType::BLOCK_COMMENT);
    CHECK(tokens[1].value == "/* ; DROP */");
}

TEST_CASE("Tokenizer: ambiguous input is an error", "[tokenizer][error]") {
    SECTION("Unterminated string") {
        const auto r = SqlTokenizer::tokenize("SELECT 'abc");
        CHECK_FALSE(r.success);
        CHECK(r.error_code == SqlTokenizer::ErrorCode::UNTERMINATED_STRING);
        CHECK(r.error_offset == 7);
    }
    SECTION("Unterminated dollar quote") {
        const auto r = SqlTokenizer::tokenize("SELECT $x$abc");
        CHECK_FALSE(r.success);
        CHECK(r.error_code == SqlTokenizer::ErrorCode::UNTERMINATED_STRING);
    }
    SECTION("Unterminated identifier") {
        const auto r = SqlTokenizer::tokenize("SELECT \"abc FROM t");
        CHECK_FALSE(r.success);
        CHECK(r.error_code == SqlTokenizer::ErrorCode::UNTERMINATED_IDENTIFIER);
    }
    SECTION("Unterminated block comment") {
        const auto r = SqlTokenizer::tokenize("SELECT 1 /* hidden");
        CHECK_FALSE(r.success);
        CHECK(r.error_code == SqlTokenizer::ErrorCode::UNTERMINATED_COMMENT);
    }
    SECTION("Nested block comment") {
        const auto r = SqlTokenizer::tokenize("SELECT /* a /* b */ */ 1");
        CHECK_FALSE(r.success);
        CHECK(r.error_code == SqlTokenizer::ErrorCode::NESTED_COMMENT);
    }
    SECTION("NUL byte") {
        const std::string sql("SELECT 1\0; DROP TABLE t", 23);
        const auto r = SqlTokenizer::tokenize(sql);
        CHECK_FALSE(r.success);
        CHECK(r.error_code == SqlTokenizer::ErrorCode::NUL_BYTE);
        CHECK(r.error_offset == 8);
    }
}

TEST_CASE("Tokenizer: line comment at end of input is kept", "[tokenizer]") {
    const auto tokens = lex("SELECT 1 --");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[2].type == TokenType::LINE_COMMENT);
}

TEST_CASE("Tokenizer: empty input yields no tokens", "[tokenizer]") {
    CHECK(lex("").empty());
    CHECK(lex(" \n\t ").empty());
}
