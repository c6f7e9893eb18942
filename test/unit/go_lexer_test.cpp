#include <modelgen/errors.hpp>
#include <modelgen/go_lexer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace modelgen;
using go::token_kind;

namespace {

  std::vector<token_kind>
  kinds(const std::vector<go::token>& tokens) {
    std::vector<token_kind> result;
    for (const auto& t : tokens)
      result.push_back(t.kind);
    return result;
  }

  std::size_t
  error_line(std::string_view source) {
    try {
      go::tokenize(source);
    } catch (const format_error& e) {
      return e.line();
    }
    return 0;
  }

} // namespace

TEST_CASE("tokenize a package clause and declaration", "[go_lexer]") {
  auto tokens = go::tokenize("package p\nvar x = 1\n");

  CHECK(kinds(tokens) ==
        std::vector<token_kind>{
            token_kind::keyword, token_kind::identifier, token_kind::semicolon,
            token_kind::keyword, token_kind::identifier, token_kind::op,
            token_kind::int_lit, token_kind::semicolon, token_kind::eof});
  CHECK(tokens[2].has(go::flag_implicit));
  CHECK(tokens[3].line == 2);
  CHECK(tokens[4].column == 5);
}

TEST_CASE("semicolons follow the Go insertion rule", "[go_lexer]") {
  SECTION("after closing brackets, literals and keywords") {
    for (const char* src : {"f()\n", "a[0]\n", "}\n", "x++\n", "return\n",
                            "'a'\n", "`raw`\n", "1.5\n"}) {
      auto tokens = go::tokenize(src);
      REQUIRE(tokens.size() >= 2);
      CHECK(tokens[tokens.size() - 2].kind == token_kind::semicolon);
    }
  }
  SECTION("not after operators or opening brackets") {
    for (const char* src : {"a +\n", "f(\n", "{\n", "x,\n"}) {
      auto tokens = go::tokenize(src);
      CHECK(tokens[tokens.size() - 2].kind != token_kind::semicolon);
    }
  }
  SECTION("at end of input") {
    auto tokens = go::tokenize("x");
    CHECK(kinds(tokens) == std::vector<token_kind>{token_kind::identifier,
                                                   token_kind::semicolon,
                                                   token_kind::eof});
  }
}

TEST_CASE("explicit semicolons are not implicit", "[go_lexer]") {
  auto tokens = go::tokenize("a; b");
  REQUIRE(tokens[1].kind == token_kind::semicolon);
  CHECK_FALSE(tokens[1].has(go::flag_implicit));
}

TEST_CASE("numeric literals", "[go_lexer]") {
  CHECK(go::tokenize("42")[0].kind == token_kind::int_lit);
  CHECK(go::tokenize("0x1F")[0].kind == token_kind::int_lit);
  CHECK(go::tokenize("1_000")[0].kind == token_kind::int_lit);
  CHECK(go::tokenize("1.5e3")[0].kind == token_kind::float_lit);
  CHECK(go::tokenize(".5")[0].kind == token_kind::float_lit);
  CHECK(go::tokenize("3i")[0].kind == token_kind::imag_lit);
}

TEST_CASE("literal digits must fit the base", "[go_lexer]") {
  CHECK_THROWS_AS(go::tokenize("08"), format_error);
  CHECK_THROWS_AS(go::tokenize("0o8"), format_error);
  CHECK_THROWS_AS(go::tokenize("0b12"), format_error);
  CHECK_THROWS_AS(go::tokenize("0b_"), format_error);
  CHECK_THROWS_AS(go::tokenize("0x"), format_error);
  CHECK_THROWS_AS(go::tokenize("0x1.8"), format_error);
  CHECK(go::tokenize("0_7")[0].kind == token_kind::int_lit);
  CHECK(go::tokenize("0x1.8p-2")[0].kind == token_kind::float_lit);
  CHECK(go::tokenize("09.5")[0].kind == token_kind::float_lit);
  CHECK(go::tokenize("08i")[0].kind == token_kind::imag_lit);
}

TEST_CASE("longest operator wins", "[go_lexer]") {
  auto tokens = go::tokenize("a &^= b ... <- :=");
  CHECK(tokens[1].text == "&^=");
  CHECK(tokens[3].text == "...");
  CHECK(tokens[4].text == "<-");
  CHECK(tokens[5].text == ":=");
}

TEST_CASE("comments are tokens", "[go_lexer]") {
  auto tokens = go::tokenize("x // trailing\n/* a\nb */ y");
  REQUIRE(tokens.size() >= 5);
  CHECK(tokens[1].kind == token_kind::line_comment);
  CHECK(tokens[1].text == "// trailing");
  CHECK(tokens[2].kind == token_kind::semicolon);
  CHECK(tokens[3].kind == token_kind::block_comment);
  CHECK(tokens[3].line == 2);
  CHECK(tokens[3].end_line == 3);
}

TEST_CASE("raw strings may span lines", "[go_lexer]") {
  auto tokens = go::tokenize("`a\nb`");
  CHECK(tokens[0].kind == token_kind::string_lit);
  CHECK(tokens[0].line == 1);
  CHECK(tokens[0].end_line == 2);
}

TEST_CASE("lexical errors carry their position", "[go_lexer]") {
  CHECK(error_line("x\n\"abc\n") == 2);
  CHECK(error_line("'ab'") == 1);
  CHECK(error_line("\n\n1e") == 3);
  CHECK(error_line("/* open") == 1);
  CHECK(error_line(R"("\q")") == 1);
  CHECK(error_line("a @ b") == 1);
  CHECK(error_line("12abc") == 1);
}

TEST_CASE("is_keyword", "[go_lexer]") {
  CHECK(go::is_keyword("func"));
  CHECK(go::is_keyword("fallthrough"));
  CHECK_FALSE(go::is_keyword("string"));
  CHECK_FALSE(go::is_keyword("Func"));
}
