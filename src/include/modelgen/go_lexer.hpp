#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace modelgen::go {

  enum class token_kind {
    eof,
    identifier,
    keyword,
    int_lit,
    float_lit,
    imag_lit,
    rune_lit,
    string_lit, // interpreted or raw
    op,         // operators and punctuation
    semicolon,  // explicit ';' or inserted at a line end
    line_comment,
    block_comment,
  };

  // Layout annotations set by the parser and read by the printer.
  enum token_flag : unsigned {
    flag_implicit = 1u << 0,     // semicolon inserted by the lexer
    flag_unary = 1u << 1,        // prefix operator (or pointer star)
    flag_composite = 1u << 2,    // brace of a composite literal
    flag_inline_brace = 1u << 3, // struct{...}/interface{...} on one line
    flag_index = 1u << 4,        // '[' of an index or slice expression
    flag_slice_colon = 1u << 5,  // ':' inside a slice expression
    flag_paren_space = 1u << 6,  // '(' of a receiver or result list
    flag_variadic = 1u << 7,     // '...' of a variadic parameter
    flag_cell = 1u << 8,         // starts an aligned column
    flag_switch_body = 1u << 9,  // '{' of a switch or select body
    flag_label = 1u << 10,       // identifier of a labeled statement
    flag_header_semi = 1u << 11, // ';' inside an if/for/switch header
    flag_newline = 1u << 12,     // forced onto a new line
    flag_blank_before = 1u << 13, // at least one blank line before
    flag_import_spec = 1u << 14, // first token of a grouped import spec
    flag_type_params = 1u << 15, // ']' closing a type parameter list
  };

  struct token {
    token_kind kind = token_kind::eof;
    std::string text;
    std::size_t line = 1;
    std::size_t column = 1;
    std::size_t end_line = 1; // differs from line for multi-line tokens
    unsigned flags = 0;
    unsigned empty_cells = 0; // empty aligned cells printed before this token

    bool
    is(token_kind k, std::string_view t) const {
      return kind == k && text == t;
    }

    bool
    is_op(std::string_view t) const {
      return kind == token_kind::op && text == t;
    }

    bool
    is_keyword(std::string_view t) const {
      return kind == token_kind::keyword && text == t;
    }

    bool
    is_comment() const {
      return kind == token_kind::line_comment ||
             kind == token_kind::block_comment;
    }

    bool
    has(token_flag f) const {
      return (flags & f) != 0;
    }
  };

  // Splits Go source into tokens, comments included, inserting semicolons
  // at line ends the way the Go grammar does. The last token is eof.
  // Throws format_error on lexical errors.
  std::vector<token>
  tokenize(std::string_view source);

  bool
  is_keyword(std::string_view word);

} // namespace modelgen::go
