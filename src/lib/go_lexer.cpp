#include <modelgen/errors.hpp>
#include <modelgen/go_lexer.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <string>

namespace modelgen::go {

  namespace {

    constexpr std::array<std::string_view, 25> keywords = {
        "break",    "case",   "chan",      "const",  "continue",
        "default",  "defer",  "else",      "fallthrough", "for",
        "func",     "go",     "goto",      "if",     "import",
        "interface", "map",   "package",   "range",  "return",
        "select",   "struct", "switch",    "type",   "var",
    };

    // Longest first within each length group.
    constexpr std::array<std::string_view, 48> operators = {
        "&^=", "<<=", ">>=", "...", "+=", "-=", "*=", "/=", "%=", "&=",
        "|=",  "^=",  "<<",  ">>",  "&^", "&&", "||", "<-", "++", "--",
        "==",  "!=",  "<=",  ">=",  ":=", "+",  "-",  "*",  "/",  "%",
        "&",   "|",   "^",   "<",   ">",  "=",  "!",  "(",  ")",  "[",
        "]",   "{",   "}",   ",",   ".",  ":",  "~",  ";",
    };

    bool
    is_letter(char c) {
      auto u = static_cast<unsigned char>(c);
      return std::isalpha(u) || c == '_' || u >= 0x80;
    }

    bool
    is_decimal(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    is_hex(char c) {
      return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }

    class lexer {
    public:
      explicit lexer(std::string_view src) : src_(src) {}

      std::vector<token>
      run() {
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (c == '\n') {
            insert_semicolon();
            advance(1);
            continue;
          }
          if (c == ' ' || c == '\t' || c == '\r') {
            advance(1);
            continue;
          }
          lex_token();
        }
        insert_semicolon();
        token eof;
        eof.kind = token_kind::eof;
        eof.line = eof.end_line = line_;
        eof.column = column_;
        tokens_.push_back(std::move(eof));
        return std::move(tokens_);
      }

    private:
      std::string_view src_;
      std::size_t pos_ = 0;
      std::size_t line_ = 1;
      std::size_t column_ = 1;
      bool semicolon_pending_ = false;
      std::vector<token> tokens_;

      [[noreturn]] void
      fail(const std::string& message, std::size_t line, std::size_t column) {
        throw format_error(message, line, column);
      }

      void
      advance(std::size_t n) {
        for (std::size_t i = 0; i < n && pos_ < src_.size(); ++i, ++pos_) {
          if (src_[pos_] == '\n') {
            ++line_;
            column_ = 1;
          } else {
            ++column_;
          }
        }
      }

      char
      at(std::size_t offset) const {
        auto i = pos_ + offset;
        return i < src_.size() ? src_[i] : '\0';
      }

      void
      insert_semicolon() {
        if (!semicolon_pending_) return;
        semicolon_pending_ = false;
        token t;
        t.kind = token_kind::semicolon;
        t.line = t.end_line = line_;
        t.column = column_;
        t.flags = flag_implicit;
        tokens_.push_back(std::move(t));
      }

      void
      emit(token_kind kind, std::size_t start, std::size_t line,
           std::size_t column) {
        token t;
        t.kind = kind;
        t.text = std::string(src_.substr(start, pos_ - start));
        t.line = line;
        t.column = column;
        t.end_line = line_;

        switch (kind) {
        case token_kind::identifier:
        case token_kind::int_lit:
        case token_kind::float_lit:
        case token_kind::imag_lit:
        case token_kind::rune_lit:
        case token_kind::string_lit: semicolon_pending_ = true; break;
        case token_kind::keyword:
          semicolon_pending_ = t.text == "break" || t.text == "continue" ||
                               t.text == "fallthrough" || t.text == "return";
          break;
        case token_kind::op:
          semicolon_pending_ = t.text == "++" || t.text == "--" ||
                               t.text == ")" || t.text == "]" || t.text == "}";
          break;
        case token_kind::semicolon: semicolon_pending_ = false; break;
        default: break;
        }
        tokens_.push_back(std::move(t));
      }

      void
      lex_token() {
        std::size_t start = pos_;
        std::size_t line = line_;
        std::size_t column = column_;
        char c = src_[pos_];

        if (c == '/' && at(1) == '/') {
          while (pos_ < src_.size() && src_[pos_] != '\n')
            advance(1);
          auto text = src_.substr(start, pos_ - start);
          while (!text.empty() && text.back() == '\r')
            text.remove_suffix(1);
          token t;
          t.kind = token_kind::line_comment;
          t.text = std::string(text);
          t.line = t.end_line = line;
          t.column = column;
          tokens_.push_back(std::move(t));
          return;
        }
        if (c == '/' && at(1) == '*') {
          auto close = src_.find("*/", pos_ + 2);
          if (close == std::string_view::npos)
            fail("comment not terminated", line, column);
          advance(close + 2 - pos_);
          token t;
          t.kind = token_kind::block_comment;
          t.text = std::string(src_.substr(start, pos_ - start));
          t.line = line;
          t.end_line = line_;
          t.column = column;
          // A comment spanning lines acts like a newline.
          if (t.end_line != t.line) {
            std::size_t saved = line_;
            line_ = line;
            insert_semicolon();
            line_ = saved;
          }
          tokens_.push_back(std::move(t));
          return;
        }

        if (is_letter(c)) {
          while (pos_ < src_.size() && (is_letter(src_[pos_]) || is_decimal(src_[pos_])))
            advance(1);
          auto word = src_.substr(start, pos_ - start);
          emit(is_keyword(word) ? token_kind::keyword : token_kind::identifier,
               start, line, column);
          return;
        }

        if (is_decimal(c) || (c == '.' && is_decimal(at(1)))) {
          lex_number(start, line, column);
          return;
        }

        if (c == '"') {
          lex_interpreted(start, line, column);
          return;
        }
        if (c == '`') {
          auto close = src_.find('`', pos_ + 1);
          if (close == std::string_view::npos)
            fail("raw string literal not terminated", line, column);
          advance(close + 1 - pos_);
          emit(token_kind::string_lit, start, line, column);
          return;
        }
        if (c == '\'') {
          lex_rune(start, line, column);
          return;
        }

        if (c == ';') {
          advance(1);
          emit(token_kind::semicolon, start, line, column);
          return;
        }

        for (auto op : operators) {
          if (src_.substr(pos_, op.size()) == op) {
            advance(op.size());
            emit(token_kind::op, start, line, column);
            return;
          }
        }

        char buf[32];
        std::snprintf(buf, sizeof(buf), "illegal character U+%04X",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        fail(buf, line, column);
      }

      void
      lex_digits(bool (*pred)(char)) {
        while (pos_ < src_.size() && (pred(src_[pos_]) || src_[pos_] == '_'))
          advance(1);
      }

      void
      lex_number(std::size_t start, std::size_t line, std::size_t column) {
        auto kind = token_kind::int_lit;
        char c0 = src_[pos_];
        char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(at(1))));
        bool prefixed = c0 == '0' && (c1 == 'x' || c1 == 'b' || c1 == 'o');

        if (prefixed) {
          advance(2);
          auto digits_start = pos_;
          if (c1 == 'x') {
            lex_digits(is_hex);
            bool mantissa = pos_ > digits_start;
            if (at(0) == '.') {
              kind = token_kind::float_lit;
              advance(1);
              auto fraction = pos_;
              lex_digits(is_hex);
              mantissa = mantissa || pos_ > fraction;
            }
            if (!mantissa) fail("hexadecimal literal has no digits", line, column);
            if (at(0) == 'p' || at(0) == 'P') {
              kind = token_kind::float_lit;
              advance(1);
              if (at(0) == '+' || at(0) == '-') advance(1);
              if (!is_decimal(at(0))) fail("exponent has no digits", line_, column_);
              lex_digits(is_decimal);
            } else if (kind == token_kind::float_lit) {
              fail("hexadecimal mantissa requires a 'p' exponent", line, column);
            }
          } else {
            const char* base = c1 == 'b' ? "binary" : "octal";
            char limit = c1 == 'b' ? '1' : '7';
            lex_digits(is_decimal);
            auto digits = src_.substr(digits_start, pos_ - digits_start);
            if (digits.find_first_not_of('_') == std::string_view::npos)
              fail(std::string(base) + " literal has no digits", line, column);
            for (char d : digits)
              if (d != '_' && d > limit)
                fail(std::string("invalid digit '") + d + "' in " + base +
                         " literal",
                     line, column);
          }
        } else {
          lex_digits(is_decimal);
          if (at(0) == '.') {
            kind = token_kind::float_lit;
            advance(1);
            lex_digits(is_decimal);
          }
          if (at(0) == 'e' || at(0) == 'E') {
            kind = token_kind::float_lit;
            advance(1);
            if (at(0) == '+' || at(0) == '-') advance(1);
            if (!is_decimal(at(0))) fail("exponent has no digits", line_, column_);
            lex_digits(is_decimal);
          }
        }
        if (at(0) == 'i') {
          kind = token_kind::imag_lit;
          advance(1);
        }
        if (is_letter(at(0)) || is_decimal(at(0)))
          fail("invalid character in numeric literal", line_, column_);
        // 0-prefixed integers are octal
        if (kind == token_kind::int_lit && !prefixed && c0 == '0') {
          for (char d : src_.substr(start, pos_ - start))
            if (d == '8' || d == '9')
              fail(std::string("invalid digit '") + d + "' in octal literal",
                   line, column);
        }
        emit(kind, start, line, column);
      }

      // Consumes one escape sequence after the backslash.
      void
      lex_escape(char quote) {
        std::size_t line = line_;
        std::size_t column = column_;
        advance(1); // backslash
        char e = at(0);
        std::size_t digits = 0;
        bool (*pred)(char) = is_hex;
        switch (e) {
        case 'a': case 'b': case 'f': case 'n': case 'r': case 't': case 'v':
        case '\\':
          advance(1);
          return;
        case 'x': digits = 2; advance(1); break;
        case 'u': digits = 4; advance(1); break;
        case 'U': digits = 8; advance(1); break;
        default:
          if (e == quote) {
            advance(1);
            return;
          }
          if (e >= '0' && e <= '7') {
            digits = 3;
            pred = [](char c) { return c >= '0' && c <= '7'; };
            break;
          }
          fail("unknown escape sequence", line, column);
        }
        for (std::size_t i = 0; i < digits; ++i) {
          if (!pred(at(0))) fail("illegal character in escape sequence", line_, column_);
          advance(1);
        }
      }

      void
      lex_interpreted(std::size_t start, std::size_t line, std::size_t column) {
        advance(1);
        for (;;) {
          char c = at(0);
          if (pos_ >= src_.size() || c == '\n')
            fail("string literal not terminated", line, column);
          if (c == '"') {
            advance(1);
            break;
          }
          if (c == '\\')
            lex_escape('"');
          else
            advance(1);
        }
        emit(token_kind::string_lit, start, line, column);
      }

      void
      lex_rune(std::size_t start, std::size_t line, std::size_t column) {
        advance(1);
        std::size_t count = 0;
        for (;;) {
          char c = at(0);
          if (pos_ >= src_.size() || c == '\n')
            fail("rune literal not terminated", line, column);
          if (c == '\'') {
            advance(1);
            break;
          }
          if (c == '\\') {
            lex_escape('\'');
          } else {
            // one UTF-8 sequence
            advance(1);
            while ((static_cast<unsigned char>(at(0)) & 0xC0) == 0x80)
              advance(1);
          }
          ++count;
        }
        if (count != 1) fail("illegal rune literal", line, column);
        emit(token_kind::rune_lit, start, line, column);
      }
    };

  } // namespace

  bool
  is_keyword(std::string_view word) {
    for (auto k : keywords)
      if (k == word) return true;
    return false;
  }

  std::vector<token>
  tokenize(std::string_view source) {
    lexer lex(source);
    return lex.run();
  }

} // namespace modelgen::go
