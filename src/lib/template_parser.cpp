#include <modelgen/errors.hpp>
#include <modelgen/template_parser.hpp>

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace modelgen {

  namespace {

    // -----------------------------------------------------------------------
    // Tokens
    // -----------------------------------------------------------------------

    enum class token_kind {
      eof,
      text,
      left_delim,
      right_delim,
      identifier, // keyword, function name, true/false/nil
      field,      // .Name (value holds Name)
      dot,        // .
      variable,   // $ or $name (value includes the $)
      string,     // decoded string literal
      integer,
      real,
      lparen,
      rparen,
      pipe,
      declare, // :=
      assign,  // =
      comma,
    };

    struct token {
      token_kind kind = token_kind::eof;
      std::string value;
      std::size_t line = 1;
      bool space_before = false;
      std::int64_t integer = 0;
      double real = 0.0;
    };

    [[noreturn]] void
    fail(std::size_t line, const std::string& message) {
      throw template_error("template: line " + std::to_string(line) + ": " +
                           message);
    }

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    bool
    is_alnum(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    void
    append_utf8(std::string& out, std::uint32_t cp) {
      if (cp < 0x80) {
        out += static_cast<char>(cp);
      } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      }
    }

    // -----------------------------------------------------------------------
    // Lexer: splits the text into text runs and action tokens
    // -----------------------------------------------------------------------

    class lexer {
    public:
      explicit lexer(std::string_view source) : src_(source) {}

      std::vector<token>
      run() {
        while (pos_ < src_.size()) {
          auto open = src_.find("{{", pos_);
          if (open == std::string_view::npos) {
            emit_text(src_.substr(pos_));
            pos_ = src_.size();
            break;
          }

          bool trim_left = open + 3 < src_.size() && src_[open + 2] == '-' &&
                           is_space(src_[open + 3]);
          auto text = src_.substr(pos_, open - pos_);
          if (trim_left) {
            while (!text.empty() && is_space(text.back()))
              text.remove_suffix(1);
          }
          emit_text(text);
          advance_to(open + (trim_left ? 3 : 2));
          lex_action();
        }
        tokens_.push_back({token_kind::eof, {}, line_});
        return std::move(tokens_);
      }

    private:
      std::string_view src_;
      std::size_t pos_ = 0;
      std::size_t line_ = 1;
      bool trim_next_ = false;
      std::vector<token> tokens_;

      void
      advance_to(std::size_t target) {
        for (; pos_ < target && pos_ < src_.size(); ++pos_)
          if (src_[pos_] == '\n') ++line_;
      }

      void
      emit_text(std::string_view text) {
        std::size_t line = line_;
        if (trim_next_) {
          while (!text.empty() && is_space(text.front())) {
            if (text.front() == '\n') ++line;
            text.remove_prefix(1);
          }
          trim_next_ = false;
        }
        if (!text.empty())
          tokens_.push_back({token_kind::text, std::string(text), line});
      }

      // At a right delimiter (optionally trimmed) starting at pos_?
      std::size_t
      right_delim_length() const {
        if (src_.substr(pos_, 2) == "}}") return 2;
        return 0;
      }

      bool
      at_trim_right() const {
        return pos_ + 3 <= src_.size() && src_[pos_] == '-' &&
               src_.substr(pos_ + 1, 2) == "}}" && pos_ > 0 &&
               is_space(src_[pos_ - 1]);
      }

      void
      lex_comment(std::size_t start_line) {
        auto close = src_.find("*/", pos_ + 2);
        if (close == std::string_view::npos) fail(start_line, "unclosed comment");
        advance_to(close + 2);
        while (pos_ < src_.size() && is_space(src_[pos_]))
          advance_to(pos_ + 1);
        if (at_trim_right()) {
          advance_to(pos_ + 3);
          trim_next_ = true;
          return;
        }
        if (right_delim_length() == 0)
          fail(line_, "comment ends before closing delimiter");
        advance_to(pos_ + 2);
      }

      void
      lex_action() {
        std::size_t start_line = line_;
        while (pos_ < src_.size() && is_space(src_[pos_]))
          advance_to(pos_ + 1);
        if (src_.substr(pos_, 2) == "/*") {
          lex_comment(start_line);
          return;
        }

        tokens_.push_back({token_kind::left_delim, "{{", start_line});
        bool space = true;
        for (;;) {
          if (pos_ >= src_.size()) fail(start_line, "unclosed action");
          char c = src_[pos_];
          if (is_space(c)) {
            advance_to(pos_ + 1);
            space = true;
            continue;
          }
          if (at_trim_right()) {
            tokens_.push_back({token_kind::right_delim, "}}", line_});
            advance_to(pos_ + 3);
            trim_next_ = true;
            return;
          }
          if (right_delim_length() != 0) {
            tokens_.push_back({token_kind::right_delim, "}}", line_});
            advance_to(pos_ + 2);
            return;
          }
          lex_token(space);
          space = false;
        }
      }

      void
      push(token_kind kind, std::string value, bool space) {
        token t;
        t.kind = kind;
        t.value = std::move(value);
        t.line = line_;
        t.space_before = space;
        tokens_.push_back(std::move(t));
      }

      void
      lex_token(bool space) {
        char c = src_[pos_];
        switch (c) {
        case '(': push(token_kind::lparen, "(", space); advance_to(pos_ + 1); return;
        case ')': push(token_kind::rparen, ")", space); advance_to(pos_ + 1); return;
        case '|': push(token_kind::pipe, "|", space); advance_to(pos_ + 1); return;
        case ',': push(token_kind::comma, ",", space); advance_to(pos_ + 1); return;
        case '=': push(token_kind::assign, "=", space); advance_to(pos_ + 1); return;
        case ':':
          if (src_.substr(pos_, 2) != ":=") fail(line_, "expected :=");
          push(token_kind::declare, ":=", space);
          advance_to(pos_ + 2);
          return;
        case '"': lex_quoted(space); return;
        case '`': lex_raw(space); return;
        case '$': {
          auto end = pos_ + 1;
          while (end < src_.size() && is_alnum(src_[end]))
            ++end;
          push(token_kind::variable, std::string(src_.substr(pos_, end - pos_)),
               space);
          advance_to(end);
          return;
        }
        case '.': {
          if (pos_ + 1 < src_.size() && is_digit(src_[pos_ + 1])) {
            lex_number(space);
            return;
          }
          auto end = pos_ + 1;
          while (end < src_.size() && is_alnum(src_[end]))
            ++end;
          if (end == pos_ + 1) {
            push(token_kind::dot, ".", space);
          } else {
            push(token_kind::field,
                 std::string(src_.substr(pos_ + 1, end - pos_ - 1)), space);
          }
          advance_to(end);
          return;
        }
        default: break;
        }

        if (is_digit(c) ||
            ((c == '-' || c == '+') && pos_ + 1 < src_.size() &&
             is_digit(src_[pos_ + 1]))) {
          lex_number(space);
          return;
        }
        if (is_alnum(c)) {
          auto end = pos_;
          while (end < src_.size() && is_alnum(src_[end]))
            ++end;
          push(token_kind::identifier, std::string(src_.substr(pos_, end - pos_)),
               space);
          advance_to(end);
          return;
        }
        fail(line_, std::string("unexpected character '") + c + "' in action");
      }

      void
      lex_number(bool space) {
        auto start = pos_;
        auto end = pos_;
        if (src_[end] == '-' || src_[end] == '+') ++end;
        bool is_real = false;
        bool hex = src_.substr(end, 2) == "0x" || src_.substr(end, 2) == "0X";
        if (hex) {
          end += 2;
          while (end < src_.size() &&
                 std::isxdigit(static_cast<unsigned char>(src_[end])))
            ++end;
        } else {
          while (end < src_.size() && is_digit(src_[end]))
            ++end;
          if (end < src_.size() && src_[end] == '.') {
            is_real = true;
            ++end;
            while (end < src_.size() && is_digit(src_[end]))
              ++end;
          }
          if (end < src_.size() && (src_[end] == 'e' || src_[end] == 'E')) {
            is_real = true;
            ++end;
            if (end < src_.size() && (src_[end] == '-' || src_[end] == '+'))
              ++end;
            while (end < src_.size() && is_digit(src_[end]))
              ++end;
          }
        }
        if (end < src_.size() && is_alnum(src_[end]))
          fail(line_, "bad number syntax: \"" +
                          std::string(src_.substr(start, end - start + 1)) +
                          "\"");

        std::string text(src_.substr(start, end - start));
        token t;
        t.line = line_;
        t.space_before = space;
        t.value = text;
        errno = 0;
        if (is_real) {
          t.kind = token_kind::real;
          t.real = std::strtod(text.c_str(), nullptr);
        } else {
          t.kind = token_kind::integer;
          t.integer = std::strtoll(text.c_str(), nullptr, hex ? 16 : 10);
        }
        if (errno == ERANGE)
          fail(line_, "number out of range: \"" + text + "\"");
        tokens_.push_back(std::move(t));
        advance_to(end);
      }

      void
      lex_quoted(bool space) {
        std::size_t line = line_;
        std::string out;
        auto i = pos_ + 1;
        for (;;) {
          if (i >= src_.size() || src_[i] == '\n')
            fail(line, "unterminated quoted string");
          char c = src_[i];
          if (c == '"') break;
          if (c != '\\') {
            out += c;
            ++i;
            continue;
          }
          if (++i >= src_.size()) fail(line, "unterminated quoted string");
          char e = src_[i++];
          switch (e) {
          case 'n': out += '\n'; break;
          case 't': out += '\t'; break;
          case 'r': out += '\r'; break;
          case '\\': out += '\\'; break;
          case '"': out += '"'; break;
          case '\'': out += '\''; break;
          case 'x':
          case 'u':
          case 'U': {
            std::size_t digits = e == 'x' ? 2 : (e == 'u' ? 4 : 8);
            if (i + digits > src_.size()) fail(line, "bad escape in string");
            std::string hex(src_.substr(i, digits));
            for (char h : hex)
              if (!std::isxdigit(static_cast<unsigned char>(h)))
                fail(line, "bad escape in string");
            auto cp = static_cast<std::uint32_t>(std::strtoul(hex.c_str(), nullptr, 16));
            if (e == 'x')
              out += static_cast<char>(cp);
            else
              append_utf8(out, cp);
            i += digits;
            break;
          }
          default:
            fail(line, std::string("unknown escape sequence \\") + e);
          }
        }
        token t;
        t.kind = token_kind::string;
        t.value = std::move(out);
        t.line = line;
        t.space_before = space;
        tokens_.push_back(std::move(t));
        advance_to(i + 1);
      }

      void
      lex_raw(bool space) {
        std::size_t line = line_;
        auto close = src_.find('`', pos_ + 1);
        if (close == std::string_view::npos) fail(line, "unterminated raw quoted string");
        token t;
        t.kind = token_kind::string;
        t.value = std::string(src_.substr(pos_ + 1, close - pos_ - 1));
        t.line = line;
        t.space_before = space;
        tokens_.push_back(std::move(t));
        advance_to(close + 1);
      }
    };

    // -----------------------------------------------------------------------
    // Parser
    // -----------------------------------------------------------------------

    enum class list_end { eof, end, else_ };

    class parser {
    public:
      parser(std::vector<token> tokens, const function_table& functions)
          : tokens_(std::move(tokens)), functions_(functions) {
        vars_.push_back("$");
      }

      tmpl::parse_tree
      run() {
        list_end ended;
        tree_.body = parse_list(ended);
        if (ended == list_end::end) fail(last_line_, "unexpected {{end}}");
        if (ended == list_end::else_) fail(last_line_, "unexpected {{else}}");
        return std::move(tree_);
      }

    private:
      std::vector<token> tokens_;
      std::size_t pos_ = 0;
      const function_table& functions_;
      std::vector<std::string> vars_;
      int range_depth_ = 0;
      int nesting_ = 0;
      std::size_t last_line_ = 1;
      tmpl::parse_tree tree_;

      const token&
      peek(std::size_t ahead = 0) const {
        auto i = pos_ + ahead;
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
      }

      const token&
      next() {
        const auto& t = tokens_[pos_];
        last_line_ = t.line;
        if (pos_ + 1 < tokens_.size()) ++pos_;
        return t;
      }

      void
      expect(token_kind kind, const std::string& context) {
        if (peek().kind != kind)
          fail(peek().line, "unexpected \"" + peek().value + "\" in " + context);
        next();
      }

      bool
      at_keyword(std::string_view word, std::size_t ahead = 0) const {
        const auto& t = peek(ahead);
        return t.kind == token_kind::identifier && t.value == word;
      }

      bool
      is_declared(const std::string& name) const {
        for (const auto& v : vars_)
          if (v == name) return true;
        return false;
      }

      // Parses nodes until {{end}}, {{else ...}} (the `else` keyword is
      // consumed, the rest of the action is left to the caller) or eof.
      tmpl::node_list
      parse_list(list_end& ended) {
        tmpl::node_list list;
        for (;;) {
          const auto& t = peek();
          if (t.kind == token_kind::eof) {
            ended = list_end::eof;
            return list;
          }
          if (t.kind == token_kind::text) {
            list.emplace_back(tmpl::text_node{t.value}, t.line);
            next();
            continue;
          }

          // left delimiter
          std::size_t line = t.line;
          next();
          if (at_keyword("end")) {
            next();
            expect(token_kind::right_delim, "end");
            ended = list_end::end;
            return list;
          }
          if (at_keyword("else")) {
            next();
            ended = list_end::else_;
            return list;
          }
          parse_action(list, line);
        }
      }

      void
      parse_action(tmpl::node_list& list, std::size_t line) {
        const auto& t = peek();
        if (t.kind == token_kind::identifier) {
          if (t.value == "if") {
            next();
            list.push_back(parse_if(line));
            return;
          }
          if (t.value == "range") {
            next();
            list.push_back(parse_range(line));
            return;
          }
          if (t.value == "with") {
            next();
            list.push_back(parse_with(line));
            return;
          }
          if (t.value == "define") {
            next();
            parse_define(line);
            return;
          }
          if (t.value == "template") {
            next();
            list.push_back(parse_template_call(line));
            return;
          }
          if (t.value == "block") {
            next();
            list.push_back(parse_block(line));
            return;
          }
          if (t.value == "break" || t.value == "continue") {
            bool is_break = t.value == "break";
            next();
            expect(token_kind::right_delim, t.value);
            if (range_depth_ == 0)
              fail(line, std::string("{{") + (is_break ? "break" : "continue") +
                             "}} outside {{range}}");
            if (is_break)
              list.emplace_back(tmpl::break_node{}, line);
            else
              list.emplace_back(tmpl::continue_node{}, line);
            return;
          }
        }

        tmpl::action_node action{parse_pipeline("command", 1)};
        expect(token_kind::right_delim, "command");
        list.emplace_back(std::move(action), line);
      }

      // Body of an if/with, after its pipeline and right delimiter. Pops the
      // variables declared since vars_mark.
      template <typename Node>
      void
      parse_control_body(Node& n, std::string_view keyword,
                         std::size_t vars_mark) {
        list_end ended;
        n.list = parse_list(ended);
        if (ended == list_end::eof)
          fail(last_line_, "unexpected EOF in " + std::string(keyword));

        if (ended == list_end::else_) {
          if (keyword != "range" && at_keyword(keyword)) {
            // {{else if ...}} / {{else with ...}}: a nested control that
            // shares the enclosing {{end}}.
            std::size_t line = peek().line;
            next();
            if (keyword == "if")
              n.else_list.push_back(parse_if(line));
            else
              n.else_list.push_back(parse_with(line));
          } else {
            expect(token_kind::right_delim, "else");
            n.else_list = parse_list(ended);
            if (ended != list_end::end)
              fail(last_line_, "expected end; found " +
                                   std::string(ended == list_end::eof
                                                   ? "EOF"
                                                   : "{{else}}"));
          }
        }
        vars_.resize(vars_mark);
      }

      tmpl::node
      parse_if(std::size_t line) {
        ++nesting_;
        auto mark = vars_.size();
        tmpl::if_node n{parse_pipeline("if", 1), {}, {}};
        expect(token_kind::right_delim, "if");
        parse_control_body(n, "if", mark);
        --nesting_;
        return tmpl::node(std::move(n), line);
      }

      tmpl::node
      parse_with(std::size_t line) {
        ++nesting_;
        auto mark = vars_.size();
        tmpl::with_node n{parse_pipeline("with", 1), {}, {}};
        expect(token_kind::right_delim, "with");
        parse_control_body(n, "with", mark);
        --nesting_;
        return tmpl::node(std::move(n), line);
      }

      tmpl::node
      parse_range(std::size_t line) {
        ++nesting_;
        auto mark = vars_.size();
        tmpl::range_node n{parse_pipeline("range", 2), {}, {}};
        expect(token_kind::right_delim, "range");

        list_end ended;
        ++range_depth_;
        n.list = parse_list(ended);
        --range_depth_;
        if (ended == list_end::eof) fail(last_line_, "unexpected EOF in range");
        if (ended == list_end::else_) {
          expect(token_kind::right_delim, "else");
          n.else_list = parse_list(ended);
          if (ended != list_end::end)
            fail(last_line_, "expected end in range");
        }
        vars_.resize(mark);
        --nesting_;
        return tmpl::node(std::move(n), line);
      }

      std::string
      parse_section_name(std::string_view context) {
        if (peek().kind != token_kind::string)
          fail(peek().line, "expected quoted name in " + std::string(context));
        return next().value;
      }

      // A separately named body: only $ is in scope, break/continue are not.
      tmpl::node_list
      parse_section_body(std::string_view context) {
        auto saved_vars = std::move(vars_);
        auto saved_range = range_depth_;
        vars_ = {"$"};
        range_depth_ = 0;

        list_end ended;
        auto body = parse_list(ended);
        if (ended != list_end::end)
          fail(last_line_, "unexpected " +
                               std::string(ended == list_end::eof ? "EOF"
                                                                  : "{{else}}") +
                               " in " + std::string(context));

        vars_ = std::move(saved_vars);
        range_depth_ = saved_range;
        return body;
      }

      void
      parse_define(std::size_t line) {
        if (nesting_ != 0) fail(line, "unexpected {{define}}");
        auto name = parse_section_name("define clause");
        expect(token_kind::right_delim, "define clause");
        ++nesting_;
        auto body = parse_section_body("define");
        --nesting_;
        tree_.definitions.emplace_back(std::move(name), std::move(body));
      }

      tmpl::node
      parse_template_call(std::size_t line) {
        tmpl::template_call_node n;
        n.name = parse_section_name("template clause");
        if (peek().kind != token_kind::right_delim)
          n.pipe = parse_pipeline("template clause", 0);
        expect(token_kind::right_delim, "template clause");
        return tmpl::node(std::move(n), line);
      }

      tmpl::node
      parse_block(std::size_t line) {
        tmpl::template_call_node n;
        n.name = parse_section_name("block clause");
        n.pipe = parse_pipeline("block clause", 0);
        expect(token_kind::right_delim, "block clause");
        ++nesting_;
        auto body = parse_section_body("block");
        --nesting_;
        tree_.definitions.emplace_back(n.name, std::move(body));
        return tmpl::node(std::move(n), line);
      }

      bool
      at_declaration() const {
        if (peek().kind != token_kind::variable) return false;
        auto k = peek(1).kind;
        if (k == token_kind::declare || k == token_kind::assign) return true;
        return k == token_kind::comma && peek(2).kind == token_kind::variable &&
               (peek(3).kind == token_kind::declare ||
                peek(3).kind == token_kind::assign);
      }

      tmpl::pipeline
      parse_pipeline(std::string_view context, std::size_t max_vars) {
        tmpl::pipeline pipe;
        pipe.line = peek().line;

        std::vector<std::string> declared;
        if (at_declaration()) {
          if (max_vars == 0)
            fail(peek().line, "unexpected declaration in " + std::string(context));
          pipe.variables.push_back(next().value);
          if (peek().kind == token_kind::comma) {
            if (max_vars < 2)
              fail(peek().line, "too many declarations in " + std::string(context));
            next();
            pipe.variables.push_back(next().value);
          }
          pipe.is_assignment = peek().kind == token_kind::assign;
          next();
          if (pipe.is_assignment) {
            for (const auto& v : pipe.variables)
              if (!is_declared(v))
                fail(pipe.line, "undefined variable \"" + v + "\"");
          } else {
            declared = pipe.variables;
          }
        }

        for (;;) {
          pipe.commands.push_back(parse_command(context));
          if (peek().kind != token_kind::pipe) break;
          next();
        }

        for (auto& v : declared)
          vars_.push_back(std::move(v));
        return pipe;
      }

      bool
      at_command_end() const {
        auto k = peek().kind;
        return k == token_kind::pipe || k == token_kind::right_delim ||
               k == token_kind::rparen || k == token_kind::eof;
      }

      tmpl::command
      parse_command(std::string_view context) {
        tmpl::command cmd;
        std::size_t line = peek().line;
        while (!at_command_end())
          cmd.operands.push_back(parse_operand());
        if (cmd.operands.empty())
          fail(line, "missing value for " + std::string(context));
        if (cmd.operands.size() > 1 &&
            cmd.operands.front().kind != tmpl::operand_kind::function)
          fail(line, "can't give argument to non-function");
        return cmd;
      }

      void
      parse_chain(tmpl::operand& op) {
        while (peek().kind == token_kind::field && !peek().space_before)
          op.fields.push_back(next().value);
      }

      tmpl::operand
      parse_operand() {
        const auto& t = peek();
        tmpl::operand op;
        std::size_t line = t.line;

        switch (t.kind) {
        case token_kind::dot:
          next();
          op.kind = tmpl::operand_kind::dot;
          if (peek().kind == token_kind::field && !peek().space_before)
            fail(line, "unexpected . after term \".\"");
          return op;
        case token_kind::field:
          op.kind = tmpl::operand_kind::field;
          op.fields.push_back(next().value);
          parse_chain(op);
          return op;
        case token_kind::variable:
          op.kind = tmpl::operand_kind::variable;
          op.name = next().value;
          if (!is_declared(op.name))
            fail(line, "undefined variable \"" + op.name + "\"");
          parse_chain(op);
          return op;
        case token_kind::string:
          op.kind = tmpl::operand_kind::literal;
          op.literal = next().value;
          break;
        case token_kind::integer:
          op.kind = tmpl::operand_kind::literal;
          op.literal = next().integer;
          break;
        case token_kind::real:
          op.kind = tmpl::operand_kind::literal;
          op.literal = next().real;
          break;
        case token_kind::lparen: {
          next();
          op.kind = tmpl::operand_kind::pipeline;
          op.inner =
              std::make_shared<const tmpl::pipeline>(parse_pipeline("parenthesized pipeline", 0));
          expect(token_kind::rparen, "parenthesized pipeline");
          parse_chain(op);
          return op;
        }
        case token_kind::identifier:
          if (t.value == "true" || t.value == "false") {
            op.kind = tmpl::operand_kind::literal;
            op.literal = next().value == "true";
            break;
          }
          if (t.value == "nil") {
            op.kind = tmpl::operand_kind::literal;
            next();
            break;
          }
          if (functions_.find(t.value) == functions_.end())
            fail(line, "function \"" + t.value + "\" not defined");
          op.kind = tmpl::operand_kind::function;
          op.name = next().value;
          break;
        default:
          fail(line, "unexpected \"" + t.value + "\" in operand");
        }

        if (peek().kind == token_kind::field && !peek().space_before)
          fail(line, "unexpected . after term");
        return op;
      }
    };

  } // namespace

  tmpl::parse_tree
  parse_template(std::string_view text, const function_table& functions) {
    lexer lex(text);
    parser p(lex.run(), functions);
    return p.run();
  }

  namespace tmpl {

    bool
    is_empty_list(const node_list& list) {
      for (const auto& n : list) {
        if (!n.holds<text_node>()) return false;
        for (char c : n.get<text_node>().text)
          if (!is_space(c)) return false;
      }
      return true;
    }

  } // namespace tmpl

} // namespace modelgen
