#include <modelgen/errors.hpp>
#include <modelgen/go_parser.hpp>

#include <string>
#include <vector>

namespace modelgen::go {

  namespace {

    // How an operand may continue into a composite literal.
    enum class operand_class {
      other,
      type_name,     // T, pkg.T, T[A]
      explicit_type, // []T, [N]T, map[K]V, struct{...}
    };

    enum class simple_stmt { expression, statement, range_clause };

    // Cell layout of one const or var spec inside a group.
    struct value_spec {
      bool has_type = false;
      bool has_values = false;
      token* assign = nullptr;  // '=' opening the values cell
      token* comment = nullptr; // trailing line comment
    };

    int
    binary_precedence(const token& t) {
      if (t.kind != token_kind::op) return 0;
      const auto& s = t.text;
      if (s == "||") return 1;
      if (s == "&&") return 2;
      if (s == "==" || s == "!=" || s == "<" || s == "<=" || s == ">" ||
          s == ">=")
        return 3;
      if (s == "+" || s == "-" || s == "|" || s == "^") return 4;
      if (s == "*" || s == "/" || s == "%" || s == "<<" || s == ">>" ||
          s == "&" || s == "&^")
        return 5;
      return 0;
    }

    bool
    is_assign_op(const token& t) {
      if (t.kind != token_kind::op) return false;
      const auto& s = t.text;
      return s == "=" || s == ":=" || s == "+=" || s == "-=" || s == "*=" ||
             s == "/=" || s == "%=" || s == "&=" || s == "|=" || s == "^=" ||
             s == "<<=" || s == ">>=" || s == "&^=";
    }

    bool
    is_unary_op(const token& t) {
      if (t.kind != token_kind::op) return false;
      const auto& s = t.text;
      return s == "+" || s == "-" || s == "!" || s == "^" || s == "*" ||
             s == "&" || s == "<-" || s == "~";
    }

    std::string
    describe(const token& t) {
      switch (t.kind) {
      case token_kind::eof: return "EOF";
      case token_kind::semicolon:
        return t.has(flag_implicit) ? "newline" : "';'";
      default: return "'" + t.text + "'";
      }
    }

    class parser {
    public:
      explicit parser(std::vector<token>& tokens) : toks_(tokens) {
        for (std::size_t i = 0; i < toks_.size(); ++i)
          if (!toks_[i].is_comment()) sig_.push_back(i);
      }

      file_syntax
      run() {
        file_syntax file;
        if (!tok().is_keyword("package"))
          fail(tok(), "expected 'package', found " + describe(tok()));
        file.package_token = index();
        next();
        expect_identifier();
        expect_semi();

        while (tok().is_keyword("import")) {
          file.decls.push_back({decl_kind::import_decl, index()});
          parse_import_decl();
          expect_semi();
        }

        while (tok().kind != token_kind::eof) {
          auto first = index();
          const auto& t = tok();
          if (t.is_keyword("const")) {
            file.decls.push_back({decl_kind::const_decl, first});
            parse_gen_decl();
          } else if (t.is_keyword("var")) {
            file.decls.push_back({decl_kind::var_decl, first});
            parse_gen_decl();
          } else if (t.is_keyword("type")) {
            file.decls.push_back({decl_kind::type_decl, first});
            parse_gen_decl();
          } else if (t.is_keyword("func")) {
            file.decls.push_back({decl_kind::func_decl, first});
            parse_func_decl();
          } else if (t.is_keyword("import")) {
            fail(t, "imports must appear before other declarations");
          } else {
            fail(t, "non-declaration statement outside function body");
          }
          if (tok().kind != token_kind::eof) expect_semi();
        }
        return file;
      }

    private:
      std::vector<token>& toks_;
      std::vector<std::size_t> sig_;
      std::size_t p_ = 0;
      int no_composite_ = 0;

      [[noreturn]] void
      fail(const token& t, const std::string& message) const {
        throw format_error(message, t.line, t.column);
      }

      std::size_t
      index() const {
        return sig_[p_];
      }

      token&
      tok() {
        return toks_[sig_[p_]];
      }

      token&
      peek(std::size_t n = 1) {
        auto i = p_ + n;
        return toks_[sig_[i < sig_.size() ? i : sig_.size() - 1]];
      }

      void
      next() {
        if (p_ + 1 < sig_.size()) ++p_;
      }

      bool
      at_op(std::string_view s) {
        return tok().is_op(s);
      }

      token&
      expect_op(std::string_view s) {
        if (!at_op(s))
          fail(tok(), "expected '" + std::string(s) + "', found " + describe(tok()));
        auto& t = tok();
        next();
        return t;
      }

      void
      expect_identifier() {
        if (tok().kind != token_kind::identifier)
          fail(tok(), "expected identifier, found " + describe(tok()));
        next();
      }

      // A semicolon may be omitted before a closing ")" or "}".
      void
      expect_semi() {
        if (tok().kind == token_kind::semicolon) {
          next();
          return;
        }
        if (at_op(")") || at_op("}") || tok().kind == token_kind::eof) return;
        fail(tok(), "expected ';', found " + describe(tok()));
      }

      bool
      starts_line(std::size_t token_index) const {
        const auto& t = toks_[token_index];
        for (std::size_t i = token_index; i-- > 0;) {
          const auto& prev = toks_[i];
          if (prev.kind == token_kind::semicolon && prev.has(flag_implicit))
            continue;
          return prev.end_line < t.line;
        }
        return true;
      }

      // Line comment trailing the last consumed token, or nullptr.
      token*
      trailing_comment() {
        if (p_ == 0) return nullptr;
        auto last = sig_[p_ - 1];
        for (auto i = last + 1; i < toks_.size(); ++i) {
          auto& t = toks_[i];
          if (t.kind == token_kind::semicolon && t.has(flag_implicit)) continue;
          if (t.kind == token_kind::line_comment && t.line == toks_[last].end_line)
            return &t;
          return nullptr;
        }
        return nullptr;
      }

      bool
      starts_type(const token& t) const {
        if (t.kind == token_kind::identifier) return true;
        if (t.kind == token_kind::keyword)
          return t.text == "func" || t.text == "map" || t.text == "chan" ||
                 t.text == "struct" || t.text == "interface";
        return t.is_op("*") || t.is_op("[") || t.is_op("(") || t.is_op("<-");
      }

      // -------------------------------------------------------------------
      // Declarations
      // -------------------------------------------------------------------

      void
      parse_import_decl() {
        next(); // import
        if (at_op("(")) {
          next();
          bool empty = true;
          while (!at_op(")")) {
            if (tok().kind == token_kind::eof) fail(tok(), "unexpected EOF in import");
            if (tok().kind == token_kind::semicolon) {
              next();
              continue;
            }
            tok().flags |= flag_import_spec | flag_newline;
            parse_import_spec();
            expect_semi();
            empty = false;
          }
          if (!empty) tok().flags |= flag_newline;
          next();
          return;
        }
        parse_import_spec();
      }

      void
      parse_import_spec() {
        if (tok().kind == token_kind::identifier || at_op("."))
          next();
        if (tok().kind != token_kind::string_lit)
          fail(tok(), "missing import path; found " + describe(tok()));
        next();
      }

      void
      parse_gen_decl() {
        std::string keyword = tok().text;
        next();
        if (!at_op("(")) {
          parse_spec(keyword, false, 0);
          return;
        }
        // A parenthesized group always prints one spec per line.
        next();
        std::vector<value_spec> specs;
        while (!at_op(")")) {
          if (tok().kind == token_kind::eof)
            fail(tok(), "unexpected EOF in " + keyword + " declaration");
          if (tok().kind == token_kind::semicolon) {
            next();
            continue;
          }
          tok().flags |= flag_newline;
          specs.push_back(parse_spec(keyword, true, specs.size()));
          expect_semi();
        }
        if (!specs.empty()) tok().flags |= flag_newline;
        next();
        if (keyword != "type") pad_value_specs(specs);
      }

      // Spec columns are names, type, values and trailing comment. A spec
      // without a type keeps an empty type cell when another spec in its
      // run of initialized specs has one.
      void
      pad_value_specs(const std::vector<value_spec>& specs) {
        std::vector<bool> keep_type(specs.size(), false);
        std::size_t run = specs.size();
        bool typed = false;
        for (std::size_t i = 0; i <= specs.size(); ++i) {
          bool initialized = i < specs.size() && specs[i].has_values;
          if (initialized && run == specs.size()) {
            run = i;
            typed = false;
          } else if (!initialized && run != specs.size()) {
            for (auto k = run; k < i; ++k)
              keep_type[k] = typed;
            run = specs.size();
          }
          if (i < specs.size() && specs[i].has_type) typed = true;
        }

        for (std::size_t i = 0; i < specs.size(); ++i) {
          const auto& spec = specs[i];
          unsigned cells = 1;
          if (spec.has_type) ++cells;
          if (spec.has_values) {
            ++cells;
            if (keep_type[i] && !spec.has_type) {
              spec.assign->empty_cells += 1;
              ++cells;
            }
          }
          if (spec.comment != nullptr && cells < 3)
            spec.comment->empty_cells += 3 - cells;
        }
      }

      value_spec
      parse_spec(const std::string& keyword, bool aligned, std::size_t position) {
        value_spec spec;
        if (keyword == "type") {
          expect_identifier();
          if (at_type_params()) parse_type_params();
          if (aligned) tok().flags |= flag_cell;
          if (at_op("=")) next();
          parse_type();
          return spec;
        }

        auto& first = tok();
        expect_identifier();
        while (at_op(",")) {
          next();
          expect_identifier();
        }
        if (!at_op("=") && tok().kind != token_kind::semicolon && !at_op(")")) {
          if (aligned) tok().flags |= flag_cell;
          parse_type();
          spec.has_type = true;
        }
        if (at_op("=")) {
          if (aligned) tok().flags |= flag_cell;
          spec.assign = &tok();
          spec.has_values = true;
          next();
          parse_expr_list();
        } else if (keyword == "var" && !spec.has_type) {
          fail(tok(), "missing variable type or initialization");
        } else if (keyword == "const" && (position == 0 || spec.has_type)) {
          fail(first, "missing init expr for const declaration");
        }
        spec.comment = trailing_comment();
        return spec;
      }

      // '[' after a type name opens type parameters, not an array length,
      // when a parameter name is followed by its constraint.
      bool
      at_type_params() {
        if (!at_op("[") || peek().kind != token_kind::identifier) return false;
        const auto& after = peek(2);
        if (after.kind == token_kind::identifier) return true;
        if (after.kind == token_kind::keyword)
          return after.text == "func" || after.text == "map" ||
                 after.text == "chan" || after.text == "struct" ||
                 after.text == "interface";
        return after.is_op(",") || after.is_op("~");
      }

      void
      parse_type_params() {
        tok().flags |= flag_index;
        next(); // [
        for (;;) {
          expect_identifier();
          if (at_op(",")) {
            next();
            continue;
          }
          parse_constraint_term();
          while (at_op("|")) {
            next();
            parse_constraint_term();
          }
          if (!at_op(",")) break;
          next();
          if (at_op("]")) break;
        }
        expect_op("]").flags |= flag_type_params;
      }

      void
      parse_func_decl() {
        next(); // func
        if (at_op("(")) {
          tok().flags |= flag_paren_space;
          parse_parameters();
        }
        expect_identifier();
        if (at_op("[")) parse_type_params();
        parse_signature();
        if (at_op("{")) {
          auto saved = no_composite_;
          no_composite_ = 0;
          parse_block();
          no_composite_ = saved;
        }
      }

      void
      parse_signature() {
        parse_parameters();
        if (at_op("(")) {
          tok().flags |= flag_paren_space;
          parse_parameters();
        } else if (starts_type(tok()) && !at_op("(")) {
          parse_type();
        }
      }

      // Either every parameter is named or none is; in "a, b int" both a
      // and b are names.
      void
      parse_parameters() {
        expect_op("(");
        bool named = false;
        const token* lone_name = nullptr; // not yet followed by a type
        const token* type_only = nullptr;
        while (!at_op(")")) {
          const auto& first = tok();
          if (first.kind == token_kind::identifier &&
              (peek().is_op("...") ||
               (starts_type(peek()) && !peek().is_op("(")))) {
            next();
            named = true;
            lone_name = nullptr;
          } else if (first.kind == token_kind::identifier &&
                     (peek().is_op(",") || peek().is_op(")"))) {
            if (lone_name == nullptr) lone_name = &first;
          } else if (type_only == nullptr) {
            type_only = &first;
          }
          if (at_op("...")) {
            tok().flags |= flag_variadic;
            next();
          }
          parse_type();
          if (!at_op(",")) break;
          next();
        }
        if (named && (type_only != nullptr || lone_name != nullptr))
          fail(type_only != nullptr ? *type_only : *lone_name,
               "mixed named and unnamed parameters");
        expect_op(")");
      }

      // -------------------------------------------------------------------
      // Types
      // -------------------------------------------------------------------

      void
      parse_type_name() {
        expect_identifier();
        if (at_op(".")) {
          next();
          expect_identifier();
        }
        if (at_op("[") && !peek().is_op("]")) {
          // type arguments
          tok().flags |= flag_index;
          next();
          parse_type();
          while (at_op(",")) {
            next();
            parse_type();
          }
          expect_op("]");
        }
      }

      void
      parse_type() {
        auto& t = tok();
        if (t.kind == token_kind::identifier) {
          parse_type_name();
          return;
        }
        if (t.is_op("*")) {
          t.flags |= flag_unary;
          next();
          parse_type();
          return;
        }
        if (t.is_op("[")) {
          next();
          if (at_op("]")) {
            next();
          } else if (at_op("...")) {
            next();
            expect_op("]");
          } else {
            auto saved = no_composite_;
            no_composite_ = 0;
            parse_expr();
            no_composite_ = saved;
            expect_op("]");
          }
          parse_type();
          return;
        }
        if (t.is_op("(")) {
          next();
          parse_type();
          expect_op(")");
          return;
        }
        if (t.is_op("<-")) {
          t.flags |= flag_unary;
          next();
          if (!tok().is_keyword("chan"))
            fail(tok(), "expected 'chan', found " + describe(tok()));
          next();
          parse_type();
          return;
        }
        if (t.kind == token_kind::keyword) {
          if (t.text == "map") {
            next();
            expect_op("[");
            parse_type();
            expect_op("]");
            parse_type();
            return;
          }
          if (t.text == "chan") {
            next();
            if (at_op("<-")) next();
            parse_type();
            return;
          }
          if (t.text == "func") {
            next();
            parse_signature();
            return;
          }
          if (t.text == "struct") {
            parse_struct_type();
            return;
          }
          if (t.text == "interface") {
            parse_interface_type();
            return;
          }
        }
        fail(t, "expected type, found " + describe(t));
      }

      void
      mark_inline_braces(token& open, token& close) {
        if (open.line == close.line) {
          open.flags |= flag_inline_brace;
          close.flags |= flag_inline_brace;
        }
      }

      void
      parse_struct_type() {
        next(); // struct
        auto& open = expect_op("{");
        while (!at_op("}")) {
          if (tok().kind == token_kind::eof) fail(tok(), "unexpected EOF in struct type");
          if (tok().kind == token_kind::semicolon) {
            next();
            continue;
          }
          bool aligned = starts_line(index());
          bool embedded = true;

          if (at_op("*")) {
            tok().flags |= flag_unary;
            next();
            parse_type_name();
          } else if (tok().kind == token_kind::identifier) {
            const auto& after = peek();
            embedded = after.is_op(".") || after.kind == token_kind::semicolon ||
                       after.is_op("}") || after.kind == token_kind::string_lit;
            if (embedded) {
              parse_type_name();
            } else {
              next();
              while (at_op(",")) {
                next();
                expect_identifier();
              }
              if (aligned) tok().flags |= flag_cell;
              parse_type();
            }
          } else {
            fail(tok(), "expected field name or embedded type, found " +
                            describe(tok()));
          }

          if (tok().kind == token_kind::string_lit) {
            if (aligned) tok().flags |= flag_cell;
            next();
          } else if (aligned && embedded) {
            // an embedded field's comment stays in the comment column
            if (auto* comment = trailing_comment()) comment->empty_cells += 1;
          }
          if (at_op("}")) break;
          expect_semi();
        }
        auto& close = expect_op("}");
        mark_inline_braces(open, close);
      }

      void
      parse_interface_type() {
        next(); // interface
        auto& open = expect_op("{");
        while (!at_op("}")) {
          if (tok().kind == token_kind::eof)
            fail(tok(), "unexpected EOF in interface type");
          if (tok().kind == token_kind::semicolon) {
            next();
            continue;
          }
          if (tok().kind == token_kind::identifier && peek().is_op("(")) {
            next();
            parse_signature();
          } else {
            parse_constraint_term();
            while (at_op("|")) {
              next();
              parse_constraint_term();
            }
          }
          if (at_op("}")) break;
          expect_semi();
        }
        auto& close = expect_op("}");
        mark_inline_braces(open, close);
      }

      void
      parse_constraint_term() {
        if (at_op("~")) {
          tok().flags |= flag_unary;
          next();
        }
        parse_type();
      }

      // -------------------------------------------------------------------
      // Statements
      // -------------------------------------------------------------------

      void
      parse_block() {
        expect_op("{");
        parse_stmt_list();
        expect_op("}");
      }

      bool
      at_clause_end() {
        return at_op("}") || tok().is_keyword("case") ||
               tok().is_keyword("default") || tok().kind == token_kind::eof;
      }

      void
      parse_stmt_list() {
        while (!at_clause_end()) {
          if (tok().kind == token_kind::semicolon) {
            next();
            continue;
          }
          parse_stmt();
          if (at_clause_end()) break;
          expect_semi();
        }
      }

      void
      parse_stmt() {
        auto& t = tok();
        if (t.kind == token_kind::keyword) {
          const auto& k = t.text;
          if (k == "const" || k == "var" || k == "type") {
            parse_gen_decl();
            return;
          }
          if (k == "go" || k == "defer") {
            auto keyword = k;
            next();
            if (is_unary_op(tok()) || !parse_primary() ||
                binary_precedence(tok()) != 0)
              fail(t, "expression in " + keyword + " must be function call");
            return;
          }
          if (k == "return") {
            next();
            if (tok().kind != token_kind::semicolon && !at_op("}")) parse_expr_list();
            return;
          }
          if (k == "break" || k == "continue") {
            next();
            if (tok().kind == token_kind::identifier) next();
            return;
          }
          if (k == "goto") {
            next();
            expect_identifier();
            return;
          }
          if (k == "fallthrough") {
            next();
            return;
          }
          if (k == "if") {
            parse_if();
            return;
          }
          if (k == "switch") {
            parse_switch();
            return;
          }
          if (k == "select") {
            parse_select();
            return;
          }
          if (k == "for") {
            parse_for();
            return;
          }
        }
        if (t.is_op("{")) {
          parse_block();
          return;
        }
        if (t.kind == token_kind::identifier && peek().is_op(":")) {
          t.flags |= flag_label;
          next();
          next();
          if (at_op("}") || tok().kind == token_kind::eof) return;
          if (tok().kind == token_kind::semicolon) return;
          parse_stmt();
          return;
        }
        parse_simple_stmt(false);
      }

      simple_stmt
      parse_simple_stmt(bool range_ok) {
        if (range_ok && tok().is_keyword("range")) {
          next();
          parse_expr();
          return simple_stmt::range_clause;
        }
        auto count = parse_expr_list();
        if (is_assign_op(tok())) {
          auto& op = tok();
          next();
          if (range_ok && tok().is_keyword("range") &&
              (op.is_op("=") || op.is_op(":="))) {
            if (count > 2) fail(op, "expected at most 2 expressions");
            next();
            parse_expr();
            return simple_stmt::range_clause;
          }
          parse_expr_list();
          return simple_stmt::statement;
        }
        if (at_op("++") || at_op("--")) {
          next();
          return simple_stmt::statement;
        }
        if (at_op("<-")) {
          next();
          parse_expr();
          return simple_stmt::statement;
        }
        return count == 1 ? simple_stmt::expression : simple_stmt::statement;
      }

      void
      expect_header_semi() {
        if (tok().kind != token_kind::semicolon || tok().has(flag_implicit))
          fail(tok(), "expected ';', found " + describe(tok()));
        tok().flags |= flag_header_semi;
        next();
      }

      bool
      at_explicit_semi() {
        return tok().kind == token_kind::semicolon && !tok().has(flag_implicit);
      }

      void
      parse_if() {
        next(); // if
        ++no_composite_;
        if (at_op("{")) fail(tok(), "missing condition in if statement");
        if (at_explicit_semi()) {
          expect_header_semi();
          if (at_op("{")) fail(tok(), "missing condition in if statement");
          parse_expr();
        } else {
          auto& first = tok();
          auto kind = parse_simple_stmt(false);
          if (at_explicit_semi()) {
            expect_header_semi();
            if (at_op("{")) fail(tok(), "missing condition in if statement");
            parse_expr();
          } else if (kind != simple_stmt::expression) {
            fail(first, "missing condition in if statement");
          }
        }
        --no_composite_;
        if (!at_op("{"))
          fail(tok(), "expected '{' after if clause, found " + describe(tok()));
        parse_block();
        if (tok().is_keyword("else")) {
          next();
          if (tok().is_keyword("if"))
            parse_if();
          else if (at_op("{"))
            parse_block();
          else
            fail(tok(), "expected if statement or block, found " + describe(tok()));
        }
      }

      void
      parse_switch_header() {
        ++no_composite_;
        if (!at_op("{")) {
          if (at_explicit_semi()) {
            expect_header_semi();
          } else {
            parse_simple_stmt(false);
            if (at_explicit_semi()) expect_header_semi();
          }
          if (!at_op("{")) parse_simple_stmt(false);
        }
        --no_composite_;
      }

      void
      parse_switch() {
        next(); // switch
        parse_switch_header();
        if (!at_op("{")) fail(tok(), "expected '{', found " + describe(tok()));
        tok().flags |= flag_switch_body;
        next();
        while (!at_op("}")) {
          if (tok().is_keyword("case")) {
            next();
            parse_expr_list();
          } else if (tok().is_keyword("default")) {
            next();
          } else if (tok().kind == token_kind::semicolon) {
            next();
            continue;
          } else {
            fail(tok(), "expected case or default or '}', found " + describe(tok()));
          }
          expect_op(":");
          parse_stmt_list();
        }
        next();
      }

      void
      parse_select() {
        next(); // select
        if (!at_op("{")) fail(tok(), "expected '{', found " + describe(tok()));
        tok().flags |= flag_switch_body;
        next();
        while (!at_op("}")) {
          if (tok().is_keyword("case")) {
            next();
            parse_simple_stmt(false);
          } else if (tok().is_keyword("default")) {
            next();
          } else if (tok().kind == token_kind::semicolon) {
            next();
            continue;
          } else {
            fail(tok(), "expected case or default or '}', found " + describe(tok()));
          }
          expect_op(":");
          parse_stmt_list();
        }
        next();
      }

      void
      parse_for() {
        next(); // for
        ++no_composite_;
        if (!at_op("{")) {
          auto& first = tok();
          auto kind = simple_stmt::statement;
          if (!at_explicit_semi()) kind = parse_simple_stmt(true);
          if (kind != simple_stmt::range_clause && at_explicit_semi()) {
            expect_header_semi();
            if (!at_explicit_semi()) parse_expr();
            expect_header_semi();
            if (!at_op("{")) parse_simple_stmt(false);
          } else if (kind == simple_stmt::statement) {
            fail(first, "expected for loop condition");
          }
        }
        --no_composite_;
        if (!at_op("{"))
          fail(tok(), "expected '{' after for clause, found " + describe(tok()));
        parse_block();
      }

      // -------------------------------------------------------------------
      // Expressions
      // -------------------------------------------------------------------

      std::size_t
      parse_expr_list() {
        std::size_t count = 1;
        parse_expr();
        while (at_op(",")) {
          next();
          parse_expr();
          ++count;
        }
        return count;
      }

      void
      parse_expr() {
        parse_binary(1);
      }

      void
      parse_binary(int min_prec) {
        parse_unary();
        for (;;) {
          int prec = binary_precedence(tok());
          if (prec < min_prec || prec == 0) return;
          next();
          parse_binary(prec + 1);
        }
      }

      void
      parse_unary() {
        if (is_unary_op(tok())) {
          tok().flags |= flag_unary;
          next();
          parse_unary();
          return;
        }
        parse_primary();
      }

      // Returns true when the expression ends in a call.
      bool
      parse_primary() {
        auto cls = parse_operand();
        bool call = false;
        for (;;) {
          if (at_op(".")) {
            call = false;
            next();
            if (tok().kind == token_kind::identifier) {
              next();
              if (cls != operand_class::type_name) cls = operand_class::other;
            } else if (at_op("(")) {
              next();
              if (tok().is_keyword("type"))
                next();
              else
                parse_type();
              expect_op(")");
              cls = operand_class::other;
            } else {
              fail(tok(), "expected selector or type assertion, found " +
                              describe(tok()));
            }
          } else if (at_op("[")) {
            call = false;
            parse_index_or_slice();
            if (cls != operand_class::type_name) cls = operand_class::other;
          } else if (at_op("(")) {
            call = true;
            parse_call();
            cls = operand_class::other;
          } else if (at_op("{") && cls != operand_class::other &&
                     (no_composite_ == 0 || cls == operand_class::explicit_type)) {
            call = false;
            parse_composite();
            cls = operand_class::other;
          } else {
            return call;
          }
        }
      }

      void
      parse_index_or_slice() {
        tok().flags |= flag_index;
        next();
        auto saved = no_composite_;
        no_composite_ = 0;
        bool present[3] = {false, false, false};
        if (!at_op(":")) {
          parse_expr();
          present[0] = true;
        }
        int colons = 0;
        while (at_op(":")) {
          if (++colons > 2) fail(tok(), "expected ']', found ':'");
          tok().flags |= flag_slice_colon;
          next();
          if (!at_op(":") && !at_op("]")) {
            parse_expr();
            present[colons] = true;
          }
        }
        if (colons == 2) {
          if (!present[1]) fail(tok(), "middle index required in 3-index slice");
          if (!present[2]) fail(tok(), "final index required in 3-index slice");
        }
        if (colons == 0) {
          while (at_op(",")) {
            next();
            parse_type();
          }
        }
        no_composite_ = saved;
        expect_op("]");
      }

      void
      parse_call() {
        next(); // (
        auto saved = no_composite_;
        no_composite_ = 0;
        while (!at_op(")")) {
          parse_expr();
          if (at_op("...")) next();
          if (!at_op(",")) break;
          next();
        }
        no_composite_ = saved;
        if (!at_op(")"))
          fail(tok(), "expected ')' in argument list, found " + describe(tok()));
        next();
      }

      void
      parse_element() {
        if (at_op("{"))
          parse_composite();
        else
          parse_expr();
      }

      void
      parse_composite() {
        auto& open = tok();
        open.flags |= flag_composite;
        next();
        auto saved = no_composite_;
        no_composite_ = 0;
        while (!at_op("}")) {
          if (tok().kind == token_kind::semicolon)
            fail(tok(), "missing ',' before newline in composite literal");
          bool aligned = starts_line(index());
          parse_element();
          if (at_op(":")) {
            next();
            if (aligned) tok().flags |= flag_cell;
            parse_element();
          }
          if (at_op("}")) break;
          if (tok().kind == token_kind::semicolon)
            fail(tok(), "missing ',' before newline in composite literal");
          expect_op(",");
        }
        no_composite_ = saved;
        tok().flags |= flag_composite;
        next();
      }

      operand_class
      parse_operand() {
        auto& t = tok();
        switch (t.kind) {
        case token_kind::identifier: next(); return operand_class::type_name;
        case token_kind::int_lit:
        case token_kind::float_lit:
        case token_kind::imag_lit:
        case token_kind::rune_lit:
        case token_kind::string_lit: next(); return operand_class::other;
        default: break;
        }

        if (t.is_op("(")) {
          next();
          auto saved = no_composite_;
          no_composite_ = 0;
          parse_expr();
          no_composite_ = saved;
          expect_op(")");
          return operand_class::other;
        }
        if (t.is_keyword("func")) {
          next();
          parse_signature();
          if (at_op("{")) {
            auto saved = no_composite_;
            no_composite_ = 0;
            parse_block();
            no_composite_ = saved;
          }
          return operand_class::other;
        }
        if (t.is_op("[") || t.is_keyword("map") || t.is_keyword("struct")) {
          parse_type();
          return operand_class::explicit_type;
        }
        if (t.is_keyword("chan") || t.is_keyword("interface")) {
          parse_type();
          return operand_class::other;
        }
        fail(t, "expected operand, found " + describe(t));
      }
    };

  } // namespace

  file_syntax
  parse_file(std::vector<token>& tokens) {
    parser p(tokens);
    return p.run();
  }

} // namespace modelgen::go
