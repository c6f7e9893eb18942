#include <modelgen/go_format.hpp>
#include <modelgen/go_lexer.hpp>
#include <modelgen/go_parser.hpp>
#include <modelgen/go_printer.hpp>

#include <vector>

namespace modelgen {

  namespace {

    // Index of the first comment of the doc comment block directly above
    // `first`, or `first` itself when there is none.
    std::size_t
    doc_comment_start(const std::vector<go::token>& tokens, std::size_t first) {
      auto start = first;
      for (std::size_t i = first; i-- > 0;) {
        const auto& t = tokens[i];
        if (t.kind == go::token_kind::semicolon && t.has(go::flag_implicit))
          continue;
        if (!t.is_comment() || t.end_line + 1 != tokens[start].line) break;

        // the comment must not trail code on its own line
        bool own_line = true;
        for (std::size_t k = i; k-- > 0;) {
          const auto& before = tokens[k];
          if (before.kind == go::token_kind::semicolon && before.has(go::flag_implicit))
            continue;
          own_line = before.end_line < t.line;
          break;
        }
        if (!own_line) break;
        start = i;
      }
      return start;
    }

  } // namespace

  std::string
  format_go_source(std::string_view source) {
    auto tokens = go::tokenize(source);
    auto file = go::parse_file(tokens);

    for (std::size_t k = 0; k < file.decls.size(); ++k) {
      const auto& decl = file.decls[k];
      auto start = doc_comment_start(tokens, decl.first_token);
      bool kind_changed = k == 0 || file.decls[k - 1].kind != decl.kind;
      tokens[start].flags |= go::flag_newline;
      if (kind_changed || start != decl.first_token)
        tokens[start].flags |= go::flag_blank_before;
    }

    return go::print(tokens);
  }

} // namespace modelgen
