#include <modelgen/go_printer.hpp>

#include <algorithm>
#include <cstddef>

namespace modelgen::go {

  namespace {

    struct output_line {
      std::vector<std::size_t> tokens;
      bool blank_before = false;
      int indent = 0;
      std::vector<std::string> cells;
      std::vector<std::size_t> widths;
    };

    bool
    is_opener(const token& t) {
      return t.is_op("(") || t.is_op("[") || t.is_op("{");
    }

    bool
    is_closer(const token& t) {
      return t.is_op(")") || t.is_op("]") || t.is_op("}");
    }

    // A line ending in one of these continues the statement on the next
    // line.
    bool
    is_continuation(const token& t) {
      if (t.kind != token_kind::op) return false;
      return !(t.is_op(",") || t.is_op(":") || is_opener(t) || is_closer(t) ||
               t.is_op("++") || t.is_op("--"));
    }

    bool
    needs_space(const token& a, const token& b) {
      if (a.is_comment() || b.is_comment()) return true;
      if (b.kind == token_kind::semicolon) return false;
      if (a.kind == token_kind::semicolon) return true;
      if (b.is_op(",") || b.is_op(")") || b.is_op("]") || b.is_op(":"))
        return false;
      if (a.is_op(",")) return true;
      if (a.is_op(":")) return !a.has(flag_slice_colon);
      if (a.is_op("(") || a.is_op("[")) return false;
      if (a.is_op(".") || b.is_op(".")) return false;
      if (b.is_op("++") || b.is_op("--")) return false;
      if (a.has(flag_unary)) return false;
      if (b.is_op("...")) return b.has(flag_variadic);
      if (a.is_op("...")) return false;

      if (b.is_op("(")) {
        if (b.has(flag_paren_space)) return true;
        if (a.kind == token_kind::keyword) return a.text != "func";
        if (a.kind == token_kind::op) return !is_closer(a);
        return false;
      }
      if (b.is_op("[")) {
        if (b.has(flag_index)) return false;
        if (a.has(flag_type_params)) return true;
        return !(a.is_keyword("map") || a.is_op("]"));
      }
      if (b.is_op("{"))
        return !(b.has(flag_composite) || b.has(flag_inline_brace));
      if (a.is_op("{")) return !(a.has(flag_composite) || b.is_op("}"));
      if (b.is_op("}")) return !b.has(flag_composite);
      if (a.has(flag_type_params)) return true;
      if (a.is_op("]"))
        return b.kind == token_kind::op && !b.has(flag_unary);
      if (a.is_keyword("chan") && b.is_op("<-")) return false;
      return true;
    }

    std::size_t
    display_width(const std::string& s) {
      std::size_t n = 0;
      for (char c : s)
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
      return n;
    }

    class printer {
    public:
      explicit printer(const std::vector<token>& tokens) : toks_(tokens) {}

      std::string
      run() {
        split_lines();
        if (lines_.empty()) return {};
        sort_imports();
        compute_layout();
        build_cells();
        for (std::size_t i = 0; i < lines_.size();) {
          auto j = i + 1;
          while (j < lines_.size() && lines_[j].indent == lines_[i].indent &&
                 !lines_[j].blank_before)
            ++j;
          align(i, j, 0);
          i = j;
        }
        return emit();
      }

    private:
      const std::vector<token>& toks_;
      std::vector<output_line> lines_;

      const token&
      first_of(const output_line& line) const {
        return toks_[line.tokens.front()];
      }

      // Last token of the line that is not a comment, or nullptr.
      const token*
      last_code(const output_line& line) const {
        for (auto it = line.tokens.rbegin(); it != line.tokens.rend(); ++it)
          if (!toks_[*it].is_comment()) return &toks_[*it];
        return nullptr;
      }

      void
      split_lines() {
        std::size_t prev_end = 0;
        bool force_break = false;
        // open brackets: token index and the output line holding it
        std::vector<std::pair<std::size_t, std::size_t>> open;

        for (std::size_t i = 0; i < toks_.size(); ++i) {
          const auto& t = toks_[i];
          if (t.kind == token_kind::eof) break;

          if (t.kind == token_kind::semicolon && !t.has(flag_header_semi)) {
            if (t.has(flag_implicit)) continue;
            bool inline_block = !open.empty() && toks_[open.back().first].is_op("{") &&
                                open.back().second + 1 == lines_.size();
            if (!inline_block) {
              force_break = true;
              continue;
            }
          }

          bool new_line = lines_.empty() || t.line > prev_end || force_break ||
                          t.has(flag_newline);
          if (new_line) {
            output_line line;
            line.blank_before = !lines_.empty() &&
                                (t.line > prev_end + 1 || t.has(flag_blank_before));
            lines_.push_back(std::move(line));
            force_break = false;
          }
          lines_.back().tokens.push_back(i);
          prev_end = t.end_line;

          if (is_opener(t)) {
            open.emplace_back(i, lines_.size() - 1);
          } else if (is_closer(t) && !open.empty()) {
            open.pop_back();
          }
        }
      }

      const std::string&
      import_path(const output_line& line) const {
        for (auto i : line.tokens)
          if (toks_[i].kind == token_kind::string_lit) return toks_[i].text;
        return toks_[line.tokens.front()].text;
      }

      void
      sort_imports() {
        for (std::size_t i = 0; i < lines_.size();) {
          if (!first_of(lines_[i]).has(flag_import_spec)) {
            ++i;
            continue;
          }
          auto j = i + 1;
          while (j < lines_.size() && first_of(lines_[j]).has(flag_import_spec) &&
                 !lines_[j].blank_before)
            ++j;
          bool blank = lines_[i].blank_before;
          std::stable_sort(lines_.begin() + static_cast<std::ptrdiff_t>(i),
                           lines_.begin() + static_cast<std::ptrdiff_t>(j),
                           [this](const output_line& a, const output_line& b) {
                             return import_path(a) < import_path(b);
                           });
          for (auto k = i; k < j; ++k)
            lines_[k].blank_before = false;
          lines_[i].blank_before = blank;
          i = j;
        }
      }

      void
      compute_layout() {
        struct open_bracket {
          int inner;
          int opener_indent;
          bool is_switch;
        };
        std::vector<open_bracket> stack;
        const token* prev_code = nullptr;

        lines_.front().blank_before = false;
        for (std::size_t li = 0; li < lines_.size(); ++li) {
          auto& line = lines_[li];
          const auto& first = first_of(line);

          if (li > 0) {
            const auto* before = last_code(lines_[li - 1]);
            if (before != nullptr && is_opener(*before)) line.blank_before = false;
          }
          if (is_closer(first)) line.blank_before = false;

          int indent;
          if (is_closer(first) && !stack.empty()) {
            indent = stack.back().opener_indent;
          } else {
            indent = stack.empty() ? 0 : stack.back().inner;
            if ((first.is_keyword("case") || first.is_keyword("default")) &&
                !stack.empty() && stack.back().is_switch)
              indent -= 1;
            else if (first.has(flag_label))
              indent = std::max(0, indent - 1);
            else if (prev_code != nullptr && is_continuation(*prev_code))
              indent += 1;
          }
          line.indent = indent;

          for (auto i : line.tokens) {
            const auto& t = toks_[i];
            if (is_opener(t))
              stack.push_back({indent + 1, indent, t.has(flag_switch_body)});
            else if (is_closer(t) && !stack.empty())
              stack.pop_back();
          }
          if (const auto* code = last_code(line)) prev_code = code;
        }
      }

      void
      build_cells() {
        for (auto& line : lines_) {
          std::string cell;
          const token* prev = nullptr;
          for (std::size_t k = 0; k < line.tokens.size(); ++k) {
            const auto& t = toks_[line.tokens[k]];
            bool trailing_comment = t.kind == token_kind::line_comment &&
                                    k > 0 && k + 1 == line.tokens.size();
            if (prev != nullptr && (t.has(flag_cell) || trailing_comment)) {
              line.cells.push_back(std::move(cell));
              cell.clear();
              line.cells.resize(line.cells.size() + t.empty_cells);
            } else if (prev != nullptr && needs_space(*prev, t)) {
              cell += ' ';
            }
            cell += t.text;
            prev = &t;
          }
          line.cells.push_back(std::move(cell));
          line.widths.assign(line.cells.size() - 1, 0);
        }
      }

      // text/tabwriter column blocks: a block is a run of consecutive lines
      // that all have a terminated cell in `column`.
      void
      align(std::size_t line0, std::size_t line1, std::size_t column) {
        for (std::size_t cur = line0; cur < line1; ++cur) {
          if (column + 1 >= lines_[cur].cells.size()) continue;

          auto start = cur;
          std::size_t width = 0;
          bool discardable = true;
          for (; cur < line1; ++cur) {
            const auto& cells = lines_[cur].cells;
            if (column + 1 >= cells.size()) break;
            auto w = display_width(cells[column]);
            if (w > 0) discardable = false;
            width = std::max(width, w + 1);
          }
          if (discardable) width = 0;
          for (auto k = start; k < cur; ++k)
            lines_[k].widths[column] = width;
          align(start, cur, column + 1);
          if (cur == line1) break;
        }
      }

      std::string
      emit() const {
        std::string out;
        for (const auto& line : lines_) {
          if (line.blank_before) out += '\n';
          std::string text(static_cast<std::size_t>(line.indent), '\t');
          for (std::size_t c = 0; c < line.cells.size(); ++c) {
            text += line.cells[c];
            if (c + 1 < line.cells.size()) {
              auto w = display_width(line.cells[c]);
              if (line.widths[c] > w) text.append(line.widths[c] - w, ' ');
            }
          }
          while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
            text.pop_back();
          out += text;
          out += '\n';
        }
        return out;
      }
    };

  } // namespace

  std::string
  print(const std::vector<token>& tokens) {
    printer p(tokens);
    return p.run();
  }

} // namespace modelgen::go
