#include <modelgen/errors.hpp>
#include <modelgen/template_parser.hpp>
#include <modelgen/text_template.hpp>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <utility>

namespace modelgen {

  namespace {

    constexpr int max_template_depth = 1000;

    enum class flow { normal, break_loop, continue_loop };

    class executor {
    public:
      executor(const text_template::section_map& sections,
               const function_table& functions, std::ostream& os)
          : sections_(sections), functions_(functions), os_(os) {}

      void
      run(std::string_view section, const value& data) {
        call_section(section, data, 0);
      }

    private:
      const text_template::section_map& sections_;
      const function_table& functions_;
      std::ostream& os_;
      std::vector<std::pair<std::string, value>> vars_;
      std::string section_;
      int depth_ = 0;

      [[noreturn]] void
      fail(std::size_t line, const std::string& message) const {
        throw render_error("template: " + section_ + ":" +
                           std::to_string(line) + ": " + message);
      }

      void
      call_section(std::string_view name, const value& dot, std::size_t line) {
        auto it = sections_.find(name);
        if (it == sections_.end())
          fail(line, "no such template \"" + std::string(name) + "\"");
        if (depth_ >= max_template_depth)
          fail(line, "exceeded maximum template depth (" +
                         std::to_string(max_template_depth) + ")");

        auto saved_vars = std::move(vars_);
        auto saved_section = std::move(section_);
        vars_.clear();
        vars_.emplace_back("$", dot);
        section_ = std::string(name);
        ++depth_;

        exec_list(*it->second, dot);

        --depth_;
        section_ = std::move(saved_section);
        vars_ = std::move(saved_vars);
      }

      flow
      exec_list(const tmpl::node_list& list, const value& dot) {
        for (const auto& n : list) {
          auto f = exec_node(n, dot);
          if (f != flow::normal) return f;
        }
        return flow::normal;
      }

      flow
      exec_node(const tmpl::node& n, const value& dot) {
        const auto& data = n.data();
        if (const auto* text = std::get_if<tmpl::text_node>(&data)) {
          os_ << text->text;
          return flow::normal;
        }
        if (const auto* action = std::get_if<tmpl::action_node>(&data)) {
          auto v = eval_pipeline(action->pipe, dot, true);
          if (action->pipe.variables.empty()) print(v);
          return flow::normal;
        }
        if (const auto* cond = std::get_if<tmpl::if_node>(&data)) {
          auto mark = vars_.size();
          auto v = eval_pipeline(cond->pipe, dot, true);
          auto f = exec_list(truthy(v) ? cond->list : cond->else_list, dot);
          vars_.resize(mark);
          return f;
        }
        if (const auto* with = std::get_if<tmpl::with_node>(&data)) {
          auto mark = vars_.size();
          auto v = eval_pipeline(with->pipe, dot, true);
          auto f = truthy(v) ? exec_list(with->list, v)
                             : exec_list(with->else_list, dot);
          vars_.resize(mark);
          return f;
        }
        if (const auto* range = std::get_if<tmpl::range_node>(&data)) {
          exec_range(*range, dot, n.line());
          return flow::normal;
        }
        if (const auto* call = std::get_if<tmpl::template_call_node>(&data)) {
          value arg;
          if (call->pipe) arg = eval_pipeline(*call->pipe, dot, true);
          call_section(call->name, arg, n.line());
          return flow::normal;
        }
        if (n.holds<tmpl::break_node>()) return flow::break_loop;
        return flow::continue_loop;
      }

      void
      print(const value& v) {
        if (v.is_nil())
          os_ << "<no value>";
        else
          os_ << to_display_string(v);
      }

      void
      exec_range(const tmpl::range_node& range, const value& dot,
                 std::size_t line) {
        auto mark = vars_.size();
        auto v = eval_pipeline(range.pipe, dot, false);
        const auto& names = range.pipe.variables;
        bool iterated = false;

        // Returns false once the body breaks.
        auto visit = [&](const value& key, const value& elem) {
          iterated = true;
          vars_.resize(mark);
          if (names.size() == 1) {
            vars_.emplace_back(names[0], elem);
          } else if (names.size() == 2) {
            vars_.emplace_back(names[0], key);
            vars_.emplace_back(names[1], elem);
          }
          return exec_list(range.list, elem) != flow::break_loop;
        };

        switch (v.kind()) {
        case value_kind::nil: break;
        case value_kind::list: {
          const auto& list = v.as_list();
          for (std::size_t i = 0; i < list.size(); ++i)
            if (!visit(value(i), list[i])) break;
          break;
        }
        case value_kind::map: {
          const auto& map = v.as_map();
          std::vector<std::size_t> order(map.size());
          for (std::size_t i = 0; i < order.size(); ++i)
            order[i] = i;
          std::sort(order.begin(), order.end(),
                    [&map](std::size_t a, std::size_t b) {
                      return map.key(a) < map.key(b);
                    });
          for (auto i : order)
            if (!visit(value(map.key(i)), map.at(i))) break;
          break;
        }
        case value_kind::integer: {
          for (std::int64_t i = 0; i < v.as_integer(); ++i)
            if (!visit(value(i), value(i))) break;
          break;
        }
        default:
          fail(line, "range can't iterate over " + to_display_string(v));
        }

        vars_.resize(mark);
        if (!iterated) {
          exec_list(range.else_list, dot);
          vars_.resize(mark);
        }
      }

      value
      eval_pipeline(const tmpl::pipeline& pipe, const value& dot, bool declare) {
        value result;
        bool piped = false;
        for (const auto& cmd : pipe.commands) {
          result = eval_command(cmd, dot, piped ? &result : nullptr, pipe.line);
          piped = true;
        }

        if (pipe.is_assignment) {
          for (const auto& name : pipe.variables)
            lookup(name, pipe.line) = result;
        } else if (declare) {
          for (const auto& name : pipe.variables)
            vars_.emplace_back(name, result);
        }
        return result;
      }

      value
      eval_command(const tmpl::command& cmd, const value& dot,
                   const value* piped, std::size_t line) {
        const auto& first = cmd.operands.front();
        if (first.kind == tmpl::operand_kind::function)
          return call_function(first.name, cmd, dot, piped, line);
        if (piped != nullptr) fail(line, "can't give argument to non-function");
        return eval_operand(first, dot, line);
      }

      value
      call_function(const std::string& name, const tmpl::command& cmd,
                    const value& dot, const value* piped, std::size_t line) {
        auto it = functions_.find(name);
        if (it == functions_.end())
          fail(line, "function \"" + name + "\" not defined");

        bool is_and = name == "and";
        if (is_and || name == "or") {
          if (cmd.operands.size() < 2 && piped == nullptr)
            fail(line, "error calling " + name + ": wrong number of args");
          value last;
          auto decided = [&](const value& v) {
            return is_and ? !truthy(v) : truthy(v);
          };
          for (std::size_t i = 1; i < cmd.operands.size(); ++i) {
            last = eval_operand(cmd.operands[i], dot, line);
            if (decided(last)) return last;
          }
          if (piped != nullptr) last = *piped;
          return last;
        }

        std::vector<value> args;
        args.reserve(cmd.operands.size());
        for (std::size_t i = 1; i < cmd.operands.size(); ++i)
          args.push_back(eval_operand(cmd.operands[i], dot, line));
        if (piped != nullptr) args.push_back(*piped);

        try {
          return it->second(args);
        } catch (const std::exception& e) {
          fail(line, e.what());
        }
      }

      value
      eval_operand(const tmpl::operand& op, const value& dot, std::size_t line) {
        switch (op.kind) {
        case tmpl::operand_kind::dot: return dot;
        case tmpl::operand_kind::field: return eval_fields(dot, op.fields, line);
        case tmpl::operand_kind::variable:
          return eval_fields(lookup(op.name, line), op.fields, line);
        case tmpl::operand_kind::literal: return op.literal;
        case tmpl::operand_kind::function: {
          tmpl::command bare;
          bare.operands.push_back(op);
          return call_function(op.name, bare, dot, nullptr, line);
        }
        case tmpl::operand_kind::pipeline: {
          auto mark = vars_.size();
          auto v = eval_pipeline(*op.inner, dot, true);
          vars_.resize(mark);
          return eval_fields(v, op.fields, line);
        }
        }
        fail(line, "unknown operand");
      }

      value
      eval_fields(value v, const std::vector<std::string>& fields,
                  std::size_t line) {
        for (const auto& field : fields) {
          if (v.is_map()) {
            const auto* found = v.as_map().find(field);
            if (found == nullptr)
              fail(line, "map has no entry for key \"" + field + "\"");
            value next = *found;
            v = std::move(next);
          } else if (v.is_nil()) {
            fail(line, "nil data; no entry for key \"" + field + "\"");
          } else {
            fail(line, "can't evaluate field " + field + " in type " +
                           std::string(kind_name(v.kind())));
          }
        }
        return v;
      }

      value&
      lookup(const std::string& name, std::size_t line) {
        for (auto it = vars_.rbegin(); it != vars_.rend(); ++it)
          if (it->first == name) return it->second;
        fail(line, "undefined variable: " + name);
      }
    };

  } // namespace

  text_template::text_template(std::string name)
      : name_(std::move(name)), functions_(builtin_functions()) {}

  void
  text_template::add_function(std::string name, template_function fn) {
    functions_.insert_or_assign(std::move(name), std::move(fn));
  }

  void
  text_template::check_not_sealed(std::string_view name) const {
    if (is_sealed(name))
      throw template_error("template: cannot redefine sealed section \"" +
                           std::string(name) + "\"");
  }

  void
  text_template::install(const std::string& name, tmpl::node_list body) {
    auto it = sections_.find(name);
    if (it != sections_.end() && tmpl::is_empty_list(body) &&
        !tmpl::is_empty_list(*it->second))
      return;
    sections_.insert_or_assign(
        name, std::make_shared<const tmpl::node_list>(std::move(body)));
  }

  void
  text_template::parse(std::string_view text) {
    auto tree = parse_template(text, functions_);

    bool has_body = !tmpl::is_empty_list(tree.body);
    for (const auto& [name, body] : tree.definitions)
      check_not_sealed(name);
    if (has_body) check_not_sealed(name_);

    for (auto& [name, body] : tree.definitions)
      install(name, std::move(body));
    if (has_body)
      sections_.insert_or_assign(
          name_, std::make_shared<const tmpl::node_list>(std::move(tree.body)));
  }

  void
  text_template::define(std::string_view name, std::string_view body) {
    auto tree = parse_template(body, functions_);

    check_not_sealed(name);
    for (const auto& [def_name, def_body] : tree.definitions)
      check_not_sealed(def_name);

    for (auto& [def_name, def_body] : tree.definitions)
      install(def_name, std::move(def_body));
    sections_.insert_or_assign(
        std::string(name),
        std::make_shared<const tmpl::node_list>(std::move(tree.body)));
  }

  void
  text_template::seal(std::string_view name) {
    sealed_.emplace(name);
  }

  bool
  text_template::is_sealed(std::string_view name) const {
    return sealed_.find(name) != sealed_.end();
  }

  bool
  text_template::has_section(std::string_view name) const {
    return sections_.find(name) != sections_.end();
  }

  std::vector<std::string>
  text_template::section_names() const {
    std::vector<std::string> names;
    names.reserve(sections_.size());
    for (const auto& [name, body] : sections_)
      names.push_back(name);
    return names;
  }

  void
  text_template::execute(std::ostream& os, const value& data) const {
    execute(os, name_, data);
  }

  void
  text_template::execute(std::ostream& os, std::string_view section,
                         const value& data) const {
    executor ex(sections_, functions_, os);
    ex.run(section, data);
  }

  std::string
  text_template::render(const value& data) const {
    return render(name_, data);
  }

  std::string
  text_template::render(std::string_view section, const value& data) const {
    std::ostringstream os;
    execute(os, section, data);
    return os.str();
  }

} // namespace modelgen
