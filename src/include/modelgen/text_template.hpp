#pragma once

#include <modelgen/template_ast.hpp>
#include <modelgen/template_funcs.hpp>
#include <modelgen/value.hpp>

#include <iosfwd>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace modelgen {

  // A set of named template sections sharing one function table. The
  // section named after the template is its entry point.
  //
  // Parsed sections are immutable and shared between copies, so copying a
  // template is cheap and copies can be redefined independently.
  class text_template {
  public:
    using section_map =
        std::map<std::string, std::shared_ptr<const tmpl::node_list>,
                 std::less<>>;

    explicit text_template(std::string name);

    const std::string&
    name() const {
      return name_;
    }

    // Functions must be added before the text that calls them is parsed.
    void
    add_function(std::string name, template_function fn);

    // Parses `text`, installing each {{define}} block as a section and any
    // non-blank top-level content as the entry section. A define with an
    // empty body does not replace an existing non-empty section. Nothing is
    // installed if any part fails. Throws template_error.
    void
    parse(std::string_view text);

    // Replaces section `name` with `body`. Throws template_error.
    void
    define(std::string_view name, std::string_view body);

    // Marks a section as fixed: later redefinitions throw template_error.
    void
    seal(std::string_view name);

    bool
    is_sealed(std::string_view name) const;

    bool
    has_section(std::string_view name) const;

    std::vector<std::string>
    section_names() const;

    const function_table&
    functions() const {
      return functions_;
    }

    // Executes the entry section. Throws render_error.
    void
    execute(std::ostream& os, const value& data) const;

    void
    execute(std::ostream& os, std::string_view section, const value& data) const;

    std::string
    render(const value& data) const;

    std::string
    render(std::string_view section, const value& data) const;

  private:
    std::string name_;
    section_map sections_;
    std::set<std::string, std::less<>> sealed_;
    function_table functions_;

    void
    check_not_sealed(std::string_view name) const;

    void
    install(const std::string& name, tmpl::node_list body);
  };

} // namespace modelgen
