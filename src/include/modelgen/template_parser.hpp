#pragma once

#include <modelgen/template_ast.hpp>
#include <modelgen/template_funcs.hpp>

#include <string_view>

namespace modelgen {

  // Parses template text into its top-level body and its {{define}} blocks.
  // Function names are resolved against `functions`. Throws template_error
  // ("template: line N: ...") on any syntax error.
  tmpl::parse_tree
  parse_template(std::string_view text, const function_table& functions);

} // namespace modelgen
