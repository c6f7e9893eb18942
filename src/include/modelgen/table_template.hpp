#pragma once

#include <modelgen/options.hpp>
#include <modelgen/schema.hpp>
#include <modelgen/text_template.hpp>
#include <modelgen/value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace modelgen {

  // Extension points of the table template, empty by default.
  namespace hook {
    inline constexpr std::string_view pre_struct_definitions = "preStructDefinitions";
    inline constexpr std::string_view extra_fields = "extraFields";
    inline constexpr std::string_view post_struct_definitions = "postStructDefinitions";
  } // namespace hook

  // Name of the entry section and of the generated-file header section.
  inline constexpr std::string_view main_section = "main";
  inline constexpr std::string_view header_section = "header";

  struct table_template_options : codegen_options {
    // Overrides struct_name(table) when set.
    std::optional<std::string> struct_name;
  };

  struct table_template {
    text_template tmpl;
    template_context context;
  };

  // Builds a fresh template and data context for one table. The context
  // holds PackageName, StructName, TableName, Fields (UUID first, then by
  // field name) and Imports. Throws generation_error (or one of its
  // subclasses) when a column cannot be turned into a field.
  table_template
  build_table_template(std::string_view package_name, std::string_view table_name,
                       const table_schema& table,
                       const table_template_options& options = {});

  // Registers FieldName, StructName and Tag on `tmpl`.
  void
  add_naming_functions(text_template& tmpl, const acronym_set& acronyms);

} // namespace modelgen
