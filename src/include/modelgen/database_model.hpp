#pragma once

#include <modelgen/generator.hpp>
#include <modelgen/options.hpp>
#include <modelgen/schema.hpp>
#include <modelgen/table_template.hpp>
#include <modelgen/text_template.hpp>
#include <modelgen/value.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace modelgen {

  namespace hook {
    inline constexpr std::string_view post_model_definitions = "postModelDefinitions";
  } // namespace hook

  namespace context_key {
    inline constexpr std::string_view database_name = "DatabaseName";
    inline constexpr std::string_view tables = "Tables";
  } // namespace context_key

  inline constexpr std::string_view model_file_name = "model.go";

  struct database_template {
    text_template tmpl;
    template_context context;
  };

  // Template for model.go: a FullDatabaseModel function registering one
  // model per table. Tables holds {TableName, StructName} entries sorted by
  // table name.
  database_template
  build_database_template(std::string_view package_name,
                          const database_schema& schema,
                          const acronym_set& acronyms = acronym_set::defaults());

  // Called once per table before it is rendered; may redefine hooks and add
  // context keys.
  using table_customizer =
      std::function<void(std::string_view table_name, table_template& table)>;

  struct package_options {
    std::string package_name = "ovsmodel";
    codegen_options codegen;
    table_customizer customize;
  };

  struct rendered_file {
    std::string filename;
    std::string content;
  };

  // Renders and formats every table (sorted by name) followed by model.go.
  // Any failure throws before a result is returned.
  std::vector<rendered_file>
  render_package(const database_schema& schema, const package_options& options,
                 const generator& gen);

  // Renders the whole package, then writes each file under `output_dir`.
  // Nothing is written when rendering fails.
  std::vector<rendered_file>
  generate_package(const database_schema& schema,
                   const package_options& options, const generator& gen,
                   const std::filesystem::path& output_dir);

} // namespace modelgen
