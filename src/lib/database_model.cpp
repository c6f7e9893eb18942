#include <modelgen/database_model.hpp>
#include <modelgen/errors.hpp>
#include <modelgen/naming.hpp>

#include <algorithm>
#include <map>

namespace modelgen {

  namespace {

    const char* const model_skeleton = R"tmpl(
{{- define "header" }}// Code generated by "modelgen"
// DO NOT EDIT.
{{ end }}
{{- define "postModelDefinitions" }}{{ end }}
{{- define "main" }}{{ template "header" . }}
package {{ index . "PackageName" }}

import (
	"github.com/ovn-org/libovsdb/model"
)

// FullDatabaseModel returns the DatabaseModel object to be used in libovsdb
func FullDatabaseModel() (model.ClientDBModel, error) {
	return model.NewClientDBModel("{{ index . "DatabaseName" }}", map[string]model.Model{
{{ range index . "Tables" }}		"{{ .TableName }}": &{{ .StructName }}{},
{{ end }}	})
}
{{ template "postModelDefinitions" . }}
{{ end }}
)tmpl";

    std::vector<std::string>
    sorted_table_names(const database_schema& schema) {
      std::vector<std::string> names;
      names.reserve(schema.tables.size());
      for (const auto& [name, table] : schema.tables)
        names.push_back(name);
      std::sort(names.begin(), names.end());
      return names;
    }

    // Two tables must not share a struct or a file.
    void
    check_unique(std::map<std::string, std::string>& seen, const std::string& key,
                 const std::string& table, std::string_view what) {
      auto [it, inserted] = seen.emplace(key, table);
      if (!inserted) {
        throw generation_error("tables '" + it->second + "' and '" + table +
                               "' both map to " + std::string(what) + " '" +
                               key + "'");
      }
    }

  } // namespace

  database_template
  build_database_template(std::string_view package_name,
                          const database_schema& schema,
                          const acronym_set& acronyms) {
    value_list tables;
    for (const auto& name : sorted_table_names(schema)) {
      tables.push_back(value_map{
          {"TableName", name},
          {"StructName", struct_name(name, acronyms)},
      });
    }

    template_context context;
    context.set(context_key::package_name, std::string(package_name));
    context.set(context_key::database_name, schema.name);
    context.set(context_key::tables, std::move(tables));

    text_template tmpl{std::string(main_section)};
    add_naming_functions(tmpl, acronyms);
    tmpl.parse(model_skeleton);
    tmpl.seal(main_section);
    tmpl.seal(header_section);

    return database_template{std::move(tmpl), std::move(context)};
  }

  std::vector<rendered_file>
  render_package(const database_schema& schema, const package_options& options,
                 const generator& gen) {
    std::vector<rendered_file> files;
    std::map<std::string, std::string> structs;
    std::map<std::string, std::string> filenames;
    table_template_options table_options{options.codegen};

    for (const auto& name : sorted_table_names(schema)) {
      auto table = build_table_template(options.package_name, name,
                                        schema.tables.at(name), table_options);
      check_unique(structs, table.context.find(context_key::struct_name)->as_string(),
                   name, "struct");
      auto filename = file_name(name);
      if (filename == model_file_name) {
        throw generation_error("table '" + name + "' maps to reserved file '" +
                               filename + "'");
      }
      check_unique(filenames, filename, name, "file");

      if (options.customize) options.customize(name, table);
      files.push_back({std::move(filename), gen.format(table.tmpl, table.context)});
    }

    auto model = build_database_template(options.package_name, schema,
                                         options.codegen.acronyms);
    files.push_back({std::string(model_file_name),
                     gen.format(model.tmpl, model.context)});
    return files;
  }

  std::vector<rendered_file>
  generate_package(const database_schema& schema,
                   const package_options& options, const generator& gen,
                   const std::filesystem::path& output_dir) {
    auto files = render_package(schema, options, gen);
    for (const auto& file : files)
      gen.write(output_dir / file.filename, file.content);
    return files;
  }

} // namespace modelgen
