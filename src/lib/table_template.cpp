#include <modelgen/errors.hpp>
#include <modelgen/naming.hpp>
#include <modelgen/table_template.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace modelgen {

  namespace {

    // The skeleton: header, package clause, imports, the three hooks
    // around a struct with one field per entry of Fields.
    const char* const table_skeleton = R"tmpl(
{{- define "header" }}// Code generated by "modelgen"
// DO NOT EDIT.
{{ end }}
{{- define "preStructDefinitions" }}{{ end }}
{{- define "extraFields" }}{{ end }}
{{- define "postStructDefinitions" }}{{ end }}
{{- define "main" }}{{ template "header" . }}
package {{ index . "PackageName" }}
{{ with index . "Imports" }}
import (
{{ range . }}	"{{ . }}"
{{ end }})
{{ end }}
{{ template "preStructDefinitions" . }}
// {{ index . "StructName" }} defines an object in {{ index . "TableName" }} table
type {{ index . "StructName" }} struct {
{{ range index . "Fields" }}	{{ .Name }} {{ .Type }} `{{ Tag .Tag }}`
{{ end }}
{{ template "extraFields" . }}
}
{{ template "postStructDefinitions" . }}
{{ end }}
)tmpl";

    struct field_spec {
      std::string name;
      std::string type;
      std::string tag;
    };

    const std::string&
    string_argument(std::string_view fn, std::span<const value> args) {
      if (args.size() != 1 || !args[0].is_string())
        throw render_error(std::string(fn) + ": expected one string argument");
      return args[0].as_string();
    }

    value
    field_value(const field_spec& f) {
      return value_map{{"Name", f.name}, {"Type", f.type}, {"Tag", f.tag}};
    }

  } // namespace

  void
  add_naming_functions(text_template& tmpl, const acronym_set& acronyms) {
    tmpl.add_function("FieldName", [acronyms](std::span<const value> args) -> value {
      return field_name(string_argument("FieldName", args), acronyms);
    });
    tmpl.add_function("StructName", [acronyms](std::span<const value> args) -> value {
      return struct_name(string_argument("StructName", args), acronyms);
    });
    tmpl.add_function("Tag", [](std::span<const value> args) -> value {
      return struct_tag(string_argument("Tag", args));
    });
  }

  table_template
  build_table_template(std::string_view package_name, std::string_view table_name,
                       const table_schema& table,
                       const table_template_options& options) {
    std::string name = options.struct_name
                           ? *options.struct_name
                           : struct_name(table_name, options.acronyms);
    if (!is_go_identifier(name)) {
      throw generation_error("table '" + std::string(table_name) +
                             "': invalid struct name '" + name + "'");
    }

    std::vector<field_spec> fields;
    std::vector<std::string> imports;
    for (const auto& [column, schema] : table.columns) {
      // folded into the identity field
      if (column == "_uuid") continue;

      auto field = field_name(column, options.acronyms);
      if (!is_go_identifier(field)) {
        throw generation_error("table '" + std::string(table_name) +
                               "' column '" + column +
                               "': cannot derive a field name");
      }
      auto resolved = field_type(options.types, table_name, column, schema);
      imports.insert(imports.end(), resolved.imports.begin(),
                     resolved.imports.end());
      fields.push_back({std::move(field), std::move(resolved.type), column});
    }

    std::sort(fields.begin(), fields.end(),
              [](const field_spec& a, const field_spec& b) {
                if (a.name != b.name) return a.name < b.name;
                return a.tag < b.tag;
              });
    for (std::size_t i = 0; i < fields.size(); ++i) {
      const auto& f = fields[i];
      std::string other;
      if (f.name == "UUID")
        other = "_uuid";
      else if (i + 1 < fields.size() && fields[i + 1].name == f.name)
        other = fields[i + 1].tag;
      if (!other.empty()) {
        throw duplicate_field_error("table '" + std::string(table_name) +
                                    "': columns '" + f.tag + "' and '" + other +
                                    "' both map to field '" + f.name + "'");
      }
    }

    std::sort(imports.begin(), imports.end());
    imports.erase(std::unique(imports.begin(), imports.end()), imports.end());

    value_list field_list;
    field_list.push_back(field_value({"UUID", "string", "_uuid"}));
    for (const auto& f : fields)
      field_list.push_back(field_value(f));

    value_list import_list(imports.begin(), imports.end());

    template_context context;
    context.set(context_key::package_name, std::string(package_name));
    context.set(context_key::struct_name, name);
    context.set(context_key::table_name, std::string(table_name));
    context.set(context_key::fields, std::move(field_list));
    context.set(context_key::imports, std::move(import_list));

    text_template tmpl{std::string(main_section)};
    add_naming_functions(tmpl, options.acronyms);
    tmpl.parse(table_skeleton);
    tmpl.seal(main_section);
    tmpl.seal(header_section);

    return table_template{std::move(tmpl), std::move(context)};
  }

} // namespace modelgen
