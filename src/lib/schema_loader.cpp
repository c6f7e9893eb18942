#include <modelgen/errors.hpp>
#include <modelgen/schema_loader.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace modelgen {

  namespace {

    using json = nlohmann::json;

    // Names the column being parsed in error messages.
    struct location {
      const std::string& table;
      const std::string& column;

      [[noreturn]] void
      fail(const std::string& message) const {
        throw schema_error("table '" + table + "' column '" + column +
                           "': " + message);
      }
    };

    // <base-type>: an atomic-type string or {"type": ..., "refTable": ...}.
    // Constraints such as enum or minInteger are accepted and ignored. The
    // type token is not checked here; the type map reports unknown ones.
    base_type
    parse_base_type(const json& j, const location& loc) {
      base_type base;
      if (j.is_string()) {
        base.type = j.get<std::string>();
      } else if (j.is_object()) {
        auto it = j.find("type");
        if (it == j.end() || !it->is_string()) loc.fail("base type has no \"type\"");
        base.type = it->get<std::string>();
        auto ref = j.find("refTable");
        if (ref != j.end()) {
          if (!ref->is_string()) loc.fail("\"refTable\" must be a string");
          base.ref_table = ref->get<std::string>();
        }
      } else {
        loc.fail("base type must be a string or an object");
      }
      if (base.type.empty()) loc.fail("empty type name");
      return base;
    }

    std::size_t
    parse_bound(const json& j, const char* member, std::size_t fallback,
                const location& loc) {
      auto it = j.find(member);
      if (it == j.end()) return fallback;
      if (it->is_string() && it->get<std::string>() == "unlimited")
        return unlimited;
      if (!it->is_number_unsigned())
        loc.fail(std::string("\"") + member + "\" must be a non-negative integer");
      return it->get<std::size_t>();
    }

    column_type
    parse_column_type(const json& j, const location& loc) {
      column_type type;
      if (j.is_string()) {
        type.key = parse_base_type(j, loc);
        return type;
      }
      if (!j.is_object()) loc.fail("type must be a string or an object");

      auto key = j.find("key");
      if (key == j.end()) loc.fail("type has no \"key\"");
      type.key = parse_base_type(*key, loc);

      auto val = j.find("value");
      if (val != j.end()) type.value = parse_base_type(*val, loc);

      type.min = parse_bound(j, "min", 1, loc);
      type.max = parse_bound(j, "max", 1, loc);
      if (type.min > 1) loc.fail("\"min\" must be 0 or 1");
      if (type.max < 1) loc.fail("\"max\" must be at least 1");
      if (type.min > type.max) loc.fail("\"min\" exceeds \"max\"");
      return type;
    }

    std::string
    string_member(const json& j, const char* member) {
      auto it = j.find(member);
      if (it == j.end() || !it->is_string())
        throw schema_error(std::string("schema has no string \"") + member + "\"");
      return it->get<std::string>();
    }

  } // namespace

  database_schema
  load_schema(std::string_view json_text) {
    json doc;
    try {
      doc = json::parse(json_text.begin(), json_text.end());
    } catch (const json::parse_error& e) {
      throw schema_error(std::string("malformed schema JSON: ") + e.what());
    }
    if (!doc.is_object()) throw schema_error("schema must be a JSON object");

    database_schema schema;
    schema.name = string_member(doc, "name");
    schema.version = string_member(doc, "version");

    auto tables = doc.find("tables");
    if (tables == doc.end() || !tables->is_object())
      throw schema_error("schema has no \"tables\" object");

    for (const auto& [table_name, table_json] : tables->items()) {
      auto columns = table_json.find("columns");
      if (!table_json.is_object() || columns == table_json.end() ||
          !columns->is_object()) {
        throw schema_error("table '" + table_name + "' has no \"columns\" object");
      }

      table_schema table;
      for (const auto& [column_name, column_json] : columns->items()) {
        location loc{table_name, column_name};
        if (!column_json.is_object()) loc.fail("column must be an object");
        auto type = column_json.find("type");
        if (type == column_json.end()) loc.fail("column has no \"type\"");
        table.columns.emplace(column_name,
                              column_schema{parse_column_type(*type, loc)});
      }
      schema.tables.emplace(table_name, std::move(table));
    }
    return schema;
  }

  database_schema
  load_schema_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw io_error("cannot open file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return load_schema(ss.str());
  }

} // namespace modelgen
