#include <modelgen/errors.hpp>
#include <modelgen/type_map.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace modelgen {

  namespace {

    const std::string typemap_ns = "http://modelgen.dev/typemap";

    const std::set<std::string, std::less<>> known_wire_types = {
        wire_type::integer, wire_type::real, wire_type::boolean,
        wire_type::string,  wire_type::uuid,
    };

    const type_mapping&
    resolve(const type_map& types, std::string_view table,
            std::string_view column, const base_type& base) {
      const auto* m = types.find(base.type);
      if (m == nullptr || m->go_type.empty()) {
        throw unrecognized_type_error(std::string(table), std::string(column),
                                      base.type);
      }
      return *m;
    }

    void
    add_import(std::vector<std::string>& imports, const type_mapping& m) {
      if (m.import_path.empty()) return;
      if (std::find(imports.begin(), imports.end(), m.import_path) ==
          imports.end())
        imports.push_back(m.import_path);
    }

  } // namespace

  type_map
  type_map::defaults() {
    type_map map;
    map.set(wire_type::integer, {"int", ""});
    map.set(wire_type::real, {"float64", ""});
    map.set(wire_type::boolean, {"bool", ""});
    map.set(wire_type::string, {"string", ""});
    // Row references are carried as the opaque UUID string.
    map.set(wire_type::uuid, {"string", ""});
    return map;
  }

  type_map
  type_map::load(xml_reader& reader) {
    const char* const context = "type_map::load";
    type_map result;
    read_config_entries(
        reader, xml_name{typemap_ns, "typemap"},
        xml_name{typemap_ns, "mapping"},
        context, [&](const xml_reader& r) {
          auto wire = std::string(r.attribute("wire-type"));
          auto go_type = std::string(r.attribute("go-type"));
          if (known_wire_types.find(wire) == known_wire_types.end())
            throw_config_error(r, context, "unknown wire-type '" + wire + "'");
          if (go_type.empty()) {
            throw_config_error(r, context,
                               "mapping for '" + wire + "' has no go-type");
          }
          result.set(std::move(wire),
                     {std::move(go_type), std::string(r.attribute("go-import"))});
        });
    return result;
  }

  void
  type_map::merge(const type_map& overrides) {
    for (const auto& [wire, mapping] : overrides.entries_) {
      if (known_wire_types.find(wire) == known_wire_types.end()) {
        throw std::runtime_error(
            "type_map::merge: cannot override unknown wire-type '" + wire +
            "'");
      }
      entries_[wire] = mapping;
    }
  }

  const type_mapping*
  type_map::find(std::string_view wire_type) const {
    auto it = entries_.find(std::string(wire_type));
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  void
  type_map::set(std::string wire_type, type_mapping mapping) {
    entries_.insert_or_assign(std::move(wire_type), std::move(mapping));
  }

  std::size_t
  type_map::size() const {
    return entries_.size();
  }

  bool
  type_map::contains(std::string_view wire_type) const {
    return entries_.count(std::string(wire_type)) != 0;
  }

  std::string
  atomic_type(std::string_view wire_type) {
    static const type_map defaults = type_map::defaults();
    const auto* m = defaults.find(wire_type);
    if (m == nullptr) return {};
    return m->go_type;
  }

  resolved_type
  field_type(const type_map& types, std::string_view table,
             std::string_view column, const column_schema& schema) {
    const auto& type = schema.type;
    resolved_type result;

    const auto& key = resolve(types, table, column, type.key);
    add_import(result.imports, key);

    if (type.is_map()) {
      const auto& value = resolve(types, table, column, *type.value);
      add_import(result.imports, value);
      result.type = "map[" + key.go_type + "]" + value.go_type;
    } else if (type.is_set()) {
      result.type = "[]" + key.go_type;
    } else if (type.is_optional()) {
      result.type = "*" + key.go_type;
    } else {
      result.type = key.go_type;
    }

    std::sort(result.imports.begin(), result.imports.end());
    return result;
  }

} // namespace modelgen
