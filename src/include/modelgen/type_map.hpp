#pragma once

#include <modelgen/schema.hpp>
#include <modelgen/xml_reader.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modelgen {

  struct type_mapping {
    std::string go_type;
    std::string import_path;
  };

  // Wire type token -> Go type.
  class type_map {
    std::unordered_map<std::string, type_mapping> entries_;

  public:
    type_map() = default;

    static type_map
    defaults();

    // Reads <typemap xmlns="http://modelgen.dev/typemap"> with
    // <mapping wire-type="..." go-type="..." go-import="..."/> children.
    static type_map
    load(xml_reader& reader);

    void
    merge(const type_map& overrides);

    const type_mapping*
    find(std::string_view wire_type) const;

    void
    set(std::string wire_type, type_mapping mapping);

    std::size_t
    size() const;

    bool
    contains(std::string_view wire_type) const;
  };

  // Default mapping of an atomic wire type; "" when the token is unknown.
  std::string
  atomic_type(std::string_view wire_type);

  struct resolved_type {
    std::string type;
    std::vector<std::string> imports;
  };

  // Go type expression for a column: T, *T (optional), []T (set) or
  // map[K]V. Throws unrecognized_type_error when a token has no mapping.
  resolved_type
  field_type(const type_map& types, std::string_view table,
             std::string_view column, const column_schema& schema);

} // namespace modelgen
