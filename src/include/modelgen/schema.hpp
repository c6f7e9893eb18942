#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace modelgen {

  // OVSDB atomic type tokens (RFC 7047, section 3.2).
  namespace wire_type {
    inline constexpr const char* integer = "integer";
    inline constexpr const char* real = "real";
    inline constexpr const char* boolean = "boolean";
    inline constexpr const char* string = "string";
    inline constexpr const char* uuid = "uuid";
  } // namespace wire_type

  inline constexpr std::size_t unlimited = std::numeric_limits<std::size_t>::max();

  struct base_type {
    std::string type;
    std::string ref_table;

    bool
    operator==(const base_type&) const = default;
  };

  struct column_type {
    base_type key;
    std::optional<base_type> value;
    std::size_t min = 1;
    std::size_t max = 1;

    bool
    is_map() const {
      return value.has_value();
    }

    bool
    is_atomic() const {
      return !value && min == 1 && max == 1;
    }

    bool
    is_optional() const {
      return !value && min == 0 && max == 1;
    }

    bool
    is_set() const {
      return !value && max > 1;
    }

    bool
    operator==(const column_type&) const = default;
  };

  struct column_schema {
    column_type type;

    bool
    operator==(const column_schema&) const = default;
  };

  struct table_schema {
    std::unordered_map<std::string, column_schema> columns;

    bool
    operator==(const table_schema&) const = default;
  };

  struct database_schema {
    std::string name;
    std::string version;
    std::unordered_map<std::string, table_schema> tables;

    const table_schema*
    table(const std::string& name) const {
      auto it = tables.find(name);
      if (it == tables.end()) return nullptr;
      return &it->second;
    }

    bool
    operator==(const database_schema&) const = default;
  };

  // Shorthands for building columns in code.
  inline column_schema
  atomic_column(std::string type) {
    return column_schema{column_type{base_type{std::move(type), {}}}};
  }

  inline column_schema
  optional_column(std::string type) {
    column_schema c = atomic_column(std::move(type));
    c.type.min = 0;
    return c;
  }

  inline column_schema
  set_column(std::string type, std::size_t max = unlimited) {
    column_schema c = atomic_column(std::move(type));
    c.type.min = 0;
    c.type.max = max;
    return c;
  }

  inline column_schema
  map_column(std::string key_type, std::string value_type) {
    column_schema c = atomic_column(std::move(key_type));
    c.type.value = base_type{std::move(value_type), {}};
    c.type.min = 0;
    c.type.max = unlimited;
    return c;
  }

} // namespace modelgen
