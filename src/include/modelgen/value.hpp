#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace modelgen {

  class value;

  using value_list = std::vector<value>;

  // String-keyed map that keeps insertion order. Setting an existing key
  // replaces its value in place.
  class value_map {
    std::vector<std::string> keys_;
    std::vector<value> values_;

  public:
    value_map() = default;
    value_map(std::initializer_list<std::pair<std::string_view, value>> entries);

    void
    set(std::string_view key, value v);

    const value*
    find(std::string_view key) const;

    value*
    find(std::string_view key);

    bool
    contains(std::string_view key) const;

    bool
    erase(std::string_view key);

    std::size_t
    size() const {
      return keys_.size();
    }

    bool
    empty() const {
      return keys_.empty();
    }

    const std::string&
    key(std::size_t index) const {
      return keys_[index];
    }

    const value&
    at(std::size_t index) const;

    const std::vector<std::string>&
    keys() const {
      return keys_;
    }

    bool
    operator==(const value_map& other) const;
  };

  enum class value_kind { nil, boolean, integer, real, string, list, map };

  class value {
  public:
    using storage = std::variant<std::monostate, bool, std::int64_t, double,
                                 std::string, value_list, value_map>;

    value() = default;
    value(std::nullptr_t) {}
    value(bool b) : data_(b) {}
    value(int i) : data_(static_cast<std::int64_t>(i)) {}
    value(std::int64_t i) : data_(i) {}
    value(std::size_t i) : data_(static_cast<std::int64_t>(i)) {}
    value(double d) : data_(d) {}
    value(const char* s) : data_(std::string(s)) {}
    value(std::string_view s) : data_(std::string(s)) {}
    value(std::string s) : data_(std::move(s)) {}
    value(value_list l) : data_(std::move(l)) {}
    value(value_map m) : data_(std::move(m)) {}

    value_kind
    kind() const {
      return static_cast<value_kind>(data_.index());
    }

    bool
    is_nil() const {
      return kind() == value_kind::nil;
    }

    bool
    is_string() const {
      return kind() == value_kind::string;
    }

    bool
    is_list() const {
      return kind() == value_kind::list;
    }

    bool
    is_map() const {
      return kind() == value_kind::map;
    }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    bool
    as_bool() const {
      return std::get<bool>(data_);
    }

    std::int64_t
    as_integer() const {
      return std::get<std::int64_t>(data_);
    }

    double
    as_real() const {
      return std::get<double>(data_);
    }

    const std::string&
    as_string() const {
      return std::get<std::string>(data_);
    }

    const value_list&
    as_list() const {
      return std::get<value_list>(data_);
    }

    value_list&
    as_list() {
      return std::get<value_list>(data_);
    }

    const value_map&
    as_map() const {
      return std::get<value_map>(data_);
    }

    value_map&
    as_map() {
      return std::get<value_map>(data_);
    }

    const storage&
    data() const {
      return data_;
    }

    bool
    operator==(const value& other) const {
      return data_ == other.data_;
    }

  private:
    storage data_;
  };

  std::string_view
  kind_name(value_kind kind);

  // Template truthiness: nil, false, 0, 0.0 and empty strings, lists and maps
  // are false.
  bool
  truthy(const value& v);

  // Text form used when a value is printed by a template ("%v").
  std::string
  to_display_string(const value& v);

  // The data context handed to every template section.
  using template_context = value_map;

  // Base keys of a table template context.
  namespace context_key {
    inline constexpr std::string_view package_name = "PackageName";
    inline constexpr std::string_view struct_name = "StructName";
    inline constexpr std::string_view table_name = "TableName";
    inline constexpr std::string_view fields = "Fields";
    inline constexpr std::string_view imports = "Imports";
  } // namespace context_key

} // namespace modelgen
