#pragma once

#include <modelgen/xml_reader.hpp>

#include <cstddef>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>

namespace modelgen {

  // Words rendered fully upper-cased by camel_case ("ip" -> "IP"). Stored
  // upper-cased; lookups are case-insensitive.
  class acronym_set {
    std::set<std::string> words_;

  public:
    acronym_set() = default;

    acronym_set(std::initializer_list<std::string_view> words);

    static acronym_set
    defaults();

    // Reads <acronyms xmlns="http://modelgen.dev/acronyms"> with
    // <acronym word="..."/> children.
    static acronym_set
    load(xml_reader& reader);

    void
    add(std::string_view word);

    void
    merge(const acronym_set& other);

    bool
    contains(std::string_view word) const;

    const std::set<std::string>&
    words() const {
      return words_;
    }

    std::size_t
    size() const {
      return words_.size();
    }
  };

  const acronym_set&
  default_acronyms();

  std::string
  camel_case(std::string_view name,
             const acronym_set& acronyms = default_acronyms());

  std::string
  field_name(std::string_view column,
             const acronym_set& acronyms = default_acronyms());

  std::string
  struct_name(std::string_view table,
              const acronym_set& acronyms = default_acronyms());

  // ovs:"<column>", the raw column name as the struct tag value.
  std::string
  struct_tag(std::string_view column);

  std::string
  file_name(std::string_view table);

  bool
  is_go_identifier(std::string_view name);

} // namespace modelgen
