#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace modelgen {

  // Namespace-qualified element name. Unqualified names have an empty
  // namespace_uri.
  struct xml_name {
    std::string namespace_uri;
    std::string local_name;

    bool
    operator==(const xml_name&) const = default;
  };

  // "{uri}local", or just "local" when unqualified.
  std::ostream&
  operator<<(std::ostream& os, const xml_name& name);

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull-style reader over a parsed configuration document.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    // Advance to the next node. Returns false at end of document.
    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const xml_name&
    name() const = 0;

    // Unqualified attribute of the current element; empty when absent.
    virtual std::string_view
    attribute(std::string_view local_name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // 1-based source line of the current node.
    virtual std::size_t
    line() const = 0;
  };

  // Read past whitespace-only character data. Returns false at end of
  // document.
  bool
  read_skip_whitespace(xml_reader& reader);

  // Throws std::runtime_error "<context>: line N: <message>" located at the
  // reader's current node.
  [[noreturn]] void
  throw_config_error(const xml_reader& reader, std::string_view context,
                     std::string_view message);

  // Walks a flat configuration document: a `root` element whose children
  // are all empty `entry` elements. `visit` sees the reader positioned on
  // each entry in document order. Any other content is an error.
  void
  read_config_entries(xml_reader& reader, const xml_name& root,
                      const xml_name& entry, std::string_view context,
                      const std::function<void(const xml_reader&)>& visit);

} // namespace modelgen
