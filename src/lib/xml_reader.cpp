#include <modelgen/xml_reader.hpp>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace modelgen {

  std::ostream&
  operator<<(std::ostream& os, const xml_name& name) {
    if (name.namespace_uri.empty()) return os << name.local_name;
    return os << '{' << name.namespace_uri << '}' << name.local_name;
  }

  bool
  read_skip_whitespace(xml_reader& reader) {
    while (reader.read()) {
      if (reader.node_type() != xml_node_type::characters) return true;
      auto text = reader.text();
      bool blank = std::all_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
      if (!blank) return true;
    }
    return false;
  }

  void
  throw_config_error(const xml_reader& reader, std::string_view context,
                     std::string_view message) {
    throw std::runtime_error(std::string(context) + ": line " +
                             std::to_string(reader.line()) + ": " +
                             std::string(message));
  }

  void
  read_config_entries(xml_reader& reader, const xml_name& root,
                      const xml_name& entry, std::string_view context,
                      const std::function<void(const xml_reader&)>& visit) {
    if (!read_skip_whitespace(reader) ||
        reader.node_type() != xml_node_type::start_element ||
        reader.name() != root) {
      std::ostringstream os;
      os << context << ": expected root element " << root;
      throw std::runtime_error(os.str());
    }

    std::ostringstream unexpected;
    unexpected << "unexpected content inside <" << root.local_name << ">";

    while (read_skip_whitespace(reader)) {
      if (reader.node_type() == xml_node_type::end_element &&
          reader.name() == root)
        return;

      if (reader.node_type() != xml_node_type::start_element ||
          reader.name() != entry)
        throw_config_error(reader, context, unexpected.str());

      visit(reader);

      if (!read_skip_whitespace(reader) ||
          reader.node_type() != xml_node_type::end_element) {
        throw_config_error(reader, context,
                           "<" + entry.local_name + "> must be empty");
      }
    }
    throw std::runtime_error(std::string(context) + ": unterminated <" +
                             root.local_name + ">");
  }

} // namespace modelgen
