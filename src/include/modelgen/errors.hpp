#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace modelgen {

  class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Schema content that cannot be turned into a model: unresolvable types,
  // colliding or empty field names.
  class generation_error : public error {
  public:
    using error::error;
  };

  class unrecognized_type_error : public generation_error {
    std::string table_;
    std::string column_;
    std::string type_;

  public:
    unrecognized_type_error(std::string table, std::string column,
                            std::string type)
        : generation_error("table '" + table + "' column '" + column +
                           "': unrecognized type '" + type + "'"),
          table_(std::move(table)), column_(std::move(column)),
          type_(std::move(type)) {}

    const std::string&
    table() const {
      return table_;
    }

    const std::string&
    column() const {
      return column_;
    }

    const std::string&
    type() const {
      return type_;
    }
  };

  class duplicate_field_error : public generation_error {
  public:
    using generation_error::generation_error;
  };

  // A template section failed to parse or could not be registered.
  class template_error : public error {
  public:
    using error::error;
  };

  // Template execution failed.
  class render_error : public error {
  public:
    using error::error;
  };

  // Rendered text is not a well-formed Go source file.
  class format_error : public error {
    std::size_t line_;
    std::size_t column_;

  public:
    format_error(const std::string& message, std::size_t line,
                 std::size_t column)
        : error(std::to_string(line) + ":" + std::to_string(column) + ": " +
                message),
          line_(line), column_(column) {}

    std::size_t
    line() const {
      return line_;
    }

    std::size_t
    column() const {
      return column_;
    }
  };

  class io_error : public error {
  public:
    using error::error;
  };

  class schema_error : public error {
  public:
    using error::error;
  };

} // namespace modelgen
