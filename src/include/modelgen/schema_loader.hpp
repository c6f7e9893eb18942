#pragma once

#include <modelgen/schema.hpp>

#include <filesystem>
#include <string_view>

namespace modelgen {

  // Parses an OVSDB schema document (RFC 7047, section 3.2). Throws
  // schema_error.
  database_schema
  load_schema(std::string_view json_text);

  // Throws io_error when the file cannot be read.
  database_schema
  load_schema_file(const std::filesystem::path& path);

} // namespace modelgen
