#pragma once

#include <string>
#include <string_view>

namespace modelgen {

  // Validates `source` as a Go source file and returns it in canonical
  // layout. Throws format_error (with line and column) if it does not parse.
  std::string
  format_go_source(std::string_view source);

} // namespace modelgen
