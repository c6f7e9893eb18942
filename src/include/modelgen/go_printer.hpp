#pragma once

#include <modelgen/go_lexer.hpp>

#include <string>
#include <vector>

namespace modelgen::go {

  // Lays out parsed tokens the way gofmt does for the constructs it
  // annotates: tab indentation by bracket nesting, canonical spacing,
  // collapsed blank lines, sorted import groups and column alignment.
  // The result ends with exactly one newline.
  std::string
  print(const std::vector<token>& tokens);

} // namespace modelgen::go
