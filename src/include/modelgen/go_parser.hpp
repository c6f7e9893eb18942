#pragma once

#include <modelgen/go_lexer.hpp>

#include <cstddef>
#include <vector>

namespace modelgen::go {

  enum class decl_kind { import_decl, const_decl, var_decl, type_decl, func_decl };

  struct top_level_decl {
    decl_kind kind;
    std::size_t first_token; // index into the token vector
  };

  struct file_syntax {
    std::size_t package_token = 0;
    std::vector<top_level_decl> decls;
  };

  // Checks that `tokens` form a Go source file and sets the layout flags
  // the printer relies on. Throws format_error at the first syntax error.
  file_syntax
  parse_file(std::vector<token>& tokens);

} // namespace modelgen::go
