#pragma once

#include <modelgen/value.hpp>

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace modelgen {

  // A function callable from a template pipeline. Throws render_error (or
  // any std::exception, which the executor wraps) on bad arguments.
  using template_function = std::function<value(std::span<const value> args)>;

  using function_table = std::map<std::string, template_function, std::less<>>;

  // and, or, not, len, index, eq, ne, lt, le, gt, ge, print, println, printf
  const function_table&
  builtin_functions();

  // Go fmt.Sprintf subset: %s %d %v %q %t %f %x %%.
  std::string
  format_printf(std::string_view format, std::span<const value> args);

} // namespace modelgen
