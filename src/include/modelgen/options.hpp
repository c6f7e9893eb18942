#pragma once

#include <modelgen/naming.hpp>
#include <modelgen/type_map.hpp>

namespace modelgen {

  // Configuration shared by every template builder.
  struct codegen_options {
    type_map types = type_map::defaults();
    acronym_set acronyms = acronym_set::defaults();
  };

} // namespace modelgen
