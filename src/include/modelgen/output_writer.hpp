#pragma once

#include <filesystem>
#include <string_view>

namespace modelgen {

  // Persists generated files. Implementations throw io_error.
  class output_writer {
  public:
    virtual ~output_writer() = default;

    virtual void
    write(const std::filesystem::path& path, std::string_view content) = 0;
  };

} // namespace modelgen
