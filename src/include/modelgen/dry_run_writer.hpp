#pragma once

#include <modelgen/output_writer.hpp>

#include <filesystem>
#include <iosfwd>
#include <string_view>

namespace modelgen {

  // Prints each file to a stream after a "// file: <path>" banner.
  class dry_run_writer : public output_writer {
  public:
    explicit dry_run_writer(std::ostream& os);

    void
    write(const std::filesystem::path& path, std::string_view content) override;

  private:
    std::ostream* os_;
  };

} // namespace modelgen
