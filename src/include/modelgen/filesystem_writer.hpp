#pragma once

#include <modelgen/output_writer.hpp>

#include <filesystem>
#include <string_view>

namespace modelgen {

  // Writes files under a root directory. Each file is written to a sibling
  // temporary and renamed into place, so a failed write leaves no partial
  // file behind.
  class filesystem_writer : public output_writer {
  public:
    filesystem_writer() = default;
    explicit filesystem_writer(std::filesystem::path root);

    const std::filesystem::path&
    root() const {
      return root_;
    }

    void
    write(const std::filesystem::path& path, std::string_view content) override;

  private:
    std::filesystem::path root_;
  };

} // namespace modelgen
