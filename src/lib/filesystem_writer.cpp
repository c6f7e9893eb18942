#include <modelgen/errors.hpp>
#include <modelgen/filesystem_writer.hpp>

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace modelgen {

  filesystem_writer::filesystem_writer(fs::path root)
      : root_(std::move(root)) {}

  void
  filesystem_writer::write(const fs::path& path, std::string_view content) {
    auto target = root_.empty() || path.is_absolute() ? path : root_ / path;

    std::error_code ec;
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path(), ec);
      if (ec) {
        throw io_error("cannot create directory " +
                       target.parent_path().string() + ": " + ec.message());
      }
    }

    auto tmp = target;
    tmp += ".tmp";
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) throw io_error("cannot open " + tmp.string() + " for writing");
      out.write(content.data(), static_cast<std::streamsize>(content.size()));
      out.close();
      if (!out) {
        fs::remove(tmp, ec);
        throw io_error("cannot write " + tmp.string());
      }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw io_error("cannot rename " + tmp.string() + " to " +
                     target.string() + ": " + ec.message());
    }
  }

} // namespace modelgen
