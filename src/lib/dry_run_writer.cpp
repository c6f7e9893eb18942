#include <modelgen/dry_run_writer.hpp>
#include <modelgen/errors.hpp>

#include <ostream>

namespace modelgen {

  dry_run_writer::dry_run_writer(std::ostream& os) : os_(&os) {}

  void
  dry_run_writer::write(const std::filesystem::path& path,
                        std::string_view content) {
    *os_ << "// file: " << path.generic_string() << '\n' << content;
    if (!os_->good()) throw io_error("cannot print " + path.generic_string());
  }

} // namespace modelgen
