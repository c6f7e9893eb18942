#pragma once

#include <modelgen/output_writer.hpp>
#include <modelgen/text_template.hpp>
#include <modelgen/value.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace modelgen {

  // Renders templates into validated Go source and hands the result to an
  // output_writer. Rendering is pure: the template and context are never
  // modified, so repeated calls give identical results.
  class generator {
  public:
    explicit generator(output_writer& writer);

    // Renders the main section of `tmpl` against `context` and formats it.
    // Throws render_error or format_error.
    std::string
    format(const text_template& tmpl, const template_context& context) const;

    // Formats, then writes `destination` only if formatting succeeded.
    void
    generate(const std::filesystem::path& destination,
             const text_template& tmpl, const template_context& context) const;

    // Writes already formatted content. Throws io_error.
    void
    write(const std::filesystem::path& destination,
          std::string_view content) const;

  private:
    output_writer* writer_;
  };

} // namespace modelgen
