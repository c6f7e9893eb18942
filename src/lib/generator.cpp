#include <modelgen/generator.hpp>
#include <modelgen/go_format.hpp>
#include <modelgen/table_template.hpp>

namespace modelgen {

  generator::generator(output_writer& writer) : writer_(&writer) {}

  std::string
  generator::format(const text_template& tmpl,
                    const template_context& context) const {
    auto rendered = tmpl.render(main_section, value(context));
    return format_go_source(rendered);
  }

  void
  generator::generate(const std::filesystem::path& destination,
                      const text_template& tmpl,
                      const template_context& context) const {
    auto content = format(tmpl, context);
    write(destination, content);
  }

  void
  generator::write(const std::filesystem::path& destination,
                   std::string_view content) const {
    writer_->write(destination, content);
  }

} // namespace modelgen
