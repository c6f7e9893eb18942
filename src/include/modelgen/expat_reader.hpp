#pragma once

#include <modelgen/xml_reader.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace modelgen {

  class expat_reader : public xml_reader {
  public:
    // Parses the whole document up front; throws std::runtime_error with
    // the expat diagnostic when it is not well-formed.
    explicit expat_reader(std::string_view xml);

    // Throws io_error when the file cannot be read.
    static expat_reader
    from_file(const std::filesystem::path& path);

    ~expat_reader() override;

    expat_reader(const expat_reader&) = delete;
    expat_reader&
    operator=(const expat_reader&) = delete;
    expat_reader(expat_reader&&) noexcept;
    expat_reader&
    operator=(expat_reader&&) noexcept;

    bool
    read() override;

    xml_node_type
    node_type() const override;

    const xml_name&
    name() const override;

    std::string_view
    attribute(std::string_view local_name) const override;

    std::string_view
    text() const override;

    std::size_t
    depth() const override;

    std::size_t
    line() const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace modelgen
