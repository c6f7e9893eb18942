#include <modelgen/errors.hpp>
#include <modelgen/expat_reader.hpp>

#include <expat.h>

#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace modelgen {

  namespace {

    // Unqualified attribute, keyed by its local name.
    struct attribute_entry {
      std::string name;
      std::string value;
    };

    struct node {
      xml_node_type type;
      xml_name name;
      std::string text;
      std::vector<attribute_entry> attributes;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

    // expat reports namespaced names as "uri\nlocal".
    xml_name
    split_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) return xml_name{"", std::string(expat_name)};
      return xml_name{std::string(expat_name, sep), std::string(sep + 1)};
    }

  } // namespace

  struct expat_reader::impl {
    XML_Parser parser = nullptr;
    std::vector<node> nodes;
    std::size_t cursor = 0;
    std::size_t depth = 0;

    std::size_t
    current_line() const {
      return static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
    }

    static void XMLCALL
    start(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      ++self->depth;

      node n{xml_node_type::start_element, split_name(name), {}, {},
             self->depth, self->current_line()};
      for (const char** p = atts; *p != nullptr; p += 2) {
        // namespace-qualified attributes are not configuration
        if (std::strchr(p[0], '\n') != nullptr) continue;
        n.attributes.push_back({std::string(p[0]), std::string(p[1])});
      }
      self->nodes.push_back(std::move(n));
    }

    static void XMLCALL
    end(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);
      self->nodes.push_back(node{xml_node_type::end_element, split_name(name),
                                 {}, {}, self->depth, self->current_line()});
      --self->depth;
    }

    static void XMLCALL
    characters(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);
      auto count = static_cast<std::size_t>(len);

      if (!self->nodes.empty() &&
          self->nodes.back().type == xml_node_type::characters) {
        self->nodes.back().text.append(s, count);
        return;
      }

      node n{xml_node_type::characters, {}, std::string(s, count), {},
             self->depth, self->current_line()};
      self->nodes.push_back(std::move(n));
    }

    const node&
    current() const {
      if (cursor == 0 || cursor > nodes.size())
        throw std::logic_error("expat_reader: no current node");
      return nodes[cursor - 1];
    }
  };

  expat_reader::expat_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    impl_->parser = XML_ParserCreateNS(nullptr, '\n');
    if (impl_->parser == nullptr)
      throw std::runtime_error("expat_reader: cannot create parser");

    XML_SetUserData(impl_->parser, impl_.get());
    XML_SetElementHandler(impl_->parser, impl::start, impl::end);
    XML_SetCharacterDataHandler(impl_->parser, impl::characters);

    auto status = XML_Parse(impl_->parser, xml.data(),
                            static_cast<int>(xml.size()), XML_TRUE);

    std::string message;
    if (status == XML_STATUS_ERROR) {
      message = "XML parse error at line " +
                std::to_string(XML_GetCurrentLineNumber(impl_->parser)) + ": " +
                XML_ErrorString(XML_GetErrorCode(impl_->parser));
    }

    XML_ParserFree(impl_->parser);
    impl_->parser = nullptr;

    if (!message.empty()) throw std::runtime_error(message);
    if (impl_->nodes.empty())
      throw std::runtime_error("XML parse error: empty document");
  }

  expat_reader
  expat_reader::from_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw io_error("cannot open file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return expat_reader(ss.str());
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader&
  expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->cursor >= impl_->nodes.size()) return false;
    ++impl_->cursor;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current().type;
  }

  const xml_name&
  expat_reader::name() const {
    return impl_->current().name;
  }

  std::string_view
  expat_reader::attribute(std::string_view local_name) const {
    for (const auto& attr : impl_->current().attributes)
      if (attr.name == local_name) return attr.value;
    return {};
  }

  std::string_view
  expat_reader::text() const {
    return impl_->current().text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->current().depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->current().line;
  }

} // namespace modelgen
