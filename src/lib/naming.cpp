#include <modelgen/go_lexer.hpp>
#include <modelgen/naming.hpp>

#include <string>
#include <vector>

namespace modelgen {

  namespace {

    const std::string acronyms_ns = "http://modelgen.dev/acronyms";

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    char
    to_upper(char c) {
      if (is_lower(c)) return static_cast<char>(c - 'a' + 'A');
      return c;
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

    std::string
    upper(std::string_view s) {
      std::string result(s);
      for (auto& c : result)
        c = to_upper(c);
      return result;
    }

    // Split on '_' and '-', dropping empty tokens.
    std::vector<std::string_view>
    split_words(std::string_view name) {
      std::vector<std::string_view> words;
      std::size_t start = 0;
      for (std::size_t i = 0; i <= name.size(); ++i) {
        if (i == name.size() || name[i] == '_' || name[i] == '-') {
          if (i > start) words.push_back(name.substr(start, i - start));
          start = i + 1;
        }
      }
      return words;
    }

    std::string
    convert_word(std::string_view word, const acronym_set& acronyms) {
      if (acronyms.contains(word)) return upper(word);

      // Plural of an acronym: "ids" -> "IDs"
      if (word.size() > 1 && word.back() == 's' &&
          acronyms.contains(word.substr(0, word.size() - 1)))
        return upper(word.substr(0, word.size() - 1)) + 's';

      std::string result(word);
      result[0] = to_upper(result[0]);
      return result;
    }

  } // namespace

  acronym_set::acronym_set(std::initializer_list<std::string_view> words) {
    for (auto w : words)
      add(w);
  }

  acronym_set
  acronym_set::defaults() {
    return acronym_set{
        "ACL",  "API",  "ASCII", "CPU",  "CSS",  "DNS", "EOF",  "GUID",
        "HTML", "HTTP", "HTTPS", "ID",   "IP",   "JSON", "LHS", "QPS",
        "RAM",  "RHS",  "RPC",   "SLA",  "SMTP", "SQL", "SSH",  "TCP",
        "TLS",  "TTL",  "UDP",   "UI",   "UID",  "UUID", "URI", "URL",
        "UTF8", "VM",   "XML",   "XMPP", "XSRF", "XSS",
    };
  }

  acronym_set
  acronym_set::load(xml_reader& reader) {
    const char* const context = "acronym_set::load";
    acronym_set result;
    read_config_entries(
        reader, xml_name{acronyms_ns, "acronyms"},
        xml_name{acronyms_ns, "acronym"},
        context, [&](const xml_reader& r) {
          auto word = r.attribute("word");
          if (!is_go_identifier(word))
            throw_config_error(r, context,
                               "invalid acronym '" + std::string(word) + "'");
          result.add(word);
        });
    return result;
  }

  void
  acronym_set::add(std::string_view word) {
    words_.insert(upper(word));
  }

  void
  acronym_set::merge(const acronym_set& other) {
    words_.insert(other.words_.begin(), other.words_.end());
  }

  bool
  acronym_set::contains(std::string_view word) const {
    return words_.count(upper(word)) != 0;
  }

  const acronym_set&
  default_acronyms() {
    static const acronym_set acronyms = acronym_set::defaults();
    return acronyms;
  }

  std::string
  camel_case(std::string_view name, const acronym_set& acronyms) {
    std::string result;
    result.reserve(name.size());
    for (auto word : split_words(name))
      result += convert_word(word, acronyms);
    return result;
  }

  std::string
  field_name(std::string_view column, const acronym_set& acronyms) {
    return camel_case(column, acronyms);
  }

  std::string
  struct_name(std::string_view table, const acronym_set& acronyms) {
    return camel_case(table, acronyms);
  }

  std::string
  struct_tag(std::string_view column) {
    std::string tag = "ovs:\"";
    tag += column;
    tag += '"';
    return tag;
  }

  std::string
  file_name(std::string_view table) {
    std::string result;
    result.reserve(table.size() + 3);
    for (char c : table)
      result += to_lower(c);
    result += ".go";
    return result;
  }

  bool
  is_go_identifier(std::string_view name) {
    if (name.empty() || is_digit(name[0]) || go::is_keyword(name))
      return false;
    for (char c : name) {
      if (!is_upper(c) && !is_lower(c) && !is_digit(c) && c != '_')
        return false;
    }
    return true;
  }

} // namespace modelgen
