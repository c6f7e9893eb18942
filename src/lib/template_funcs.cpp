#include <modelgen/errors.hpp>
#include <modelgen/template_funcs.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace modelgen {

  namespace {

    [[noreturn]] void
    fail(std::string_view fn, const std::string& message) {
      throw render_error("error calling " + std::string(fn) + ": " + message);
    }

    void
    require_args(std::string_view fn, std::span<const value> args,
                 std::size_t count) {
      if (args.size() != count) {
        fail(fn, "wrong number of args: want " + std::to_string(count) +
                     " got " + std::to_string(args.size()));
      }
    }

    bool
    is_number(const value& v) {
      return v.kind() == value_kind::integer || v.kind() == value_kind::real;
    }

    double
    as_double(const value& v) {
      if (v.kind() == value_kind::integer)
        return static_cast<double>(v.as_integer());
      return v.as_real();
    }

    bool
    basic_equal(std::string_view fn, const value& a, const value& b) {
      if (is_number(a) && is_number(b)) {
        if (a.kind() == value_kind::integer && b.kind() == value_kind::integer)
          return a.as_integer() == b.as_integer();
        return as_double(a) == as_double(b);
      }
      if (a.kind() != b.kind()) fail(fn, "incompatible types for comparison");
      switch (a.kind()) {
      case value_kind::nil: return true;
      case value_kind::boolean: return a.as_bool() == b.as_bool();
      case value_kind::string: return a.as_string() == b.as_string();
      default: fail(fn, "non-comparable type " + std::string(kind_name(a.kind())));
      }
    }

    // <0, 0, >0
    int
    basic_compare(std::string_view fn, const value& a, const value& b) {
      if (is_number(a) && is_number(b)) {
        if (a.kind() == value_kind::integer && b.kind() == value_kind::integer) {
          auto x = a.as_integer(), y = b.as_integer();
          return x < y ? -1 : (x > y ? 1 : 0);
        }
        auto x = as_double(a), y = as_double(b);
        return x < y ? -1 : (x > y ? 1 : 0);
      }
      if (a.kind() == value_kind::string && b.kind() == value_kind::string)
        return a.as_string().compare(b.as_string());
      fail(fn, "incompatible types for comparison");
    }

    value
    index_one(const value& item, const value& key) {
      if (item.is_list()) {
        if (key.kind() != value_kind::integer)
          fail("index", "cannot index list with " +
                            std::string(kind_name(key.kind())));
        auto i = key.as_integer();
        const auto& list = item.as_list();
        if (i < 0 || static_cast<std::size_t>(i) >= list.size())
          fail("index", "index out of range: " + std::to_string(i));
        return list[static_cast<std::size_t>(i)];
      }
      if (item.is_map()) {
        if (!key.is_string())
          fail("index", "map key must be a string, got " +
                            std::string(kind_name(key.kind())));
        const auto* found = item.as_map().find(key.as_string());
        if (found == nullptr)
          fail("index", "map has no entry for key \"" + key.as_string() + "\"");
        return *found;
      }
      if (item.is_string()) {
        if (key.kind() != value_kind::integer)
          fail("index", "cannot index string with " +
                            std::string(kind_name(key.kind())));
        auto i = key.as_integer();
        const auto& s = item.as_string();
        if (i < 0 || static_cast<std::size_t>(i) >= s.size())
          fail("index", "index out of range: " + std::to_string(i));
        return static_cast<std::int64_t>(
            static_cast<unsigned char>(s[static_cast<std::size_t>(i)]));
      }
      fail("index", "can't index item of type " +
                        std::string(kind_name(item.kind())));
    }

    std::string
    quote(std::string_view s) {
      static const char hex[] = "0123456789abcdef";
      std::string out = "\"";
      for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:
          if (c < 0x20 || c == 0x7f) {
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0xf];
          } else {
            out += ch;
          }
        }
      }
      out += '"';
      return out;
    }

    struct verb_spec {
      bool left = false;
      bool zero = false;
      bool plus = false;
      std::size_t width = 0;
      int precision = -1;
    };

    std::string
    pad(std::string s, const verb_spec& spec) {
      if (s.size() >= spec.width) return s;
      auto fill = spec.width - s.size();
      if (spec.left) return s + std::string(fill, ' ');
      if (spec.zero) {
        auto sign = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1u : 0u;
        return s.substr(0, sign) + std::string(fill, '0') + s.substr(sign);
      }
      return std::string(fill, ' ') + s;
    }

    std::string
    bad_verb(char verb, const value& arg) {
      return std::string("%!") + verb + "(" + std::string(kind_name(arg.kind())) +
             "=" + to_display_string(arg) + ")";
    }

    std::string
    format_verb(char verb, const verb_spec& spec, const value& arg) {
      switch (verb) {
      case 'v':
      case 's': {
        auto s = to_display_string(arg);
        if (spec.precision >= 0 &&
            static_cast<std::size_t>(spec.precision) < s.size())
          s.resize(static_cast<std::size_t>(spec.precision));
        return pad(std::move(s), spec);
      }
      case 'q':
        if (!arg.is_string()) return bad_verb(verb, arg);
        return pad(quote(arg.as_string()), spec);
      case 't':
        if (arg.kind() != value_kind::boolean) return bad_verb(verb, arg);
        return pad(arg.as_bool() ? "true" : "false", spec);
      case 'd': {
        if (arg.kind() != value_kind::integer) return bad_verb(verb, arg);
        auto s = std::to_string(arg.as_integer());
        if (spec.plus && arg.as_integer() >= 0) s.insert(s.begin(), '+');
        return pad(std::move(s), spec);
      }
      case 'f': {
        if (!is_number(arg)) return bad_verb(verb, arg);
        int precision = spec.precision >= 0 ? spec.precision : 6;
        const char* fmt = spec.plus ? "%+.*f" : "%.*f";
        auto n = std::snprintf(nullptr, 0, fmt, precision, as_double(arg));
        if (n < 0) return bad_verb(verb, arg);
        std::string s(static_cast<std::size_t>(n) + 1, '\0');
        std::snprintf(s.data(), s.size(), fmt, precision, as_double(arg));
        s.resize(static_cast<std::size_t>(n));
        return pad(std::move(s), spec);
      }
      case 'x': {
        static const char hex[] = "0123456789abcdef";
        std::string s;
        if (arg.kind() == value_kind::integer) {
          auto n = arg.as_integer();
          bool negative = n < 0;
          auto u = negative ? -static_cast<std::uint64_t>(n)
                            : static_cast<std::uint64_t>(n);
          do {
            s.insert(s.begin(), hex[u & 0xf]);
            u >>= 4;
          } while (u != 0);
          if (negative) s.insert(s.begin(), '-');
        } else if (arg.is_string()) {
          for (char ch : arg.as_string()) {
            auto c = static_cast<unsigned char>(ch);
            s += hex[c >> 4];
            s += hex[c & 0xf];
          }
        } else {
          return bad_verb(verb, arg);
        }
        return pad(std::move(s), spec);
      }
      default: return std::string("%!") + verb + "(" + to_display_string(arg) + ")";
      }
    }

    // fmt.Sprint: a space is added between operands when neither is a
    // string.
    std::string
    sprint(std::span<const value> args) {
      std::string out;
      for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0 && !args[i - 1].is_string() && !args[i].is_string())
          out += ' ';
        out += to_display_string(args[i]);
      }
      return out;
    }

    function_table
    make_builtins() {
      function_table fns;

      fns["and"] = [](std::span<const value> args) -> value {
        if (args.empty()) fail("and", "wrong number of args");
        for (const auto& a : args)
          if (!truthy(a)) return a;
        return args.back();
      };

      fns["or"] = [](std::span<const value> args) -> value {
        if (args.empty()) fail("or", "wrong number of args");
        for (const auto& a : args)
          if (truthy(a)) return a;
        return args.back();
      };

      fns["not"] = [](std::span<const value> args) -> value {
        require_args("not", args, 1);
        return !truthy(args[0]);
      };

      fns["len"] = [](std::span<const value> args) -> value {
        require_args("len", args, 1);
        const auto& v = args[0];
        switch (v.kind()) {
        case value_kind::string: return v.as_string().size();
        case value_kind::list: return v.as_list().size();
        case value_kind::map: return v.as_map().size();
        default: fail("len", "len of type " + std::string(kind_name(v.kind())));
        }
      };

      fns["index"] = [](std::span<const value> args) -> value {
        if (args.empty()) fail("index", "wrong number of args");
        value item = args[0];
        for (std::size_t i = 1; i < args.size(); ++i)
          item = index_one(item, args[i]);
        return item;
      };

      fns["eq"] = [](std::span<const value> args) -> value {
        if (args.size() < 2) fail("eq", "missing argument for comparison");
        for (std::size_t i = 1; i < args.size(); ++i)
          if (basic_equal("eq", args[0], args[i])) return true;
        return false;
      };

      fns["ne"] = [](std::span<const value> args) -> value {
        require_args("ne", args, 2);
        return !basic_equal("ne", args[0], args[1]);
      };

      fns["lt"] = [](std::span<const value> args) -> value {
        require_args("lt", args, 2);
        return basic_compare("lt", args[0], args[1]) < 0;
      };

      fns["le"] = [](std::span<const value> args) -> value {
        require_args("le", args, 2);
        return basic_compare("le", args[0], args[1]) <= 0;
      };

      fns["gt"] = [](std::span<const value> args) -> value {
        require_args("gt", args, 2);
        return basic_compare("gt", args[0], args[1]) > 0;
      };

      fns["ge"] = [](std::span<const value> args) -> value {
        require_args("ge", args, 2);
        return basic_compare("ge", args[0], args[1]) >= 0;
      };

      fns["print"] = [](std::span<const value> args) -> value {
        return sprint(args);
      };

      fns["println"] = [](std::span<const value> args) -> value {
        std::string out;
        for (std::size_t i = 0; i < args.size(); ++i) {
          if (i > 0) out += ' ';
          out += to_display_string(args[i]);
        }
        out += '\n';
        return out;
      };

      fns["printf"] = [](std::span<const value> args) -> value {
        if (args.empty() || !args[0].is_string())
          fail("printf", "format must be a string");
        return format_printf(args[0].as_string(), args.subspan(1));
      };

      return fns;
    }

  } // namespace

  const function_table&
  builtin_functions() {
    static const function_table fns = make_builtins();
    return fns;
  }

  std::string
  format_printf(std::string_view format, std::span<const value> args) {
    std::string out;
    std::size_t next = 0;

    for (std::size_t i = 0; i < format.size(); ++i) {
      char c = format[i];
      if (c != '%') {
        out += c;
        continue;
      }
      if (++i >= format.size()) {
        out += "%!(NOVERB)";
        break;
      }

      verb_spec spec;
      for (; i < format.size(); ++i) {
        if (format[i] == '-')
          spec.left = true;
        else if (format[i] == '0')
          spec.zero = true;
        else if (format[i] == '+')
          spec.plus = true;
        else
          break;
      }
      while (i < format.size() && format[i] >= '0' && format[i] <= '9')
        spec.width = spec.width * 10 + static_cast<std::size_t>(format[i++] - '0');
      if (i < format.size() && format[i] == '.') {
        spec.precision = 0;
        ++i;
        while (i < format.size() && format[i] >= '0' && format[i] <= '9')
          spec.precision = spec.precision * 10 + (format[i++] - '0');
      }
      if (i >= format.size()) {
        out += "%!(NOVERB)";
        break;
      }

      char verb = format[i];
      if (verb == '%') {
        out += '%';
        continue;
      }
      if (next >= args.size()) {
        out += std::string("%!") + verb + "(MISSING)";
        continue;
      }
      out += format_verb(verb, spec, args[next++]);
    }

    if (next < args.size()) {
      out += "%!(EXTRA ";
      for (std::size_t i = next; i < args.size(); ++i) {
        if (i > next) out += ", ";
        out += std::string(kind_name(args[i].kind())) + "=" +
               to_display_string(args[i]);
      }
      out += ')';
    }

    return out;
  }

} // namespace modelgen
