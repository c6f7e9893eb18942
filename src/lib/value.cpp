#include <modelgen/value.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>

namespace modelgen {

  namespace {

    // Go's %v for float64: shortest round-trip digits, exponent form when
    // the decimal exponent is < -4 or >= 21.
    std::string
    format_real(double d) {
      if (std::isnan(d)) return "NaN";
      if (std::isinf(d)) return d > 0 ? "+Inf" : "-Inf";

      char buf[64];
      auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d,
                                     std::chars_format::scientific);
      if (ec != std::errc()) return std::to_string(d);

      std::string sci(buf, end);
      auto epos = sci.find('e');
      std::string mantissa = sci.substr(0, epos);
      int exponent = std::atoi(sci.c_str() + epos + 1);

      bool negative = !mantissa.empty() && mantissa[0] == '-';
      if (negative) mantissa.erase(0, 1);
      std::string digits;
      for (char c : mantissa)
        if (c != '.') digits += c;

      std::string result = negative ? "-" : "";

      if (exponent < -4 || exponent >= 21) {
        result += digits[0];
        if (digits.size() > 1) {
          result += '.';
          result += digits.substr(1);
        }
        result += 'e';
        result += exponent < 0 ? '-' : '+';
        int magnitude = exponent < 0 ? -exponent : exponent;
        if (magnitude < 10) result += '0';
        result += std::to_string(magnitude);
        return result;
      }

      if (exponent < 0) {
        result += "0.";
        result.append(static_cast<std::size_t>(-exponent - 1), '0');
        result += digits;
        return result;
      }

      auto int_len = static_cast<std::size_t>(exponent) + 1;
      if (digits.size() <= int_len) {
        result += digits;
        result.append(int_len - digits.size(), '0');
      } else {
        result += digits.substr(0, int_len);
        result += '.';
        result += digits.substr(int_len);
      }
      return result;
    }

  } // namespace

  value_map::value_map(
      std::initializer_list<std::pair<std::string_view, value>> entries) {
    for (const auto& [k, v] : entries)
      set(k, v);
  }

  void
  value_map::set(std::string_view key, value v) {
    if (auto* existing = find(key)) {
      *existing = std::move(v);
      return;
    }
    keys_.emplace_back(key);
    values_.push_back(std::move(v));
  }

  const value*
  value_map::find(std::string_view key) const {
    for (std::size_t i = 0; i < keys_.size(); ++i)
      if (keys_[i] == key) return &values_[i];
    return nullptr;
  }

  value*
  value_map::find(std::string_view key) {
    for (std::size_t i = 0; i < keys_.size(); ++i)
      if (keys_[i] == key) return &values_[i];
    return nullptr;
  }

  bool
  value_map::contains(std::string_view key) const {
    return find(key) != nullptr;
  }

  bool
  value_map::erase(std::string_view key) {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
      if (keys_[i] == key) {
        keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(i));
        values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(i));
        return true;
      }
    }
    return false;
  }

  const value&
  value_map::at(std::size_t index) const {
    return values_.at(index);
  }

  bool
  value_map::operator==(const value_map& other) const {
    return keys_ == other.keys_ && values_ == other.values_;
  }

  std::string_view
  kind_name(value_kind kind) {
    switch (kind) {
    case value_kind::nil: return "nil";
    case value_kind::boolean: return "bool";
    case value_kind::integer: return "int";
    case value_kind::real: return "float64";
    case value_kind::string: return "string";
    case value_kind::list: return "list";
    case value_kind::map: return "map";
    }
    return "unknown";
  }

  bool
  truthy(const value& v) {
    switch (v.kind()) {
    case value_kind::nil: return false;
    case value_kind::boolean: return v.as_bool();
    case value_kind::integer: return v.as_integer() != 0;
    case value_kind::real: return v.as_real() != 0.0;
    case value_kind::string: return !v.as_string().empty();
    case value_kind::list: return !v.as_list().empty();
    case value_kind::map: return !v.as_map().empty();
    }
    return false;
  }

  std::string
  to_display_string(const value& v) {
    switch (v.kind()) {
    case value_kind::nil: return "<nil>";
    case value_kind::boolean: return v.as_bool() ? "true" : "false";
    case value_kind::integer: return std::to_string(v.as_integer());
    case value_kind::real: return format_real(v.as_real());
    case value_kind::string: return v.as_string();
    case value_kind::list: {
      std::string result = "[";
      const auto& list = v.as_list();
      for (std::size_t i = 0; i < list.size(); ++i) {
        if (i > 0) result += ' ';
        result += to_display_string(list[i]);
      }
      result += ']';
      return result;
    }
    case value_kind::map: {
      const auto& map = v.as_map();
      std::vector<std::size_t> order(map.size());
      for (std::size_t i = 0; i < order.size(); ++i)
        order[i] = i;
      std::sort(order.begin(), order.end(),
                [&map](std::size_t a, std::size_t b) {
                  return map.key(a) < map.key(b);
                });

      std::string result = "map[";
      for (std::size_t i = 0; i < order.size(); ++i) {
        if (i > 0) result += ' ';
        result += map.key(order[i]);
        result += ':';
        result += to_display_string(map.at(order[i]));
      }
      result += ']';
      return result;
    }
    }
    return {};
  }

} // namespace modelgen
