#pragma once

#include <jsonsub/value.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace jsonsub {

namespace detail {

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; continue;
      case '\\': out += "\\\\"; continue;
      case '\b': out += "\\b"; continue;
      case '\f': out += "\\f"; continue;
      case '\n': out += "\\n"; continue;
      case '\r': out += "\\r"; continue;
      case '\t': out += "\\t"; continue;
      default: break;
    }
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc <= 0x1Fu) {
      out += "\\u00";
      out.push_back(hex[(uc >> 4) & 0xF]);
      out.push_back(hex[uc & 0xF]);
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
}

inline void dump_int64(std::string& out, std::int64_t v) {
  char buf[32];
  const auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) throw std::runtime_error("jsonsub: failed to format integer");
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

inline void dump_double(std::string& out, double d) {
  if (!std::isfinite(d)) throw std::runtime_error("jsonsub: cannot dump NaN/Inf as JSON number");
  char buf[64];
  auto r = std::to_chars(buf, buf + sizeof(buf), d);
  if (r.ec != std::errc{}) {
    r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::general,
                      std::numeric_limits<double>::max_digits10);
  }
  if (r.ec != std::errc{}) throw std::runtime_error("jsonsub: failed to format double");
  const std::string_view text(buf, static_cast<std::size_t>(r.ptr - buf));
  out += text;
  // Keep doubles recognisable as non-integers when re-parsed.
  if (text.find_first_of(".eE") == std::string_view::npos) out += ".0";
}

inline void dump_indent(std::string& out, int indent) { out.append(static_cast<std::size_t>(indent), ' '); }

inline void dump_to(std::string& out, const value& v, bool pretty, int indent) {
  switch (v.type()) {
    case value::kind::null:
      out += "null";
      return;
    case value::kind::boolean:
      out += v.as_bool() ? "true" : "false";
      return;
    case value::kind::number:
      if (v.is_int()) dump_int64(out, v.as_int());
      else dump_double(out, v.as_double());
      return;
    case value::kind::string:
      dump_escaped(out, v.as_string());
      return;
    case value::kind::array: {
      const auto& a = v.as_array();
      out.push_back('[');
      bool first = true;
      for (const auto& elem : a) {
        if (!first) out.push_back(',');
        first = false;
        if (pretty) {
          out.push_back('\n');
          dump_indent(out, indent + 2);
        }
        dump_to(out, elem, pretty, indent + 2);
      }
      if (pretty && !a.empty()) {
        out.push_back('\n');
        dump_indent(out, indent);
      }
      out.push_back(']');
      return;
    }
    case value::kind::object: {
      const auto& o = v.as_object();
      out.push_back('{');
      bool first = true;
      for (const auto& kv : o) {
        if (!first) out.push_back(',');
        first = false;
        if (pretty) {
          out.push_back('\n');
          dump_indent(out, indent + 2);
        }
        dump_escaped(out, kv.first);
        out += pretty ? ": " : ":";
        dump_to(out, kv.second, pretty, indent + 2);
      }
      if (pretty && !o.empty()) {
        out.push_back('\n');
        dump_indent(out, indent);
      }
      out.push_back('}');
      return;
    }
  }
}

} // namespace detail

inline std::string dump(const value& v, bool pretty = false) {
  std::string out;
  detail::dump_to(out, v, pretty, 0);
  return out;
}

} // namespace jsonsub
