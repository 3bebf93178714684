#pragma once

#include <jsonsub/value.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace jsonsub {

// Config: floating-point parsing backend.
// Define JSONSUB_USE_FROM_CHARS_DOUBLE to 1 before including this header to parse with std::from_chars.
#ifndef JSONSUB_USE_FROM_CHARS_DOUBLE
  #define JSONSUB_USE_FROM_CHARS_DOUBLE 0
#endif

enum class error_code {
  ok = 0,
  unexpected_eof,
  invalid_value,
  invalid_number,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  nesting_too_deep
};

inline const char* error_code_name(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::invalid_value: return "invalid value";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_string: return "invalid string";
    case error_code::invalid_escape: return "invalid escape";
    case error_code::invalid_unicode_escape: return "invalid unicode escape";
    case error_code::invalid_utf16_surrogate: return "invalid utf-16 surrogate";
    case error_code::expected_colon: return "expected ':'";
    case error_code::expected_comma_or_end: return "expected ',' or closing bracket";
    case error_code::expected_key_string: return "expected string key";
    case error_code::trailing_characters: return "trailing characters";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown";
}

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

struct parse_options {
  std::size_t max_depth{256};
  bool require_eof{true};
};

struct parse_result {
  value val;
  error err;
};

class parse_failure : public std::runtime_error {
public:
  explicit parse_failure(const error& e)
      : std::runtime_error(std::string("jsonsub: parse failed: ") + error_code_name(e.code) + " at line " +
                           std::to_string(e.line) + ", column " + std::to_string(e.column)),
        err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

namespace detail {

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

inline double parse_double(std::string_view token) {
#if JSONSUB_USE_FROM_CHARS_DOUBLE && defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* last = token.data() + token.size();
    const auto r = std::from_chars(token.data(), last, v, std::chars_format::general);
    if (r.ec == std::errc{} && r.ptr == last) return v;
  }
#endif
  // strtod needs a NUL-terminated copy; number tokens are short.
  const std::string buf(token);
  return std::strtod(buf.c_str(), nullptr);
}

class reader {
public:
  reader(std::string_view text, const parse_options& opt) : s_(text), opt_(opt) {}

  parse_result run() {
    parse_result r;
    skip_ws();
    r.val = read_value(0, r.err);
    if (r.err) {
      r.val = nullptr;
      return r;
    }
    skip_ws();
    if (opt_.require_eof && i_ != s_.size()) fail(r.err, error_code::trailing_characters);
    return r;
  }

private:
  std::string_view s_;
  std::size_t i_{0};
  parse_options opt_;

  void skip_ws() noexcept {
    while (i_ < s_.size() && is_ws(s_[i_])) ++i_;
  }

  void fail(error& e, error_code code) { fail_at(e, code, i_); }

  void fail_at(error& e, error_code code, std::size_t at) {
    if (e) return;
    e.code = code;
    e.offset = at;
    e.line = 1;
    e.column = 1;
    for (std::size_t k = 0; k < at && k < s_.size(); ++k) {
      if (s_[k] == '\n') {
        ++e.line;
        e.column = 1;
      } else {
        ++e.column;
      }
    }
  }

  value read_value(std::size_t depth, error& e) {
    if (depth > opt_.max_depth) {
      fail(e, error_code::nesting_too_deep);
      return nullptr;
    }
    if (i_ >= s_.size()) {
      fail(e, error_code::unexpected_eof);
      return nullptr;
    }
    switch (s_[i_]) {
      case 'n': return read_literal("null", nullptr, e);
      case 't': return read_literal("true", value(true), e);
      case 'f': return read_literal("false", value(false), e);
      case '"': {
        std::string out;
        if (!read_string(out, e)) return nullptr;
        return value(std::move(out));
      }
      case '[': return read_array(depth + 1, e);
      case '{': return read_object(depth + 1, e);
      default: break;
    }
    if (s_[i_] == '-' || is_digit(s_[i_])) return read_number(e);
    fail(e, error_code::invalid_value);
    return nullptr;
  }

  value read_literal(std::string_view lit, value v, error& e) {
    if (s_.size() - i_ < lit.size()) {
      fail(e, error_code::unexpected_eof);
      return nullptr;
    }
    if (s_.compare(i_, lit.size(), lit) != 0) {
      fail(e, error_code::invalid_value);
      return nullptr;
    }
    i_ += lit.size();
    return v;
  }

  // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  value read_number(error& e) {
    const std::size_t start = i_;
    const std::size_t n = s_.size();
    if (s_[i_] == '-') ++i_;
    if (i_ >= n || !is_digit(s_[i_])) {
      fail_at(e, error_code::invalid_number, start);
      return nullptr;
    }
    if (s_[i_] == '0') {
      ++i_;
      if (i_ < n && is_digit(s_[i_])) {
        fail_at(e, error_code::invalid_number, start);
        return nullptr;
      }
    } else {
      while (i_ < n && is_digit(s_[i_])) ++i_;
    }

    bool integral = true;
    if (i_ < n && s_[i_] == '.') {
      integral = false;
      ++i_;
      if (i_ >= n || !is_digit(s_[i_])) {
        fail_at(e, error_code::invalid_number, start);
        return nullptr;
      }
      while (i_ < n && is_digit(s_[i_])) ++i_;
    }
    if (i_ < n && (s_[i_] == 'e' || s_[i_] == 'E')) {
      integral = false;
      ++i_;
      if (i_ < n && (s_[i_] == '+' || s_[i_] == '-')) ++i_;
      if (i_ >= n || !is_digit(s_[i_])) {
        fail_at(e, error_code::invalid_number, start);
        return nullptr;
      }
      while (i_ < n && is_digit(s_[i_])) ++i_;
    }

    const std::string_view token = s_.substr(start, i_ - start);
    if (integral) {
      std::int64_t iv = 0;
      const auto r = std::from_chars(token.data(), token.data() + token.size(), iv);
      if (r.ec == std::errc{} && r.ptr == token.data() + token.size()) return value::integer(iv);
      // Out of int64 range: stored as a double.
    }
    return value::number(parse_double(token));
  }

  bool read_hex4(std::uint32_t& cp) {
    if (s_.size() - i_ < 4) return false;
    std::uint32_t v = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const int h = hex_val(s_[i_ + k]);
      if (h < 0) return false;
      v = (v << 4) | static_cast<std::uint32_t>(h);
    }
    i_ += 4;
    cp = v;
    return true;
  }

  bool read_escape(std::string& out, std::size_t quote_pos, error& e) {
    if (i_ >= s_.size()) {
      fail_at(e, error_code::unexpected_eof, quote_pos);
      return false;
    }
    const char esc = s_[i_++];
    switch (esc) {
      case '"': out.push_back('"'); return true;
      case '\\': out.push_back('\\'); return true;
      case '/': out.push_back('/'); return true;
      case 'b': out.push_back('\b'); return true;
      case 'f': out.push_back('\f'); return true;
      case 'n': out.push_back('\n'); return true;
      case 'r': out.push_back('\r'); return true;
      case 't': out.push_back('\t'); return true;
      case 'u': break;
      default:
        fail_at(e, error_code::invalid_escape, i_ - 1);
        return false;
    }

    std::uint32_t cp = 0;
    if (!read_hex4(cp)) {
      fail(e, error_code::invalid_unicode_escape);
      return false;
    }
    if (cp >= 0xDC00u && cp <= 0xDFFFu) {
      fail(e, error_code::invalid_utf16_surrogate);
      return false;
    }
    if (cp >= 0xD800u && cp <= 0xDBFFu) {
      if (s_.size() - i_ < 2 || s_[i_] != '\\' || s_[i_ + 1] != 'u') {
        fail(e, error_code::invalid_utf16_surrogate);
        return false;
      }
      i_ += 2;
      std::uint32_t low = 0;
      if (!read_hex4(low)) {
        fail(e, error_code::invalid_unicode_escape);
        return false;
      }
      if (low < 0xDC00u || low > 0xDFFFu) {
        fail(e, error_code::invalid_utf16_surrogate);
        return false;
      }
      cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
    }
    append_utf8(out, cp);
    return true;
  }

  bool read_string(std::string& out, error& e) {
    const std::size_t quote_pos = i_;
    ++i_;
    out.clear();
    std::size_t chunk = i_;
    while (i_ < s_.size()) {
      const char c = s_[i_];
      if (c == '"') {
        out.append(s_.data() + chunk, i_ - chunk);
        ++i_;
        return true;
      }
      if (c == '\\') {
        out.append(s_.data() + chunk, i_ - chunk);
        ++i_;
        if (!read_escape(out, quote_pos, e)) return false;
        chunk = i_;
        continue;
      }
      if (static_cast<unsigned char>(c) <= 0x1Fu) {
        fail(e, error_code::invalid_string);
        return false;
      }
      ++i_;
    }
    fail_at(e, error_code::unexpected_eof, quote_pos);
    return false;
  }

  // Consumes ',' (returns true) or the closing bracket (returns false, sets done).
  bool next_member(char close, bool& done, error& e) {
    skip_ws();
    if (i_ >= s_.size()) {
      fail(e, error_code::unexpected_eof);
      return false;
    }
    const char c = s_[i_++];
    if (c == ',') return true;
    if (c == close) {
      done = true;
      return false;
    }
    fail_at(e, error_code::expected_comma_or_end, i_ - 1);
    return false;
  }

  value read_array(std::size_t depth, error& e) {
    ++i_;
    skip_ws();
    value::array a;
    if (i_ < s_.size() && s_[i_] == ']') {
      ++i_;
      return value(std::move(a));
    }
    bool done = false;
    do {
      skip_ws();
      value elem = read_value(depth, e);
      if (e) return nullptr;
      a.push_back(std::move(elem));
    } while (next_member(']', done, e));
    if (!done) return nullptr;
    return value(std::move(a));
  }

  value read_object(std::size_t depth, error& e) {
    ++i_;
    skip_ws();
    value::object o;
    if (i_ < s_.size() && s_[i_] == '}') {
      ++i_;
      return value(std::move(o));
    }
    bool done = false;
    do {
      skip_ws();
      if (i_ >= s_.size()) {
        fail(e, error_code::unexpected_eof);
        return nullptr;
      }
      if (s_[i_] != '"') {
        fail(e, error_code::expected_key_string);
        return nullptr;
      }
      std::string key;
      if (!read_string(key, e)) return nullptr;
      skip_ws();
      if (i_ >= s_.size()) {
        fail(e, error_code::unexpected_eof);
        return nullptr;
      }
      if (s_[i_] != ':') {
        fail(e, error_code::expected_colon);
        return nullptr;
      }
      ++i_;
      skip_ws();
      value v = read_value(depth, e);
      if (e) return nullptr;
      // Duplicate keys: the last occurrence wins.
      o.insert_or_assign(std::move(key), std::move(v));
    } while (next_member('}', done, e));
    if (!done) return nullptr;
    return value(std::move(o));
  }
};

} // namespace detail

inline parse_result parse(std::string_view json, parse_options opt = {}) {
  return detail::reader(json, opt).run();
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) throw parse_failure(r.err);
  return std::move(r.val);
}

} // namespace jsonsub
