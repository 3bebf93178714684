#pragma once

#include <jsonsub/access_error.hpp>
#include <jsonsub/value.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace jsonsub {

// decoder<T> is the "construct T from a value" capability used by decode() and
// get_array_of(). Types opt in by providing `static T from_json(const value&)`,
// or by specializing decoder<T> when the type cannot be changed.
template <class T, class = void>
struct decoder {
  static T decode(const value& v) { return T::from_json(v); }
};

template <>
struct decoder<value> {
  static value decode(const value& v) { return v; }
};

template <>
struct decoder<bool> {
  static bool decode(const value& v) {
    if (!v.is_bool()) throw access_error::type_not_convertible("bool");
    return v.as_bool();
  }
};

template <class T>
struct decoder<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
  static T decode(const value& v) {
    if (v.is_int()) {
      const std::int64_t i = v.as_int();
      if (!fits(i)) throw access_error::type_not_convertible("int");
      return static_cast<T>(i);
    }
    if (v.is_number()) {
      // Doubles are truncated toward zero when the result is representable.
      const double t = std::trunc(v.as_double());
      const double lo = static_cast<double>(std::numeric_limits<T>::min());
      const double hi = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
      if (std::isfinite(t) && t >= lo && t < hi) return static_cast<T>(t);
    }
    throw access_error::type_not_convertible("int");
  }

private:
  static bool fits(std::int64_t i) noexcept {
    if constexpr (std::is_signed_v<T>) {
      return i >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
             i <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
    } else {
      return i >= 0 && static_cast<std::uint64_t>(i) <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    }
  }
};

template <class T>
struct decoder<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static T decode(const value& v) {
    if (!v.is_number()) throw access_error::type_not_convertible("double");
    return static_cast<T>(v.as_double());
  }
};

template <>
struct decoder<std::string> {
  static std::string decode(const value& v) {
    if (!v.is_string()) throw access_error::type_not_convertible("string");
    return v.as_string();
  }
};

namespace detail {

inline const value::array& require_array(const value& v) {
  if (!v.is_array()) throw access_error::type_not_convertible("array");
  return v.as_array();
}

inline const value::object& require_object(const value& v) {
  if (!v.is_object()) throw access_error::type_not_convertible("object");
  return v.as_object();
}

} // namespace detail

// All-or-nothing: the first element that fails aborts the whole decode.
template <class T>
struct decoder<std::vector<T>> {
  static std::vector<T> decode(const value& v) {
    const auto& a = detail::require_array(v);
    std::vector<T> out;
    out.reserve(a.size());
    for (const auto& elem : a) out.push_back(decoder<T>::decode(elem));
    return out;
  }
};

template <class T, class Compare, class Alloc>
struct decoder<std::map<std::string, T, Compare, Alloc>> {
  static std::map<std::string, T, Compare, Alloc> decode(const value& v) {
    std::map<std::string, T, Compare, Alloc> out;
    for (const auto& kv : detail::require_object(v)) out.emplace(kv.first, decoder<T>::decode(kv.second));
    return out;
  }
};

template <class T>
struct decoder<std::optional<T>> {
  static std::optional<T> decode(const value& v) {
    if (v.is_null()) return std::nullopt;
    return decoder<T>::decode(v);
  }
};

} // namespace jsonsub
