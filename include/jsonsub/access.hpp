#pragma once

#include <jsonsub/access_error.hpp>
#include <jsonsub/decode.hpp>
#include <jsonsub/path.hpp>
#include <jsonsub/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace jsonsub {

// Required accessors: resolve the path, then coerce. Every navigation or
// coercion failure reaches the caller as access_error; failures thrown by a
// type's from_json() propagate unchanged.

template <class T>
T decode(const value& root, const path& p) {
  return decoder<T>::decode(resolve(root, p));
}

template <class T, class... Segments>
T decode(const value& root, const Segments&... segs) {
  return decode<T>(root, path{segment_ref(segs)...});
}

inline double get_double(const value& root, const path& p) { return decode<double>(root, p); }

template <class... Segments>
double get_double(const value& root, const Segments&... segs) {
  return decode<double>(root, path{segment_ref(segs)...});
}

inline std::int64_t get_int(const value& root, const path& p) { return decode<std::int64_t>(root, p); }

template <class... Segments>
std::int64_t get_int(const value& root, const Segments&... segs) {
  return decode<std::int64_t>(root, path{segment_ref(segs)...});
}

inline std::string get_string(const value& root, const path& p) { return decode<std::string>(root, p); }

template <class... Segments>
std::string get_string(const value& root, const Segments&... segs) {
  return decode<std::string>(root, path{segment_ref(segs)...});
}

inline bool get_bool(const value& root, const path& p) { return decode<bool>(root, p); }

template <class... Segments>
bool get_bool(const value& root, const Segments&... segs) {
  return decode<bool>(root, path{segment_ref(segs)...});
}

inline const value::array& get_array(const value& root, const path& p) {
  return detail::require_array(resolve(root, p));
}

template <class... Segments>
const value::array& get_array(const value& root, const Segments&... segs) {
  return get_array(root, path{segment_ref(segs)...});
}

template <class T>
std::vector<T> get_array_of(const value& root, const path& p) {
  return decoder<std::vector<T>>::decode(resolve(root, p));
}

template <class T, class... Segments>
std::vector<T> get_array_of(const value& root, const Segments&... segs) {
  return get_array_of<T>(root, path{segment_ref(segs)...});
}

inline const value::object& get_object(const value& root, const path& p) {
  return detail::require_object(resolve(root, p));
}

template <class... Segments>
const value::object& get_object(const value& root, const Segments&... segs) {
  return get_object(root, path{segment_ref(segs)...});
}

namespace detail {

// Shared by every optional accessor. Runs `transform` on the resolved value
// and maps the failures selected by `opts` to std::nullopt:
//   key_not_found, index_out_of_bounds  with missing_key_becomes_nil
//   a null subscripted along the path   with null_becomes_nil
//   type_not_convertible on a null      with null_becomes_nil
// Everything else is rethrown as is.
template <class Transform>
auto find_at(const value& root, subscripting_options opts, const path& p, Transform&& transform)
    -> std::optional<std::decay_t<decltype(transform(root))>> {
  const bool detect_null = contains(opts, subscripting_options::null_becomes_nil);
  const bool detect_missing = contains(opts, subscripting_options::missing_key_becomes_nil);

  const value* resolved = nullptr;
  try {
    const walk_result r = walk(root, p, detect_null);
    if (r.null_at != nullptr) return std::nullopt;
    resolved = r.resolved;
    return transform(*resolved);
  } catch (const access_error& e) {
    switch (e.code()) {
      case access_errc::key_not_found:
      case access_errc::index_out_of_bounds:
        if (detect_missing) return std::nullopt;
        break;
      case access_errc::type_not_convertible:
        if (detect_null && resolved != nullptr && resolved->is_null()) return std::nullopt;
        break;
      case access_errc::unexpected_subscript:
        break;
    }
    throw;
  }
}

} // namespace detail

// Optional accessors: same lookups as above, with `opts` choosing which
// failures mean "no value" instead of an error.

template <class T>
std::optional<T> find_decode(const value& root, subscripting_options opts, const path& p) {
  return detail::find_at(root, opts, p, [](const value& v) { return decoder<T>::decode(v); });
}

template <class T, class... Segments>
std::optional<T> find_decode(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_decode<T>(root, opts, path{segment_ref(segs)...});
}

inline std::optional<double> find_double(const value& root, subscripting_options opts, const path& p) {
  return find_decode<double>(root, opts, p);
}

template <class... Segments>
std::optional<double> find_double(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_decode<double>(root, opts, path{segment_ref(segs)...});
}

inline std::optional<std::int64_t> find_int(const value& root, subscripting_options opts, const path& p) {
  return find_decode<std::int64_t>(root, opts, p);
}

template <class... Segments>
std::optional<std::int64_t> find_int(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_decode<std::int64_t>(root, opts, path{segment_ref(segs)...});
}

inline std::optional<std::string> find_string(const value& root, subscripting_options opts, const path& p) {
  return find_decode<std::string>(root, opts, p);
}

template <class... Segments>
std::optional<std::string> find_string(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_decode<std::string>(root, opts, path{segment_ref(segs)...});
}

inline std::optional<bool> find_bool(const value& root, subscripting_options opts, const path& p) {
  return find_decode<bool>(root, opts, p);
}

template <class... Segments>
std::optional<bool> find_bool(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_decode<bool>(root, opts, path{segment_ref(segs)...});
}

// nullptr when absent; otherwise points into `root`.
inline const value::array* find_array(const value& root, subscripting_options opts, const path& p) {
  const auto found = detail::find_at(root, opts, p, [](const value& v) { return &detail::require_array(v); });
  return found ? *found : nullptr;
}

template <class... Segments>
const value::array* find_array(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_array(root, opts, path{segment_ref(segs)...});
}

template <class T>
std::optional<std::vector<T>> find_array_of(const value& root, subscripting_options opts, const path& p) {
  return find_decode<std::vector<T>>(root, opts, p);
}

template <class T, class... Segments>
std::optional<std::vector<T>> find_array_of(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_array_of<T>(root, opts, path{segment_ref(segs)...});
}

inline const value::object* find_object(const value& root, subscripting_options opts, const path& p) {
  const auto found = detail::find_at(root, opts, p, [](const value& v) { return &detail::require_object(v); });
  return found ? *found : nullptr;
}

template <class... Segments>
const value::object* find_object(const value& root, subscripting_options opts, const Segments&... segs) {
  return find_object(root, opts, path{segment_ref(segs)...});
}

} // namespace jsonsub
