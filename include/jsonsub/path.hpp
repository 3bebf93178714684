#pragma once

#include <jsonsub/access_error.hpp>
#include <jsonsub/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace jsonsub {

// One step of a path. A segment can key into an object, index into an array,
// or both; the default for either is to fail with unexpected_subscript, so a
// segment only overrides the half that makes sense for it.
class path_segment {
public:
  virtual ~path_segment() = default;

  virtual const value& lookup_in_object(const value::object& o) const {
    (void)o;
    throw access_error::unexpected_subscript(type_name());
  }

  virtual const value& lookup_in_array(const value::array& a) const {
    (void)a;
    throw access_error::unexpected_subscript(type_name());
  }

  // Reported by unexpected_subscript errors.
  virtual std::string type_name() const = 0;
};

// Object member lookup. The name is borrowed, not copied.
class key final : public path_segment {
public:
  explicit key(std::string_view name) noexcept : name_(name) {}

  const value& lookup_in_object(const value::object& o) const override {
    const auto it = o.find(name_);
    if (it == o.end()) throw access_error::key_not_found(std::string(name_));
    return it->second;
  }

  std::string type_name() const override { return "key"; }

  std::string_view name() const noexcept { return name_; }

private:
  std::string_view name_;
};

class index final : public path_segment {
public:
  explicit index(std::int64_t i) noexcept : i_(i) {}

  const value& lookup_in_array(const value::array& a) const override {
    if (i_ < 0 || static_cast<std::uint64_t>(i_) >= a.size()) throw access_error::index_out_of_bounds(i_);
    return a[static_cast<std::size_t>(i_)];
  }

  std::string type_name() const override { return "index"; }

  std::int64_t get() const noexcept { return i_; }

private:
  std::int64_t i_;
};

namespace detail {

// Integers index; bool and character types are neither keys nor indices.
template <class I>
inline constexpr bool is_index_type_v =
    std::is_integral_v<I> && !std::is_same_v<I, bool> && !std::is_same_v<I, char> &&
    !std::is_same_v<I, wchar_t> && !std::is_same_v<I, char16_t> && !std::is_same_v<I, char32_t>;

} // namespace detail

// What a call site passes as a path element: text becomes a key, an integer an
// index, and any path_segment is used as-is (by reference).
class segment_ref {
public:
  segment_ref(const char* k) : seg_(key(k)) {}
  segment_ref(const std::string& k) : seg_(key(k)) {}
  segment_ref(std::string_view k) : seg_(key(k)) {}

  template <class I, std::enable_if_t<detail::is_index_type_v<I>, int> = 0>
  segment_ref(I i) : seg_(index(static_cast<std::int64_t>(i))) {}

  segment_ref(const path_segment& custom) : seg_(&custom) {}

  const path_segment& get() const noexcept {
    if (const auto* custom = std::get_if<const path_segment*>(&seg_)) return **custom;
    if (const auto* k = std::get_if<key>(&seg_)) return *k;
    return *std::get_if<index>(&seg_);
  }

private:
  std::variant<key, index, const path_segment*> seg_;
};

// Outer to inner. Segments borrow their text and custom segments, so a path
// must not outlive what it was built from.
using path = std::vector<segment_ref>;

enum class subscripting_options : unsigned {
  none = 0,
  // A null met along the path, or at its end, yields no value.
  null_becomes_nil = 1u << 0,
  // A missing key or an out-of-bounds index yields no value.
  missing_key_becomes_nil = 1u << 1
};

constexpr subscripting_options operator|(subscripting_options a, subscripting_options b) noexcept {
  return static_cast<subscripting_options>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

constexpr bool contains(subscripting_options set, subscripting_options flag) noexcept {
  return flag != subscripting_options::none &&
         (static_cast<unsigned>(set) & static_cast<unsigned>(flag)) == static_cast<unsigned>(flag);
}

namespace detail {

// Result of walking a path. When null detection is on and a null is
// subscripted, `null_at` names the segment that hit it and `resolved` is
// unset. This never leaves the library: the optional accessors turn it into
// an absent result.
struct walk_result {
  const value* resolved{nullptr};
  const path_segment* null_at{nullptr};
};

inline const value& step(const value& current, const path_segment& seg) {
  switch (current.type()) {
    case value::kind::object: return seg.lookup_in_object(current.as_object());
    case value::kind::array: return seg.lookup_in_array(current.as_array());
    default: throw access_error::unexpected_subscript(seg.type_name());
  }
}

inline walk_result walk(const value& root, const path& p, bool detect_null) {
  walk_result r;
  const value* current = &root;
  for (const auto& ref : p) {
    const path_segment& seg = ref.get();
    if (detect_null && current->is_null()) {
      r.null_at = &seg;
      return r;
    }
    current = &step(*current, seg);
  }
  r.resolved = current;
  return r;
}

} // namespace detail

// Follows `p` from `root`. An empty path resolves to `root`. Throws
// access_error on the first segment that cannot be applied; a null along the
// way is an unexpected_subscript like any other scalar.
inline const value& resolve(const value& root, const path& p) {
  return *detail::walk(root, p, /*detect_null=*/false).resolved;
}

template <class... Segments>
const value& resolve(const value& root, const Segments&... segs) {
  return resolve(root, path{segment_ref(segs)...});
}

// Single step that reports any navigation failure as nullptr.
inline const value* subscript(const value& v, const segment_ref& seg) {
  try {
    return &detail::step(v, seg.get());
  } catch (const access_error&) {
    return nullptr;
  }
}

} // namespace jsonsub
