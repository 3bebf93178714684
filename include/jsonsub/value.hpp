#pragma once

// jsonsub: typed, path-based access into an immutable JSON value tree.
// This header holds the tree itself; parse.hpp builds one, path.hpp and
// access.hpp navigate it.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonsub {

namespace detail {

struct number {
  // Integral literals that fit int64 keep their exact value; everything else is a double.
  bool is_int{false};
  std::int64_t i{0};
  double d{0.0};
};

inline bool operator==(const number& a, const number& b) noexcept {
  if (a.is_int && b.is_int) return a.i == b.i;
  const double x = a.is_int ? static_cast<double>(a.i) : a.d;
  const double y = b.is_int ? static_cast<double>(b.i) : b.d;
  return x == y;
}

} // namespace detail

class value {
public:
  using array = std::vector<value>;
  using object = std::map<std::string, value, std::less<>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}

  // Numbers go through integer() or number(); other arithmetic types would
  // otherwise convert to bool.
  template <class T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
  value(T) = delete;

  static value integer(std::int64_t i) {
    detail::number n;
    n.is_int = true;
    n.i = i;
    value v;
    v.data_ = n;
    return v;
  }

  static value number(double d) {
    detail::number n;
    n.d = d;
    value v;
    v.data_ = n;
    return v;
  }

  value(std::string s) : data_(std::move(s)) {}
  value(std::string_view s) : data_(std::string(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::array;
      case 5: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<detail::number>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool is_int() const noexcept {
    const auto* n = std::get_if<detail::number>(&data_);
    return n != nullptr && n->is_int;
  }

  bool as_bool() const { return std::get<bool>(data_); }

  std::int64_t as_int() const {
    const auto& n = std::get<detail::number>(data_);
    if (!n.is_int) throw std::runtime_error("jsonsub: number is not int");
    return n.i;
  }

  double as_double() const {
    const auto& n = std::get<detail::number>(data_);
    return n.is_int ? static_cast<double>(n.i) : n.d;
  }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  // Element count of an array or object; 0 for scalars.
  std::size_t size() const noexcept {
    if (const auto* a = std::get_if<array>(&data_)) return a->size();
    if (const auto* o = std::get_if<object>(&data_)) return o->size();
    return 0;
  }

  const value* find(std::string_view key) const noexcept {
    const auto* o = std::get_if<object>(&data_);
    if (o == nullptr) return nullptr;
    const auto it = o->find(key);
    return it == o->end() ? nullptr : &it->second;
  }

  const value* find(std::size_t idx) const noexcept {
    const auto* a = std::get_if<array>(&data_);
    if (a == nullptr || idx >= a->size()) return nullptr;
    return &(*a)[idx];
  }

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 number, 3 string, 4 array, 5 object
  std::variant<std::monostate, bool, detail::number, std::string, array, object> data_;
};

inline const char* kind_name(value::kind k) noexcept {
  switch (k) {
    case value::kind::null: return "null";
    case value::kind::boolean: return "bool";
    case value::kind::number: return "number";
    case value::kind::string: return "string";
    case value::kind::array: return "array";
    case value::kind::object: return "object";
  }
  return "unknown";
}

} // namespace jsonsub
