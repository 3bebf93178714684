#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsonsub {

enum class access_errc {
  key_not_found,
  index_out_of_bounds,
  unexpected_subscript,
  type_not_convertible
};

inline const char* access_errc_name(access_errc code) noexcept {
  switch (code) {
    case access_errc::key_not_found: return "key not found";
    case access_errc::index_out_of_bounds: return "index out of bounds";
    case access_errc::unexpected_subscript: return "unexpected subscript";
    case access_errc::type_not_convertible: return "type not convertible";
  }
  return "unknown";
}

// Failure raised while navigating a path or coercing the value found there.
// The payload depends on code():
//   key_not_found         -> key()
//   index_out_of_bounds   -> index()
//   unexpected_subscript  -> type_name() of the offending segment
//   type_not_convertible  -> type_name() the accessor expected
class access_error : public std::runtime_error {
public:
  static access_error key_not_found(std::string key) {
    std::string what = "jsonsub: key not found: \"" + key + "\"";
    return access_error(access_errc::key_not_found, std::move(key), 0, what);
  }

  static access_error index_out_of_bounds(std::int64_t index) {
    return access_error(access_errc::index_out_of_bounds, std::string(), index,
                        "jsonsub: index out of bounds: " + std::to_string(index));
  }

  static access_error unexpected_subscript(std::string segment_type) {
    std::string what = "jsonsub: unexpected subscript of type " + segment_type;
    return access_error(access_errc::unexpected_subscript, std::move(segment_type), 0, what);
  }

  static access_error type_not_convertible(std::string expected_type) {
    std::string what = "jsonsub: value is not convertible to " + expected_type;
    return access_error(access_errc::type_not_convertible, std::move(expected_type), 0, what);
  }

  access_errc code() const noexcept { return code_; }
  const std::string& key() const noexcept { return subject_; }
  const std::string& type_name() const noexcept { return subject_; }
  std::int64_t index() const noexcept { return index_; }

private:
  access_error(access_errc code, std::string subject, std::int64_t index, const std::string& what)
      : std::runtime_error(what), code_(code), subject_(std::move(subject)), index_(index) {}

  access_errc code_;
  std::string subject_;
  std::int64_t index_;
};

} // namespace jsonsub
