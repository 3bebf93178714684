#pragma once

// Builds jsonsub values from jsoncpp documents, so jsoncpp's reader can stand
// in for the built-in parser. Requires linking jsoncpp.

#include <jsonsub/parse.hpp>
#include <jsonsub/value.hpp>

#include <json/json.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace jsonsub {
namespace jsoncpp {

inline value from_jsoncpp(const Json::Value& j) {
  switch (j.type()) {
    case Json::nullValue: return nullptr;
    case Json::booleanValue: return value(j.asBool());
    case Json::intValue: return value::integer(static_cast<std::int64_t>(j.asLargestInt()));
    case Json::uintValue: {
      const auto u = static_cast<std::uint64_t>(j.asLargestUInt());
      if (u <= static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)())) {
        return value::integer(static_cast<std::int64_t>(u));
      }
      return value::number(static_cast<double>(u));
    }
    case Json::realValue: return value::number(j.asDouble());
    case Json::stringValue: return value(j.asString());
    case Json::arrayValue: {
      value::array a;
      a.reserve(j.size());
      for (Json::ArrayIndex k = 0; k < j.size(); ++k) a.push_back(from_jsoncpp(j[k]));
      return value(std::move(a));
    }
    case Json::objectValue: {
      value::object o;
      for (auto it = j.begin(); it != j.end(); ++it) o.insert_or_assign(it.name(), from_jsoncpp(*it));
      return value(std::move(o));
    }
  }
  return nullptr;
}

// jsoncpp does not report positions in a structured way; failures map to
// invalid_value at offset 0.
inline parse_result parse(std::string_view json, parse_options opt = {}) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = false;
  builder["failIfExtra"] = opt.require_eof;
  builder["stackLimit"] = static_cast<Json::UInt>(opt.max_depth);

  parse_result r;
  Json::Value root;
  std::string errs;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) {
    r.err.code = error_code::invalid_value;
    return r;
  }
  r.val = from_jsoncpp(root);
  return r;
}

} // namespace jsoncpp
} // namespace jsonsub
