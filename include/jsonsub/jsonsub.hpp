#pragma once

// jsonsub: a small, header-only C++17 library for typed, path-based access
// into parsed JSON.
//
//   auto root = jsonsub::parse_or_throw(text);
//   std::int64_t n = jsonsub::get_int(root, "a", "b", 1);
//   auto s = jsonsub::find_string(root, jsonsub::subscripting_options::missing_key_becomes_nil, "a", "d");

#include <jsonsub/access.hpp>
#include <jsonsub/access_error.hpp>
#include <jsonsub/decode.hpp>
#include <jsonsub/dump.hpp>
#include <jsonsub/parse.hpp>
#include <jsonsub/path.hpp>
#include <jsonsub/value.hpp>
