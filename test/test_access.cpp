#include "test_common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace jsonsub;

namespace {

const char* const kDoc = R"({"a": {"b": [1, 2, 3], "c": null}})";

constexpr subscripting_options kNone = subscripting_options::none;
constexpr subscripting_options kNull = subscripting_options::null_becomes_nil;
constexpr subscripting_options kMissing = subscripting_options::missing_key_becomes_nil;
constexpr subscripting_options kBoth = kNull | kMissing;

struct pair_of_ints {
  std::int64_t first{0};
  std::int64_t second{0};

  // A failure thrown from here is classified like one thrown by the walk.
  static pair_of_ints from_json(const value& v) {
    pair_of_ints p;
    p.first = get_int(v, "first");
    p.second = get_int(v, "second");
    return p;
  }
};

} // namespace

static void test_basic_scenarios() {
  const value root = parse_or_throw(kDoc);

  JSONSUB_CHECK(get_int(root, "a", "b", 1) == 2);

  auto e = JSONSUB_EXPECT_ACCESS_ERROR(get_int(root, "a", "b", 5), index_out_of_bounds);
  JSONSUB_CHECK(e.index() == 5);

  JSONSUB_CHECK(!find_string(root, kMissing, "a", "d").has_value());
  JSONSUB_CHECK(!find_int(root, kNull, "a", "c").has_value());

  e = JSONSUB_EXPECT_ACCESS_ERROR(get_int(root, "a", "c"), type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "int");

  JSONSUB_CHECK(get_array(root, "a", "b").size() == 3);
}

static void test_required_family() {
  const value root =
      parse_or_throw(R"({"d": 1.5, "i": 7, "s": "str", "t": true, "arr": [1, "x"], "o": {"k": "v"}, "ints": [4, 5]})");

  JSONSUB_CHECK(get_double(root, "d") == 1.5);
  JSONSUB_CHECK(get_double(root, "i") == 7.0);
  JSONSUB_CHECK(get_int(root, "i") == 7);
  JSONSUB_CHECK(get_int(root, "d") == 1);
  JSONSUB_CHECK(get_string(root, "s") == "str");
  JSONSUB_CHECK(get_bool(root, "t"));
  JSONSUB_CHECK(&get_array(root, "arr") == &root.find("arr")->as_array());
  JSONSUB_CHECK(&get_object(root, "o") == &root.find("o")->as_object());
  JSONSUB_CHECK(get_string(root, "o", "k") == "v");
  JSONSUB_CHECK((get_array_of<int>(root, "ints") == std::vector<int>{4, 5}));
  JSONSUB_CHECK(decode<value>(root, "o") == *root.find("o"));

  // An empty path targets the root.
  JSONSUB_CHECK(get_object(root).size() == 7);

  JSONSUB_CHECK(JSONSUB_EXPECT_ACCESS_ERROR(get_string(root, "i"), type_not_convertible).type_name() == "string");
  JSONSUB_CHECK(JSONSUB_EXPECT_ACCESS_ERROR(get_bool(root, "s"), type_not_convertible).type_name() == "bool");
  JSONSUB_CHECK(JSONSUB_EXPECT_ACCESS_ERROR(get_double(root, "t"), type_not_convertible).type_name() == "double");
  JSONSUB_CHECK(JSONSUB_EXPECT_ACCESS_ERROR(get_array(root, "o"), type_not_convertible).type_name() == "array");
  JSONSUB_CHECK(JSONSUB_EXPECT_ACCESS_ERROR(get_object(root, "arr"), type_not_convertible).type_name() == "object");

  // get_array_of is all or nothing.
  JSONSUB_EXPECT_ACCESS_ERROR(get_array_of<int>(root, "arr"), type_not_convertible);
  JSONSUB_CHECK(get_array(root, "arr").size() == 2);
}

static void test_dynamic_paths() {
  const value root = parse_or_throw(kDoc);
  const std::vector<std::string> names = {"a", "b"};

  path p;
  for (const auto& n : names) p.emplace_back(n);
  p.emplace_back(2);
  JSONSUB_CHECK(get_int(root, p) == 3);
  JSONSUB_CHECK(find_int(root, kNone, p) == 3);

  p.back() = segment_ref(9);
  JSONSUB_EXPECT_ACCESS_ERROR(get_int(root, p), index_out_of_bounds);
  JSONSUB_CHECK(!find_int(root, kMissing, p).has_value());
}

struct absorb_case {
  const char* label;
  path p;
  access_errc raised;
  bool absorbed_by_null;
  bool absorbed_by_missing;
};

static void test_absorption_grid() {
  const value root = parse_or_throw(R"({"a": {"b": [1, 2, 3], "c": null, "s": "text"}})");

  const absorb_case cases[] = {
      {"missing key", {"a", "zz"}, access_errc::key_not_found, false, true},
      {"index past end", {"a", "b", 3}, access_errc::index_out_of_bounds, false, true},
      {"negative index", {"a", "b", -1}, access_errc::index_out_of_bounds, false, true},
      {"index into object", {"a", 0}, access_errc::unexpected_subscript, false, false},
      {"key into array", {"a", "b", "x"}, access_errc::unexpected_subscript, false, false},
      {"key into string", {"a", "s", "x"}, access_errc::unexpected_subscript, false, false},
      {"key into null", {"a", "c", "x"}, access_errc::unexpected_subscript, true, false},
      {"index into null", {"a", "c", 0}, access_errc::unexpected_subscript, true, false},
      {"null at end", {"a", "c"}, access_errc::type_not_convertible, true, false},
      {"string at end", {"a", "s"}, access_errc::type_not_convertible, false, false},
  };

  for (const auto& c : cases) {
    const subscripting_options all[] = {kNone, kNull, kMissing, kBoth};
    for (const auto opts : all) {
      const bool absorbed = (c.absorbed_by_null && contains(opts, kNull)) ||
                            (c.absorbed_by_missing && contains(opts, kMissing));
      bool threw = false;
      std::optional<std::int64_t> got;
      try {
        got = find_int(root, opts, c.p);
      } catch (const access_error& e) {
        threw = true;
        if (e.code() != c.raised) {
          jsonsub_test::fail(c.label, __FILE__, __LINE__, std::string("wrong code: ") + access_errc_name(e.code()));
        }
      }
      if (absorbed && (threw || got.has_value())) {
        jsonsub_test::fail(c.label, __FILE__, __LINE__, "expected an absent result");
      }
      if (!absorbed && !threw) jsonsub_test::fail(c.label, __FILE__, __LINE__, "expected access_error");
    }
  }
}

static void test_required_optional_parity() {
  const value root = parse_or_throw(R"({"a": {"b": [1, 2.5, "x", true, [0], {"k": 1}]}})");
  const subscripting_options all[] = {kNone, kNull, kMissing, kBoth};

  for (std::int64_t i = 0; i < 6; ++i) {
    for (const auto opts : all) {
      try {
        const double v = get_double(root, "a", "b", i);
        JSONSUB_CHECK(find_double(root, opts, "a", "b", i) == v);
      } catch (const access_error&) {
        JSONSUB_EXPECT_THROW(find_double(root, opts, "a", "b", i));
      }
      try {
        const std::string v = get_string(root, "a", "b", i);
        JSONSUB_CHECK(find_string(root, opts, "a", "b", i) == v);
      } catch (const access_error&) {
        JSONSUB_EXPECT_THROW(find_string(root, opts, "a", "b", i));
      }
      try {
        const bool v = get_bool(root, "a", "b", i);
        JSONSUB_CHECK(find_bool(root, opts, "a", "b", i) == v);
      } catch (const access_error&) {
        JSONSUB_EXPECT_THROW(find_bool(root, opts, "a", "b", i));
      }
      try {
        const value::array* v = &get_array(root, "a", "b", i);
        JSONSUB_CHECK(find_array(root, opts, "a", "b", i) == v);
      } catch (const access_error&) {
        JSONSUB_EXPECT_THROW(find_array(root, opts, "a", "b", i));
      }
      try {
        const value::object* v = &get_object(root, "a", "b", i);
        JSONSUB_CHECK(find_object(root, opts, "a", "b", i) == v);
      } catch (const access_error&) {
        JSONSUB_EXPECT_THROW(find_object(root, opts, "a", "b", i));
      }
    }
  }
}

static void test_optional_family_results() {
  const value root = parse_or_throw(R"({"list": [1, 2], "mixed": [1, null], "o": {"n": null}})");

  const auto list = find_array_of<int>(root, kNone, "list");
  JSONSUB_CHECK(list && (*list == std::vector<int>{1, 2}));
  JSONSUB_CHECK(find_array(root, kNone, "list")->size() == 2);
  JSONSUB_CHECK(find_object(root, kNone, "o")->size() == 1);

  JSONSUB_CHECK(find_array(root, kMissing, "nope") == nullptr);
  JSONSUB_CHECK(find_object(root, kNull, "o", "n") == nullptr);
  JSONSUB_CHECK(!find_array_of<int>(root, kMissing, "nope").has_value());
  // from_json() subscripting the null is not a conversion failure.
  JSONSUB_EXPECT_ACCESS_ERROR(find_decode<pair_of_ints>(root, kNull, "o", "n"), unexpected_subscript);
  JSONSUB_CHECK(!find_decode<std::int64_t>(root, kNull, "o", "n").has_value());

  // A null inside the array fails the element, not the lookup.
  JSONSUB_EXPECT_ACCESS_ERROR(find_array_of<int>(root, kBoth, "mixed"), type_not_convertible);
  const auto holes = find_array_of<std::optional<int>>(root, kNone, "mixed");
  JSONSUB_CHECK(holes && holes->size() == 2 && !(*holes)[1].has_value());
}

static void test_unexpected_subscript_always_propagates() {
  const value root = parse_or_throw(kDoc);
  auto e = JSONSUB_EXPECT_ACCESS_ERROR(find_int(root, kBoth, "a", "b", "x"), unexpected_subscript);
  JSONSUB_CHECK(e.type_name() == "key");
  e = JSONSUB_EXPECT_ACCESS_ERROR(find_string(root, kBoth, "a", 0), unexpected_subscript);
  JSONSUB_CHECK(e.type_name() == "index");
  JSONSUB_EXPECT_ACCESS_ERROR(find_bool(root, kBoth, "a", "b", 0, 0), unexpected_subscript);
}

static void test_custom_decoder_failures() {
  const value root = parse_or_throw(R"({"ok": {"first": 1, "second": 2}, "short": {"first": 1}, "bad": {"first": "1", "second": 2}})");

  const pair_of_ints ok = decode<pair_of_ints>(root, "ok");
  JSONSUB_CHECK(ok.first == 1 && ok.second == 2);
  JSONSUB_CHECK(find_decode<pair_of_ints>(root, kNone, "ok")->second == 2);

  auto e = JSONSUB_EXPECT_ACCESS_ERROR(decode<pair_of_ints>(root, "short"), key_not_found);
  JSONSUB_CHECK(e.key() == "second");

  // The nested missing key is absorbed just like one on the outer path.
  JSONSUB_CHECK(!find_decode<pair_of_ints>(root, kMissing, "short").has_value());
  JSONSUB_EXPECT_ACCESS_ERROR(find_decode<pair_of_ints>(root, kNull, "short"), key_not_found);
  JSONSUB_EXPECT_ACCESS_ERROR(find_decode<pair_of_ints>(root, kBoth, "bad"), type_not_convertible);
}

void test_access() {
  test_basic_scenarios();
  test_required_family();
  test_dynamic_paths();
  test_absorption_grid();
  test_required_optional_parity();
  test_optional_family_results();
  test_unexpected_subscript_always_propagates();
  test_custom_decoder_failures();
}
