#include "test_common.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace jsonsub;

namespace {

struct point {
  std::int64_t x{0};
  std::int64_t y{0};

  static point from_json(const value& v) {
    point p;
    p.x = get_int(v, "x");
    p.y = get_int(v, "y");
    return p;
  }
};

enum class color { red, green };

} // namespace

// Types that cannot grow a from_json() specialize decoder instead.
namespace jsonsub {
template <>
struct decoder<color> {
  static color decode(const value& v) {
    const std::string s = decoder<std::string>::decode(v);
    if (s == "red") return color::red;
    if (s == "green") return color::green;
    throw access_error::type_not_convertible("color");
  }
};
} // namespace jsonsub

static void test_scalars() {
  JSONSUB_CHECK(decoder<bool>::decode(value(true)));
  JSONSUB_CHECK(decoder<std::string>::decode(value("s")) == "s");
  JSONSUB_CHECK(decoder<double>::decode(value::number(2.5)) == 2.5);
  JSONSUB_CHECK(decoder<double>::decode(value::integer(4)) == 4.0);
  JSONSUB_CHECK(decoder<float>::decode(value::number(0.5)) == 0.5f);
  JSONSUB_CHECK(decoder<std::int64_t>::decode(value::integer(-9)) == -9);
  JSONSUB_CHECK(decoder<value>::decode(value("same")) == value("same"));

  auto e = JSONSUB_EXPECT_ACCESS_ERROR(decoder<bool>::decode(value::integer(1)), type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "bool");
  e = JSONSUB_EXPECT_ACCESS_ERROR(decoder<std::string>::decode(value(nullptr)), type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "string");
  e = JSONSUB_EXPECT_ACCESS_ERROR(decoder<double>::decode(value("1.0")), type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "double");
}

static void test_integers_from_doubles_and_ranges() {
  JSONSUB_CHECK(decoder<int>::decode(value::number(3.9)) == 3);
  JSONSUB_CHECK(decoder<int>::decode(value::number(-3.9)) == -3);
  JSONSUB_CHECK(decoder<std::uint8_t>::decode(value::integer(255)) == 255);

  auto e = JSONSUB_EXPECT_ACCESS_ERROR(decoder<std::uint8_t>::decode(value::integer(256)), type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "int");
  JSONSUB_EXPECT_ACCESS_ERROR(decoder<unsigned>::decode(value::integer(-1)), type_not_convertible);
  JSONSUB_EXPECT_ACCESS_ERROR(decoder<std::int32_t>::decode(value::number(3e9)), type_not_convertible);
  JSONSUB_EXPECT_ACCESS_ERROR(decoder<std::int64_t>::decode(value::number(1e19)), type_not_convertible);
  JSONSUB_EXPECT_ACCESS_ERROR(decoder<int>::decode(value(true)), type_not_convertible);
}

static void test_containers() {
  const value root = parse_or_throw(R"({"list":[1,2,3],"mixed":[1,"two"],"map":{"a":1,"b":2},"n":null})");

  const auto list = decoder<std::vector<int>>::decode(*root.find("list"));
  JSONSUB_CHECK((list == std::vector<int>{1, 2, 3}));

  JSONSUB_EXPECT_ACCESS_ERROR(decoder<std::vector<int>>::decode(*root.find("mixed")), type_not_convertible);
  auto e = JSONSUB_EXPECT_ACCESS_ERROR(decoder<std::vector<int>>::decode(*root.find("map")), type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "array");

  const auto map = decoder<std::map<std::string, int, std::less<>>>::decode(*root.find("map"));
  JSONSUB_CHECK(map.size() == 2 && map.at("b") == 2);
  e = JSONSUB_EXPECT_ACCESS_ERROR((decoder<std::map<std::string, int, std::less<>>>::decode(*root.find("list"))),
                                  type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "object");

  // Any comparator works.
  const auto plain = decode<std::map<std::string, int>>(root, "map");
  JSONSUB_CHECK(plain.size() == 2 && plain.at("a") == 1);
  const auto reversed = decoder<std::map<std::string, int, std::greater<>>>::decode(*root.find("map"));
  JSONSUB_CHECK(reversed.begin()->first == "b");
  JSONSUB_EXPECT_ACCESS_ERROR((decode<std::map<std::string, int>>(root, "list")), type_not_convertible);

  JSONSUB_CHECK(!decoder<std::optional<int>>::decode(*root.find("n")).has_value());
  JSONSUB_CHECK(decoder<std::optional<int>>::decode(value::integer(5)) == 5);
}

static void test_custom_types() {
  const value root = parse_or_throw(R"({"p":{"x":1,"y":-2},"bad":{"x":1},"c":"green","d":"blue"})");

  const point p = decoder<point>::decode(*root.find("p"));
  JSONSUB_CHECK(p.x == 1 && p.y == -2);

  auto e = JSONSUB_EXPECT_ACCESS_ERROR(decoder<point>::decode(*root.find("bad")), key_not_found);
  JSONSUB_CHECK(e.key() == "y");

  JSONSUB_CHECK(decoder<color>::decode(*root.find("c")) == color::green);
  e = JSONSUB_EXPECT_ACCESS_ERROR(decoder<color>::decode(*root.find("d")), type_not_convertible);
  JSONSUB_CHECK(e.type_name() == "color");
}

void test_decode() {
  test_scalars();
  test_integers_from_doubles_and_ranges();
  test_containers();
  test_custom_types();
}
