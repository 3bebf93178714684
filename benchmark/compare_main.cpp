#include <jsonsub/jsonsub.hpp>
#include <jsonsub/jsoncpp_backend.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/document.h>
#include <rapidjson/pointer.h>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

std::string make_payload(std::size_t n_items, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_items * (str_len + 96));
  s += "{\"items\":[";
  for (std::size_t i = 0; i < n_items; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";
    for (std::size_t k = 0; k < str_len; ++k) s.push_back(static_cast<char>(ch(rng)));
    s += "\",\"meta\":{\"score\":";
    s += std::to_string(static_cast<std::uint64_t>(i * 7 % 101));
    s += ",\"note\":null}}";
  }
  s += "]}";
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t ops{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t ops = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    ops = br.ops;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], ops};
}

void print_mops(const char* name, const bench_result& r, std::int64_t checksum) {
  const double mops = (r.seconds > 0.0) ? (static_cast<double>(r.ops) / 1e6 / r.seconds) : 0.0;
  std::cout << name << ": " << mops << " Mlookups/s (" << r.seconds << " s, checksum " << checksum << ")\n";
}

bench_result bench_jsonsub(const jsonsub::value& root, std::size_t n_items, std::size_t iters, std::int64_t& sum) {
  sum = 0;
  const auto t0 = clock_type::now();
  for (std::size_t iter = 0; iter < iters; ++iter) {
    for (std::size_t i = 0; i < n_items; ++i) sum += jsonsub::get_int(root, "items", i, "meta", "score");
  }
  const auto t1 = clock_type::now();
  do_not_optimize(sum);
  return {std::chrono::duration<double>(t1 - t0).count(), n_items * iters};
}

bench_result bench_jsonsub_optional(const jsonsub::value& root, std::size_t n_items, std::size_t iters,
                                    std::int64_t& sum) {
  sum = 0;
  const auto t0 = clock_type::now();
  for (std::size_t iter = 0; iter < iters; ++iter) {
    for (std::size_t i = 0; i < n_items; ++i) {
      sum += jsonsub::find_int(root, jsonsub::subscripting_options::none, "items", i, "meta", "score").value_or(0);
    }
  }
  const auto t1 = clock_type::now();
  do_not_optimize(sum);
  return {std::chrono::duration<double>(t1 - t0).count(), n_items * iters};
}

bench_result bench_nlohmann(const nlohmann::json& j, std::size_t n_items, std::size_t iters, std::int64_t& sum) {
  sum = 0;
  const auto t0 = clock_type::now();
  for (std::size_t iter = 0; iter < iters; ++iter) {
    for (std::size_t i = 0; i < n_items; ++i) sum += j.at("items").at(i).at("meta").at("score").get<std::int64_t>();
  }
  const auto t1 = clock_type::now();
  do_not_optimize(sum);
  return {std::chrono::duration<double>(t1 - t0).count(), n_items * iters};
}

bench_result bench_jsoncpp(const Json::Value& root, std::size_t n_items, std::size_t iters, std::int64_t& sum) {
  sum = 0;
  const auto t0 = clock_type::now();
  for (std::size_t iter = 0; iter < iters; ++iter) {
    for (std::size_t i = 0; i < n_items; ++i) {
      sum += root["items"][static_cast<Json::ArrayIndex>(i)]["meta"]["score"].asInt64();
    }
  }
  const auto t1 = clock_type::now();
  do_not_optimize(sum);
  return {std::chrono::duration<double>(t1 - t0).count(), n_items * iters};
}

bench_result bench_rapidjson(const rapidjson::Document& d, std::size_t n_items, std::size_t iters, std::int64_t& sum) {
  sum = 0;
  const auto t0 = clock_type::now();
  for (std::size_t iter = 0; iter < iters; ++iter) {
    const auto& items = d["items"];
    for (std::size_t i = 0; i < n_items; ++i) {
      sum += items[static_cast<rapidjson::SizeType>(i)]["meta"]["score"].GetInt64();
    }
  }
  const auto t1 = clock_type::now();
  do_not_optimize(sum);
  return {std::chrono::duration<double>(t1 - t0).count(), n_items * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_items = 2000;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_items = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_items, 24);
  std::cout << "payload bytes: " << payload.size() << "\n";

  const auto ours = jsonsub::parse(payload);
  if (ours.err) {
    std::cerr << "jsonsub: input parse failed\n";
    return 1;
  }
  // The jsoncpp backend must build the same tree as the built-in parser.
  const auto via_jsoncpp = jsonsub::jsoncpp::parse(payload);
  if (via_jsoncpp.err || !(via_jsoncpp.val == ours.val)) {
    std::cerr << "jsonsub: jsoncpp backend disagrees with the built-in parser\n";
    return 1;
  }

  const auto nj = nlohmann::json::parse(payload, nullptr, false, false);
  if (nj.is_discarded()) {
    std::cerr << "nlohmann: input parse failed\n";
    return 1;
  }

  Json::Value jc;
  {
    Json::CharReaderBuilder builder;
    std::string errs;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(payload.data(), payload.data() + payload.size(), &jc, &errs)) {
      std::cerr << "jsoncpp: input parse failed: " << errs << "\n";
      return 1;
    }
  }

  rapidjson::Document rd;
  rd.Parse(payload.data(), payload.size());
  if (rd.HasParseError()) {
    std::cerr << "rapidjson: input parse failed\n";
    return 1;
  }

  // Spot check through a JSON pointer before timing.
  if (const rapidjson::Value* v = rapidjson::Pointer("/items/1/meta/score").Get(rd)) {
    if (v->GetInt64() != jsonsub::get_int(ours.val, "items", 1, "meta", "score")) {
      std::cerr << "rapidjson: value mismatch\n";
      return 1;
    }
  }

  std::int64_t sum = 0;
  std::cout << "\n== Path access (items[i].meta.score) ==\n";
  auto r = run_median(runs, [&] { return bench_jsonsub(ours.val, n_items, iters, sum); });
  print_mops("jsonsub get_int", r, sum);
  r = run_median(runs, [&] { return bench_jsonsub_optional(ours.val, n_items, iters, sum); });
  print_mops("jsonsub find_int", r, sum);
  r = run_median(runs, [&] { return bench_nlohmann(nj, n_items, iters, sum); });
  print_mops("nlohmann at()", r, sum);
  r = run_median(runs, [&] { return bench_jsoncpp(jc, n_items, iters, sum); });
  print_mops("jsoncpp operator[]", r, sum);
  r = run_median(runs, [&] { return bench_rapidjson(rd, n_items, iters, sum); });
  print_mops("rapidjson operator[]", r, sum);

  return 0;
}
