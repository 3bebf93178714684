#include <jsonsub/jsonsub.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

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

// {"items":[{"id":0,"ok":true,"name":"...","val":3.14,"meta":{"score":N,"note":null}}, ...]}
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
    s += "\",\"val\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += ",\"meta\":{\"score\":";
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

bench_result bench_parse(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = jsonsub::parse(json);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.type());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_get(const jsonsub::value& root, std::size_t n_items, std::size_t iters) {
  const auto t0 = clock_type::now();
  std::int64_t sum = 0;
  for (std::size_t iter = 0; iter < iters; ++iter) {
    for (std::size_t i = 0; i < n_items; ++i) {
      sum += jsonsub::get_int(root, "items", i, "meta", "score");
      sum += jsonsub::get_bool(root, "items", i, "ok") ? 1 : 0;
    }
  }
  do_not_optimize(sum);
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), 2 * n_items * iters};
}

// Half the lookups end in an absent value: a null on the path or a missing key.
bench_result bench_find(const jsonsub::value& root, std::size_t n_items, std::size_t iters) {
  const auto opts =
      jsonsub::subscripting_options::null_becomes_nil | jsonsub::subscripting_options::missing_key_becomes_nil;
  const auto t0 = clock_type::now();
  std::size_t absent = 0;
  for (std::size_t iter = 0; iter < iters; ++iter) {
    for (std::size_t i = 0; i < n_items; ++i) {
      if (!jsonsub::find_string(root, opts, "items", i, "meta", "note", "text")) ++absent;
      if (!jsonsub::find_string(root, opts, "items", i, "nickname")) ++absent;
      if (!jsonsub::find_double(root, opts, "items", i, "val")) ++absent;
      if (!jsonsub::find_int(root, opts, "items", i, "id")) ++absent;
    }
  }
  do_not_optimize(absent);
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), 4 * n_items * iters};
}

bench_result bench_dump(const jsonsub::value& root, std::size_t iters) {
  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    auto out = jsonsub::dump(root);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.ops) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

void print_mops(const char* name, const bench_result& r) {
  const double mops = (r.seconds > 0.0) ? (static_cast<double>(r.ops) / 1e6 / r.seconds) : 0.0;
  std::cout << name << ": " << mops << " Mlookups/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_items = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_items = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_items, str_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  const auto parsed = jsonsub::parse(payload);
  if (parsed.err) {
    std::cerr << "input parse failed: " << jsonsub::error_code_name(parsed.err.code) << "\n";
    return 1;
  }
  const jsonsub::value& root = parsed.val;

  print_mbps("parse", run_median(runs, [&] { return bench_parse(payload, iters); }));
  print_mops("get (required)", run_median(runs, [&] { return bench_get(root, n_items, iters); }));
  print_mops("find (optional)", run_median(runs, [&] { return bench_find(root, n_items, iters); }));
  print_mbps("dump", run_median(runs, [&] { return bench_dump(root, iters); }));

  return 0;
}
