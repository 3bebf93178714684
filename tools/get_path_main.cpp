#include <jsonsub/jsonsub.hpp>

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

bool slurp_file(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// "[N]" is an index, anything else a key.
std::optional<std::int64_t> as_index(std::string_view arg) {
  if (arg.size() < 3 || arg.front() != '[' || arg.back() != ']') return std::nullopt;
  const std::string digits(arg.substr(1, arg.size() - 2));
  std::size_t used = 0;
  try {
    const long long i = std::stoll(digits, &used);
    if (used != digits.size()) return std::nullopt;
    return static_cast<std::int64_t>(i);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

void usage() {
  std::cerr << "usage: jsonsub_get [--null-nil] [--missing-nil] <file.json> [segment...]\n";
  std::cerr << "       a segment written [N] is an array index, anything else an object key\n";
}

} // namespace

int main(int argc, char** argv) {
  jsonsub::subscripting_options opts = jsonsub::subscripting_options::none;
  bool optional_lookup = false;
  int argi = 1;
  for (; argi < argc; ++argi) {
    const std::string_view a{argv[argi]};
    if (a == "--null-nil") {
      opts = opts | jsonsub::subscripting_options::null_becomes_nil;
      optional_lookup = true;
    } else if (a == "--missing-nil") {
      opts = opts | jsonsub::subscripting_options::missing_key_becomes_nil;
      optional_lookup = true;
    } else if (a.size() > 1 && a.substr(0, 2) == "--") {
      std::cerr << "unknown option: " << a << "\n";
      usage();
      return 2;
    } else {
      break;
    }
  }
  if (argi >= argc) {
    usage();
    return 2;
  }

  const char* file = argv[argi++];
  std::string text;
  if (!slurp_file(file, text)) {
    std::cerr << "failed to read file: " << file << "\n";
    return 2;
  }

  const auto r = jsonsub::parse(text);
  if (r.err) {
    std::cerr << "parse failed: " << file << "\n";
    std::cerr << "  code=" << jsonsub::error_code_name(r.err.code) << " offset=" << r.err.offset
              << " line=" << r.err.line << " column=" << r.err.column << "\n";
    return 1;
  }

  // Keys borrow argv.
  jsonsub::path p;
  for (int k = argi; k < argc; ++k) {
    if (const auto i = as_index(argv[k])) {
      p.emplace_back(*i);
    } else {
      p.emplace_back(std::string_view{argv[k]});
    }
  }

  try {
    if (optional_lookup) {
      const auto found = jsonsub::find_decode<jsonsub::value>(r.val, opts, p);
      if (!found) {
        std::cerr << "absent\n";
        return 3;
      }
      std::cout << jsonsub::dump(*found) << "\n";
    } else {
      std::cout << jsonsub::dump(jsonsub::resolve(r.val, p)) << "\n";
    }
  } catch (const jsonsub::access_error& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
