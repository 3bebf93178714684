#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace {

bool read_all(const char* path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0) return false;
  out.resize(static_cast<std::size_t>(end));
  ifs.seekg(0, std::ios::beg);
  if (!out.empty()) {
    if (!ifs.read(out.data(), static_cast<std::streamsize>(out.size()))) return false;
  }
  return true;
}

// RFC 6901 reference token: "~" -> "~0", "/" -> "~1". "[N]" selects element N.
std::string pointer_token(std::string_view seg) {
  if (seg.size() > 2 && seg.front() == '[' && seg.back() == ']') return std::string(seg.substr(1, seg.size() - 2));
  std::string out;
  for (const char c : seg) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: nlohmann_get <file.json> [segment...]\n";
    return 2;
  }

  std::string text;
  if (!read_all(argv[1], text)) {
    std::cerr << "read failed: " << argv[1] << "\n";
    return 2;
  }

  using nlohmann::json;
  const json j = json::parse(text, /*callback=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/false);
  if (j.is_discarded()) {
    std::cerr << "parse failed: " << argv[1] << "\n";
    return 1;
  }

  std::string pointer;
  for (int k = 2; k < argc; ++k) pointer += "/" + pointer_token(argv[k]);

  try {
    std::cout << j.at(json::json_pointer(pointer)).dump() << "\n";
  } catch (const json::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
