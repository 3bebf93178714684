#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
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

// Follows one segment; nullptr when it does not apply.
const Json::Value* step(const Json::Value& cur, std::string_view seg) {
  if (seg.size() > 2 && seg.front() == '[' && seg.back() == ']') {
    if (!cur.isArray()) return nullptr;
    const std::string digits(seg.substr(1, seg.size() - 2));
    char* end = nullptr;
    const long long i = std::strtoll(digits.c_str(), &end, 10);
    if (end != digits.c_str() + digits.size() || i < 0 || static_cast<unsigned long long>(i) >= cur.size()) {
      return nullptr;
    }
    return &cur[static_cast<Json::ArrayIndex>(i)];
  }
  if (!cur.isObject()) return nullptr;
  return cur.find(seg.data(), seg.data() + seg.size());
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: jsoncpp_get <file.json> [segment...]\n";
    return 2;
  }

  std::string text;
  if (!read_all(argv[1], text)) {
    std::cerr << "read failed: " << argv[1] << "\n";
    return 2;
  }

  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["failIfExtra"] = true;

  Json::Value root;
  std::string errs;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    std::cerr << "parse failed: " << argv[1] << "\n" << errs;
    return 1;
  }

  const Json::Value* cur = &root;
  for (int k = 2; k < argc; ++k) {
    cur = step(*cur, argv[k]);
    if (cur == nullptr) {
      std::cerr << "cannot apply segment: " << argv[k] << "\n";
      return 1;
    }
  }

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  std::cout << Json::writeString(writer, *cur) << "\n";
  return 0;
}
