#include "matryoshka/virtual_path.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace matryoshka {

VirtualPath::VirtualPath(const std::string& raw) : path_(normalize(raw)) {}

VirtualPath::VirtualPath(const char* raw) : path_(normalize(raw ? raw : "")) {}

std::string VirtualPath::normalize(const std::string& raw) {
  fs::path path(raw);
  std::vector<std::string> parts;
  for (const auto& element : path) {
    // root names, root directories and the empty trailing element drop out
    if (element.empty() || element == path.root_name() || element == path.root_directory())
      continue;
    const std::string part = element.generic_string();
    if (part == ".") continue;
    if (part == "..") {
      if (!parts.empty()) parts.pop_back();
      continue;
    }
    parts.push_back(part);
  }

  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += '/';
    out += parts[i];
  }
  return out;
}

} // namespace matryoshka
