#pragma once
#include <ostream>
#include <string>

namespace matryoshka {

// Normalized path inside the virtual file system: components joined by '/',
// no leading or trailing slash, "." dropped and ".." resolved. A ".." with
// nothing left to remove is ignored, so the result never escapes the root.
class VirtualPath {
public:
  VirtualPath() = default;
  VirtualPath(const std::string& raw);
  VirtualPath(const char* raw);

  static std::string normalize(const std::string& raw);

  const std::string& str() const { return path_; }
  bool empty() const { return path_.empty(); }

  friend bool operator==(const VirtualPath& a, const VirtualPath& b) { return a.path_ == b.path_; }
  friend bool operator!=(const VirtualPath& a, const VirtualPath& b) { return a.path_ != b.path_; }
  friend bool operator<(const VirtualPath& a, const VirtualPath& b) { return a.path_ < b.path_; }

private:
  std::string path_;
};

inline std::ostream& operator<<(std::ostream& os, const VirtualPath& p) {
  return os << p.str();
}

} // namespace matryoshka
