#pragma once
#include <cstdint>

namespace matryoshka {

// Row id of a file entry. Does not keep the entry alive; revalidate with
// FileSystem::size() after anything may have deleted it.
class Handle {
public:
  constexpr explicit Handle(int64_t value) : value_(value) {}

  constexpr int64_t value() const { return value_; }

  friend constexpr bool operator==(Handle a, Handle b) { return a.value_ == b.value_; }
  friend constexpr bool operator!=(Handle a, Handle b) { return a.value_ != b.value_; }
  friend constexpr bool operator<(Handle a, Handle b) { return a.value_ < b.value_; }

private:
  int64_t value_;
};

} // namespace matryoshka

