#include "matryoshka/meta_data.hpp"
#include "matryoshka/database.hpp"
#include <re2/re2.h>

namespace matryoshka {

namespace {
const RE2& version_pattern() {
  static const RE2 re(std::string(MetaData::kMetaTablePrefix) + "([0-9]+)");
  return re;
}
}

std::string MetaData::table_name(uint32_t version) {
  return kMetaTablePrefix + std::to_string(version);
}

std::optional<uint32_t> MetaData::extract_version(const std::string& table_name) {
  // RE2 rejects digits that overflow the target type
  uint32_t version = 0;
  if (!RE2::FullMatch(table_name, version_pattern(), &version)) return std::nullopt;
  return version;
}

Availability Availability::available(MetaData meta_data) {
  Availability a;
  a.state = State::Available;
  a.meta_data = meta_data;
  return a;
}

Availability Availability::missing() {
  return Availability{};
}

Availability Availability::failed(const DatabaseError& error) {
  Availability a;
  a.state = State::Error;
  a.error = error;
  return a;
}

Availability discover(Database& database) {
  std::optional<MetaData> newest;
  try {
    Statement tables = database.prepare(
      "SELECT name FROM sqlite_master WHERE type = 'table' AND name LIKE ?");
    tables.bind(1, std::string(MetaData::kMetaTablePrefix) + "%");
    while (tables.step()) {
      auto version = MetaData::extract_version(tables.column_text(0));
      if (!version) continue;
      if (!newest || newest->version() < *version) newest = MetaData(*version);
    }
  } catch (const DatabaseError& e) {
    return Availability::failed(e);
  }

  if (newest) return Availability::available(*newest);
  return Availability::missing();
}

} // namespace matryoshka
