#pragma once
#include "errors.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace matryoshka {

class Database;

// Schema generation of a virtual file system. It is encoded in the name of
// the meta table (Matryoshka_Meta_<version>), never stored as a value.
class MetaData {
public:
  static constexpr const char* kMetaTablePrefix = "Matryoshka_Meta_";

  explicit MetaData(uint32_t version) : version_(version) {}

  uint32_t version() const { return version_; }

  static std::string table_name(uint32_t version);
  // Version encoded in a table name, if it is a meta table name at all.
  static std::optional<uint32_t> extract_version(const std::string& table_name);

  friend bool operator==(MetaData a, MetaData b) { return a.version_ == b.version_; }
  friend bool operator!=(MetaData a, MetaData b) { return a.version_ != b.version_; }
  friend bool operator<(MetaData a, MetaData b) { return a.version_ < b.version_; }

private:
  uint32_t version_;
};

// Outcome of looking for a virtual file system in a database.
struct Availability {
  enum class State { Available, Missing, Error };

  State state = State::Missing;
  std::optional<MetaData> meta_data;   // Available
  std::optional<DatabaseError> error;  // Error

  static Availability available(MetaData meta_data);
  static Availability missing();
  static Availability failed(const DatabaseError& error);
};

// Scans the table catalog and reports the newest meta table found.
Availability discover(Database& database);

} // namespace matryoshka
