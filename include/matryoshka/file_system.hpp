#pragma once
#include "database.hpp"
#include "handle.hpp"
#include "io.hpp"
#include "meta_data.hpp"
#include "virtual_path.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace matryoshka {

// A virtual file system stored in one SQLite database. It owns the
// connection; Files created from it borrow it and must not outlive it.
class FileSystem {
public:
  static constexpr uint32_t kCurrentVersion = 0;
  static constexpr std::size_t kDefaultChunkSize = 33554432;   // 32 MiB
  static constexpr std::size_t kPrecompiledStatements = 6;

  // Finds (or, if allowed, creates) the file system in a database.
  // Throws FileSystemError.
  static FileSystem load(Database database, bool create_file_system);
  // Same, opening the database file first.
  static FileSystem load(const std::string& database_path, bool create_file_system);

  FileSystem(FileSystem&&) = default;
  FileSystem& operator=(FileSystem&&) = default;

  const MetaData& meta_data() const { return meta_data_; }
  Database& database() { return database_; }

  // Paths matching a GLOB pattern ('?' one character, '*' any text, '/' not
  // special), ascending. Throws DatabaseError.
  std::vector<std::string> find(const VirtualPath& pattern);

  // Streams `data` into chunks of `chunk_size` bytes (0 or more than SQLite
  // accepts selects the default). All or nothing. Throws CreationError.
  Handle create(const VirtualPath& path, Source& data, std::size_t chunk_size);

  // Throws DatabaseError.
  std::optional<Handle> open(const VirtualPath& path);

  // Copies [index, index + length) to `sink` and returns `length`.
  // Throws ReadError.
  std::size_t read(Handle handle, Sink& sink, std::size_t index, std::size_t length);

  // Number of deleted entries (0 or 1). Chunks go with the entry.
  // Throws DatabaseError.
  std::size_t remove(Handle handle);

  // Total content size, nullopt if the handle has no chunks at all, which
  // never happens for an existing entry. Throws DatabaseError.
  std::optional<std::size_t> size(Handle handle);

  std::size_t resolve_chunk_size(std::size_t requested) const;

private:
  FileSystem(Database database, MetaData meta_data);

  Database database_;
  MetaData meta_data_;
};

} // namespace matryoshka
