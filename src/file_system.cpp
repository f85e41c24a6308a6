#include "matryoshka/file_system.hpp"
#include "matryoshka/errors.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <limits>
#include <system_error>

namespace matryoshka {

namespace {

// Entry type of plain files; other values are reserved.
constexpr int64_t kFileType = 1;

namespace sql {
const std::string kMetaTable = MetaData::table_name(FileSystem::kCurrentVersion);
const std::string kDataTable = "Matryoshka_Data";

const std::string kCreateMeta =
  "CREATE TABLE " + kMetaTable + " ("
  " id INTEGER PRIMARY KEY,"
  " path TEXT UNIQUE NOT NULL,"
  " type INTEGER,"
  " flags INTEGER,"
  " chunk_size INTEGER NOT NULL"
  ")";
const std::string kCreateData =
  "CREATE TABLE IF NOT EXISTS " + kDataTable + " ("
  " chunk_id INTEGER PRIMARY KEY,"
  " file_id INTEGER NOT NULL,"
  " chunk_num INTEGER NOT NULL,"
  " data BLOB NOT NULL,"
  " CONSTRAINT unq UNIQUE (file_id, chunk_num),"
  " FOREIGN KEY (file_id) REFERENCES " + kMetaTable + " (id) ON DELETE CASCADE ON UPDATE CASCADE"
  ")";

const std::string kCreateHandle =
  "INSERT INTO " + kMetaTable + " (path, type, chunk_size) VALUES (?, ?, ?)";
const std::string kCreateChunk =
  "INSERT INTO " + kDataTable + " (file_id, chunk_num, data) VALUES (?, ?, ?)";
const std::string kGetHandle =
  "SELECT id FROM " + kMetaTable + " WHERE path = ? AND type = ?";
const std::string kGlob =
  "SELECT path FROM " + kMetaTable + " WHERE path GLOB ? AND type = ? ORDER BY path";
const std::string kSize =
  "SELECT COALESCE(SUM(LENGTH(data)), -1) FROM " + kDataTable + " WHERE file_id = ?";
const std::string kDelete =
  "DELETE FROM " + kMetaTable + " WHERE id = ?";
// Chunks intersecting [:index, :index + :size), with the file's chunk size.
const std::string kGetChunks =
  "SELECT chunk_id, chunk_num, " + kMetaTable + ".chunk_size FROM " + kDataTable +
  " INNER JOIN " + kMetaTable + " ON " + kMetaTable + ".id = " + kDataTable + ".file_id"
  " WHERE file_id = :handle AND chunk_num BETWEEN"
  " CAST((:index / " + kMetaTable + ".chunk_size) AS INTEGER) AND"
  " CAST(((:index + :size - 1) / " + kMetaTable + ".chunk_size) AS INTEGER)"
  " ORDER BY chunk_num ASC";
} // namespace sql

Database open_database(const std::string& path) {
  try {
    return Database::open(path);
  } catch (const DatabaseError& e) {
    throw FileSystemError::database(e);
  }
}

// One chunk worth of source data; a short count means the source is done.
std::size_t fill_chunk(Source& data, std::vector<uint8_t>& buffer) {
  for (;;) {
    try {
      return data.read(buffer.data(), buffer.size());
    } catch (const std::system_error& e) {
      if (e.code() == std::errc::interrupted) continue;
      throw CreationError::source(e.code());
    }
  }
}

} // namespace

FileSystem::FileSystem(Database database, MetaData meta_data)
  : database_(std::move(database)), meta_data_(meta_data) {}

FileSystem FileSystem::load(const std::string& database_path, bool create_file_system) {
  return load(open_database(database_path), create_file_system);
}

FileSystem FileSystem::load(Database database, bool create_file_system) {
  std::optional<MetaData> meta_data;
  try {
    // chunk cleanup relies on ON DELETE CASCADE
    database.execute("PRAGMA foreign_keys = ON");

    Availability availability = discover(database);
    switch (availability.state) {
      case Availability::State::Available:
        if (availability.meta_data->version() != kCurrentVersion) {
          throw FileSystemError::unsupported_version(availability.meta_data->version());
        }
        meta_data = availability.meta_data;
        break;
      case Availability::State::Missing: {
        if (!create_file_system) throw FileSystemError::no_file_system();
        Transaction transaction(database);
        database.execute(sql::kCreateMeta);
        database.execute(sql::kCreateData);
        transaction.commit();
        meta_data = MetaData(kCurrentVersion);
        break;
      }
      case Availability::State::Error:
        throw FileSystemError::database(*availability.error);
    }
  } catch (const DatabaseError& e) {
    throw FileSystemError::database(e);
  }

  const std::string* precompiled[] = {
    &sql::kGetHandle, &sql::kCreateHandle, &sql::kGlob,
    &sql::kSize, &sql::kDelete, &sql::kGetChunks,
  };
  static_assert(sizeof(precompiled) / sizeof(precompiled[0]) == kPrecompiledStatements,
                "statement cache capacity must match the precompiled statements");

  database.set_statement_cache_capacity(kPrecompiledStatements);
  for (const std::string* statement : precompiled) {
    try {
      database.prepare_cached(*statement);
    } catch (const DatabaseError& e) {
      throw FileSystemError::invalid_base_command(*statement, e);
    }
  }

  return FileSystem(std::move(database), *meta_data);
}

std::vector<std::string> FileSystem::find(const VirtualPath& pattern) {
  auto query = database_.prepare_cached(sql::kGlob);
  query->bind(1, pattern.str());
  query->bind(2, kFileType);

  std::vector<std::string> paths;
  while (query->step()) paths.push_back(query->column_text(0));
  return paths;
}

std::size_t FileSystem::resolve_chunk_size(std::size_t requested) const {
  const int max_blob_size = database_.limit(SQLITE_LIMIT_LENGTH);
  if (requested > 0 && max_blob_size > 0 && requested <= (std::size_t)max_blob_size) {
    return requested;
  }
  return kDefaultChunkSize;
}

Handle FileSystem::create(const VirtualPath& path, Source& data, std::size_t chunk_size) {
  chunk_size = resolve_chunk_size(chunk_size);

  try {
    Transaction transaction(database_);
    // declared after the transaction so they are reset before a rollback
    auto insert_entry = database_.prepare_cached(sql::kCreateHandle);
    auto insert_chunk = database_.prepare_cached(sql::kCreateChunk);

    insert_entry->bind(1, path.str());
    insert_entry->bind(2, kFileType);
    insert_entry->bind(3, (int64_t)chunk_size);
    try {
      insert_entry->execute();
    } catch (const DatabaseError& e) {
      if (e.primary_code() == SQLITE_CONSTRAINT) throw CreationError::file_exists();
      throw;
    }
    const Handle handle(database_.last_insert_rowid());

    std::vector<uint8_t> buffer(chunk_size);
    for (int64_t chunk_num = 0;; ++chunk_num) {
      const std::size_t n = fill_chunk(data, buffer);
      insert_chunk->bind(1, handle.value());
      insert_chunk->bind(2, chunk_num);
      insert_chunk->bind_blob(3, buffer.data(), n);
      insert_chunk->execute();
      insert_chunk->reset();
      if (n != chunk_size) break;
    }

    transaction.commit();
    return handle;
  } catch (const DatabaseError& e) {
    throw CreationError::database(e);
  }
}

std::optional<Handle> FileSystem::open(const VirtualPath& path) {
  auto query = database_.prepare_cached(sql::kGetHandle);
  query->bind(1, path.str());
  query->bind(2, kFileType);
  if (!query->step()) return std::nullopt;
  return Handle(query->column_int64(0));
}

std::size_t FileSystem::read(Handle handle, Sink& sink, std::size_t index, std::size_t length) {
  constexpr std::size_t kMaxIndex = (std::size_t)std::numeric_limits<int64_t>::max();
  if (index > kMaxIndex || length > kMaxIndex) throw ReadError::file_system_limits();
  if (length == 0) return 0;
  if (index > kMaxIndex - length) throw ReadError::file_system_limits();

  try {
    auto chunks = database_.prepare_cached(sql::kGetChunks);
    chunks->bind(":handle", handle.value());
    chunks->bind(":index", (int64_t)index);
    chunks->bind(":size", (int64_t)length);

    std::optional<Blob> blob;   // one handle for all chunks, moved with reopen()
    std::vector<uint8_t> buffer;
    std::size_t copied = 0;
    bool first = true;

    while (chunks->step()) {
      const int64_t chunk_id = chunks->column_int64(0);
      std::size_t offset = 0;
      if (first) {
        const int64_t chunk_num = chunks->column_int64(1);
        const int64_t chunk_size = chunks->column_int64(2);
        const int64_t start = (int64_t)index - chunk_num * chunk_size;
        if (start < 0) throw ReadError::out_of_bounds();   // leading chunks are missing
        offset = (std::size_t)start;
        buffer.resize(std::min((std::size_t)chunk_size, length));
      }

      if (blob) blob->reopen(chunk_id);
      else blob.emplace(database_, sql::kDataTable.c_str(), "data", chunk_id);

      const std::size_t blob_size = blob->size();
      std::size_t n = std::min(blob_size, length - copied);
      if (first) {
        // offset lies behind the stored content, e.g. past end of file
        if (offset >= blob_size) throw ReadError::out_of_bounds();
        n = std::min(blob_size - offset, n);
      }
      if (n > buffer.size()) buffer.resize(n);

      blob->read(buffer.data(), n, offset);
      try {
        sink.write(buffer.data(), n);
      } catch (const std::system_error& e) {
        throw ReadError::sink(e.code());
      }

      copied += n;
      first = false;
    }

    if (first || copied != length) throw ReadError::out_of_bounds();
    return copied;
  } catch (const DatabaseError& e) {
    throw ReadError::database(e);
  }
}

std::size_t FileSystem::remove(Handle handle) {
  auto statement = database_.prepare_cached(sql::kDelete);
  statement->bind(1, handle.value());
  return statement->execute();
}

std::optional<std::size_t> FileSystem::size(Handle handle) {
  auto query = database_.prepare_cached(sql::kSize);
  query->bind(1, handle.value());
  if (!query->step()) {
    throw std::logic_error("size aggregate returned no row");
  }
  const int64_t raw_size = query->column_int64(0);
  if (raw_size < 0) return std::nullopt;
  return (std::size_t)raw_size;
}

} // namespace matryoshka
