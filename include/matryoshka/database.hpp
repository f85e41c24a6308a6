#pragma once
#include "statement.hpp"
#include "statement_cache.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

struct sqlite3_blob;

namespace matryoshka {

// One SQLite connection. Every SQLite failure surfaces as DatabaseError.
class Database {
public:
  static Database open(const std::string& path);   // ":memory:" for an in-memory store
  static Database open_in_memory() { return open(":memory:"); }

  ~Database();
  Database(Database&& other) noexcept;
  Database& operator=(Database&& other) noexcept;
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  void execute(const std::string& sql);
  Statement prepare(const std::string& sql);
  CachedStatement prepare_cached(const std::string& sql);
  void set_statement_cache_capacity(std::size_t capacity);
  const StatementCache& statement_cache() const;

  int limit(int id) const;   // SQLITE_LIMIT_*
  int64_t last_insert_rowid() const;
  std::size_t changes() const;

  sqlite3* raw() const;

private:
  Database();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// BEGIN on construction, ROLLBACK on destruction unless committed.
class Transaction {
public:
  explicit Transaction(Database& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

private:
  Database& db_;
  bool done_;
};

// Read-only incremental access to one BLOB cell.
class Blob {
public:
  Blob(Database& db, const char* table, const char* column, int64_t row);
  ~Blob();

  Blob(const Blob&) = delete;
  Blob& operator=(const Blob&) = delete;

  // Moves the handle to another row of the same table and column.
  void reopen(int64_t row);
  std::size_t size() const;
  void read(void* buffer, std::size_t length, std::size_t offset) const;

private:
  Database& db_;
  sqlite3_blob* blob_ = nullptr;
};

} // namespace matryoshka
