#include "matryoshka/database.hpp"
#include "matryoshka/errors.hpp"
#include <sqlite3.h>
#include <limits>

namespace matryoshka {

struct Database::Impl {
  sqlite3* db = nullptr;
  StatementCache cache;

  ~Impl() {
    // statements must be finalized before the connection goes
    cache.clear();
    if (db) sqlite3_close(db);
  }
};

namespace {
[[noreturn]] void throw_last_error(sqlite3* db, int rc) {
  if (!db) throw DatabaseError(rc, std::nullopt);
  const char* m = sqlite3_errmsg(db);
  throw DatabaseError(sqlite3_extended_errcode(db),
                      m ? std::optional<std::string>(m) : std::nullopt);
}
}

Database::Database() : impl_(new Impl) {}

Database::~Database() = default;
Database::Database(Database&& other) noexcept = default;
Database& Database::operator=(Database&& other) noexcept = default;

Database Database::open(const std::string& path) {
  Database database;
  int rc = sqlite3_open_v2(path.c_str(), &database.impl_->db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    // a handle is allocated even on failure; it carries the message
    throw_last_error(database.impl_->db, rc);
  }
  sqlite3_extended_result_codes(database.impl_->db, 1);
  return database;
}

void Database::execute(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(impl_->db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::optional<std::string> message;
    if (err) message = std::string(err);
    sqlite3_free(err);
    throw DatabaseError(sqlite3_extended_errcode(impl_->db), std::move(message));
  }
}

Statement Database::prepare(const std::string& sql) {
  return Statement(impl_->db, sql);
}

CachedStatement Database::prepare_cached(const std::string& sql) {
  return CachedStatement(impl_->cache, impl_->cache.take(impl_->db, sql));
}

void Database::set_statement_cache_capacity(std::size_t capacity) {
  impl_->cache.set_capacity(capacity);
}

const StatementCache& Database::statement_cache() const {
  return impl_->cache;
}

int Database::limit(int id) const {
  return sqlite3_limit(impl_->db, id, -1);
}

int64_t Database::last_insert_rowid() const {
  return (int64_t)sqlite3_last_insert_rowid(impl_->db);
}

std::size_t Database::changes() const {
  return (std::size_t)sqlite3_changes(impl_->db);
}

sqlite3* Database::raw() const {
  return impl_->db;
}

// --- Transaction

Transaction::Transaction(Database& db) : db_(db), done_(false) {
  db_.execute("BEGIN");
}

Transaction::~Transaction() {
  if (done_) return;
  // If ROLLBACK itself fails SQLite has already rolled the transaction back.
  char* err = nullptr;
  if (sqlite3_exec(db_.raw(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
    sqlite3_free(err);
  }
}

void Transaction::commit() {
  db_.execute("COMMIT");
  done_ = true;
}

// --- Blob

Blob::Blob(Database& db, const char* table, const char* column, int64_t row) : db_(db) {
  int rc = sqlite3_blob_open(db_.raw(), "main", table, column, (sqlite3_int64)row,
                             /*read-only*/ 0, &blob_);
  if (rc != SQLITE_OK) {
    sqlite3_blob_close(blob_);   // may be set on failure; closing null is harmless
    blob_ = nullptr;
    throw_last_error(db_.raw(), rc);
  }
}

Blob::~Blob() {
  if (blob_) sqlite3_blob_close(blob_);
}

void Blob::reopen(int64_t row) {
  int rc = sqlite3_blob_reopen(blob_, (sqlite3_int64)row);
  if (rc != SQLITE_OK) throw_last_error(db_.raw(), rc);
}

std::size_t Blob::size() const {
  return (std::size_t)sqlite3_blob_bytes(blob_);
}

void Blob::read(void* buffer, std::size_t length, std::size_t offset) const {
  if (length > (std::size_t)std::numeric_limits<int>::max() ||
      offset > (std::size_t)std::numeric_limits<int>::max()) {
    throw DatabaseError(SQLITE_RANGE, std::string("blob range exceeds SQLite limits"));
  }
  int rc = sqlite3_blob_read(blob_, buffer, (int)length, (int)offset);
  if (rc != SQLITE_OK) throw_last_error(db_.raw(), rc);
}

} // namespace matryoshka
