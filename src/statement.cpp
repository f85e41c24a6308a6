#include "matryoshka/statement.hpp"
#include "matryoshka/errors.hpp"
#include <sqlite3.h>
#include <limits>
#include <stdexcept>

namespace matryoshka {

namespace {
std::optional<std::string> connection_message(sqlite3* db) {
  if (!db) return std::nullopt;
  const char* m = sqlite3_errmsg(db);
  if (!m) return std::nullopt;
  return std::string(m);
}
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
  int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    fail(rc);
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
  : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
  other.db_ = nullptr;
  other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    if (stmt_) sqlite3_finalize(stmt_);
    db_ = other.db_;
    stmt_ = other.stmt_;
    sql_ = std::move(other.sql_);
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }
  return *this;
}

void Statement::fail(int rc) const {
  // sqlite3_errmsg reflects the most recent failure on the connection
  throw DatabaseError(db_ ? sqlite3_extended_errcode(db_) : rc, connection_message(db_));
}

void Statement::bind(int index, int64_t value) {
  int rc = sqlite3_bind_int64(stmt_, index, (sqlite3_int64)value);
  if (rc != SQLITE_OK) fail(rc);
}

void Statement::bind(int index, const std::string& text) {
  int rc = sqlite3_bind_text(stmt_, index, text.c_str(), (int)text.size(), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) fail(rc);
}

void Statement::bind_blob(int index, const void* data, std::size_t length) {
  if (length > (std::size_t)std::numeric_limits<int>::max()) {
    throw DatabaseError(SQLITE_TOOBIG, std::string("blob exceeds the bindable size"));
  }
  // a null pointer would bind NULL rather than an empty blob
  static const char empty = 0;
  int rc = sqlite3_bind_blob(stmt_, index, length ? data : &empty, (int)length, SQLITE_STATIC);
  if (rc != SQLITE_OK) fail(rc);
}

void Statement::bind(const char* name, int64_t value) {
  int index = sqlite3_bind_parameter_index(stmt_, name);
  if (index == 0) {
    throw std::logic_error(std::string("unknown SQL parameter ") + name + " in: " + sql_);
  }
  bind(index, value);
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  fail(rc);
}

std::size_t Statement::execute() {
  while (step()) {}
  return (std::size_t)sqlite3_changes(db_);
}

void Statement::reset() {
  // the error of a failed step is reported again by reset; it was already thrown
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool Statement::column_is_null(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::column_int64(int column) const {
  return (int64_t)sqlite3_column_int64(stmt_, column);
}

std::string Statement::column_text(int column) const {
  if (sqlite3_column_type(stmt_, column) != SQLITE_TEXT) {
    throw std::logic_error("column " + std::to_string(column) + " is not text in: " + sql_);
  }
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  int length = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char*>(text), (std::size_t)length);
}

} // namespace matryoshka
