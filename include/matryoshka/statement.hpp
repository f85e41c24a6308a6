#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace matryoshka {

// Owning wrapper of one prepared SQLite statement.
class Statement {
public:
  Statement() = default;
  Statement(sqlite3* db, const std::string& sql);   // throws DatabaseError
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  void bind(int index, int64_t value);
  void bind(int index, const std::string& text);
  void bind_blob(int index, const void* data, std::size_t length);
  void bind(const char* name, int64_t value);   // named parameter, e.g. ":index"

  // true while rows are produced, false once the statement is done
  bool step();
  // Runs to completion and returns the number of changed rows.
  std::size_t execute();
  // Rewinds and clears all bindings.
  void reset();

  bool column_is_null(int column) const;
  int64_t column_int64(int column) const;
  std::string column_text(int column) const;   // throws std::logic_error if not text

  const std::string& sql() const { return sql_; }
  explicit operator bool() const { return stmt_ != nullptr; }

private:
  [[noreturn]] void fail(int rc) const;

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  std::string sql_;
};

} // namespace matryoshka
