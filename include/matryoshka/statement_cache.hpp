#pragma once
#include "statement.hpp"
#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>

namespace matryoshka {

// Prepared statements keyed by their SQL text, least recently used first out.
// A statement is removed while somebody uses it and handed back afterwards,
// so two users never share one sqlite3_stmt.
class StatementCache {
public:
  explicit StatementCache(std::size_t capacity = 16);

  // Cached statement if there is one, freshly prepared otherwise.
  Statement take(sqlite3* db, const std::string& sql);
  // Reset and keep; evicts the least recently used entry when over capacity.
  // Never throws: a statement that cannot be stored is finalized instead.
  void give_back(Statement statement) noexcept;

  void set_capacity(std::size_t capacity);
  std::size_t capacity() const { return capacity_; }
  std::size_t size() const { return entries_.size(); }
  bool contains(const std::string& sql) const { return index_.count(sql) != 0; }
  void clear();

private:
  void evict();

  std::size_t capacity_;
  std::list<Statement> entries_;   // most recently used at front
  std::unordered_map<std::string, std::list<Statement>::iterator> index_;
};

// Borrowed cache entry, returned to its cache on destruction.
class CachedStatement {
public:
  CachedStatement(StatementCache& cache, Statement statement)
    : cache_(&cache), statement_(std::move(statement)) {}
  ~CachedStatement();

  CachedStatement(const CachedStatement&) = delete;
  CachedStatement& operator=(const CachedStatement&) = delete;

  Statement* operator->() { return &statement_; }
  Statement& operator*() { return statement_; }

private:
  StatementCache* cache_;
  Statement statement_;
};

} // namespace matryoshka
