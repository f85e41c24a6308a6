#include "matryoshka/statement_cache.hpp"
#include <new>

namespace matryoshka {

StatementCache::StatementCache(std::size_t capacity) : capacity_(capacity) {}

Statement StatementCache::take(sqlite3* db, const std::string& sql) {
  auto it = index_.find(sql);
  if (it == index_.end()) return Statement(db, sql);

  Statement statement = std::move(*it->second);
  entries_.erase(it->second);
  index_.erase(it);
  return statement;
}

void StatementCache::give_back(Statement statement) noexcept {
  if (!statement || capacity_ == 0) return;   // dropping finalizes it
  statement.reset();

  auto it = index_.find(statement.sql());
  if (it != index_.end()) {
    // an equal statement was prepared while this one was out; keep the newer
    entries_.erase(it->second);
    index_.erase(it);
  }
  try {
    entries_.push_front(std::move(statement));
  } catch (const std::bad_alloc&) {
    return;   // not kept; the statement is finalized on the way out
  }
  try {
    index_[entries_.front().sql()] = entries_.begin();
  } catch (const std::bad_alloc&) {
    entries_.pop_front();
    return;
  }

  while (entries_.size() > capacity_) evict();
}

void StatementCache::set_capacity(std::size_t capacity) {
  capacity_ = capacity;
  while (entries_.size() > capacity_) evict();
}

void StatementCache::clear() {
  index_.clear();
  entries_.clear();
}

void StatementCache::evict() {
  index_.erase(entries_.back().sql());
  entries_.pop_back();
}

CachedStatement::~CachedStatement() {
  cache_->give_back(std::move(statement_));
}

} // namespace matryoshka
