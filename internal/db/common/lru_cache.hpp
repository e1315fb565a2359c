#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace stateshift::db::common {

/*
  Read-through LRU cache.

  Not synchronized: the owning backend guards it with its own mutex.
  capacity == 0 disables caching.
*/
template <typename Key, typename Value>
class LruCache {
 public:
  explicit LruCache(std::size_t capacity) : capacity_(capacity) {
  }

  std::optional<Value> Get(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++misses_;
      return std::nullopt;
    }
    ++hits_;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  void Put(const Key& key, Value value) {
    if (capacity_ == 0) return;

    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }

    entries_.emplace_front(key, std::move(value));
    index_[key] = entries_.begin();

    if (entries_.size() > capacity_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
    }
  }

  void Erase(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return;
    entries_.erase(it->second);
    index_.erase(it);
  }

  void Clear() {
    entries_.clear();
    index_.clear();
  }

  std::size_t Size() const {
    return entries_.size();
  }

  double HitRate() const {
    const auto total = hits_ + misses_;
    return total == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(total);
  }

 private:
  using Entry = std::pair<Key, Value>;

  std::size_t                                                   capacity_;
  std::list<Entry>                                              entries_;
  std::unordered_map<Key, typename std::list<Entry>::iterator> index_;
  std::uint64_t                                                 hits_   = 0;
  std::uint64_t                                                 misses_ = 0;
};

} // namespace stateshift::db::common
