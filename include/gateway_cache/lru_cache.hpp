#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gateway_cache {

struct LruStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
};

// Fixed-capacity map that drops the least recently touched entry when a new
// key would exceed the capacity. Insertion and get() count as a touch,
// peek() and iteration do not. Evicted entries are handed back to the caller
// so that any references they hold can be released.
template <typename Key, typename Value> class LruCache {
public:
  using Entry = std::pair<Key, Value>;

  explicit LruCache(std::size_t capacity) : capacity_(capacity) {}
  // The index points into order_; a copy would alias the source list.
  LruCache(const LruCache &) = delete;
  LruCache &operator=(const LruCache &) = delete;
  LruCache(LruCache &&) = default;
  LruCache &operator=(LruCache &&) = default;

  std::size_t capacity() const { return capacity_; }
  std::size_t size() const { return index_.size(); }
  bool empty() const { return index_.empty(); }
  bool contains(const Key &key) const { return index_.contains(key); }
  const LruStats &stats() const { return stats_; }

  Value *get(const Key &key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++stats_.misses;
      return nullptr;
    }
    ++stats_.hits;
    order_.splice(order_.begin(), order_, it->second);
    return &it->second->second;
  }

  Value *peek(const Key &key) {
    auto it = index_.find(key);
    if (it == index_.end())
      return nullptr;
    return &it->second->second;
  }

  const Value *peek(const Key &key) const {
    auto it = index_.find(key);
    if (it == index_.end())
      return nullptr;
    return &it->second->second;
  }

  // Inserts or replaces. Returns the entry pushed out to make room, if any.
  // With a capacity of zero the new entry itself is returned.
  std::optional<Entry> put(const Key &key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      order_.splice(order_.begin(), order_, it->second);
      return std::nullopt;
    }
    if (capacity_ == 0) {
      ++stats_.evictions;
      return Entry{key, std::move(value)};
    }

    std::optional<Entry> evicted;
    if (index_.size() >= capacity_) {
      auto &oldest = order_.back();
      index_.erase(oldest.first);
      evicted = std::move(oldest);
      order_.pop_back();
      ++stats_.evictions;
    }
    order_.emplace_front(key, std::move(value));
    index_[key] = order_.begin();
    return evicted;
  }

  std::optional<Value> erase(const Key &key) {
    auto it = index_.find(key);
    if (it == index_.end())
      return std::nullopt;
    Value value = std::move(it->second->second);
    order_.erase(it->second);
    index_.erase(it);
    return value;
  }

  // Empties the cache, most recently used first.
  std::vector<Entry> drain() {
    std::vector<Entry> out;
    out.reserve(order_.size());
    for (auto &entry : order_)
      out.push_back(std::move(entry));
    order_.clear();
    index_.clear();
    return out;
  }

  // Most recently used first. Does not touch.
  template <typename Fn> void for_each(Fn &&fn) const {
    for (const auto &[key, value] : order_)
      fn(key, value);
  }

  std::optional<Key> oldest_key() const {
    if (order_.empty())
      return std::nullopt;
    return order_.back().first;
  }

private:
  using Order = std::list<Entry>;

  std::size_t capacity_;
  Order order_;
  std::unordered_map<Key, typename Order::iterator> index_;
  LruStats stats_;
};

} // namespace gateway_cache
