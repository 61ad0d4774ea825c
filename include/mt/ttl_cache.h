#pragma once

#include "util/times.h"

#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <unordered_map>

// Concurrent read-mostly cache, every entry expires `ttl` after insertion
template <typename K, typename V>
class TtlCache {
  struct Entry {
    V value;
    TimePoint expires;
  };

  const Clock::duration ttl;

  mutable std::shared_mutex mtx;
  std::unordered_map<K, Entry> entries;

 public:
  explicit TtlCache(Clock::duration ttl) noexcept : ttl{ttl} {}

  std::optional<V> get(const K& key) const {
    std::shared_lock lk{mtx};
    auto it = entries.find(key);
    if (it == entries.end() || it->second.expires <= Clock::now())
      return std::nullopt;
    return it->second.value;
  }

  void put(const K& key, V value) {
    std::unique_lock lk{mtx};
    entries.insert_or_assign(key, Entry{std::move(value), Clock::now() + ttl});
  }

  void invalidate(const K& key) {
    std::unique_lock lk{mtx};
    entries.erase(key);
  }

  void clear() {
    std::unique_lock lk{mtx};
    entries.clear();
  }

  // Drops expired entries, returns how many were removed
  size_t purge() {
    std::unique_lock lk{mtx};
    auto now = Clock::now();
    return std::erase_if(entries,
                         [&](auto& kv) { return kv.second.expires <= now; });
  }

  size_t size() const {
    std::shared_lock lk{mtx};
    return entries.size();
  }

  // `load` runs outside the lock, so two callers may both load on a miss
  template <typename F>
    requires std::is_invocable_r_v<std::optional<V>, F>
  std::optional<V> get_or_load(const K& key, F&& load) {
    if (auto v = get(key))
      return v;
    auto v = std::invoke(std::forward<F>(load));
    if (v)
      put(key, *v);
    return v;
  }
};
