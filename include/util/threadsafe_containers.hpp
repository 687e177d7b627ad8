#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace parley {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded std::unordered_map
 *
 * Every operation takes the lock exactly once. Read() and Modify() run the
 * callback under the lock; keep callbacks short and never call back into
 * the same map from them.
 *
 * Usage:
 *   ThreadSafeMap<std::string, HandlerPtr> handlers_;
 *   handlers_.Insert(key, handler);
 *   handlers_.Read(key, [&](const HandlerPtr& h) { h->start_call(); });
 *   handlers_.Rekey(address, pubkey_hex);
 */
template <typename Key, typename Value> class ThreadSafeMap {
public:
  ThreadSafeMap() = default;

  ThreadSafeMap(const ThreadSafeMap &) = delete;
  ThreadSafeMap &operator=(const ThreadSafeMap &) = delete;

  /**
   * Insert or replace
   * Returns true if inserted, false if an existing value was replaced
   */
  bool Insert(const Key &key, const Value &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.insert_or_assign(key, value).second;
  }

  /**
   * Insert only if key doesn't exist
   */
  bool TryInsert(const Key &key, const Value &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.insert({key, value}).second;
  }

  /** Copy of the value, if present. */
  std::optional<Value> Get(const Key &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  template <typename Func> bool Read(const Key &key, Func &&reader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return false;
    }
    reader(it->second);
    return true;
  }

  template <typename Func> bool Modify(const Key &key, Func &&modifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return false;
    }
    modifier(it->second);
    return true;
  }

  bool Contains(const Key &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.count(key) > 0;
  }

  bool Erase(const Key &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.erase(key) > 0;
  }

  /**
   * Erase only if the stored value equals expected.
   * Used when a stale owner must not remove its replacement.
   */
  bool EraseIf(const Key &key, const Value &expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end() || !(it->second == expected)) {
      return false;
    }
    map_.erase(it);
    return true;
  }

  /** Remove and return the value. */
  std::optional<Value> Take(const Key &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return std::nullopt;
    }
    Value value = std::move(it->second);
    map_.erase(it);
    return value;
  }

  /**
   * Move the entry at from to to. Never replaces an entry stored at to.
   * Returns false if from is absent or to is taken; the map is then
   * unchanged.
   */
  bool Rekey(const Key &from, const Key &to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(from);
    if (it == map_.end()) {
      return false;
    }
    if (from == to) {
      return true;
    }
    if (map_.count(to) > 0) {
      return false;
    }
    Value value = std::move(it->second);
    map_.erase(it);
    map_.emplace(to, std::move(value));
    return true;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
  }

  bool Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.empty();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    map_.clear();
  }

  /**
   * Snapshot of all entries (safe to iterate without the lock)
   */
  std::vector<std::pair<Key, Value>> GetAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
  }

private:
  mutable std::mutex mutex_;
  std::unordered_map<Key, Value> map_;
};

} // namespace util
} // namespace parley
