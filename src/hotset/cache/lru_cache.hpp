#pragma once

#include "recency_chain.hpp"
#include "types.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace hotset {
namespace cache {

/// @brief Fixed capacity key-value cache that evicts the least recently used entry.
///
/// Entries live in an arena indexed by chain handles. The chain orders them
/// from least recently used (head) to most recently used (tail) and the index
/// maps every stored key to its handle, so no operation scans the chain.
/// Not thread safe; callers sharing a cache across threads must lock around it.
template <typename Key, typename Value,
          typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class LRUCache {

public:

  using Entry = CacheEntry<Key, Value>;

  // Called once per eviction, after the entry has left the chain and the index.
  // On Put the new entry is stored before the hook runs; an exception thrown by
  // the hook propagates to the caller with the cache already consistent.
  using EvictionHook = std::function<void(const Key&, Value&)>;

  class ConstIterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = const Entry*;
    using reference = const Entry&;

    ConstIterator() = default;

    reference operator*() const { return *cache_->slots_[handle_]; }
    pointer operator->() const { return &*cache_->slots_[handle_]; }

    ConstIterator& operator++() {
      handle_ = cache_->chain_.Newer(handle_);
      return *this;
    }

    ConstIterator operator++(int) {
      ConstIterator previous = *this;
      ++(*this);
      return previous;
    }

    friend bool operator==(const ConstIterator& a, const ConstIterator& b) {
      return a.cache_ == b.cache_ && a.handle_ == b.handle_;
    }

    friend bool operator!=(const ConstIterator& a, const ConstIterator& b) {
      return !(a == b);
    }

  private:
    friend class LRUCache;

    ConstIterator(const LRUCache* cache, Handle handle)
      : cache_(cache), handle_(handle) {}

    const LRUCache* cache_ = nullptr;
    Handle handle_ = kNullHandle;
  };

  // Oldest to newest walk over a cache; restartable, invalidated by any mutation.
  class OrderedView {
  public:
    explicit OrderedView(const LRUCache& cache) : cache_(&cache) {}

    ConstIterator begin() const { return cache_->begin(); }
    ConstIterator end() const { return cache_->end(); }

  private:
    const LRUCache* cache_;
  };

public:

  explicit LRUCache(size_t limit, EvictionHook on_evict = {})
    : limit_(limit), on_evict_(std::move(on_evict)) {
    if (limit_ < 1) {
      throw std::invalid_argument("cache limit must be at least 1");
    }
  }

  explicit LRUCache(const CacheConfig& config, EvictionHook on_evict = {})
    : LRUCache(config.capacity, std::move(on_evict)) {}

  ~LRUCache() = default;

  LRUCache(const LRUCache&) = delete;
  LRUCache& operator=(const LRUCache&) = delete;

  // The source keeps its limit and is left empty, without a hook.
  LRUCache(LRUCache&& other)
    : limit_(other.limit_),
      on_evict_(std::move(other.on_evict_)),
      chain_(std::move(other.chain_)),
      slots_(std::move(other.slots_)),
      index_(std::move(other.index_)) {
    other.on_evict_ = nullptr;
    other.Clear();
  }

  LRUCache& operator=(LRUCache&& other) {
    if (this != &other) {
      limit_ = other.limit_;
      on_evict_ = std::move(other.on_evict_);
      chain_ = std::move(other.chain_);
      slots_ = std::move(other.slots_);
      index_ = std::move(other.index_);
      other.on_evict_ = nullptr;
      other.Clear();
    }
    return *this;
  }

  /// @brief Insert or update the value for a key and mark it most recently used
  /// @return the entry evicted to make room, or std::nullopt if nothing was evicted
  std::optional<Entry> Put(Key key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      slots_[it->second]->value = std::move(value);
      chain_.MoveToBack(it->second);
      return std::nullopt;
    }

    // at capacity the head goes first; with a limit of 1 this empties the chain
    std::optional<Entry> evicted;
    if (chain_.size() == limit_) {
      evicted = PopOldest();
    }

    Handle handle = chain_.Acquire();
    if (handle >= slots_.size()) {
      slots_.resize(handle + 1);
    }
    index_.emplace(key, handle);
    slots_[handle].emplace(Entry{std::move(key), std::move(value)});
    chain_.PushBack(handle);

    // the new entry is already stored, so a throwing hook cannot lose it
    if (evicted && on_evict_) {
      on_evict_(evicted->key, evicted->value);
    }
    return evicted;
  }

  /// @brief Look up a key and mark it most recently used
  /// @return a pointer to the stored value, or nullptr if the key is not cached
  Value* Get(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    chain_.MoveToBack(it->second);
    return &slots_[it->second]->value;
  }

  /// @brief Look up a key without touching its recency
  const Value* Peek(const Key& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    return &slots_[it->second]->value;
  }

  bool Contains(const Key& key) const {
    return index_.find(key) != index_.end();
  }

  /// @brief Delete a key; does not run the eviction hook
  /// @return the removed value, or std::nullopt if the key was not cached
  std::optional<Value> Remove(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return std::nullopt;
    }
    Handle handle = it->second;
    chain_.Unlink(handle);
    return std::optional<Value>(std::move(TakeSlot(handle).value));
  }

  /// @brief Purge the least recently used entry and run the eviction hook on it
  /// @return the purged entry, or std::nullopt if the cache is empty
  std::optional<Entry> EvictOldest() {
    std::optional<Entry> evicted = PopOldest();
    if (evicted && on_evict_) {
      on_evict_(evicted->key, evicted->value);
    }
    return evicted;
  }

  void Clear() {
    chain_.Clear();
    slots_.clear();
    index_.clear();
  }

  size_t Size() const { return chain_.size(); }
  size_t Limit() const { return limit_; }
  bool Empty() const { return chain_.empty(); }

  const Entry* Oldest() const {
    return chain_.empty() ? nullptr : &*slots_[chain_.head()];
  }

  const Entry* Newest() const {
    return chain_.empty() ? nullptr : &*slots_[chain_.tail()];
  }

  ConstIterator begin() const { return ConstIterator(this, chain_.head()); }
  ConstIterator end() const { return ConstIterator(this, kNullHandle); }

  OrderedView Entries() const { return OrderedView(*this); }

  /// @brief Render the cache oldest to newest as "key:value" pairs
  std::string ToString(std::string_view delimiter = HOTSET_ORDER_DELIMITER) const {
    std::string out;
    for (auto it = begin(); it != end(); ++it) {
      if (it != begin()) {
        out.append(delimiter.data(), delimiter.size());
      }
      fmt::format_to(std::back_inserter(out), "{}:{}", it->key, it->value);
    }
    return out;
  }

private:

  std::optional<Entry> PopOldest() {
    Handle handle = chain_.PopFront();
    if (handle == kNullHandle) {
      return std::nullopt;
    }
    return TakeSlot(handle);
  }

  // Moves an unlinked entry out of its slot, drops it from the index and frees the slot.
  Entry TakeSlot(Handle handle) {
    Entry entry = std::move(*slots_[handle]);
    slots_[handle].reset();
    index_.erase(entry.key);
    chain_.Release(handle);
    return entry;
  }

private:

  size_t limit_;
  EvictionHook on_evict_;

  RecencyChain chain_;
  std::vector<std::optional<Entry>> slots_;
  std::unordered_map<Key, Handle, Hash, KeyEqual> index_;

};

} // namespace cache
} // namespace hotset
