#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace hotset {
namespace cache {

using Handle = std::size_t;

static constexpr Handle kNullHandle = std::numeric_limits<Handle>::max();

struct ChainLink {
  Handle older = kNullHandle;
  Handle newer = kNullHandle;
  bool linked = false;
  bool in_use = false;
};

/// @brief Doubly linked ordering of arena slots, oldest (head) to newest (tail).
///
/// Links are slot handles rather than pointers, so the owner of the payloads
/// can keep them in a parallel array indexed by the same handle. Released
/// slots are recycled before the arena grows.
class RecencyChain {

public:

  RecencyChain() = default;
  ~RecencyChain() = default;

  explicit RecencyChain(size_t capacity);

  RecencyChain(const RecencyChain&) = default;
  RecencyChain& operator=(const RecencyChain&) = default;

  // the source is left empty
  RecencyChain(RecencyChain&& other) noexcept;
  RecencyChain& operator=(RecencyChain&& other) noexcept;

  void Reserve(size_t capacity);

  /// @brief Hand out an unlinked slot
  /// @return a recycled handle if one is free, otherwise a new one at the end of the arena
  Handle Acquire();

  /// @brief Return an unlinked slot to the free list
  void Release(Handle handle);

  void PushBack(Handle handle);
  void Unlink(Handle handle);
  void MoveToBack(Handle handle);

  /// @brief Unlink the oldest slot
  /// @return the unlinked handle, or kNullHandle if the chain is empty
  Handle PopFront();

  void Clear();

  Handle head() const { return head_; }
  Handle tail() const { return tail_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  // arena slots handed out so far, linked or free
  size_t slots() const { return links_.size(); }

  Handle Older(Handle handle) const;
  Handle Newer(Handle handle) const;
  bool IsLinked(Handle handle) const;

private:

  ChainLink& LinkAt(Handle handle);
  const ChainLink& LinkAt(Handle handle) const;

private:

  std::vector<ChainLink> links_;
  std::vector<Handle> free_;

  Handle head_ = kNullHandle;
  Handle tail_ = kNullHandle;
  size_t size_ = 0;

};

} // namespace cache
} // namespace hotset
