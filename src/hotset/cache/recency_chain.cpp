#include "recency_chain.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace hotset {
namespace cache {

RecencyChain::RecencyChain(size_t capacity) {
  Reserve(capacity);
}

RecencyChain::RecencyChain(RecencyChain&& other) noexcept
  : links_(std::move(other.links_)),
    free_(std::move(other.free_)),
    head_(other.head_),
    tail_(other.tail_),
    size_(other.size_) {
  other.Clear();
}

RecencyChain& RecencyChain::operator=(RecencyChain&& other) noexcept {
  if (this != &other) {
    links_ = std::move(other.links_);
    free_ = std::move(other.free_);
    head_ = other.head_;
    tail_ = other.tail_;
    size_ = other.size_;
    other.Clear();
  }
  return *this;
}

void RecencyChain::Reserve(size_t capacity) {
  links_.reserve(capacity);
}

Handle RecencyChain::Acquire() {
  if (!free_.empty()) {
    Handle handle = free_.back();
    free_.pop_back();
    links_[handle] = ChainLink{};
    links_[handle].in_use = true;
    return handle;
  }
  links_.emplace_back();
  links_.back().in_use = true;
  return links_.size() - 1;
}

void RecencyChain::Release(Handle handle) {
  ChainLink& link = LinkAt(handle);
  if (!link.in_use) {
    throw std::logic_error("slot is already free");
  }
  if (link.linked) {
    throw std::logic_error("cannot release a linked slot");
  }
  link.in_use = false;
  free_.push_back(handle);
}

void RecencyChain::PushBack(Handle handle) {
  ChainLink& link = LinkAt(handle);
  if (!link.in_use) {
    throw std::logic_error("slot was not acquired");
  }
  if (link.linked) {
    throw std::logic_error("slot is already linked");
  }
  link.older = tail_;
  link.newer = kNullHandle;
  link.linked = true;
  if (tail_ != kNullHandle) {
    links_[tail_].newer = handle;
  } else {
    // first in, so it is also the head
    head_ = handle;
  }
  tail_ = handle;
  size_++;
}

void RecencyChain::Unlink(Handle handle) {
  ChainLink& link = LinkAt(handle);
  if (!link.linked) {
    throw std::logic_error("slot is not linked");
  }

  if (link.older != kNullHandle) {
    links_[link.older].newer = link.newer;
  } else {
    head_ = link.newer;
  }

  if (link.newer != kNullHandle) {
    links_[link.newer].older = link.older;
  } else {
    tail_ = link.older;
  }

  link.older = kNullHandle;
  link.newer = kNullHandle;
  link.linked = false;
  size_--;
}

void RecencyChain::MoveToBack(Handle handle) {
  if (handle == tail_ && LinkAt(handle).linked) {
    return;
  }
  Unlink(handle);
  PushBack(handle);
}

Handle RecencyChain::PopFront() {
  Handle handle = head_;
  if (handle == kNullHandle) {
    return kNullHandle;
  }
  Unlink(handle);
  return handle;
}

void RecencyChain::Clear() {
  links_.clear();
  free_.clear();
  head_ = kNullHandle;
  tail_ = kNullHandle;
  size_ = 0;
}

Handle RecencyChain::Older(Handle handle) const {
  return LinkAt(handle).older;
}

Handle RecencyChain::Newer(Handle handle) const {
  return LinkAt(handle).newer;
}

bool RecencyChain::IsLinked(Handle handle) const {
  return handle < links_.size() && links_[handle].linked;
}

//
// Private methods
//

ChainLink& RecencyChain::LinkAt(Handle handle) {
  if (handle >= links_.size()) {
    throw std::out_of_range("invalid chain handle: " + std::to_string(handle));
  }
  return links_[handle];
}

const ChainLink& RecencyChain::LinkAt(Handle handle) const {
  if (handle >= links_.size()) {
    throw std::out_of_range("invalid chain handle: " + std::to_string(handle));
  }
  return links_[handle];
}

} // namespace cache
} // namespace hotset
