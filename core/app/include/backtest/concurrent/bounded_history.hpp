#pragma once

#include "backtest/error/errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// BoundedHistory<T>
// -----------------------------------------------------------------------------
// Responsibility: Fixed-capacity, append-only sequence. Once full, every
// append overwrites the oldest entry. Used wherever the engine accumulates
// records for the length of a run (transactions, closed positions, equity
// curve, per-agent opinions, per-symbol price bars) so memory stays bounded
// no matter how long the backtest window is.
//
// Storage: a ring over std::vector<T>. head_ is the slot the next append
// writes to; size_ grows until it reaches capacity_ and stays there.
//
// Thread model: NOT internally synchronized. Every owner (PositionManager,
// MemoryStore) already serializes access under its own mutex; a second lock
// here would only add contention.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedHistory {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  capacity  Maximum number of retained items. Must be > 0.
  //
  // @throws InvalidConfiguration if capacity <= 0. Taken as a signed value
  //         so that a negative number coming from a config file is reported
  //         rather than silently wrapped to a huge size_t.
  // -------------------------------------------------------------------------
  explicit BoundedHistory(long long capacity) {
    if (capacity <= 0) {
      throw InvalidConfiguration("BoundedHistory capacity must be positive, got " +
                                 std::to_string(capacity));
    }
    capacity_ = static_cast<std::size_t>(capacity);
    items_.reserve(capacity_);
  }

  // -------------------------------------------------------------------------
  // append(item)
  // -------------------------------------------------------------------------
  // O(1). Never throws beyond what T's move constructor/assignment throws.
  // -------------------------------------------------------------------------
  void append(T item) {
    if (items_.size() < capacity_) {
      items_.push_back(std::move(item));
    } else {
      items_[head_] = std::move(item);
    }
    head_ = (head_ + 1) % capacity_;
    if (size_ < capacity_) {
      ++size_;
    }
  }

  // Contents in insertion order, oldest first.
  std::vector<T> all() const { return last(size_); }

  // -------------------------------------------------------------------------
  // last(n)
  // -------------------------------------------------------------------------
  // @return The newest min(n, size()) items, oldest of them first. n == 0
  //         yields an empty vector.
  // -------------------------------------------------------------------------
  std::vector<T> last(std::size_t n) const {
    std::vector<T> out;
    const std::size_t count = n < size_ ? n : size_;
    if (count == 0) {
      return out;
    }
    out.reserve(count);
    // Index of the oldest element we want: count slots behind head_.
    std::size_t idx = (head_ + capacity_ - count) % capacity_;
    for (std::size_t i = 0; i < count; ++i) {
      out.push_back(items_[idx]);
      idx = (idx + 1) % capacity_;
    }
    return out;
  }

  // Most recently appended item, if any.
  std::optional<T> latest() const {
    if (size_ == 0) {
      return std::nullopt;
    }
    return items_[(head_ + capacity_ - 1) % capacity_];
  }

  std::size_t size() const { return size_; }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return size_ == 0; }

  void clear() {
    items_.clear();
    head_ = 0;
    size_ = 0;
  }

 private:
  std::size_t capacity_{0};
  std::size_t head_{0};
  std::size_t size_{0};
  std::vector<T> items_;
};

}  // namespace backtest
