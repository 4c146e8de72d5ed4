#pragma once

#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace trendbook {

// -----------------------------------------------------------------------------
// LogBuffer<T>
// -----------------------------------------------------------------------------
// Responsibility: An append-only log with a bounded staging area. append()
// writes into the staging vector; once it holds `capacity` rows the batch is
// moved onto the committed log in one splice. flush() commits a partial batch.
//
// Ordering: rows are committed in exactly the order they were appended, so a
// reader that flushes first always sees a chronological FIFO snapshot.
//
// Readers: entries() flushes before returning. The staging area is mutable so
// const readers (AccountingTester, exporters) can take a consistent snapshot
// without a non-const handle on the owner.
//
// Thread model: single-threaded. Owned by the component that appends to it.
// -----------------------------------------------------------------------------
template <typename T>
class LogBuffer {
 public:
  explicit LogBuffer(std::size_t capacity)
      : capacity_(capacity > 0 ? capacity : 1) {
    pending_.reserve(capacity_);
  }

  // -------------------------------------------------------------------------
  // append(entry)
  // -------------------------------------------------------------------------
  // Stages one row; commits the batch when the staging area is full.
  // -------------------------------------------------------------------------
  void append(T entry) {
    pending_.push_back(std::move(entry));
    if (pending_.size() >= capacity_) {
      flush();
    }
  }

  // -------------------------------------------------------------------------
  // flush()
  // -------------------------------------------------------------------------
  // Moves every staged row onto the committed log, preserving order.
  // -------------------------------------------------------------------------
  void flush() const {
    if (pending_.empty()) {
      return;
    }
    committed_.insert(committed_.end(),
                      std::make_move_iterator(pending_.begin()),
                      std::make_move_iterator(pending_.end()));
    pending_.clear();
  }

  // Flushed, chronological view of every appended row.
  const std::vector<T>& entries() const {
    flush();
    return committed_;
  }

  std::size_t size() const { return committed_.size() + pending_.size(); }
  std::size_t pendingCount() const { return pending_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return size() == 0; }

  void clear() {
    pending_.clear();
    committed_.clear();
  }

 private:
  std::size_t capacity_;
  mutable std::vector<T> pending_;
  mutable std::vector<T> committed_;
};

}  // namespace trendbook
