#pragma once

#include <cstddef>
#include <deque>

#include "circuit/circuit.hpp"

namespace qviz {

// Linear undo history of full circuit snapshots. The snapshot at position()
// is the current circuit. Bounded by `capacity`; the oldest snapshot is
// evicted first.
class CircuitHistory {
  public:
    explicit CircuitHistory(std::size_t capacity);

    // Drop everything and start over from `initial`.
    void reset(const Circuit& initial);

    // Record a new current snapshot, discarding any redo branch.
    void push(const Circuit& snapshot);

    bool can_undo() const { return index_ > 0; }
    bool can_redo() const { return index_ + 1 < snapshots_.size(); }

    // Throw InvalidOperationError (position unchanged) past either end.
    const Circuit& undo();
    const Circuit& redo();

    const Circuit& current() const { return snapshots_.at(index_); }
    std::size_t size() const { return snapshots_.size(); }
    std::size_t position() const { return index_; }
    std::size_t capacity() const { return capacity_; }

  private:
    std::size_t capacity_;
    std::deque<Circuit> snapshots_;
    std::size_t index_ = 0;
};

}  // namespace qviz
