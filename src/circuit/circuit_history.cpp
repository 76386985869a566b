#include "circuit/circuit_history.hpp"

#include "errors.hpp"

#include <stdexcept>

namespace qviz {

CircuitHistory::CircuitHistory(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("history capacity must be positive");
    }
    snapshots_.emplace_back();
}

void CircuitHistory::reset(const Circuit& initial) {
    snapshots_.clear();
    snapshots_.push_back(initial);
    index_ = 0;
}

void CircuitHistory::push(const Circuit& snapshot) {
    snapshots_.erase(snapshots_.begin() + static_cast<std::ptrdiff_t>(index_) + 1, snapshots_.end());
    snapshots_.push_back(snapshot);
    while (snapshots_.size() > capacity_) {
        snapshots_.pop_front();
    }
    index_ = snapshots_.size() - 1;
}

const Circuit& CircuitHistory::undo() {
    if (!can_undo()) {
        throw InvalidOperationError("Nothing to undo");
    }
    --index_;
    return snapshots_[index_];
}

const Circuit& CircuitHistory::redo() {
    if (!can_redo()) {
        throw InvalidOperationError("Nothing to redo");
    }
    ++index_;
    return snapshots_[index_];
}

}  // namespace qviz
