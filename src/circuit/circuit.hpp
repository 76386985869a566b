#pragma once

#include <cstddef>
#include <vector>

#include "ir/gate.hpp"

namespace qviz {

struct CircuitEntry {
    std::size_t id;
    Gate gate;
    // Time slot; gates sharing a qubit never share a depth.
    int depth;
};

// Plain value type: copied wholesale into the undo history on every edit.
struct Circuit {
    int num_qubits = 1;
    std::vector<CircuitEntry> entries;
    std::size_t next_entry_id = 0;

    // One past the deepest slot used on any qubit `gate` touches; 0 when the
    // qubits are free.
    int next_depth(const Gate& gate) const;

    // Number of occupied time slots (max depth + 1).
    int depth() const;

    // Appends with the next depth and a fresh id; returns the id.
    std::size_t append(const Gate& gate);

    const CircuitEntry* find(std::size_t id) const;

    // Entries sorted by (depth, id); the replay order.
    std::vector<CircuitEntry> ordered() const;
};

}  // namespace qviz
