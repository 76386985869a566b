#include "circuit/circuit.hpp"

#include <algorithm>

namespace qviz {

int Circuit::next_depth(const Gate& gate) const {
    int max_depth = -1;
    for (const auto& entry : entries) {
        for (int q : gate.qubits()) {
            if (entry.gate.touches(q)) {
                max_depth = std::max(max_depth, entry.depth);
                break;
            }
        }
    }
    return max_depth + 1;
}

int Circuit::depth() const {
    int max_depth = -1;
    for (const auto& entry : entries) {
        max_depth = std::max(max_depth, entry.depth);
    }
    return max_depth + 1;
}

std::size_t Circuit::append(const Gate& gate) {
    const std::size_t id = next_entry_id++;
    entries.push_back(CircuitEntry{id, gate, next_depth(gate)});
    return id;
}

const CircuitEntry* Circuit::find(std::size_t id) const {
    for (const auto& entry : entries) {
        if (entry.id == id) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<CircuitEntry> Circuit::ordered() const {
    std::vector<CircuitEntry> out = entries;
    std::stable_sort(out.begin(), out.end(), [](const CircuitEntry& a, const CircuitEntry& b) {
        if (a.depth != b.depth) {
            return a.depth < b.depth;
        }
        return a.id < b.id;
    });
    return out;
}

}  // namespace qviz
