#pragma once

#include <string>
#include <vector>

namespace qviz {

// Flat, depth-ordered form of a circuit entry handed to external
// hardware-execution translators. Independent of any live state.
struct Instruction {
    std::string name;          // canonical gate name, e.g. "CNOT"
    std::vector<int> qubits;   // controls first, then targets
    std::vector<double> params;
    int depth = 0;
};

}  // namespace qviz
