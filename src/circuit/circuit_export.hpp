#pragma once

#include <string>
#include <vector>

#include "circuit/circuit.hpp"
#include "ir/instruction.hpp"

// Stateless serialization of a Circuit for external executors. Nothing here
// reads the live state vector.

namespace qviz {

// Depth-ordered flat list; qubits are listed controls first.
std::vector<Instruction> to_instructions(const Circuit& circuit);

// OpenQASM 3.0 program over `stdgates.inc` that measures every qubit at the
// end.
std::string to_openqasm(const Circuit& circuit);

// Throws std::invalid_argument for an unknown name and GateDimensionError
// for a qubit list that does not fit the gate.
Gate gate_from_instruction(const Instruction& instruction);

}  // namespace qviz
