#pragma once

#include <vector>

#include "ir/gate.hpp"

// Ready-made gate sequences for common states and transforms. Each returns
// gates in application order; feed them to CircuitModel::add_gates.

namespace qviz {

// H on `a`, then CNOT a -> b: (|00> + |11>)/sqrt(2).
std::vector<Gate> bell_pair(int a = 0, int b = 1);

// H on the first qubit followed by a CNOT chain along `qubits`.
std::vector<Gate> ghz_state(const std::vector<int>& qubits);

// Quantum Fourier transform from H and controlled phases, without the final
// qubit-reversal swaps.
std::vector<Gate> qft(const std::vector<int>& qubits);
std::vector<Gate> inverse_qft(const std::vector<int>& qubits);

// 0..n-1, for use with the templates above.
std::vector<int> qubit_range(int n);

}  // namespace qviz
