#pragma once

#include <array>
#include <complex>
#include <cstddef>
#include <vector>

namespace qviz {

// Storage and kernels for the amplitude array. Qubit i corresponds to bit i
// of a basis-state index.
class StateBackend {
  public:
    virtual ~StateBackend() = default;

    virtual void alloc_array(int n) = 0;
    virtual int num_qubits() const = 0;

    virtual std::vector<std::complex<double>>& state() = 0;
    virtual const std::vector<std::complex<double>>& state() const = 0;

    // 2x2 transform on every index pair differing only in bit `q`, restricted
    // to pairs where all bits of `control_mask` are set.
    virtual void apply_single_qubit_unitary(
        int q,
        const std::array<std::complex<double>, 4>& U,
        std::size_t control_mask = 0
    ) = 0;

    // Dense transform over `qubits` (first = most significant local bit).
    // The leading `num_controls` qubits act as controls: only the bottom-right
    // block of U, where they are all 1, is applied.
    virtual void apply_controlled_unitary(
        const std::vector<int>& qubits,
        int num_controls,
        const std::vector<std::complex<double>>& U
    ) = 0;

    virtual void scale(double factor) = 0;
};

}  // namespace qviz
