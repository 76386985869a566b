#pragma once

#include <array>
#include <complex>
#include <cstddef>
#include <vector>

#include "state_backend.hpp"

namespace qviz {

class CpuStateBackend : public StateBackend {
  public:
    CpuStateBackend() = default;

    void alloc_array(int n) override;
    int num_qubits() const override;

    std::vector<std::complex<double>>& state() override;
    const std::vector<std::complex<double>>& state() const override;

    void apply_single_qubit_unitary(
        int q,
        const std::array<std::complex<double>, 4>& U,
        std::size_t control_mask = 0
    ) override;

    void apply_controlled_unitary(
        const std::vector<int>& qubits,
        int num_controls,
        const std::vector<std::complex<double>>& U
    ) override;

    void scale(double factor) override;

  private:
    int n_qubits_{0};
    std::vector<std::complex<double>> state_;
};

}  // namespace qviz
