#pragma once

#include <complex>
#include <cstddef>
#include <unordered_map>
#include <vector>

#include "ir/gate.hpp"

namespace qviz {

// Dense row-major 2^k x 2^k complex matrix over k = 1..3 qubits. The first
// qubit of the owning gate is the most significant bit of a row/column index.
class UnitaryMatrix {
  public:
    explicit UnitaryMatrix(int num_qubits);
    UnitaryMatrix(int num_qubits, std::vector<std::complex<double>> data);

    static UnitaryMatrix identity(int num_qubits);

    int num_qubits() const { return num_qubits_; }
    std::size_t dimension() const { return static_cast<std::size_t>(1) << num_qubits_; }

    std::complex<double>& operator()(std::size_t row, std::size_t col) {
        return data_[row * dimension() + col];
    }
    const std::complex<double>& operator()(std::size_t row, std::size_t col) const {
        return data_[row * dimension() + col];
    }

    const std::vector<std::complex<double>>& data() const { return data_; }

    UnitaryMatrix adjoint() const;
    UnitaryMatrix operator*(const UnitaryMatrix& rhs) const;

    // Largest elementwise deviation of U^dagger U from the identity.
    double unitarity_error() const;
    bool is_unitary(double eps) const { return unitarity_error() <= eps; }

    double max_abs_difference(const UnitaryMatrix& other) const;

  private:
    int num_qubits_;
    std::vector<std::complex<double>> data_;
};

// Stateless matrix construction. Fixed gates are precomputed once by the
// constructor; parameterized ones are built per call.
class GateLibrary {
  public:
    GateLibrary();

    UnitaryMatrix matrix(const Gate& gate) const;
    UnitaryMatrix matrix(GateKind kind, const std::vector<double>& params = {}) const;

    static UnitaryMatrix identity();
    static UnitaryMatrix pauli_x();
    static UnitaryMatrix pauli_y();
    static UnitaryMatrix pauli_z();
    static UnitaryMatrix hadamard();
    static UnitaryMatrix phase_s();
    static UnitaryMatrix phase_s_dagger();
    static UnitaryMatrix phase_t();
    static UnitaryMatrix phase_t_dagger();
    static UnitaryMatrix sqrt_x();
    static UnitaryMatrix sqrt_y();

    static UnitaryMatrix rx(double theta);
    static UnitaryMatrix ry(double theta);
    static UnitaryMatrix rz(double theta);
    static UnitaryMatrix u1(double lambda);
    static UnitaryMatrix u2(double phi, double lambda);
    static UnitaryMatrix u3(double theta, double phi, double lambda);

    static UnitaryMatrix swap();

    // Embed `base` in the block where all `num_controls` leading qubits are
    // 1; identity elsewhere.
    static UnitaryMatrix controlled(const UnitaryMatrix& base, int num_controls);

  private:
    std::unordered_map<GateKind, UnitaryMatrix> fixed_;
};

}  // namespace qviz
