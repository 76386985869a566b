#pragma once

#include <complex>
#include <vector>

namespace qviz {

class StateVectorEngine;

// 2x2 partial trace of the full state onto one qubit.
struct ReducedDensityMatrix {
    double rho00 = 0.0;
    double rho11 = 0.0;
    std::complex<double> rho01{0.0, 0.0};

    std::complex<double> rho10() const { return std::conj(rho01); }
    double trace() const { return rho00 + rho11; }
    // Tr(rho^2); 1 for a pure reduced state, 1/2 for a maximally mixed one.
    double purity() const;
};

struct BlochCoordinate {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    // Marginal probabilities of reading 0 and 1 on this qubit.
    double p0 = 0.0;
    double p1 = 0.0;

    double length = 0.0;
    // Polar angle from +z and azimuth from +x, in radians.
    double theta = 0.0;
    double phi = 0.0;
};

// Derived, read-only view of single-qubit marginals. Nothing computed here is
// written back to the engine.
class BlochProjector {
  public:
    static ReducedDensityMatrix reduced_density_matrix(
        const std::vector<std::complex<double>>& amplitudes,
        int qubit
    );

    static BlochCoordinate from_density_matrix(const ReducedDensityMatrix& rho);

    static BlochCoordinate project(const std::vector<std::complex<double>>& amplitudes, int qubit);
    static BlochCoordinate project(const StateVectorEngine& engine, int qubit);

    static std::vector<BlochCoordinate> project_all(
        const std::vector<std::complex<double>>& amplitudes,
        int num_qubits
    );
    static std::vector<BlochCoordinate> project_all(const StateVectorEngine& engine);

    // Von Neumann entropy of the reduced state, in bits.
    static double entanglement_entropy(const StateVectorEngine& engine, int qubit);
};

}  // namespace qviz
