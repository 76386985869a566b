#include "bloch_projector.hpp"

#include "engine_statevector.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace qviz {
namespace {

constexpr double kDegenerateTrace = 1e-12;

void check_qubit(std::size_t dimension, int qubit) {
    if (qubit < 0 || qubit >= 63 || (static_cast<std::size_t>(1) << qubit) >= dimension) {
        std::ostringstream oss;
        oss << "Qubit " << qubit << " out of range for a state of dimension " << dimension;
        throw GateDimensionError(oss.str());
    }
}

}  // namespace

double ReducedDensityMatrix::purity() const {
    return rho00 * rho00 + rho11 * rho11 + 2.0 * std::norm(rho01);
}

ReducedDensityMatrix BlochProjector::reduced_density_matrix(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit
) {
    const std::size_t dim = amplitudes.size();
    if (dim == 0) {
        throw std::logic_error("Cannot project an empty state");
    }
    check_qubit(dim, qubit);

    const std::size_t bit = static_cast<std::size_t>(1) << qubit;
    ReducedDensityMatrix rho;
    for (std::size_t base = 0; base < dim; ++base) {
        if (base & bit) {
            continue;
        }
        const auto& a0 = amplitudes[base];
        const auto& a1 = amplitudes[base | bit];
        rho.rho00 += std::norm(a0);
        rho.rho11 += std::norm(a1);
        rho.rho01 += a0 * std::conj(a1);
    }
    return rho;
}

BlochCoordinate BlochProjector::from_density_matrix(const ReducedDensityMatrix& rho) {
    const double tr = rho.trace();
    if (!(tr >= kDegenerateTrace) || !std::isfinite(tr)) {
        throw DegenerateStateError("Cannot project a state with zero trace");
    }

    BlochCoordinate out;
    out.x = 2.0 * rho.rho01.real() / tr;
    out.y = -2.0 * rho.rho01.imag() / tr;
    out.z = (rho.rho00 - rho.rho11) / tr;
    out.p0 = rho.rho00 / tr;
    out.p1 = rho.rho11 / tr;
    out.length = std::sqrt(out.x * out.x + out.y * out.y + out.z * out.z);
    out.theta = out.length > 1e-12 ? std::acos(std::clamp(out.z / out.length, -1.0, 1.0)) : 0.0;
    out.phi = std::atan2(out.y, out.x);
    return out;
}

BlochCoordinate BlochProjector::project(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit
) {
    return from_density_matrix(reduced_density_matrix(amplitudes, qubit));
}

BlochCoordinate BlochProjector::project(const StateVectorEngine& engine, int qubit) {
    return project(engine.amplitudes(), qubit);
}

std::vector<BlochCoordinate> BlochProjector::project_all(
    const std::vector<std::complex<double>>& amplitudes,
    int num_qubits
) {
    std::vector<BlochCoordinate> out;
    out.reserve(static_cast<std::size_t>(std::max(num_qubits, 0)));
    for (int q = 0; q < num_qubits; ++q) {
        out.push_back(project(amplitudes, q));
    }
    return out;
}

std::vector<BlochCoordinate> BlochProjector::project_all(const StateVectorEngine& engine) {
    return project_all(engine.amplitudes(), engine.num_qubits());
}

double BlochProjector::entanglement_entropy(const StateVectorEngine& engine, int qubit) {
    const BlochCoordinate b = project(engine, qubit);
    // Eigenvalues of the reduced state are (1 +- |r|) / 2.
    const double r = std::min(b.length, 1.0);
    double entropy = 0.0;
    for (double lambda : {(1.0 + r) / 2.0, (1.0 - r) / 2.0}) {
        if (lambda > 1e-15) {
            entropy -= lambda * std::log2(lambda);
        }
    }
    return entropy;
}

}  // namespace qviz
