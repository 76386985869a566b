#include "gate_library.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace qviz {
namespace {

using cd = std::complex<double>;

constexpr double kInvSqrt2 = 0.70710678118654752440;
constexpr double kHalfPi = 1.57079632679489661923;

UnitaryMatrix make_1q(cd u00, cd u01, cd u10, cd u11) {
    return UnitaryMatrix(1, {u00, u01, u10, u11});
}

cd expi(double angle) {
    return std::polar(1.0, angle);
}

}  // namespace

UnitaryMatrix::UnitaryMatrix(int num_qubits)
    : num_qubits_(num_qubits) {
    if (num_qubits < 1 || num_qubits > 3) {
        throw std::invalid_argument("UnitaryMatrix supports 1 to 3 qubits");
    }
    data_.assign(dimension() * dimension(), cd{0.0, 0.0});
}

UnitaryMatrix::UnitaryMatrix(int num_qubits, std::vector<std::complex<double>> data)
    : UnitaryMatrix(num_qubits) {
    if (data.size() != data_.size()) {
        throw std::invalid_argument("UnitaryMatrix data size does not match its dimension");
    }
    data_ = std::move(data);
}

UnitaryMatrix UnitaryMatrix::identity(int num_qubits) {
    UnitaryMatrix out(num_qubits);
    for (std::size_t i = 0; i < out.dimension(); ++i) {
        out(i, i) = cd{1.0, 0.0};
    }
    return out;
}

UnitaryMatrix UnitaryMatrix::adjoint() const {
    UnitaryMatrix out(num_qubits_);
    const std::size_t dim = dimension();
    for (std::size_t r = 0; r < dim; ++r) {
        for (std::size_t c = 0; c < dim; ++c) {
            out(c, r) = std::conj((*this)(r, c));
        }
    }
    return out;
}

UnitaryMatrix UnitaryMatrix::operator*(const UnitaryMatrix& rhs) const {
    if (rhs.num_qubits_ != num_qubits_) {
        throw std::invalid_argument("Matrix product requires equal dimensions");
    }
    UnitaryMatrix out(num_qubits_);
    const std::size_t dim = dimension();
    for (std::size_t r = 0; r < dim; ++r) {
        for (std::size_t c = 0; c < dim; ++c) {
            cd acc{0.0, 0.0};
            for (std::size_t k = 0; k < dim; ++k) {
                acc += (*this)(r, k) * rhs(k, c);
            }
            out(r, c) = acc;
        }
    }
    return out;
}

double UnitaryMatrix::unitarity_error() const {
    const UnitaryMatrix product = adjoint() * (*this);
    return product.max_abs_difference(identity(num_qubits_));
}

double UnitaryMatrix::max_abs_difference(const UnitaryMatrix& other) const {
    if (other.num_qubits_ != num_qubits_) {
        throw std::invalid_argument("Matrix comparison requires equal dimensions");
    }
    double worst = 0.0;
    for (std::size_t i = 0; i < data_.size(); ++i) {
        const double d = std::abs(data_[i] - other.data_[i]);
        if (!std::isfinite(d)) {
            return std::numeric_limits<double>::infinity();
        }
        worst = std::max(worst, d);
    }
    return worst;
}

GateLibrary::GateLibrary() {
    fixed_.emplace(GateKind::I, identity());
    fixed_.emplace(GateKind::X, pauli_x());
    fixed_.emplace(GateKind::Y, pauli_y());
    fixed_.emplace(GateKind::Z, pauli_z());
    fixed_.emplace(GateKind::H, hadamard());
    fixed_.emplace(GateKind::S, phase_s());
    fixed_.emplace(GateKind::Sdg, phase_s_dagger());
    fixed_.emplace(GateKind::T, phase_t());
    fixed_.emplace(GateKind::Tdg, phase_t_dagger());
    fixed_.emplace(GateKind::SX, sqrt_x());
    fixed_.emplace(GateKind::SY, sqrt_y());
    fixed_.emplace(GateKind::CNOT, controlled(pauli_x(), 1));
    fixed_.emplace(GateKind::CZ, controlled(pauli_z(), 1));
    fixed_.emplace(GateKind::SWAP, swap());
    fixed_.emplace(GateKind::CCX, controlled(pauli_x(), 2));
    fixed_.emplace(GateKind::CSWAP, controlled(swap(), 1));
}

UnitaryMatrix GateLibrary::matrix(const Gate& gate) const {
    return matrix(gate.kind(), gate.params());
}

UnitaryMatrix GateLibrary::matrix(GateKind kind, const std::vector<double>& params) const {
    const GateSpec& spec = gate_spec(kind);
    if (static_cast<int>(params.size()) != spec.num_params) {
        throw std::invalid_argument(
            std::string(spec.name) + " expects " + std::to_string(spec.num_params) +
            " parameter(s)");
    }
    const auto it = fixed_.find(kind);
    if (it != fixed_.end()) {
        return it->second;
    }
    switch (kind) {
        case GateKind::RX:
            return rx(params[0]);
        case GateKind::RY:
            return ry(params[0]);
        case GateKind::RZ:
            return rz(params[0]);
        case GateKind::U1:
            return u1(params[0]);
        case GateKind::U2:
            return u2(params[0], params[1]);
        case GateKind::U3:
            return u3(params[0], params[1], params[2]);
        case GateKind::CRX:
            return controlled(rx(params[0]), 1);
        case GateKind::CRY:
            return controlled(ry(params[0]), 1);
        case GateKind::CRZ:
            return controlled(rz(params[0]), 1);
        case GateKind::CU1:
            return controlled(u1(params[0]), 1);
        default:
            break;
    }
    throw std::invalid_argument("No matrix registered for gate " + std::string(spec.name));
}

UnitaryMatrix GateLibrary::identity() {
    return make_1q({1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {1.0, 0.0});
}

UnitaryMatrix GateLibrary::pauli_x() {
    return make_1q({0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}, {0.0, 0.0});
}

UnitaryMatrix GateLibrary::pauli_y() {
    return make_1q({0.0, 0.0}, {0.0, -1.0}, {0.0, 1.0}, {0.0, 0.0});
}

UnitaryMatrix GateLibrary::pauli_z() {
    return make_1q({1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {-1.0, 0.0});
}

UnitaryMatrix GateLibrary::hadamard() {
    return make_1q({kInvSqrt2, 0.0}, {kInvSqrt2, 0.0}, {kInvSqrt2, 0.0}, {-kInvSqrt2, 0.0});
}

UnitaryMatrix GateLibrary::phase_s() {
    return make_1q({1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, 1.0});
}

UnitaryMatrix GateLibrary::phase_s_dagger() {
    return make_1q({1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, -1.0});
}

UnitaryMatrix GateLibrary::phase_t() {
    return make_1q({1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {kInvSqrt2, kInvSqrt2});
}

UnitaryMatrix GateLibrary::phase_t_dagger() {
    return make_1q({1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {kInvSqrt2, -kInvSqrt2});
}

UnitaryMatrix GateLibrary::sqrt_x() {
    return make_1q({0.5, 0.5}, {0.5, -0.5}, {0.5, -0.5}, {0.5, 0.5});
}

UnitaryMatrix GateLibrary::sqrt_y() {
    return make_1q({0.5, 0.5}, {-0.5, -0.5}, {0.5, 0.5}, {0.5, 0.5});
}

UnitaryMatrix GateLibrary::rx(double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return make_1q({c, 0.0}, {0.0, -s}, {0.0, -s}, {c, 0.0});
}

UnitaryMatrix GateLibrary::ry(double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return make_1q({c, 0.0}, {-s, 0.0}, {s, 0.0}, {c, 0.0});
}

UnitaryMatrix GateLibrary::rz(double theta) {
    const double half = theta / 2.0;
    return make_1q(expi(-half), {0.0, 0.0}, {0.0, 0.0}, expi(half));
}

UnitaryMatrix GateLibrary::u1(double lambda) {
    return make_1q({1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, expi(lambda));
}

UnitaryMatrix GateLibrary::u2(double phi, double lambda) {
    return u3(kHalfPi, phi, lambda);
}

UnitaryMatrix GateLibrary::u3(double theta, double phi, double lambda) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return make_1q(
        {c, 0.0},
        -expi(lambda) * s,
        expi(phi) * s,
        expi(phi + lambda) * c);
}

UnitaryMatrix GateLibrary::swap() {
    UnitaryMatrix out(2);
    out(0, 0) = cd{1.0, 0.0};
    out(1, 2) = cd{1.0, 0.0};
    out(2, 1) = cd{1.0, 0.0};
    out(3, 3) = cd{1.0, 0.0};
    return out;
}

UnitaryMatrix GateLibrary::controlled(const UnitaryMatrix& base, int num_controls) {
    if (num_controls < 0) {
        throw std::invalid_argument("Control count must be non-negative");
    }
    const int total = base.num_qubits() + num_controls;
    UnitaryMatrix out = UnitaryMatrix::identity(total);
    const std::size_t block = base.dimension();
    const std::size_t offset = out.dimension() - block;
    for (std::size_t r = 0; r < block; ++r) {
        for (std::size_t c = 0; c < block; ++c) {
            out(offset + r, offset + c) = base(r, c);
        }
    }
    return out;
}

}  // namespace qviz
