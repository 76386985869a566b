#include "gate_library.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

using qviz::Gate;
using qviz::GateKind;
using qviz::GateLibrary;
using qviz::UnitaryMatrix;

constexpr double kEps = 1e-12;
constexpr double kPi = 3.14159265358979323846;

std::vector<double> params_for(int count, double theta) {
    std::vector<double> params;
    for (int i = 0; i < count; ++i) {
        params.push_back(theta * (i + 1) / 1.7);
    }
    return params;
}

TEST(GateLibraryTests, EveryGateIsUnitaryAcrossAngles) {
    GateLibrary library;
    for (const auto& spec : qviz::all_gate_specs()) {
        for (int step = 0; step < 16; ++step) {
            const double theta = 2.0 * kPi * step / 16.0;
            const UnitaryMatrix u = library.matrix(spec.kind, params_for(spec.num_params, theta));
            EXPECT_EQ(u.num_qubits(), spec.arity()) << spec.name;
            EXPECT_LT(u.unitarity_error(), 1e-12) << spec.name << " theta=" << theta;
        }
    }
}

TEST(GateLibraryTests, RepeatedCallsAreIdentical) {
    GateLibrary library;
    const auto a = library.matrix(GateKind::U3, {0.3, 1.1, -0.4});
    const auto b = library.matrix(GateKind::U3, {0.3, 1.1, -0.4});
    EXPECT_EQ(a.data(), b.data());
    EXPECT_EQ(library.matrix(GateKind::H).data(), GateLibrary::hadamard().data());
}

TEST(GateLibraryTests, PauliYAndSDaggerKeepImaginaryEntries) {
    const auto y = GateLibrary::pauli_y();
    EXPECT_EQ(y(0, 1), std::complex<double>(0.0, -1.0));
    EXPECT_EQ(y(1, 0), std::complex<double>(0.0, 1.0));

    const auto sdg = GateLibrary::phase_s_dagger();
    EXPECT_EQ(sdg(1, 1), std::complex<double>(0.0, -1.0));
}

TEST(GateLibraryTests, SquareRootsAndPhaseTowerCompose) {
    EXPECT_LT((GateLibrary::sqrt_x() * GateLibrary::sqrt_x()).max_abs_difference(GateLibrary::pauli_x()), kEps);
    EXPECT_LT((GateLibrary::sqrt_y() * GateLibrary::sqrt_y()).max_abs_difference(GateLibrary::pauli_y()), kEps);
    EXPECT_LT((GateLibrary::phase_t() * GateLibrary::phase_t()).max_abs_difference(GateLibrary::phase_s()), kEps);
    EXPECT_LT((GateLibrary::phase_s() * GateLibrary::phase_s()).max_abs_difference(GateLibrary::pauli_z()), kEps);
    EXPECT_LT(
        (GateLibrary::phase_s() * GateLibrary::phase_s_dagger()).max_abs_difference(UnitaryMatrix::identity(1)),
        kEps);
}

TEST(GateLibraryTests, RotationsMatchClosedForms) {
    const double theta = 0.8;
    const auto rx = GateLibrary::rx(theta);
    EXPECT_NEAR(rx(0, 0).real(), std::cos(theta / 2.0), kEps);
    EXPECT_NEAR(rx(0, 1).imag(), -std::sin(theta / 2.0), kEps);

    const auto rz = GateLibrary::rz(theta);
    EXPECT_NEAR(std::arg(rz(0, 0)), -theta / 2.0, kEps);
    EXPECT_NEAR(std::arg(rz(1, 1)), theta / 2.0, kEps);

    // U3(theta, -pi/2, pi/2) is RX(theta).
    EXPECT_LT(GateLibrary::u3(theta, -kPi / 2.0, kPi / 2.0).max_abs_difference(rx), kEps);
    EXPECT_LT(GateLibrary::u3(theta, 0.0, 0.0).max_abs_difference(GateLibrary::ry(theta)), kEps);
}

TEST(GateLibraryTests, ControlledGatesEmbedInTheControlOneBlock) {
    GateLibrary library;
    const auto cnot = library.matrix(GateKind::CNOT);
    EXPECT_EQ(cnot(0, 0), 1.0);
    EXPECT_EQ(cnot(1, 1), 1.0);
    EXPECT_EQ(cnot(2, 3), 1.0);
    EXPECT_EQ(cnot(3, 2), 1.0);
    EXPECT_EQ(cnot(2, 2), 0.0);

    const auto crz = library.matrix(GateKind::CRZ, {0.6});
    const auto rz = GateLibrary::rz(0.6);
    EXPECT_EQ(crz(0, 0), 1.0);
    EXPECT_EQ(crz(1, 1), 1.0);
    EXPECT_EQ(crz(2, 2), rz(0, 0));
    EXPECT_EQ(crz(3, 3), rz(1, 1));

    const auto ccx = library.matrix(GateKind::CCX);
    EXPECT_EQ(ccx(6, 7), 1.0);
    EXPECT_EQ(ccx(7, 6), 1.0);
    EXPECT_EQ(ccx(5, 5), 1.0);

    const auto cswap = library.matrix(GateKind::CSWAP);
    EXPECT_EQ(cswap(5, 6), 1.0);
    EXPECT_EQ(cswap(6, 5), 1.0);
    EXPECT_EQ(cswap(1, 1), 1.0);
    EXPECT_EQ(cswap(2, 2), 1.0);
}

TEST(GateLibraryTests, WrongParameterCountThrows) {
    GateLibrary library;
    EXPECT_THROW(library.matrix(GateKind::RX, {}), std::invalid_argument);
    EXPECT_THROW(library.matrix(GateKind::H, {0.1}), std::invalid_argument);
}

TEST(GateLibraryTests, MatrixDimensionIsBounded) {
    EXPECT_THROW(UnitaryMatrix(0), std::invalid_argument);
    EXPECT_THROW(UnitaryMatrix(4), std::invalid_argument);
    EXPECT_THROW(UnitaryMatrix(1, {1.0, 0.0}), std::invalid_argument);
}

TEST(GateTests, NamesAndAliasesResolve) {
    EXPECT_EQ(qviz::gate_kind_from_string("cx"), GateKind::CNOT);
    EXPECT_EQ(qviz::gate_kind_from_string("Toffoli"), GateKind::CCX);
    EXPECT_EQ(qviz::gate_kind_from_string("fredkin"), GateKind::CSWAP);
    EXPECT_EQ(qviz::gate_kind_from_string("sdg"), GateKind::Sdg);
    EXPECT_EQ(qviz::gate_kind_from_string("U"), GateKind::U3);
    EXPECT_EQ(qviz::to_string(GateKind::CU1), "CU1");
    EXPECT_THROW(qviz::gate_kind_from_string("MEASURE"), std::invalid_argument);
}

TEST(GateTests, ConstructorValidatesShape) {
    EXPECT_THROW(Gate(GateKind::CNOT, {1}, {1}), qviz::GateDimensionError);
    EXPECT_THROW(Gate(GateKind::CNOT, {1}), qviz::GateDimensionError);
    EXPECT_THROW(Gate(GateKind::X, {-1}), qviz::GateDimensionError);
    EXPECT_THROW(Gate(GateKind::CSWAP, {1, 2}, {2}), qviz::GateDimensionError);
    EXPECT_THROW(Gate(GateKind::RZ, {0}), std::invalid_argument);

    const Gate ccx(GateKind::CCX, {2}, {0, 1});
    EXPECT_EQ(ccx.qubits(), (std::vector<int>{0, 1, 2}));
    EXPECT_TRUE(ccx.touches(1));
    EXPECT_FALSE(ccx.touches(3));
    EXPECT_EQ(ccx.max_qubit(), 2);
    EXPECT_EQ(qviz::describe(ccx), "CCX controls=[0,1] targets=[2]");
}

TEST(GateTests, NonFiniteParametersAreRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(Gate(GateKind::RX, {0}, {}, {nan}), std::invalid_argument);
    EXPECT_THROW(Gate(GateKind::RZ, {0}, {}, {-inf}), std::invalid_argument);
    EXPECT_THROW(Gate(GateKind::U3, {0}, {}, {0.1, inf, 0.2}), std::invalid_argument);
    EXPECT_NO_THROW(Gate(GateKind::RY, {0}, {}, {-1e300}));
}

TEST(GateLibraryTests, NonFiniteMatrixIsNotUnitary) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const UnitaryMatrix broken(1, {nan, 0.0, 0.0, 1.0});
    EXPECT_FALSE(broken.is_unitary(1e-6));
    EXPECT_TRUE(std::isinf(broken.unitarity_error()));
    EXPECT_TRUE(std::isinf(broken.max_abs_difference(UnitaryMatrix::identity(1))));
}

}  // namespace
