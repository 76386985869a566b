#include "bloch_projector.hpp"
#include "engine_statevector.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

namespace {

using qviz::BlochProjector;
using qviz::EngineConfig;
using qviz::Gate;
using qviz::GateKind;
using qviz::StateVectorEngine;

constexpr double kEps = 1e-9;
constexpr double kPi = 3.14159265358979323846;

EngineConfig quiet_config() {
    EngineConfig cfg;
    cfg.emit_logs = false;
    return cfg;
}

TEST(BlochProjectorTests, BasisStatesSitOnThePoles) {
    StateVectorEngine engine(quiet_config());
    engine.initialize(2);
    engine.apply_gate(Gate(GateKind::X, {1}));

    const auto q0 = BlochProjector::project(engine, 0);
    EXPECT_NEAR(q0.z, 1.0, kEps);
    EXPECT_NEAR(q0.p0, 1.0, kEps);
    EXPECT_NEAR(q0.theta, 0.0, kEps);

    const auto q1 = BlochProjector::project(engine, 1);
    EXPECT_NEAR(q1.z, -1.0, kEps);
    EXPECT_NEAR(q1.p1, 1.0, kEps);
    EXPECT_NEAR(q1.theta, kPi, kEps);
}

TEST(BlochProjectorTests, EquatorStatesHaveExpectedAzimuth) {
    StateVectorEngine engine(quiet_config());
    engine.initialize(1);
    engine.apply_gate(Gate(GateKind::H, {0}));

    auto b = BlochProjector::project(engine, 0);
    EXPECT_NEAR(b.x, 1.0, kEps);
    EXPECT_NEAR(b.y, 0.0, kEps);
    EXPECT_NEAR(b.z, 0.0, kEps);

    engine.apply_gate(Gate(GateKind::S, {0}));
    b = BlochProjector::project(engine, 0);
    EXPECT_NEAR(b.x, 0.0, kEps);
    EXPECT_NEAR(b.y, 1.0, kEps);
    EXPECT_NEAR(b.theta, kPi / 2.0, kEps);
    EXPECT_NEAR(b.phi, kPi / 2.0, kEps);
}

TEST(BlochProjectorTests, ProductStateKeepsEachQubitPure) {
    const double theta = 0.9;
    StateVectorEngine engine(quiet_config());
    engine.initialize(2);
    engine.apply_gate(Gate(GateKind::H, {0}));
    engine.apply_gate(Gate(GateKind::RY, {1}, {}, {theta}));

    const auto b = BlochProjector::project(engine, 1);
    EXPECT_NEAR(b.x, std::sin(theta), kEps);
    EXPECT_NEAR(b.y, 0.0, kEps);
    EXPECT_NEAR(b.z, std::cos(theta), kEps);
    EXPECT_NEAR(b.length, 1.0, kEps);
    EXPECT_NEAR(b.p0, std::cos(theta / 2.0) * std::cos(theta / 2.0), kEps);
    EXPECT_NEAR(BlochProjector::entanglement_entropy(engine, 1), 0.0, 1e-6);
}

TEST(BlochProjectorTests, BellPairHalvesAreMaximallyMixed) {
    StateVectorEngine engine(quiet_config());
    engine.initialize(2);
    engine.apply_gate(Gate(GateKind::H, {0}));
    engine.apply_gate(Gate(GateKind::CNOT, {1}, {0}));

    for (int q = 0; q < 2; ++q) {
        const auto b = BlochProjector::project(engine, q);
        EXPECT_NEAR(b.length, 0.0, kEps);
        EXPECT_NEAR(b.p0, 0.5, kEps);
        EXPECT_NEAR(BlochProjector::entanglement_entropy(engine, q), 1.0, 1e-9);

        const auto rho = BlochProjector::reduced_density_matrix(engine.amplitudes(), q);
        EXPECT_NEAR(rho.purity(), 0.5, kEps);
        EXPECT_NEAR(rho.trace(), 1.0, kEps);
    }
}

TEST(BlochProjectorTests, CoordinatesStayInsideTheUnitBall) {
    StateVectorEngine engine(quiet_config());
    std::mt19937_64 rng(314);
    std::uniform_real_distribution<double> angle(0.0, 2.0 * kPi);
    std::uniform_int_distribution<int> qubit(0, 3);

    engine.initialize(4);
    for (int i = 0; i < 200; ++i) {
        const int a = qubit(rng);
        const int b = (a + 1 + qubit(rng) % 3) % 4;
        engine.apply_gate(Gate(GateKind::U3, {a}, {}, {angle(rng), angle(rng), angle(rng)}));
        engine.apply_gate(Gate(GateKind::CRX, {b}, {a}, {angle(rng)}));

        for (const auto& coord : BlochProjector::project_all(engine)) {
            EXPECT_LE(coord.length, 1.0 + kEps);
        }
    }
}

TEST(BlochProjectorTests, ProjectionIsReadOnly) {
    StateVectorEngine engine(quiet_config());
    engine.initialize(3);
    engine.apply_gate(Gate(GateKind::H, {2}));
    const auto before = engine.amplitudes();
    const auto coords = BlochProjector::project_all(engine);
    EXPECT_EQ(coords.size(), 3u);
    EXPECT_EQ(engine.amplitudes(), before);
}

TEST(BlochProjectorTests, DegenerateAndOutOfRangeInputsThrow) {
    const std::vector<std::complex<double>> zeros(4);
    EXPECT_THROW(BlochProjector::project(zeros, 0), qviz::DegenerateStateError);

    const std::vector<std::complex<double>> ground{{1.0, 0.0}, {0.0, 0.0}};
    EXPECT_THROW(BlochProjector::project(ground, 1), qviz::GateDimensionError);
    EXPECT_THROW(BlochProjector::project(ground, -1), qviz::GateDimensionError);
}

TEST(BlochProjectorTests, NonFiniteAmplitudesAreDegenerate) {
    const std::vector<std::complex<double>> broken{
        {std::numeric_limits<double>::quiet_NaN(), 0.0}, {0.0, 0.0}};
    EXPECT_THROW(BlochProjector::project(broken, 0), qviz::DegenerateStateError);
}

}  // namespace
