#include "circuit/circuit_export.hpp"
#include "circuit/circuit_model.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using qviz::CircuitModel;
using qviz::EngineConfig;
using qviz::Gate;
using qviz::GateKind;
using qviz::Instruction;

EngineConfig quiet_config() {
    EngineConfig cfg;
    cfg.emit_logs = false;
    cfg.seed = 8;
    return cfg;
}

TEST(CircuitExportTests, InstructionsFollowDepthOrder) {
    qviz::Circuit circuit;
    circuit.num_qubits = 2;
    circuit.append(Gate(GateKind::X, {0}));
    circuit.append(Gate(GateKind::RZ, {0}, {}, {0.5}));
    circuit.append(Gate(GateKind::H, {1}));
    circuit.append(Gate(GateKind::CNOT, {1}, {0}));

    const auto instructions = qviz::to_instructions(circuit);
    ASSERT_EQ(instructions.size(), 4u);
    EXPECT_EQ(instructions[0].name, "X");
    EXPECT_EQ(instructions[0].depth, 0);
    EXPECT_EQ(instructions[1].name, "H");
    EXPECT_EQ(instructions[1].depth, 0);
    EXPECT_EQ(instructions[2].name, "RZ");
    EXPECT_EQ(instructions[2].params, (std::vector<double>{0.5}));
    EXPECT_EQ(instructions[3].name, "CNOT");
    EXPECT_EQ(instructions[3].qubits, (std::vector<int>{0, 1}));
    EXPECT_EQ(instructions[3].depth, 2);
}

TEST(CircuitExportTests, BellCircuitAsOpenQasm) {
    CircuitModel model(2, quiet_config());
    model.add_gate(GateKind::H, {0});
    model.add_gate(GateKind::CNOT, {1}, {0});

    const std::string expected =
        "OPENQASM 3.0;\n"
        "include \"stdgates.inc\";\n"
        "qubit[2] q;\n"
        "bit[2] c;\n"
        "h q[0];\n"
        "cx q[0], q[1];\n"
        "c[0] = measure q[0];\n"
        "c[1] = measure q[1];\n";
    EXPECT_EQ(qviz::to_openqasm(model.circuit()), expected);
}

TEST(CircuitExportTests, ParameterizedAndAliasedGatesInOpenQasm) {
    qviz::Circuit circuit;
    circuit.num_qubits = 3;
    circuit.append(Gate(GateKind::SY, {0}));
    circuit.append(Gate(GateKind::CU1, {1}, {0}, {0.5}));
    circuit.append(Gate(GateKind::U3, {2}, {}, {0.25, 0.5, 1}));
    circuit.append(Gate(GateKind::CSWAP, {1, 2}, {0}));
    circuit.append(Gate(GateKind::Sdg, {1}));

    const std::string qasm = qviz::to_openqasm(circuit);
    EXPECT_NE(qasm.find("ry(pi/2) q[0];\n"), std::string::npos);
    EXPECT_NE(qasm.find("cp(0.5) q[0], q[1];\n"), std::string::npos);
    EXPECT_NE(qasm.find("u3(0.25, 0.5, 1) q[2];\n"), std::string::npos);
    EXPECT_NE(qasm.find("cswap q[0], q[1], q[2];\n"), std::string::npos);
    EXPECT_NE(qasm.find("sdg q[1];\n"), std::string::npos);
}

TEST(CircuitExportTests, ExportIgnoresLiveState) {
    CircuitModel model(2, quiet_config());
    model.add_gate(GateKind::H, {0});
    model.add_gate(GateKind::CNOT, {1}, {0});
    const auto before = qviz::to_openqasm(model.circuit());

    model.measure_all();
    EXPECT_EQ(qviz::to_openqasm(model.circuit()), before);
}

TEST(CircuitExportTests, GateFromInstructionSplitsControls) {
    const Gate cx = qviz::gate_from_instruction(Instruction{"cx", {3, 1}, {}, 0});
    EXPECT_EQ(cx.kind(), GateKind::CNOT);
    EXPECT_EQ(cx.controls(), (std::vector<int>{3}));
    EXPECT_EQ(cx.targets(), (std::vector<int>{1}));

    const Gate fredkin = qviz::gate_from_instruction(Instruction{"FREDKIN", {0, 1, 2}, {}, 0});
    EXPECT_EQ(fredkin.controls(), (std::vector<int>{0}));
    EXPECT_EQ(fredkin.targets(), (std::vector<int>{1, 2}));

    EXPECT_THROW(qviz::gate_from_instruction(Instruction{"cx", {0}, {}, 0}), qviz::GateDimensionError);
    EXPECT_THROW(qviz::gate_from_instruction(Instruction{"rx", {0}, {}, 0}), std::invalid_argument);
    EXPECT_THROW(qviz::gate_from_instruction(Instruction{"warp", {0}, {}, 0}), std::invalid_argument);
}

TEST(CircuitExportTests, InstructionListReloadsToTheSameState) {
    CircuitModel source(3, quiet_config());
    source.add_gate(GateKind::H, {0});
    source.add_gate(GateKind::CRX, {2}, {0}, {0.3});
    source.add_gate(GateKind::U2, {1}, {}, {0.1, 0.2});
    source.add_gate(GateKind::CCX, {1}, {0, 2});

    CircuitModel copy(1, quiet_config());
    copy.load_instructions(3, qviz::to_instructions(source.circuit()));
    EXPECT_EQ(copy.engine().amplitudes(), source.engine().amplitudes());
    EXPECT_EQ(qviz::to_openqasm(copy.circuit()), qviz::to_openqasm(source.circuit()));
}

}  // namespace
