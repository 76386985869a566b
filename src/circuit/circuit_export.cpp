#include "circuit/circuit_export.hpp"

#include "errors.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace qviz {
namespace {

const char* qasm_name(GateKind kind) {
    switch (kind) {
        case GateKind::I:
            return "id";
        case GateKind::X:
            return "x";
        case GateKind::Y:
            return "y";
        case GateKind::Z:
            return "z";
        case GateKind::H:
            return "h";
        case GateKind::S:
            return "s";
        case GateKind::Sdg:
            return "sdg";
        case GateKind::T:
            return "t";
        case GateKind::Tdg:
            return "tdg";
        case GateKind::SX:
            return "sx";
        case GateKind::SY:
        case GateKind::RY:
            return "ry";
        case GateKind::RX:
            return "rx";
        case GateKind::RZ:
            return "rz";
        case GateKind::U1:
            return "p";
        case GateKind::U2:
            return "u2";
        case GateKind::U3:
            return "u3";
        case GateKind::CNOT:
            return "cx";
        case GateKind::CZ:
            return "cz";
        case GateKind::SWAP:
            return "swap";
        case GateKind::CRX:
            return "crx";
        case GateKind::CRY:
            return "cry";
        case GateKind::CRZ:
            return "crz";
        case GateKind::CU1:
            return "cp";
        case GateKind::CCX:
            return "ccx";
        case GateKind::CSWAP:
            return "cswap";
    }
    throw std::invalid_argument("Gate has no OpenQASM name");
}

void append_params(const std::vector<double>& params, std::ostringstream& out) {
    if (params.empty()) {
        return;
    }
    out << '(';
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << params[i];
    }
    out << ')';
}

}  // namespace

std::vector<Instruction> to_instructions(const Circuit& circuit) {
    std::vector<Instruction> out;
    out.reserve(circuit.entries.size());
    for (const auto& entry : circuit.ordered()) {
        out.push_back(Instruction{
            entry.gate.spec().name,
            entry.gate.qubits(),
            entry.gate.params(),
            entry.depth,
        });
    }
    return out;
}

std::string to_openqasm(const Circuit& circuit) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << "OPENQASM 3.0;\n";
    out << "include \"stdgates.inc\";\n";
    out << "qubit[" << circuit.num_qubits << "] q;\n";
    out << "bit[" << circuit.num_qubits << "] c;\n";

    for (const auto& entry : circuit.ordered()) {
        const Gate& gate = entry.gate;
        out << qasm_name(gate.kind());
        if (gate.kind() == GateKind::SY) {
            // sqrt(Y) equals ry(pi/2) up to a global phase.
            out << "(pi/2)";
        } else {
            append_params(gate.params(), out);
        }
        const std::vector<int> qubits = gate.qubits();
        for (std::size_t i = 0; i < qubits.size(); ++i) {
            out << (i == 0 ? " " : ", ") << "q[" << qubits[i] << "]";
        }
        out << ";\n";
    }

    for (int q = 0; q < circuit.num_qubits; ++q) {
        out << "c[" << q << "] = measure q[" << q << "];\n";
    }
    return out.str();
}

Gate gate_from_instruction(const Instruction& instruction) {
    const GateKind kind = gate_kind_from_string(instruction.name);
    const GateSpec& spec = gate_spec(kind);
    if (static_cast<int>(instruction.qubits.size()) != spec.arity()) {
        std::ostringstream oss;
        oss << spec.name << " expects " << spec.arity() << " qubit(s), got "
            << instruction.qubits.size();
        throw GateDimensionError(oss.str());
    }
    const auto split = instruction.qubits.begin() + spec.num_controls;
    return Gate(
        kind,
        std::vector<int>(split, instruction.qubits.end()),
        std::vector<int>(instruction.qubits.begin(), split),
        instruction.params);
}

}  // namespace qviz
