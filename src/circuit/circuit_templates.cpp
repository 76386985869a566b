#include "circuit/circuit_templates.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace qviz {
namespace {

constexpr double kPi = 3.14159265358979323846;

void require_qubits(const std::vector<int>& qubits, const char* name) {
    if (qubits.empty()) {
        throw std::invalid_argument(std::string(name) + " needs at least one qubit");
    }
}

}  // namespace

std::vector<Gate> bell_pair(int a, int b) {
    return {
        Gate(GateKind::H, {a}),
        Gate(GateKind::CNOT, {b}, {a}),
    };
}

std::vector<Gate> ghz_state(const std::vector<int>& qubits) {
    require_qubits(qubits, "ghz_state");
    std::vector<Gate> gates;
    gates.emplace_back(GateKind::H, std::vector<int>{qubits[0]});
    for (std::size_t i = 1; i < qubits.size(); ++i) {
        gates.emplace_back(
            GateKind::CNOT, std::vector<int>{qubits[i]}, std::vector<int>{qubits[i - 1]});
    }
    return gates;
}

std::vector<Gate> qft(const std::vector<int>& qubits) {
    require_qubits(qubits, "qft");
    std::vector<Gate> gates;
    for (std::size_t i = 0; i < qubits.size(); ++i) {
        gates.emplace_back(GateKind::H, std::vector<int>{qubits[i]});
        for (std::size_t j = i + 1; j < qubits.size(); ++j) {
            const double angle = kPi / std::pow(2.0, static_cast<double>(j - i));
            gates.emplace_back(
                GateKind::CU1,
                std::vector<int>{qubits[i]},
                std::vector<int>{qubits[j]},
                std::vector<double>{angle});
        }
    }
    return gates;
}

std::vector<Gate> inverse_qft(const std::vector<int>& qubits) {
    require_qubits(qubits, "inverse_qft");
    std::vector<Gate> gates;
    for (std::size_t ii = qubits.size(); ii-- > 0;) {
        for (std::size_t j = qubits.size() - 1; j > ii; --j) {
            const double angle = -kPi / std::pow(2.0, static_cast<double>(j - ii));
            gates.emplace_back(
                GateKind::CU1,
                std::vector<int>{qubits[ii]},
                std::vector<int>{qubits[j]},
                std::vector<double>{angle});
        }
        gates.emplace_back(GateKind::H, std::vector<int>{qubits[ii]});
    }
    return gates;
}

std::vector<int> qubit_range(int n) {
    std::vector<int> out;
    for (int q = 0; q < n; ++q) {
        out.push_back(q);
    }
    return out;
}

}  // namespace qviz
