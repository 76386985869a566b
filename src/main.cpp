#include "bloch_projector.hpp"
#include "circuit/circuit_export.hpp"
#include "circuit/circuit_model.hpp"
#include "circuit/circuit_templates.hpp"
#include "state_metrics.hpp"

#include <iostream>

int main() {
    qviz::EngineConfig cfg = qviz::EngineConfig::from_environment();
    cfg.emit_logs = false;

    qviz::CircuitModel model(2, cfg);
    model.add_gates(qviz::bell_pair(0, 1));

    const auto& state = model.engine().amplitudes();
    std::cout << "Final state amplitudes:\n";
    for (std::size_t i = 0; i < state.size(); ++i) {
        std::cout << i << ": " << state[i] << '\n';
    }
    std::cout << "State: " << qviz::format_state(state, model.num_qubits()) << '\n';

    const auto snap = model.snapshot();
    for (int q = 0; q < snap.num_qubits; ++q) {
        const auto& b = snap.bloch[static_cast<std::size_t>(q)];
        std::cout << "q" << q << " bloch=(" << b.x << ", " << b.y << ", " << b.z
                  << ") |r|=" << b.length
                  << " entropy=" << qviz::BlochProjector::entanglement_entropy(model.engine(), q)
                  << '\n';
    }

    std::cout << "Counts over 1000 shots:\n";
    for (const auto& [bits, count] : model.sample(1000)) {
        std::cout << "  " << bits << ": " << count << '\n';
    }

    std::cout << qviz::to_openqasm(model.circuit());
    return 0;
}
