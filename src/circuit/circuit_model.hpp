#pragma once

#include <complex>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "bloch_projector.hpp"
#include "circuit/circuit.hpp"
#include "circuit/circuit_history.hpp"
#include "engine_config.hpp"
#include "engine_statevector.hpp"
#include "gate_library.hpp"
#include "ir/instruction.hpp"
#include "ir/measurement_record.types.hpp"
#include "measurement_sampler.hpp"

namespace qviz {

class ProgressReporter;

// Read-only view handed to renderers after every edit or playback step.
struct VisualizationSnapshot {
    int num_qubits = 0;
    std::vector<std::complex<double>> amplitudes;
    std::vector<BlochCoordinate> bloch;
    MeasurementHistogram histogram;
    std::size_t playback_position = 0;
    std::size_t total_steps = 0;
    int circuit_depth = 0;
};

// Editable circuit plus the engine that mirrors it. Every edit is one
// history step and replays the whole circuit from |0...0>, so the engine
// always reflects the current circuit unless playback is mid-way or a
// destructive measurement has been taken since.
class CircuitModel {
  public:
    explicit CircuitModel(
        int num_qubits = 1,
        EngineConfig config = EngineConfig{},
        std::shared_ptr<const GateLibrary> gates = nullptr
    );

    // Places the gate at the next free depth on its qubits and returns the
    // entry id. Throws GateDimensionError (circuit unchanged) for qubits
    // outside the register.
    std::size_t add_gate(
        GateKind kind,
        std::vector<int> targets,
        std::vector<int> controls = {},
        std::vector<double> params = {}
    );
    std::size_t add_gate(const Gate& gate);

    // Appends a whole sequence as a single history step.
    std::vector<std::size_t> add_gates(const std::vector<Gate>& gates);

    // Depth slots of the other entries are left as they are.
    void remove_gate(std::size_t entry_id);

    void add_qubit();
    // Removes the highest-index qubit and every entry touching it.
    void remove_qubit();

    // Empties the circuit and keeps the qubit count.
    void clear();

    // Replace the circuit with `instructions` over `num_qubits` qubits.
    void load_instructions(int num_qubits, const std::vector<Instruction>& instructions);

    void undo();
    void redo();
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }

    // Step playback. rewind() resets the engine to |0...0>; step() applies
    // the next entry in replay order and returns false when none is left.
    void rewind();
    bool step();
    void run();
    std::size_t playback_position() const { return playback_position_; }
    bool playback_complete() const { return playback_position_ >= schedule_.size(); }

    // Destructive measurements of the live state.
    std::size_t measure_all();
    int measure_qubit(int qubit);

    // Non-destructive shots; the histogram is kept for snapshot().
    const MeasurementHistogram& sample(int shots);

    VisualizationSnapshot snapshot() const;

    const Circuit& circuit() const { return circuit_; }
    int num_qubits() const { return circuit_.num_qubits; }
    const StateVectorEngine& engine() const { return engine_; }
    MeasurementSampler& sampler() { return sampler_; }
    const MeasurementHistogram& last_histogram() const { return histogram_; }
    const CircuitHistory& history() const { return history_; }

    void set_progress_reporter(ProgressReporter* reporter);
    const std::vector<ExecutionLog>& logs() const { return logs_; }

  private:
    EngineConfig config_;
    StateVectorEngine engine_;
    MeasurementSampler sampler_;
    Circuit circuit_;
    CircuitHistory history_;
    std::vector<CircuitEntry> schedule_;
    std::size_t playback_position_ = 0;
    MeasurementHistogram histogram_;
    ProgressReporter* progress_reporter_ = nullptr;
    std::vector<ExecutionLog> logs_;

    void check_gate(const Circuit& target, const Gate& gate) const;
    void check_qubit_count(int num_qubits) const;

    // Replays `next` on the engine, then makes it current. When replay
    // fails the circuit is left as it was and the engine is replayed back to
    // the current playback position before the error propagates.
    void install(const Circuit& next);
    void commit(const Circuit& next, const std::string& category, const std::string& message);
    void replay(int num_qubits, const std::vector<CircuitEntry>& schedule, std::size_t count);

    void log_event(const std::string& category, const std::string& message);
    void notify_state();
};

}  // namespace qviz
