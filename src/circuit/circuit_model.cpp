#include "circuit/circuit_model.hpp"

#include "circuit/circuit_export.hpp"
#include "errors.hpp"
#include "progress_reporter.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace qviz {

CircuitModel::CircuitModel(
    int num_qubits,
    EngineConfig config,
    std::shared_ptr<const GateLibrary> gates
)
    : config_(config),
      engine_(config, std::move(gates)),
      sampler_(config.seed),
      history_(config.history_capacity) {
    check_qubit_count(num_qubits);
    Circuit initial;
    initial.num_qubits = num_qubits;
    install(initial);
    history_.reset(circuit_);
}

void CircuitModel::log_event(const std::string& category, const std::string& message) {
    logs_.push_back(ExecutionLog{playback_position_, category, message});
    if (progress_reporter_) {
        progress_reporter_->record_log(logs_.back());
    }
}

void CircuitModel::notify_state() {
    if (progress_reporter_) {
        progress_reporter_->state_updated(playback_position_, schedule_.size());
    }
}

void CircuitModel::set_progress_reporter(ProgressReporter* reporter) {
    progress_reporter_ = reporter;
    engine_.set_progress_reporter(reporter);
}

void CircuitModel::check_qubit_count(int num_qubits) const {
    if (num_qubits <= 0 || num_qubits > config_.max_qubits) {
        std::ostringstream oss;
        oss << "Qubit count " << num_qubits << " outside 1.." << config_.max_qubits;
        throw InvalidQubitCountError(oss.str());
    }
}

void CircuitModel::check_gate(const Circuit& target, const Gate& gate) const {
    if (gate.max_qubit() >= target.num_qubits) {
        std::ostringstream oss;
        oss << describe(gate) << " does not fit a " << target.num_qubits << "-qubit circuit";
        throw GateDimensionError(oss.str());
    }
}

void CircuitModel::replay(
    int num_qubits,
    const std::vector<CircuitEntry>& schedule,
    std::size_t count
) {
    engine_.initialize(num_qubits);
    for (std::size_t i = 0; i < count && i < schedule.size(); ++i) {
        engine_.apply_gate(schedule[i].gate);
    }
}

void CircuitModel::install(const Circuit& next) {
    std::vector<CircuitEntry> schedule = next.ordered();
    try {
        replay(next.num_qubits, schedule, schedule.size());
    } catch (...) {
        // Put the engine back where playback of the current circuit stood.
        replay(circuit_.num_qubits, schedule_, playback_position_);
        throw;
    }
    circuit_ = next;
    schedule_ = std::move(schedule);
    histogram_.clear();
    playback_position_ = schedule_.size();
    notify_state();
}

void CircuitModel::commit(
    const Circuit& next,
    const std::string& category,
    const std::string& message
) {
    install(next);
    history_.push(circuit_);
    if (config_.emit_logs) {
        log_event(category, message);
    }
}

std::size_t CircuitModel::add_gate(
    GateKind kind,
    std::vector<int> targets,
    std::vector<int> controls,
    std::vector<double> params
) {
    return add_gate(Gate(kind, std::move(targets), std::move(controls), std::move(params)));
}

std::size_t CircuitModel::add_gate(const Gate& gate) {
    check_gate(circuit_, gate);
    Circuit next = circuit_;
    const std::size_t id = next.append(gate);
    std::ostringstream oss;
    oss << "id=" << id << " depth=" << next.find(id)->depth << " " << describe(gate);
    commit(next, "AddGate", oss.str());
    return id;
}

std::vector<std::size_t> CircuitModel::add_gates(const std::vector<Gate>& gates) {
    Circuit next = circuit_;
    std::vector<std::size_t> ids;
    ids.reserve(gates.size());
    for (const auto& gate : gates) {
        check_gate(next, gate);
        ids.push_back(next.append(gate));
    }
    std::ostringstream oss;
    oss << "count=" << gates.size() << " depth=" << next.depth();
    commit(next, "AddGates", oss.str());
    return ids;
}

void CircuitModel::remove_gate(std::size_t entry_id) {
    const auto it = std::find_if(
        circuit_.entries.begin(), circuit_.entries.end(),
        [entry_id](const CircuitEntry& entry) { return entry.id == entry_id; });
    if (it == circuit_.entries.end()) {
        throw InvalidOperationError("No circuit entry with id " + std::to_string(entry_id));
    }
    Circuit next = circuit_;
    next.entries.erase(next.entries.begin() + (it - circuit_.entries.begin()));
    commit(next, "RemoveGate", "id=" + std::to_string(entry_id));
}

void CircuitModel::add_qubit() {
    check_qubit_count(circuit_.num_qubits + 1);
    Circuit next = circuit_;
    ++next.num_qubits;
    commit(next, "AddQubit", "n_qubits=" + std::to_string(next.num_qubits));
}

void CircuitModel::remove_qubit() {
    if (circuit_.num_qubits <= 1) {
        throw InvalidOperationError("Cannot remove the last qubit");
    }
    Circuit next = circuit_;
    const int removed = --next.num_qubits;
    const auto dropped = std::remove_if(
        next.entries.begin(), next.entries.end(),
        [removed](const CircuitEntry& entry) { return entry.gate.touches(removed); });
    const auto dropped_count = std::distance(dropped, next.entries.end());
    next.entries.erase(dropped, next.entries.end());
    std::ostringstream oss;
    oss << "n_qubits=" << next.num_qubits << " dropped_gates=" << dropped_count;
    commit(next, "RemoveQubit", oss.str());
}

void CircuitModel::clear() {
    Circuit next = circuit_;
    next.entries.clear();
    commit(next, "Clear", "n_qubits=" + std::to_string(next.num_qubits));
}

void CircuitModel::load_instructions(
    int num_qubits,
    const std::vector<Instruction>& instructions
) {
    check_qubit_count(num_qubits);
    Circuit next;
    next.num_qubits = num_qubits;
    next.next_entry_id = circuit_.next_entry_id;
    for (const auto& instruction : instructions) {
        const Gate gate = gate_from_instruction(instruction);
        check_gate(next, gate);
        next.append(gate);
    }
    std::ostringstream oss;
    oss << "n_qubits=" << num_qubits << " count=" << instructions.size();
    commit(next, "Load", oss.str());
}

void CircuitModel::undo() {
    install(history_.undo());
    if (config_.emit_logs) {
        log_event("Undo", "position=" + std::to_string(history_.position()));
    }
}

void CircuitModel::redo() {
    install(history_.redo());
    if (config_.emit_logs) {
        log_event("Redo", "position=" + std::to_string(history_.position()));
    }
}

void CircuitModel::rewind() {
    engine_.initialize(circuit_.num_qubits);
    playback_position_ = 0;
    if (progress_reporter_) {
        progress_reporter_->set_total_steps(schedule_.size());
    }
    notify_state();
}

bool CircuitModel::step() {
    if (playback_complete()) {
        return false;
    }
    engine_.apply_gate(schedule_[playback_position_].gate);
    ++playback_position_;
    if (progress_reporter_) {
        progress_reporter_->increment_completed_steps();
    }
    notify_state();
    return true;
}

void CircuitModel::run() {
    rewind();
    while (step()) {
    }
    if (config_.emit_logs) {
        log_event("Playback", "steps=" + std::to_string(schedule_.size()));
    }
}

std::size_t CircuitModel::measure_all() {
    const std::size_t index = sampler_.sample_full_measurement(engine_);
    notify_state();
    if (config_.emit_logs) {
        log_event("Measure", "bits=" + MeasurementSampler::to_bitstring(index, num_qubits()));
    }
    return index;
}

int CircuitModel::measure_qubit(int qubit) {
    const int bit = sampler_.sample_single_qubit(engine_, qubit);
    notify_state();
    if (config_.emit_logs) {
        std::ostringstream oss;
        oss << "qubit=" << qubit << " bit=" << bit;
        log_event("Measure", oss.str());
    }
    return bit;
}

const MeasurementHistogram& CircuitModel::sample(int shots) {
    histogram_ = sampler_.run_shots(engine_, shots);
    return histogram_;
}

VisualizationSnapshot CircuitModel::snapshot() const {
    VisualizationSnapshot snap;
    snap.num_qubits = engine_.num_qubits();
    snap.amplitudes = engine_.amplitudes();
    snap.bloch = BlochProjector::project_all(engine_);
    snap.histogram = histogram_;
    snap.playback_position = playback_position_;
    snap.total_steps = schedule_.size();
    snap.circuit_depth = circuit_.depth();
    return snap;
}

}  // namespace qviz
