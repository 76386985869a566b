#pragma once

#include <complex>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "cpu_state_backend.hpp"
#include "engine_config.hpp"
#include "gate_library.hpp"
#include "ir/gate.hpp"
#include "ir/measurement_record.types.hpp"

namespace qviz {

class ProgressReporter;

// Owns the authoritative amplitude array and applies unitary transforms to
// it in place. Single-threaded; no I/O.
class StateVectorEngine {
  public:
    explicit StateVectorEngine(
        EngineConfig cfg = EngineConfig{},
        std::shared_ptr<const GateLibrary> gates = nullptr,
        std::unique_ptr<StateBackend> backend = nullptr
    );

    // Replace the state with |0...0> over n qubits. Throws
    // InvalidQubitCountError (state untouched) for n <= 0 or n > max_qubits.
    void initialize(int n);

    // Throws GateDimensionError (state untouched) for out-of-range or
    // repeated qubits, or a matrix whose size does not match the gate.
    void apply_gate(const Gate& gate, const UnitaryMatrix& matrix);
    void apply_gate(const Gate& gate);

    bool is_initialized() const { return num_qubits_ > 0; }
    int num_qubits() const { return num_qubits_; }
    std::size_t dimension() const;

    const std::vector<std::complex<double>>& amplitudes() const;

    // Mutable view for measurement collapse.
    std::vector<std::complex<double>>& state_vector();

    double norm_squared() const;

    // Rescale by 1/||v|| when the norm is outside tolerance. Returns true when
    // a rescale happened. Throws DegenerateStateError for a ~0 norm.
    bool renormalize();

    // Throws NormalizationError when the norm is outside tolerance.
    void require_normalized() const;

    std::size_t gates_applied() const { return gates_applied_; }

    const EngineConfig& config() const { return config_; }
    const GateLibrary& gate_library() const { return *gates_; }
    std::shared_ptr<const GateLibrary> shared_gate_library() const { return gates_; }

    void set_progress_reporter(ProgressReporter* reporter);
    const std::vector<ExecutionLog>& logs() const { return logs_; }
    void clear_logs() { logs_.clear(); }

  private:
    EngineConfig config_;
    std::shared_ptr<const GateLibrary> gates_;
    std::unique_ptr<StateBackend> backend_;
    ProgressReporter* progress_reporter_ = nullptr;

    int num_qubits_ = 0;
    std::size_t gates_applied_ = 0;
    std::size_t gates_since_check_ = 0;
    std::vector<ExecutionLog> logs_;

    void log_event(const std::string& category, const std::string& message);
    void validate_gate(const Gate& gate, const UnitaryMatrix& matrix) const;
    void require_initialized(const char* operation) const;
};

}  // namespace qviz
