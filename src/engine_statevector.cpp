#include "engine_statevector.hpp"

#include "errors.hpp"
#include "progress_reporter.hpp"

#include <array>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace qviz {
namespace {

// Below this the state carries no probability mass worth rescaling.
constexpr double kDegenerateNormSquared = 1e-24;

}  // namespace

StateVectorEngine::StateVectorEngine(
    EngineConfig cfg,
    std::shared_ptr<const GateLibrary> gates,
    std::unique_ptr<StateBackend> backend
)
    : config_(std::move(cfg)),
      gates_(gates ? std::move(gates) : std::make_shared<const GateLibrary>()),
      backend_(backend ? std::move(backend) : std::make_unique<CpuStateBackend>()) {
    config_.validate();
}

void StateVectorEngine::log_event(const std::string& category, const std::string& message) {
    logs_.push_back(ExecutionLog{gates_applied_, category, message});
    if (progress_reporter_) {
        progress_reporter_->record_log(logs_.back());
    }
}

void StateVectorEngine::set_progress_reporter(ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

void StateVectorEngine::require_initialized(const char* operation) const {
    if (num_qubits_ == 0) {
        throw std::logic_error(std::string("Cannot ") + operation + " before initialize()");
    }
}

void StateVectorEngine::initialize(int n) {
    if (n <= 0 || n > config_.max_qubits) {
        std::ostringstream oss;
        oss << "Qubit count " << n << " outside 1.." << config_.max_qubits;
        throw InvalidQubitCountError(oss.str());
    }
    backend_->alloc_array(n);
    num_qubits_ = backend_->num_qubits();
    gates_applied_ = 0;
    gates_since_check_ = 0;
    logs_.clear();
    if (config_.emit_logs) {
        std::ostringstream oss;
        oss << "Initialize n_qubits=" << n << " dimension=" << dimension();
        log_event("Initialize", oss.str());
    }
}

std::size_t StateVectorEngine::dimension() const {
    return backend_->state().size();
}

const std::vector<std::complex<double>>& StateVectorEngine::amplitudes() const {
    return backend_->state();
}

std::vector<std::complex<double>>& StateVectorEngine::state_vector() {
    return backend_->state();
}

void StateVectorEngine::validate_gate(const Gate& gate, const UnitaryMatrix& matrix) const {
    const std::vector<int> qubits = gate.qubits();
    for (int q : qubits) {
        if (q < 0 || q >= num_qubits_) {
            std::ostringstream oss;
            oss << "Qubit " << q << " out of range for " << num_qubits_
                << "-qubit register in " << describe(gate);
            throw GateDimensionError(oss.str());
        }
    }
    if (matrix.num_qubits() != static_cast<int>(qubits.size())) {
        std::ostringstream oss;
        oss << gate.spec().name << " acts on " << qubits.size()
            << " qubit(s) but the matrix spans " << matrix.num_qubits();
        throw GateDimensionError(oss.str());
    }
    for (const auto& entry : matrix.data()) {
        if (!std::isfinite(entry.real()) || !std::isfinite(entry.imag())) {
            throw std::invalid_argument("Matrix supplied for " + std::string(gate.spec().name) +
                                        " has non-finite entries");
        }
    }
    if (config_.verify_unitarity && !matrix.is_unitary(config_.tolerance * 1e3)) {
        throw std::invalid_argument("Matrix supplied for " + std::string(gate.spec().name) +
                                    " is not unitary");
    }
}

void StateVectorEngine::apply_gate(const Gate& gate) {
    apply_gate(gate, gates_->matrix(gate));
}

void StateVectorEngine::apply_gate(const Gate& gate, const UnitaryMatrix& matrix) {
    require_initialized("apply a gate");
    validate_gate(gate, matrix);

    const auto& controls = gate.controls();
    const auto& targets = gate.targets();
    if (targets.size() == 1) {
        // Pair walk on the target bit; controls restrict it to pairs where
        // every control bit is set, i.e. the bottom-right 2x2 block.
        std::size_t control_mask = 0;
        for (int c : controls) {
            control_mask |= static_cast<std::size_t>(1) << c;
        }
        const std::size_t off = matrix.dimension() - 2;
        const std::array<std::complex<double>, 4> U{{
            matrix(off, off),
            matrix(off, off + 1),
            matrix(off + 1, off),
            matrix(off + 1, off + 1),
        }};
        backend_->apply_single_qubit_unitary(targets[0], U, control_mask);
    } else {
        backend_->apply_controlled_unitary(
            gate.qubits(), static_cast<int>(controls.size()), matrix.data());
    }

    ++gates_applied_;
    ++gates_since_check_;
    if (config_.emit_logs) {
        log_event("ApplyGate", describe(gate));
    }
    if (gates_since_check_ >= config_.renormalize_interval) {
        gates_since_check_ = 0;
        renormalize();
    }
}

double StateVectorEngine::norm_squared() const {
    double total = 0.0;
    for (const auto& amp : backend_->state()) {
        total += std::norm(amp);
    }
    return total;
}

bool StateVectorEngine::renormalize() {
    require_initialized("renormalize");
    const double total = norm_squared();
    if (!(total >= kDegenerateNormSquared) || !std::isfinite(total)) {
        throw DegenerateStateError("State norm is zero or not finite; cannot renormalize");
    }
    const double drift = std::abs(total - 1.0);
    if (drift <= config_.tolerance) {
        return false;
    }
    std::ostringstream oss;
    oss << "Norm drift " << drift << " exceeds tolerance " << config_.tolerance
        << "; rescaling by " << 1.0 / std::sqrt(total);
    log_event("NormalizationError", oss.str());
    backend_->scale(1.0 / std::sqrt(total));
    return true;
}

void StateVectorEngine::require_normalized() const {
    const double drift = std::abs(norm_squared() - 1.0);
    if (drift > config_.tolerance) {
        std::ostringstream oss;
        oss << "Norm drift " << drift << " exceeds tolerance " << config_.tolerance;
        throw NormalizationError(oss.str());
    }
}

}  // namespace qviz
