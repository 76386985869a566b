#pragma once

#include <stdexcept>
#include <string>

// Error kinds raised by the simulation core. All of them are local and
// recoverable at the call site; the object that raised keeps its prior state.

namespace qviz {

// Requested qubit count is <= 0 or above the configured ceiling.
class InvalidQubitCountError : public std::invalid_argument {
  public:
    explicit InvalidQubitCountError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Qubit index out of range, or a qubit used twice within one gate.
class GateDimensionError : public std::out_of_range {
  public:
    explicit GateDimensionError(const std::string& what)
        : std::out_of_range(what) {}
};

// Norm drifted outside tolerance. Normally repaired by renormalization and
// only recorded as a log event.
class NormalizationError : public std::runtime_error {
  public:
    explicit NormalizationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Measurement or projection on a state whose total probability is ~0.
class DegenerateStateError : public std::runtime_error {
  public:
    explicit DegenerateStateError(const std::string& what)
        : std::runtime_error(what) {}
};

// Qubit removal below one qubit, undo/redo past history bounds, or an
// unknown circuit entry.
class InvalidOperationError : public std::logic_error {
  public:
    explicit InvalidOperationError(const std::string& what)
        : std::logic_error(what) {}
};

}  // namespace qviz
