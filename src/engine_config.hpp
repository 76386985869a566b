#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace qviz {

// Hard upper bound on the qubit count regardless of configuration;
// 2^30 complex<double> amplitudes is already 16 GiB.
inline constexpr int kHardQubitLimit = 30;

inline constexpr std::uint64_t kUnseeded = std::numeric_limits<std::uint64_t>::max();

struct EngineConfig {
    // Safety ceiling for the amplitude array (2^24 amplitudes = 256 MiB).
    int max_qubits = 24;

    // Number of gate applications between opportunistic norm checks.
    std::size_t renormalize_interval = 64;

    // Allowed drift of sum(|amplitude|^2) from 1.
    double tolerance = 1e-9;

    // Maximum number of circuit snapshots kept for undo/redo.
    std::size_t history_capacity = 50;

    bool emit_logs = true;

#ifdef NDEBUG
    bool verify_unitarity = false;
#else
    bool verify_unitarity = true;
#endif

    // Seed for measurement sampling; kUnseeded draws from std::random_device.
    std::uint64_t seed = kUnseeded;

    // Throws std::invalid_argument when a field is out of range.
    void validate() const;

    // Start from `base` and override fields from QVIZ_* environment
    // variables. Malformed values are ignored.
    static EngineConfig from_environment(EngineConfig base);
    static EngineConfig from_environment();
};

}  // namespace qviz
