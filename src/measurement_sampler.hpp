#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "ir/measurement_record.types.hpp"

namespace qviz {

class StateVectorEngine;

// Born-rule sampling over a StateVectorEngine's amplitudes. The sampler owns
// its random stream; the engine owns the state.
class MeasurementSampler {
  public:
    explicit MeasurementSampler(std::uint64_t seed = kUnseeded);

    void seed(std::uint64_t seed);

    // Draw one basis index and collapse the engine onto it. Destructive.
    std::size_t sample_full_measurement(StateVectorEngine& engine);

    // Measure one qubit, zero the inconsistent amplitudes and rescale the
    // survivors. Returns the outcome bit.
    int sample_single_qubit(StateVectorEngine& engine, int qubit);

    // Joint measurement of `targets`; bits[i] is the outcome of targets[i].
    MeasurementRecord measure_qubits(StateVectorEngine& engine, const std::vector<int>& targets);

    // Non-destructive: draws `shots` full measurements from the current
    // distribution and aggregates them by bitstring.
    MeasurementHistogram run_shots(const StateVectorEngine& engine, int shots);

    static std::vector<double> probabilities(const std::vector<std::complex<double>>& amplitudes);

    // Qubit n-1 is the leftmost character.
    static std::string to_bitstring(std::size_t index, int num_qubits);

  private:
    std::mt19937_64 rng_;

    std::size_t draw_index(const std::vector<double>& probs, double total);
};

}  // namespace qviz
