#include "measurement_sampler.hpp"

#include "engine_statevector.hpp"
#include "errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace qviz {
namespace {

// Total probability below this is treated as an empty state.
constexpr double kDegenerateProbability = 1e-12;

void require_engine(const StateVectorEngine& engine) {
    if (!engine.is_initialized()) {
        throw std::logic_error("Cannot measure before initialize()");
    }
}

void require_qubit(const StateVectorEngine& engine, int qubit) {
    if (qubit < 0 || qubit >= engine.num_qubits()) {
        std::ostringstream oss;
        oss << "Measurement target " << qubit << " out of range for "
            << engine.num_qubits() << "-qubit register";
        throw GateDimensionError(oss.str());
    }
}

double checked_total(const std::vector<double>& probs) {
    double total = 0.0;
    for (double p : probs) {
        total += p;
    }
    if (!(total >= kDegenerateProbability) || !std::isfinite(total)) {
        throw DegenerateStateError("State norm is zero or not finite before measurement");
    }
    return total;
}

}  // namespace

MeasurementSampler::MeasurementSampler(std::uint64_t seed_value) {
    seed(seed_value);
}

void MeasurementSampler::seed(std::uint64_t seed_value) {
    if (seed_value != kUnseeded) {
        rng_.seed(seed_value);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

std::vector<double> MeasurementSampler::probabilities(
    const std::vector<std::complex<double>>& amplitudes
) {
    std::vector<double> probs;
    probs.reserve(amplitudes.size());
    for (const auto& amp : amplitudes) {
        probs.push_back(std::norm(amp));
    }
    return probs;
}

std::string MeasurementSampler::to_bitstring(std::size_t index, int num_qubits) {
    std::string bits(static_cast<std::size_t>(num_qubits), '0');
    for (int q = 0; q < num_qubits; ++q) {
        if ((index >> q) & 1ULL) {
            bits[static_cast<std::size_t>(num_qubits - 1 - q)] = '1';
        }
    }
    return bits;
}

std::size_t MeasurementSampler::draw_index(const std::vector<double>& probs, double total) {
    // Cumulative walk in basis order; r is scaled so a slightly
    // unnormalized state still samples its own distribution.
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const double r = uniform(rng_) * total;
    double cumulative = 0.0;
    std::size_t last_nonzero = 0;
    for (std::size_t i = 0; i < probs.size(); ++i) {
        if (probs[i] == 0.0) {
            continue;
        }
        cumulative += probs[i];
        last_nonzero = i;
        if (cumulative >= r) {
            return i;
        }
    }
    return last_nonzero;
}

std::size_t MeasurementSampler::sample_full_measurement(StateVectorEngine& engine) {
    require_engine(engine);
    auto& amps = engine.state_vector();
    const std::vector<double> probs = probabilities(amps);
    const double total = checked_total(probs);
    const std::size_t selected = draw_index(probs, total);

    for (auto& amp : amps) {
        amp = {0.0, 0.0};
    }
    amps[selected] = {1.0, 0.0};
    return selected;
}

int MeasurementSampler::sample_single_qubit(StateVectorEngine& engine, int qubit) {
    require_engine(engine);
    require_qubit(engine, qubit);
    auto& amps = engine.state_vector();
    const std::size_t mask = static_cast<std::size_t>(1) << qubit;

    double p0 = 0.0;
    double p1 = 0.0;
    for (std::size_t i = 0; i < amps.size(); ++i) {
        if (i & mask) {
            p1 += std::norm(amps[i]);
        } else {
            p0 += std::norm(amps[i]);
        }
    }
    const double total = p0 + p1;
    if (!(total >= kDegenerateProbability) || !std::isfinite(total)) {
        throw DegenerateStateError("State norm is zero or not finite before measurement");
    }

    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const int outcome = (uniform(rng_) * total < p0) ? 0 : 1;
    const double selected_prob = outcome == 0 ? p0 : p1;
    if (!(selected_prob >= kDegenerateProbability)) {
        throw DegenerateStateError("Selected measurement outcome has zero probability");
    }

    const double norm_factor = std::sqrt(selected_prob);
    for (std::size_t i = 0; i < amps.size(); ++i) {
        const int bit = (i & mask) ? 1 : 0;
        if (bit == outcome) {
            amps[i] /= norm_factor;
        } else {
            amps[i] = {0.0, 0.0};
        }
    }
    return outcome;
}

MeasurementRecord MeasurementSampler::measure_qubits(
    StateVectorEngine& engine,
    const std::vector<int>& targets
) {
    MeasurementRecord record;
    if (targets.empty()) {
        return record;
    }
    require_engine(engine);
    for (std::size_t a = 0; a < targets.size(); ++a) {
        require_qubit(engine, targets[a]);
        for (std::size_t b = a + 1; b < targets.size(); ++b) {
            if (targets[a] == targets[b]) {
                throw GateDimensionError("Measurement targets must be distinct");
            }
        }
    }

    auto& amps = engine.state_vector();
    const std::size_t dim = amps.size();
    const std::size_t k = targets.size();
    const std::size_t combos = static_cast<std::size_t>(1) << k;

    auto outcome_of = [&](std::size_t i) {
        std::size_t outcome = 0;
        for (std::size_t idx = 0; idx < k; ++idx) {
            const std::size_t bit = (i >> targets[idx]) & 1ULL;
            outcome |= (bit << idx);
        }
        return outcome;
    };

    std::vector<double> outcome_probs(combos, 0.0);
    for (std::size_t i = 0; i < dim; ++i) {
        const double p = std::norm(amps[i]);
        if (p == 0.0) {
            continue;
        }
        outcome_probs[outcome_of(i)] += p;
    }
    const double total_prob = checked_total(outcome_probs);
    for (auto& p : outcome_probs) {
        p /= total_prob;
    }

    std::discrete_distribution<std::size_t> dist(outcome_probs.begin(), outcome_probs.end());
    const std::size_t selected = dist(rng_);
    const double norm_factor = std::sqrt(outcome_probs[selected] * total_prob);

    for (std::size_t i = 0; i < dim; ++i) {
        if (outcome_of(i) == selected) {
            amps[i] /= norm_factor;
        } else {
            amps[i] = {0.0, 0.0};
        }
    }

    record.targets = targets;
    record.bits.reserve(k);
    for (std::size_t idx = 0; idx < k; ++idx) {
        record.bits.push_back(static_cast<int>((selected >> idx) & 1ULL));
    }
    return record;
}

MeasurementHistogram MeasurementSampler::run_shots(const StateVectorEngine& engine, int shots) {
    if (shots <= 0) {
        throw std::invalid_argument("shots must be positive");
    }
    require_engine(engine);
    // Every shot starts from the same pre-measurement state, so the
    // distribution is computed once and the live amplitudes are never touched.
    const std::vector<double> probs = probabilities(engine.amplitudes());
    const double total = checked_total(probs);

    MeasurementHistogram histogram;
    for (int shot = 0; shot < shots; ++shot) {
        const std::size_t index = draw_index(probs, total);
        ++histogram[to_bitstring(index, engine.num_qubits())];
    }
    return histogram;
}

}  // namespace qviz
