#include "state_metrics.hpp"

#include "measurement_sampler.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace qviz {
namespace {

void write_coefficient(std::ostringstream& oss, const std::complex<double>& amp, double threshold) {
    const bool has_re = std::abs(amp.real()) >= threshold;
    const bool has_im = std::abs(amp.imag()) >= threshold;
    if (has_re && has_im) {
        oss << amp.real() << (amp.imag() < 0.0 ? " - " : " + ") << std::abs(amp.imag()) << "i";
    } else if (has_im) {
        oss << amp.imag() << "i";
    } else {
        oss << amp.real();
    }
}

}  // namespace

double fidelity(
    const std::vector<std::complex<double>>& a,
    const std::vector<std::complex<double>>& b
) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("fidelity requires states of equal dimension");
    }
    std::complex<double> overlap{0.0, 0.0};
    for (std::size_t i = 0; i < a.size(); ++i) {
        overlap += std::conj(a[i]) * b[i];
    }
    return std::norm(overlap);
}

double shannon_entropy(const std::vector<double>& probabilities) {
    double entropy = 0.0;
    for (double p : probabilities) {
        if (p < 0.0) {
            throw std::invalid_argument("probabilities must be non-negative");
        }
        if (p > 0.0) {
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

std::string format_state(
    const std::vector<std::complex<double>>& amplitudes,
    int num_qubits,
    double threshold,
    int precision
) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision);
    bool first = true;
    for (std::size_t i = 0; i < amplitudes.size(); ++i) {
        if (std::abs(amplitudes[i]) < threshold) {
            continue;
        }
        if (!first) {
            oss << " + ";
        }
        first = false;
        oss << "(";
        write_coefficient(oss, amplitudes[i], threshold);
        oss << ")|" << MeasurementSampler::to_bitstring(i, num_qubits) << ">";
    }
    if (first) {
        return "0";
    }
    return oss.str();
}

}  // namespace qviz
