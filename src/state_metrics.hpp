#pragma once

#include <complex>
#include <string>
#include <vector>

namespace qviz {

// |<a|b>|^2. Throws std::invalid_argument for vectors of different size.
double fidelity(
    const std::vector<std::complex<double>>& a,
    const std::vector<std::complex<double>>& b
);

// Shannon entropy in bits of a probability vector; zero entries contribute 0.
double shannon_entropy(const std::vector<double>& probabilities);

// Dirac-notation rendering such as "(0.707)|00> + (0.707)|11>". Terms with
// |amplitude| below `threshold` are omitted; an all-zero vector prints "0".
std::string format_state(
    const std::vector<std::complex<double>>& amplitudes,
    int num_qubits,
    double threshold = 1e-3,
    int precision = 3
);

}  // namespace qviz
