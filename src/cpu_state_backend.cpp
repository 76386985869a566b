#include "cpu_state_backend.hpp"

#include <stdexcept>

namespace qviz {

void CpuStateBackend::alloc_array(int n) {
    if (n <= 0) {
        throw std::invalid_argument("alloc_array requires a positive number of qubits");
    }
    const std::size_t dim = static_cast<std::size_t>(1) << n;
    std::vector<std::complex<double>> fresh(dim, std::complex<double>{0.0, 0.0});
    fresh[0] = std::complex<double>{1.0, 0.0};
    state_.swap(fresh);
    n_qubits_ = n;
}

int CpuStateBackend::num_qubits() const {
    return n_qubits_;
}

std::vector<std::complex<double>>& CpuStateBackend::state() {
    return state_;
}

const std::vector<std::complex<double>>& CpuStateBackend::state() const {
    return state_;
}

void CpuStateBackend::apply_single_qubit_unitary(
    int q,
    const std::array<std::complex<double>, 4>& U,
    std::size_t control_mask
) {
    if (q < 0 || q >= n_qubits_) {
        throw std::out_of_range("Invalid qubit index");
    }
    const std::size_t dim = state_.size();
    const std::size_t bit = static_cast<std::size_t>(1) << q;
    if ((control_mask & bit) != 0) {
        throw std::invalid_argument("Target qubit is also a control");
    }
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & bit) == 0 && (i & control_mask) == control_mask) {
            const std::size_t j = i | bit;
            const auto a0 = state_[i];
            const auto a1 = state_[j];
            state_[i] = U[0] * a0 + U[1] * a1;
            state_[j] = U[2] * a0 + U[3] * a1;
        }
    }
}

void CpuStateBackend::apply_controlled_unitary(
    const std::vector<int>& qubits,
    int num_controls,
    const std::vector<std::complex<double>>& U
) {
    const std::size_t k = qubits.size();
    if (k == 0 || num_controls < 0 || static_cast<std::size_t>(num_controls) >= k) {
        throw std::invalid_argument("Controlled unitary needs at least one target");
    }
    const std::size_t local_dim = static_cast<std::size_t>(1) << k;
    if (U.size() != local_dim * local_dim) {
        throw std::invalid_argument("Unitary size does not match qubit count");
    }

    std::size_t gate_mask = 0;
    std::vector<std::size_t> offsets(local_dim, 0);
    for (std::size_t j = 0; j < k; ++j) {
        const int q = qubits[j];
        if (q < 0 || q >= n_qubits_) {
            throw std::out_of_range("Invalid qubit index");
        }
        const std::size_t bit = static_cast<std::size_t>(1) << q;
        if ((gate_mask & bit) != 0) {
            throw std::invalid_argument("Controlled unitary requires distinct qubits");
        }
        gate_mask |= bit;
    }
    for (std::size_t local = 0; local < local_dim; ++local) {
        std::size_t offset = 0;
        for (std::size_t j = 0; j < k; ++j) {
            if ((local >> (k - 1 - j)) & 1ULL) {
                offset |= static_cast<std::size_t>(1) << qubits[j];
            }
        }
        offsets[local] = offset;
    }

    // With controls leading, the all-ones control block is the tail of the
    // local index range.
    const std::size_t block = static_cast<std::size_t>(1) << (k - static_cast<std::size_t>(num_controls));
    const std::size_t first = local_dim - block;
    std::vector<std::complex<double>> in(block);

    const std::size_t dim = state_.size();
    for (std::size_t base = 0; base < dim; ++base) {
        if ((base & gate_mask) != 0) {
            continue;
        }
        for (std::size_t r = 0; r < block; ++r) {
            in[r] = state_[base | offsets[first + r]];
        }
        for (std::size_t r = 0; r < block; ++r) {
            std::complex<double> acc{0.0, 0.0};
            const std::size_t row = (first + r) * local_dim + first;
            for (std::size_t c = 0; c < block; ++c) {
                acc += U[row + c] * in[c];
            }
            state_[base | offsets[first + r]] = acc;
        }
    }
}

void CpuStateBackend::scale(double factor) {
    for (auto& amp : state_) {
        amp *= factor;
    }
}

}  // namespace qviz
