#include "engine_config.hpp"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace qviz {
namespace {

const char* env_value(const char* name) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0') {
        return nullptr;
    }
    return env;
}

template <typename T>
void read_unsigned(const char* name, T& dst) {
    const char* env = env_value(name);
    if (!env || std::strchr(env, '-')) {
        return;
    }
    try {
        // Values that do not fit T are ignored rather than truncated.
        const unsigned long long parsed = std::stoull(env);
        if (parsed > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            return;
        }
        dst = static_cast<T>(parsed);
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
}

void read_double(const char* name, double& dst) {
    const char* env = env_value(name);
    if (!env) {
        return;
    }
    try {
        const double parsed = std::stod(env);
        if (parsed > 0.0) {
            dst = parsed;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
}

}  // namespace

void EngineConfig::validate() const {
    if (max_qubits <= 0 || max_qubits > kHardQubitLimit) {
        throw std::invalid_argument(
            "max_qubits must lie in 1.." + std::to_string(kHardQubitLimit));
    }
    if (renormalize_interval == 0) {
        throw std::invalid_argument("renormalize_interval must be positive");
    }
    if (!(tolerance > 0.0) || tolerance >= 1.0) {
        throw std::invalid_argument("tolerance must lie in (0, 1)");
    }
    if (history_capacity == 0) {
        throw std::invalid_argument("history_capacity must be positive");
    }
}

EngineConfig EngineConfig::from_environment() {
    return from_environment(EngineConfig{});
}

EngineConfig EngineConfig::from_environment(EngineConfig base) {
    int max_qubits = base.max_qubits;
    read_unsigned("QVIZ_MAX_QUBITS", max_qubits);
    if (max_qubits > 0 && max_qubits <= kHardQubitLimit) {
        base.max_qubits = max_qubits;
    }

    std::size_t interval = base.renormalize_interval;
    read_unsigned("QVIZ_RENORMALIZE_INTERVAL", interval);
    if (interval > 0) {
        base.renormalize_interval = interval;
    }

    double tolerance = base.tolerance;
    read_double("QVIZ_TOLERANCE", tolerance);
    if (tolerance < 1.0) {
        base.tolerance = tolerance;
    }

    std::size_t capacity = base.history_capacity;
    read_unsigned("QVIZ_HISTORY_CAPACITY", capacity);
    if (capacity > 0) {
        base.history_capacity = capacity;
    }

    read_unsigned("QVIZ_SEED", base.seed);
    return base;
}

}  // namespace qviz
