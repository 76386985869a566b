#include "ir/gate.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace qviz {
namespace {

const std::array<GateSpec, kGateKindCount> kGateSpecs{{
    {GateKind::I, "I", 0, 1, 0},
    {GateKind::X, "X", 0, 1, 0},
    {GateKind::Y, "Y", 0, 1, 0},
    {GateKind::Z, "Z", 0, 1, 0},
    {GateKind::H, "H", 0, 1, 0},
    {GateKind::S, "S", 0, 1, 0},
    {GateKind::Sdg, "SDG", 0, 1, 0},
    {GateKind::T, "T", 0, 1, 0},
    {GateKind::Tdg, "TDG", 0, 1, 0},
    {GateKind::SX, "SX", 0, 1, 0},
    {GateKind::SY, "SY", 0, 1, 0},
    {GateKind::RX, "RX", 0, 1, 1},
    {GateKind::RY, "RY", 0, 1, 1},
    {GateKind::RZ, "RZ", 0, 1, 1},
    {GateKind::U1, "U1", 0, 1, 1},
    {GateKind::U2, "U2", 0, 1, 2},
    {GateKind::U3, "U3", 0, 1, 3},
    {GateKind::CNOT, "CNOT", 1, 1, 0},
    {GateKind::CZ, "CZ", 1, 1, 0},
    {GateKind::SWAP, "SWAP", 0, 2, 0},
    {GateKind::CRX, "CRX", 1, 1, 1},
    {GateKind::CRY, "CRY", 1, 1, 1},
    {GateKind::CRZ, "CRZ", 1, 1, 1},
    {GateKind::CU1, "CU1", 1, 1, 1},
    {GateKind::CCX, "CCX", 2, 1, 0},
    {GateKind::CSWAP, "CSWAP", 1, 2, 0},
}};

std::string to_upper(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

const std::unordered_map<std::string, GateKind>& gate_aliases() {
    static const std::unordered_map<std::string, GateKind> aliases = [] {
        std::unordered_map<std::string, GateKind> map;
        for (const auto& spec : kGateSpecs) {
            map.emplace(spec.name, spec.kind);
        }
        map.emplace("ID", GateKind::I);
        map.emplace("SDAG", GateKind::Sdg);
        map.emplace("TDAG", GateKind::Tdg);
        map.emplace("P", GateKind::U1);
        map.emplace("U", GateKind::U3);
        map.emplace("CX", GateKind::CNOT);
        map.emplace("CP", GateKind::CU1);
        map.emplace("CCNOT", GateKind::CCX);
        map.emplace("TOFFOLI", GateKind::CCX);
        map.emplace("FREDKIN", GateKind::CSWAP);
        return map;
    }();
    return aliases;
}

std::string format_indices(const std::vector<int>& indices) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << indices[i];
    }
    oss << "]";
    return oss.str();
}

}  // namespace

const std::array<GateSpec, kGateKindCount>& all_gate_specs() {
    return kGateSpecs;
}

const GateSpec& gate_spec(GateKind kind) {
    const auto index = static_cast<std::size_t>(kind);
    if (index >= kGateSpecs.size()) {
        throw std::invalid_argument("Unknown gate kind");
    }
    return kGateSpecs[index];
}

std::string to_string(GateKind kind) {
    return gate_spec(kind).name;
}

GateKind gate_kind_from_string(const std::string& name) {
    const auto& aliases = gate_aliases();
    const auto it = aliases.find(to_upper(name));
    if (it == aliases.end()) {
        throw std::invalid_argument("Unknown gate: " + name);
    }
    return it->second;
}

Gate::Gate(
    GateKind kind,
    std::vector<int> targets,
    std::vector<int> controls,
    std::vector<double> params
)
    : kind_(kind),
      targets_(std::move(targets)),
      controls_(std::move(controls)),
      params_(std::move(params)) {
    const GateSpec& s = gate_spec(kind_);
    if (static_cast<int>(targets_.size()) != s.num_targets ||
        static_cast<int>(controls_.size()) != s.num_controls) {
        std::ostringstream oss;
        oss << s.name << " expects " << s.num_controls << " control(s) and "
            << s.num_targets << " target(s), got controls=" << format_indices(controls_)
            << " targets=" << format_indices(targets_);
        throw GateDimensionError(oss.str());
    }
    if (static_cast<int>(params_.size()) != s.num_params) {
        throw std::invalid_argument(
            std::string(s.name) + " expects " + std::to_string(s.num_params) +
            " parameter(s), got " + std::to_string(params_.size()));
    }
    for (double p : params_) {
        if (!std::isfinite(p)) {
            throw std::invalid_argument(std::string(s.name) + " parameter must be finite");
        }
    }
    std::vector<int> all = qubits();
    for (int q : all) {
        if (q < 0) {
            throw GateDimensionError("Negative qubit index in " + std::string(s.name));
        }
    }
    std::sort(all.begin(), all.end());
    if (std::adjacent_find(all.begin(), all.end()) != all.end()) {
        throw GateDimensionError(
            std::string(s.name) + " uses a qubit more than once: controls=" +
            format_indices(controls_) + " targets=" + format_indices(targets_));
    }
}

double Gate::param(std::size_t index) const {
    if (index >= params_.size()) {
        throw std::out_of_range("Gate parameter index out of range");
    }
    return params_[index];
}

std::vector<int> Gate::qubits() const {
    std::vector<int> out;
    out.reserve(controls_.size() + targets_.size());
    out.insert(out.end(), controls_.begin(), controls_.end());
    out.insert(out.end(), targets_.begin(), targets_.end());
    return out;
}

bool Gate::touches(int qubit) const {
    return std::find(targets_.begin(), targets_.end(), qubit) != targets_.end() ||
           std::find(controls_.begin(), controls_.end(), qubit) != controls_.end();
}

int Gate::max_qubit() const {
    int out = -1;
    for (int q : targets_) {
        out = std::max(out, q);
    }
    for (int q : controls_) {
        out = std::max(out, q);
    }
    return out;
}

bool Gate::operator==(const Gate& other) const {
    return kind_ == other.kind_ && targets_ == other.targets_ &&
           controls_ == other.controls_ && params_ == other.params_;
}

std::string describe(const Gate& gate) {
    std::ostringstream oss;
    oss << gate.spec().name;
    if (!gate.controls().empty()) {
        oss << " controls=" << format_indices(gate.controls());
    }
    oss << " targets=" << format_indices(gate.targets());
    if (!gate.params().empty()) {
        oss << " params=[";
        for (std::size_t i = 0; i < gate.params().size(); ++i) {
            if (i > 0) {
                oss << ",";
            }
            oss << gate.params()[i];
        }
        oss << "]";
    }
    return oss.str();
}

}  // namespace qviz
