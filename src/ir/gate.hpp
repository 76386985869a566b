#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

// Gate vocabulary shared by the gate library, the state-vector engine, the
// circuit model and the exporters. This header carries no simulation state.

namespace qviz {

enum class GateKind {
    I,
    X,
    Y,
    Z,
    H,
    S,
    Sdg,
    T,
    Tdg,
    SX,
    SY,
    RX,
    RY,
    RZ,
    U1,
    U2,
    U3,
    CNOT,
    CZ,
    SWAP,
    CRX,
    CRY,
    CRZ,
    CU1,
    CCX,
    CSWAP,
};

struct GateSpec {
    GateKind kind;
    const char* name;
    int num_controls;
    int num_targets;
    int num_params;

    int arity() const { return num_controls + num_targets; }
};

inline constexpr std::size_t kGateKindCount = 26;

const std::array<GateSpec, kGateKindCount>& all_gate_specs();
const GateSpec& gate_spec(GateKind kind);

std::string to_string(GateKind kind);

// Case-insensitive; accepts the aliases CX, U, CP, TOFFOLI, CCNOT, FREDKIN, ID,
// P. Throws std::invalid_argument for unknown names.
GateKind gate_kind_from_string(const std::string& name);

// A single gate placement. Immutable once constructed; the constructor checks
// arity, parameter count and qubit distinctness but not the register size.
class Gate {
  public:
    Gate(
        GateKind kind,
        std::vector<int> targets,
        std::vector<int> controls = {},
        std::vector<double> params = {}
    );

    GateKind kind() const { return kind_; }
    const GateSpec& spec() const { return gate_spec(kind_); }
    std::string name() const { return spec().name; }

    const std::vector<int>& targets() const { return targets_; }
    const std::vector<int>& controls() const { return controls_; }
    const std::vector<double>& params() const { return params_; }
    double param(std::size_t index) const;

    // Controls first, then targets. This is the order the gate's matrix
    // is laid out in (first qubit = most significant local bit).
    std::vector<int> qubits() const;

    bool touches(int qubit) const;
    int max_qubit() const;

    bool operator==(const Gate& other) const;
    bool operator!=(const Gate& other) const { return !(*this == other); }

  private:
    GateKind kind_;
    std::vector<int> targets_;
    std::vector<int> controls_;
    std::vector<double> params_;
};

std::string describe(const Gate& gate);

}  // namespace qviz
