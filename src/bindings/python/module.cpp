#include "circuit/circuit_export.hpp"
#include "circuit/circuit_model.hpp"
#include "circuit/circuit_templates.hpp"
#include "errors.hpp"
#include "state_metrics.hpp"

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>

namespace py = pybind11;

namespace {

using qviz::CircuitModel;
using qviz::EngineConfig;
using qviz::Instruction;

EngineConfig config_from_dict(const py::dict& src) {
    EngineConfig cfg = EngineConfig::from_environment();
    if (src.contains("max_qubits")) {
        cfg.max_qubits = py::cast<int>(src["max_qubits"]);
    }
    if (src.contains("renormalize_interval")) {
        cfg.renormalize_interval = py::cast<std::size_t>(src["renormalize_interval"]);
    }
    if (src.contains("tolerance")) {
        cfg.tolerance = py::cast<double>(src["tolerance"]);
    }
    if (src.contains("history_capacity")) {
        cfg.history_capacity = py::cast<std::size_t>(src["history_capacity"]);
    }
    if (src.contains("emit_logs")) {
        cfg.emit_logs = py::cast<bool>(src["emit_logs"]);
    }
    if (src.contains("seed") && !src["seed"].is_none()) {
        cfg.seed = py::cast<std::uint64_t>(src["seed"]);
    }
    cfg.validate();
    return cfg;
}

Instruction instruction_from_dict(const py::dict& obj) {
    Instruction instr;
    instr.name = py::cast<std::string>(obj["name"]);
    instr.qubits = py::cast<std::vector<int>>(obj["qubits"]);
    if (obj.contains("params")) {
        instr.params = py::cast<std::vector<double>>(obj["params"]);
    }
    if (obj.contains("depth")) {
        instr.depth = py::cast<int>(obj["depth"]);
    }
    return instr;
}

py::dict instruction_to_dict(const Instruction& instr) {
    py::dict out;
    out["name"] = instr.name;
    out["qubits"] = instr.qubits;
    out["params"] = instr.params;
    out["depth"] = instr.depth;
    return out;
}

py::dict execution_log_to_dict(const qviz::ExecutionLog& entry) {
    py::dict log;
    log["step"] = entry.step;
    log["category"] = entry.category;
    log["message"] = entry.message;
    return log;
}

py::dict snapshot_to_dict(const qviz::VisualizationSnapshot& snap) {
    py::dict out;
    out["n_qubits"] = snap.num_qubits;
    out["amplitudes"] = snap.amplitudes;
    py::list bloch;
    for (const auto& b : snap.bloch) {
        py::dict coord;
        coord["x"] = b.x;
        coord["y"] = b.y;
        coord["z"] = b.z;
        coord["p0"] = b.p0;
        coord["p1"] = b.p1;
        coord["length"] = b.length;
        coord["theta"] = b.theta;
        coord["phi"] = b.phi;
        bloch.append(coord);
    }
    out["bloch"] = bloch;
    out["histogram"] = snap.histogram;
    out["playback_position"] = snap.playback_position;
    out["total_steps"] = snap.total_steps;
    out["depth"] = snap.circuit_depth;
    return out;
}

std::unique_ptr<CircuitModel> make_model(int n_qubits, const py::dict& config) {
    return std::make_unique<CircuitModel>(n_qubits, config_from_dict(config));
}

std::size_t add_gate(
    CircuitModel& model,
    const std::string& name,
    std::vector<int> targets,
    std::vector<int> controls,
    std::vector<double> params
) {
    return model.add_gate(
        qviz::gate_kind_from_string(name),
        std::move(targets),
        std::move(controls),
        std::move(params));
}

void apply_template(CircuitModel& model, const std::string& name, std::vector<int> qubits) {
    if (qubits.empty()) {
        qubits = qviz::qubit_range(model.num_qubits());
    }
    if (name == "bell") {
        if (qubits.size() < 2) {
            throw std::invalid_argument("bell template needs two qubits");
        }
        model.add_gates(qviz::bell_pair(qubits[0], qubits[1]));
    } else if (name == "ghz") {
        model.add_gates(qviz::ghz_state(qubits));
    } else if (name == "qft") {
        model.add_gates(qviz::qft(qubits));
    } else if (name == "iqft") {
        model.add_gates(qviz::inverse_qft(qubits));
    } else {
        throw std::invalid_argument("Unknown circuit template: " + name);
    }
}

py::list instructions(const CircuitModel& model) {
    py::list out;
    for (const auto& instr : qviz::to_instructions(model.circuit())) {
        out.append(instruction_to_dict(instr));
    }
    return out;
}

void load(CircuitModel& model, const py::dict& circuit) {
    std::vector<Instruction> program;
    for (const auto& item : py::cast<py::list>(circuit["instructions"])) {
        program.push_back(instruction_from_dict(py::cast<py::dict>(item)));
    }
    model.load_instructions(py::cast<int>(circuit["n_qubits"]), program);
}

py::list logs(const CircuitModel& model) {
    py::list out;
    for (const auto& entry : model.logs()) {
        out.append(execution_log_to_dict(entry));
    }
    return out;
}

py::list gate_names() {
    py::list out;
    for (const auto& spec : qviz::all_gate_specs()) {
        out.append(spec.name);
    }
    return out;
}

}  // namespace

PYBIND11_MODULE(_qviz, m) {
    m.doc() = "Quantum circuit visualizer simulation core";

    py::register_exception<qviz::InvalidQubitCountError>(m, "InvalidQubitCountError", PyExc_ValueError);
    py::register_exception<qviz::GateDimensionError>(m, "GateDimensionError", PyExc_IndexError);
    py::register_exception<qviz::DegenerateStateError>(m, "DegenerateStateError", PyExc_RuntimeError);
    py::register_exception<qviz::InvalidOperationError>(m, "InvalidOperationError", PyExc_RuntimeError);

    m.def("gate_names", &gate_names, "List the canonical gate names.");

    py::class_<CircuitModel>(m, "CircuitModel")
        .def(
            py::init(&make_model),
            py::arg("n_qubits") = 1,
            py::arg("config") = py::dict(),
            "Create a circuit over n_qubits; config keys mirror qviz::EngineConfig."
        )
        .def(
            "add_gate",
            &add_gate,
            py::arg("name"),
            py::arg("targets"),
            py::arg("controls") = std::vector<int>{},
            py::arg("params") = std::vector<double>{},
            "Place a gate at the next free depth and return its entry id."
        )
        .def("remove_gate", &CircuitModel::remove_gate, py::arg("entry_id"))
        .def("add_qubit", &CircuitModel::add_qubit)
        .def("remove_qubit", &CircuitModel::remove_qubit)
        .def("clear", &CircuitModel::clear)
        .def("undo", &CircuitModel::undo)
        .def("redo", &CircuitModel::redo)
        .def("can_undo", &CircuitModel::can_undo)
        .def("can_redo", &CircuitModel::can_redo)
        .def("rewind", &CircuitModel::rewind)
        .def("step", &CircuitModel::step, "Apply the next gate; False once playback is complete.")
        .def("run", &CircuitModel::run)
        .def("measure_all", &CircuitModel::measure_all)
        .def("measure_qubit", &CircuitModel::measure_qubit, py::arg("qubit"))
        .def("sample", &CircuitModel::sample, py::arg("shots"))
        .def(
            "apply_template",
            &apply_template,
            py::arg("name"),
            py::arg("qubits") = std::vector<int>{},
            "Append one of 'bell', 'ghz', 'qft', 'iqft' as a single edit."
        )
        .def("snapshot", [](const CircuitModel& model) { return snapshot_to_dict(model.snapshot()); })
        .def("state_string", [](const CircuitModel& model) {
            return qviz::format_state(model.engine().amplitudes(), model.num_qubits());
        })
        .def("instructions", &instructions)
        .def("load", &load, py::arg("circuit"))
        .def("to_openqasm", [](const CircuitModel& model) { return qviz::to_openqasm(model.circuit()); })
        .def("logs", &logs)
        .def_property_readonly("n_qubits", &CircuitModel::num_qubits);
}
