#include "analysis/errors.hpp"
#include "analysis/heavy_output.hpp"
#include "analysis/quantum_volume.hpp"
#include "experiment/experiment.hpp"
#include "experiment/experiment_data.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace py = pybind11;

using namespace bench_analysis;

namespace {

TrialRecord trial_from_dict(const py::dict& obj) {
    TrialRecord trial;
    if (!obj.contains("counts") || !obj.contains("metadata")) {
        throw std::invalid_argument("trial dict requires 'counts' and 'metadata'");
    }
    trial.counts = py::cast<std::map<std::string, std::uint64_t>>(obj["counts"]);
    const py::dict metadata = py::cast<py::dict>(obj["metadata"]);
    if (!metadata.contains("depth") || !metadata.contains("ideal_probabilities")) {
        throw std::invalid_argument(
            "trial metadata requires 'depth' and 'ideal_probabilities'");
    }
    trial.metadata.depth = py::cast<int>(metadata["depth"]);
    trial.metadata.ideal_probabilities =
        py::cast<std::vector<double>>(metadata["ideal_probabilities"]);
    return trial;
}

std::vector<TrialRecord> trials_from_list(const py::list& items) {
    std::vector<TrialRecord> trials;
    trials.reserve(items.size());
    for (const auto& item : items) {
        trials.push_back(trial_from_dict(py::cast<py::dict>(item)));
    }
    return trials;
}

std::shared_ptr<const Experiment> experiment_from_dict(const py::dict& obj) {
    const std::string type = obj.contains("type")
        ? py::cast<std::string>(obj["type"])
        : std::string("QuantumVolume");
    if (type == "QuantumVolume") {
        return std::make_shared<QuantumVolumeExperiment>(
            py::cast<std::vector<int>>(obj["qubits"]));
    }
    std::vector<std::shared_ptr<const Experiment>> components;
    for (const auto& item : py::cast<py::list>(obj["components"])) {
        components.push_back(experiment_from_dict(py::cast<py::dict>(item)));
    }
    if (type == "BatchExperiment") {
        return std::make_shared<BatchExperiment>(std::move(components));
    }
    if (type == "ParallelExperiment") {
        return std::make_shared<ParallelExperiment>(std::move(components));
    }
    throw std::invalid_argument("Unknown experiment type: " + type);
}

void fill_trials(const py::dict& obj, ExperimentData& data) {
    if (obj.contains("id")) {
        data.set_experiment_id(py::cast<std::string>(obj["id"]));
    }
    if (data.is_composite()) {
        const py::list components = py::cast<py::list>(obj["components"]);
        for (std::size_t i = 0; i < data.num_components(); ++i) {
            fill_trials(py::cast<py::dict>(components[i]), data.component_experiment_data(i));
        }
        return;
    }
    if (obj.contains("trials")) {
        data.add_trials(trials_from_list(py::cast<py::list>(obj["trials"])));
    }
}

py::dict quantum_volume_to_dict(const QuantumVolumeResult& result) {
    py::dict out;
    out["quantum_volume"] = result.quantum_volume;
    out["success"] = result.success;
    out["confidence"] = result.confidence;
    out["heavy_output_probability"] = result.heavy_output_probability;
    out["mean_hop"] = result.mean_hop;
    out["sigma"] = result.sigma;
    out["depth"] = result.depth;
    out["trials"] = result.trials;
    return out;
}

py::dict composite_to_dict(const CompositeAggregateResult& result) {
    py::dict out;
    out["experiment_types"] = result.experiment_types;
    out["experiment_ids"] = result.experiment_ids;
    out["experiment_qubits"] = result.experiment_qubits;
    return out;
}

py::dict diagnostic_to_dict(const Diagnostic& diagnostic) {
    py::dict out;
    out["experiment_id"] = diagnostic.experiment_id;
    out["category"] = diagnostic.category;
    out["message"] = diagnostic.message;
    return out;
}

py::list diagnostics_to_list(const std::vector<Diagnostic>& diagnostics) {
    py::list out;
    for (const auto& diagnostic : diagnostics) {
        out.append(diagnostic_to_dict(diagnostic));
    }
    return out;
}

py::dict result_to_dict(const AnalysisResultData& result) {
    py::dict out;
    out["name"] = result.name;
    out["value"] = std::visit(
        [](const auto& value) -> py::dict {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, QuantumVolumeResult>) {
                return quantum_volume_to_dict(value);
            } else {
                return composite_to_dict(value);
            }
        },
        result.value);
    return out;
}

py::dict experiment_data_to_dict(const ExperimentData& data) {
    py::dict out;
    out["experiment_id"] = data.experiment_id();
    out["experiment_type"] = data.experiment_type();
    out["physical_qubits"] = data.physical_qubits();
    py::list results;
    for (const auto& result : data.analysis_results()) {
        results.append(result_to_dict(result));
    }
    out["analysis_results"] = results;
    out["diagnostics"] = diagnostics_to_list(data.diagnostics());
    if (data.is_composite()) {
        py::list components;
        for (std::size_t i = 0; i < data.num_components(); ++i) {
            components.append(experiment_data_to_dict(data.component_experiment_data(i)));
        }
        out["components"] = components;
    }
    return out;
}

std::vector<std::string> py_heavy_outputs(const std::vector<double>& probabilities, int depth) {
    const HeavyOutputSet heavy = heavy_outputs(probabilities, depth);
    return std::vector<std::string>(heavy.begin(), heavy.end());
}

double py_heavy_output_probability(
    const py::dict& trial,
    const std::vector<std::string>& heavy
) {
    return heavy_output_probability(
        trial_from_dict(trial), HeavyOutputSet(heavy.begin(), heavy.end()));
}

py::dict py_estimate_quantum_volume(const std::vector<double>& hops, int depth, int trials) {
    const QuantumVolumeEstimate estimate = estimate_quantum_volume(hops, depth, trials);
    py::dict out = quantum_volume_to_dict(estimate.result);
    out["diagnostics"] = diagnostics_to_list(estimate.diagnostics);
    return out;
}

py::dict analyze_quantum_volume(
    const py::list& trials,
    const std::vector<int>& qubits,
    std::size_t max_threads
) {
    auto experiment = std::make_shared<QuantumVolumeExperiment>(qubits);
    ExperimentData data(experiment);
    data.add_trials(trials_from_list(trials));
    AnalysisOptions options;
    options.plot = false;
    options.max_threads = max_threads;
    experiment->run_analysis(data, options);
    return experiment_data_to_dict(data);
}

py::dict analyze_composite(const py::dict& tree, std::size_t max_threads) {
    const auto experiment = experiment_from_dict(tree);
    ExperimentData data(experiment);
    fill_trials(tree, data);
    AnalysisOptions options;
    options.plot = false;
    options.max_threads = max_threads;
    experiment->run_analysis(data, options);
    return experiment_data_to_dict(data);
}

}  // namespace

PYBIND11_MODULE(_bench_analysis, m) {
    m.doc() = "Quantum volume and composite experiment analysis";
    py::register_exception<InvalidOperationError>(m, "InvalidOperationError", PyExc_RuntimeError);
    py::register_exception<InvalidInputError>(m, "InvalidInputError", PyExc_ValueError);
    m.def(
        "heavy_outputs",
        &py_heavy_outputs,
        py::arg("probabilities"),
        py::arg("depth"),
        "Bitstrings whose ideal probability is strictly above the median."
    );
    m.def(
        "heavy_output_probability",
        &py_heavy_output_probability,
        py::arg("trial"),
        py::arg("heavy_outputs"),
        "Fraction of a trial's shots that landed on a heavy output."
    );
    m.def(
        "estimate_quantum_volume",
        &py_estimate_quantum_volume,
        py::arg("heavy_output_probabilities"),
        py::arg("depth"),
        py::arg("trials"),
        "Pass/fail quantum volume estimate with its diagnostics."
    );
    m.def(
        "analyze_quantum_volume",
        &analyze_quantum_volume,
        py::arg("trials"),
        py::arg("qubits"),
        py::arg("max_threads") = 0,
        "Analyse a list of trial dicts as one quantum volume experiment."
    );
    m.def(
        "analyze_composite",
        &analyze_composite,
        py::arg("experiment"),
        py::arg("max_threads") = 0,
        "Analyse a nested batch/parallel experiment tree given as dicts."
    );
}
