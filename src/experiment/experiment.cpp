#include "experiment/experiment.hpp"

#include "analysis/composite_analysis.hpp"
#include "analysis/errors.hpp"
#include "analysis/quantum_volume_analysis.hpp"
#include "experiment/experiment_data.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace bench_analysis {
namespace {

void require_components(const std::vector<std::shared_ptr<const Experiment>>& components) {
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (!components[i]) {
            throw std::invalid_argument(
                "component experiment " + std::to_string(i) + " is null");
        }
    }
}

std::vector<int> batch_qubits(const std::vector<std::shared_ptr<const Experiment>>& components) {
    require_components(components);
    std::set<int> qubits;
    for (const auto& component : components) {
        qubits.insert(component->physical_qubits().begin(), component->physical_qubits().end());
    }
    return std::vector<int>(qubits.begin(), qubits.end());
}

std::vector<int> parallel_qubits(const std::vector<std::shared_ptr<const Experiment>>& components) {
    require_components(components);
    std::vector<int> qubits;
    std::set<int> seen;
    for (const auto& component : components) {
        for (int qubit : component->physical_qubits()) {
            if (!seen.insert(qubit).second) {
                throw std::invalid_argument(
                    "parallel experiment components share qubit " + std::to_string(qubit));
            }
            qubits.push_back(qubit);
        }
    }
    return qubits;
}

}  // namespace

Experiment::Experiment(
    std::string experiment_type,
    std::vector<int> physical_qubits,
    std::shared_ptr<const BaseAnalysis> analysis
)
    : experiment_type_(std::move(experiment_type))
    , physical_qubits_(std::move(physical_qubits))
    , analysis_(std::move(analysis)) {}

AnalysisOutput Experiment::run_analysis(
    ExperimentData& data,
    const AnalysisOptions& options
) const {
    if (!analysis_) {
        throw InvalidOperationError(
            "experiment " + experiment_type_ + " has no analysis attached");
    }
    return analysis_->run(data, options);
}

QuantumVolumeExperiment::QuantumVolumeExperiment(
    std::vector<int> physical_qubits,
    QuantumVolumeCriteria criteria
)
    : Experiment(
          "QuantumVolume",
          std::move(physical_qubits),
          std::make_shared<QuantumVolumeAnalysis>(criteria)
      ) {}

CompositeExperiment::CompositeExperiment(
    std::string experiment_type,
    std::vector<int> physical_qubits,
    std::vector<std::shared_ptr<const Experiment>> components
)
    : Experiment(
          std::move(experiment_type),
          std::move(physical_qubits),
          std::make_shared<CompositeAnalysis>()
      )
    , components_(std::move(components)) {
    require_components(components_);
}

const std::shared_ptr<const Experiment>& CompositeExperiment::component_experiment(
    std::size_t index
) const {
    if (index >= components_.size()) {
        throw std::out_of_range(
            "component index " + std::to_string(index) + " out of range for " +
            std::to_string(components_.size()) + " components");
    }
    return components_[index];
}

BatchExperiment::BatchExperiment(std::vector<std::shared_ptr<const Experiment>> components)
    : CompositeExperiment("BatchExperiment", batch_qubits(components), components) {}

ParallelExperiment::ParallelExperiment(std::vector<std::shared_ptr<const Experiment>> components)
    : CompositeExperiment("ParallelExperiment", parallel_qubits(components), components) {}

}  // namespace bench_analysis
