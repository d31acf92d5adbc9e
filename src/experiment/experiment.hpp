#pragma once

#include "analysis/analysis.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Experiment definitions: a type label, the physical qubits the experiment
// acts on, and the analysis strategy that interprets its data.

namespace bench_analysis {

class ExperimentData;

class Experiment {
  public:
    Experiment(
        std::string experiment_type,
        std::vector<int> physical_qubits,
        std::shared_ptr<const BaseAnalysis> analysis
    );
    virtual ~Experiment() = default;

    const std::string& experiment_type() const { return experiment_type_; }
    const std::vector<int>& physical_qubits() const { return physical_qubits_; }
    int num_qubits() const { return static_cast<int>(physical_qubits_.size()); }
    const std::shared_ptr<const BaseAnalysis>& analysis() const { return analysis_; }

    // Run this experiment's analysis on `data`, recording the output there.
    AnalysisOutput run_analysis(ExperimentData& data, const AnalysisOptions& options = {}) const;

  private:
    std::string experiment_type_;
    std::vector<int> physical_qubits_;
    std::shared_ptr<const BaseAnalysis> analysis_;
};

class QuantumVolumeExperiment final : public Experiment {
  public:
    explicit QuantumVolumeExperiment(
        std::vector<int> physical_qubits,
        QuantumVolumeCriteria criteria = {}
    );
};

// Ordered collection of component experiments, each possibly composite.
class CompositeExperiment : public Experiment {
  public:
    CompositeExperiment(
        std::string experiment_type,
        std::vector<int> physical_qubits,
        std::vector<std::shared_ptr<const Experiment>> components
    );

    std::size_t num_experiments() const { return components_.size(); }
    const std::shared_ptr<const Experiment>& component_experiment(std::size_t index) const;

  private:
    std::vector<std::shared_ptr<const Experiment>> components_;
};

// Components run one after another, possibly on shared qubits.
class BatchExperiment final : public CompositeExperiment {
  public:
    explicit BatchExperiment(std::vector<std::shared_ptr<const Experiment>> components);
};

// Components run simultaneously on disjoint qubits.
class ParallelExperiment final : public CompositeExperiment {
  public:
    explicit ParallelExperiment(std::vector<std::shared_ptr<const Experiment>> components);
};

}  // namespace bench_analysis
