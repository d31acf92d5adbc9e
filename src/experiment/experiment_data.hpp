#pragma once

#include "analysis/analysis.hpp"
#include "analysis/analysis_result.hpp"
#include "analysis/diagnostic.types.hpp"
#include "experiment/trial_record.types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace bench_analysis {

class CompositeExperiment;
class Experiment;
class ExperimentData;

struct LeafPayload {
    std::vector<TrialRecord> trials;
};

// Child containers of a composite node, owned exclusively by the parent.
struct CompositePayload {
    std::vector<std::unique_ptr<ExperimentData>> components;
};

class CompositeExperimentData;

// Data container of one node of an experiment tree. Leaf nodes hold trial
// records; composite nodes own one container per component experiment,
// built recursively to mirror the experiment definition.
class ExperimentData {
  public:
    // An empty `experiment_id` is replaced by a generated "exp-N" id.
    explicit ExperimentData(
        std::shared_ptr<const Experiment> experiment,
        std::string experiment_id = {}
    );
    ~ExperimentData();

    ExperimentData(const ExperimentData&) = delete;
    ExperimentData& operator=(const ExperimentData&) = delete;
    ExperimentData(ExperimentData&&) noexcept;
    ExperimentData& operator=(ExperimentData&&) noexcept;

    const std::shared_ptr<const Experiment>& experiment() const { return experiment_; }
    const std::string& experiment_id() const { return experiment_id_; }
    void set_experiment_id(std::string experiment_id);
    const std::string& experiment_type() const;
    const std::vector<int>& physical_qubits() const;

    bool is_composite() const { return std::holds_alternative<CompositePayload>(payload_); }

    void add_trial(TrialRecord trial);
    void add_trials(std::vector<TrialRecord> trials);
    const std::vector<TrialRecord>& trials() const;

    std::size_t num_components() const;
    ExperimentData& component_experiment_data(std::size_t index);
    const ExperimentData& component_experiment_data(std::size_t index) const;

    // Composite view of this container; throws InvalidOperationError on a leaf.
    CompositeExperimentData as_composite();

    // Number of containers in the subtree rooted here, this one included.
    std::size_t node_count() const;

    void record_analysis(const AnalysisOutput& output);
    const std::vector<AnalysisResultData>& analysis_results() const { return analysis_results_; }
    const std::vector<Figure>& figures() const { return figures_; }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

  private:
    const LeafPayload& leaf(const char* operation) const;
    LeafPayload& leaf(const char* operation);
    const CompositePayload& composite(const char* operation) const;

    std::shared_ptr<const Experiment> experiment_;
    std::string experiment_id_;
    std::variant<LeafPayload, CompositePayload> payload_;
    std::vector<AnalysisResultData> analysis_results_;
    std::vector<Figure> figures_;
    std::vector<Diagnostic> diagnostics_;
};

// Handle to an ExperimentData that is known to be composite. Only
// ExperimentData::as_composite creates one, so code taking this type never
// sees a leaf.
class CompositeExperimentData {
  public:
    ExperimentData& data() const { return *data_; }
    const CompositeExperiment& experiment() const { return *experiment_; }
    std::size_t num_experiments() const;
    ExperimentData& component_experiment_data(std::size_t index) const;

  private:
    friend class ExperimentData;
    CompositeExperimentData(ExperimentData& data, const CompositeExperiment& experiment)
        : data_(&data)
        , experiment_(&experiment) {}

    ExperimentData* data_;
    const CompositeExperiment* experiment_;
};

}  // namespace bench_analysis
