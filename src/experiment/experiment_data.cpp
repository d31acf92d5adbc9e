#include "experiment/experiment_data.hpp"

#include "analysis/errors.hpp"
#include "experiment/experiment.hpp"

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace bench_analysis {
namespace {

std::atomic<std::uint64_t> id_counter{0};

std::string next_experiment_id() {
    const std::uint64_t seq = id_counter.fetch_add(1, std::memory_order_relaxed);
    return "exp-" + std::to_string(seq);
}

}  // namespace

ExperimentData::ExperimentData(
    std::shared_ptr<const Experiment> experiment,
    std::string experiment_id
)
    : experiment_(std::move(experiment))
    , experiment_id_(experiment_id.empty() ? next_experiment_id() : std::move(experiment_id)) {
    if (!experiment_) {
        throw std::invalid_argument("experiment data requires an experiment definition");
    }
    if (const auto* composite_experiment =
            dynamic_cast<const CompositeExperiment*>(experiment_.get())) {
        CompositePayload payload;
        payload.components.reserve(composite_experiment->num_experiments());
        for (std::size_t i = 0; i < composite_experiment->num_experiments(); ++i) {
            payload.components.push_back(std::make_unique<ExperimentData>(
                composite_experiment->component_experiment(i)));
        }
        payload_ = std::move(payload);
    }
}

ExperimentData::~ExperimentData() = default;
ExperimentData::ExperimentData(ExperimentData&&) noexcept = default;
ExperimentData& ExperimentData::operator=(ExperimentData&&) noexcept = default;

void ExperimentData::set_experiment_id(std::string experiment_id) {
    if (experiment_id.empty()) {
        throw std::invalid_argument("experiment id must not be empty");
    }
    experiment_id_ = std::move(experiment_id);
}

const std::string& ExperimentData::experiment_type() const {
    return experiment_->experiment_type();
}

const std::vector<int>& ExperimentData::physical_qubits() const {
    return experiment_->physical_qubits();
}

const LeafPayload& ExperimentData::leaf(const char* operation) const {
    const auto* payload = std::get_if<LeafPayload>(&payload_);
    if (!payload) {
        throw InvalidOperationError(
            std::string(operation) + " is not available on composite experiment data " +
            experiment_id_);
    }
    return *payload;
}

LeafPayload& ExperimentData::leaf(const char* operation) {
    const ExperimentData& self = *this;
    return const_cast<LeafPayload&>(self.leaf(operation));
}

const CompositePayload& ExperimentData::composite(const char* operation) const {
    const auto* payload = std::get_if<CompositePayload>(&payload_);
    if (!payload) {
        throw InvalidOperationError(
            std::string(operation) + " requires composite experiment data but " +
            experiment_id_ + " is a leaf");
    }
    return *payload;
}

void ExperimentData::add_trial(TrialRecord trial) {
    leaf("add_trial").trials.push_back(std::move(trial));
}

void ExperimentData::add_trials(std::vector<TrialRecord> trials) {
    auto& stored = leaf("add_trials").trials;
    stored.insert(
        stored.end(),
        std::make_move_iterator(trials.begin()),
        std::make_move_iterator(trials.end()));
}

const std::vector<TrialRecord>& ExperimentData::trials() const {
    return leaf("trials").trials;
}

std::size_t ExperimentData::num_components() const {
    return composite("num_components").components.size();
}

ExperimentData& ExperimentData::component_experiment_data(std::size_t index) {
    const auto& components = composite("component_experiment_data").components;
    if (index >= components.size()) {
        throw std::out_of_range(
            "component index " + std::to_string(index) + " out of range for " +
            std::to_string(components.size()) + " components");
    }
    return *components[index];
}

const ExperimentData& ExperimentData::component_experiment_data(std::size_t index) const {
    return const_cast<ExperimentData&>(*this).component_experiment_data(index);
}

CompositeExperimentData ExperimentData::as_composite() {
    composite("CompositeAnalysis");
    return CompositeExperimentData(
        *this, dynamic_cast<const CompositeExperiment&>(*experiment_));
}

std::size_t ExperimentData::node_count() const {
    std::size_t count = 1;
    if (const auto* payload = std::get_if<CompositePayload>(&payload_)) {
        for (const auto& component : payload->components) {
            count += component->node_count();
        }
    }
    return count;
}

void ExperimentData::record_analysis(const AnalysisOutput& output) {
    analysis_results_.insert(
        analysis_results_.end(), output.results.begin(), output.results.end());
    figures_.insert(figures_.end(), output.figures.begin(), output.figures.end());
    diagnostics_.insert(
        diagnostics_.end(), output.diagnostics.begin(), output.diagnostics.end());
}

std::size_t CompositeExperimentData::num_experiments() const {
    return experiment_->num_experiments();
}

ExperimentData& CompositeExperimentData::component_experiment_data(std::size_t index) const {
    return data_->component_experiment_data(index);
}

}  // namespace bench_analysis
