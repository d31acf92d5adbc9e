#include "analysis/composite_analysis.hpp"

#include "analysis/errors.hpp"
#include "experiment/experiment.hpp"
#include "experiment/experiment_data.hpp"

#include <utility>

namespace bench_analysis {

CompositeAggregateResult CompositeAnalysis::analyze(
    const CompositeExperimentData& data,
    const AnalysisOptions& options
) const {
    const CompositeExperiment& experiment = data.experiment();
    const std::size_t count = experiment.num_experiments();
    if (data.data().num_components() != count) {
        throw InvalidInputError(
            "composite data " + data.data().experiment_id() + " holds " +
            std::to_string(data.data().num_components()) + " components but experiment " +
            experiment.experiment_type() + " declares " + std::to_string(count));
    }

    // Components run one at a time so a failure leaves every later sibling
    // untouched. options.max_threads still reaches the per-trial loops.
    for (std::size_t i = 0; i < count; ++i) {
        const auto& component = experiment.component_experiment(i);
        component->run_analysis(data.component_experiment_data(i), options);
    }

    CompositeAggregateResult result;
    result.experiment_types.reserve(count);
    result.experiment_ids.reserve(count);
    result.experiment_qubits.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const ExperimentData& component_data = data.component_experiment_data(i);
        result.experiment_types.push_back(component_data.experiment_type());
        result.experiment_ids.push_back(component_data.experiment_id());
        result.experiment_qubits.push_back(component_data.physical_qubits());
    }
    return result;
}

AnalysisOutput CompositeAnalysis::run_analysis(
    ExperimentData& data,
    const AnalysisOptions& options
) const {
    AnalysisOutput output;
    output.results.push_back(AnalysisResultData{name(), analyze(data.as_composite(), options)});
    return output;
}

}  // namespace bench_analysis
