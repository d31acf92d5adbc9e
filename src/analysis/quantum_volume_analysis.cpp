#include "analysis/quantum_volume_analysis.hpp"

#include "analysis/errors.hpp"
#include "analysis/heavy_output.hpp"
#include "analysis/quantum_volume_plot.hpp"
#include "analysis/trial_validation.hpp"
#include "analysis/worker_pool.hpp"
#include "experiment/experiment.hpp"
#include "experiment/experiment_data.hpp"

#include <utility>
#include <vector>

namespace bench_analysis {

QuantumVolumeAnalysis::QuantumVolumeAnalysis(QuantumVolumeCriteria criteria)
    : criteria_(criteria) {}

AnalysisOutput QuantumVolumeAnalysis::run_analysis(
    ExperimentData& data,
    const AnalysisOptions& options
) const {
    if (data.is_composite()) {
        throw InvalidOperationError(
            "QuantumVolumeAnalysis must be run on leaf experiment data, got composite " +
            data.experiment_id());
    }
    const std::vector<TrialRecord>& trials = data.trials();
    if (trials.empty()) {
        throw InvalidInputError(
            "experiment data " + data.experiment_id() + " contains no trials");
    }
    make_trial_validator_registry().run_all_validators(trials);

    const int depth = data.experiment()->num_qubits();
    std::vector<double> hops(trials.size(), 0.0);
    for_each_index(trials.size(), resolve_worker_count(options.max_threads), [&](std::size_t i) {
        const TrialRecord& trial = trials[i];
        const HeavyOutputSet heavy =
            heavy_outputs(trial.metadata.ideal_probabilities, trial.metadata.depth);
        hops[i] = heavy_output_probability(trial, heavy);
    });

    QuantumVolumeEstimate estimate = estimate_quantum_volume(
        hops, depth, static_cast<int>(trials.size()), criteria_);

    AnalysisOutput output;
    if (options.plot && options.renderer) {
        const QuantumVolumePlot plot =
            build_quantum_volume_plot(estimate.result, criteria_.success_threshold);
        output.figures.push_back(options.renderer->render(plot, options.ax));
    }
    output.results.push_back(AnalysisResultData{name(), std::move(estimate.result)});
    output.diagnostics = std::move(estimate.diagnostics);
    return output;
}

}  // namespace bench_analysis
