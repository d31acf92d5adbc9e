#include "analysis/heavy_output.hpp"
#include "experiment/experiment.hpp"
#include "experiment/experiment_data.hpp"
#include "service/result_json.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <random>
#include <vector>

using namespace bench_analysis;

namespace {

// Porter-Thomas-like ideal distribution and counts sampled from a mix of the
// ideal distribution and uniform noise.
TrialRecord synthesize_trial(int depth, int shots, double fidelity, std::mt19937_64& rng) {
    const std::size_t outcomes = std::size_t{1} << depth;
    std::exponential_distribution<double> weight(1.0);
    TrialRecord trial;
    trial.metadata.depth = depth;
    trial.metadata.ideal_probabilities.resize(outcomes);
    double total = 0.0;
    for (auto& p : trial.metadata.ideal_probabilities) {
        p = weight(rng);
        total += p;
    }
    std::vector<double> noisy(outcomes);
    for (std::size_t b = 0; b < outcomes; ++b) {
        trial.metadata.ideal_probabilities[b] /= total;
        noisy[b] = fidelity * trial.metadata.ideal_probabilities[b] +
            (1.0 - fidelity) / static_cast<double>(outcomes);
    }
    std::discrete_distribution<std::size_t> sampler(noisy.begin(), noisy.end());
    for (int shot = 0; shot < shots; ++shot) {
        trial.counts[format_bitstring(sampler(rng), depth)] += 1;
    }
    return trial;
}

}  // namespace

int main() {
    constexpr int kTrials = 120;
    constexpr int kShots = 1000;
    std::mt19937_64 rng(1234);

    auto good = std::make_shared<QuantumVolumeExperiment>(std::vector<int>{0, 1});
    auto noisy = std::make_shared<QuantumVolumeExperiment>(std::vector<int>{2, 3});
    auto batch = std::make_shared<BatchExperiment>(
        std::vector<std::shared_ptr<const Experiment>>{good, noisy});

    ExperimentData data(batch);
    for (int i = 0; i < kTrials; ++i) {
        data.component_experiment_data(0).add_trial(synthesize_trial(2, kShots, 0.95, rng));
        data.component_experiment_data(1).add_trial(synthesize_trial(2, kShots, 0.2, rng));
    }

    AnalysisOptions options;
    options.plot = false;
    batch->run_analysis(data, options);

    std::cout << service::to_json(data) << '\n';
    return 0;
}
