#pragma once

#include "analysis/diagnostic.types.hpp"
#include "analysis/heavy_output.hpp"
#include "experiment/trial_record.types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bench_analysis {

// Pass criteria of the quantum volume benchmark. A depth passes when the mean
// heavy-output probability clears `success_threshold + z * sigma` and at
// least `min_trials` trials were run.
struct QuantumVolumeCriteria {
    double success_threshold = 2.0 / 3.0;
    double z = 2.0;
    int min_trials = 100;
    // Stand-in for a zero standard error when computing the z value.
    double sigma_epsilon = 1e-10;
};

struct QuantumVolumeResult {
    std::uint64_t quantum_volume = 1;
    bool success = false;
    double confidence = 0.0;
    std::vector<double> heavy_output_probability;
    double mean_hop = 0.0;
    double sigma = 0.0;
    int depth = 0;
    int trials = 0;
};

struct QuantumVolumeEstimate {
    QuantumVolumeResult result;
    std::vector<Diagnostic> diagnostics;
};

// Fraction of the trial's shots that landed on a heavy output.
double heavy_output_probability(const TrialRecord& trial, const HeavyOutputSet& heavy);

// Sum using pairwise reduction over blocks of eight, so that means computed
// here are reproducible bit for bit across platforms and thread counts.
double pairwise_sum(const double* values, std::size_t count);

// Standard normal CDF evaluated at `z_value`.
double confidence_level(double z_value);

// `sigma` is the binomial standard error computed with `trials` as sample
// size. `hops` holds one heavy-output probability per trial in trial order.
QuantumVolumeEstimate estimate_quantum_volume(
    const std::vector<double>& hops,
    int depth,
    int trials,
    const QuantumVolumeCriteria& criteria = {}
);

}  // namespace bench_analysis
