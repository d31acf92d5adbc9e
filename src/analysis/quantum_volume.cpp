#include "analysis/quantum_volume.hpp"

#include "analysis/errors.hpp"

#include <cmath>
#include <string>

namespace bench_analysis {
namespace {

constexpr std::size_t kPairwiseBlockSize = 128;

double z_value_for(
    double mean,
    double sigma,
    const QuantumVolumeCriteria& criteria,
    std::vector<Diagnostic>& diagnostics
) {
    if (sigma == 0.0) {
        sigma = criteria.sigma_epsilon;
        diagnostics.push_back(Diagnostic{
            {},
            kDegenerateStatisticCategory,
            "Standard deviation sigma should not be zero."
        });
    }
    return (mean - criteria.success_threshold) / sigma;
}

}  // namespace

double heavy_output_probability(const TrialRecord& trial, const HeavyOutputSet& heavy) {
    const std::uint64_t shots = total_shots(trial);
    if (shots == 0) {
        throw InvalidInputError("trial has zero total shots");
    }
    std::uint64_t heavy_counts = 0;
    for (const auto& bitstring : heavy) {
        const auto it = trial.counts.find(bitstring);
        if (it != trial.counts.end()) {
            heavy_counts += it->second;
        }
    }
    return static_cast<double>(heavy_counts) / static_cast<double>(shots);
}

double pairwise_sum(const double* values, std::size_t count) {
    if (count < 8) {
        double res = 0.0;
        for (std::size_t i = 0; i < count; ++i) {
            res += values[i];
        }
        return res;
    }
    if (count <= kPairwiseBlockSize) {
        double r[8];
        for (std::size_t j = 0; j < 8; ++j) {
            r[j] = values[j];
        }
        std::size_t i = 8;
        for (; i < count - (count % 8); i += 8) {
            for (std::size_t j = 0; j < 8; ++j) {
                r[j] += values[i + j];
            }
        }
        double res = ((r[0] + r[1]) + (r[2] + r[3])) + ((r[4] + r[5]) + (r[6] + r[7]));
        for (; i < count; ++i) {
            res += values[i];
        }
        return res;
    }
    std::size_t half = count / 2;
    half -= half % 8;
    return pairwise_sum(values, half) + pairwise_sum(values + half, count - half);
}

double confidence_level(double z_value) {
    return 0.5 * (1.0 + std::erf(z_value / std::sqrt(2.0)));
}

QuantumVolumeEstimate estimate_quantum_volume(
    const std::vector<double>& hops,
    int depth,
    int trials,
    const QuantumVolumeCriteria& criteria
) {
    if (hops.empty() || trials <= 0) {
        throw InvalidInputError("quantum volume estimation needs at least one trial");
    }
    if (depth < 0 || depth > kMaxDepth) {
        throw InvalidInputError(
            "depth " + std::to_string(depth) + " outside supported range 0.." +
            std::to_string(kMaxDepth)
        );
    }

    QuantumVolumeEstimate estimate;
    QuantumVolumeResult& result = estimate.result;

    const double mean_hop =
        pairwise_sum(hops.data(), hops.size()) / static_cast<double>(hops.size());
    const double sigma_hop = std::sqrt(mean_hop * ((1.0 - mean_hop) / trials));
    const double threshold = criteria.success_threshold + criteria.z * sigma_hop;
    const double z_value = z_value_for(mean_hop, sigma_hop, criteria, estimate.diagnostics);

    if (trials < criteria.min_trials) {
        estimate.diagnostics.push_back(Diagnostic{
            {},
            kInsufficientSampleCategory,
            "Must use at least " + std::to_string(criteria.min_trials) +
                " trials to consider Quantum Volume as successful."
        });
    }
    if (mean_hop > threshold && trials >= criteria.min_trials) {
        result.quantum_volume = 1ULL << depth;
        result.success = true;
    }

    result.confidence = confidence_level(z_value);
    result.heavy_output_probability = hops;
    result.mean_hop = mean_hop;
    result.sigma = sigma_hop;
    result.depth = depth;
    result.trials = trials;
    return estimate;
}

}  // namespace bench_analysis
