#include "analysis/quantum_volume_plot.hpp"

#include "analysis/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace bench_analysis {

QuantumVolumePlot build_quantum_volume_plot(
    const QuantumVolumeResult& result,
    double threshold
) {
    const std::vector<double>& hops = result.heavy_output_probability;
    if (hops.empty()) {
        throw InvalidInputError("cannot plot a quantum volume result without trials");
    }

    QuantumVolumePlot plot;
    plot.depth = result.depth;
    plot.threshold = threshold;
    plot.title = "Quantum Volume experiment for depth " + std::to_string(result.depth) +
        " - accumulative hop";
    plot.individual_hop = hops;

    const std::size_t count = hops.size();
    plot.trial_numbers.reserve(count);
    plot.cumulative_hop.reserve(count);
    plot.two_sigma.reserve(count);
    double running = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double n = static_cast<double>(i + 1);
        running += hops[i];
        const double cumulative = running / n;
        plot.trial_numbers.push_back(n);
        plot.cumulative_hop.push_back(cumulative);
        plot.two_sigma.push_back(2.0 * std::sqrt(cumulative * (1.0 - cumulative) / n));
    }

    const double last = plot.cumulative_hop.back();
    const double last_sigma = plot.two_sigma.back();
    plot.y_min = std::max(last - 4.0 * last_sigma, 0.0);
    plot.y_max = std::min(last + 4.0 * last_sigma, 1.0);
    return plot;
}

}  // namespace bench_analysis
