#pragma once

#include "analysis/quantum_volume.hpp"

#include <string>
#include <vector>

namespace bench_analysis {

// Series behind the accumulative heavy-output plot of a quantum volume run.
// Rendering is left to a FigureRenderer; this only prepares the data.
struct QuantumVolumePlot {
    std::string title;
    std::string x_label = "Number of Trials";
    std::string y_label = "Heavy Output Probability";
    std::vector<double> trial_numbers;
    std::vector<double> individual_hop;
    std::vector<double> cumulative_hop;
    std::vector<double> two_sigma;
    double threshold = 2.0 / 3.0;
    double y_min = 0.0;
    double y_max = 1.0;
    int depth = 0;
};

QuantumVolumePlot build_quantum_volume_plot(
    const QuantumVolumeResult& result,
    double threshold = 2.0 / 3.0
);

}  // namespace bench_analysis
