#pragma once

#include "analysis/quantum_volume.hpp"

#include <string>
#include <variant>
#include <vector>

namespace bench_analysis {

// Identifying metadata of the immediate children of a composite experiment,
// one entry per child in child order.
struct CompositeAggregateResult {
    std::vector<std::string> experiment_types;
    std::vector<std::string> experiment_ids;
    std::vector<std::vector<int>> experiment_qubits;
};

using AnalysisValue = std::variant<QuantumVolumeResult, CompositeAggregateResult>;

struct AnalysisResultData {
    std::string name;
    AnalysisValue value;
};

// Artifact produced by an injected renderer. The analysis never inspects it.
struct Figure {
    std::string name;
    std::string format;
    std::string content;
};

}  // namespace bench_analysis
