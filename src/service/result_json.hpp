#pragma once

#include "analysis/analysis_result.hpp"
#include "analysis/diagnostic.types.hpp"
#include "analysis/quantum_volume.hpp"
#include "experiment/experiment_data.hpp"

#include <string>

namespace bench_analysis::service {

std::string to_json(const QuantumVolumeResult& result);
std::string to_json(const CompositeAggregateResult& result);
std::string to_json(const AnalysisResultData& result);
std::string to_json(const Diagnostic& diagnostic);

// Whole analysed tree: identity, stored results and diagnostics of every
// container, with composite children nested under "components".
std::string to_json(const ExperimentData& data);

}  // namespace bench_analysis::service
