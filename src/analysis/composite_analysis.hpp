#pragma once

#include "analysis/analysis.hpp"
#include "analysis/analysis_result.hpp"

#include <string>

namespace bench_analysis {

class CompositeExperimentData;

// Runs the analysis of every component experiment on its own data container
// and reports the components' types, ids and physical qubits. Numeric results
// stay on the component containers and are not merged.
class CompositeAnalysis final : public BaseAnalysis {
  public:
    std::string name() const override { return "composite"; }

    // Components are analysed in index order. The first component failure
    // aborts the pass and propagates; later components are not analysed.
    CompositeAggregateResult analyze(
        const CompositeExperimentData& data,
        const AnalysisOptions& options = {}
    ) const;

  protected:
    // Throws InvalidOperationError when `data` is a leaf.
    AnalysisOutput run_analysis(
        ExperimentData& data,
        const AnalysisOptions& options
    ) const override;
};

}  // namespace bench_analysis
