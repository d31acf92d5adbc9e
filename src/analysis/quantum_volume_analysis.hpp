#pragma once

#include "analysis/analysis.hpp"
#include "analysis/quantum_volume.hpp"

#include <string>

namespace bench_analysis {

// Analysis of a leaf quantum volume experiment. The depth is the number of
// physical qubits of the experiment; each trial contributes one heavy-output
// probability computed against its own ideal distribution.
class QuantumVolumeAnalysis final : public BaseAnalysis {
  public:
    explicit QuantumVolumeAnalysis(QuantumVolumeCriteria criteria = {});

    std::string name() const override { return "quantum_volume"; }

    const QuantumVolumeCriteria& criteria() const { return criteria_; }

  protected:
    AnalysisOutput run_analysis(
        ExperimentData& data,
        const AnalysisOptions& options
    ) const override;

  private:
    QuantumVolumeCriteria criteria_;
};

}  // namespace bench_analysis
