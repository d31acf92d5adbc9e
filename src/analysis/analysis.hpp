#pragma once

#include "analysis/analysis_result.hpp"
#include "analysis/diagnostic.types.hpp"
#include "analysis/quantum_volume_plot.hpp"
#include "progress_reporter.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace bench_analysis {

class ExperimentData;

// Drawing surface owned by the caller. Only the renderer knows its type.
class PlotSurface {
  public:
    virtual ~PlotSurface() = default;
};

class FigureRenderer {
  public:
    virtual ~FigureRenderer() = default;

    // `ax` is the caller-supplied surface to draw into, or nullptr when the
    // renderer should create its own.
    virtual Figure render(const QuantumVolumePlot& plot, PlotSurface* ax) const = 0;
};

struct AnalysisOptions {
    // Produce a figure when a renderer is available.
    bool plot = true;
    PlotSurface* ax = nullptr;
    std::shared_ptr<const FigureRenderer> renderer;
    // Worker threads for per-trial loops. 0 defers to
    // BENCH_ANALYSIS_MAX_THREADS and otherwise runs sequentially.
    std::size_t max_threads = 0;
    ProgressReporter* reporter = nullptr;
};

struct AnalysisOutput {
    std::vector<AnalysisResultData> results;
    std::vector<Figure> figures;
    std::vector<Diagnostic> diagnostics;
};

class BaseAnalysis {
  public:
    virtual ~BaseAnalysis() = default;

    // Run the analysis on `data` and record the output on that container.
    // Nothing is recorded when the analysis throws.
    AnalysisOutput run(ExperimentData& data, const AnalysisOptions& options = {}) const;

    virtual std::string name() const = 0;

  protected:
    virtual AnalysisOutput run_analysis(
        ExperimentData& data,
        const AnalysisOptions& options
    ) const = 0;
};

}  // namespace bench_analysis
