#include "analysis/analysis.hpp"

#include "experiment/experiment_data.hpp"

#include <string>

namespace bench_analysis {
namespace {

class ExperimentScope {
  public:
    ExperimentScope(ProgressReporter* reporter, const std::string& experiment_id)
        : reporter_(reporter), experiment_id_(experiment_id) {
        if (reporter_) {
            reporter_->enter_experiment(experiment_id_);
        }
    }

    ~ExperimentScope() {
        if (reporter_) {
            reporter_->exit_experiment(experiment_id_);
        }
    }

    ExperimentScope(const ExperimentScope&) = delete;
    ExperimentScope& operator=(const ExperimentScope&) = delete;

  private:
    ProgressReporter* reporter_;
    std::string experiment_id_;
};

}  // namespace

AnalysisOutput BaseAnalysis::run(ExperimentData& data, const AnalysisOptions& options) const {
    ExperimentScope scope(options.reporter, data.experiment_id());
    AnalysisOutput output = run_analysis(data, options);
    for (auto& diagnostic : output.diagnostics) {
        if (diagnostic.experiment_id.empty()) {
            diagnostic.experiment_id = data.experiment_id();
        }
        if (options.reporter) {
            options.reporter->record_log(diagnostic);
        }
    }
    data.record_analysis(output);
    if (options.reporter) {
        options.reporter->increment_completed_steps();
    }
    return output;
}

}  // namespace bench_analysis
