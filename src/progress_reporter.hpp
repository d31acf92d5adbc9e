#pragma once

#include "analysis/diagnostic.types.hpp"

#include <cstddef>
#include <string>

namespace bench_analysis {

class ProgressReporter {
  public:
    virtual ~ProgressReporter() = default;

    virtual void set_total_steps(std::size_t total_steps) = 0;
    virtual void increment_completed_steps(std::size_t delta = 1) = 0;
    virtual void record_log(const Diagnostic& log) = 0;

    // Bracket the analysis of one experiment data container. Calls nest
    // when a composite analyses its components.
    virtual void enter_experiment(const std::string& experiment_id) = 0;
    virtual void exit_experiment(const std::string& experiment_id) = 0;
};

}  // namespace bench_analysis
