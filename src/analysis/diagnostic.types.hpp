#pragma once

#include <string>

namespace bench_analysis {

// Non-fatal notice raised while analysing one experiment data container.
struct Diagnostic {
    std::string experiment_id;
    std::string category;
    std::string message;
};

inline constexpr const char* kDegenerateStatisticCategory = "DegenerateStatistic";
inline constexpr const char* kInsufficientSampleCategory = "InsufficientSample";

inline bool operator==(const Diagnostic& lhs, const Diagnostic& rhs) {
    return lhs.experiment_id == rhs.experiment_id &&
           lhs.category == rhs.category &&
           lhs.message == rhs.message;
}

}  // namespace bench_analysis
