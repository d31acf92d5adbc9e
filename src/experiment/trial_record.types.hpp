#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bench_analysis {

struct TrialMetadata {
    int depth = 0;
    // Ideal outcome distribution indexed by integer outcome; 2^depth entries.
    std::vector<double> ideal_probabilities;
};

// Outcome of one executed circuit: measured bitstring -> occurrence count.
struct TrialRecord {
    std::map<std::string, std::uint64_t> counts;
    TrialMetadata metadata;
};

inline std::uint64_t total_shots(const TrialRecord& trial) {
    std::uint64_t total = 0;
    for (const auto& [bitstring, count] : trial.counts) {
        (void)bitstring;
        total += count;
    }
    return total;
}

}  // namespace bench_analysis
