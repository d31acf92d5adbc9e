#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace bench_analysis {

using HeavyOutputSet = std::set<std::string>;

// Largest circuit depth accepted anywhere in the analysis (2^30 outcomes).
inline constexpr int kMaxDepth = 30;

// Zero-padded binary representation of `value` with exactly `width` digits.
std::string format_bitstring(std::uint64_t value, int width);

// Median of the values; the mean of the two middle values for even sizes.
double median(std::vector<double> values);

// Bitstrings whose ideal probability is strictly greater than the median of
// all 2^depth probabilities. Values equal to the median are never heavy, so a
// uniform distribution has no heavy outputs.
HeavyOutputSet heavy_outputs(const std::vector<double>& probabilities, int depth);

}  // namespace bench_analysis
