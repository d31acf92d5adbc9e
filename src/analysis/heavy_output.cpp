#include "analysis/heavy_output.hpp"

#include "analysis/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace bench_analysis {

std::string format_bitstring(std::uint64_t value, int width) {
    std::string out(static_cast<std::size_t>(std::max(width, 0)), '0');
    for (int bit = 0; bit < width; ++bit) {
        if ((value >> bit) & 1ULL) {
            out[static_cast<std::size_t>(width - 1 - bit)] = '1';
        }
    }
    return out;
}

double median(std::vector<double> values) {
    if (values.empty()) {
        throw InvalidInputError("median of an empty sequence is undefined");
    }
    const std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    const double lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

HeavyOutputSet heavy_outputs(const std::vector<double>& probabilities, int depth) {
    if (depth < 0 || depth > kMaxDepth) {
        throw InvalidInputError(
            "depth " + std::to_string(depth) + " outside supported range 0.." +
            std::to_string(kMaxDepth)
        );
    }
    const std::uint64_t outcomes = 1ULL << depth;
    if (probabilities.size() != outcomes) {
        throw InvalidInputError(
            "ideal probability vector has " + std::to_string(probabilities.size()) +
            " entries but depth " + std::to_string(depth) + " requires " +
            std::to_string(outcomes)
        );
    }

    const double median_probability = median(probabilities);
    HeavyOutputSet heavy;
    for (std::uint64_t b = 0; b < outcomes; ++b) {
        if (probabilities[static_cast<std::size_t>(b)] > median_probability) {
            heavy.insert(heavy.end(), format_bitstring(b, depth));
        }
    }
    return heavy;
}

}  // namespace bench_analysis
