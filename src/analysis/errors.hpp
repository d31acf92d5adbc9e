#pragma once

#include <stdexcept>

namespace bench_analysis {

// Raised when an operation is applied to the wrong kind of experiment data,
// e.g. composite dispatch on a leaf container.
class InvalidOperationError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

// Raised for malformed trial data: zero shots, probability vectors whose
// length does not match the depth, badly formed bitstrings.
class InvalidInputError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace bench_analysis
