#include "analysis/trial_validation.hpp"

#include "analysis/errors.hpp"
#include "analysis/heavy_output.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <utility>

namespace bench_analysis {
namespace {

constexpr double kProbabilitySumTolerance = 1e-6;

std::string trial_prefix(std::size_t index) {
    return "trial " + std::to_string(index) + ": ";
}

class ProbabilityVectorValidator final : public TrialValidator {
public:
    void validate(const TrialRecord& trial, std::size_t index) const override {
        const int depth = trial.metadata.depth;
        if (depth < 0 || depth > kMaxDepth) {
            throw InvalidInputError(
                trial_prefix(index) + "depth " + std::to_string(depth) +
                " outside supported range 0.." + std::to_string(kMaxDepth)
            );
        }
        const auto& probabilities = trial.metadata.ideal_probabilities;
        const std::uint64_t expected = 1ULL << depth;
        if (probabilities.size() != expected) {
            throw InvalidInputError(
                trial_prefix(index) + "ideal probability vector has " +
                std::to_string(probabilities.size()) + " entries but depth " +
                std::to_string(depth) + " requires " + std::to_string(expected)
            );
        }
        double total = 0.0;
        for (std::size_t b = 0; b < probabilities.size(); ++b) {
            const double p = probabilities[b];
            if (!std::isfinite(p) || p < 0.0) {
                std::ostringstream oss;
                oss << trial_prefix(index) << "ideal probability " << b << " is " << p;
                throw InvalidInputError(oss.str());
            }
            total += p;
        }
        if (std::fabs(total - 1.0) > kProbabilitySumTolerance) {
            std::ostringstream oss;
            oss << trial_prefix(index) << "ideal probabilities sum to " << total
                << " instead of 1";
            throw InvalidInputError(oss.str());
        }
    }

    std::string name() const override {
        return "probability_vector";
    }
};

class ShotCountValidator final : public TrialValidator {
public:
    void validate(const TrialRecord& trial, std::size_t index) const override {
        if (total_shots(trial) == 0) {
            throw InvalidInputError(trial_prefix(index) + "counts contain zero total shots");
        }
    }

    std::string name() const override {
        return "shot_count";
    }
};

class BitstringFormatValidator final : public TrialValidator {
public:
    void validate(const TrialRecord& trial, std::size_t index) const override {
        const std::size_t width = static_cast<std::size_t>(std::max(trial.metadata.depth, 0));
        for (const auto& [bitstring, count] : trial.counts) {
            (void)count;
            bool well_formed = bitstring.size() == width;
            for (const char ch : bitstring) {
                if (ch != '0' && ch != '1') {
                    well_formed = false;
                    break;
                }
            }
            if (!well_formed) {
                throw InvalidInputError(
                    trial_prefix(index) + "measured bitstring '" + bitstring +
                    "' is not a binary string of width " + std::to_string(width)
                );
            }
        }
    }

    std::string name() const override {
        return "bitstring_format";
    }
};

}  // namespace

std::string TrialValidator::name() const {
    return "trial_validator";
}

LambdaValidator::LambdaValidator(std::string name, ValidateFn fn)
    : name_(std::move(name))
    , fn_(std::move(fn)) {}

void LambdaValidator::validate(const TrialRecord& trial, std::size_t index) const {
    if (fn_) {
        fn_(trial, index);
    }
}

std::string LambdaValidator::name() const {
    return name_;
}

void ValidatorRegistry::register_validator(std::unique_ptr<TrialValidator> validator) {
    if (validator) {
        validators_.push_back(std::move(validator));
    }
}

void ValidatorRegistry::run_all_validators(const std::vector<TrialRecord>& trials) const {
    for (std::size_t index = 0; index < trials.size(); ++index) {
        for (const auto& validator : validators_) {
            validator->validate(trials[index], index);
        }
    }
}

std::vector<std::string> ValidatorRegistry::validator_names() const {
    std::vector<std::string> names;
    names.reserve(validators_.size());
    for (const auto& validator : validators_) {
        names.push_back(validator->name());
    }
    return names;
}

std::unique_ptr<TrialValidator> make_probability_vector_validator() {
    return std::make_unique<ProbabilityVectorValidator>();
}

std::unique_ptr<TrialValidator> make_shot_count_validator() {
    return std::make_unique<ShotCountValidator>();
}

std::unique_ptr<TrialValidator> make_bitstring_format_validator() {
    return std::make_unique<BitstringFormatValidator>();
}

ValidatorRegistry make_trial_validator_registry() {
    ValidatorRegistry registry;
    registry.register_validator(make_probability_vector_validator());
    registry.register_validator(make_shot_count_validator());
    registry.register_validator(make_bitstring_format_validator());
    return registry;
}

}  // namespace bench_analysis
