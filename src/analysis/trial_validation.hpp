#pragma once

#include "experiment/trial_record.types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace bench_analysis {

class TrialValidator {
public:
    virtual ~TrialValidator() = default;
    // Throws InvalidInputError when `trial` cannot be analysed.
    virtual void validate(const TrialRecord& trial, std::size_t index) const = 0;
    virtual std::string name() const;
};

class LambdaValidator final : public TrialValidator {
public:
    using ValidateFn = std::function<void(const TrialRecord& trial, std::size_t index)>;

    LambdaValidator(std::string name, ValidateFn fn);
    void validate(const TrialRecord& trial, std::size_t index) const override;
    std::string name() const override;

private:
    std::string name_;
    ValidateFn fn_;
};

class ValidatorRegistry final {
public:
    void register_validator(std::unique_ptr<TrialValidator> validator);
    // Validators run in registration order for each trial in turn.
    void run_all_validators(const std::vector<TrialRecord>& trials) const;
    std::vector<std::string> validator_names() const;

private:
    std::vector<std::unique_ptr<TrialValidator>> validators_;
};

std::unique_ptr<TrialValidator> make_probability_vector_validator();
std::unique_ptr<TrialValidator> make_shot_count_validator();
std::unique_ptr<TrialValidator> make_bitstring_format_validator();

// probability_vector, shot_count and bitstring_format, in that order.
ValidatorRegistry make_trial_validator_registry();

}  // namespace bench_analysis
