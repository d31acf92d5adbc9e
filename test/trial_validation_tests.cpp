#include "analysis/errors.hpp"
#include "analysis/trial_validation.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using bench_analysis::InvalidInputError;
using bench_analysis::LambdaValidator;
using bench_analysis::TrialRecord;
using bench_analysis::ValidatorRegistry;

TEST(TrialValidatorRegistryTests, PropagatesValidatorExceptions) {
    ValidatorRegistry registry;
    registry.register_validator(std::make_unique<LambdaValidator>(
        "throws",
        [](const TrialRecord&, std::size_t) {
            throw std::runtime_error("boom");
        }
    ));
    EXPECT_THROW(
        registry.run_all_validators({test_helpers::make_depth2_trial(80)}),
        std::runtime_error
    );
}

TEST(TrialValidatorRegistryTests, RunsLambdaValidatorsInOrder) {
    ValidatorRegistry registry;
    bool first = false;
    bool second = false;
    registry.register_validator(std::make_unique<LambdaValidator>(
        "first",
        [&](const TrialRecord&, std::size_t) {
            first = true;
        }
    ));
    registry.register_validator(std::make_unique<LambdaValidator>(
        "second",
        [&](const TrialRecord&, std::size_t) {
            if (!first) {
                throw std::runtime_error("order");
            }
            second = true;
        }
    ));
    EXPECT_NO_THROW(registry.run_all_validators({test_helpers::make_depth2_trial(80)}));
    EXPECT_TRUE(first);
    EXPECT_TRUE(second);
}

TEST(TrialValidatorRegistryTests, DefaultRegistryListsValidators) {
    const ValidatorRegistry registry = bench_analysis::make_trial_validator_registry();
    const std::vector<std::string> expected = {
        "probability_vector",
        "shot_count",
        "bitstring_format",
    };
    EXPECT_EQ(registry.validator_names(), expected);
}

TEST(TrialValidatorRegistryTests, AcceptsWellFormedTrials) {
    const ValidatorRegistry registry = bench_analysis::make_trial_validator_registry();
    EXPECT_NO_THROW(registry.run_all_validators(test_helpers::make_depth2_trials(5, 70)));
}

TEST(TrialValidatorRegistryTests, RejectsProbabilityVectorLengthMismatch) {
    TrialRecord trial = test_helpers::make_depth2_trial(80);
    trial.metadata.ideal_probabilities = {0.5, 0.5};
    const ValidatorRegistry registry = bench_analysis::make_trial_validator_registry();
    EXPECT_THROW(registry.run_all_validators({trial}), InvalidInputError);
}

TEST(TrialValidatorRegistryTests, RejectsProbabilitiesThatDoNotSumToOne) {
    TrialRecord trial = test_helpers::make_depth2_trial(80);
    trial.metadata.ideal_probabilities = {0.1, 0.2, 0.3, 0.3};
    const ValidatorRegistry registry = bench_analysis::make_trial_validator_registry();
    EXPECT_THROW(registry.run_all_validators({trial}), InvalidInputError);
}

TEST(TrialValidatorRegistryTests, RejectsNegativeProbabilities) {
    TrialRecord trial = test_helpers::make_depth2_trial(80);
    trial.metadata.ideal_probabilities = {-0.1, 0.3, 0.4, 0.4};
    const auto validator = bench_analysis::make_probability_vector_validator();
    EXPECT_THROW(validator->validate(trial, 0), InvalidInputError);
}

TEST(TrialValidatorRegistryTests, RejectsZeroShotsAndNamesTheTrial) {
    std::vector<TrialRecord> trials = test_helpers::make_depth2_trials(3, 80);
    for (auto& entry : trials[2].counts) {
        entry.second = 0;
    }
    const ValidatorRegistry registry = bench_analysis::make_trial_validator_registry();
    try {
        registry.run_all_validators(trials);
        FAIL() << "expected InvalidInputError";
    } catch (const InvalidInputError& ex) {
        EXPECT_NE(std::string(ex.what()).find("trial 2"), std::string::npos);
    }
}

TEST(TrialValidatorRegistryTests, RejectsMalformedBitstrings) {
    const auto validator = bench_analysis::make_bitstring_format_validator();

    TrialRecord wrong_width = test_helpers::make_depth2_trial(80);
    wrong_width.counts["101"] = 1;
    EXPECT_THROW(validator->validate(wrong_width, 0), InvalidInputError);

    TrialRecord wrong_digit = test_helpers::make_depth2_trial(80);
    wrong_digit.counts["1x"] = 1;
    EXPECT_THROW(validator->validate(wrong_digit, 0), InvalidInputError);
}
