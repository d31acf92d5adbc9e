#include "service/analysis_service.hpp"

#include "experiment/experiment.hpp"
#include "experiment/experiment_data.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace bench_analysis;
using service::AnalysisJobResult;
using service::AnalysisService;
using service::AnalysisStatus;

namespace {

std::shared_ptr<ExperimentData> make_batch_data(std::size_t trials) {
    auto first = std::make_shared<QuantumVolumeExperiment>(std::vector<int>{0, 1});
    auto second = std::make_shared<QuantumVolumeExperiment>(std::vector<int>{2, 3});
    auto batch = std::make_shared<BatchExperiment>(
        std::vector<std::shared_ptr<const Experiment>>{first, second});
    auto data = std::make_shared<ExperimentData>(batch);
    data->component_experiment_data(0).add_trials(test_helpers::make_depth2_trials(trials, 85));
    data->component_experiment_data(1).add_trials(test_helpers::make_depth2_trials(trials, 55));
    return data;
}

std::optional<AnalysisJobResult> wait_for_result(
    const AnalysisService& service,
    const std::string& job_id
) {
    std::optional<AnalysisJobResult> result;
    for (int attempt = 0; attempt < 400 && !result; ++attempt) {
        result = service.poll_result(job_id);
        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    return result;
}

}  // namespace

TEST(AnalysisServiceTests, SubmitsAsyncAnalysisAndReturnsResult) {
    AnalysisService service;
    auto data = make_batch_data(120);

    const std::string job_id = service.submit(data);
    ASSERT_FALSE(job_id.empty());

    const std::optional<AnalysisJobResult> result = wait_for_result(service, job_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, AnalysisStatus::Completed);
    EXPECT_EQ(result->job_id, job_id);
    ASSERT_EQ(result->output.results.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<CompositeAggregateResult>(result->output.results[0].value));

    const auto snapshot = service.status(job_id);
    EXPECT_EQ(snapshot.status, AnalysisStatus::Completed);
    EXPECT_DOUBLE_EQ(snapshot.percent_complete, 1.0);
    EXPECT_TRUE(snapshot.active_experiments.empty());
    EXPECT_EQ(snapshot.last_finished_experiment, data->experiment_id());

    const auto& first = std::get<QuantumVolumeResult>(
        data->component_experiment_data(0).analysis_results().front().value);
    EXPECT_TRUE(first.success);
}

TEST(AnalysisServiceTests, FailedAnalysisReportsMessage) {
    AnalysisService service;
    auto data = make_batch_data(120);
    TrialRecord broken = test_helpers::make_depth2_trial(80);
    broken.metadata.ideal_probabilities = {0.5, 0.5};
    data->component_experiment_data(1).add_trial(broken);

    const std::string job_id = service.submit(data);
    const std::optional<AnalysisJobResult> result = wait_for_result(service, job_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, AnalysisStatus::Failed);
    EXPECT_NE(result->message.find("trial 120"), std::string::npos);
    EXPECT_EQ(service.status(job_id).status, AnalysisStatus::Failed);
    EXPECT_TRUE(data->analysis_results().empty());
}

TEST(AnalysisServiceTests, UnknownJobIsReportedAsFailed) {
    AnalysisService service;
    EXPECT_FALSE(service.poll_result("analysis-404").has_value());
    const auto snapshot = service.status("analysis-404");
    EXPECT_EQ(snapshot.status, AnalysisStatus::Failed);
    EXPECT_EQ(snapshot.message, "job_id not found");
}

TEST(AnalysisServiceTests, RunnerReportsProgressAndDiagnostics) {
    auto data = make_batch_data(40);
    test_helpers::RecordingReporter reporter;
    service::AnalysisRunner runner;

    const AnalysisJobResult result = runner.run(*data, {}, &reporter);
    EXPECT_EQ(result.status, AnalysisStatus::Completed);
    EXPECT_EQ(reporter.total_steps(), 3u);
    EXPECT_EQ(reporter.completed_steps(), 3u);
    ASSERT_EQ(reporter.logs().size(), 2u);
    EXPECT_EQ(reporter.logs()[0].category, kInsufficientSampleCategory);
    EXPECT_EQ(reporter.logs()[0].experiment_id, data->component_experiment_data(0).experiment_id());
    EXPECT_EQ(service::status_to_string(result.status), "completed");

    const std::string root = data->experiment_id();
    const std::string first = data->component_experiment_data(0).experiment_id();
    const std::string second = data->component_experiment_data(1).experiment_id();
    EXPECT_EQ(
        reporter.events(),
        (std::vector<std::string>{
            "enter " + root,
            "enter " + first,
            "exit " + first,
            "enter " + second,
            "exit " + second,
            "exit " + root,
        }));
}

TEST(AnalysisServiceTests, ProgressReporterTracksNestedExperiments) {
    AnalysisProgressReporter reporter;
    reporter.enter_experiment("batch");
    reporter.enter_experiment("qv-0");
    EXPECT_EQ(reporter.active_experiments(), (std::vector<std::string>{"batch", "qv-0"}));
    reporter.exit_experiment("qv-0");
    EXPECT_EQ(reporter.active_experiments(), (std::vector<std::string>{"batch"}));
    EXPECT_EQ(reporter.last_finished_experiment(), "qv-0");
    reporter.exit_experiment("batch");
    EXPECT_TRUE(reporter.active_experiments().empty());
    EXPECT_EQ(reporter.last_finished_experiment(), "batch");
}

TEST(AnalysisServiceTests, FailedAnalysisStillLeavesExperimentScopes) {
    auto data = make_batch_data(120);
    TrialRecord broken = test_helpers::make_depth2_trial(80);
    broken.counts.clear();
    data->component_experiment_data(0).add_trial(broken);
    test_helpers::RecordingReporter reporter;

    const AnalysisJobResult result = service::AnalysisRunner().run(*data, {}, &reporter);
    EXPECT_EQ(result.status, AnalysisStatus::Failed);
    const std::string root = data->experiment_id();
    const std::string first = data->component_experiment_data(0).experiment_id();
    EXPECT_EQ(
        reporter.events(),
        (std::vector<std::string>{"enter " + root, "enter " + first, "exit " + first, "exit " + root}));
}

TEST(AnalysisServiceTests, FinishedWorkersAreJoinedOnSubmit) {
    AnalysisService service;
    for (int job = 0; job < 40; ++job) {
        const std::string job_id = service.submit(make_batch_data(5));
        ASSERT_TRUE(wait_for_result(service, job_id).has_value());
        EXPECT_LE(service.worker_count(), 2u);
    }
    EXPECT_LE(service.worker_count(), 1u);
}
