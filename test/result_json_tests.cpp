#include "experiment/experiment.hpp"
#include "experiment/experiment_data.hpp"
#include "service/result_json.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace bench_analysis;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(ResultJsonTests, SerializesQuantumVolumeResult) {
    QuantumVolumeResult result;
    result.quantum_volume = 4;
    result.success = true;
    result.confidence = 0.5;
    result.heavy_output_probability = {0.75, 0.25};
    result.mean_hop = 0.5;
    result.sigma = 0.25;
    result.depth = 2;
    result.trials = 2;

    EXPECT_EQ(
        service::to_json(result),
        "{\"quantum_volume\":4,\"success\":true,\"confidence\":0.5,"
        "\"heavy_output_probability\":[0.75,0.25],\"mean_hop\":0.5,\"sigma\":0.25,"
        "\"depth\":2,\"trials\":2}");
}

TEST(ResultJsonTests, SerializesCompositeAggregate) {
    CompositeAggregateResult result;
    result.experiment_types = {"A", "B"};
    result.experiment_ids = {"id1", "id\"2"};
    result.experiment_qubits = {{0}, {1, 2}};

    EXPECT_EQ(
        service::to_json(AnalysisResultData{"composite", result}),
        "{\"name\":\"composite\",\"value\":{\"experiment_types\":[\"A\",\"B\"],"
        "\"experiment_ids\":[\"id1\",\"id\\\"2\"],\"experiment_qubits\":[[0],[1,2]]}}");
}

TEST(ResultJsonTests, SerializesDiagnostic) {
    const Diagnostic diagnostic{"exp-9", kInsufficientSampleCategory, "line\nbreak"};
    EXPECT_EQ(
        service::to_json(diagnostic),
        "{\"experiment_id\":\"exp-9\",\"category\":\"InsufficientSample\","
        "\"message\":\"line\\nbreak\"}");
}

TEST(ResultJsonTests, EscapesControlCharactersInIds) {
    const Diagnostic diagnostic{std::string("exp\x01") + "\b", "Cat\t", "m"};
    EXPECT_EQ(
        service::to_json(diagnostic),
        "{\"experiment_id\":\"exp\\u0001\\u0008\",\"category\":\"Cat\\t\","
        "\"message\":\"m\"}");
}

TEST(ResultJsonTests, NestsAnalysedComponents) {
    auto qv = std::make_shared<QuantumVolumeExperiment>(std::vector<int>{0, 1});
    auto batch = std::make_shared<BatchExperiment>(
        std::vector<std::shared_ptr<const Experiment>>{qv});
    ExperimentData data(batch, "batch-1");
    data.component_experiment_data(0).set_experiment_id("qv-1");
    data.component_experiment_data(0).add_trials(test_helpers::make_depth2_trials(10, 80));
    batch->run_analysis(data);

    const std::string json = service::to_json(data);
    EXPECT_TRUE(contains(json, "\"experiment_id\":\"batch-1\""));
    EXPECT_TRUE(contains(json, "\"experiment_type\":\"BatchExperiment\""));
    EXPECT_TRUE(contains(json, "\"experiment_ids\":[\"qv-1\"]"));
    EXPECT_TRUE(contains(json, "\"components\":[{\"experiment_id\":\"qv-1\""));
    EXPECT_TRUE(contains(json, "\"quantum_volume\":1,\"success\":false"));
    EXPECT_TRUE(contains(json, "\"category\":\"InsufficientSample\""));
    EXPECT_TRUE(contains(json, "\"trials\":10}"));
}
