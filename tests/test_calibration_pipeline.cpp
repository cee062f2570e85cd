#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "QCalib/calibration_pipeline.hpp"
#include "QCalib/errors.hpp"
#include "QCalib/graph_loader.hpp"
#include "QCalib/quantization_params_io.hpp"
#include "QCalib/reference_interpreter.hpp"
#include "test_helpers.hpp"

using namespace qcalib;
using namespace qcalib::testing;

namespace {

TensorDataset two_sample_dataset() {
    TensorDataset dataset({1, 1, 3, 3});
    dataset.add(Tensor({1, 1, 3, 3}, {1, 2, 3, 4, 5, 6, 7, 8, 9}));
    dataset.add(Tensor({1, 1, 3, 3}, {-1, -2, -3, -4, -5, -6, -7, -8, -9}));
    return dataset;
}

void write_floats(const std::string& path, const std::vector<float>& values) {
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(reinterpret_cast<const char*>(values.data()),
              static_cast<std::streamsize>(values.size() * sizeof(float)));
}

CalibrationConfig scratch_config(const ScratchDir& dir) {
    CalibrationConfig config;
    config.model_path = dir.file("model.json");
    config.dataset_path = dir.file("data.bin");
    config.dataset_size = 2;
    config.output_path = dir.file("params.json");
    config.augmented_model_path = dir.file("augmented.json");
    return config;
}

} // namespace

TEST(CalibrationPipelineTest, CalibratesSmallCnnEndToEnd) {
    ScratchDir dir;
    CalibrationConfig config = scratch_config(dir);
    const ComputationGraph graph = small_cnn_graph();
    const nlohmann::json before = graph_to_json(graph);
    CalibrationPipeline pipeline(config, std::make_shared<ReferenceInterpreter>());

    const CalibrationReport report = pipeline.run(graph, two_sample_dataset());

    EXPECT_EQ(graph_to_json(graph), before);
    ASSERT_EQ(report.manifest.probes.size(), 2u);
    EXPECT_EQ(*report.statistics.find("c0"), (ValueRange{-14.0f, 14.0f}));
    EXPECT_EQ(*report.statistics.find("m0"), (ValueRange{0.0f, 22.0f}));

    ASSERT_EQ(report.parameters.size(), 2u);
    // c0 is fused with relu0, so the negative half is dropped
    EXPECT_FLOAT_EQ(report.parameters.find("c0")->scale, 14.0f / 255.0f);
    EXPECT_EQ(report.parameters.find("c0")->zero_point, 0);
    EXPECT_FLOAT_EQ(report.parameters.find("m0")->scale, 22.0f / 255.0f);
    EXPECT_EQ(report.parameters.find("m0")->zero_point, 0);

    EXPECT_EQ(report.latency.inference.measurement_count, 2u);
    EXPECT_EQ(report.latency.augmentation.measurement_count, 1u);
    EXPECT_EQ(report.latency.parameter_derivation.measurement_count, 1u);
    EXPECT_EQ(report.latency.pipeline_total.measurement_count, 1u);
    EXPECT_NE(report.latency.generateReport().find("Inference"), std::string::npos);

    const ComputationGraph augmented = load_graph_from_json(config.augmented_model_path);
    EXPECT_EQ(augmented.outputs.size(), 5u);
}

TEST(CalibrationPipelineTest, RepeatedRunsResetLatency) {
    ScratchDir dir;
    CalibrationConfig config = scratch_config(dir);
    config.augmented_model_path.clear();
    CalibrationPipeline pipeline(config, std::make_shared<ReferenceInterpreter>());

    pipeline.run(small_cnn_graph(), two_sample_dataset());
    const CalibrationReport second = pipeline.run(small_cnn_graph(), two_sample_dataset());

    EXPECT_EQ(second.latency.inference.measurement_count, 2u);
}

TEST(CalibrationPipelineTest, CandidateTypesFollowConfiguration) {
    ScratchDir dir;
    CalibrationConfig config = scratch_config(dir);
    config.augmented_model_path.clear();
    config.candidate_op_types = {"Add"};
    CalibrationPipeline pipeline(config, std::make_shared<ReferenceInterpreter>());

    const CalibrationReport report = pipeline.run(small_cnn_graph(), two_sample_dataset());

    ASSERT_EQ(report.parameters.size(), 1u);
    // y = m0 + (0.5, -0.5) spans [-0.5, 21.5]
    EXPECT_EQ(*report.statistics.find("y"), (ValueRange{-0.5f, 21.5f}));
    EXPECT_FLOAT_EQ(report.parameters.find("y")->scale, 22.0f / 255.0f);
    EXPECT_EQ(report.parameters.find("y")->zero_point, 6);
}

TEST(CalibrationPipelineTest, CancelledRunThrows) {
    ScratchDir dir;
    CalibrationConfig config = scratch_config(dir);
    config.augmented_model_path.clear();
    CalibrationPipeline pipeline(config, std::make_shared<ReferenceInterpreter>());
    std::atomic<bool> cancel{true};
    pipeline.setCancellationFlag(&cancel);

    EXPECT_THROW(pipeline.run(small_cnn_graph(), two_sample_dataset()), CalibrationCancelled);
}

TEST(CalibrationPipelineTest, RejectedDatasetLeavesNoAugmentedGraph) {
    ScratchDir dir;
    const CalibrationConfig config = scratch_config(dir);
    CalibrationPipeline pipeline(config, std::make_shared<ReferenceInterpreter>());

    EXPECT_THROW(pipeline.run(small_cnn_graph(), TensorDataset({1, 1, 3, 3})), ConfigurationError);
    EXPECT_FALSE(std::filesystem::exists(config.augmented_model_path));

    TensorDataset wrong_shape({1, 1, 4, 4});
    wrong_shape.add(Tensor::zeros({1, 1, 4, 4}));
    EXPECT_THROW(pipeline.run(small_cnn_graph(), wrong_shape), DataShapeError);
    EXPECT_FALSE(std::filesystem::exists(config.augmented_model_path));
}

TEST(RunCalibrationTest, ReadsModelAndDatasetAndWritesParameters) {
    ScratchDir dir;
    const CalibrationConfig config = scratch_config(dir);
    save_graph_to_json(small_cnn_graph(), config.model_path);
    write_floats(config.dataset_path, {1, 2, 3, 4, 5, 6, 7, 8, 9, -1, -2, -3, -4, -5, -6, -7, -8, -9});

    const CalibrationReport report = run_calibration(config, std::make_shared<ReferenceInterpreter>());

    const QuantizationParameterMap written = load_quantization_params_from_json(config.output_path);
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written.entries()[0].first, "c0");
    EXPECT_EQ(written.entries()[1].first, "m0");
    EXPECT_FLOAT_EQ(written.find("c0")->scale, report.parameters.find("c0")->scale);
}

TEST(RunCalibrationTest, DatasetSizeMismatchIsADataShapeError) {
    ScratchDir dir;
    CalibrationConfig config = scratch_config(dir);
    config.dataset_size = 3;
    save_graph_to_json(small_cnn_graph(), config.model_path);
    write_floats(config.dataset_path, std::vector<float>(18, 1.0f));

    EXPECT_THROW(run_calibration(config, std::make_shared<ReferenceInterpreter>()), DataShapeError);
}

TEST(RunCalibrationTest, BadConfigurationFailsBeforeInference) {
    ScratchDir dir;
    auto backend = std::make_shared<ScriptedBackend>([](const ComputationGraph&, const Tensor&) {
        return std::vector<NamedTensor>{};
    });

    CalibrationConfig bad_width = scratch_config(dir);
    bad_width.bit_width = 4;
    EXPECT_THROW(run_calibration(bad_width, backend), ConfigurationError);

    CalibrationConfig no_model = scratch_config(dir);
    no_model.model_path.clear();
    EXPECT_THROW(run_calibration(no_model, backend), ConfigurationError);

    EXPECT_EQ(backend->runCalls(), 0u);
    EXPECT_EQ(backend->prepareCalls(), 0u);
}
