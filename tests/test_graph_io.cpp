#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "QCalib/calibration_config.hpp"
#include "QCalib/errors.hpp"
#include "QCalib/graph_loader.hpp"
#include "QCalib/quantization_params_io.hpp"
#include "test_helpers.hpp"

using namespace qcalib;
using namespace qcalib::testing;
using json = nlohmann::json;

namespace {

void write_text(const std::string& path, const std::string& text) {
    std::ofstream ofs(path);
    ofs << text;
}

const char* kConvReluGraph = R"({
  "name": "conv_relu",
  "inputs": [{"name": "x", "shape": [1, 1, 2, 2]}],
  "outputs": [{"name": "y"}],
  "initializers": {"w": {"shape": [1, 1, 1, 1], "data": [2.0]}},
  "nodes": [
    {"name": "conv0", "op_type": "Conv", "inputs": ["x", "w"], "outputs": ["c"],
     "attributes": {"strides": [1, 1], "group": 1}},
    {"name": "clip0", "op_type": "Clip", "inputs": ["c"], "outputs": ["y"],
     "attributes": {"min": 0.0, "max": 6.0, "mode": "fast"}}
  ]
})";

} // namespace

TEST(GraphLoaderTest, ParsesNodesInputsAndAttributes) {
    const ComputationGraph g = parse_graph_json(json::parse(kConvReluGraph));

    EXPECT_EQ(g.name, "conv_relu");
    ASSERT_EQ(g.inputs.size(), 1u);
    EXPECT_EQ(g.inputs[0].shape, (Shape{1, 1, 2, 2}));
    EXPECT_EQ(g.inputs[0].elem_type, "float32");
    ASSERT_EQ(g.nodes.size(), 2u);
    EXPECT_EQ(g.nodes[0].op_type, "Conv");
    EXPECT_EQ(g.nodes[0].intsAttribute("strides"), (std::vector<int64_t>{1, 1}));
    EXPECT_EQ(g.nodes[0].intAttribute("group", 0), 1);
    EXPECT_FLOAT_EQ(g.nodes[1].floatAttribute("max", 0.0f), 6.0f);
    ASSERT_NE(g.nodes[1].findAttribute("mode"), nullptr);
    EXPECT_EQ(g.nodes[1].findAttribute("mode")->s, "fast");
    EXPECT_TRUE(g.isInitializer("w"));
    EXPECT_TRUE(g.isGraphOutput("y"));
    ASSERT_EQ(g.runtimeInputs().size(), 1u);
}

TEST(GraphLoaderTest, AcceptsGraphWrapper) {
    json wrapped;
    wrapped["graph"] = json::parse(kConvReluGraph);
    const ComputationGraph g = parse_graph_json(wrapped);
    EXPECT_EQ(g.nodes.size(), 2u);
}

TEST(GraphLoaderTest, RejectsMissingRequiredFields) {
    EXPECT_THROW(parse_graph_json(json::parse(R"({"outputs": []})")), std::runtime_error);
    EXPECT_THROW(parse_graph_json(json::parse(R"({"nodes": []})")), std::runtime_error);
    EXPECT_THROW(parse_graph_json(json::parse(R"({"nodes": {}, "outputs": []})")), std::runtime_error);
    EXPECT_THROW(load_graph_from_json("/nonexistent/qcalib/graph.json"), std::runtime_error);
}

TEST(GraphLoaderTest, RejectsInitializerWithWrongElementCount) {
    json g = json::parse(kConvReluGraph);
    g["initializers"]["w"]["data"] = {1.0, 2.0};
    EXPECT_THROW(parse_graph_json(g), DataShapeError);
}

TEST(GraphLoaderTest, SaveThenLoadPreservesGraph) {
    ScratchDir dir;
    const ComputationGraph original = small_cnn_graph();
    save_graph_to_json(original, dir.file("graph.json"));

    const ComputationGraph loaded = load_graph_from_json(dir.file("graph.json"));

    EXPECT_EQ(graph_to_json(loaded), graph_to_json(original));
}

TEST(QuantizationParamsIoTest, WritesEntriesInNodeOrder) {
    QuantizationParameterMap params;
    params.set("conv_out", QuantizationParameter{0, 0.5f});
    params.set("a_matmul_out", QuantizationParameter{64, 0.25f});

    const auto j = quantization_params_to_json(params);

    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j.begin().key(), "conv_out");
    EXPECT_EQ(j.at("a_matmul_out").at("zero_point").get<int>(), 64);
    EXPECT_FLOAT_EQ(j.at("a_matmul_out").at("scale").get<float>(), 0.25f);
}

TEST(QuantizationParamsIoTest, FileCanBeReadBack) {
    ScratchDir dir;
    QuantizationParameterMap params;
    params.set("c0", QuantizationParameter{12, 0.125f});
    write_quantization_params(params, dir.file("params.json"));

    const QuantizationParameterMap loaded = load_quantization_params_from_json(dir.file("params.json"));

    ASSERT_NE(loaded.find("c0"), nullptr);
    EXPECT_EQ(loaded.find("c0")->zero_point, 12);
    EXPECT_FLOAT_EQ(loaded.find("c0")->scale, 0.125f);
}

TEST(QuantizationParamsIoTest, RejectsOutOfRangeValues) {
    ScratchDir dir;
    write_text(dir.file("bad.json"), R"({"c0": {"zero_point": 300, "scale": 0.1}})");
    EXPECT_THROW(load_quantization_params_from_json(dir.file("bad.json")), ConfigurationError);
    write_text(dir.file("zero_scale.json"), R"({"c0": {"zero_point": 0, "scale": 0.0}})");
    EXPECT_THROW(load_quantization_params_from_json(dir.file("zero_scale.json")), ConfigurationError);
}

TEST(CalibrationConfigTest, AppliesDefaults) {
    const CalibrationConfig cfg = parse_calibration_config(json::parse(R"({"model_path": "m.json"})"));

    EXPECT_EQ(cfg.model_path, "m.json");
    EXPECT_EQ(cfg.dataset_size, 30u);
    EXPECT_EQ(cfg.calib_mode, CalibrationMode::NAIVE);
    EXPECT_EQ(cfg.bit_width, 8);
    EXPECT_EQ(cfg.output_path, "calibrated_quantization_params.json");
    EXPECT_EQ(cfg.missing_statistics, MissingStatisticsPolicy::kSkip);
    EXPECT_TRUE(cfg.sample_shape.empty());
}

TEST(CalibrationConfigTest, ReadsAllFields) {
    ScratchDir dir;
    write_text(dir.file("config.json"), R"({
        "model_path": "model.json",
        "dataset_path": "data.bin",
        "dataset_size": 4,
        "sample_shape": [1, 3, 8, 8],
        "output_path": "out.json",
        "augmented_model_path": "",
        "calib_mode": "naive",
        "candidate_op_types": ["Conv", "Gemm"],
        "bit_width": 8,
        "missing_statistics": "error",
        "log_level": "warn"
    })");

    const CalibrationConfig cfg = load_calibration_config_from_json(dir.file("config.json"));

    EXPECT_EQ(cfg.dataset_path, "data.bin");
    EXPECT_EQ(cfg.dataset_size, 4u);
    EXPECT_EQ(cfg.sample_shape, (Shape{1, 3, 8, 8}));
    EXPECT_TRUE(cfg.augmented_model_path.empty());
    EXPECT_EQ(cfg.candidate_op_types, (std::vector<std::string>{"Conv", "Gemm"}));
    EXPECT_EQ(cfg.missing_statistics, MissingStatisticsPolicy::kError);
    EXPECT_EQ(cfg.log_level, LogLevel::kWarn);
}

TEST(CalibrationConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(parse_calibration_config(json::parse(R"({"calib_mode": "entropy"})")), ConfigurationError);
    EXPECT_THROW(parse_calibration_config(json::parse(R"({"bit_width": 4})")), ConfigurationError);
    EXPECT_THROW(parse_calibration_config(json::parse(R"({"dataset_size": 0})")), ConfigurationError);
    EXPECT_THROW(parse_calibration_config(json::parse(R"({"sample_shape": [1, 0]})")), ConfigurationError);
    EXPECT_THROW(parse_calibration_config(json::parse(R"({"log_level": "verbose"})")), ConfigurationError);
    EXPECT_THROW(parse_calibration_config(json::parse("[]")), ConfigurationError);
}

TEST(CalibrationConfigTest, DatasetSizeTextMustBeAPositiveInteger) {
    EXPECT_EQ(parse_dataset_size("12"), 12u);
    EXPECT_THROW(parse_dataset_size("12abc"), ConfigurationError);
    EXPECT_THROW(parse_dataset_size(""), ConfigurationError);
    EXPECT_THROW(parse_dataset_size("0"), ConfigurationError);
    EXPECT_THROW(parse_dataset_size("-3"), ConfigurationError);
    EXPECT_THROW(parse_dataset_size("99999999999999999999999"), ConfigurationError);
}
