#include "QCalib/calibration_pipeline.hpp"
#include "QCalib/errors.hpp"
#include "QCalib/graph_loader.hpp"
#include "QCalib/log.hpp"
#include "QCalib/quantization_params_io.hpp"

namespace qcalib {

namespace {

QuantizationOptions quantization_options(const CalibrationConfig& config) {
    QuantizationOptions options;
    options.bit_width = config.bit_width;
    options.missing_statistics = config.missing_statistics;
    options.candidate_op_types = config.candidate_op_types;
    return options;
}

AugmentOptions augment_options(const CalibrationConfig& config) {
    AugmentOptions options;
    if (!config.candidate_op_types.empty()) options.candidate_op_types = config.candidate_op_types;
    return options;
}

} // namespace

CalibrationPipeline::CalibrationPipeline(CalibrationConfig config, std::shared_ptr<InferenceBackend> backend)
    : config_(std::move(config)),
      timer_(std::make_shared<PerformanceTimer>()),
      collector_(std::move(backend), config_.calib_mode),
      calculator_(quantization_options(config_)) {
    collector_.setTimer(timer_);
}

CalibrationReport CalibrationPipeline::run(const ComputationGraph& graph, const CalibrationDataset& dataset) {
    timer_->clear();
    timer_->start(stages::kPipelineTotal);

    AugmentedGraph augmented;
    {
        QCALIB_TIME_SCOPE(timer_, stages::kAugmentation);
        augmented = augment_graph(graph, augment_options(config_));
    }
    collector_.validate(augmented, dataset);
    if (!config_.augmented_model_path.empty()) {
        save_graph_to_json(augmented.graph, config_.augmented_model_path);
        QCALIB_INFO("Augmented graph written to {}", config_.augmented_model_path);
    }

    CalibrationReport report;
    report.statistics = collector_.collect(augmented, dataset);
    {
        QCALIB_TIME_SCOPE(timer_, stages::kParameterDerivation);
        report.parameters = calculator_.calculate(graph, report.statistics);
    }
    report.manifest = std::move(augmented.manifest);

    timer_->end(stages::kPipelineTotal);
    report.latency = getLatencyReport();
    return report;
}

TensorDataset load_calibration_dataset(const CalibrationConfig& config, const ComputationGraph& graph) {
    const auto runtime_inputs = graph.runtimeInputs();
    if (runtime_inputs.size() != 1) {
        throw ConfigurationError("Calibration needs a graph with exactly one runtime input, '" + graph.name +
                                 "' has " + std::to_string(runtime_inputs.size()));
    }
    if (config.dataset_path.empty()) {
        throw ConfigurationError("dataset_path is not set");
    }
    const Shape sample_shape = resolve_input_shape(*runtime_inputs.front(), config.sample_shape);
    QCALIB_INFO("Loading {} calibration sample(s) of shape {} from {}",
                config.dataset_size, shape_to_string(sample_shape), config.dataset_path);
    return load_tensor_file(config.dataset_path, config.dataset_size, sample_shape);
}

CalibrationReport run_calibration(const CalibrationConfig& config, std::shared_ptr<InferenceBackend> backend) {
    if (config.model_path.empty()) {
        throw ConfigurationError("model_path is not set");
    }
    // building the pipeline validates mode and bit width before any file is read
    CalibrationPipeline pipeline(config, std::move(backend));

    const ComputationGraph graph = load_graph_from_json(config.model_path);
    const TensorDataset dataset = load_calibration_dataset(config, graph);

    CalibrationReport report = pipeline.run(graph, dataset);
    write_quantization_params(report.parameters, config.output_path);
    QCALIB_INFO("Quantization parameters for {} output(s) written to {}",
                report.parameters.size(), config.output_path);
    return report;
}

} // namespace qcalib
