#pragma once

#include <atomic>
#include <memory>

#include "QCalib/calibration_collector.hpp"
#include "QCalib/calibration_config.hpp"
#include "QCalib/dataset.hpp"
#include "QCalib/graph_augmenter.hpp"
#include "QCalib/inference_backend.hpp"
#include "QCalib/performance_timer.hpp"
#include "QCalib/quantization_params.hpp"

namespace qcalib {

struct CalibrationReport {
    ProbeManifest manifest;
    PerNodeStatistics statistics;
    QuantizationParameterMap parameters;
    CalibrationLatencyReport latency;
};

/**
 * Augment -> collect -> derive. Mode and bit width are validated when
 * the pipeline is built, so a bad configuration fails before any graph
 * is touched.
 */
class CalibrationPipeline {
public:
    CalibrationPipeline(CalibrationConfig config, std::shared_ptr<InferenceBackend> backend);

    /**
     * The original graph is left unmodified and is the one used for
     * derivation. The dataset is validated before the augmented graph
     * is written, so a rejected run leaves no files behind.
     */
    CalibrationReport run(const ComputationGraph& graph, const CalibrationDataset& dataset);

    void setCancellationFlag(const std::atomic<bool>* flag) { collector_.setCancellationFlag(flag); }

    CalibrationLatencyReport getLatencyReport() const { return CalibrationLatencyReport::fromTimer(*timer_); }

    const CalibrationConfig& config() const { return config_; }

private:
    CalibrationConfig config_;
    std::shared_ptr<PerformanceTimer> timer_;
    CalibrationCollector collector_;
    QuantizationParameterCalculator calculator_;
};

/**
 * Dataset described by config for the graph's single runtime input:
 * dataset_size samples read from dataset_path.
 */
TensorDataset load_calibration_dataset(const CalibrationConfig& config, const ComputationGraph& graph);

/** Load model and dataset, run the pipeline, write config.output_path. */
CalibrationReport run_calibration(const CalibrationConfig& config, std::shared_ptr<InferenceBackend> backend);

} // namespace qcalib
