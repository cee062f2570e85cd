#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "QCalib/calibration_collector.hpp"
#include "QCalib/log.hpp"
#include "QCalib/quantization_params.hpp"
#include "QCalib/tensor.hpp"

namespace qcalib {

struct CalibrationConfig {
    std::string model_path;
    std::string dataset_path;
    size_t dataset_size{30};
    Shape sample_shape;   // empty: taken from the graph input
    std::string output_path{"calibrated_quantization_params.json"};
    std::string augmented_model_path{"augmented_model.json"};   // empty: not written
    CalibrationMode calib_mode{CalibrationMode::NAIVE};
    std::vector<std::string> candidate_op_types;   // empty: Conv, MatMul
    int32_t bit_width{8};
    MissingStatisticsPolicy missing_statistics{MissingStatisticsPolicy::kSkip};
    LogLevel log_level{LogLevel::kInfo};
};

/**
 * Parse a calibration configuration JSON file. Throws std::runtime_error
 * if the file cannot be read and ConfigurationError for invalid values.
 */
CalibrationConfig load_calibration_config_from_json(const std::string& json_path);

CalibrationConfig parse_calibration_config(const nlohmann::json& root);

/** Positive decimal sample count; anything else (e.g. "12abc") is a ConfigurationError. */
size_t parse_dataset_size(const std::string& text);

} // namespace qcalib
