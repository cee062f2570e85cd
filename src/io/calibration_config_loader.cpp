#include "QCalib/calibration_config.hpp"
#include "QCalib/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace qcalib {

using json = nlohmann::json;

CalibrationConfig parse_calibration_config(const json& root) {
    if (!root.is_object()) {
        throw ConfigurationError("Calibration config must be a JSON object");
    }

    CalibrationConfig cfg;
    cfg.model_path = root.value("model_path", "");
    cfg.dataset_path = root.value("dataset_path", "");
    cfg.output_path = root.value("output_path", cfg.output_path);
    cfg.augmented_model_path = root.value("augmented_model_path", cfg.augmented_model_path);
    cfg.calib_mode = parse_calibration_mode(root.value("calib_mode", "naive"));
    cfg.bit_width = root.value("bit_width", cfg.bit_width);
    cfg.missing_statistics = parse_missing_statistics_policy(root.value("missing_statistics", "skip"));

    const int64_t size = root.value("dataset_size", static_cast<int64_t>(cfg.dataset_size));
    if (size <= 0) {
        throw ConfigurationError("dataset_size must be positive, got " + std::to_string(size));
    }
    cfg.dataset_size = static_cast<size_t>(size);

    if (root.contains("sample_shape")) {
        cfg.sample_shape = root.at("sample_shape").get<Shape>();
        for (auto d : cfg.sample_shape) {
            if (d <= 0) {
                throw ConfigurationError("sample_shape must have positive dimensions, got " +
                                         shape_to_string(cfg.sample_shape));
            }
        }
    }
    if (root.contains("candidate_op_types")) {
        cfg.candidate_op_types = root.at("candidate_op_types").get<std::vector<std::string>>();
    }
    if (root.contains("log_level")) {
        try {
            cfg.log_level = parse_log_level(root.at("log_level").get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(e.what());
        }
    }
    if (cfg.bit_width != 8) {
        throw ConfigurationError("Unknown value for bit_width: " + std::to_string(cfg.bit_width) +
                                 ". Only 8 bit quantization is currently supported");
    }
    return cfg;
}

size_t parse_dataset_size(const std::string& text) {
    errno = 0;
    char* end = nullptr;
    const long long n = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE || n <= 0) {
        throw ConfigurationError("dataset_size must be a positive integer, got '" + text + "'");
    }
    return static_cast<size_t>(n);
}

CalibrationConfig load_calibration_config_from_json(const std::string& json_path) {
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) throw std::runtime_error("Failed to open calibration config: " + json_path);
    std::stringstream buffer; buffer << ifs.rdbuf();
    return parse_calibration_config(json::parse(buffer.str()));
}

} // namespace qcalib
