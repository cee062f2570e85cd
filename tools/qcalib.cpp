#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "QCalib/calibration_config.hpp"
#include "QCalib/calibration_pipeline.hpp"
#include "QCalib/errors.hpp"
#include "QCalib/log.hpp"
#include "QCalib/reference_interpreter.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [config.json] [options]\n"
              << "  --model PATH          graph JSON to calibrate\n"
              << "  --dataset PATH        raw float32 calibration tensor file\n"
              << "  --output PATH         quantization parameter JSON to write\n"
              << "  --augmented PATH      where to write the augmented graph (\"\" to skip)\n"
              << "  --calib-mode NAME     calibration mode (naive)\n"
              << "  --dataset-size N      number of samples in the dataset file\n"
              << "  --log-level LEVEL     info | warn | error | off\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace qcalib;

    try {
        CalibrationConfig config;
        int i = 1;
        if (i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
            config = load_calibration_config_from_json(argv[i]);
            ++i;
        }
        for (; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            const std::string value = argv[++i];
            if (arg == "--model") {
                config.model_path = value;
            } else if (arg == "--dataset") {
                config.dataset_path = value;
            } else if (arg == "--output") {
                config.output_path = value;
            } else if (arg == "--augmented") {
                config.augmented_model_path = value;
            } else if (arg == "--calib-mode") {
                config.calib_mode = parse_calibration_mode(value);
            } else if (arg == "--dataset-size") {
                config.dataset_size = parse_dataset_size(value);
            } else if (arg == "--log-level") {
                config.log_level = parse_log_level(value);
            } else {
                std::cerr << "Unknown option " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        Logger::level() = config.log_level;

        auto backend = std::make_shared<ReferenceInterpreter>();
        const CalibrationReport report = run_calibration(config, backend);

        if (Logger::level() <= LogLevel::kInfo) {
            std::cout << report.latency.generateReport();
        }
        QCALIB_INFO("Calibrated quantization parameters saved.");
        return 0;
    } catch (const std::exception& e) {
        QCALIB_ERROR("{}", e.what());
        return 1;
    }
}
