#include "QCalib/quantization_params_io.hpp"
#include "QCalib/errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace qcalib {

using ordered_json = nlohmann::ordered_json;

ordered_json quantization_params_to_json(const QuantizationParameterMap& params) {
    ordered_json root = ordered_json::object();
    for (const auto& entry : params.entries()) {
        root[entry.first] = ordered_json{
            {"zero_point", static_cast<int>(entry.second.zero_point)},
            {"scale", entry.second.scale}
        };
    }
    return root;
}

void write_quantization_params(const QuantizationParameterMap& params, const std::string& json_path) {
    std::ofstream ofs(json_path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open quantization parameter file for writing: " + json_path);
    }
    ofs << quantization_params_to_json(params).dump(2) << "\n";
    if (!ofs) {
        throw std::runtime_error("Failed to write quantization parameter file: " + json_path);
    }
}

QuantizationParameterMap load_quantization_params_from_json(const std::string& json_path) {
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open quantization parameter file: " + json_path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    const ordered_json root = ordered_json::parse(buffer.str());
    if (!root.is_object()) {
        throw std::runtime_error("Quantization parameter file must hold a JSON object");
    }

    QuantizationParameterMap params;
    for (const auto& item : root.items()) {
        const auto& entry = item.value();
        const int zero_point = entry.at("zero_point").get<int>();
        const float scale = entry.at("scale").get<float>();
        if (zero_point < 0 || zero_point > 255 || !(scale > 0.0f)) {
            throw ConfigurationError("Invalid quantization parameter for '" + item.key() + "'");
        }
        params.set(item.key(), QuantizationParameter{static_cast<uint8_t>(zero_point), scale});
    }
    return params;
}

} // namespace qcalib
