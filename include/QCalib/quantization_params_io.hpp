#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "QCalib/quantization_params.hpp"

namespace qcalib {

/** {"<output>": {"zero_point": z, "scale": s}, ...} in map order. */
nlohmann::ordered_json quantization_params_to_json(const QuantizationParameterMap& params);

void write_quantization_params(const QuantizationParameterMap& params, const std::string& json_path);

/** Read back a file written by write_quantization_params(). */
QuantizationParameterMap load_quantization_params_from_json(const std::string& json_path);

} // namespace qcalib
