#include "QCalib/dataset.hpp"
#include "QCalib/errors.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>

namespace qcalib {

TensorDataset::TensorDataset(Shape expected_shape) : expected_shape_(std::move(expected_shape)) {
    for (auto d : expected_shape_) {
        if (d < 0) {
            throw DataShapeError("Dataset shape must be concrete, got " + shape_to_string(expected_shape_));
        }
    }
}

void TensorDataset::add(Tensor sample) {
    if (sample.shape != expected_shape_) {
        throw DataShapeError("Calibration sample " + std::to_string(samples_.size()) +
                             " has incorrect shape. The required shape is: " + shape_to_string(expected_shape_) +
                             ". The real shape is: " + shape_to_string(sample.shape));
    }
    sample.validate("Calibration sample " + std::to_string(samples_.size()));
    samples_.push_back(std::move(sample));
}

const Tensor& TensorDataset::at(size_t index) const {
    if (index >= samples_.size()) {
        throw std::out_of_range("Calibration sample index " + std::to_string(index) +
                                " out of range (size " + std::to_string(samples_.size()) + ")");
    }
    return samples_[index];
}

TensorDataset load_tensor_file(const std::string& path, size_t dataset_size, const Shape& sample_shape) {
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open tensor file: " + path);
    }
    const std::streamsize bytes = ifs.tellg();
    ifs.seekg(0, std::ios::beg);

    const int64_t per_sample = element_count(sample_shape);
    const int64_t required = per_sample * static_cast<int64_t>(dataset_size);

    Shape required_shape{static_cast<int64_t>(dataset_size)};
    required_shape.insert(required_shape.end(), sample_shape.begin(), sample_shape.end());

    if (bytes % static_cast<std::streamsize>(sizeof(float)) != 0 ||
        bytes / static_cast<std::streamsize>(sizeof(float)) != required) {
        const int64_t real = bytes / static_cast<std::streamsize>(sizeof(float));
        throw DataShapeError("Input tensor file contains incorrect input size. The required size is: " +
                             shape_to_string(required_shape) + " (" + std::to_string(required) +
                             " elements). The real size is: (" + std::to_string(real) + ") elements in " +
                             std::to_string(bytes) + " bytes");
    }

    std::vector<char> raw(static_cast<size_t>(bytes));
    if (bytes > 0 && !ifs.read(raw.data(), bytes)) {
        throw std::runtime_error("Failed to read tensor file: " + path);
    }

    TensorDataset dataset(sample_shape);
    const size_t sample_bytes = static_cast<size_t>(per_sample) * sizeof(float);
    for (size_t i = 0; i < dataset_size; ++i) {
        std::vector<float> data(static_cast<size_t>(per_sample));
        std::memcpy(data.data(), raw.data() + i * sample_bytes, sample_bytes);
        dataset.add(Tensor(sample_shape, std::move(data)));
    }
    return dataset;
}

Shape resolve_input_shape(const ValueInfo& input, const Shape& override_shape) {
    if (override_shape.empty()) {
        for (auto d : input.shape) {
            if (d < 0) {
                throw DataShapeError("Graph input '" + input.name + "' has symbolic shape " +
                                     shape_to_string(input.shape) + "; a sample shape must be configured");
            }
        }
        return input.shape;
    }
    if (input.shape.empty()) {
        return override_shape;
    }
    if (override_shape.size() != input.shape.size()) {
        throw DataShapeError("Graph input '" + input.name + "' expects shape " + shape_to_string(input.shape) +
                             " but the configured sample shape is " + shape_to_string(override_shape));
    }
    Shape resolved = input.shape;
    for (size_t i = 0; i < resolved.size(); ++i) {
        if (resolved[i] < 0) {
            resolved[i] = override_shape[i];
        } else if (resolved[i] != override_shape[i]) {
            throw DataShapeError("Graph input '" + input.name + "' expects shape " + shape_to_string(input.shape) +
                                 " but the configured sample shape is " + shape_to_string(override_shape));
        }
    }
    return resolved;
}

} // namespace qcalib
