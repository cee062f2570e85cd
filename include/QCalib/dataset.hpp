#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "QCalib/ir.hpp"
#include "QCalib/tensor.hpp"

namespace qcalib {

/** Ordered, finite sequence of calibration inputs consumed front to back. */
class CalibrationDataset {
public:
    virtual ~CalibrationDataset() = default;

    virtual size_t size() const = 0;
    virtual const Tensor& at(size_t index) const = 0;
    virtual const Shape& sampleShape() const = 0;

    bool empty() const { return size() == 0; }
};

/** In-memory dataset; every sample must match the expected shape. */
class TensorDataset : public CalibrationDataset {
public:
    explicit TensorDataset(Shape expected_shape);

    /** Append a sample. Throws DataShapeError on a shape or size mismatch. */
    void add(Tensor sample);

    size_t size() const override { return samples_.size(); }
    const Tensor& at(size_t index) const override;
    const Shape& sampleShape() const override { return expected_shape_; }

private:
    Shape expected_shape_;
    std::vector<Tensor> samples_;
};

/**
 * Read dataset_size samples of sample_shape from a raw little-endian
 * float32 file. Throws DataShapeError if the file holds a different
 * number of elements.
 */
TensorDataset load_tensor_file(const std::string& path, size_t dataset_size, const Shape& sample_shape);

/**
 * Concrete sample shape for a graph input. Symbolic dims (-1) are
 * filled from override_shape; a concrete dim that disagrees with the
 * override is a DataShapeError.
 */
Shape resolve_input_shape(const ValueInfo& input, const Shape& override_shape);

} // namespace qcalib
