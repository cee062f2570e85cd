#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qcalib {

using Shape = std::vector<int64_t>;

/** Number of elements described by a shape. An empty shape is a scalar (1 element). */
int64_t element_count(const Shape& shape);

/** Render a shape as "(1, 3, 224, 224)". */
std::string shape_to_string(const Shape& shape);

/**
 * True if actual fits a declared graph shape. Symbolic dims (-1) match
 * anything; an empty declared shape is unknown and matches every shape.
 */
bool shape_matches(const Shape& declared, const Shape& actual);

/** Dense float32 tensor in row-major order. */
struct Tensor {
    Shape shape;
    std::vector<float> data;

    Tensor() = default;
    Tensor(Shape s, std::vector<float> d) : shape(std::move(s)), data(std::move(d)) {}

    /** Zero-filled tensor of the given shape. */
    static Tensor zeros(const Shape& shape);
    static Tensor scalar(float value) { return Tensor({}, {value}); }

    int64_t numel() const { return static_cast<int64_t>(data.size()); }
    int64_t rank() const { return static_cast<int64_t>(shape.size()); }

    /** Throws DataShapeError if data size disagrees with shape. */
    void validate(const std::string& what) const;
};

struct NamedTensor {
    std::string name;
    Tensor value;
};

} // namespace qcalib
