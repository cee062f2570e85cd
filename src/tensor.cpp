#include "QCalib/tensor.hpp"
#include "QCalib/errors.hpp"

#include <sstream>

namespace qcalib {

int64_t element_count(const Shape& shape) {
    int64_t n = 1;
    for (auto d : shape) {
        if (d < 0) {
            throw DataShapeError("Cannot count elements of symbolic shape " + shape_to_string(shape));
        }
        n *= d;
    }
    return n;
}

std::string shape_to_string(const Shape& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) oss << ", ";
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

bool shape_matches(const Shape& declared, const Shape& actual) {
    if (declared.empty()) return true;
    if (declared.size() != actual.size()) return false;
    for (size_t i = 0; i < declared.size(); ++i) {
        if (declared[i] >= 0 && declared[i] != actual[i]) return false;
    }
    return true;
}

Tensor Tensor::zeros(const Shape& shape) {
    return Tensor(shape, std::vector<float>(static_cast<size_t>(element_count(shape)), 0.0f));
}

void Tensor::validate(const std::string& what) const {
    if (element_count(shape) != numel()) {
        throw DataShapeError(what + ": shape " + shape_to_string(shape) + " requires " +
                             std::to_string(element_count(shape)) + " elements but " +
                             std::to_string(numel()) + " are present");
    }
}

} // namespace qcalib
