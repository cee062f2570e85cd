#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace qcalib {

/** Base class for every error raised by the calibration pipeline. */
class CalibrationError : public std::runtime_error {
public:
    explicit CalibrationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Unsupported calibration mode, bit width, missing statistics under the
 * error policy, empty dataset. Raised before any inference runs.
 */
class ConfigurationError : public CalibrationError {
public:
    explicit ConfigurationError(const std::string& what) : CalibrationError(what) {}
};

/** Tensor data does not match the declared shape. */
class DataShapeError : public CalibrationError {
public:
    explicit DataShapeError(const std::string& what) : CalibrationError(what) {}
};

/** Inference failed, or returned outputs that do not match the graph. */
class ExecutionFailure : public CalibrationError {
public:
    static constexpr size_t kNoSample = static_cast<size_t>(-1);

    explicit ExecutionFailure(const std::string& what, size_t sample_index = kNoSample)
        : CalibrationError(what), sample_index_(sample_index) {}

    size_t sampleIndex() const { return sample_index_; }
    bool hasSampleIndex() const { return sample_index_ != kNoSample; }

private:
    size_t sample_index_;
};

/** The cancellation flag was raised between two calibration samples. */
class CalibrationCancelled : public CalibrationError {
public:
    explicit CalibrationCancelled(size_t completed_samples)
        : CalibrationError("Calibration cancelled after " + std::to_string(completed_samples) + " sample(s)"),
          completed_samples_(completed_samples) {}

    size_t completedSamples() const { return completed_samples_; }

private:
    size_t completed_samples_;
};

} // namespace qcalib
