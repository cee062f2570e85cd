#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "QCalib/calibration_collector.hpp"
#include "QCalib/ir.hpp"

namespace qcalib {

struct QuantizationParameter {
    uint8_t zero_point;
    float scale;
};

/** Parameters keyed by candidate output tensor, in node order. */
class QuantizationParameterMap {
public:
    using Entry = std::pair<std::string, QuantizationParameter>;

    void set(const std::string& output_name, const QuantizationParameter& param);
    const QuantizationParameter* find(const std::string& output_name) const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// Fused activations recognized on the consumer of a candidate output.
struct NoActivation {};

/** Clip with constant bounds; a missing bound is +/- infinity. */
struct ClipActivation {
    float min;
    float max;
};

/** Relu: values below zero are discarded. */
struct ReluActivation {};

using FusedActivation = std::variant<NoActivation, ClipActivation, ReluActivation>;

/**
 * Classify a node as a fused activation. Clip bounds come from the
 * "min"/"max" attributes or from constant initializer inputs 1 and 2;
 * a Clip with a non-constant bound is NoActivation.
 */
FusedActivation classify_activation(const OperatorNode& node, const ComputationGraph& graph);

/** Narrow range to what the activation lets through. Never widens. */
ValueRange apply_activation(const ValueRange& range, const FusedActivation& activation);

/**
 * 8-bit affine parameters for one observed range: include zero, tighten
 * by the activation, then scale = (max - min) / 255 (1 when max == min)
 * and zero_point = round_half_even(clamp(-min / scale, 0, 255)).
 */
QuantizationParameter calculate_scale_zero_point(const ValueRange& observed, const FusedActivation& activation);

enum class MissingStatisticsPolicy {
    kSkip,   // leave the candidate out of the result
    kError   // throw ConfigurationError
};

/** Throws ConfigurationError for anything but "skip" or "error". */
MissingStatisticsPolicy parse_missing_statistics_policy(const std::string& name);

struct QuantizationOptions {
    int32_t bit_width = 8;
    MissingStatisticsPolicy missing_statistics = MissingStatisticsPolicy::kSkip;
    std::vector<std::string> candidate_op_types;   // empty: default_candidate_op_types()
};

/** Derives per-output quantization parameters from calibration statistics. */
class QuantizationParameterCalculator {
public:
    /** Throws ConfigurationError if bit_width is not 8. */
    explicit QuantizationParameterCalculator(QuantizationOptions options = QuantizationOptions());

    /**
     * @param graph      the original, non-augmented graph
     * @param statistics folded ranges from CalibrationCollector
     */
    QuantizationParameterMap calculate(const ComputationGraph& graph, const PerNodeStatistics& statistics) const;

    /**
     * Activation fused onto tensor_name: the single consumer, classified.
     * Outputs with several consumers, no consumer, or that are graph
     * outputs get NoActivation.
     */
    static FusedActivation fusedActivationFor(const std::string& tensor_name, const ComputationGraph& graph,
                                              const ConsumerIndex& index);

    const QuantizationOptions& options() const { return options_; }

private:
    QuantizationOptions options_;
};

} // namespace qcalib
