#include "QCalib/quantization_params.hpp"
#include "QCalib/errors.hpp"
#include "QCalib/graph_augmenter.hpp"
#include "QCalib/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace qcalib {

namespace {

constexpr double kQuantLevels = 255.0;

/** Value of a constant scalar input, if input i is an initializer. */
bool constant_scalar_input(const OperatorNode& node, const ComputationGraph& graph, size_t i, float& value) {
    if (i >= node.inputs.size() || node.inputs[i].empty()) return false;
    auto it = graph.initializers.find(node.inputs[i]);
    if (it == graph.initializers.end() || it->second.numel() != 1) return false;
    value = it->second.data[0];
    return true;
}

bool has_runtime_input(const OperatorNode& node, const ComputationGraph& graph, size_t i) {
    return i < node.inputs.size() && !node.inputs[i].empty() && !graph.isInitializer(node.inputs[i]);
}

struct RangeAdjuster {
    ValueRange range;

    ValueRange operator()(const NoActivation&) const { return range; }

    ValueRange operator()(const ClipActivation& clip) const {
        ValueRange r = range;
        if (r.min < clip.min) r.min = clip.min;
        if (r.max > clip.max) r.max = clip.max;
        // bounds entirely outside the observed range collapse it
        if (r.max < r.min) r.max = r.min;
        return r;
    }

    ValueRange operator()(const ReluActivation&) const {
        ValueRange r = range;
        if (r.min < 0.0f) r.min = 0.0f;
        return r;
    }
};

} // namespace

void QuantizationParameterMap::set(const std::string& output_name, const QuantizationParameter& param) {
    auto it = index_.find(output_name);
    if (it != index_.end()) {
        entries_[it->second].second = param;
        return;
    }
    index_.emplace(output_name, entries_.size());
    entries_.emplace_back(output_name, param);
}

const QuantizationParameter* QuantizationParameterMap::find(const std::string& output_name) const {
    auto it = index_.find(output_name);
    return it != index_.end() ? &entries_[it->second].second : nullptr;
}

FusedActivation classify_activation(const OperatorNode& node, const ComputationGraph& graph) {
    if (node.op_type == "Relu") {
        return ReluActivation{};
    }
    if (node.op_type == "Clip") {
        if (has_runtime_input(node, graph, 1) || has_runtime_input(node, graph, 2)) {
            return NoActivation{};
        }
        ClipActivation clip{node.floatAttribute("min", -std::numeric_limits<float>::infinity()),
                            node.floatAttribute("max", std::numeric_limits<float>::infinity())};
        constant_scalar_input(node, graph, 1, clip.min);
        constant_scalar_input(node, graph, 2, clip.max);
        return clip;
    }
    return NoActivation{};
}

ValueRange apply_activation(const ValueRange& range, const FusedActivation& activation) {
    return std::visit(RangeAdjuster{range}, activation);
}

QuantizationParameter calculate_scale_zero_point(const ValueRange& observed, const FusedActivation& activation) {
    // zero must be exactly representable
    const ValueRange range = apply_activation(observed.includeZero(), activation);

    const double rmin = range.min;
    const double rmax = range.max;
    float scale = static_cast<float>(rmax != rmin ? (rmax - rmin) / kQuantLevels : 1.0);
    // a span too small for float after division falls back like an empty one
    if (!(scale > 0.0f)) scale = 1.0f;

    const double initial_zero_point = (0.0 - rmin) / static_cast<double>(scale);
    const double clamped = std::max(0.0, std::min(kQuantLevels, initial_zero_point));
    // nearbyint honours the default round-half-to-even mode
    const auto zero_point = static_cast<uint8_t>(std::nearbyint(clamped));

    return QuantizationParameter{zero_point, scale};
}

MissingStatisticsPolicy parse_missing_statistics_policy(const std::string& name) {
    if (name == "skip") return MissingStatisticsPolicy::kSkip;
    if (name == "error") return MissingStatisticsPolicy::kError;
    throw ConfigurationError("Unknown missing_statistics policy: '" + name + "' (expected 'skip' or 'error')");
}

QuantizationParameterCalculator::QuantizationParameterCalculator(QuantizationOptions options)
    : options_(std::move(options)) {
    if (options_.bit_width != 8) {
        throw ConfigurationError("Unknown value for nbits: " + std::to_string(options_.bit_width) +
                                 ". Only 8 bit quantization is currently supported");
    }
    if (options_.candidate_op_types.empty()) {
        options_.candidate_op_types = default_candidate_op_types();
    }
}

FusedActivation QuantizationParameterCalculator::fusedActivationFor(const std::string& tensor_name,
                                                                    const ComputationGraph& graph,
                                                                    const ConsumerIndex& index) {
    if (index.isGraphOutput(tensor_name)) return NoActivation{};
    const auto& consumers = index.consumersOf(tensor_name);
    if (consumers.size() != 1) return NoActivation{};
    const OperatorNode& consumer = graph.nodes[consumers.front()];
    // the activation must read the candidate as its data input
    if (consumer.inputs.empty() || consumer.inputs[0] != tensor_name) return NoActivation{};
    return classify_activation(consumer, graph);
}

QuantizationParameterMap QuantizationParameterCalculator::calculate(const ComputationGraph& graph,
                                                                    const PerNodeStatistics& statistics) const {
    const ConsumerIndex index(graph);
    const std::unordered_set<std::string> candidates(options_.candidate_op_types.begin(),
                                                     options_.candidate_op_types.end());

    QuantizationParameterMap params;
    for (const auto& node : graph.nodes) {
        if (node.outputs.empty() || node.outputs[0].empty()) continue;
        const std::string& output = node.outputs[0];
        const ValueRange* observed = statistics.find(output);

        if (!observed) {
            if (!candidates.count(node.op_type)) continue;
            if (options_.missing_statistics == MissingStatisticsPolicy::kError) {
                throw ConfigurationError("No calibration statistics for candidate output '" + output +
                                         "' of node '" + node.name + "'");
            }
            QCALIB_WARN("No calibration statistics for '{}' ({}); skipped", output, node.op_type);
            continue;
        }

        const FusedActivation activation = fusedActivationFor(output, graph, index);
        const QuantizationParameter param = calculate_scale_zero_point(*observed, activation);
        params.set(output, param);
    }

    QCALIB_INFO("Derived quantization parameters for {} of {} calibrated output(s)",
                params.size(), statistics.size());
    return params;
}

} // namespace qcalib
