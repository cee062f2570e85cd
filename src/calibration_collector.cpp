#include "QCalib/calibration_collector.hpp"
#include "QCalib/errors.hpp"
#include "QCalib/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace qcalib {

CalibrationMode parse_calibration_mode(const std::string& name) {
    if (name == "naive") return CalibrationMode::NAIVE;
    throw ConfigurationError("Unknown value for calib_mode: '" + name +
                             "'. Currently only naive mode is supported.");
}

std::string to_string(CalibrationMode mode) {
    switch (mode) {
        case CalibrationMode::NAIVE: return "naive";
    }
    return "unknown";
}

ValueRange ValueRange::includeZero() const {
    return ValueRange{std::min(min, 0.0f), std::max(max, 0.0f)};
}

void PerNodeStatistics::merge(const std::string& output_name, const ValueRange& range) {
    auto it = index_.find(output_name);
    if (it == index_.end()) {
        index_.emplace(output_name, entries_.size());
        entries_.emplace_back(output_name, range);
        return;
    }
    ValueRange& current = entries_[it->second].second;
    current.min = std::min(current.min, range.min);
    current.max = std::max(current.max, range.max);
}

const ValueRange* PerNodeStatistics::find(const std::string& output_name) const {
    auto it = index_.find(output_name);
    return it != index_.end() ? &entries_[it->second].second : nullptr;
}

CalibrationCollector::CalibrationCollector(std::shared_ptr<InferenceBackend> backend, CalibrationMode mode)
    : backend_(std::move(backend)), mode_(mode), timer_(std::make_shared<PerformanceTimer>()) {
    if (!backend_) {
        throw ConfigurationError("CalibrationCollector requires an inference backend");
    }
}

CalibrationCollector::CalibrationCollector(std::shared_ptr<InferenceBackend> backend, const std::string& mode_name)
    : CalibrationCollector(std::move(backend), parse_calibration_mode(mode_name)) {}

void CalibrationCollector::validate(const AugmentedGraph& augmented, const CalibrationDataset& dataset) const {
    const ProbeManifest& manifest = augmented.manifest;
    const ComputationGraph& graph = augmented.graph;

    if (dataset.empty()) {
        throw ConfigurationError("Calibration dataset is empty");
    }
    if (graph.outputs.size() != manifest.original_output_count + 2 * manifest.probes.size()) {
        throw ConfigurationError("Augmented graph declares " + std::to_string(graph.outputs.size()) +
                                 " outputs but its manifest expects " +
                                 std::to_string(manifest.original_output_count + 2 * manifest.probes.size()));
    }
    // graphs with several runtime inputs are left to the backend
    const auto runtime_inputs = graph.runtimeInputs();
    if (runtime_inputs.size() == 1 && !shape_matches(runtime_inputs.front()->shape, dataset.sampleShape())) {
        throw DataShapeError("Calibration samples do not fit graph input '" + runtime_inputs.front()->name +
                             "'. The required shape is: " + shape_to_string(runtime_inputs.front()->shape) +
                             ". The real shape is: " + shape_to_string(dataset.sampleShape()));
    }
}

PerNodeStatistics CalibrationCollector::collect(const AugmentedGraph& augmented, const CalibrationDataset& dataset) {
    const ProbeManifest& manifest = augmented.manifest;
    const ComputationGraph& graph = augmented.graph;

    last_stats_ = CollectionStats{};
    last_stats_.probe_pairs = manifest.probes.size();

    validate(augmented, dataset);
    if (manifest.probes.empty()) {
        QCALIB_WARN("Graph '{}' has no quantization candidates; nothing to calibrate", graph.name);
    }

    try {
        backend_->prepare(graph);
    } catch (const CalibrationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExecutionFailure("Backend '" + backend_->name() + "' failed to prepare graph: " + e.what());
    }

    QCALIB_INFO("Calibrating {} probe pair(s) over {} sample(s) with backend '{}' ({} mode)",
                manifest.probes.size(), dataset.size(), backend_->name(), to_string(mode_));

    std::vector<ValueRange> running(manifest.probes.size(),
                                    ValueRange{std::numeric_limits<float>::infinity(),
                                               -std::numeric_limits<float>::infinity()});

    for (size_t i = 0; i < dataset.size(); ++i) {
        if (cancel_flag_ && cancel_flag_->load()) {
            QCALIB_WARN("Calibration cancelled after {} of {} sample(s)", i, dataset.size());
            throw CalibrationCancelled(i);
        }

        std::vector<NamedTensor> outputs = runSample(graph, dataset.at(i), i);

        if (timer_) timer_->start(stages::kAggregation);
        accumulate(manifest, outputs, i, running);
        if (timer_) timer_->end(stages::kAggregation);

        ++last_stats_.samples_processed;
        if ((i + 1) % 10 == 0 || i + 1 == dataset.size()) {
            QCALIB_INFO("Processed {}/{} calibration sample(s)", i + 1, dataset.size());
        }
    }

    PerNodeStatistics statistics;
    for (size_t p = 0; p < manifest.probes.size(); ++p) {
        statistics.merge(manifest.probes[p].owner_output, running[p]);
    }
    return statistics;
}

std::vector<NamedTensor> CalibrationCollector::runSample(const ComputationGraph& graph, const Tensor& input,
                                                         size_t sample_index) {
    QCALIB_TIME_SCOPE(timer_, stages::kInference);
    try {
        return backend_->run(graph, input);
    } catch (const ExecutionFailure& e) {
        if (e.hasSampleIndex()) throw;
        throw ExecutionFailure("Inference failed on calibration sample " + std::to_string(sample_index) +
                               ": " + e.what(), sample_index);
    } catch (const CalibrationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExecutionFailure("Inference failed on calibration sample " + std::to_string(sample_index) +
                               ": " + e.what(), sample_index);
    }
}

void CalibrationCollector::accumulate(const ProbeManifest& manifest, const std::vector<NamedTensor>& outputs,
                                      size_t sample_index, std::vector<ValueRange>& running) const {
    const size_t offset = manifest.original_output_count;
    const size_t expected = offset + 2 * manifest.probes.size();
    if (outputs.size() != expected) {
        throw ExecutionFailure("Sample " + std::to_string(sample_index) + ": backend returned " +
                               std::to_string(outputs.size()) + " outputs, expected " + std::to_string(expected),
                               sample_index);
    }

    auto probe_value = [&](size_t position, const std::string& expected_name) {
        const NamedTensor& out = outputs[position];
        if (out.name != expected_name) {
            throw ExecutionFailure("Sample " + std::to_string(sample_index) + ": output " + std::to_string(position) +
                                   " is '" + out.name + "', expected probe '" + expected_name + "'", sample_index);
        }
        if (out.value.numel() != 1) {
            throw ExecutionFailure("Sample " + std::to_string(sample_index) + ": probe '" + expected_name +
                                   "' is not a scalar (shape " + shape_to_string(out.value.shape) + ")", sample_index);
        }
        const float v = out.value.data[0];
        if (!std::isfinite(v)) {
            throw ExecutionFailure("Sample " + std::to_string(sample_index) + ": probe '" + expected_name +
                                   "' is not finite", sample_index);
        }
        return v;
    };

    for (size_t p = 0; p < manifest.probes.size(); ++p) {
        const ProbePair& probe = manifest.probes[p];
        const float lo = probe_value(offset + 2 * p, probe.min_output);
        const float hi = probe_value(offset + 2 * p + 1, probe.max_output);
        switch (mode_) {
            case CalibrationMode::NAIVE:
                running[p].min = std::min(running[p].min, lo);
                running[p].max = std::max(running[p].max, hi);
                break;
        }
    }
}

} // namespace qcalib
