#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "QCalib/dataset.hpp"
#include "QCalib/graph_augmenter.hpp"
#include "QCalib/inference_backend.hpp"
#include "QCalib/performance_timer.hpp"

namespace qcalib {

enum class CalibrationMode {
    NAIVE   // global min of ReduceMin probes, global max of ReduceMax probes
};

/** Throws ConfigurationError for anything but "naive". */
CalibrationMode parse_calibration_mode(const std::string& name);
std::string to_string(CalibrationMode mode);

struct ValueRange {
    float min;
    float max;

    /** Widen the range so that it contains 0. */
    ValueRange includeZero() const;
    bool containsZero() const { return min <= 0.0f && 0.0f <= max; }

    bool operator==(const ValueRange& other) const { return min == other.min && max == other.max; }
    bool operator!=(const ValueRange& other) const { return !(*this == other); }
};

/**
 * Observed range per candidate output tensor, in probe order. Holds the
 * raw folded ranges; zero inclusion happens at parameter derivation.
 */
class PerNodeStatistics {
public:
    using Entry = std::pair<std::string, ValueRange>;

    /** Insert, or widen an existing entry (min of mins, max of maxes). */
    void merge(const std::string& output_name, const ValueRange& range);

    const ValueRange* find(const std::string& output_name) const;
    bool contains(const std::string& output_name) const { return index_.count(output_name) > 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<Entry>& entries() const { return entries_; }

    bool operator==(const PerNodeStatistics& other) const { return entries_ == other.entries_; }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

/**
 * Runs the augmented graph once per calibration sample and folds the
 * probe scalars into PerNodeStatistics.
 */
class CalibrationCollector {
public:
    CalibrationCollector(std::shared_ptr<InferenceBackend> backend, CalibrationMode mode);

    /** Parses mode_name first; an unknown mode throws before anything runs. */
    CalibrationCollector(std::shared_ptr<InferenceBackend> backend, const std::string& mode_name);

    /**
     * @param augmented graph and manifest from augment_graph()
     * @param dataset   samples, fed to the backend in order
     * @return folded ranges keyed by candidate output tensor
     */
    PerNodeStatistics collect(const AugmentedGraph& augmented, const CalibrationDataset& dataset);

    /**
     * Checks collect() makes before touching the backend: the dataset is
     * not empty, its sample shape fits the graph input (DataShapeError),
     * and the graph's outputs agree with the manifest.
     */
    void validate(const AugmentedGraph& augmented, const CalibrationDataset& dataset) const;

    /** Checked between samples; raising it makes collect() throw CalibrationCancelled. */
    void setCancellationFlag(const std::atomic<bool>* flag) { cancel_flag_ = flag; }

    /** Share a timer with the caller (e.g. the pipeline). */
    void setTimer(std::shared_ptr<PerformanceTimer> timer) { timer_ = std::move(timer); }
    std::shared_ptr<PerformanceTimer> timer() const { return timer_; }

    CalibrationMode mode() const { return mode_; }

    struct CollectionStats {
        size_t samples_processed = 0;
        size_t probe_pairs = 0;
    };

    CollectionStats getLastCollectionStats() const { return last_stats_; }

private:
    std::shared_ptr<InferenceBackend> backend_;
    CalibrationMode mode_;
    const std::atomic<bool>* cancel_flag_ = nullptr;
    std::shared_ptr<PerformanceTimer> timer_;
    CollectionStats last_stats_;

    std::vector<NamedTensor> runSample(const ComputationGraph& graph, const Tensor& input, size_t sample_index);

    /** Fold one sample's probe outputs into running (min, max) per probe pair. */
    void accumulate(const ProbeManifest& manifest, const std::vector<NamedTensor>& outputs,
                    size_t sample_index, std::vector<ValueRange>& running) const;
};

} // namespace qcalib
