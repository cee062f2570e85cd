#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace qcalib {

/**
 * High-resolution timer keyed by stage name. A stage may be measured
 * several times (e.g. once per calibration sample).
 */
class PerformanceTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration = std::chrono::nanoseconds;

    PerformanceTimer() = default;

    void start(const std::string& stage_name) {
        start_times_[stage_name] = Clock::now();
    }

    /** Record the time since the matching start(); ignored if none is pending. */
    void end(const std::string& stage_name) {
        auto end_time = Clock::now();
        auto start_it = start_times_.find(stage_name);
        if (start_it != start_times_.end()) {
            durations_[stage_name].push_back(std::chrono::duration_cast<Duration>(end_time - start_it->second));
            start_times_.erase(start_it);
        }
    }

    int64_t getLastDuration(const std::string& stage_name) const {
        auto it = durations_.find(stage_name);
        if (it != durations_.end() && !it->second.empty()) {
            return it->second.back().count();
        }
        return 0;
    }

    double getAverageDuration(const std::string& stage_name) const {
        auto it = durations_.find(stage_name);
        if (it != durations_.end() && !it->second.empty()) {
            return static_cast<double>(getTotalDuration(stage_name)) / it->second.size();
        }
        return 0.0;
    }

    int64_t getTotalDuration(const std::string& stage_name) const {
        auto it = durations_.find(stage_name);
        int64_t total = 0;
        if (it != durations_.end()) {
            for (const auto& duration : it->second) total += duration.count();
        }
        return total;
    }

    size_t getMeasurementCount(const std::string& stage_name) const {
        auto it = durations_.find(stage_name);
        return it != durations_.end() ? it->second.size() : 0;
    }

    void clear() {
        start_times_.clear();
        durations_.clear();
    }

private:
    std::unordered_map<std::string, TimePoint> start_times_;
    std::unordered_map<std::string, std::vector<Duration>> durations_;
};

/** RAII helper: start on construction, end on destruction. */
class ScopedTimer {
public:
    ScopedTimer(std::shared_ptr<PerformanceTimer> timer, std::string stage_name)
        : timer_(std::move(timer)), stage_name_(std::move(stage_name)) {
        if (timer_) timer_->start(stage_name_);
    }

    ~ScopedTimer() {
        if (timer_) timer_->end(stage_name_);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::shared_ptr<PerformanceTimer> timer_;
    std::string stage_name_;
};

struct LatencyStats {
    int64_t total_duration_ns;
    double average_duration_ns;
    int64_t last_duration_ns;
    size_t measurement_count;

    LatencyStats()
        : total_duration_ns(0), average_duration_ns(0.0),
          last_duration_ns(0), measurement_count(0) {}

    LatencyStats(int64_t total, double average, int64_t last, size_t count)
        : total_duration_ns(total), average_duration_ns(average),
          last_duration_ns(last), measurement_count(count) {}

    static LatencyStats fromTimer(const PerformanceTimer& timer, const std::string& stage_name) {
        return LatencyStats(timer.getTotalDuration(stage_name), timer.getAverageDuration(stage_name),
                            timer.getLastDuration(stage_name), timer.getMeasurementCount(stage_name));
    }
};

// Stage names shared by the collector and the pipeline.
namespace stages {
inline const char* const kAugmentation = "augmentation";
inline const char* const kInference = "inference";
inline const char* const kAggregation = "aggregation";
inline const char* const kParameterDerivation = "parameter_derivation";
inline const char* const kPipelineTotal = "pipeline_total";
} // namespace stages

/** Per-stage latency of one calibration run. */
struct CalibrationLatencyReport {
    LatencyStats augmentation;
    LatencyStats inference;             // one measurement per sample
    LatencyStats aggregation;
    LatencyStats parameter_derivation;
    LatencyStats pipeline_total;

    static CalibrationLatencyReport fromTimer(const PerformanceTimer& timer) {
        CalibrationLatencyReport report;
        report.augmentation = LatencyStats::fromTimer(timer, stages::kAugmentation);
        report.inference = LatencyStats::fromTimer(timer, stages::kInference);
        report.aggregation = LatencyStats::fromTimer(timer, stages::kAggregation);
        report.parameter_derivation = LatencyStats::fromTimer(timer, stages::kParameterDerivation);
        report.pipeline_total = LatencyStats::fromTimer(timer, stages::kPipelineTotal);
        return report;
    }

    static std::string formatDuration(int64_t nanoseconds) {
        if (nanoseconds < 1000) {
            return std::to_string(nanoseconds) + " ns";
        } else if (nanoseconds < 1000000) {
            return std::to_string(nanoseconds / 1000.0) + " us";
        } else if (nanoseconds < 1000000000) {
            return std::to_string(nanoseconds / 1000000.0) + " ms";
        }
        return std::to_string(nanoseconds / 1000000000.0) + " s";
    }

    std::string generateReport() const {
        std::string report;
        report += "=== QCalib Calibration Latency Report ===\n\n";
        report += "  Augmentation: " + formatDuration(augmentation.last_duration_ns) + "\n";
        report += "  Inference: " + formatDuration(inference.total_duration_ns) + " over " +
                  std::to_string(inference.measurement_count) + " sample(s), avg " +
                  formatDuration(static_cast<int64_t>(inference.average_duration_ns)) + "\n";
        report += "  Aggregation: " + formatDuration(aggregation.total_duration_ns) + "\n";
        report += "  Parameter Derivation: " + formatDuration(parameter_derivation.last_duration_ns) + "\n";
        report += "Pipeline Total: " + formatDuration(pipeline_total.last_duration_ns) + "\n";
        return report;
    }
};

#define QCALIB_CONCAT_INNER(a, b) a##b
#define QCALIB_CONCAT(a, b) QCALIB_CONCAT_INNER(a, b)

/** Time the enclosing scope under stage_name. */
#define QCALIB_TIME_SCOPE(timer, stage_name) \
    qcalib::ScopedTimer QCALIB_CONCAT(qcalib_scoped_timer_, __LINE__)(timer, stage_name)

} // namespace qcalib
