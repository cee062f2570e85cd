#pragma once

#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace qcalib {

enum class LogLevel {
    kInfo = 0,
    kWarn = 1,
    kError = 2,
    kOff = 3,
};

/** Process-wide log threshold shared by the QCALIB_* macros. */
class Logger {
public:
    static LogLevel& level() { return level_; }

private:
    static LogLevel level_;
};

/** Parse "info", "warn", "error" or "off". Throws std::invalid_argument otherwise. */
LogLevel parse_log_level(const std::string& name);

#define QCALIB_INFO(...)                                                        \
    if (qcalib::Logger::level() <= qcalib::LogLevel::kInfo) {                   \
        fmt::print(fg(fmt::color::green) | fmt::emphasis::bold, "[INFO]");      \
        fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__)); \
    }

#define QCALIB_WARN(...)                                                         \
    if (qcalib::Logger::level() <= qcalib::LogLevel::kWarn) {                    \
        fmt::print(fg(fmt::color::green_yellow) | fmt::emphasis::bold, "[WARN]"); \
        fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__));  \
    }

#define QCALIB_ERROR(...)                                                       \
    if (qcalib::Logger::level() <= qcalib::LogLevel::kError) {                  \
        fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "[ERROR]");       \
        fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__)); \
    }

} // namespace qcalib
