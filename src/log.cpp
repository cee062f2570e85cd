#include "QCalib/log.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace qcalib {

LogLevel Logger::level_ = LogLevel::kInfo;

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){return std::tolower(c);});
    if (lower == "info") return LogLevel::kInfo;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    if (lower == "off" || lower == "none") return LogLevel::kOff;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace qcalib
