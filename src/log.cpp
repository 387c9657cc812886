// =============================================================================
// log.cpp - Level parsing and line logger
// =============================================================================

#include "cpamm/log.hpp"

#include <stdexcept>

namespace cpamm {

LogLevel parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off" || name == "none") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

void Logger::log(LogLevel level, std::string_view message) const {
    if (!out_ || !enabled(level)) return;
    *out_ << "[cpamm] [" << to_string(level) << "] " << message << '\n';
}

} // namespace cpamm
