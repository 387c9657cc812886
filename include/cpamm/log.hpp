#ifndef CPAMM_LOG_HPP
#define CPAMM_LOG_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace cpamm {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

inline constexpr const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

// Throws std::invalid_argument for unknown names
LogLevel parse_log_level(std::string_view name);

// Line-oriented logger writing "[cpamm] [level] message"
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info, std::ostream* out = &std::cerr)
        : level_(level), out_(out) {}

    [[nodiscard]] LogLevel level() const noexcept { return level_; }
    void set_level(LogLevel level) noexcept { level_ = level; }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level_ != LogLevel::Off && level != LogLevel::Off && level >= level_;
    }

    void log(LogLevel level, std::string_view message) const;

    void trace(std::string_view message) const { log(LogLevel::Trace, message); }
    void debug(std::string_view message) const { log(LogLevel::Debug, message); }
    void info(std::string_view message) const { log(LogLevel::Info, message); }
    void warn(std::string_view message) const { log(LogLevel::Warn, message); }
    void error(std::string_view message) const { log(LogLevel::Error, message); }

private:
    LogLevel level_;
    std::ostream* out_;
};

} // namespace cpamm

#endif // CPAMM_LOG_HPP
