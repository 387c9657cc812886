// cpamm - Configuration
// Builder pattern for fluent configuration

#ifndef CPAMM_CONFIG_HPP
#define CPAMM_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "log.hpp"
#include "types.hpp"

namespace cpamm {

class Config {
public:
    uint32_t fee_bps = 30;                       // 0.30%
    std::string log_level = "info";
    Address custody = addresses::AMM_CUSTODY;    // holds pooled assets

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string
    static Config from_json(std::string_view content);

    // Throws std::invalid_argument if a field is out of range
    void validate() const;

    [[nodiscard]] LogLevel level() const { return parse_log_level(log_level); }

    [[nodiscard]] std::string to_json() const;

    // Builder methods
    Config& with_fee_bps(uint32_t bps) {
        fee_bps = bps;
        return *this;
    }

    Config& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    Config& with_custody(const Address& addr) {
        custody = addr;
        return *this;
    }
};

} // namespace cpamm

#endif // CPAMM_CONFIG_HPP
