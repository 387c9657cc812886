// cpamm - Configuration Implementation

#include "cpamm/config.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpamm {

using json = nlohmann::json;

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    try {
        json doc = json::parse(content.begin(), content.end());
        if (!doc.is_object()) {
            throw std::runtime_error("Config must be a JSON object");
        }

        if (doc.contains("fee_bps")) {
            auto fee = doc.at("fee_bps").get<int64_t>();
            if (fee < 0 || fee > BPS_DENOMINATOR) {
                throw std::runtime_error("fee_bps out of range: " + std::to_string(fee));
            }
            config.fee_bps = static_cast<uint32_t>(fee);
        }
        if (doc.contains("log_level")) {
            config.log_level = doc.at("log_level").get<std::string>();
        }
        if (doc.contains("custody")) {
            auto text = doc.at("custody").get<std::string>();
            auto addr = addresses::from_hex(text);
            if (!addr) {
                throw std::runtime_error("Invalid custody address: " + text);
            }
            config.custody = *addr;
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }

    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }
    return config;
}

void Config::validate() const {
    if (fee_bps > BPS_DENOMINATOR) {
        throw std::invalid_argument("fee_bps must be within 0..10000");
    }
    parse_log_level(log_level);
    if (addresses::is_zero(custody)) {
        throw std::invalid_argument("custody address must be non-zero");
    }
}

std::string Config::to_json() const {
    json doc = {
        {"fee_bps", fee_bps},
        {"log_level", log_level},
        {"custody", addresses::to_hex(custody)}
    };
    return doc.dump();
}

} // namespace cpamm
