// kswap - Configuration loading

#include "kswap/config.hpp"
#include "kswap/codec.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace kswap {

ExchangeConfig ExchangeConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

ExchangeConfig ExchangeConfig::from_json_string(std::string_view content) {
    ExchangeConfig config;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Invalid config: top level must be an object");
    }

    try {
        if (j.contains("state_path")) config.state_path = j["state_path"].get<std::string>();
        if (j.contains("log_level")) config.log_level = j["log_level"].get<std::string>();
        if (j.contains("emit_events")) config.emit_events = j["emit_events"].get<bool>();
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }
    if (j.contains("share_decimals")) {
        try {
            config.share_decimals = decimals_from_json(j["share_decimals"]);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(std::string("Invalid config value share_decimals: ") + e.what());
        }
    }

    if (config.log_level != "error" && config.log_level != "info" && config.log_level != "debug") {
        throw std::runtime_error("Invalid config: unknown log_level " + config.log_level);
    }
    return config;
}

} // namespace kswap
