#include "shmkv/config.hpp"
#include <fstream>
#include <stdexcept>

#include "shmkv/layout.hpp"

using json = nlohmann::ordered_json;

namespace shmkv {

Config::Config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + filename);
    }
    file >> config_json;
    if (!config_json.is_object()) {
        throw std::runtime_error("Config root is not an object in " + filename);
    }
}

Config Config::Defaults() {
    return Config();
}

Config Config::FromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root is not an object");
    }
    Config config;
    config.config_json = j;
    return config;
}

std::string Config::read_segment_name() const {
    return config_json.value("segment_name", std::string(DEFAULT_SEGMENT_NAME));
}

bool Config::read_verbose() const {
    return config_json.value("verbose", false);
}

int Config::read_poll_interval_ms() const {
    int interval = config_json.value("poll_interval_ms", 1000);
    if (interval <= 0) {
        throw std::runtime_error("poll_interval_ms must be positive");
    }
    return interval;
}

std::vector<std::pair<std::string, std::string>> Config::read_seed() const {
    std::vector<std::pair<std::string, std::string>> seed;
    if (!config_json.contains("seed")) {
        return seed;
    }
    const auto& pairs = config_json.at("seed");
    if (!pairs.is_object()) {
        throw std::runtime_error("seed must be an object of string values");
    }
    for (const auto& item : pairs.items()) {
        seed.emplace_back(item.key(), item.value().get<std::string>());
    }
    return seed;
}

std::vector<std::string> Config::read_watch_keys() const {
    if (!config_json.contains("watch_keys")) {
        return {};
    }
    return config_json.at("watch_keys").get<std::vector<std::string>>();
}

} // namespace shmkv
