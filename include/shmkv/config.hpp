#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace shmkv {

class Config {
public:
    // Throws std::runtime_error if the file cannot be opened and
    // nlohmann::json::exception if it is not valid JSON.
    explicit Config(const std::string& filename);

    // Configuration with every key at its default.
    static Config Defaults();

    static Config FromJson(const nlohmann::ordered_json& json);

    std::string read_segment_name() const;
    bool read_verbose() const;
    int read_poll_interval_ms() const;
    // Seed pairs in the order they appear in the file.
    std::vector<std::pair<std::string, std::string>> read_seed() const;
    std::vector<std::string> read_watch_keys() const;
private:
    Config() = default;

    // Ordered so the producer fills slots in file order.
    nlohmann::ordered_json config_json = nlohmann::ordered_json::object();
};

} // namespace shmkv
