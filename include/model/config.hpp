#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sessionizer::model {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    // Null entries survive parsing; the normalizer drops them.
    std::vector<std::optional<std::string>> searchPaths;
    std::optional<bool> nested;
};

Config parseConfig(const nlohmann::json &document);
Config loadConfig(const std::filesystem::path &configFile);

} // namespace sessionizer::model
