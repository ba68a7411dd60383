#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

namespace sessionizer::io {

nlohmann::json loadJsonFile(const std::filesystem::path &path);

} // namespace sessionizer::io
