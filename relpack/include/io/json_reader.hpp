#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace relpack::io {

nlohmann::json loadJsonFile(const std::filesystem::path &path);
std::vector<std::string> splitFlags(const std::string &text);

// Accepts either a JSON array of strings or one whitespace-separated string.
std::vector<std::string> readArgList(const nlohmann::json &node);

} // namespace relpack::io
