#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace state {

// nullopt when the file is missing or not valid JSON (logged)
std::optional<nlohmann::json> read_json_file(const std::string& path);

// Writes <path>.tmp then renames over <path>; false on failure (logged)
bool write_json_file(const std::string& path, const nlohmann::json& j);

} // namespace state
