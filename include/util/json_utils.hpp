#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hotupdate::json_utils {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out);
bool GetUint64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out);

// Absent, null and non-string values all read as nullopt.
std::optional<std::string> GetOptionalString(const nlohmann::json& j, const char* key);

// Non-string array elements are skipped.
std::vector<std::string> GetStringArray(const nlohmann::json& j, const char* key);

} // namespace hotupdate::json_utils
