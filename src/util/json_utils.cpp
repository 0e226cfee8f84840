#include "util/json_utils.hpp"

#include <fstream>

namespace hotupdate::json_utils {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

bool GetUint64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_number_unsigned())
        return false;
    out = it->get<std::uint64_t>();
    return true;
}

std::optional<std::string> GetOptionalString(const nlohmann::json& j, const char* key) {
    std::string s;
    if (!GetStringIfPresent(j, key, s) || s.empty())
        return std::nullopt;
    return s;
}

std::vector<std::string> GetStringArray(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array())
        return out;
    out.reserve(it->size());
    for (const auto& item : *it) {
        if (item.is_string())
            out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace hotupdate::json_utils
