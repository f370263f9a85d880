/**
 * JsonUtils.cpp
 *
 * JSON parsing and persistence helpers.
 */

#include "JsonUtils.hpp"
#include <fstream>
#include <system_error>

namespace aniflow::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str) {
    try { return json::parse(str); }
    catch (const json::exception&) { return std::nullopt; }
}

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        return json::parse(file);
    } catch (const json::exception&) { return std::nullopt; }
}

// -- Serialization --

bool JsonUtils::writeFile(const std::filesystem::path& path, const json& j, int indent) {
    try {
        if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        if (!file.is_open()) return false;
        file << j.dump(indent);
        return file.good();
    } catch (const std::exception&) { return false; }
}

bool JsonUtils::writeFileAtomic(const std::filesystem::path& path, const json& j, int indent) {
    auto tmpPath = path;
    tmpPath += ".tmp";

    if (!writeFile(tmpPath, j, indent)) return false;

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
    return true;
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

int JsonUtils::getInt(const json& j, const std::string& key, int defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<int>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return defaultValue;
}

bool JsonUtils::getBool(const json& j, const std::string& key, bool defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return defaultValue;
}

json JsonUtils::getObject(const json& j, const std::string& key, const json& defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_object()) return j[key];
    return defaultValue;
}

json JsonUtils::getArray(const json& j, const std::string& key, const json& defaultValue) {
    if (j.is_object() && j.contains(key) && j[key].is_array()) return j[key];
    return defaultValue;
}

std::optional<std::string> JsonUtils::getOptionalString(const json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<int> JsonUtils::getOptionalInt(const json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<int>();
    return std::nullopt;
}

std::optional<int64_t> JsonUtils::getOptionalLong(const json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return std::nullopt;
}

} // namespace aniflow::utils
