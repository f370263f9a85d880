// aniflow - JSON Utilities
// JSON parsing, safe accessors and file persistence helpers

#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace aniflow::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 *
 * Accessors never throw: a missing key, a null or a value of the wrong
 * type yields the default (or std::nullopt for the optional variants).
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parse(const std::string& str);
    static std::optional<json> parseFile(const std::filesystem::path& path);

    // Serialization
    static bool writeFile(const std::filesystem::path& path, const json& j, int indent = 2);

    /**
     * Replace the file content in one step: write a sibling temporary
     * file, then rename it over the target. Readers never observe a
     * half-written document.
     */
    static bool writeFileAtomic(const std::filesystem::path& path, const json& j, int indent = 2);

    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int getInt(const json& j, const std::string& key, int defaultValue = 0);
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
    static bool getBool(const json& j, const std::string& key, bool defaultValue = false);
    static json getObject(const json& j, const std::string& key, const json& defaultValue = json::object());
    static json getArray(const json& j, const std::string& key, const json& defaultValue = json::array());

    static std::optional<std::string> getOptionalString(const json& j, const std::string& key);
    static std::optional<int> getOptionalInt(const json& j, const std::string& key);
    static std::optional<int64_t> getOptionalLong(const json& j, const std::string& key);
};

} // namespace aniflow::utils
