#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>
#include <vector>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace aniflow::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Manages engine settings with:
 * - Type-safe getters with defaults
 * - JSON persistence
 * - Validation of the settings the engine cannot run without
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file
     *
     * Values present in the file override the defaults; keys the file
     * does not mention keep their default value.
     *
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                return false;
            }

            m_config = defaults();
            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            m_configPath = savePath;
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset every setting to its default value
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "openlist.url")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Wrong type in the file: fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxConcurrent")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Get entire configuration as JSON
     * @return JSON configuration object
     */
    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    /**
     * Merge configuration values
     * @param other JSON object to merge
     */
    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

    /**
     * Check the settings the engine needs before it can talk to OpenList
     * @return Human-readable problems, empty when the configuration is usable
     */
    std::vector<std::string> validate() const {
        std::vector<std::string> errors;

        if (get<std::string>("openlist.url").empty()) {
            errors.push_back("OpenList URL is not configured (openlist.url)");
        }
        if (get<std::string>("openlist.token").empty()) {
            errors.push_back("OpenList token is not configured (openlist.token); "
                             "authenticated calls will fail");
        }

        static const std::vector<std::string> tools{"aria2", "qBittorrent", "PikPak"};
        auto tool = get<std::string>("openlist.offlineDownloadTool");
        if (std::find(tools.begin(), tools.end(), tool) == tools.end()) {
            errors.push_back("Unknown offline download tool '" + tool +
                             "' (openlist.offlineDownloadTool)");
        }

        if (get<std::string>("openlist.renameFormat").empty()) {
            errors.push_back("Rename format is empty (openlist.renameFormat)");
        }
        auto limits = validateLimits();
        errors.insert(errors.end(), limits.begin(), limits.end());

        return errors;
    }

    /**
     * Check the numeric limits. Startup refuses to continue on any of these.
     */
    std::vector<std::string> validateLimits() const {
        std::vector<std::string> errors;

        if (get<int>("downloads.maxConcurrent", 0) <= 0) {
            errors.push_back("downloads.maxConcurrent must be positive");
        }
        if (get<int>("openlist.maxConcurrentRequests", 0) <= 0) {
            errors.push_back("openlist.maxConcurrentRequests must be positive");
        }
        if (get<int>("downloads.maxRetries", 0) < 0) {
            errors.push_back("downloads.maxRetries must not be negative");
        }
        for (const char* key : {"downloads.pollInterval", "downloads.transferCheckDelay",
                                "downloads.renameSettleDelay"}) {
            if (get<int>(key, 0) < 0) {
                errors.push_back(std::string(key) + " must not be negative");
            }
        }

        return errors;
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json defaults() {
        return {
            {"openlist", {
                {"url", "http://localhost:5244"},
                {"token", ""},
                {"downloadPath", "/"},
                {"offlineDownloadTool", "qBittorrent"},
                {"renameFormat", "{anime_name} S{season:02d}E{episode:02d}"},
                {"maxConcurrentRequests", 4},
                {"requestTimeout", 30},
                {"connectTimeout", 30},
                {"readTimeout", 30},
                {"maxRetries", 3},
                {"retryBackoffMs", 800}
            }},
            {"downloads", {
                {"stateFile", "data/pending_downloads.json"},
                {"maxConcurrent", 3},
                {"maxRetries", 3},
                {"pollInterval", 5},
                {"transferCheckDelay", 5},
                {"renameSettleDelay", 5},
                {"maxDetectAttempts", 10}
            }},
            {"log", {
                {"level", "info"},
                {"fileLevel", "debug"},
                {"directory", "logs"},
                {"maxFileSize", 1024 * 1024 * 10},
                {"maxFiles", 5}
            }},
            {"proxy", {
                {"http", ""},
                {"https", ""}
            }}
        };
    }

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace aniflow::core
