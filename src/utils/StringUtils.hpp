// aniflow - String Utilities
// String manipulation, naming and timestamp helpers

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace aniflow::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);
    static std::string trimRight(const std::string& str, char ch);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting and joining
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Paths on the remote storage always use '/' regardless of platform
    static std::string joinRemotePath(const std::string& base, const std::string& name);
    static std::string remoteParent(const std::string& path);
    static std::string remoteBaseName(const std::string& path);
    static std::string fileExtension(const std::string& name);

    // Formatting
    static std::string formatTimestamp(std::chrono::system_clock::time_point time,
                                       const std::string& format = "%Y-%m-%dT%H:%M:%S");
    static std::string nowIso();

    // UUID
    static std::string generateUUID();
    static bool isValidUUID(const std::string& str);

    /**
     * Replace characters that are invalid in file names on common
     * file systems (< > : " / \ | ? *) with spaces, then trim.
     */
    static std::string sanitizeFileName(const std::string& name);
};

} // namespace aniflow::utils
