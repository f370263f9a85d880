/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace aniflow::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string StringUtils::trimRight(const std::string& str, char ch) {
    auto end = str.find_last_not_of(ch);
    return end == std::string::npos ? "" : str.substr(0, end + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Join --

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) result += separator + parts[i];
    return result;
}

// -- Search --

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Remote paths --

std::string StringUtils::joinRemotePath(const std::string& base, const std::string& name) {
    std::string left = trimRight(base, '/');
    if (name.empty()) return left.empty() ? "/" : left;
    return left + "/" + name;
}

std::string StringUtils::remoteParent(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos) return "";
    return path.substr(0, pos);
}

std::string StringUtils::remoteBaseName(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string StringUtils::fileExtension(const std::string& name) {
    std::string base = remoteBaseName(name);
    auto pos = base.rfind('.');
    // A leading dot is a hidden file, not an extension
    if (pos == std::string::npos || pos == 0) return "";
    return base.substr(pos);
}

// -- Formatting --

std::string StringUtils::formatTimestamp(std::chrono::system_clock::time_point time, const std::string& format) {
    auto tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

std::string StringUtils::nowIso() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::ostringstream oss;
    oss << formatTimestamp(now) << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

// -- UUID --

std::string StringUtils::generateUUID() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[dis(gen)];
    }
    uuid[14] = '4'; // version 4
    uuid[19] = hex[(dis(gen) & 0x3) | 0x8]; // variant
    return uuid;
}

bool StringUtils::isValidUUID(const std::string& str) {
    if (str.size() != 36) return false;
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') return false;
        } else {
            if (!std::isxdigit(static_cast<unsigned char>(str[i]))) return false;
        }
    }
    return true;
}

std::string StringUtils::sanitizeFileName(const std::string& name) {
    static const std::string invalid = "<>:\"/\\|?*";
    std::string result = name;
    for (char& c : result) {
        if (invalid.find(c) != std::string::npos) c = ' ';
    }
    return trim(result);
}

} // namespace aniflow::utils
