// aniflow - Data Models
// Resource descriptors shared by the download engine and its callers

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace aniflow {

using json = nlohmann::json;

//=============================================================================
// Resource Models
//=============================================================================

enum class VideoQuality {
    Q2160p,
    Q1080p,
    Q720p,
    Q480p,
    Unknown
};

enum class LanguageType {
    SimplifiedChinese,
    TraditionalChinese,
    Japanese,
    English,
    Unknown
};

// Textual labels ("1080p", "简", ...). Unknown labels parse to Unknown.
std::string qualityToString(VideoQuality quality);
VideoQuality qualityFromString(const std::string& label);
std::string languageToString(LanguageType language);
LanguageType languageFromString(const std::string& label);

/**
 * @brief One downloadable resource as produced by the feed parser
 *
 * title and downloadUrl are always present. The remaining fields are
 * metadata enriched upstream and may be absent.
 */
struct ResourceInfo {
    std::string title;
    std::string downloadUrl;
    std::optional<std::string> animeName;
    std::optional<int> season;
    std::optional<int> episode;
    std::optional<std::string> fansub;
    VideoQuality quality{VideoQuality::Unknown};
    std::vector<LanguageType> languages;
    int version{1};

    json toJson() const;
    static ResourceInfo fromJson(const json& j);
};

} // namespace aniflow
