/**
 * Models.cpp
 */

#include "Models.hpp"
#include "../../utils/JsonUtils.hpp"

namespace aniflow {

using utils::JsonUtils;

// -- Labels --

std::string qualityToString(VideoQuality quality) {
    switch (quality) {
        case VideoQuality::Q2160p: return "2160p";
        case VideoQuality::Q1080p: return "1080p";
        case VideoQuality::Q720p:  return "720p";
        case VideoQuality::Q480p:  return "480p";
        case VideoQuality::Unknown: break;
    }
    return "unknown";
}

VideoQuality qualityFromString(const std::string& label) {
    if (label == "2160p") return VideoQuality::Q2160p;
    if (label == "1080p") return VideoQuality::Q1080p;
    if (label == "720p") return VideoQuality::Q720p;
    if (label == "480p") return VideoQuality::Q480p;
    return VideoQuality::Unknown;
}

std::string languageToString(LanguageType language) {
    switch (language) {
        case LanguageType::SimplifiedChinese:  return "简";
        case LanguageType::TraditionalChinese: return "繁";
        case LanguageType::Japanese:           return "日";
        case LanguageType::English:            return "英";
        case LanguageType::Unknown: break;
    }
    return "未知";
}

LanguageType languageFromString(const std::string& label) {
    if (label == "简") return LanguageType::SimplifiedChinese;
    if (label == "繁") return LanguageType::TraditionalChinese;
    if (label == "日") return LanguageType::Japanese;
    if (label == "英") return LanguageType::English;
    return LanguageType::Unknown;
}

// -- ResourceInfo --

json ResourceInfo::toJson() const {
    json languageLabels = json::array();
    for (auto language : languages) languageLabels.push_back(languageToString(language));

    return {
        {"title", title},
        {"download_url", downloadUrl},
        {"anime_name", animeName ? json(*animeName) : json(nullptr)},
        {"season", season ? json(*season) : json(nullptr)},
        {"episode", episode ? json(*episode) : json(nullptr)},
        {"fansub", fansub ? json(*fansub) : json(nullptr)},
        {"quality", qualityToString(quality)},
        {"languages", languageLabels},
        {"version", version}
    };
}

ResourceInfo ResourceInfo::fromJson(const json& j) {
    ResourceInfo info;
    info.title = JsonUtils::getString(j, "title");
    info.downloadUrl = JsonUtils::getString(j, "download_url");
    info.animeName = JsonUtils::getOptionalString(j, "anime_name");
    info.season = JsonUtils::getOptionalInt(j, "season");
    info.episode = JsonUtils::getOptionalInt(j, "episode");
    info.fansub = JsonUtils::getOptionalString(j, "fansub");
    info.quality = qualityFromString(JsonUtils::getString(j, "quality", "unknown"));

    for (const auto& label : JsonUtils::getArray(j, "languages")) {
        if (label.is_string()) info.languages.push_back(languageFromString(label.get<std::string>()));
    }

    info.version = JsonUtils::getInt(j, "version", 1);
    return info;
}

} // namespace aniflow
