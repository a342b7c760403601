#include "delo/ambient/FilterStore.h"

#include "delo/ambient/utils/TextMatch.h"

namespace delo::ambient {

using types::AppFilter;
using types::AudioFilter;

static void fillInvalid(ErrorInfo* err, const std::string& message, const nlohmann::json& details) {
    if (!err) return;
    err->errorType = ErrorType::InvalidConfig;
    err->errorCode = 0;
    err->message = message;
    err->details = details;
}

std::string FilterStore::keyOf(const std::string& name) {
    return utils::toLowerCopy(utils::trimCopy(name));
}

bool FilterStore::addAppFilter(const AppFilter& filter, ErrorInfo* err) {
    const auto key = keyOf(filter.appName);
    if (key.empty()) {
        fillInvalid(err, "App filter requires a non-empty appName", filter.toJson());
        return false;
    }
    if (filter.isWhitelisted && filter.isBlacklisted) {
        fillInvalid(err, "App filter cannot be both whitelisted and blacklisted: " + filter.appName, filter.toJson());
        return false;
    }
    for (const auto& p : filter.windowPatterns) {
        if (utils::trimCopy(p).empty()) {
            fillInvalid(err, "App filter window pattern must not be empty: " + filter.appName, filter.toJson());
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_appFilters[key] = filter;
    return true;
}

bool FilterStore::addAudioFilter(const AudioFilter& filter, ErrorInfo* err) {
    const auto key = keyOf(filter.sourceName);
    if (key.empty()) {
        fillInvalid(err, "Audio filter requires a non-empty sourceName", filter.toJson());
        return false;
    }
    if (filter.isWhitelisted && filter.isBlacklisted) {
        fillInvalid(err, "Audio filter cannot be both whitelisted and blacklisted: " + filter.sourceName,
                    filter.toJson());
        return false;
    }
    if (!(filter.volumeThreshold >= 0.0f && filter.volumeThreshold <= 1.0f)) {
        fillInvalid(err, "Audio filter volumeThreshold must be within [0,1]: " + filter.sourceName, filter.toJson());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_audioFilters[key] = filter;
    return true;
}

bool FilterStore::removeAppFilter(const std::string& appName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_appFilters.erase(keyOf(appName)) > 0;
}

bool FilterStore::removeAudioFilter(const std::string& sourceName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_audioFilters.erase(keyOf(sourceName)) > 0;
}

std::vector<AppFilter> FilterStore::listAppFilters() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AppFilter> out;
    out.reserve(m_appFilters.size());
    for (const auto& kv : m_appFilters) out.push_back(kv.second);
    return out;
}

std::vector<AudioFilter> FilterStore::listAudioFilters() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AudioFilter> out;
    out.reserve(m_audioFilters.size());
    for (const auto& kv : m_audioFilters) out.push_back(kv.second);
    return out;
}

bool FilterStore::shouldMonitorApp(const std::string& appName, const std::string& windowTitle) const {
    const auto key = keyOf(appName);
    std::lock_guard<std::mutex> lock(m_mutex);

    bool whitelistActive = false;
    for (const auto& kv : m_appFilters) {
        if (kv.second.isWhitelisted) {
            whitelistActive = true;
            break;
        }
    }

    auto it = m_appFilters.find(key);
    if (it == m_appFilters.end()) {
        return !whitelistActive;
    }
    const auto& f = it->second;
    if (f.isBlacklisted) return false;
    if (!f.isWhitelisted) return !whitelistActive;

    if (f.windowPatterns.empty()) return true;
    for (const auto& p : f.windowPatterns) {
        if (utils::containsIgnoreCase(windowTitle, p)) return true;
    }
    return false;
}

bool FilterStore::shouldCaptureAudio(const std::string& sourceName) const {
    const auto key = keyOf(sourceName);
    std::lock_guard<std::mutex> lock(m_mutex);

    bool whitelistActive = false;
    for (const auto& kv : m_audioFilters) {
        if (kv.second.isWhitelisted) {
            whitelistActive = true;
            break;
        }
    }
    auto it = m_audioFilters.find(key);
    if (it == m_audioFilters.end()) return !whitelistActive;
    if (it->second.isBlacklisted) return false;
    return it->second.isWhitelisted || !whitelistActive;
}

float FilterStore::volumeThresholdFor(const std::string& sourceName, float defaultThreshold) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_audioFilters.find(keyOf(sourceName));
    if (it == m_audioFilters.end()) return defaultThreshold;
    return it->second.volumeThreshold;
}

bool FilterStore::matchesAudioKeywords(const std::string& sourceName, const std::string& transcript) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_audioFilters.find(keyOf(sourceName));
    if (it == m_audioFilters.end() || it->second.keywords.empty()) return true;
    for (const auto& kw : it->second.keywords) {
        if (utils::containsIgnoreCase(transcript, kw)) return true;
    }
    return false;
}

nlohmann::json FilterStore::toJson() const {
    nlohmann::json apps = nlohmann::json::array();
    nlohmann::json audio = nlohmann::json::array();
    for (const auto& f : listAppFilters()) apps.push_back(f.toJson());
    for (const auto& f : listAudioFilters()) audio.push_back(f.toJson());
    return nlohmann::json{{"app_filters", apps}, {"audio_filters", audio}};
}

bool FilterStore::loadFromJson(const nlohmann::json& j, ErrorInfo* err) {
    if (!j.is_object()) {
        fillInvalid(err, "Filter document must be a JSON object", nlohmann::json::object());
        return false;
    }

    nlohmann::json rejected = nlohmann::json::array();
    auto importList = [&](const char* key, auto parse, auto add) {
        if (!j.contains(key) || !j.at(key).is_array()) return;
        for (const auto& item : j.at(key)) {
            auto f = parse(item);
            ErrorInfo one;
            if (!f.has_value() || !add(*f, &one)) {
                rejected.push_back(nlohmann::json{{"rule", item}, {"reason", f.has_value() ? one.message : "malformed"}});
            }
        }
    };
    importList("app_filters", [](const nlohmann::json& x) { return AppFilter::fromJson(x); },
               [this](const AppFilter& f, ErrorInfo* e) { return addAppFilter(f, e); });
    importList("audio_filters", [](const nlohmann::json& x) { return AudioFilter::fromJson(x); },
               [this](const AudioFilter& f, ErrorInfo* e) { return addAudioFilter(f, e); });

    if (!rejected.empty()) {
        fillInvalid(err, "Some filter rules were rejected", nlohmann::json{{"rejected", rejected}});
        return false;
    }
    return true;
}

} // namespace delo::ambient
