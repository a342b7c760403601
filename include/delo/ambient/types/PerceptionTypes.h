#pragma once

#include "delo/ambient/types/CommonTypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient::types {

/**
 * @brief 应用过滤规则（屏幕感知）
 *
 * 黑名单优先：同一规则同时标记白/黑名单在注册时被拒绝。
 */
struct AppFilter {
    std::string appName;
    bool isWhitelisted{false};
    bool isBlacklisted{false};
    std::vector<std::string> windowPatterns;

    static std::optional<AppFilter> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        AppFilter f;
        f.appName = jsonValueOr<std::string>(j, "app_name", "");
        if (f.appName.empty()) return std::nullopt;
        f.isWhitelisted = jsonValueOr<bool>(j, "is_whitelisted", false);
        f.isBlacklisted = jsonValueOr<bool>(j, "is_blacklisted", false);
        f.windowPatterns = jsonStringList(j, "window_patterns");
        return f;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"app_name", appName},
            {"is_whitelisted", isWhitelisted},
            {"is_blacklisted", isBlacklisted},
            {"window_patterns", windowPatterns},
        };
    }
};

/**
 * @brief 音频源过滤规则
 */
struct AudioFilter {
    std::string sourceName;
    bool isWhitelisted{false};
    bool isBlacklisted{false};
    float volumeThreshold{0.1f}; // [0,1]
    std::vector<std::string> keywords;

    static std::optional<AudioFilter> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        AudioFilter f;
        f.sourceName = jsonValueOr<std::string>(j, "source_name", "");
        if (f.sourceName.empty()) return std::nullopt;
        f.isWhitelisted = jsonValueOr<bool>(j, "is_whitelisted", false);
        f.isBlacklisted = jsonValueOr<bool>(j, "is_blacklisted", false);
        f.volumeThreshold = jsonValueOr<float>(j, "volume_threshold", 0.1f);
        f.keywords = jsonStringList(j, "keywords");
        return f;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"source_name", sourceName},
            {"is_whitelisted", isWhitelisted},
            {"is_blacklisted", isBlacklisted},
            {"volume_threshold", volumeThreshold},
            {"keywords", keywords},
        };
    }
};

/**
 * @brief 前台窗口描述（交给 TextExtractor 的 frame）
 */
struct ScreenFrame {
    std::string appName;
    std::string windowTitle;
    uint64_t windowId{0};
    int64_t processId{0};
    Timestamp capturedAt{};
};

/**
 * @brief 屏幕快照：创建后不可变，同一应用的下一次快照取代它
 */
struct ScreenSnapshot {
    std::string appName;
    std::string windowTitle;
    std::string extractedText;
    uint32_t contentHash{0};
    Timestamp capturedAt{};

    static std::optional<ScreenSnapshot> fromJson(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("app_name")) return std::nullopt;
        ScreenSnapshot s;
        s.appName = jsonValueOr<std::string>(j, "app_name", "");
        s.windowTitle = jsonValueOr<std::string>(j, "window_title", "");
        s.extractedText = jsonValueOr<std::string>(j, "extracted_text", "");
        s.contentHash = jsonValueOr<uint32_t>(j, "content_hash", 0);
        s.capturedAt = fromUnixMillis(jsonValueOr<uint64_t>(j, "captured_at_ms", 0));
        return s;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"app_name", appName},
            {"window_title", windowTitle},
            {"extracted_text", extractedText},
            {"content_hash", contentHash},
            {"captured_at_ms", toUnixMillis(capturedAt)},
        };
    }
};

/**
 * @brief 一段音频数据（单声道 float，范围 [-1,1]）
 */
struct AudioChunk {
    std::string sourceName;
    std::vector<float> samples;
    uint32_t sampleRate{16000};
    Timestamp capturedAt{};

    uint64_t durationMs() const {
        if (sampleRate == 0) return 0;
        return static_cast<uint64_t>(samples.size()) * 1000ULL / sampleRate;
    }
};

/**
 * @brief 一次语音会话：说话开始时创建，持续追加转写，静音超时后封存
 */
struct AudioSession {
    std::string transcript;
    std::string sourceName;
    Timestamp startTime{};
    Timestamp endTime{};
    bool isFinal{false};

    uint64_t durationMs() const {
        using namespace std::chrono;
        if (endTime <= startTime) return 0;
        return static_cast<uint64_t>(duration_cast<milliseconds>(endTime - startTime).count());
    }

    static std::optional<AudioSession> fromJson(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("source_name")) return std::nullopt;
        AudioSession s;
        s.transcript = jsonValueOr<std::string>(j, "transcript", "");
        s.sourceName = jsonValueOr<std::string>(j, "source_name", "");
        s.startTime = fromUnixMillis(jsonValueOr<uint64_t>(j, "start_time_ms", 0));
        s.endTime = fromUnixMillis(jsonValueOr<uint64_t>(j, "end_time_ms", 0));
        s.isFinal = jsonValueOr<bool>(j, "is_final", false);
        return s;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"transcript", transcript},
            {"source_name", sourceName},
            {"start_time_ms", toUnixMillis(startTime)},
            {"end_time_ms", toUnixMillis(endTime)},
            {"duration_ms", durationMs()},
            {"is_final", isFinal},
        };
    }
};

} // namespace delo::ambient::types
