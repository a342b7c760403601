#pragma once

#include "delo/ambient/types/CommonTypes.h"
#include "delo/ambient/types/PerceptionTypes.h"

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient::types {

/**
 * @brief 用户定义的上下文模式
 *
 * - appName 为空或 "*" 表示任意应用
 * - windowPattern 普通文本按子串匹配；"/expr/" 形式按正则匹配
 * - audioKeywords / screenKeywords 任一命中即满足关键字条件
 */
struct ContextPattern {
    std::string patternName;
    std::string appName;
    std::string windowPattern;
    std::vector<std::string> audioKeywords;
    std::vector<std::string> screenKeywords;
    std::vector<std::string> triggerActions;
    bool isActive{true};

    bool operator==(const ContextPattern& o) const {
        return patternName == o.patternName && appName == o.appName && windowPattern == o.windowPattern &&
               audioKeywords == o.audioKeywords && screenKeywords == o.screenKeywords &&
               triggerActions == o.triggerActions && isActive == o.isActive;
    }
    bool operator!=(const ContextPattern& o) const { return !(*this == o); }

    static std::optional<ContextPattern> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        ContextPattern p;
        p.patternName = jsonValueOr<std::string>(j, "pattern_name", "");
        if (p.patternName.empty()) return std::nullopt;
        p.appName = jsonValueOr<std::string>(j, "app_name", "");
        p.windowPattern = jsonValueOr<std::string>(j, "window_pattern", "");
        p.audioKeywords = jsonStringList(j, "audio_keywords");
        p.screenKeywords = jsonStringList(j, "screen_keywords");
        p.triggerActions = jsonStringList(j, "trigger_actions");
        p.isActive = jsonValueOr<bool>(j, "is_active", true);
        return p;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"pattern_name", patternName},
            {"app_name", appName},
            {"window_pattern", windowPattern},
            {"audio_keywords", audioKeywords},
            {"screen_keywords", screenKeywords},
            {"trigger_actions", triggerActions},
            {"is_active", isActive},
        };
    }
};

/**
 * @brief 融合后的上下文快照（只由 ContextEngine 派生）
 */
struct ContextSnapshot {
    std::string appName;
    std::optional<ScreenSnapshot> screenSnapshot;
    std::optional<AudioSession> audioSession;
    std::optional<std::string> userIntent;
    Timestamp timestamp{};

    static std::optional<ContextSnapshot> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        ContextSnapshot s;
        s.appName = jsonValueOr<std::string>(j, "app_name", "");
        if (j.contains("screen_snapshot")) s.screenSnapshot = ScreenSnapshot::fromJson(j.at("screen_snapshot"));
        if (j.contains("audio_session")) s.audioSession = AudioSession::fromJson(j.at("audio_session"));
        if (j.contains("user_intent") && j.at("user_intent").is_string()) {
            s.userIntent = j.at("user_intent").get<std::string>();
        }
        s.timestamp = fromUnixMillis(jsonValueOr<uint64_t>(j, "timestamp_ms", 0));
        return s;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["app_name"] = appName;
        if (screenSnapshot.has_value()) j["screen_snapshot"] = screenSnapshot->toJson();
        if (audioSession.has_value()) j["audio_session"] = audioSession->toJson();
        if (userIntent.has_value()) j["user_intent"] = *userIntent;
        j["timestamp_ms"] = toUnixMillis(timestamp);
        return j;
    }
};

/**
 * @brief 模式命中后产生的触发事件
 */
struct Trigger {
    std::string patternName;
    std::vector<std::string> triggerActions;
    ContextSnapshot snapshot;
    Timestamp firedAt{};
};

} // namespace delo::ambient::types
