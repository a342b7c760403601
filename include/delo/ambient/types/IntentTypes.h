#pragma once

#include "delo/ambient/types/CommonTypes.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient::types {

// 命令类别（路由表的键）
enum class IntentCategory {
    Open,
    Search,
    YouTube,
    Email,
    Summarize,
    Translate,
    Task,
    Screenshot,
    Clipboard,
    System,
    Help,
    Unknown
};

inline std::string intentCategoryToString(IntentCategory v) {
    switch (v) {
        case IntentCategory::Open: return "open";
        case IntentCategory::Search: return "search";
        case IntentCategory::YouTube: return "youtube";
        case IntentCategory::Email: return "email";
        case IntentCategory::Summarize: return "summarize";
        case IntentCategory::Translate: return "translate";
        case IntentCategory::Task: return "task";
        case IntentCategory::Screenshot: return "screenshot";
        case IntentCategory::Clipboard: return "clipboard";
        case IntentCategory::System: return "system";
        case IntentCategory::Help: return "help";
        case IntentCategory::Unknown: return "unknown";
    }
    return "unknown";
}

inline std::optional<IntentCategory> stringToIntentCategory(std::string_view s) {
    static const IntentCategory all[] = {
        IntentCategory::Open,      IntentCategory::Search,     IntentCategory::YouTube,
        IntentCategory::Email,     IntentCategory::Summarize,  IntentCategory::Translate,
        IntentCategory::Task,      IntentCategory::Screenshot, IntentCategory::Clipboard,
        IntentCategory::System,    IntentCategory::Help,       IntentCategory::Unknown,
    };
    for (auto c : all) {
        if (intentCategoryToString(c) == s) return c;
    }
    return std::nullopt;
}

// 路由策略来源
enum class MatchStrategy {
    Exact,
    Fuzzy,
    Clarifier,
    None
};

inline std::string matchStrategyToString(MatchStrategy v) {
    switch (v) {
        case MatchStrategy::Exact: return "exact";
        case MatchStrategy::Fuzzy: return "fuzzy";
        case MatchStrategy::Clarifier: return "clarifier";
        case MatchStrategy::None: return "none";
    }
    return "none";
}

/**
 * @brief 命令解析结果
 */
struct Intent {
    std::string functionName;           // 与类别同名，例如 "search"
    IntentCategory category{IntentCategory::Unknown};
    float confidence{0.0f};             // [0,1]
    std::string rawCommand;
    nlohmann::json extractedArgs = nlohmann::json::object();
    MatchStrategy strategy{MatchStrategy::None};

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"function_name", functionName},
            {"category", intentCategoryToString(category)},
            {"confidence", confidence},
            {"raw_command", rawCommand},
            {"extracted_args", extractedArgs},
            {"strategy", matchStrategyToString(strategy)},
        };
    }
};

/**
 * @brief Clarifier 返回的结构化澄清
 */
struct Clarification {
    std::string clarifiedIntent;
    std::vector<std::string> actionSteps;
    std::string context;
    std::optional<float> confidence;

    static std::optional<Clarification> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        Clarification c;
        c.clarifiedIntent = jsonValueOr<std::string>(j, "clarifiedIntent", "");
        if (c.clarifiedIntent.empty()) c.clarifiedIntent = jsonValueOr<std::string>(j, "clarified_intent", "");
        c.actionSteps = jsonStringList(j, "actionSteps");
        if (c.actionSteps.empty()) c.actionSteps = jsonStringList(j, "action_steps");
        c.context = jsonValueOr<std::string>(j, "context", "");
        if (j.contains("confidence") && j.at("confidence").is_number()) {
            c.confidence = j.at("confidence").get<float>();
        }
        if (c.clarifiedIntent.empty() && c.actionSteps.empty()) return std::nullopt;
        return c;
    }

    nlohmann::json toJson() const {
        nlohmann::json j{
            {"clarified_intent", clarifiedIntent},
            {"action_steps", actionSteps},
            {"context", context},
        };
        if (confidence.has_value()) j["confidence"] = *confidence;
        return j;
    }
};

enum class RoutingOutcome {
    Resolved,           // 本地匹配成功，可直接执行
    NeedsConfirmation,  // 经 Clarifier 澄清，需要确认后执行
    Unresolved          // 无法解析（含 Clarifier 超时/失败）
};

inline std::string routingOutcomeToString(RoutingOutcome v) {
    switch (v) {
        case RoutingOutcome::Resolved: return "resolved";
        case RoutingOutcome::NeedsConfirmation: return "needs_confirmation";
        case RoutingOutcome::Unresolved: return "unresolved";
    }
    return "unresolved";
}

/**
 * @brief 应用目录条目（open 类命令的解析目标）
 */
struct AppInfo {
    std::string id;                         // 规范名，例如 "chrome"
    std::string displayName;                // 用于提示与应用商店搜索
    std::vector<std::string> aliases;       // 小写别名
    std::vector<std::string> linuxCommands; // 依次尝试的可执行文件
    std::string macAppName;                 // open -a 的参数
    std::string windowsCommand;             // start 的参数
    std::string downloadUrl;                // 未安装时的下载地址（可空）

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"id", id},
            {"display_name", displayName},
            {"aliases", aliases},
            {"download_url", downloadUrl},
        };
    }
};

/**
 * @brief 命令历史条目（只追加）
 */
struct CommandHistoryEntry {
    std::string command;
    bool success{false};
    Timestamp timestamp{};
    std::string resultSummary;

    static std::optional<CommandHistoryEntry> fromJson(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("command") || !j.at("command").is_string()) return std::nullopt;
        CommandHistoryEntry e;
        e.command = j.at("command").get<std::string>();
        e.success = jsonValueOr<bool>(j, "success", false);
        e.timestamp = fromUnixMillis(jsonValueOr<uint64_t>(j, "timestamp_ms", 0));
        e.resultSummary = jsonValueOr<std::string>(j, "result_summary", "");
        return e;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"command", command},
            {"success", success},
            {"timestamp_ms", toUnixMillis(timestamp)},
            {"result_summary", resultSummary},
        };
    }
};

} // namespace delo::ambient::types
