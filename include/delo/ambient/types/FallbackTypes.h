#pragma once

#include "delo/ambient/types/CommonTypes.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient::types {

enum class FallbackReason {
    MissingApp,
    MissingOAuth,
    MissingPermission,
    MissingScript,
    UnknownAction
};

inline std::string fallbackReasonToString(FallbackReason v) {
    switch (v) {
        case FallbackReason::MissingApp: return "missing_app";
        case FallbackReason::MissingOAuth: return "missing_oauth";
        case FallbackReason::MissingPermission: return "missing_permission";
        case FallbackReason::MissingScript: return "missing_script";
        case FallbackReason::UnknownAction: return "unknown_action";
    }
    return "unknown_action";
}

inline std::optional<FallbackReason> stringToFallbackReason(std::string_view s) {
    if (s == "missing_app") return FallbackReason::MissingApp;
    if (s == "missing_oauth") return FallbackReason::MissingOAuth;
    if (s == "missing_permission") return FallbackReason::MissingPermission;
    if (s == "missing_script") return FallbackReason::MissingScript;
    if (s == "unknown_action") return FallbackReason::UnknownAction;
    return std::nullopt;
}

enum class FallbackAction {
    InstallApp,
    OpenOAuth,
    RequestPermission,
    GenerateScript,
    ManualInstruction
};

inline std::string fallbackActionToString(FallbackAction v) {
    switch (v) {
        case FallbackAction::InstallApp: return "install_app";
        case FallbackAction::OpenOAuth: return "open_oauth";
        case FallbackAction::RequestPermission: return "request_permission";
        case FallbackAction::GenerateScript: return "generate_script";
        case FallbackAction::ManualInstruction: return "manual_instruction";
    }
    return "manual_instruction";
}

// ========== 各原因的类型化详情 ==========
struct MissingAppDetails {
    std::string appName;
    std::string appUrl; // 可选：直接下载地址
};

struct MissingOAuthDetails {
    std::string oauthProvider;
};

struct MissingPermissionDetails {
    std::string permissionType;
};

struct MissingScriptDetails {
    std::string action;
};

struct UnknownActionDetails {
    std::string action;
};

// 变体下标与 FallbackReason 枚举顺序一致
using FallbackDetails = std::variant<
    MissingAppDetails,
    MissingOAuthDetails,
    MissingPermissionDetails,
    MissingScriptDetails,
    UnknownActionDetails>;

// std::visit 辅助：把多个 lambda 合成一个重载集合
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

struct FallbackRequest {
    FallbackDetails details{UnknownActionDetails{}};
    std::string proposal; // 给用户看的简述（可选）

    FallbackReason reason() const {
        return std::visit(Overloaded{
            [](const MissingAppDetails&) { return FallbackReason::MissingApp; },
            [](const MissingOAuthDetails&) { return FallbackReason::MissingOAuth; },
            [](const MissingPermissionDetails&) { return FallbackReason::MissingPermission; },
            [](const MissingScriptDetails&) { return FallbackReason::MissingScript; },
            [](const UnknownActionDetails&) { return FallbackReason::UnknownAction; },
        }, details);
    }

    static FallbackRequest missingApp(std::string appName, std::string appUrl = {}) {
        return FallbackRequest{MissingAppDetails{std::move(appName), std::move(appUrl)}, {}};
    }
    static FallbackRequest missingOAuth(std::string provider) {
        return FallbackRequest{MissingOAuthDetails{std::move(provider)}, {}};
    }
    static FallbackRequest missingPermission(std::string permissionType) {
        return FallbackRequest{MissingPermissionDetails{std::move(permissionType)}, {}};
    }
    static FallbackRequest missingScript(std::string action) {
        return FallbackRequest{MissingScriptDetails{std::move(action)}, {}};
    }
    static FallbackRequest unknownAction(std::string action = {}) {
        return FallbackRequest{UnknownActionDetails{std::move(action)}, {}};
    }

    /**
     * @brief 从线上格式解析 {"reason": "...", "details": {...}}
     * @return 原因无法识别时返回 nullopt
     */
    static std::optional<FallbackRequest> fromJson(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("reason") || !j.at("reason").is_string()) return std::nullopt;
        auto reason = stringToFallbackReason(j.at("reason").get<std::string>());
        if (!reason.has_value()) return std::nullopt;
        const nlohmann::json d = j.contains("details") && j.at("details").is_object() ? j.at("details")
                                                                                       : nlohmann::json::object();
        FallbackRequest req;
        switch (*reason) {
            case FallbackReason::MissingApp:
                req = missingApp(jsonValueOr<std::string>(d, "appName", ""), jsonValueOr<std::string>(d, "appUrl", ""));
                break;
            case FallbackReason::MissingOAuth:
                req = missingOAuth(jsonValueOr<std::string>(d, "oauthProvider", ""));
                break;
            case FallbackReason::MissingPermission:
                req = missingPermission(jsonValueOr<std::string>(d, "permissionType", ""));
                break;
            case FallbackReason::MissingScript:
                req = missingScript(jsonValueOr<std::string>(d, "action", ""));
                break;
            case FallbackReason::UnknownAction:
                req = unknownAction(jsonValueOr<std::string>(d, "action", ""));
                break;
        }
        req.proposal = jsonValueOr<std::string>(j, "proposal", "");
        return req;
    }

    nlohmann::json toJson() const {
        nlohmann::json d = std::visit(Overloaded{
            [](const MissingAppDetails& x) { return nlohmann::json{{"appName", x.appName}, {"appUrl", x.appUrl}}; },
            [](const MissingOAuthDetails& x) { return nlohmann::json{{"oauthProvider", x.oauthProvider}}; },
            [](const MissingPermissionDetails& x) { return nlohmann::json{{"permissionType", x.permissionType}}; },
            [](const MissingScriptDetails& x) { return nlohmann::json{{"action", x.action}}; },
            [](const UnknownActionDetails& x) { return nlohmann::json{{"action", x.action}}; },
        }, details);
        return nlohmann::json{
            {"reason", fallbackReasonToString(reason())},
            {"proposal", proposal},
            {"details", std::move(d)},
        };
    }
};

struct FallbackResponse {
    bool success{false};
    std::string message;
    FallbackAction action{FallbackAction::ManualInstruction};
    std::vector<std::string> nextSteps;

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"success", success},
            {"message", message},
            {"action", fallbackActionToString(action)},
            {"next_steps", nextSteps},
        };
    }
};

} // namespace delo::ambient::types
