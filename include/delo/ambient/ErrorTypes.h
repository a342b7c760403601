#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace delo::ambient {

/**
 * @brief 统一错误类型
 */
enum class ErrorType {
    SensingError,         // 感知失败（文本提取/转写），本地恢复
    TimeoutError,         // 超时（Clarifier 往返等）
    InvalidConfig,        // 配置/过滤规则/模式校验失败
    ExternalServiceError, // 外部能力调用失败
    ActionUnavailable,    // 动作无法完成，转入回退流程
    UnknownError          // 未知错误
};

/**
 * @brief 错误严重程度
 */
enum class ErrorSeverity {
    Critical,
    Warning,
    Info
};

/**
 * @brief 结构化错误信息
 */
struct ErrorInfo {
    ErrorType errorType{ErrorType::UnknownError};
    int errorCode{0}; // 内部错误码（0 表示无/未知）
    std::string message;
    std::optional<nlohmann::json> details;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::map<std::string, std::string>> context;

    static ErrorInfo make(ErrorType type, std::string msg, std::optional<nlohmann::json> details = std::nullopt) {
        ErrorInfo e;
        e.errorType = type;
        e.message = std::move(msg);
        e.details = std::move(details);
        return e;
    }

    static const char* errorTypeToString(ErrorType t) {
        switch (t) {
            case ErrorType::SensingError: return "SensingError";
            case ErrorType::TimeoutError: return "TimeoutError";
            case ErrorType::InvalidConfig: return "InvalidConfig";
            case ErrorType::ExternalServiceError: return "ExternalServiceError";
            case ErrorType::ActionUnavailable: return "ActionUnavailable";
            default: return "UnknownError";
        }
    }

    static const char* severityToString(ErrorSeverity s) {
        switch (s) {
            case ErrorSeverity::Critical: return "Critical";
            case ErrorSeverity::Warning: return "Warning";
            default: return "Info";
        }
    }

    static ErrorSeverity defaultSeverity(ErrorType t) {
        switch (t) {
            case ErrorType::InvalidConfig:
            case ErrorType::ExternalServiceError:
            case ErrorType::TimeoutError:
                return ErrorSeverity::Warning;
            case ErrorType::SensingError:
            case ErrorType::ActionUnavailable:
                return ErrorSeverity::Info;
            default:
                return ErrorSeverity::Warning;
        }
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["error_type"] = errorTypeToString(errorType);
        j["error_code"] = errorCode;
        j["message"] = message;
        j["severity"] = severityToString(defaultSeverity(errorType));
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        j["timestamp_ms"] = ms;
        if (details.has_value()) j["details"] = details.value();
        if (context.has_value()) j["context"] = context.value();
        return j;
    }

    std::string toString() const {
        // JSON 作为统一字符串化输出，便于日志/调试
        return toJson().dump();
    }
};

} // namespace delo::ambient
