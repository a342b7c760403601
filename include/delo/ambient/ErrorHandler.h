#pragma once

#include "delo/ambient/ErrorTypes.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace delo::ambient {

/**
 * @brief 结构化日志输出
 *
 * 默认写 stderr：`[epochMs] LEVEL message {error-json}`；
 * 可设置 sink 替换输出目标（测试中用于观察被吞掉的感知错误）。
 */
class ErrorHandler {
public:
    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Warning};
        bool enabled{true};
    };

    using LogSink = std::function<void(LogLevel level, const std::string& line)>;

    ErrorHandler();
    explicit ErrorHandler(LoggerConfig cfg);

    void setLoggerConfig(LoggerConfig cfg);
    LoggerConfig getLoggerConfig() const;

    // 设置为空函数即恢复 stderr 输出
    void setSink(LogSink sink);

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);

    // "error" / "warning" / "info" / "debug"（大小写不敏感，首尾空白忽略）
    static std::optional<LogLevel> parseLogLevel(const std::string& text);

private:
    mutable std::mutex m_mutex;
    LoggerConfig m_loggerCfg;
    LogSink m_sink;
};

} // namespace delo::ambient
