#include "delo/ambient/ErrorHandler.h"

#include "delo/ambient/utils/TextMatch.h"

#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>

namespace delo::ambient {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static int levelRank(ErrorHandler::LogLevel lv) {
    switch (lv) {
        case ErrorHandler::LogLevel::Error: return 0;
        case ErrorHandler::LogLevel::Warning: return 1;
        case ErrorHandler::LogLevel::Info: return 2;
        default: return 3;
    }
}

ErrorHandler::ErrorHandler()
    : m_loggerCfg(LoggerConfig{})
{}

ErrorHandler::ErrorHandler(LoggerConfig cfg)
    : m_loggerCfg(cfg)
{}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loggerCfg = cfg;
}

ErrorHandler::LoggerConfig ErrorHandler::getLoggerConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loggerCfg;
}

void ErrorHandler::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sink = std::move(sink);
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& text) {
    const auto low = utils::toLowerCopy(utils::trimCopy(text));
    if (low == "error") return LogLevel::Error;
    if (low == "warning" || low == "warn") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_loggerCfg.enabled) return;
        if (levelRank(level) > levelRank(m_loggerCfg.minLevel)) return;
        sink = m_sink;
    }

    // 结构化输出：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }

    if (sink) {
        sink(level, oss.str());
        return;
    }
    oss << "\n";
    const auto line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace delo::ambient
