#pragma once

#include "delo/ambient/ConfigManager.h"
#include "delo/ambient/ErrorHandler.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace delo::ambient {

// 回退指引所针对的平台
enum class Platform {
    MacOS,
    Windows,
    Linux
};

inline const char* platformToString(Platform p) {
    switch (p) {
        case Platform::MacOS: return "macos";
        case Platform::Windows: return "windows";
        default: return "linux";
    }
}

// 编译期检测当前平台
inline Platform detectPlatform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

/**
 * @brief 强类型配置视图（由 ConfigManager 的 json 派生）
 */
struct AssistantConfig {
    bool ultraLightweight{false};
    Platform platform{detectPlatform()};

    uint32_t screenSampleIntervalMs{60000};
    double screenDiffThreshold{0.0};
    uint32_t audioSilenceTimeoutMs{2000};
    uint32_t minUtteranceMs{500};
    float volumeThreshold{0.1f};
    uint32_t transcribeWindowMs{1000};
    size_t perceptionMaxHistory{100};

    std::optional<int> quietHoursStart;
    std::optional<int> quietHoursEnd;
    size_t contextMaxHistory{100};

    uint32_t clarifierTimeoutMs{2500};
    uint32_t confirmationTtlMs{120000};
    double fuzzyThreshold{0.7};

    size_t historyMaxEntries{50};
    std::string historyPath;

    std::string textCommand;
    std::string transcribeCommand;
    std::string completionCommand;
    bool microphoneEnabled{false};

    ErrorHandler::LogLevel logLevel{ErrorHandler::LogLevel::Warning};

    static AssistantConfig fromConfig(const ConfigManager& cfg);
};

} // namespace delo::ambient
