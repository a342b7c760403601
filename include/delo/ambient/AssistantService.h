#pragma once

#include "delo/ambient/AssistantConfig.h"
#include "delo/ambient/AudioSentinel.h"
#include "delo/ambient/Capabilities.h"
#include "delo/ambient/CommandHistory.h"
#include "delo/ambient/CommandRouter.h"
#include "delo/ambient/ContextEngine.h"
#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/FallbackResolver.h"
#include "delo/ambient/FilterStore.h"
#include "delo/ambient/ScreenCapture.h"
#include "delo/ambient/ScreenSentinel.h"
#include "delo/ambient/TriggerDispatcher.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient {

/**
 * @brief 对展示层暴露的命令面
 *
 * 持有过滤规则、两个感知源、上下文引擎、命令路由与历史；
 * 感知源产出的 Trigger 由独立工作线程交给路由器，感知线程不等待命令执行。
 * 所有公开方法都不抛异常。
 */
class AssistantService {
public:
    /**
     * @brief 注入的外部能力，均可为空（对应功能随之不可用）
     */
    struct Capabilities {
        std::shared_ptr<ScreenCapture> screenCapture;
        std::shared_ptr<TextExtractor> textExtractor;
        std::shared_ptr<Transcriber> transcriber;
        std::shared_ptr<AudioSource> audioSource;
        std::shared_ptr<Clarifier> clarifier;
        std::shared_ptr<CompletionClient> completionClient; // summarize 使用
        std::shared_ptr<UrlOpener> urlOpener;
        std::shared_ptr<AppLauncher> appLauncher;
        std::shared_ptr<RecordStore> recordStore; // 为空时使用 InMemoryRecordStore
        bool registerBuiltinHandlers{true};
    };

    AssistantService(AssistantConfig config, Capabilities caps, ErrorHandler& logger);
    ~AssistantService();

    // 禁止拷贝/移动
    AssistantService(const AssistantService&) = delete;
    AssistantService& operator=(const AssistantService&) = delete;
    AssistantService(AssistantService&&) = delete;
    AssistantService& operator=(AssistantService&&) = delete;

    /**
     * @brief 加载命令历史、应用免打扰配置并启动 Trigger 工作线程
     * @return 历史文件损坏或免打扰配置无效时返回 false（服务仍可用）
     */
    bool initialize(ErrorInfo* err = nullptr);

    // 停止所有感知源与工作线程；幂等
    void shutdown();

    // ========== 命令 ==========
    CommandResult executeCommand(const std::string& text, const types::SessionId& sessionId = "default");
    ConfirmationResult confirmAndExecute(const types::RequestId& requestId, const std::string& confirmation);
    ConfirmationResult confirmAndExecute(const std::string& confirmation,
                                         const types::Clarification& clarification,
                                         const std::string& originalCommand,
                                         const std::string& context);
    std::vector<std::string> getCommandSuggestions(const std::string& partialText) const;
    std::vector<types::CommandHistoryEntry> getCommandHistory(size_t limit = 0) const;

    // ========== 感知生命周期 ==========
    // ultraLightweight 模式下均不启动并返回 false
    bool startScreenPerception();
    void stopScreenPerception();
    bool startAudioPerception();
    void stopAudioPerception();
    bool startContextManager();
    void stopContextManager();

    // ========== 规则注册 ==========
    bool addScreenFilter(const types::AppFilter& filter, ErrorInfo* err = nullptr);
    bool addAudioFilter(const types::AudioFilter& filter, ErrorInfo* err = nullptr);
    bool addContextPattern(const types::ContextPattern& pattern, ErrorInfo* err = nullptr);
    bool setQuietHours(int startHour, int endHour, ErrorInfo* err = nullptr);

    // ========== 查询 ==========
    std::vector<types::ScreenSnapshot> getScreenSnapshots(size_t limit = 0) const;
    std::vector<types::AudioSession> getAudioSessions(size_t limit = 0) const;
    std::vector<types::ContextSnapshot> getContextSnapshots(size_t limit = 0) const;
    std::vector<types::AudioSession> searchTranscripts(const std::string& query) const;
    nlohmann::json getStatus() const;

    /**
     * @brief 等待已入队的 Trigger 全部处理完
     * @return 超时返回 false
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    // ========== 组件访问 ==========
    const AssistantConfig& config() const { return m_config; }
    FilterStore& filters() { return m_filters; }
    ScreenSentinel& screenSentinel() { return m_screen; }
    AudioSentinel& audioSentinel() { return m_audio; }
    ContextEngine& contextEngine() { return m_context; }
    CommandRouter& router() { return m_router; }
    CommandHistory& history() { return m_history; }
    const FallbackResolver& fallbackResolver() const { return m_fallback; }
    RecordStore& recordStore() { return *m_records; }

private:
    void onScreenSnapshot(const types::ScreenSnapshot& snapshot);
    void onAudioSession(const types::AudioSession& session);
    void onTrigger(const types::Trigger& trigger);
    void handleTrigger(const types::Trigger& trigger);

    void saveRecord(const std::string& collection, const nlohmann::json& record);
    void recordHistory(const std::string& command, bool success, const std::string& summary);

    // 交给 Clarifier 的上下文：当前应用与窗口标题
    std::string currentContextText() const;

    AssistantConfig m_config;
    ErrorHandler& m_logger;
    std::shared_ptr<RecordStore> m_records;

    FilterStore m_filters;
    FallbackResolver m_fallback;
    CommandRouter m_router;
    CommandHistory m_history;
    ContextEngine m_context;
    ScreenSentinel m_screen;
    AudioSentinel m_audio;
    TriggerDispatcher m_dispatcher;

    std::mutex m_lifecycleMutex;
    bool m_initialized{false};
};

} // namespace delo::ambient
