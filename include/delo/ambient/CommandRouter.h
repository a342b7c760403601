#pragma once

#include "delo/ambient/Capabilities.h"
#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/ErrorTypes.h"
#include "delo/ambient/FallbackResolver.h"
#include "delo/ambient/types/CommonTypes.h"
#include "delo/ambient/types/FallbackTypes.h"
#include "delo/ambient/types/IntentTypes.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient {

/**
 * @brief 路由结果
 */
struct RouteResult {
    types::Intent intent;
    types::RoutingOutcome outcome{types::RoutingOutcome::Unresolved};
    std::optional<types::Clarification> clarification; // 仅 NeedsConfirmation
    std::optional<types::RequestId> requestId;         // 待确认请求
    std::optional<types::FallbackResponse> fallback;   // 仅 Unresolved
    std::string message;

    nlohmann::json toJson() const;
};

/**
 * @brief 单次动作执行结果
 */
struct ExecutionResult {
    types::Intent intent;
    ActionResult action;
    std::optional<types::FallbackResponse> fallback;

    bool succeeded() const { return action.success; }
    nlohmann::json toJson() const;
};

/**
 * @brief executeCommand 的返回：{success, result, error?}
 */
struct CommandResult {
    bool success{false};
    RouteResult route;
    std::optional<ExecutionResult> execution; // Resolved 时执行
    std::optional<std::string> error;

    bool needsConfirmation() const { return route.outcome == types::RoutingOutcome::NeedsConfirmation; }
    // 给用户的一句话总结
    std::string summary() const;
    nlohmann::json toJson() const;
};

/**
 * @brief confirmAndExecute 的返回：{success, executed, results[]}
 */
struct ConfirmationResult {
    struct StepResult {
        std::string step;
        types::IntentCategory category{types::IntentCategory::Unknown};
        ExecutionResult execution;
    };

    bool success{false};
    bool executed{false};
    std::string message;
    std::string originalCommand;
    std::vector<StepResult> results;

    nlohmann::json toJson() const;
};

/**
 * @brief 路由历史记录
 */
struct RoutingRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string command;
    types::IntentCategory category{types::IntentCategory::Unknown};
    types::MatchStrategy strategy{types::MatchStrategy::None};
    float confidence{0.0f};
    types::RoutingOutcome outcome{types::RoutingOutcome::Unresolved};
};

/**
 * @brief 命令路由器：自由文本 -> Intent -> ActionHandler
 *
 * 匹配顺序固定：精确短语 -> 同义词/模糊 -> Clarifier。
 * Clarifier 得出的意图不会立即执行，需要 confirmAndExecute 二次确认。
 * 对外接口从不抛异常，失败以结构化结果返回。
 */
class CommandRouter {
public:
    struct Options {
        uint32_t clarifierTimeoutMs{2500};
        uint32_t confirmationTtlMs{120000};
        double fuzzyThreshold{0.7};
        uint32_t maxInflightClarifications{4}; // 超时后仍在运行的 Clarifier 调用也计入
    };

    CommandRouter(const FallbackResolver& fallback, const ErrorHandler& logger, Options options);
    ~CommandRouter() = default;

    // 禁止拷贝/移动
    CommandRouter(const CommandRouter&) = delete;
    CommandRouter& operator=(const CommandRouter&) = delete;
    CommandRouter(CommandRouter&&) = delete;
    CommandRouter& operator=(CommandRouter&&) = delete;

    // ========== 依赖注入 ==========
    void setClarifier(std::shared_ptr<Clarifier> clarifier);
    void registerHandler(types::IntentCategory category, std::shared_ptr<ActionHandler> handler);
    bool unregisterHandler(types::IntentCategory category);
    bool hasHandler(types::IntentCategory category) const;

    // 正在运行的 Clarifier 调用数；超时放弃等待的调用总数
    uint32_t inflightClarifications() const;
    uint64_t abandonedClarifications() const;

    // ========== 路由 ==========
    /**
     * @brief 只做本地匹配（精确、模糊），不调用 Clarifier
     * @return 未命中时返回 nullopt
     */
    std::optional<types::Intent> matchLocally(const std::string& rawCommand) const;

    /**
     * @brief 路由命令
     * @param sessionId 待确认请求归属的会话（每个会话同时只保留一个）
     * @param context   传给 Clarifier 的上下文（剪贴板、当前应用等）
     */
    RouteResult route(const std::string& rawCommand,
                      const types::SessionId& sessionId = "default",
                      const std::string& context = "");

    // 执行一个已解析的意图
    ExecutionResult execute(const types::Intent& intent);

    // route + 对 Resolved 结果执行
    CommandResult executeCommand(const std::string& rawCommand,
                                 const types::SessionId& sessionId = "default",
                                 const std::string& context = "");

    // ========== 二次确认 ==========
    /**
     * @brief 按请求 id 确认执行（请求只能被消费一次，过期视为不存在）
     */
    ConfirmationResult confirmAndExecute(const types::RequestId& requestId, const std::string& confirmation);

    /**
     * @brief 无状态形式：调用方自行携带澄清结果
     */
    ConfirmationResult confirmAndExecute(const std::string& confirmation,
                                         const types::Clarification& clarification,
                                         const std::string& originalCommand,
                                         const std::string& context);

    bool cancelPending(const types::RequestId& requestId);
    std::optional<types::RequestId> pendingRequestFor(const types::SessionId& sessionId) const;
    size_t pendingCount() const;

    static bool isAffirmative(const std::string& confirmation);

    // ========== 路由记录 ==========
    std::vector<RoutingRecord> getRoutingHistory(size_t maxCount = 100) const;
    void clearRoutingHistory();

    /**
     * @brief 路由统计：类别名 -> 次数，另含 "strategy.exact/fuzzy/clarifier/none"
     */
    std::unordered_map<std::string, uint64_t> getRoutingStatistics() const;

private:
    struct PendingConfirmation {
        types::RequestId requestId;
        types::SessionId sessionId;
        std::string originalCommand;
        std::string context;
        types::Clarification clarification;
        std::chrono::steady_clock::time_point expiresAt;
    };

    struct ClarifyOutcome {
        bool attempted{false}; // 是否配置了 Clarifier
        std::optional<types::Clarification> clarification;
        ErrorInfo err;
    };

    ClarifyOutcome clarifyBounded(const std::string& command, const std::string& context) const;
    std::optional<types::Intent> intentFromClarification(const types::Clarification& c,
                                                          const std::string& rawCommand) const;
    ConfirmationResult runConfirmedSteps(const types::Clarification& clarification,
                                         const std::string& originalCommand,
                                         const std::string& context);
    types::FallbackResponse unresolvedFallback(const std::string& rawCommand) const;
    types::RequestId storePending(PendingConfirmation pending);
    void dropExpiredLocked(std::chrono::steady_clock::time_point now);
    void recordRouting(const RouteResult& result);

    // 按类别填充 extractedArgs；返回应用匹配的置信度系数
    float extractArgs(types::Intent& intent, const std::string& remainder) const;

    const FallbackResolver& m_fallback;
    const ErrorHandler& m_logger;
    Options m_options;

    mutable std::mutex m_handlersMutex;
    std::unordered_map<types::IntentCategory, std::shared_ptr<ActionHandler>> m_handlers;
    std::shared_ptr<Clarifier> m_clarifier;
    // 与 Clarifier 线程共享，线程结束时递减
    std::shared_ptr<std::atomic<uint32_t>> m_inflightClarifications{std::make_shared<std::atomic<uint32_t>>(0)};
    mutable std::atomic<uint64_t> m_abandonedClarifications{0};

    mutable std::mutex m_pendingMutex;
    std::map<types::RequestId, PendingConfirmation> m_pending;
    std::map<types::SessionId, types::RequestId> m_pendingBySession;
    uint64_t m_requestCounter{0};

    // 路由历史（限制大小）
    mutable std::mutex m_historyMutex;
    std::vector<RoutingRecord> m_routingHistory;
    static constexpr size_t kMaxHistorySize = 1000;

    mutable std::mutex m_statsMutex;
    std::unordered_map<std::string, uint64_t> m_routingStats;
};

} // namespace delo::ambient
