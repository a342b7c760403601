#pragma once

#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/ErrorTypes.h"
#include "delo/ambient/types/ContextTypes.h"
#include "delo/ambient/types/PerceptionTypes.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient {

/**
 * @brief 上下文融合与模式匹配
 *
 * 两个感知源可能并发调用 update()，融合状态由互斥锁保护。
 * 每次 update 产生一个 ContextSnapshot 并记录；免打扰时段内触发被抑制，但快照照常记录。
 */
class ContextEngine {
public:
    struct Options {
        size_t maxHistory{100};
    };

    struct Status {
        bool isActive{false};
        bool isQuietHours{false};
        size_t patternsCount{0};
        uint64_t snapshotsRecorded{0};
        uint64_t triggersEmitted{0};
        uint64_t triggersSuppressed{0};

        nlohmann::json toJson() const {
            return nlohmann::json{
                {"is_active", isActive},
                {"is_quiet_hours", isQuietHours},
                {"patterns_count", patternsCount},
                {"snapshots_recorded", snapshotsRecorded},
                {"triggers_emitted", triggersEmitted},
                {"triggers_suppressed", triggersSuppressed},
            };
        }
    };

    using TriggerCallback = std::function<void(const types::Trigger& trigger)>;
    // 返回当前本地小时 0..23
    using HourSource = std::function<int()>;

    ContextEngine(const ErrorHandler& logger, Options options);

    // 禁止拷贝/移动
    ContextEngine(const ContextEngine&) = delete;
    ContextEngine& operator=(const ContextEngine&) = delete;

    // ========== 模式管理 ==========

    /**
     * @brief 注册模式；同名模式被替换（保留原位置）
     * @return 名称为空、无触发动作或正则形式 windowPattern 无法编译时返回 false
     */
    bool addContextPattern(const types::ContextPattern& pattern, ErrorInfo* err = nullptr);
    bool removeContextPattern(const std::string& patternName);
    std::vector<types::ContextPattern> listPatterns() const;

    // ========== 免打扰 ==========

    // [start, end) 本地小时，start > end 表示跨午夜，start == end 表示关闭
    bool setQuietHours(int startHour, int endHour, ErrorInfo* err = nullptr);
    void clearQuietHours();
    bool isQuietHours() const;
    void setHourSource(HourSource source);

    // ========== 生命周期 ==========
    // 停止状态下 update() 仍融合并记录，但不发出触发
    void start();
    void stop();
    bool isActive() const;

    void setTriggerCallback(TriggerCallback cb);

    // ========== 融合/匹配 ==========

    /**
     * @brief 合并最新屏幕/音频状态（逐字段后写者胜）并匹配模式
     * @param activeApp 可选的前台应用元数据，覆盖屏幕快照中的应用名
     * @return 本次融合出的快照
     */
    types::ContextSnapshot update(const std::optional<types::ScreenSnapshot>& screen,
                                  const std::optional<types::AudioSession>& audio,
                                  const std::optional<std::string>& activeApp = std::nullopt);

    /**
     * @brief 对快照匹配所有启用的模式，每个命中模式产生一个 Trigger
     * @return 免打扰时段内恒为空
     */
    std::vector<types::Trigger> evaluate(const types::ContextSnapshot& snapshot) const;

    std::optional<types::ContextSnapshot> currentSnapshot() const;

    // 最近记录的快照（旧 -> 新），limit 为 0 时返回全部
    std::vector<types::ContextSnapshot> getContextSnapshots(size_t limit = 0) const;

    Status getStatus() const;

    // 从融合文本粗略推断用户意图；无明显信号时返回 nullopt
    static std::optional<std::string> inferUserIntent(const std::string& text);

    static bool isHourInWindow(int hour, int startHour, int endHour);

private:
    struct PatternEntry {
        types::ContextPattern pattern;
        std::optional<std::regex> windowRegex;
    };

    static bool isRegexForm(const std::string& windowPattern);
    static bool matchesPattern(const PatternEntry& entry, const types::ContextSnapshot& snapshot);

    bool quietNowLocked() const;
    std::vector<types::Trigger> collectTriggersLocked(const types::ContextSnapshot& snapshot) const;

    const ErrorHandler& m_logger;
    Options m_options;

    mutable std::mutex m_mutex;
    std::vector<PatternEntry> m_patterns;

    std::optional<int> m_quietStart;
    std::optional<int> m_quietEnd;
    HourSource m_hourSource;

    bool m_active{false};
    TriggerCallback m_callback;

    // 当前融合状态
    std::optional<types::ScreenSnapshot> m_screen;
    std::optional<types::AudioSession> m_audio;
    std::optional<std::string> m_activeApp;
    std::optional<types::ContextSnapshot> m_current;

    std::deque<types::ContextSnapshot> m_history;
    uint64_t m_snapshotsRecorded{0};
    uint64_t m_triggersEmitted{0};
    uint64_t m_triggersSuppressed{0};
};

} // namespace delo::ambient
