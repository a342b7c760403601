#pragma once

#include "delo/ambient/Capabilities.h"
#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/FilterStore.h"
#include "delo/ambient/ScreenCapture.h"
#include "delo/ambient/types/PerceptionTypes.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace delo::ambient {

/**
 * @brief 周期性屏幕感知
 *
 * 每个 tick：定位前台窗口 -> 过滤 -> 提取文本 -> 按应用比较内容哈希；
 * 内容变化时产出 ScreenSnapshot。单次失败只记录日志，不中断采样。
 */
class ScreenSentinel {
public:
    struct Options {
        uint32_t sampleIntervalMs{60000};
        double diffThreshold{0.0}; // >0 时词集合相似度 >= 1 - diffThreshold 视为未变化
        size_t maxHistory{100};
    };

    struct Stats {
        uint64_t ticks{0};
        uint64_t emitted{0};
        uint64_t skippedFiltered{0};
        uint64_t skippedUnchanged{0};
        uint64_t failures{0};
    };

    using SnapshotCallback = std::function<void(const types::ScreenSnapshot& snapshot)>;

    ScreenSentinel(const FilterStore& filters,
                   std::shared_ptr<ScreenCapture> capture,
                   std::shared_ptr<TextExtractor> extractor,
                   const ErrorHandler& logger,
                   Options options);
    ~ScreenSentinel();

    // 禁止拷贝/移动
    ScreenSentinel(const ScreenSentinel&) = delete;
    ScreenSentinel& operator=(const ScreenSentinel&) = delete;

    /**
     * @brief 执行一次采样
     * @return 内容变化且通过过滤时返回新快照，否则 std::nullopt
     */
    std::optional<types::ScreenSnapshot> sample();

    // 启动后台采样线程（立即采样一次，然后按间隔采样）；已运行时返回 false
    bool start();
    // 幂等
    void stop();
    bool isRunning() const;

    void setSnapshotCallback(SnapshotCallback cb);
    void setSampleInterval(uint32_t intervalMs);

    // 最近的快照（旧 -> 新），limit 为 0 时返回全部
    std::vector<types::ScreenSnapshot> getRecentSnapshots(size_t limit = 0) const;

    Stats getStats() const;

    // 清空每个应用的上次哈希，下一次采样必然产出快照
    void resetDiffState();

private:
    struct LastContent {
        uint32_t hash{0};
        std::string text;
    };

    void runLoop();

    const FilterStore& m_filters;
    std::shared_ptr<ScreenCapture> m_capture;
    std::shared_ptr<TextExtractor> m_extractor;
    const ErrorHandler& m_logger;

    mutable std::mutex m_mutex;
    Options m_options;
    Stats m_stats;
    std::unordered_map<std::string, LastContent> m_lastByApp;
    std::deque<types::ScreenSnapshot> m_history;
    SnapshotCallback m_callback;

    // 串行化 sample()，后台线程与手动调用不会交错
    std::mutex m_sampleMutex;

    // 采样线程
    std::mutex m_threadMutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    bool m_stopRequested{false};
};

} // namespace delo::ambient
