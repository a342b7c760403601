#pragma once

#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/types/ContextTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace delo::ambient {

/**
 * @brief Trigger 队列：感知线程只入队，由工作线程串行交给命令路由
 *
 * 队列满时丢弃新 Trigger 并记录日志，感知线程不会被阻塞。
 */
class TriggerDispatcher {
public:
    using Handler = std::function<void(const types::Trigger& trigger)>;

    struct Statistics {
        size_t currentSize{0};
        size_t maxSize{0};
        uint64_t totalEnqueued{0};
        uint64_t totalDispatched{0};
        uint64_t totalDropped{0};
        uint64_t handlerFailures{0};
    };

    TriggerDispatcher(Handler handler, const ErrorHandler& logger, size_t maxQueueSize = 256);
    ~TriggerDispatcher();

    // 禁止拷贝/移动
    TriggerDispatcher(const TriggerDispatcher&) = delete;
    TriggerDispatcher& operator=(const TriggerDispatcher&) = delete;

    void start();
    // 处理完已入队的 Trigger 后退出
    void stop();
    bool isRunning() const { return m_running.load(); }

    // @return 队列已满时返回 false
    bool enqueue(const types::Trigger& trigger);

    /**
     * @brief 等待队列清空且当前 Trigger 处理完毕
     * @return 超时返回 false
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    Statistics getStatistics() const;

private:
    void processQueue();

    Handler m_handler;
    const ErrorHandler& m_logger;
    size_t m_maxQueueSize;

    std::atomic<bool> m_running{false};
    std::thread m_workerThread;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    std::condition_variable m_idleCondition;
    std::deque<types::Trigger> m_queue;
    bool m_busy{false};
    Statistics m_statistics;
};

} // namespace delo::ambient
