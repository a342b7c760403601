#include "delo/ambient/TriggerDispatcher.h"

namespace delo::ambient {

TriggerDispatcher::TriggerDispatcher(Handler handler, const ErrorHandler& logger, size_t maxQueueSize)
    : m_handler(std::move(handler))
    , m_logger(logger)
    , m_maxQueueSize(maxQueueSize == 0 ? 1 : maxQueueSize)
{
    m_statistics.maxSize = m_maxQueueSize;
}

TriggerDispatcher::~TriggerDispatcher() {
    stop();
}

void TriggerDispatcher::start() {
    if (m_running.load()) {
        return; // 已经在运行
    }
    m_running.store(true);
    m_workerThread = std::thread(&TriggerDispatcher::processQueue, this);
}

void TriggerDispatcher::stop() {
    if (!m_running.load()) {
        return; // 已经停止
    }
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_running.store(false);
    }
    m_queueCondition.notify_all(); // 唤醒工作线程

    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }
}

bool TriggerDispatcher::enqueue(const types::Trigger& trigger) {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_queue.size() >= m_maxQueueSize) {
            m_statistics.totalDropped++;
            m_logger.log(ErrorHandler::LogLevel::Warning,
                         "TriggerDispatcher: queue full, dropping trigger " + trigger.patternName);
            return false;
        }
        m_queue.push_back(trigger);
        m_statistics.totalEnqueued++;
        m_statistics.currentSize = m_queue.size();
    }
    m_queueCondition.notify_one();
    return true;
}

void TriggerDispatcher::processQueue() {
    while (true) {
        std::unique_lock<std::mutex> lock(m_queueMutex);

        // 等待队列非空或停止信号
        m_queueCondition.wait(lock, [this] { return !m_queue.empty() || !m_running.load(); });

        // 如果停止且队列为空，退出
        if (!m_running.load() && m_queue.empty()) {
            break;
        }

        types::Trigger trigger = std::move(m_queue.front());
        m_queue.pop_front();
        m_statistics.currentSize = m_queue.size();
        m_busy = true;
        lock.unlock();

        bool ok = true;
        if (m_handler) {
            try {
                m_handler(trigger);
            } catch (const std::exception& e) {
                ok = false;
                m_logger.log(ErrorHandler::LogLevel::Error,
                             "TriggerDispatcher: handler failed for " + trigger.patternName,
                             ErrorInfo::make(ErrorType::UnknownError, e.what()));
            }
        }

        lock.lock();
        m_busy = false;
        m_statistics.totalDispatched++;
        if (!ok) m_statistics.handlerFailures++;
        const bool idle = m_queue.empty();
        lock.unlock();
        if (idle) m_idleCondition.notify_all();
    }

    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_busy = false;
    m_idleCondition.notify_all();
}

bool TriggerDispatcher::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    return m_idleCondition.wait_for(lock, timeout, [this] { return m_queue.empty() && !m_busy; });
}

TriggerDispatcher::Statistics TriggerDispatcher::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_statistics;
}

} // namespace delo::ambient
