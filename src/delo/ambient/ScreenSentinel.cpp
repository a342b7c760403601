#include "delo/ambient/ScreenSentinel.h"

#include "delo/ambient/utils/TextMatch.h"

#include <chrono>
#include <cstddef>

namespace delo::ambient {

using types::ScreenSnapshot;

ScreenSentinel::ScreenSentinel(const FilterStore& filters,
                               std::shared_ptr<ScreenCapture> capture,
                               std::shared_ptr<TextExtractor> extractor,
                               const ErrorHandler& logger,
                               Options options)
    : m_filters(filters)
    , m_capture(std::move(capture))
    , m_extractor(std::move(extractor))
    , m_logger(logger)
    , m_options(options)
{
    if (m_options.maxHistory == 0) m_options.maxHistory = 1;
}

ScreenSentinel::~ScreenSentinel() {
    stop();
}

std::optional<ScreenSnapshot> ScreenSentinel::sample() {
    std::lock_guard<std::mutex> sampleLock(m_sampleMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.ticks++;
    }

    if (!m_capture || !m_extractor) {
        m_logger.log(ErrorHandler::LogLevel::Debug, "ScreenSentinel: capture or extractor not configured");
        return std::nullopt;
    }

    auto frame = m_capture->captureForeground();
    if (!frame.has_value()) {
        m_logger.log(ErrorHandler::LogLevel::Debug,
                     "ScreenSentinel: no foreground window (" + m_capture->getLastError() + ")");
        return std::nullopt;
    }

    // ========== 过滤 ==========
    if (!m_filters.shouldMonitorApp(frame->appName, frame->windowTitle)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.skippedFiltered++;
        return std::nullopt;
    }

    // ========== 文本提取（失败只记录） ==========
    std::optional<std::string> text;
    ErrorInfo err = ErrorInfo::make(ErrorType::SensingError, "Text extraction failed");
    try {
        text = m_extractor->extract(*frame, &err);
    } catch (const std::exception& e) {
        text.reset();
        err = ErrorInfo::make(ErrorType::SensingError, std::string("Text extractor threw: ") + e.what());
    }
    if (!text.has_value()) {
        err.context = std::map<std::string, std::string>{{"app", frame->appName}};
        m_logger.log(ErrorHandler::LogLevel::Warning, "ScreenSentinel: sample failed, continuing", err);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.failures++;
        return std::nullopt;
    }

    // ========== 内容比较 ==========
    const uint32_t hash = utils::contentHash(*text);
    const auto appKey = utils::toLowerCopy(frame->appName);

    ScreenSnapshot snapshot;
    SnapshotCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_lastByApp.find(appKey);
        if (it != m_lastByApp.end()) {
            bool unchanged = it->second.hash == hash;
            if (!unchanged && m_options.diffThreshold > 0.0) {
                unchanged = utils::jaccardSimilarity(it->second.text, *text) >= 1.0 - m_options.diffThreshold;
            }
            if (unchanged) {
                m_stats.skippedUnchanged++;
                return std::nullopt;
            }
        }

        snapshot.appName = frame->appName;
        snapshot.windowTitle = frame->windowTitle;
        snapshot.extractedText = *text;
        snapshot.contentHash = hash;
        snapshot.capturedAt = types::nowTimestamp();

        m_lastByApp[appKey] = LastContent{hash, *text};
        m_history.push_back(snapshot);
        while (m_history.size() > m_options.maxHistory) m_history.pop_front();
        m_stats.emitted++;
        cb = m_callback;
    }

    if (cb) {
        try {
            cb(snapshot);
        } catch (const std::exception& e) {
            m_logger.log(ErrorHandler::LogLevel::Warning,
                         std::string("ScreenSentinel: snapshot consumer threw: ") + e.what());
        }
    }
    return snapshot;
}

bool ScreenSentinel::start() {
    std::lock_guard<std::mutex> lock(m_threadMutex);
    if (m_running.load()) return false;
    if (!m_capture || !m_extractor) {
        m_logger.log(ErrorHandler::LogLevel::Warning, "ScreenSentinel: cannot start without capture and extractor");
        return false;
    }
    m_stopRequested = false;
    m_running = true;
    m_thread = std::thread([this]() { runLoop(); });
    m_logger.log(ErrorHandler::LogLevel::Info, "ScreenSentinel started");
    return true;
}

void ScreenSentinel::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_threadMutex);
        if (!m_running.load()) return;
        m_stopRequested = true;
        worker = std::move(m_thread);
    }
    m_cv.notify_all();
    if (worker.joinable()) worker.join();
    m_running = false;
    m_logger.log(ErrorHandler::LogLevel::Info, "ScreenSentinel stopped");
}

bool ScreenSentinel::isRunning() const {
    return m_running.load();
}

void ScreenSentinel::runLoop() {
    while (true) {
        sample();

        uint32_t intervalMs = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            intervalMs = m_options.sampleIntervalMs;
        }
        std::unique_lock<std::mutex> lock(m_threadMutex);
        if (m_cv.wait_for(lock, std::chrono::milliseconds(intervalMs), [this]() { return m_stopRequested; })) {
            break;
        }
    }
}

void ScreenSentinel::setSnapshotCallback(SnapshotCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(cb);
}

void ScreenSentinel::setSampleInterval(uint32_t intervalMs) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_options.sampleIntervalMs = intervalMs;
    }
    m_cv.notify_all();
}

std::vector<ScreenSnapshot> ScreenSentinel::getRecentSnapshots(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = (limit == 0 || limit > m_history.size()) ? m_history.size() : limit;
    return std::vector<ScreenSnapshot>(m_history.end() - static_cast<std::ptrdiff_t>(n), m_history.end());
}

ScreenSentinel::Stats ScreenSentinel::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void ScreenSentinel::resetDiffState() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastByApp.clear();
}

} // namespace delo::ambient
