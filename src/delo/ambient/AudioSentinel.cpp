#include "delo/ambient/AudioSentinel.h"

#include "delo/ambient/utils/TextMatch.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>

namespace delo::ambient {

using types::AudioChunk;
using types::AudioSession;
using types::Timestamp;

namespace {

uint64_t elapsedMs(Timestamp from, Timestamp to) {
    using namespace std::chrono;
    if (to <= from) return 0;
    return static_cast<uint64_t>(duration_cast<milliseconds>(to - from).count());
}

Timestamp chunkEnd(const AudioChunk& chunk) {
    return chunk.capturedAt + std::chrono::milliseconds(chunk.durationMs());
}

} // namespace

AudioSentinel::AudioSentinel(const FilterStore& filters,
                             std::shared_ptr<Transcriber> transcriber,
                             const ErrorHandler& logger,
                             Options options)
    : m_filters(filters)
    , m_transcriber(std::move(transcriber))
    , m_logger(logger)
    , m_options(options)
{
    if (m_options.maxHistory == 0) m_options.maxHistory = 1;
}

AudioSentinel::~AudioSentinel() {
    stop();
}

float AudioSentinel::computeLevel(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;
    double sumSq = 0.0;
    for (float s : samples) {
        sumSq += static_cast<double>(s) * static_cast<double>(s);
    }
    const double rms = std::sqrt(sumSq / static_cast<double>(samples.size()));
    return static_cast<float>(std::min(1.0, std::max(0.0, rms)));
}

void AudioSentinel::setAudioSource(std::shared_ptr<AudioSource> source) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_source = std::move(source);
}

void AudioSentinel::setSessionCallback(SessionCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(cb);
}

// ========== 状态机 ==========

void AudioSentinel::feed(const AudioChunk& chunk) {
    if (chunk.samples.empty()) return;
    if (!m_filters.shouldCaptureAudio(chunk.sourceName)) return;

    const float threshold = m_filters.volumeThresholdFor(chunk.sourceName, m_options.volumeThreshold);
    const bool voiced = computeLevel(chunk.samples) > threshold;
    const Timestamp end = chunkEnd(chunk);

    std::vector<AudioSession> sealed;
    {
        // 转写调用在 m_mutex 之外进行；m_transcribeMutex 保证窗口按顺序追加
        std::lock_guard<std::mutex> transcribeLock(m_transcribeMutex);
        std::optional<SealingSession> sealing;
        std::optional<PendingWindow> window;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stats.chunks++;

            if (m_state == State::Idle) {
                if (!voiced) return;
                m_state = State::Capturing;
                m_generation++;
                m_session = AudioSession{};
                m_session.sourceName = chunk.sourceName;
                m_session.startTime = chunk.capturedAt;
                m_session.endTime = end;
                m_lastVoicedEnd = end;
                m_lastChunkEnd = end;
                m_pending = chunk.samples;
                m_pendingSampleRate = chunk.sampleRate;
                m_pendingStart = chunk.capturedAt;
                m_stats.sessionsOpened++;
            } else {
                // 采集中只接受同一音源
                if (!utils::equalsIgnoreCase(chunk.sourceName, m_session.sourceName)) return;

                if (m_pending.empty()) m_pendingStart = chunk.capturedAt;
                m_pending.insert(m_pending.end(), chunk.samples.begin(), chunk.samples.end());
                m_pendingSampleRate = chunk.sampleRate;
                m_session.endTime = end;
                m_lastChunkEnd = end;
                if (voiced) {
                    m_lastVoicedEnd = end;
                } else if (elapsedMs(m_lastVoicedEnd, end) >= m_options.silenceTimeoutMs) {
                    sealing = beginSealLocked(end, SealReason::Silence);
                }
            }

            // 增量转写
            if (!sealing && m_state == State::Capturing && m_pendingSampleRate > 0) {
                const uint64_t pendingMs = static_cast<uint64_t>(m_pending.size()) * 1000ULL / m_pendingSampleRate;
                if (pendingMs >= m_options.transcribeWindowMs) window = takePendingLocked();
            }
        }

        if (sealing) completeSeal(*sealing, sealed);

        if (window) {
            const auto text = transcribeWindow(*window);
            std::lock_guard<std::mutex> lock(m_mutex);
            // 会话已被替换时丢弃结果
            if (m_state == State::Capturing && m_generation == window->generation) {
                if (text.has_value()) {
                    appendTranscript(m_session, *text);
                } else {
                    m_stats.transcriptionFailures++;
                    auto failed = beginSealLocked(end, SealReason::TranscriptionError);
                    finishSealLocked(failed, sealed);
                }
            }
        }
    }
    emit(sealed);
}

void AudioSentinel::checkSilence(Timestamp now) {
    std::vector<AudioSession> sealed;
    {
        std::lock_guard<std::mutex> transcribeLock(m_transcribeMutex);
        std::optional<SealingSession> sealing;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state != State::Capturing) return;
            if (elapsedMs(m_lastVoicedEnd, now) < m_options.silenceTimeoutMs) return;
            sealing = beginSealLocked(std::max(now, m_lastChunkEnd), SealReason::Silence);
        }
        completeSeal(*sealing, sealed);
    }
    emit(sealed);
}

std::optional<AudioSentinel::PendingWindow> AudioSentinel::takePendingLocked() {
    if (m_pending.empty()) return std::nullopt;
    if (!m_transcriber) {
        m_pending.clear();
        return std::nullopt;
    }

    PendingWindow window;
    window.generation = m_generation;
    window.chunk.sourceName = m_session.sourceName;
    window.chunk.samples.swap(m_pending);
    window.chunk.sampleRate = m_pendingSampleRate;
    window.chunk.capturedAt = m_pendingStart;
    m_pending.clear();
    return window;
}

std::optional<std::string> AudioSentinel::transcribeWindow(const PendingWindow& window) const {
    std::optional<std::string> text;
    ErrorInfo err = ErrorInfo::make(ErrorType::SensingError, "Transcription failed");
    try {
        text = m_transcriber->transcribe(window.chunk, &err);
    } catch (const std::exception& e) {
        text.reset();
        err = ErrorInfo::make(ErrorType::SensingError, std::string("Transcriber threw: ") + e.what());
    }
    if (!text.has_value()) {
        err.context = std::map<std::string, std::string>{{"source", window.chunk.sourceName}};
        m_logger.log(ErrorHandler::LogLevel::Warning, "AudioSentinel: transcription failed, sealing session", err);
    }
    return text;
}

void AudioSentinel::appendTranscript(AudioSession& session, const std::string& text) {
    const auto piece = utils::trimCopy(text);
    if (piece.empty()) return;
    if (!session.transcript.empty()) session.transcript.push_back(' ');
    session.transcript += piece;
}

AudioSentinel::SealingSession AudioSentinel::beginSealLocked(Timestamp endTime, SealReason reason) {
    SealingSession sealing;
    sealing.reason = reason;
    sealing.lastVoicedEnd = m_lastVoicedEnd;
    // 转写失败时不再重试剩余音频
    if (reason != SealReason::TranscriptionError) {
        sealing.tail = takePendingLocked();
    }
    m_pending.clear();

    sealing.session = m_session;
    sealing.session.endTime = endTime;
    sealing.session.isFinal = true;
    m_state = State::Idle;
    m_session = AudioSession{};
    return sealing;
}

void AudioSentinel::completeSeal(SealingSession& sealing, std::vector<AudioSession>& out) {
    bool tailFailed = false;
    if (sealing.tail) {
        if (auto text = transcribeWindow(*sealing.tail)) {
            appendTranscript(sealing.session, *text);
        } else {
            tailFailed = true;
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (tailFailed) m_stats.transcriptionFailures++;
    finishSealLocked(sealing, out);
}

void AudioSentinel::finishSealLocked(SealingSession& sealing, std::vector<AudioSession>& out) {
    const uint64_t voicedMs = elapsedMs(sealing.session.startTime, sealing.lastVoicedEnd);
    if (sealing.reason == SealReason::Silence && voicedMs < m_options.minUtteranceMs) {
        m_stats.discardedShort++;
        m_logger.log(ErrorHandler::LogLevel::Debug,
                     "AudioSentinel: discarded short utterance (" + std::to_string(voicedMs) + " ms)");
        return;
    }
    if (!m_filters.matchesAudioKeywords(sealing.session.sourceName, sealing.session.transcript)) {
        m_stats.discardedByKeywords++;
        return;
    }

    m_history.push_back(sealing.session);
    while (m_history.size() > m_options.maxHistory) m_history.pop_front();
    m_stats.sessionsEmitted++;
    out.push_back(std::move(sealing.session));
}

void AudioSentinel::emit(const std::vector<AudioSession>& sessions) {
    if (sessions.empty()) return;
    SessionCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cb = m_callback;
    }
    if (!cb) return;
    for (const auto& s : sessions) {
        try {
            cb(s);
        } catch (const std::exception& e) {
            m_logger.log(ErrorHandler::LogLevel::Warning,
                         std::string("AudioSentinel: session consumer threw: ") + e.what());
        }
    }
}

// ========== 生命周期 ==========

bool AudioSentinel::start() {
    std::lock_guard<std::mutex> lock(m_threadMutex);
    if (m_running.load()) return false;

    std::shared_ptr<AudioSource> source;
    {
        std::lock_guard<std::mutex> stateLock(m_mutex);
        source = m_source;
    }
    if (source) {
        ErrorInfo err;
        if (!source->start([this](AudioChunk chunk) { feed(chunk); }, &err)) {
            m_logger.log(ErrorHandler::LogLevel::Error, "AudioSentinel: audio source failed to start", err);
            return false;
        }
    }

    m_stopRequested = false;
    m_running = true;
    m_watchdog = std::thread([this]() { watchdogLoop(); });
    m_logger.log(ErrorHandler::LogLevel::Info, "AudioSentinel started");
    return true;
}

void AudioSentinel::stop() {
    std::thread worker;
    std::shared_ptr<AudioSource> source;
    bool wasRunning = false;
    {
        std::lock_guard<std::mutex> lock(m_threadMutex);
        wasRunning = m_running.load();
        if (wasRunning) {
            m_stopRequested = true;
            worker = std::move(m_watchdog);
        }
    }
    if (wasRunning) {
        {
            std::lock_guard<std::mutex> stateLock(m_mutex);
            source = m_source;
        }
        if (source) source->stop();
        m_cv.notify_all();
        if (worker.joinable()) worker.join();
        m_running = false;
    }

    // 停止前封存进行中的会话，不丢弃
    std::vector<AudioSession> sealed;
    {
        std::lock_guard<std::mutex> transcribeLock(m_transcribeMutex);
        std::optional<SealingSession> sealing;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state == State::Capturing) sealing = beginSealLocked(m_lastChunkEnd, SealReason::Stopped);
        }
        if (sealing) completeSeal(*sealing, sealed);
    }
    emit(sealed);
    if (wasRunning) m_logger.log(ErrorHandler::LogLevel::Info, "AudioSentinel stopped");
}

bool AudioSentinel::isRunning() const {
    return m_running.load();
}

void AudioSentinel::watchdogLoop() {
    const auto tick = std::chrono::milliseconds(std::max<uint32_t>(50, std::min<uint32_t>(250, m_options.silenceTimeoutMs / 4)));
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_threadMutex);
            if (m_cv.wait_for(lock, tick, [this]() { return m_stopRequested; })) break;
        }
        checkSilence(types::nowTimestamp());
    }
}

// ========== 查询 ==========

AudioSentinel::State AudioSentinel::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::optional<AudioSession> AudioSentinel::currentSession() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != State::Capturing) return std::nullopt;
    return m_session;
}

std::vector<AudioSession> AudioSentinel::getRecentSessions(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = (limit == 0 || limit > m_history.size()) ? m_history.size() : limit;
    return std::vector<AudioSession>(m_history.end() - static_cast<std::ptrdiff_t>(n), m_history.end());
}

std::vector<AudioSession> AudioSentinel::searchTranscripts(const std::string& query) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AudioSession> out;
    for (const auto& s : m_history) {
        if (utils::containsIgnoreCase(s.transcript, query)) out.push_back(s);
    }
    return out;
}

AudioSentinel::Stats AudioSentinel::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

} // namespace delo::ambient
