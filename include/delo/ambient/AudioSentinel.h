#pragma once

#include "delo/ambient/Capabilities.h"
#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/FilterStore.h"
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
#include <vector>

namespace delo::ambient {

/**
 * @brief 连续音频感知：Idle / Capturing 两状态切分语音段
 *
 * - 音量超过阈值：Idle -> Capturing，打开新会话
 * - 采集中按窗口增量转写，文本追加到会话
 * - 连续静音达到超时：封存会话（isFinal=true）并发出
 * - 转写失败：以已累积的转写封存会话，不丢弃
 *
 * 静音时长按音频块自带的时间戳计算；watchdog 线程在音源停止送数据时按墙钟封存。
 * 转写在状态锁之外执行，慢速 Transcriber 不阻塞查询。
 */
class AudioSentinel {
public:
    struct Options {
        float volumeThreshold{0.1f};
        uint32_t silenceTimeoutMs{2000};
        uint32_t minUtteranceMs{500};
        uint32_t transcribeWindowMs{1000};
        size_t maxHistory{100};
    };

    enum class State {
        Idle,
        Capturing
    };

    struct Stats {
        uint64_t chunks{0};
        uint64_t sessionsOpened{0};
        uint64_t sessionsEmitted{0};
        uint64_t discardedShort{0};
        uint64_t discardedByKeywords{0};
        uint64_t transcriptionFailures{0};
    };

    using SessionCallback = std::function<void(const types::AudioSession& session)>;

    AudioSentinel(const FilterStore& filters,
                  std::shared_ptr<Transcriber> transcriber,
                  const ErrorHandler& logger,
                  Options options);
    ~AudioSentinel();

    // 禁止拷贝/移动
    AudioSentinel(const AudioSentinel&) = delete;
    AudioSentinel& operator=(const AudioSentinel&) = delete;

    // 设置音源（start 时启动）；为空时只能通过 feed() 推送
    void setAudioSource(std::shared_ptr<AudioSource> source);

    // 启动音源与 watchdog；已运行返回 false
    bool start();

    // 幂等；停止前封存进行中的会话
    void stop();
    bool isRunning() const;

    /**
     * @brief 推送一段音频，驱动状态机
     */
    void feed(const types::AudioChunk& chunk);

    /**
     * @brief 以给定时刻检查静音超时（watchdog 调用；测试可直接调用）
     */
    void checkSilence(types::Timestamp now);

    void setSessionCallback(SessionCallback cb);

    State getState() const;
    std::optional<types::AudioSession> currentSession() const;

    // 最近发出的会话（旧 -> 新），limit 为 0 时返回全部
    std::vector<types::AudioSession> getRecentSessions(size_t limit = 0) const;

    // 大小写不敏感的转写文本搜索
    std::vector<types::AudioSession> searchTranscripts(const std::string& query) const;

    Stats getStats() const;

    // RMS 电平，范围 [0,1]
    static float computeLevel(const std::vector<float>& samples);

private:
    enum class SealReason {
        Silence,
        TranscriptionError,
        Stopped
    };

    // 取出的待转写音频；generation 标识所属会话
    struct PendingWindow {
        uint64_t generation{0};
        types::AudioChunk chunk;
    };

    // 已脱离状态机、等待最终转写与过滤的会话
    struct SealingSession {
        types::AudioSession session;
        types::Timestamp lastVoicedEnd{};
        SealReason reason{SealReason::Silence};
        std::optional<PendingWindow> tail;
    };

    // *Locked 要求持有 m_mutex；transcribeWindow / completeSeal 不得持有 m_mutex
    std::optional<PendingWindow> takePendingLocked();
    SealingSession beginSealLocked(types::Timestamp endTime, SealReason reason);
    void finishSealLocked(SealingSession& sealing, std::vector<types::AudioSession>& out);
    std::optional<std::string> transcribeWindow(const PendingWindow& window) const;
    void completeSeal(SealingSession& sealing, std::vector<types::AudioSession>& out);
    static void appendTranscript(types::AudioSession& session, const std::string& text);

    void emit(const std::vector<types::AudioSession>& sessions);
    void watchdogLoop();

    const FilterStore& m_filters;
    std::shared_ptr<Transcriber> m_transcriber;
    const ErrorHandler& m_logger;
    Options m_options;

    // 锁顺序：m_transcribeMutex -> m_mutex；查询只取 m_mutex
    std::mutex m_transcribeMutex;
    mutable std::mutex m_mutex;
    State m_state{State::Idle};
    uint64_t m_generation{0};
    types::AudioSession m_session;
    types::Timestamp m_lastVoicedEnd{};
    types::Timestamp m_lastChunkEnd{};
    std::vector<float> m_pending;
    uint32_t m_pendingSampleRate{16000};
    types::Timestamp m_pendingStart{};
    std::deque<types::AudioSession> m_history;
    Stats m_stats;
    SessionCallback m_callback;

    std::shared_ptr<AudioSource> m_source;

    std::mutex m_threadMutex;
    std::condition_variable m_cv;
    std::thread m_watchdog;
    std::atomic<bool> m_running{false};
    bool m_stopRequested{false};
};

} // namespace delo::ambient
