#pragma once

#include "delo/ambient/Capabilities.h"
#include "delo/ambient/ErrorTypes.h"
#include "delo/ambient/types/PerceptionTypes.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace delo::ambient::utils {

/**
 * @brief 基于 miniaudio 的麦克风采集
 *
 * 设备回调只负责攒帧入队，按 chunkMs 切块后由投递线程回调，
 * 不在实时音频线程里执行转写等耗时逻辑。
 */
class MiniaudioCaptureSource : public AudioSource {
public:
    struct Options {
        std::string sourceName{"microphone"};
        uint32_t sampleRate{16000};
        uint32_t chunkMs{100};
        uint32_t periodSizeInFrames{0}; // 0 表示默认 1024
        bool skipLoopbackDevices{true};
    };

    MiniaudioCaptureSource();
    explicit MiniaudioCaptureSource(Options options);
    ~MiniaudioCaptureSource() override;

    // 禁止拷贝/移动
    MiniaudioCaptureSource(const MiniaudioCaptureSource&) = delete;
    MiniaudioCaptureSource& operator=(const MiniaudioCaptureSource&) = delete;

    bool start(ChunkCallback cb, ErrorInfo* err) override;
    void stop() override;
    std::string sourceName() const override { return m_options.sourceName; }

    bool isCapturing() const;

    // miniaudio 设备回调入口（float 单声道帧）
    void onCaptureFrames(const float* frames, uint32_t frameCount);

private:
    struct Impl;

    void deliveryLoop();

    Options m_options;
    std::unique_ptr<Impl> m_impl;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<float> m_accum;
    std::deque<types::AudioChunk> m_queue;
    ChunkCallback m_callback;
    std::thread m_delivery;
    bool m_capturing{false};
    bool m_stopRequested{false};
};

/**
 * @brief 把 float 单声道 PCM 写成 WAV 文件
 */
bool writeWavFile(const std::string& path, const std::vector<float>& samples, uint32_t sampleRate,
                  ErrorInfo* err = nullptr);

/**
 * @brief 通过外部命令转写：音频写入临时 WAV，命令模板中的 {file} 替换为其路径，stdout 即转写文本
 */
class CommandTranscriber : public Transcriber {
public:
    explicit CommandTranscriber(std::string commandTemplate, std::string tempDir = "");

    std::optional<std::string> transcribe(const types::AudioChunk& chunk, ErrorInfo* err) override;

private:
    std::string makeTempPath();

    std::string m_commandTemplate;
    std::string m_tempDir;
    std::mutex m_mutex;
    uint64_t m_counter{0};
};

} // namespace delo::ambient::utils
