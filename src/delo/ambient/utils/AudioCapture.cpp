#include "delo/ambient/utils/AudioCapture.h"

#include "delo/ambient/utils/ProcessUtils.h"
#include "delo/ambient/utils/TextMatch.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <miniaudio.h>
#include <string>

namespace delo::ambient::utils {

struct MiniaudioCaptureSource::Impl {
    ma_context context{};
    ma_device device{};
    bool contextReady{false};
    bool deviceReady{false};
};

MiniaudioCaptureSource::MiniaudioCaptureSource()
    : MiniaudioCaptureSource(Options{})
{}

MiniaudioCaptureSource::MiniaudioCaptureSource(Options options)
    : m_options(std::move(options))
    , m_impl(std::make_unique<Impl>())
{
    if (m_options.sampleRate == 0) m_options.sampleRate = 16000;
    if (m_options.chunkMs == 0) m_options.chunkMs = 100;
}

MiniaudioCaptureSource::~MiniaudioCaptureSource() {
    stop();
}

static void fillDeviceError(ErrorInfo* err, const std::string& message, ma_result result) {
    if (!err) return;
    *err = ErrorInfo::make(ErrorType::SensingError, message, nlohmann::json{{"ma_result", static_cast<int>(result)}});
}

bool MiniaudioCaptureSource::start(ChunkCallback cb, ErrorInfo* err) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_capturing) return true;
        m_callback = std::move(cb);
        m_accum.clear();
        m_queue.clear();
        m_stopRequested = false;
    }

    ma_result result = ma_context_init(nullptr, 0, nullptr, &m_impl->context);
    if (result != MA_SUCCESS) {
        fillDeviceError(err, "ma_context_init failed", result);
        return false;
    }
    m_impl->contextReady = true;

    ma_device_config deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.sampleRate = m_options.sampleRate;
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.periodSizeInFrames = m_options.periodSizeInFrames == 0 ? 1024 : m_options.periodSizeInFrames;
    deviceConfig.pUserData = this;
    deviceConfig.dataCallback = [](ma_device* device, void* /*pOutput*/, const void* pInput, ma_uint32 frameCount) {
        auto* self = static_cast<MiniaudioCaptureSource*>(device->pUserData);
        if (self && pInput) self->onCaptureFrames(static_cast<const float*>(pInput), frameCount);
    };

    // 默认输入若为 loopback，改选第一个非 loopback 设备
    ma_device_info* playbackInfos = nullptr;
    ma_uint32 playbackCount = 0;
    ma_device_info* captureInfos = nullptr;
    ma_uint32 captureCount = 0;
    if (m_options.skipLoopbackDevices &&
        ma_context_get_devices(&m_impl->context, &playbackInfos, &playbackCount, &captureInfos, &captureCount) == MA_SUCCESS &&
        captureInfos != nullptr && captureCount > 0) {
        auto isLoopback = [](const ma_device_info& info) {
            return toLowerCopy(std::string(info.name)).find("loopback") != std::string::npos;
        };
        const ma_device_info* chosen = &captureInfos[0];
        if (isLoopback(*chosen)) {
            for (ma_uint32 i = 0; i < captureCount; ++i) {
                if (!isLoopback(captureInfos[i])) {
                    chosen = &captureInfos[i];
                    break;
                }
            }
        }
        deviceConfig.capture.pDeviceID = &chosen->id;
    }

    result = ma_device_init(&m_impl->context, &deviceConfig, &m_impl->device);
    if (result != MA_SUCCESS) {
        ma_context_uninit(&m_impl->context);
        m_impl->contextReady = false;
        fillDeviceError(err, "ma_device_init failed", result);
        return false;
    }
    m_impl->deviceReady = true;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_capturing = true;
    }
    m_delivery = std::thread([this]() { deliveryLoop(); });

    result = ma_device_start(&m_impl->device);
    if (result != MA_SUCCESS) {
        stop();
        fillDeviceError(err, "ma_device_start failed", result);
        return false;
    }
    return true;
}

void MiniaudioCaptureSource::stop() {
    if (m_impl->deviceReady) {
        ma_device_uninit(&m_impl->device);
        m_impl->deviceReady = false;
    }
    if (m_impl->contextReady) {
        ma_context_uninit(&m_impl->context);
        m_impl->contextReady = false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_capturing) return;
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_delivery.joinable()) m_delivery.join();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_capturing = false;
    m_accum.clear();
    m_queue.clear();
}

bool MiniaudioCaptureSource::isCapturing() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capturing;
}

void MiniaudioCaptureSource::onCaptureFrames(const float* frames, uint32_t frameCount) {
    const size_t chunkFrames = static_cast<size_t>(m_options.sampleRate) * m_options.chunkMs / 1000;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_capturing) return;
        m_accum.insert(m_accum.end(), frames, frames + frameCount);
        while (m_accum.size() >= chunkFrames) {
            types::AudioChunk chunk;
            chunk.sourceName = m_options.sourceName;
            chunk.sampleRate = m_options.sampleRate;
            chunk.samples.assign(m_accum.begin(), m_accum.begin() + static_cast<std::ptrdiff_t>(chunkFrames));
            m_accum.erase(m_accum.begin(), m_accum.begin() + static_cast<std::ptrdiff_t>(chunkFrames));
            // 块结束于当前时刻
            chunk.capturedAt = types::nowTimestamp() - std::chrono::milliseconds(chunk.durationMs());
            m_queue.push_back(std::move(chunk));
        }
    }
    m_cv.notify_one();
}

void MiniaudioCaptureSource::deliveryLoop() {
    while (true) {
        types::AudioChunk chunk;
        ChunkCallback cb;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopRequested || !m_queue.empty(); });
            if (m_stopRequested) break;
            chunk = std::move(m_queue.front());
            m_queue.pop_front();
            cb = m_callback;
        }
        if (cb) cb(std::move(chunk));
    }
}

// ========== WAV 写入 ==========

bool writeWavFile(const std::string& path, const std::vector<float>& samples, uint32_t sampleRate, ErrorInfo* err) {
    ma_encoder_config encCfg = ma_encoder_config_init(ma_encoding_format_wav, ma_format_f32, 1, sampleRate);
    ma_encoder encoder;
    if (ma_encoder_init_file(path.c_str(), &encCfg, &encoder) != MA_SUCCESS) {
        if (err) *err = ErrorInfo::make(ErrorType::SensingError, "Failed to open WAV for write: " + path);
        return false;
    }
    ma_uint64 framesWritten = 0;
    const auto result = ma_encoder_write_pcm_frames(&encoder, samples.data(), samples.size(), &framesWritten);
    ma_encoder_uninit(&encoder);
    if (result != MA_SUCCESS || framesWritten != samples.size()) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::SensingError, "Failed to write WAV frames",
                                   nlohmann::json{{"path", path}, {"written", framesWritten}});
        }
        return false;
    }
    return true;
}

// ========== CommandTranscriber ==========

CommandTranscriber::CommandTranscriber(std::string commandTemplate, std::string tempDir)
    : m_commandTemplate(std::move(commandTemplate))
    , m_tempDir(std::move(tempDir))
{
    if (m_tempDir.empty()) {
        std::error_code ec;
        const auto tmp = std::filesystem::temp_directory_path(ec);
        m_tempDir = ec ? std::string(".") : tmp.string();
    }
}

std::string CommandTranscriber::makeTempPath() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto stamp = types::toUnixMillis(types::nowTimestamp());
    return (std::filesystem::path(m_tempDir) /
            ("delo_utterance_" + std::to_string(stamp) + "_" + std::to_string(m_counter++) + ".wav")).string();
}

std::optional<std::string> CommandTranscriber::transcribe(const types::AudioChunk& chunk, ErrorInfo* err) {
    if (m_commandTemplate.empty()) {
        if (err) *err = ErrorInfo::make(ErrorType::SensingError, "No transcription command configured");
        return std::nullopt;
    }
    const auto path = makeTempPath();
    if (!writeWavFile(path, chunk.samples, chunk.sampleRate, err)) return std::nullopt;

    auto res = runCommand(fillTemplate(m_commandTemplate, "file", shellQuote(path)), err);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (!res.has_value()) return std::nullopt;
    if (res->exitCode != 0) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::SensingError, "Transcription command failed",
                                   nlohmann::json{{"exit_code", res->exitCode}});
        }
        return std::nullopt;
    }
    return trimCopy(res->output);
}

} // namespace delo::ambient::utils
