#include "delo/ambient/AssistantConfig.h"

namespace delo::ambient {

namespace {

template <typename T>
T readOr(const ConfigManager& cfg, const std::string& keyPath, T fallback) {
    auto v = cfg.get(keyPath);
    if (!v.has_value() || v->is_null()) return fallback;
    try {
        return v->get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

std::optional<int> readHour(const ConfigManager& cfg, const std::string& keyPath) {
    const int h = readOr<int>(cfg, keyPath, -1);
    if (h < 0 || h > 23) return std::nullopt;
    return h;
}

} // namespace

AssistantConfig AssistantConfig::fromConfig(const ConfigManager& cfg) {
    AssistantConfig c;
    c.ultraLightweight = readOr<bool>(cfg, "ultra_lightweight", c.ultraLightweight);

    const auto platform = readOr<std::string>(cfg, "platform", "auto");
    if (platform == "macos") c.platform = Platform::MacOS;
    else if (platform == "windows") c.platform = Platform::Windows;
    else if (platform == "linux") c.platform = Platform::Linux;

    c.screenSampleIntervalMs = readOr<uint32_t>(cfg, "perception.screen_sample_interval_ms", c.screenSampleIntervalMs);
    c.screenDiffThreshold = readOr<double>(cfg, "perception.screen_diff_threshold", c.screenDiffThreshold);
    c.audioSilenceTimeoutMs = readOr<uint32_t>(cfg, "perception.audio_silence_timeout_ms", c.audioSilenceTimeoutMs);
    c.minUtteranceMs = readOr<uint32_t>(cfg, "perception.min_utterance_ms", c.minUtteranceMs);
    c.volumeThreshold = readOr<float>(cfg, "perception.volume_threshold", c.volumeThreshold);
    c.transcribeWindowMs = readOr<uint32_t>(cfg, "perception.transcribe_window_ms", c.transcribeWindowMs);
    c.perceptionMaxHistory = readOr<size_t>(cfg, "perception.max_history", c.perceptionMaxHistory);

    c.quietHoursStart = readHour(cfg, "context.quiet_hours_start");
    c.quietHoursEnd = readHour(cfg, "context.quiet_hours_end");
    if (!c.quietHoursStart.has_value() || !c.quietHoursEnd.has_value()) {
        c.quietHoursStart.reset();
        c.quietHoursEnd.reset();
    }
    c.contextMaxHistory = readOr<size_t>(cfg, "context.max_history", c.contextMaxHistory);

    c.clarifierTimeoutMs = readOr<uint32_t>(cfg, "router.clarifier_timeout_ms", c.clarifierTimeoutMs);
    c.confirmationTtlMs = readOr<uint32_t>(cfg, "router.confirmation_ttl_ms", c.confirmationTtlMs);
    c.fuzzyThreshold = readOr<double>(cfg, "router.fuzzy_threshold", c.fuzzyThreshold);

    c.historyMaxEntries = readOr<size_t>(cfg, "history.max_entries", c.historyMaxEntries);
    c.historyPath = readOr<std::string>(cfg, "history.path", c.historyPath);

    c.textCommand = readOr<std::string>(cfg, "capture.text_command", "");
    c.transcribeCommand = readOr<std::string>(cfg, "capture.transcribe_command", "");
    c.completionCommand = readOr<std::string>(cfg, "capture.completion_command", "");
    c.microphoneEnabled = readOr<bool>(cfg, "capture.microphone_enabled", false);

    if (auto lv = ErrorHandler::parseLogLevel(readOr<std::string>(cfg, "logging.min_level", "warning"))) {
        c.logLevel = *lv;
    }
    return c;
}

} // namespace delo::ambient
