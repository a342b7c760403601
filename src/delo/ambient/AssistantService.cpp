#include "delo/ambient/AssistantService.h"

#include "delo/ambient/ActionHandlers.h"
#include "delo/ambient/CommandCatalog.h"
#include "delo/ambient/RecordStore.h"
#include "delo/ambient/utils/TextMatch.h"

namespace delo::ambient {

using types::AudioSession;
using types::ContextSnapshot;
using types::ScreenSnapshot;
using types::Trigger;

namespace {

FallbackResolver::Options fallbackOptionsFor(const AssistantConfig& cfg) {
    FallbackResolver::Options o;
    o.platform = cfg.platform;
    return o;
}

CommandRouter::Options routerOptionsFor(const AssistantConfig& cfg) {
    CommandRouter::Options o;
    o.clarifierTimeoutMs = cfg.clarifierTimeoutMs;
    o.confirmationTtlMs = cfg.confirmationTtlMs;
    o.fuzzyThreshold = cfg.fuzzyThreshold;
    return o;
}

CommandHistory::Options historyOptionsFor(const AssistantConfig& cfg) {
    CommandHistory::Options o;
    o.maxEntries = cfg.historyMaxEntries;
    o.path = cfg.historyPath;
    return o;
}

ScreenSentinel::Options screenOptionsFor(const AssistantConfig& cfg) {
    ScreenSentinel::Options o;
    o.sampleIntervalMs = cfg.screenSampleIntervalMs;
    o.diffThreshold = cfg.screenDiffThreshold;
    o.maxHistory = cfg.perceptionMaxHistory;
    return o;
}

AudioSentinel::Options audioOptionsFor(const AssistantConfig& cfg) {
    AudioSentinel::Options o;
    o.volumeThreshold = cfg.volumeThreshold;
    o.silenceTimeoutMs = cfg.audioSilenceTimeoutMs;
    o.minUtteranceMs = cfg.minUtteranceMs;
    o.transcribeWindowMs = cfg.transcribeWindowMs;
    o.maxHistory = cfg.perceptionMaxHistory;
    return o;
}

std::string contextTextOf(const ContextSnapshot& snapshot) {
    std::string text;
    if (!snapshot.appName.empty()) text = "Active app: " + snapshot.appName;
    if (snapshot.screenSnapshot.has_value() && !snapshot.screenSnapshot->windowTitle.empty()) {
        if (!text.empty()) text += "; ";
        text += "Window: " + snapshot.screenSnapshot->windowTitle;
    }
    if (snapshot.audioSession.has_value() && !snapshot.audioSession->transcript.empty()) {
        if (!text.empty()) text += "; ";
        text += "Heard: " + snapshot.audioSession->transcript;
    }
    return text;
}

} // namespace

AssistantService::AssistantService(AssistantConfig config, Capabilities caps, ErrorHandler& logger)
    : m_config(std::move(config))
    , m_logger(logger)
    , m_records(caps.recordStore ? caps.recordStore : std::make_shared<InMemoryRecordStore>())
    , m_fallback(caps.urlOpener, logger, fallbackOptionsFor(m_config))
    , m_router(m_fallback, logger, routerOptionsFor(m_config))
    , m_history(logger, historyOptionsFor(m_config))
    , m_context(logger, ContextEngine::Options{m_config.contextMaxHistory})
    , m_screen(m_filters, caps.screenCapture, caps.textExtractor, logger, screenOptionsFor(m_config))
    , m_audio(m_filters, caps.transcriber, logger, audioOptionsFor(m_config))
    , m_dispatcher([this](const Trigger& trigger) { handleTrigger(trigger); }, logger)
{
    if (caps.clarifier) m_router.setClarifier(caps.clarifier);
    if (caps.registerBuiltinHandlers) {
        registerBuiltinHandlers(m_router, caps.urlOpener, caps.appLauncher, caps.completionClient,
                                [this]() { return m_context.currentSnapshot(); });
    }
    if (caps.audioSource) m_audio.setAudioSource(caps.audioSource);

    m_screen.setSnapshotCallback([this](const ScreenSnapshot& s) { onScreenSnapshot(s); });
    m_audio.setSessionCallback([this](const AudioSession& s) { onAudioSession(s); });
    m_context.setTriggerCallback([this](const Trigger& t) { onTrigger(t); });
}

AssistantService::~AssistantService() {
    shutdown();
}

bool AssistantService::initialize(ErrorInfo* err) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_initialized) return true;

    bool ok = true;
    ErrorInfo localErr;
    if (!m_history.load(&localErr)) {
        ok = false;
        if (err) *err = localErr;
    }

    if (m_config.quietHoursStart.has_value() && m_config.quietHoursEnd.has_value()) {
        ErrorInfo quietErr;
        if (!m_context.setQuietHours(*m_config.quietHoursStart, *m_config.quietHoursEnd, &quietErr)) {
            m_logger.log(ErrorHandler::LogLevel::Warning, "AssistantService: ignoring configured quiet hours",
                         quietErr);
            if (ok && err) *err = quietErr;
            ok = false;
        }
    }

    m_dispatcher.start();
    m_initialized = true;
    m_logger.log(ErrorHandler::LogLevel::Info,
                 std::string("AssistantService initialized (platform=") + platformToString(m_config.platform) +
                     (m_config.ultraLightweight ? ", ultra-lightweight)" : ")"));
    return ok;
}

void AssistantService::shutdown() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    // 先停生产者，再排空 Trigger 队列
    m_screen.stop();
    m_audio.stop();
    m_context.stop();
    m_dispatcher.stop();
    if (m_initialized) {
        m_initialized = false;
        m_logger.log(ErrorHandler::LogLevel::Info, "AssistantService shut down");
    }
}

// ========== 命令 ==========

CommandResult AssistantService::executeCommand(const std::string& text, const types::SessionId& sessionId) {
    CommandResult result;
    try {
        result = m_router.executeCommand(text, sessionId, currentContextText());
    } catch (const std::exception& e) {
        m_logger.log(ErrorHandler::LogLevel::Error, "AssistantService: command failed",
                     ErrorInfo::make(ErrorType::UnknownError, e.what()));
        result.success = false;
        result.route.intent.rawCommand = text;
        result.error = std::string("Internal error: ") + e.what();
    }

    if (!utils::trimCopy(text).empty()) {
        recordHistory(text, result.success, result.summary());
    }
    saveRecord("command_results", nlohmann::json{
                                      {"command", text},
                                      {"session_id", sessionId},
                                      {"timestamp_ms", types::toUnixMillis(types::nowTimestamp())},
                                      {"result", result.toJson()},
                                  });
    return result;
}

ConfirmationResult AssistantService::confirmAndExecute(const types::RequestId& requestId,
                                                       const std::string& confirmation) {
    auto result = m_router.confirmAndExecute(requestId, confirmation);
    if (result.executed) recordHistory(result.originalCommand, result.success, result.message);
    return result;
}

ConfirmationResult AssistantService::confirmAndExecute(const std::string& confirmation,
                                                       const types::Clarification& clarification,
                                                       const std::string& originalCommand,
                                                       const std::string& context) {
    auto result = m_router.confirmAndExecute(confirmation, clarification, originalCommand, context);
    if (result.executed) recordHistory(result.originalCommand, result.success, result.message);
    return result;
}

std::vector<std::string> AssistantService::getCommandSuggestions(const std::string& partialText) const {
    return m_history.getCommandSuggestions(partialText, catalog::allPhrases());
}

std::vector<types::CommandHistoryEntry> AssistantService::getCommandHistory(size_t limit) const {
    return m_history.getCommandHistory(limit);
}

// ========== 感知生命周期 ==========

bool AssistantService::startScreenPerception() {
    if (m_config.ultraLightweight) {
        m_logger.log(ErrorHandler::LogLevel::Info, "Ultra-lightweight mode: screen perception disabled");
        return false;
    }
    return m_screen.start();
}

void AssistantService::stopScreenPerception() {
    m_screen.stop();
}

bool AssistantService::startAudioPerception() {
    if (m_config.ultraLightweight) {
        m_logger.log(ErrorHandler::LogLevel::Info, "Ultra-lightweight mode: audio perception disabled");
        return false;
    }
    return m_audio.start();
}

void AssistantService::stopAudioPerception() {
    m_audio.stop();
}

bool AssistantService::startContextManager() {
    m_context.start();
    return m_context.isActive();
}

void AssistantService::stopContextManager() {
    m_context.stop();
}

// ========== 规则注册 ==========

bool AssistantService::addScreenFilter(const types::AppFilter& filter, ErrorInfo* err) {
    return m_filters.addAppFilter(filter, err);
}

bool AssistantService::addAudioFilter(const types::AudioFilter& filter, ErrorInfo* err) {
    return m_filters.addAudioFilter(filter, err);
}

bool AssistantService::addContextPattern(const types::ContextPattern& pattern, ErrorInfo* err) {
    return m_context.addContextPattern(pattern, err);
}

bool AssistantService::setQuietHours(int startHour, int endHour, ErrorInfo* err) {
    return m_context.setQuietHours(startHour, endHour, err);
}

// ========== 查询 ==========

std::vector<ScreenSnapshot> AssistantService::getScreenSnapshots(size_t limit) const {
    return m_screen.getRecentSnapshots(limit);
}

std::vector<AudioSession> AssistantService::getAudioSessions(size_t limit) const {
    return m_audio.getRecentSessions(limit);
}

std::vector<ContextSnapshot> AssistantService::getContextSnapshots(size_t limit) const {
    return m_context.getContextSnapshots(limit);
}

std::vector<AudioSession> AssistantService::searchTranscripts(const std::string& query) const {
    return m_audio.searchTranscripts(query);
}

nlohmann::json AssistantService::getStatus() const {
    const auto screen = m_screen.getStats();
    const auto audio = m_audio.getStats();
    const auto dispatch = m_dispatcher.getStatistics();

    nlohmann::json routing = nlohmann::json::object();
    for (const auto& kv : m_router.getRoutingStatistics()) routing[kv.first] = kv.second;

    return nlohmann::json{
        {"platform", platformToString(m_config.platform)},
        {"ultra_lightweight", m_config.ultraLightweight},
        {"screen",
         {
             {"running", m_screen.isRunning()},
             {"ticks", screen.ticks},
             {"emitted", screen.emitted},
             {"skipped_filtered", screen.skippedFiltered},
             {"skipped_unchanged", screen.skippedUnchanged},
             {"failures", screen.failures},
         }},
        {"audio",
         {
             {"running", m_audio.isRunning()},
             {"capturing", m_audio.getState() == AudioSentinel::State::Capturing},
             {"chunks", audio.chunks},
             {"sessions_opened", audio.sessionsOpened},
             {"sessions_emitted", audio.sessionsEmitted},
             {"discarded_short", audio.discardedShort},
             {"discarded_by_keywords", audio.discardedByKeywords},
             {"transcription_failures", audio.transcriptionFailures},
         }},
        {"context", m_context.getStatus().toJson()},
        {"router",
         {
             {"pending_confirmations", m_router.pendingCount()},
             {"statistics", routing},
         }},
        {"triggers",
         {
             {"queued", dispatch.currentSize},
             {"enqueued", dispatch.totalEnqueued},
             {"dispatched", dispatch.totalDispatched},
             {"dropped", dispatch.totalDropped},
         }},
        {"history_entries", m_history.size()},
    };
}

bool AssistantService::waitForIdle(std::chrono::milliseconds timeout) {
    return m_dispatcher.waitUntilIdle(timeout);
}

// ========== 感知回调 ==========

void AssistantService::onScreenSnapshot(const ScreenSnapshot& snapshot) {
    saveRecord("screen_snapshots", snapshot.toJson());
    const auto fused = m_context.update(snapshot, std::nullopt);
    saveRecord("context_snapshots", fused.toJson());
}

void AssistantService::onAudioSession(const AudioSession& session) {
    saveRecord("audio_sessions", session.toJson());
    const auto fused = m_context.update(std::nullopt, session);
    saveRecord("context_snapshots", fused.toJson());
}

void AssistantService::onTrigger(const Trigger& trigger) {
    // 在感知线程上调用：只入队
    if (!m_dispatcher.isRunning()) {
        m_logger.log(ErrorHandler::LogLevel::Warning,
                     "AssistantService: trigger dispatcher not running, dropping " + trigger.patternName);
        return;
    }
    m_dispatcher.enqueue(trigger);
}

void AssistantService::handleTrigger(const Trigger& trigger) {
    const auto context = contextTextOf(trigger.snapshot);
    const auto sessionId = "trigger:" + trigger.patternName;

    for (const auto& action : trigger.triggerActions) {
        auto result = m_router.executeCommand(action, sessionId, context);
        if (result.needsConfirmation()) {
            m_logger.log(ErrorHandler::LogLevel::Info,
                         "Trigger " + trigger.patternName + ": \"" + action + "\" awaits confirmation");
        } else if (!result.success) {
            m_logger.log(ErrorHandler::LogLevel::Warning,
                         "Trigger " + trigger.patternName + ": \"" + action + "\" failed: " + result.summary());
        } else {
            m_logger.log(ErrorHandler::LogLevel::Info,
                         "Trigger " + trigger.patternName + ": \"" + action + "\" -> " + result.summary());
        }
        saveRecord("trigger_results", nlohmann::json{
                                          {"pattern_name", trigger.patternName},
                                          {"action", action},
                                          {"fired_at_ms", types::toUnixMillis(trigger.firedAt)},
                                          {"result", result.toJson()},
                                      });
    }
}

// ========== 内部 ==========

void AssistantService::saveRecord(const std::string& collection, const nlohmann::json& record) {
    ErrorInfo err;
    try {
        if (!m_records->save(collection, record, &err)) {
            m_logger.log(ErrorHandler::LogLevel::Warning, "AssistantService: failed to store " + collection, err);
        }
    } catch (const std::exception& e) {
        m_logger.log(ErrorHandler::LogLevel::Warning, "AssistantService: record store threw for " + collection,
                     ErrorInfo::make(ErrorType::ExternalServiceError, e.what()));
    }
}

void AssistantService::recordHistory(const std::string& command, bool success, const std::string& summary) {
    types::CommandHistoryEntry entry;
    entry.command = utils::trimCopy(command);
    entry.success = success;
    entry.timestamp = types::nowTimestamp();
    entry.resultSummary = summary;
    m_history.append(entry);
}

std::string AssistantService::currentContextText() const {
    auto snapshot = m_context.currentSnapshot();
    if (!snapshot.has_value()) return "";
    return contextTextOf(*snapshot);
}

} // namespace delo::ambient
