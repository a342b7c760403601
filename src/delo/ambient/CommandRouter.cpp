#include "delo/ambient/CommandRouter.h"

#include "delo/ambient/CommandCatalog.h"
#include "delo/ambient/utils/TextMatch.h"

#include <algorithm>
#include <future>
#include <initializer_list>
#include <iomanip>
#include <set>
#include <sstream>
#include <thread>

namespace delo::ambient {

using types::Clarification;
using types::FallbackRequest;
using types::Intent;
using types::IntentCategory;
using types::MatchStrategy;
using types::RoutingOutcome;

namespace {

constexpr float kFuzzyScale = 0.9f;
constexpr float kDefaultClarifierConfidence = 0.5f;

std::string joinWords(const std::vector<std::string>& words, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end && i < words.size(); ++i) {
        if (!out.empty()) out.push_back(' ');
        out += words[i];
    }
    return out;
}

// 去掉首尾的虚词，例如 "for react tutorial please" -> "react tutorial"
std::string stripFiller(const std::string& text, const std::set<std::string>& leading) {
    static const std::set<std::string> trailing = {"please", "now"};
    static const std::vector<std::string> trailingPhrases = {"on youtube", "in youtube", "on google",
                                                             "on the web", "online"};
    auto words = utils::splitWords(text);
    size_t begin = 0;
    while (begin < words.size() && leading.count(words[begin])) ++begin;
    words.erase(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(begin));

    bool changed = true;
    while (changed && !words.empty()) {
        changed = false;
        if (trailing.count(words.back())) {
            words.pop_back();
            changed = true;
            continue;
        }
        const auto joined = joinWords(words, 0, words.size());
        for (const auto& p : trailingPhrases) {
            const auto pw = utils::splitWords(p);
            if (words.size() >= pw.size() && joined.size() >= p.size() &&
                joined.compare(joined.size() - p.size(), p.size(), p) == 0) {
                words.resize(words.size() - pw.size());
                changed = true;
                break;
            }
        }
    }
    return joinWords(words, 0, words.size());
}

// 命中短语/词之后的文本；之后为空时取之前的文本
std::string remainderAround(const std::string& before, const std::string& after) {
    const auto a = utils::trimCopy(after);
    if (!a.empty()) return a;
    return utils::trimCopy(before);
}

std::string formatConfidence(float v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

} // namespace

// ========== 结果序列化 ==========

nlohmann::json RouteResult::toJson() const {
    nlohmann::json j{
        {"intent", intent.toJson()},
        {"outcome", types::routingOutcomeToString(outcome)},
        {"message", message},
    };
    if (clarification.has_value()) j["clarification"] = clarification->toJson();
    if (requestId.has_value()) j["request_id"] = *requestId;
    if (fallback.has_value()) j["fallback"] = fallback->toJson();
    return j;
}

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json j{
        {"intent", intent.toJson()},
        {"result", action.toJson()},
    };
    if (fallback.has_value()) j["fallback"] = fallback->toJson();
    return j;
}

std::string CommandResult::summary() const {
    if (execution.has_value()) {
        if (execution->fallback.has_value()) return execution->fallback->message;
        return execution->action.message;
    }
    if (needsConfirmation() && route.clarification.has_value()) {
        return "Did you mean: " + route.clarification->clarifiedIntent + "? Reply yes to proceed.";
    }
    if (route.fallback.has_value()) return route.fallback->message;
    return route.message;
}

nlohmann::json CommandResult::toJson() const {
    nlohmann::json result{
        {"route", route.toJson()},
        {"needs_confirmation", needsConfirmation()},
        {"summary", summary()},
    };
    if (execution.has_value()) result["execution"] = execution->toJson();
    nlohmann::json j{
        {"success", success},
        {"result", std::move(result)},
    };
    if (error.has_value()) j["error"] = *error;
    return j;
}

nlohmann::json ConfirmationResult::toJson() const {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& r : results) {
        steps.push_back(nlohmann::json{
            {"step", r.step},
            {"action_type", types::intentCategoryToString(r.category)},
            {"result", r.execution.toJson()},
        });
    }
    return nlohmann::json{
        {"success", success},
        {"executed", executed},
        {"message", message},
        {"original_command", originalCommand},
        {"results", std::move(steps)},
    };
}

// ========== 构造与注册 ==========

CommandRouter::CommandRouter(const FallbackResolver& fallback, const ErrorHandler& logger, Options options)
    : m_fallback(fallback)
    , m_logger(logger)
    , m_options(options)
{}

void CommandRouter::setClarifier(std::shared_ptr<Clarifier> clarifier) {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    m_clarifier = std::move(clarifier);
}

void CommandRouter::registerHandler(IntentCategory category, std::shared_ptr<ActionHandler> handler) {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    if (handler) {
        m_handlers[category] = std::move(handler);
    } else {
        m_handlers.erase(category);
    }
}

bool CommandRouter::unregisterHandler(IntentCategory category) {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    return m_handlers.erase(category) > 0;
}

bool CommandRouter::hasHandler(IntentCategory category) const {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    return m_handlers.count(category) > 0;
}

// ========== 本地匹配 ==========

float CommandRouter::extractArgs(Intent& intent, const std::string& remainder) const {
    static const std::set<std::string> commonLeading = {"for", "about", "on", "up", "please", "me"};
    static const std::set<std::string> openLeading = {"the", "app", "application", "my", "up", "please"};

    auto& args = intent.extractedArgs;
    switch (intent.category) {
        case IntentCategory::Open: {
            const auto target = stripFiller(remainder, openLeading);
            if (target.empty()) return 1.0f;
            args["target"] = target;
            if (auto match = catalog::resolveApp(target, m_options.fuzzyThreshold)) {
                args["app"] = match->app.id;
                args["app_name"] = match->app.displayName;
                args["app_match"] = match->similarity;
                return static_cast<float>(match->similarity);
            }
            return 1.0f;
        }
        case IntentCategory::Search:
        case IntentCategory::YouTube: {
            const auto query = stripFiller(remainder, commonLeading);
            if (!query.empty()) args["query"] = query;
            return 1.0f;
        }
        case IntentCategory::Email: {
            auto words = utils::splitWords(stripFiller(remainder, {"to", "a", "an", "please"}));
            auto findWord = [&words](std::initializer_list<const char*> keys) {
                for (size_t i = 0; i < words.size(); ++i) {
                    for (const char* k : keys) {
                        if (words[i] == k) return i;
                    }
                }
                return words.size();
            };
            const size_t about = findWord({"about", "regarding", "subject"});
            const size_t saying = findWord({"saying", "body", "message"});
            const size_t recipientEnd = std::min(about, saying);
            if (recipientEnd > 0 && recipientEnd <= 3) {
                args["recipient"] = joinWords(words, 0, recipientEnd);
            }
            if (about < words.size()) args["subject"] = joinWords(words, about + 1, saying > about ? saying : words.size());
            if (saying < words.size()) args["body"] = joinWords(words, saying + 1, words.size());
            return 1.0f;
        }
        default: {
            const auto text = stripFiller(remainder, commonLeading);
            if (!text.empty()) args["text"] = text;
            return 1.0f;
        }
    }
}

std::optional<Intent> CommandRouter::matchLocally(const std::string& rawCommand) const {
    const auto normalized = utils::normalizeCommand(rawCommand);
    if (normalized.empty()) return std::nullopt;

    // (1) 精确短语
    if (auto hit = catalog::matchPhrase(normalized)) {
        Intent intent;
        intent.category = hit->category;
        intent.functionName = types::intentCategoryToString(hit->category);
        intent.confidence = 1.0f;
        intent.rawCommand = rawCommand;
        intent.strategy = MatchStrategy::Exact;
        extractArgs(intent, remainderAround(normalized.substr(0, hit->position),
                                            normalized.substr(hit->position + hit->phrase.size())));
        return intent;
    }

    // (2) 同义词 / 模糊
    if (auto hit = catalog::matchSynonym(normalized, m_options.fuzzyThreshold)) {
        const auto words = utils::splitWords(normalized);
        Intent intent;
        intent.category = hit->category;
        intent.functionName = types::intentCategoryToString(hit->category);
        intent.rawCommand = rawCommand;
        intent.strategy = MatchStrategy::Fuzzy;
        const float appFactor = extractArgs(intent, remainderAround(joinWords(words, 0, hit->wordIndex),
                                                                    joinWords(words, hit->wordIndex + 1, words.size())));
        intent.confidence = kFuzzyScale * static_cast<float>(hit->similarity) * appFactor;
        intent.extractedArgs["matched_synonym"] = hit->synonym;
        return intent;
    }
    return std::nullopt;
}

// ========== Clarifier ==========

CommandRouter::ClarifyOutcome CommandRouter::clarifyBounded(const std::string& command,
                                                            const std::string& context) const {
    std::shared_ptr<Clarifier> clarifier;
    {
        std::lock_guard<std::mutex> lock(m_handlersMutex);
        clarifier = m_clarifier;
    }
    ClarifyOutcome outcome;
    if (!clarifier) {
        outcome.err = ErrorInfo::make(ErrorType::ExternalServiceError, "No clarifier configured");
        return outcome;
    }

    // 独立线程执行，超时后放弃等待；线程持有 clarifier、promise 与计数器的共享所有权
    outcome.attempted = true;
    auto inflight = m_inflightClarifications;
    const uint32_t running = inflight->fetch_add(1);
    if (running >= m_options.maxInflightClarifications) {
        inflight->fetch_sub(1);
        outcome.err = ErrorInfo::make(ErrorType::ExternalServiceError,
                                      "Clarifier busy: " + std::to_string(running) + " call(s) still running");
        return outcome;
    }

    auto promise = std::make_shared<std::promise<ClarifyOutcome>>();
    auto future = promise->get_future();
    std::thread([clarifier, promise, inflight, command, context]() {
        ClarifyOutcome out;
        out.attempted = true;
        out.err = ErrorInfo::make(ErrorType::ExternalServiceError, "Clarifier returned no result");
        try {
            out.clarification = clarifier->clarify(command, context, &out.err);
        } catch (const std::exception& e) {
            out.clarification.reset();
            out.err = ErrorInfo::make(ErrorType::ExternalServiceError, std::string("Clarifier threw: ") + e.what());
        }
        inflight->fetch_sub(1);
        promise->set_value(std::move(out));
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(m_options.clarifierTimeoutMs)) != std::future_status::ready) {
        const uint64_t abandoned = ++m_abandonedClarifications;
        m_logger.log(ErrorHandler::LogLevel::Warning,
                     "CommandRouter: abandoned slow clarifier call (total " + std::to_string(abandoned) + ", running " +
                         std::to_string(inflight->load()) + ")");
        outcome.err = ErrorInfo::make(ErrorType::TimeoutError,
                                      "Clarifier did not answer within " +
                                          std::to_string(m_options.clarifierTimeoutMs) + " ms");
        return outcome;
    }
    return future.get();
}

uint32_t CommandRouter::inflightClarifications() const {
    return m_inflightClarifications->load();
}

uint64_t CommandRouter::abandonedClarifications() const {
    return m_abandonedClarifications.load();
}

std::optional<Intent> CommandRouter::intentFromClarification(const Clarification& c,
                                                             const std::string& rawCommand) const {
    std::optional<Intent> local = matchLocally(c.clarifiedIntent);
    if (!local.has_value() && !c.actionSteps.empty()) local = matchLocally(c.actionSteps.front());
    if (!local.has_value()) return std::nullopt;

    Intent intent = *local;
    intent.rawCommand = rawCommand;
    intent.strategy = MatchStrategy::Clarifier;
    intent.confidence = std::clamp(c.confidence.value_or(kDefaultClarifierConfidence), 0.0f, 1.0f);
    return intent;
}

types::FallbackResponse CommandRouter::unresolvedFallback(const std::string& rawCommand) const {
    return m_fallback.resolve(FallbackRequest::unknownAction(rawCommand));
}

// ========== 路由 ==========

RouteResult CommandRouter::route(const std::string& rawCommand,
                                 const types::SessionId& sessionId,
                                 const std::string& context) {
    RouteResult result;
    result.intent.rawCommand = rawCommand;
    result.intent.functionName = types::intentCategoryToString(IntentCategory::Unknown);

    if (utils::trimCopy(rawCommand).empty()) {
        result.outcome = RoutingOutcome::Unresolved;
        result.message = "Empty command";
        result.fallback = unresolvedFallback(rawCommand);
        recordRouting(result);
        return result;
    }

    if (auto local = matchLocally(rawCommand)) {
        result.intent = *local;
        result.outcome = RoutingOutcome::Resolved;
        result.message = "Matched " + local->functionName + " (" + types::matchStrategyToString(local->strategy) +
                         ", confidence " + formatConfidence(local->confidence) + ")";
        m_logger.log(ErrorHandler::LogLevel::Debug, "CommandRouter: \"" + rawCommand + "\" -> " + result.message);
        recordRouting(result);
        return result;
    }

    auto outcome = clarifyBounded(rawCommand, context);
    if (!outcome.clarification.has_value()) {
        if (outcome.attempted) {
            m_logger.log(ErrorHandler::LogLevel::Warning, "CommandRouter: clarification unavailable", outcome.err);
        }
        result.outcome = RoutingOutcome::Unresolved;
        result.message = "Could not understand \"" + rawCommand + "\": " + outcome.err.message;
        result.fallback = unresolvedFallback(rawCommand);
        recordRouting(result);
        return result;
    }

    if (auto intent = intentFromClarification(*outcome.clarification, rawCommand)) {
        result.intent = *intent;
    } else {
        result.intent.strategy = MatchStrategy::Clarifier;
        result.intent.confidence =
            std::clamp(outcome.clarification->confidence.value_or(kDefaultClarifierConfidence), 0.0f, 1.0f);
    }
    result.outcome = RoutingOutcome::NeedsConfirmation;
    result.clarification = outcome.clarification;
    result.message = "Clarified as: " + outcome.clarification->clarifiedIntent;

    PendingConfirmation pending;
    pending.sessionId = sessionId;
    pending.originalCommand = rawCommand;
    pending.context = context;
    pending.clarification = *outcome.clarification;
    result.requestId = storePending(std::move(pending));

    recordRouting(result);
    return result;
}

ExecutionResult CommandRouter::execute(const Intent& intent) {
    ExecutionResult r;
    r.intent = intent;

    std::shared_ptr<ActionHandler> handler;
    {
        std::lock_guard<std::mutex> lock(m_handlersMutex);
        auto it = m_handlers.find(intent.category);
        if (it != m_handlers.end()) handler = it->second;
    }

    if (!handler) {
        r.action.success = false;
        r.action.message = "No handler available for \"" + intent.functionName + "\"";
        r.action.fallback = FallbackRequest::missingScript(intent.rawCommand.empty() ? intent.functionName
                                                                                      : intent.rawCommand);
    } else {
        try {
            r.action = handler->run(intent);
        } catch (const std::exception& e) {
            r.action = ActionResult{};
            r.action.success = false;
            r.action.message = std::string("Action failed: ") + e.what();
            m_logger.log(ErrorHandler::LogLevel::Error, "CommandRouter: handler threw",
                         ErrorInfo::make(ErrorType::UnknownError, e.what(), intent.toJson()));
        }
    }

    if (!r.action.success && r.action.fallback.has_value()) {
        r.fallback = m_fallback.resolve(*r.action.fallback);
        m_logger.log(ErrorHandler::LogLevel::Info,
                     "CommandRouter: fallback " + types::fallbackReasonToString(r.action.fallback->reason()) +
                         " -> " + types::fallbackActionToString(r.fallback->action));
    }
    return r;
}

CommandResult CommandRouter::executeCommand(const std::string& rawCommand,
                                            const types::SessionId& sessionId,
                                            const std::string& context) {
    CommandResult out;
    out.route = route(rawCommand, sessionId, context);
    switch (out.route.outcome) {
        case RoutingOutcome::Resolved:
            out.execution = execute(out.route.intent);
            out.success = out.execution->succeeded();
            if (!out.success) out.error = out.execution->action.message;
            break;
        case RoutingOutcome::NeedsConfirmation:
            out.success = true;
            break;
        case RoutingOutcome::Unresolved:
            out.success = false;
            out.error = out.route.message;
            break;
    }
    return out;
}

// ========== 二次确认 ==========

bool CommandRouter::isAffirmative(const std::string& confirmation) {
    static const std::set<std::string> accepted = {"yes", "y", "ok", "confirm", "go ahead", "proceed"};
    auto text = utils::normalizeCommand(confirmation);
    while (!text.empty() && (text.back() == '.' || text.back() == '!')) text.pop_back();
    return accepted.count(text) > 0;
}

void CommandRouter::dropExpiredLocked(std::chrono::steady_clock::time_point now) {
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        if (it->second.expiresAt <= now) {
            auto s = m_pendingBySession.find(it->second.sessionId);
            if (s != m_pendingBySession.end() && s->second == it->first) m_pendingBySession.erase(s);
            it = m_pending.erase(it);
        } else {
            ++it;
        }
    }
}

types::RequestId CommandRouter::storePending(PendingConfirmation pending) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    dropExpiredLocked(now);

    pending.requestId = "req-" + std::to_string(++m_requestCounter) + "-" +
                        std::to_string(types::toUnixMillis(types::nowTimestamp()));
    pending.expiresAt = now + std::chrono::milliseconds(m_options.confirmationTtlMs);

    // 每个会话只保留一个待确认请求
    auto s = m_pendingBySession.find(pending.sessionId);
    if (s != m_pendingBySession.end()) {
        m_pending.erase(s->second);
        m_logger.log(ErrorHandler::LogLevel::Debug, "CommandRouter: replaced pending confirmation " + s->second);
    }
    const auto id = pending.requestId;
    m_pendingBySession[pending.sessionId] = id;
    m_pending.emplace(id, std::move(pending));
    return id;
}

bool CommandRouter::cancelPending(const types::RequestId& requestId) {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    auto it = m_pending.find(requestId);
    if (it == m_pending.end()) return false;
    auto s = m_pendingBySession.find(it->second.sessionId);
    if (s != m_pendingBySession.end() && s->second == requestId) m_pendingBySession.erase(s);
    m_pending.erase(it);
    return true;
}

std::optional<types::RequestId> CommandRouter::pendingRequestFor(const types::SessionId& sessionId) const {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    auto s = m_pendingBySession.find(sessionId);
    if (s == m_pendingBySession.end()) return std::nullopt;
    auto it = m_pending.find(s->second);
    if (it == m_pending.end() || it->second.expiresAt <= std::chrono::steady_clock::now()) return std::nullopt;
    return s->second;
}

size_t CommandRouter::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    return m_pending.size();
}

ConfirmationResult CommandRouter::confirmAndExecute(const types::RequestId& requestId,
                                                    const std::string& confirmation) {
    std::optional<PendingConfirmation> pending;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        dropExpiredLocked(std::chrono::steady_clock::now());
        auto it = m_pending.find(requestId);
        if (it != m_pending.end()) {
            pending = std::move(it->second);
            auto s = m_pendingBySession.find(pending->sessionId);
            if (s != m_pendingBySession.end() && s->second == requestId) m_pendingBySession.erase(s);
            m_pending.erase(it);
        }
    }

    if (!pending.has_value()) {
        ConfirmationResult r;
        r.success = false;
        r.executed = false;
        r.message = "No pending confirmation for request " + requestId + " (expired or already handled)";
        return r;
    }
    return confirmAndExecute(confirmation, pending->clarification, pending->originalCommand, pending->context);
}

ConfirmationResult CommandRouter::confirmAndExecute(const std::string& confirmation,
                                                    const Clarification& clarification,
                                                    const std::string& originalCommand,
                                                    const std::string& context) {
    if (!isAffirmative(confirmation)) {
        ConfirmationResult r;
        r.success = true;
        r.executed = false;
        r.message = "Execution cancelled by user";
        r.originalCommand = originalCommand;
        m_logger.log(ErrorHandler::LogLevel::Info, "CommandRouter: user declined \"" + originalCommand + "\"");
        return r;
    }
    return runConfirmedSteps(clarification, originalCommand, context);
}

ConfirmationResult CommandRouter::runConfirmedSteps(const Clarification& clarification,
                                                    const std::string& originalCommand,
                                                    const std::string& context) {
    std::vector<std::string> steps = clarification.actionSteps;
    if (steps.empty() && !clarification.clarifiedIntent.empty()) steps.push_back(clarification.clarifiedIntent);
    if (steps.empty()) steps.push_back(originalCommand);

    ConfirmationResult out;
    out.executed = true;
    out.originalCommand = originalCommand;
    const auto ctx = utils::trimCopy(context);

    size_t succeeded = 0;
    for (const auto& step : steps) {
        ConfirmationResult::StepResult sr;
        sr.step = step;

        auto intent = matchLocally(step);
        if (!intent.has_value()) {
            sr.execution.intent.rawCommand = step;
            sr.execution.intent.functionName = types::intentCategoryToString(IntentCategory::Unknown);
            sr.execution.action.success = false;
            sr.execution.action.message = "Could not interpret step \"" + step + "\"";
            sr.execution.fallback = unresolvedFallback(step);
            out.results.push_back(std::move(sr));
            continue;
        }

        intent->strategy = MatchStrategy::Clarifier;
        // 步骤未给出参数时，使用上下文（例如剪贴板内容）
        if (!ctx.empty()) {
            auto& args = intent->extractedArgs;
            const bool wantsQuery =
                intent->category == IntentCategory::Search || intent->category == IntentCategory::YouTube;
            if (wantsQuery && !args.contains("query")) args["query"] = ctx;
            if (!wantsQuery && intent->category != IntentCategory::Open && !args.contains("text")) args["text"] = ctx;
        }

        sr.category = intent->category;
        sr.execution = execute(*intent);
        if (sr.execution.succeeded()) succeeded++;
        out.results.push_back(std::move(sr));
    }

    out.success = succeeded == steps.size();
    out.message = "Executed " + std::to_string(succeeded) + " of " + std::to_string(steps.size()) + " step(s)";
    m_logger.log(ErrorHandler::LogLevel::Info, "CommandRouter: confirmed \"" + originalCommand + "\": " + out.message);
    return out;
}

// ========== 路由记录 ==========

void CommandRouter::recordRouting(const RouteResult& result) {
    {
        std::lock_guard<std::mutex> lock(m_historyMutex);
        RoutingRecord rec;
        rec.timestamp = std::chrono::system_clock::now();
        rec.command = result.intent.rawCommand;
        rec.category = result.intent.category;
        rec.strategy = result.intent.strategy;
        rec.confidence = result.intent.confidence;
        rec.outcome = result.outcome;
        m_routingHistory.push_back(std::move(rec));

        // 限制历史记录大小
        if (m_routingHistory.size() > kMaxHistorySize) {
            m_routingHistory.erase(m_routingHistory.begin(),
                                   m_routingHistory.begin() +
                                       static_cast<std::ptrdiff_t>(m_routingHistory.size() - kMaxHistorySize));
        }
    }

    std::lock_guard<std::mutex> statsLock(m_statsMutex);
    m_routingStats[types::intentCategoryToString(result.intent.category)]++;
    m_routingStats["strategy." + types::matchStrategyToString(result.intent.strategy)]++;
    m_routingStats["outcome." + types::routingOutcomeToString(result.outcome)]++;
}

std::vector<RoutingRecord> CommandRouter::getRoutingHistory(size_t maxCount) const {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    if (maxCount == 0 || maxCount >= m_routingHistory.size()) return m_routingHistory;
    return std::vector<RoutingRecord>(m_routingHistory.end() - static_cast<std::ptrdiff_t>(maxCount),
                                      m_routingHistory.end());
}

void CommandRouter::clearRoutingHistory() {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    m_routingHistory.clear();
}

std::unordered_map<std::string, uint64_t> CommandRouter::getRoutingStatistics() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_routingStats;
}

} // namespace delo::ambient
