#include "delo/ambient/ContextEngine.h"

#include "delo/ambient/utils/TextMatch.h"

#include <ctime>

namespace delo::ambient {

using types::ContextPattern;
using types::ContextSnapshot;
using types::Trigger;

namespace {

int localHourNow() {
    const std::time_t t = std::time(nullptr);
    std::tm tmLocal{};
#if defined(_WIN32)
    localtime_s(&tmLocal, &t);
#else
    localtime_r(&t, &tmLocal);
#endif
    return tmLocal.tm_hour;
}

bool anyKeywordIn(const std::vector<std::string>& keywords, const std::string& text) {
    for (const auto& kw : keywords) {
        if (!kw.empty() && utils::containsIgnoreCase(text, kw)) return true;
    }
    return false;
}

// 意图关键字表：按顺序匹配，先命中者胜
struct IntentRule {
    const char* intent;
    std::vector<std::string> keywords;
};

const std::vector<IntentRule>& intentRules() {
    static const std::vector<IntentRule> rules = {
        {"email_composition", {"email", "compose", "reply", "send", "inbox"}},
        {"coding", {"code", "function", "debug", "compile", "programming"}},
        {"information_search", {"search", "find", "look up", "google"}},
        {"communication", {"chat", "message", "call", "meeting", "slack"}},
    };
    return rules;
}

} // namespace

ContextEngine::ContextEngine(const ErrorHandler& logger, Options options)
    : m_logger(logger)
    , m_options(options)
    , m_hourSource(localHourNow)
{
    if (m_options.maxHistory == 0) m_options.maxHistory = 1;
}

// ========== 模式管理 ==========

bool ContextEngine::isRegexForm(const std::string& windowPattern) {
    return windowPattern.size() >= 2 && windowPattern.front() == '/' && windowPattern.back() == '/';
}

bool ContextEngine::addContextPattern(const ContextPattern& pattern, ErrorInfo* err) {
    auto reject = [&](const std::string& message) {
        if (err) *err = ErrorInfo::make(ErrorType::InvalidConfig, message, pattern.toJson());
        m_logger.log(ErrorHandler::LogLevel::Warning, "ContextEngine: rejected pattern: " + message);
        return false;
    };

    if (utils::trimCopy(pattern.patternName).empty()) return reject("Pattern name must not be empty");
    if (pattern.triggerActions.empty()) return reject("Pattern requires at least one trigger action");
    for (const auto& a : pattern.triggerActions) {
        if (utils::trimCopy(a).empty()) return reject("Trigger action must not be empty");
    }

    PatternEntry entry;
    entry.pattern = pattern;
    if (isRegexForm(pattern.windowPattern)) {
        const auto expr = pattern.windowPattern.substr(1, pattern.windowPattern.size() - 2);
        try {
            entry.windowRegex = std::regex(expr, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            return reject(std::string("Invalid window pattern regex: ") + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& existing : m_patterns) {
        if (existing.pattern.patternName == pattern.patternName) {
            existing = std::move(entry);
            return true;
        }
    }
    m_patterns.push_back(std::move(entry));
    return true;
}

bool ContextEngine::removeContextPattern(const std::string& patternName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_patterns.begin(); it != m_patterns.end(); ++it) {
        if (it->pattern.patternName == patternName) {
            m_patterns.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<ContextPattern> ContextEngine::listPatterns() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ContextPattern> out;
    out.reserve(m_patterns.size());
    for (const auto& e : m_patterns) out.push_back(e.pattern);
    return out;
}

// ========== 免打扰 ==========

bool ContextEngine::isHourInWindow(int hour, int startHour, int endHour) {
    if (startHour == endHour) return false;
    if (startHour < endHour) return hour >= startHour && hour < endHour;
    return hour >= startHour || hour < endHour;
}

bool ContextEngine::setQuietHours(int startHour, int endHour, ErrorInfo* err) {
    if (startHour < 0 || startHour > 23 || endHour < 0 || endHour > 23) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::InvalidConfig, "Quiet hours must be within 0..23",
                                   nlohmann::json{{"start", startHour}, {"end", endHour}});
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_quietStart = startHour;
    m_quietEnd = endHour;
    return true;
}

void ContextEngine::clearQuietHours() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_quietStart.reset();
    m_quietEnd.reset();
}

bool ContextEngine::quietNowLocked() const {
    if (!m_quietStart.has_value() || !m_quietEnd.has_value() || !m_hourSource) return false;
    return isHourInWindow(m_hourSource(), *m_quietStart, *m_quietEnd);
}

bool ContextEngine::isQuietHours() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return quietNowLocked();
}

void ContextEngine::setHourSource(HourSource source) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hourSource = source ? std::move(source) : HourSource(localHourNow);
}

// ========== 生命周期 ==========

void ContextEngine::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_active = true;
}

void ContextEngine::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_active = false;
}

bool ContextEngine::isActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

void ContextEngine::setTriggerCallback(TriggerCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(cb);
}

// ========== 匹配 ==========

bool ContextEngine::matchesPattern(const PatternEntry& entry, const ContextSnapshot& snapshot) {
    const auto& p = entry.pattern;

    // (a) 应用
    if (!p.appName.empty() && p.appName != "*" && !utils::equalsIgnoreCase(p.appName, snapshot.appName)) {
        return false;
    }

    // (b) 窗口标题
    if (!p.windowPattern.empty()) {
        const std::string title = snapshot.screenSnapshot.has_value() ? snapshot.screenSnapshot->windowTitle : "";
        if (entry.windowRegex.has_value()) {
            if (!std::regex_search(title, *entry.windowRegex)) return false;
        } else if (!utils::containsIgnoreCase(title, p.windowPattern)) {
            return false;
        }
    }

    // (c) 关键字：任一列表命中即可
    if (p.audioKeywords.empty() && p.screenKeywords.empty()) return true;
    if (snapshot.audioSession.has_value() && anyKeywordIn(p.audioKeywords, snapshot.audioSession->transcript)) {
        return true;
    }
    if (snapshot.screenSnapshot.has_value() &&
        anyKeywordIn(p.screenKeywords, snapshot.screenSnapshot->extractedText)) {
        return true;
    }
    return false;
}

std::vector<Trigger> ContextEngine::collectTriggersLocked(const ContextSnapshot& snapshot) const {
    std::vector<Trigger> out;
    if (quietNowLocked()) return out;
    const auto now = types::nowTimestamp();
    for (const auto& entry : m_patterns) {
        if (!entry.pattern.isActive) continue;
        if (!matchesPattern(entry, snapshot)) continue;
        Trigger t;
        t.patternName = entry.pattern.patternName;
        t.triggerActions = entry.pattern.triggerActions;
        t.snapshot = snapshot;
        t.firedAt = now;
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<Trigger> ContextEngine::evaluate(const ContextSnapshot& snapshot) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return collectTriggersLocked(snapshot);
}

std::optional<std::string> ContextEngine::inferUserIntent(const std::string& text) {
    if (utils::trimCopy(text).empty()) return std::nullopt;
    for (const auto& rule : intentRules()) {
        for (const auto& kw : rule.keywords) {
            if (utils::findPhrase(utils::toLowerCopy(text), kw) != std::string::npos) return std::string(rule.intent);
        }
    }
    return std::nullopt;
}

ContextSnapshot ContextEngine::update(const std::optional<types::ScreenSnapshot>& screen,
                                      const std::optional<types::AudioSession>& audio,
                                      const std::optional<std::string>& activeApp) {
    ContextSnapshot snapshot;
    std::vector<Trigger> triggers;
    TriggerCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (screen.has_value()) m_screen = screen;
        if (audio.has_value()) m_audio = audio;
        if (activeApp.has_value()) {
            m_activeApp = activeApp;
        } else if (screen.has_value()) {
            m_activeApp = screen->appName;
        }

        snapshot.appName = m_activeApp.value_or("");
        snapshot.screenSnapshot = m_screen;
        snapshot.audioSession = m_audio;
        snapshot.timestamp = types::nowTimestamp();

        std::string fused;
        if (m_screen.has_value()) fused += m_screen->windowTitle + "\n" + m_screen->extractedText + "\n";
        if (m_audio.has_value()) fused += m_audio->transcript;
        snapshot.userIntent = inferUserIntent(fused);

        m_current = snapshot;
        m_history.push_back(snapshot);
        while (m_history.size() > m_options.maxHistory) m_history.pop_front();
        m_snapshotsRecorded++;

        if (m_active) {
            if (quietNowLocked()) {
                // 免打扰：统计被抑制的命中数，快照仍已记录
                for (const auto& entry : m_patterns) {
                    if (entry.pattern.isActive && matchesPattern(entry, snapshot)) m_triggersSuppressed++;
                }
            } else {
                triggers = collectTriggersLocked(snapshot);
                m_triggersEmitted += triggers.size();
                cb = m_callback;
            }
        }
    }

    if (cb) {
        for (const auto& t : triggers) {
            try {
                cb(t);
            } catch (const std::exception& e) {
                m_logger.log(ErrorHandler::LogLevel::Warning,
                             std::string("ContextEngine: trigger consumer threw: ") + e.what());
            }
        }
    }
    return snapshot;
}

std::optional<ContextSnapshot> ContextEngine::currentSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

std::vector<ContextSnapshot> ContextEngine::getContextSnapshots(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = (limit == 0 || limit > m_history.size()) ? m_history.size() : limit;
    return std::vector<ContextSnapshot>(m_history.end() - static_cast<std::ptrdiff_t>(n), m_history.end());
}

ContextEngine::Status ContextEngine::getStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Status s;
    s.isActive = m_active;
    s.isQuietHours = quietNowLocked();
    s.patternsCount = m_patterns.size();
    s.snapshotsRecorded = m_snapshotsRecorded;
    s.triggersEmitted = m_triggersEmitted;
    s.triggersSuppressed = m_triggersSuppressed;
    return s;
}

} // namespace delo::ambient
