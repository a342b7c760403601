#include "delo/ambient/CommandHistory.h"

#include "delo/ambient/utils/TextMatch.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>

namespace delo::ambient {

using types::CommandHistoryEntry;

CommandHistory::CommandHistory(const ErrorHandler& logger, Options options)
    : m_logger(logger)
    , m_options(std::move(options))
{
    if (m_options.maxEntries == 0) m_options.maxEntries = 1;
}

void CommandHistory::trimLocked() {
    while (m_entries.size() > m_options.maxEntries) m_entries.pop_front();
}

// ========== 持久化 ==========

bool CommandHistory::load(ErrorInfo* err) {
    if (m_options.path.empty()) return true;

    std::ifstream ifs(m_options.path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        m_logger.log(ErrorHandler::LogLevel::Debug, "CommandHistory: no history file at " + m_options.path);
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(buffer.str());
    } catch (const std::exception& e) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::InvalidConfig, std::string("History JSON parse failed: ") + e.what(),
                                   nlohmann::json{{"path", m_options.path}});
        }
        return false;
    }

    const nlohmann::json* list = &parsed;
    if (parsed.is_object() && parsed.contains("entries")) list = &parsed.at("entries");
    if (!list->is_array()) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::InvalidConfig, "History file must contain an array of entries",
                                   nlohmann::json{{"path", m_options.path}});
        }
        return false;
    }

    std::deque<CommandHistoryEntry> loaded;
    size_t skipped = 0;
    for (const auto& item : *list) {
        if (auto e = CommandHistoryEntry::fromJson(item)) {
            loaded.push_back(std::move(*e));
        } else {
            skipped++;
        }
    }
    if (skipped > 0) {
        m_logger.log(ErrorHandler::LogLevel::Warning,
                     "CommandHistory: skipped " + std::to_string(skipped) + " malformed entries");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries = std::move(loaded);
    trimLocked();
    return true;
}

bool CommandHistory::save(ErrorInfo* err) const {
    if (m_options.path.empty()) return true;

    nlohmann::json entries = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& e : m_entries) entries.push_back(e.toJson());
    }

    try {
        const std::filesystem::path p(m_options.path);
        const auto parent = p.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::exists(parent)) {
                if (err) {
                    *err = ErrorInfo::make(ErrorType::InvalidConfig,
                                           "Failed to create history directory: " + parent.string(),
                                           nlohmann::json{{"ec", ec.value()}, {"what", ec.message()}});
                }
                return false;
            }
        }

        std::ofstream ofs(m_options.path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            if (err) {
                *err = ErrorInfo::make(ErrorType::InvalidConfig,
                                       "Failed to open history file for write: " + m_options.path);
            }
            return false;
        }
        ofs << nlohmann::json{{"version", 1}, {"entries", std::move(entries)}}.dump(2) << "\n";
        ofs.flush();
        return ofs.good();
    } catch (const std::exception& e) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::InvalidConfig, std::string("Failed to save history: ") + e.what(),
                                   nlohmann::json{{"path", m_options.path}});
        }
        return false;
    }
}

// ========== 记录 ==========

void CommandHistory::append(const CommandHistoryEntry& entry) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back(entry);
        trimLocked();
    }
    if (m_options.path.empty()) return;

    ErrorInfo err;
    if (!save(&err)) {
        m_logger.log(ErrorHandler::LogLevel::Warning, "CommandHistory: failed to persist history", err);
    }
}

std::vector<CommandHistoryEntry> CommandHistory::getCommandHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = (limit == 0 || limit > m_entries.size()) ? m_entries.size() : limit;
    return std::vector<CommandHistoryEntry>(m_entries.end() - static_cast<std::ptrdiff_t>(n), m_entries.end());
}

size_t CommandHistory::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void CommandHistory::clear() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }
    ErrorInfo err;
    if (!save(&err)) {
        m_logger.log(ErrorHandler::LogLevel::Warning, "CommandHistory: failed to persist cleared history", err);
    }
}

// ========== 补全建议 ==========

std::vector<std::string> CommandHistory::getCommandSuggestions(const std::string& partial,
                                                               const std::vector<std::string>& staticPhrases) const {
    const auto needle = utils::normalizeCommand(partial);
    if (needle.empty()) return {};

    struct Candidate {
        std::string text;
        bool prefix{false};
        size_t count{0};
        size_t lastIndex{0};
    };

    std::map<std::string, Candidate> byKey;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_entries.size(); ++i) {
            const auto key = utils::normalizeCommand(m_entries[i].command);
            if (key.empty() || key.find(needle) == std::string::npos) continue;
            auto& c = byKey[key];
            c.text = utils::trimCopy(m_entries[i].command);
            c.prefix = utils::startsWith(key, needle);
            c.count++;
            c.lastIndex = i;
        }
    }

    std::vector<Candidate> history;
    history.reserve(byKey.size());
    for (auto& kv : byKey) history.push_back(std::move(kv.second));
    std::sort(history.begin(), history.end(), [](const Candidate& a, const Candidate& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.lastIndex > b.lastIndex;
    });

    std::vector<std::string> out;
    std::set<std::string> seen;
    auto push = [&](const std::string& text) {
        if (out.size() >= m_options.maxSuggestions) return;
        if (seen.insert(utils::normalizeCommand(text)).second) out.push_back(text);
    };

    for (bool wantPrefix : {true, false}) {
        for (const auto& c : history) {
            if (c.prefix == wantPrefix) push(c.text);
        }
        for (const auto& phrase : staticPhrases) {
            const auto key = utils::normalizeCommand(phrase);
            const auto pos = key.find(needle);
            if (pos == std::string::npos) continue;
            if ((pos == 0) == wantPrefix) push(phrase);
        }
    }
    return out;
}

} // namespace delo::ambient
