#include "delo/ambient/CommandCatalog.h"

#include "delo/ambient/utils/TextMatch.h"

#include <set>

namespace delo::ambient::catalog {

using types::AppInfo;
using types::IntentCategory;

const std::vector<CategoryPhrases>& phraseTable() {
    static const std::vector<CategoryPhrases> table = {
        {IntentCategory::Open, {"open", "launch"}},
        {IntentCategory::Search, {"search for", "search the web for", "search", "look up", "google", "find"}},
        {IntentCategory::YouTube, {"search youtube for", "youtube", "watch"}},
        {IntentCategory::Email, {"send an email", "send email", "write an email", "draft an email",
                                 "compose an email", "email", "e-mail"}},
        {IntentCategory::Summarize, {"summarize", "summarise", "summary of", "tldr"}},
        {IntentCategory::Translate, {"translate"}},
        {IntentCategory::Task, {"remind me", "add a task", "add task", "create task", "todo", "to-do", "reminder"}},
        {IntentCategory::Screenshot, {"take a screenshot", "screenshot", "screen capture", "capture the screen"}},
        {IntentCategory::Clipboard, {"clipboard", "copy", "paste"}},
        {IntentCategory::System, {"system settings", "settings", "volume", "brightness", "shut down", "shutdown",
                                  "lock screen"}},
        {IntentCategory::Help, {"what can you do", "help", "commands"}},
    };
    return table;
}

const std::vector<CategorySynonyms>& synonymTable() {
    static const std::vector<CategorySynonyms> table = {
        {IntentCategory::Open, {"open", "launch", "start", "opne", "oepn", "lauch"}},
        {IntentCategory::Search, {"search", "find", "lookup", "srch", "serach", "seach"}},
        {IntentCategory::YouTube, {"youtube", "video", "videos", "yotube", "youtub"}},
        {IntentCategory::Email, {"email", "mail", "send", "compose", "message", "emal", "emial"}},
        {IntentCategory::Summarize, {"summarize", "summary", "brief", "sumarize", "sumry", "summarise"}},
        {IntentCategory::Translate, {"translate", "translation", "language", "translat", "tranlsate"}},
        {IntentCategory::Task, {"task", "todo", "reminder", "remind", "tsk"}},
        {IntentCategory::Screenshot, {"screenshot", "capture", "snap", "screnshot"}},
        {IntentCategory::Clipboard, {"clipboard", "copy", "paste", "clipbord"}},
        {IntentCategory::System, {"system", "control", "settings", "sys"}},
        {IntentCategory::Help, {"help", "assist", "hlp"}},
    };
    return table;
}

const std::vector<AppInfo>& appCatalog() {
    static const std::vector<AppInfo> apps = {
        {"chrome", "Google Chrome", {"chrome", "google chrome", "chrome browser"},
         {"google-chrome", "google-chrome-stable", "chromium", "chromium-browser"},
         "Google Chrome", "chrome", "https://www.google.com/chrome/"},
        {"firefox", "Firefox", {"firefox", "mozilla firefox"}, {"firefox"}, "Firefox", "firefox",
         "https://www.mozilla.org/firefox/new/"},
        {"notepad", "Text Editor", {"notepad", "text editor", "textedit", "gedit"},
         {"gnome-text-editor", "gedit", "kate", "mousepad"}, "TextEdit", "notepad", ""},
        {"calculator", "Calculator", {"calculator", "calc"}, {"gnome-calculator", "kcalc", "galculator"},
         "Calculator", "calc", ""},
        {"explorer", "File Manager", {"explorer", "file explorer", "files", "finder", "file manager"},
         {"nautilus", "dolphin", "thunar", "nemo"}, "Finder", "explorer", ""},
        {"terminal", "Terminal", {"terminal", "console", "shell"},
         {"gnome-terminal", "konsole", "xfce4-terminal", "xterm"}, "Terminal", "wt", ""},
        {"spotify", "Spotify", {"spotify"}, {"spotify"}, "Spotify", "spotify",
         "https://www.spotify.com/download/"},
        {"discord", "Discord", {"discord"}, {"discord"}, "Discord", "discord", "https://discord.com/download"},
        {"slack", "Slack", {"slack"}, {"slack"}, "Slack", "slack", "https://slack.com/downloads"},
        {"vscode", "Visual Studio Code", {"vscode", "vs code", "visual studio code", "code"}, {"code", "codium"},
         "Visual Studio Code", "code", "https://code.visualstudio.com/download"},
        {"figma", "Figma", {"figma"}, {"figma-linux"}, "Figma", "figma", "https://www.figma.com/downloads/"},
        {"zoom", "Zoom", {"zoom"}, {"zoom"}, "zoom.us", "zoom", "https://zoom.us/download"},
        {"notion", "Notion", {"notion"}, {"notion-app"}, "Notion", "notion", "https://www.notion.so/desktop"},
    };
    return apps;
}

std::vector<std::string> allPhrases() {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& entry : phraseTable()) {
        for (const auto& p : entry.phrases) {
            if (seen.insert(p).second) out.push_back(p);
        }
    }
    return out;
}

int categoryTier(IntentCategory category) {
    switch (category) {
        case IntentCategory::Clipboard:
        case IntentCategory::System:
        case IntentCategory::Help:
            return 1;
        default:
            return 0;
    }
}

std::optional<PhraseHit> matchPhrase(const std::string& normalized) {
    std::optional<PhraseHit> best;
    for (const auto& entry : phraseTable()) {
        const int tier = categoryTier(entry.category);
        for (const auto& phrase : entry.phrases) {
            const size_t pos = utils::findPhrase(normalized, phrase);
            if (pos == std::string::npos) continue;
            bool better = !best.has_value();
            if (!better) {
                const int bestTier = categoryTier(best->category);
                better = tier < bestTier ||
                         (tier == bestTier && (pos < best->position ||
                                               (pos == best->position && phrase.size() > best->phrase.size())));
            }
            if (better) best = PhraseHit{entry.category, phrase, pos};
        }
    }
    return best;
}

std::optional<SynonymHit> matchSynonym(const std::string& normalized, double threshold) {
    const auto words = utils::splitWords(normalized);
    std::optional<SynonymHit> best;
    for (size_t i = 0; i < words.size(); ++i) {
        const auto& word = words[i];
        for (const auto& entry : synonymTable()) {
            for (const auto& syn : entry.words) {
                double sim = 0.0;
                if (word == syn) {
                    sim = 1.0;
                } else if (word.size() >= 4) {
                    sim = utils::similarity(word, syn);
                }
                if (sim < threshold) continue;
                if (!best.has_value() || sim > best->similarity) {
                    best = SynonymHit{entry.category, word, syn, i, sim};
                }
            }
        }
    }
    return best;
}

namespace {

std::vector<std::string> namesOf(const AppInfo& app) {
    std::vector<std::string> names = app.aliases;
    names.push_back(app.id);
    names.push_back(utils::toLowerCopy(app.displayName));
    return names;
}

std::string joinPrefix(const std::vector<std::string>& words, size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) out.push_back(' ');
        out += words[i];
    }
    return out;
}

} // namespace

std::optional<AppMatch> resolveApp(const std::string& name, double threshold) {
    const auto words = utils::splitWords(utils::normalizeCommand(name));
    if (words.empty()) return std::nullopt;

    // 精确
    for (size_t n = words.size(); n >= 1; --n) {
        const auto candidate = joinPrefix(words, n);
        for (const auto& app : appCatalog()) {
            for (const auto& alias : namesOf(app)) {
                if (candidate == alias) return AppMatch{app, 1.0, n};
            }
        }
    }

    // 模糊
    std::optional<AppMatch> best;
    for (size_t n = words.size(); n >= 1; --n) {
        const auto candidate = joinPrefix(words, n);
        if (candidate.size() < 4) continue;
        for (const auto& app : appCatalog()) {
            for (const auto& alias : namesOf(app)) {
                const double sim = utils::similarity(candidate, alias);
                if (sim < threshold) continue;
                if (!best.has_value() || sim > best->similarity) best = AppMatch{app, sim, n};
            }
        }
    }
    return best;
}

} // namespace delo::ambient::catalog
