#include "delo/ambient/ActionHandlers.h"

#include "delo/ambient/CommandCatalog.h"
#include "delo/ambient/utils/TextMatch.h"

#include <sstream>

namespace delo::ambient {

using types::FallbackRequest;
using types::Intent;
using types::IntentCategory;

namespace {

std::string argOr(const Intent& intent, const char* key) {
    return utils::trimCopy(types::jsonValueOr<std::string>(intent.extractedArgs, key, ""));
}

ActionResult failure(std::string message, std::vector<std::string> nextSteps = {}) {
    ActionResult r;
    r.success = false;
    r.message = std::move(message);
    r.nextSteps = std::move(nextSteps);
    return r;
}

} // namespace

// ========== OpenAppHandler ==========

OpenAppHandler::OpenAppHandler(std::shared_ptr<AppLauncher> launcher)
    : m_launcher(std::move(launcher))
{}

ActionResult OpenAppHandler::run(const Intent& intent) {
    const auto appId = argOr(intent, "app");
    const auto target = argOr(intent, "target");

    if (appId.empty()) {
        if (target.empty()) {
            return failure("No application specified to open.", {"Try a command like \"open chrome\""});
        }
        auto r = failure("Application \"" + target + "\" was not found.");
        r.fallback = FallbackRequest::missingApp(target);
        return r;
    }

    const types::AppInfo* app = nullptr;
    for (const auto& candidate : catalog::appCatalog()) {
        if (candidate.id == appId) {
            app = &candidate;
            break;
        }
    }
    if (!app) {
        auto r = failure("Application \"" + appId + "\" is not in the catalog.");
        r.fallback = FallbackRequest::missingApp(target.empty() ? appId : target);
        return r;
    }
    if (!m_launcher) return failure("No application launcher available.");

    ErrorInfo err;
    if (!m_launcher->launch(*app, &err)) {
        auto r = failure("Failed to open " + app->displayName + ": " + err.message);
        r.data = nlohmann::json{{"app", app->toJson()}};
        if (err.errorType == ErrorType::ActionUnavailable) {
            r.fallback = FallbackRequest::missingApp(app->displayName, app->downloadUrl);
        }
        return r;
    }

    ActionResult r;
    r.success = true;
    r.message = "Opening " + app->displayName + ".";
    r.data = nlohmann::json{{"app", app->toJson()}};
    return r;
}

// ========== UrlSearchHandler ==========

UrlSearchHandler::UrlSearchHandler(std::shared_ptr<UrlOpener> opener, std::string urlPrefix, std::string siteLabel)
    : m_opener(std::move(opener))
    , m_urlPrefix(std::move(urlPrefix))
    , m_siteLabel(std::move(siteLabel))
{}

std::shared_ptr<UrlSearchHandler> UrlSearchHandler::webSearch(std::shared_ptr<UrlOpener> opener) {
    return std::make_shared<UrlSearchHandler>(std::move(opener), "https://www.google.com/search?q=", "web search");
}

std::shared_ptr<UrlSearchHandler> UrlSearchHandler::youtubeSearch(std::shared_ptr<UrlOpener> opener) {
    return std::make_shared<UrlSearchHandler>(std::move(opener), "https://www.youtube.com/results?search_query=",
                                              "YouTube search");
}

std::string UrlSearchHandler::urlFor(const std::string& query) const {
    return m_urlPrefix + utils::urlEncode(query);
}

ActionResult UrlSearchHandler::run(const Intent& intent) {
    auto query = argOr(intent, "query");
    if (query.empty()) query = argOr(intent, "text");
    if (query.empty()) {
        return failure("No search term provided.", {"Tell DELO what to search for, e.g. \"search for react tutorial\""});
    }

    const auto url = urlFor(query);
    if (!m_opener) return failure("No URL opener available.", {"Open this link manually: " + url});

    ErrorInfo err;
    if (!m_opener->openExternal(url, &err)) {
        auto r = failure("Failed to open " + m_siteLabel + ": " + err.message, {"Open this link manually: " + url});
        r.data = nlohmann::json{{"query", query}, {"url", url}};
        return r;
    }

    ActionResult r;
    r.success = true;
    r.message = "Searching for \"" + query + "\" (" + m_siteLabel + ").";
    r.data = nlohmann::json{{"query", query}, {"url", url}};
    r.nextSteps = {"Opened " + m_siteLabel + " for \"" + query + "\": " + url};
    return r;
}

// ========== EmailDraftHandler ==========

EmailDraftHandler::EmailDraftHandler(std::shared_ptr<UrlOpener> opener)
    : m_opener(std::move(opener))
{}

std::string EmailDraftHandler::mailtoFor(const std::string& recipient, const std::string& subject,
                                         const std::string& body) {
    // 地址整体编码，仅保留 @ 原样
    std::string to = utils::urlEncode(recipient);
    for (size_t pos = to.find("%40"); pos != std::string::npos; pos = to.find("%40", pos + 1)) {
        to.replace(pos, 3, "@");
    }
    std::string url = "mailto:" + to;
    std::string sep = "?";
    if (!subject.empty()) {
        url += sep + "subject=" + utils::urlEncode(subject);
        sep = "&";
    }
    if (!body.empty()) url += sep + "body=" + utils::urlEncode(body);
    return url;
}

ActionResult EmailDraftHandler::run(const Intent& intent) {
    const auto recipientArg = argOr(intent, "recipient");
    const auto subject = argOr(intent, "subject");
    auto body = argOr(intent, "body");
    if (body.empty()) body = argOr(intent, "text");

    // 只有看起来像地址的收件人才写进 mailto
    const bool isAddress = recipientArg.find('@') != std::string::npos;
    const auto url = mailtoFor(isAddress ? recipientArg : "", subject, body);

    std::vector<std::string> steps = {"Review the draft before sending"};
    if (!recipientArg.empty() && !isAddress) steps.insert(steps.begin(), "Fill in the address for " + recipientArg);

    if (!m_opener) return failure("No URL opener available.", {"Open this link manually: " + url});

    ErrorInfo err;
    if (!m_opener->openExternal(url, &err)) {
        auto r = failure("Could not open a mail client: " + err.message);
        r.fallback = FallbackRequest::missingApp("Mail client");
        return r;
    }

    ActionResult r;
    r.success = true;
    r.message = "Drafting email in your mail client.";
    r.data = nlohmann::json{{"recipient", recipientArg}, {"subject", subject}, {"url", url}};
    r.nextSteps = std::move(steps);
    return r;
}

// ========== HelpHandler ==========

ActionResult HelpHandler::run(const Intent&) {
    ActionResult r;
    r.success = true;
    r.message = "Here is what DELO can do.";

    nlohmann::json categories = nlohmann::json::array();
    for (const auto& entry : catalog::phraseTable()) {
        categories.push_back(nlohmann::json{
            {"category", types::intentCategoryToString(entry.category)},
            {"phrases", entry.phrases},
        });
    }
    r.data = nlohmann::json{{"categories", std::move(categories)}};
    r.nextSteps = {
        "open chrome",
        "search for react tutorial",
        "search youtube for lofi music",
        "email alice@example.com about lunch",
    };
    return r;
}

// ========== SummarizeScreenHandler ==========

SummarizeScreenHandler::SummarizeScreenHandler(std::shared_ptr<CompletionClient> client, SnapshotProvider snapshots)
    : m_client(std::move(client))
    , m_snapshots(std::move(snapshots))
{}

std::string SummarizeScreenHandler::buildPrompt(const types::ContextSnapshot& snapshot, const std::string& focus) {
    const auto& screen = *snapshot.screenSnapshot;
    const auto text = utils::trimCopy(screen.extractedText);

    std::ostringstream oss;
    oss << "You are DELO, a floating AI desktop assistant.\n\n";
    oss << "Here is the visible text from the user's screen:\n\n";
    oss << text.substr(0, kMaxScreenChars) << (text.size() > kMaxScreenChars ? "..." : "") << "\n\n";
    oss << "Active App: " << (screen.appName.empty() ? snapshot.appName : screen.appName) << "\n";
    if (!screen.windowTitle.empty()) oss << "Active Window: " << screen.windowTitle << "\n";
    if (!focus.empty()) oss << "The user asked to focus on: \"" << focus << "\"\n";
    oss << "\nYour task:\n"
           "1. Summarize what is happening on screen in 2-3 sentences\n"
           "2. Infer what the user is trying to do\n"
           "3. Suggest 1-3 short follow-up commands (e.g. \"search for <terms>\", \"open <app>\")\n"
           "4. Categorize the activity in one word (email, coding, browsing, meeting, writing, ...)\n\n";
    oss << "Return your output as JSON:\n"
           "{\n"
           "  \"summary\": \"<what's happening>\",\n"
           "  \"intent\": \"<inferred user goal>\",\n"
           "  \"suggestedActions\": [\"<command 1>\"],\n"
           "  \"intentCategory\": \"<category>\"\n"
           "}";
    return oss.str();
}

ActionResult SummarizeScreenHandler::run(const Intent& intent) {
    std::optional<types::ContextSnapshot> snapshot;
    if (m_snapshots) snapshot = m_snapshots();
    if (!snapshot.has_value() || !snapshot->screenSnapshot.has_value() ||
        utils::trimCopy(snapshot->screenSnapshot->extractedText).empty()) {
        return failure("No text found on screen yet.",
                       {"Start screen perception and bring the window you want summarized to the front"});
    }
    if (!m_client) {
        return failure("No AI completion service configured.",
                       {"Set capture.completion_command in the config file"});
    }

    const auto prompt = buildPrompt(*snapshot, argOr(intent, "text"));
    std::optional<std::string> reply;
    ErrorInfo err = ErrorInfo::make(ErrorType::ExternalServiceError, "Completion returned no result");
    try {
        reply = m_client->complete(prompt, &err);
    } catch (const std::exception& e) {
        reply.reset();
        err = ErrorInfo::make(ErrorType::ExternalServiceError, std::string("Completion threw: ") + e.what());
    }
    if (!reply.has_value()) return failure("Summary failed: " + err.message, {"Try again in a moment"});

    const auto raw = utils::trimCopy(*reply);
    std::string summary;
    std::string inferred;
    std::string category;
    std::vector<std::string> suggestions;

    // JSON 可能被包在 ```json 代码块或说明文字里
    const auto open = raw.find('{');
    const auto close = raw.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        try {
            const auto parsed = nlohmann::json::parse(raw.substr(open, close - open + 1));
            summary = utils::trimCopy(types::jsonValueOr<std::string>(parsed, "summary", ""));
            inferred = types::jsonValueOr<std::string>(parsed, "intent", "");
            category = types::jsonValueOr<std::string>(parsed, "intentCategory", "");
            suggestions = types::jsonStringList(parsed, "suggestedActions");
        } catch (const nlohmann::json::exception&) {
            summary.clear();
        }
    }
    if (summary.empty()) summary = raw;
    if (summary.empty()) return failure("Summary failed: the AI returned an empty response.");

    const auto& screen = *snapshot->screenSnapshot;
    ActionResult r;
    r.success = true;
    r.message = summary;
    r.data = nlohmann::json{
        {"app", screen.appName},
        {"window", screen.windowTitle},
        {"summary", summary},
        {"intent", inferred},
        {"intent_category", category},
    };
    r.nextSteps = std::move(suggestions);
    return r;
}

void registerBuiltinHandlers(CommandRouter& router,
                             std::shared_ptr<UrlOpener> opener,
                             std::shared_ptr<AppLauncher> launcher,
                             std::shared_ptr<CompletionClient> completion,
                             SummarizeScreenHandler::SnapshotProvider snapshots) {
    router.registerHandler(IntentCategory::Open, std::make_shared<OpenAppHandler>(std::move(launcher)));
    router.registerHandler(IntentCategory::Search, UrlSearchHandler::webSearch(opener));
    router.registerHandler(IntentCategory::YouTube, UrlSearchHandler::youtubeSearch(opener));
    router.registerHandler(IntentCategory::Email, std::make_shared<EmailDraftHandler>(opener));
    router.registerHandler(IntentCategory::Help, std::make_shared<HelpHandler>());
    if (snapshots) {
        router.registerHandler(IntentCategory::Summarize,
                               std::make_shared<SummarizeScreenHandler>(std::move(completion), std::move(snapshots)));
    }
}

} // namespace delo::ambient
