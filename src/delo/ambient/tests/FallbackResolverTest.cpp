#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/FallbackResolver.h"
#include "MiniTest.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace delo::ambient;
using namespace delo::ambient::types;

class RecordingOpener : public UrlOpener {
public:
    explicit RecordingOpener(bool ok = true) : m_ok(ok) {}

    bool openExternal(const std::string& target, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_opened.push_back(target);
        if (!m_ok && err) *err = ErrorInfo::make(ErrorType::ActionUnavailable, "xdg-open missing");
        return m_ok;
    }
    std::vector<std::string> opened() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_opened;
    }

private:
    mutable std::mutex m_mutex;
    bool m_ok;
    std::vector<std::string> m_opened;
};

static FallbackResolver::Options optionsFor(Platform platform, bool openLinks = true) {
    FallbackResolver::Options o;
    o.platform = platform;
    o.openExternalLinks = openLinks;
    return o;
}

static bool containsStep(const FallbackResponse& r, const std::string& needle) {
    for (const auto& s : r.nextSteps) {
        if (s.find(needle) != std::string::npos) return true;
    }
    return false;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    // ========== missing_app ==========
    tests.push_back({"FallbackResolver_MissingAppOffersInstall", []() {
        ErrorHandler logger;
        auto opener = std::make_shared<RecordingOpener>();
        FallbackResolver resolver(opener, logger, optionsFor(Platform::Linux));

        auto r = resolver.resolve(FallbackRequest::missingApp("Notion", "https://www.notion.so/desktop"));
        CHECK_TRUE(r.success);
        CHECK_TRUE(r.action == FallbackAction::InstallApp);
        CHECK_FALSE(r.nextSteps.empty());
        CHECK_TRUE(r.message.find("Notion") != std::string::npos);
        CHECK_TRUE(containsStep(r, "https://www.notion.so/desktop"));

        auto opened = opener->opened();
        CHECK_EQ(opened.size(), 1u);
        CHECK_EQ(opened[0], "https://flathub.org/apps/search?q=Notion");
    }});

    tests.push_back({"FallbackResolver_MissingAppPlatformGuidance", []() {
        ErrorHandler logger;
        FallbackResolver mac(nullptr, logger, optionsFor(Platform::MacOS));
        FallbackResolver win(nullptr, logger, optionsFor(Platform::Windows));

        auto m = mac.resolve(FallbackRequest::missingApp("Figma"));
        CHECK_TRUE(containsStep(m, "Mac App Store"));
        auto w = win.resolve(FallbackRequest::missingApp("Figma"));
        CHECK_TRUE(containsStep(w, "Microsoft Store"));
        CHECK_EQ(win.storeSearchUrl("Visual Studio Code"), "ms-windows-store://search/?query=Visual%20Studio%20Code");
    }});

    tests.push_back({"FallbackResolver_MissingAppWithoutNameIsManual", []() {
        ErrorHandler logger;
        auto opener = std::make_shared<RecordingOpener>();
        FallbackResolver resolver(opener, logger, optionsFor(Platform::Linux));
        auto r = resolver.resolve(FallbackRequest::missingApp("  "));
        CHECK_FALSE(r.success);
        CHECK_TRUE(r.action == FallbackAction::ManualInstruction);
        CHECK_EQ(opener->opened().size(), 0u);
    }});

    tests.push_back({"FallbackResolver_LinkFailureIsOnlyLogged", []() {
        ErrorHandler logger;
        std::vector<std::string> lines;
        logger.setSink([&lines](ErrorHandler::LogLevel, const std::string& line) { lines.push_back(line); });
        auto opener = std::make_shared<RecordingOpener>(false);
        FallbackResolver resolver(opener, logger, optionsFor(Platform::Linux));

        auto r = resolver.resolve(FallbackRequest::missingApp("Slack", "https://slack.com/downloads"));
        CHECK_TRUE(r.success);
        CHECK_TRUE(r.action == FallbackAction::InstallApp);
        CHECK_EQ(lines.size(), 1u);
        CHECK_TRUE(lines[0].find("failed to open link") != std::string::npos);
    }});

    // ========== missing_oauth ==========
    tests.push_back({"FallbackResolver_MissingOAuthKnownProvider", []() {
        ErrorHandler logger;
        auto opener = std::make_shared<RecordingOpener>();
        FallbackResolver resolver(opener, logger, optionsFor(Platform::Linux));

        auto r = resolver.resolve(FallbackRequest::missingOAuth("GitHub"));
        CHECK_TRUE(r.success);
        CHECK_TRUE(r.action == FallbackAction::OpenOAuth);
        CHECK_EQ(r.nextSteps.size(), 4u);
        auto opened = opener->opened();
        CHECK_EQ(opened.size(), 1u);
        CHECK_EQ(opened[0], "https://github.com/login/oauth/authorize");

        auto unknown = resolver.resolve(FallbackRequest::missingOAuth("acme"));
        CHECK_TRUE(unknown.action == FallbackAction::OpenOAuth);
        CHECK_TRUE(containsStep(unknown, "acme OAuth documentation"));
        CHECK_EQ(opener->opened().size(), 1u);

        CHECK_FALSE(FallbackResolver::oauthUrlFor("acme").has_value());
        CHECK_TRUE(FallbackResolver::oauthUrlFor(" Slack ").has_value());
    }});

    // ========== missing_permission ==========
    tests.push_back({"FallbackResolver_MissingPermissionGuides", []() {
        ErrorHandler logger;
        FallbackResolver lnx(nullptr, logger, optionsFor(Platform::Linux));
        FallbackResolver mac(nullptr, logger, optionsFor(Platform::MacOS));

        auto r = lnx.resolve(FallbackRequest::missingPermission("microphone"));
        CHECK_TRUE(r.success);
        CHECK_TRUE(r.action == FallbackAction::RequestPermission);
        CHECK_TRUE(containsStep(r, "Settings > Privacy > Microphone"));

        auto m = mac.resolve(FallbackRequest::missingPermission("Screen_Recording"));
        CHECK_TRUE(containsStep(m, "Screen Recording"));

        auto generic = lnx.permissionGuide("bluetooth");
        CHECK_EQ(generic.size(), 3u);
        CHECK_EQ(generic[0], "Open Settings > Privacy");

        auto missing = lnx.resolve(FallbackRequest::missingPermission(""));
        CHECK_FALSE(missing.success);
        CHECK_TRUE(missing.action == FallbackAction::ManualInstruction);
    }});

    // ========== missing_script / unknown_action ==========
    tests.push_back({"FallbackResolver_MissingScriptAddsIntegrationSteps", []() {
        ErrorHandler logger;
        FallbackResolver resolver(nullptr, logger, optionsFor(Platform::Linux));

        auto plain = resolver.resolve(FallbackRequest::missingScript("rename photos"));
        CHECK_TRUE(plain.success);
        CHECK_TRUE(plain.action == FallbackAction::GenerateScript);
        CHECK_EQ(plain.nextSteps.size(), 5u);
        CHECK_TRUE(containsStep(plain, "shell script"));

        auto calendar = resolver.resolve(FallbackRequest::missingScript("create calendar event"));
        CHECK_EQ(calendar.nextSteps.size(), 7u);
        auto mail = resolver.resolve(FallbackRequest::missingScript("send Email digest"));
        CHECK_TRUE(containsStep(mail, "mail client"));
    }});

    tests.push_back({"FallbackResolver_UnknownActionFails", []() {
        ErrorHandler logger;
        FallbackResolver resolver(nullptr, logger, optionsFor(Platform::Linux));
        auto r = resolver.resolve(FallbackRequest::unknownAction("teleport"));
        CHECK_FALSE(r.success);
        CHECK_TRUE(r.action == FallbackAction::ManualInstruction);
        CHECK_TRUE(r.message.find("teleport") != std::string::npos);
        CHECK_EQ(r.nextSteps.size(), 4u);
    }});

    // ========== 线上格式 ==========
    tests.push_back({"FallbackResolver_ResolveJson", []() {
        ErrorHandler logger{ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Error, true}};
        FallbackResolver resolver(nullptr, logger, optionsFor(Platform::Linux));

        auto r = resolver.resolveJson(nlohmann::json{
            {"reason", "missing_oauth"},
            {"details", {{"oauthProvider", "google"}}},
        });
        CHECK_TRUE(r.action == FallbackAction::OpenOAuth);

        auto bad = resolver.resolveJson(nlohmann::json{{"reason", "missing_coffee"}});
        CHECK_FALSE(bad.success);
        CHECK_EQ(bad.message, "Unknown fallback reason");

        auto notObject = resolver.resolveJson(nlohmann::json::array());
        CHECK_FALSE(notObject.success);

        auto j = FallbackRequest::missingApp("Zoom", "https://zoom.us/download").toJson();
        CHECK_EQ(j.at("reason").get<std::string>(), "missing_app");
        auto parsed = FallbackRequest::fromJson(j);
        CHECK_TRUE(parsed.has_value());
        CHECK_TRUE(parsed->reason() == FallbackReason::MissingApp);
    }});

    return mini_test::run(tests);
}
