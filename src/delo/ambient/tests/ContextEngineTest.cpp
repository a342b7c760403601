#include "delo/ambient/ContextEngine.h"
#include "delo/ambient/ErrorHandler.h"
#include "MiniTest.h"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace delo::ambient;
using namespace delo::ambient::types;

static ScreenSnapshot makeScreen(const std::string& app, const std::string& title, const std::string& text) {
    ScreenSnapshot s;
    s.appName = app;
    s.windowTitle = title;
    s.extractedText = text;
    s.capturedAt = nowTimestamp();
    return s;
}

static AudioSession makeAudio(const std::string& transcript) {
    AudioSession s;
    s.transcript = transcript;
    s.sourceName = "microphone";
    s.startTime = nowTimestamp();
    s.endTime = s.startTime;
    s.isFinal = true;
    return s;
}

static ContextPattern makePattern(const std::string& name, const std::string& app,
                                  const std::string& window = "",
                                  std::vector<std::string> audioKw = {},
                                  std::vector<std::string> screenKw = {},
                                  std::vector<std::string> actions = {"search for something"}) {
    ContextPattern p;
    p.patternName = name;
    p.appName = app;
    p.windowPattern = window;
    p.audioKeywords = std::move(audioKw);
    p.screenKeywords = std::move(screenKw);
    p.triggerActions = std::move(actions);
    return p;
}

struct Fixture {
    ErrorHandler logger{ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Error, true}};
    ContextEngine engine{logger, ContextEngine::Options{50}};
    std::vector<Trigger> fired;

    Fixture() {
        engine.setHourSource([]() { return 12; });
        engine.setTriggerCallback([this](const Trigger& t) { fired.push_back(t); });
        engine.start();
    }
};

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    // ========== 模式管理 ==========
    tests.push_back({"ContextEngine_ListPatternsReturnsRegisteredValues", []() {
        Fixture fx;
        auto a = makePattern("email-helper", "Chrome", "Gmail", {"reply"}, {"inbox"}, {"send an email"});
        auto b = makePattern("code-helper", "*", "/\\.cpp$/", {}, {"error"}, {"search for compiler error"});
        b.isActive = false;
        CHECK_TRUE(fx.engine.addContextPattern(a));
        CHECK_TRUE(fx.engine.addContextPattern(b));

        auto list = fx.engine.listPatterns();
        CHECK_EQ(list.size(), 2u);
        CHECK_TRUE(list[0] == a);
        CHECK_TRUE(list[1] == b);

        auto fromJson = ContextPattern::fromJson(a.toJson());
        CHECK_TRUE(fromJson.has_value());
        CHECK_TRUE(*fromJson == a);
    }});

    tests.push_back({"ContextEngine_SameNameReplacesInPlace", []() {
        Fixture fx;
        fx.engine.addContextPattern(makePattern("a", "Chrome"));
        fx.engine.addContextPattern(makePattern("b", "Slack"));
        fx.engine.addContextPattern(makePattern("a", "Firefox"));
        auto list = fx.engine.listPatterns();
        CHECK_EQ(list.size(), 2u);
        CHECK_EQ(list[0].patternName, "a");
        CHECK_EQ(list[0].appName, "Firefox");
        CHECK_TRUE(fx.engine.removeContextPattern("a"));
        CHECK_FALSE(fx.engine.removeContextPattern("a"));
        CHECK_EQ(fx.engine.listPatterns().size(), 1u);
    }});

    tests.push_back({"ContextEngine_RejectsInvalidPatterns", []() {
        Fixture fx;
        ErrorInfo err;
        CHECK_FALSE(fx.engine.addContextPattern(makePattern("", "Chrome"), &err));
        CHECK_TRUE(err.errorType == ErrorType::InvalidConfig);
        CHECK_FALSE(fx.engine.addContextPattern(makePattern("no-actions", "Chrome", "", {}, {}, {}), &err));
        CHECK_FALSE(fx.engine.addContextPattern(makePattern("bad-regex", "Chrome", "/([a-z/"), &err));
        CHECK_TRUE(err.message.find("regex") != std::string::npos);
        CHECK_EQ(fx.engine.listPatterns().size(), 0u);
    }});

    // ========== 匹配 ==========
    tests.push_back({"ContextEngine_EveryMatchingPatternFires", []() {
        Fixture fx;
        fx.engine.addContextPattern(makePattern("any-chrome", "chrome"));
        fx.engine.addContextPattern(makePattern("gmail", "Chrome", "gmail"));
        fx.engine.addContextPattern(makePattern("wildcard-kw", "*", "", {}, {"invoice"}));
        fx.engine.addContextPattern(makePattern("slack-only", "Slack"));

        fx.engine.update(makeScreen("Chrome", "Inbox - Gmail", "Your invoice is ready"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 3u);
        CHECK_EQ(fx.fired[0].patternName, "any-chrome");
        CHECK_EQ(fx.fired[1].patternName, "gmail");
        CHECK_EQ(fx.fired[2].patternName, "wildcard-kw");
        CHECK_EQ(fx.fired[0].triggerActions.size(), 1u);
        CHECK_EQ(fx.fired[0].snapshot.appName, "Chrome");
    }});

    tests.push_back({"ContextEngine_WindowPatternRegexForm", []() {
        Fixture fx;
        fx.engine.addContextPattern(makePattern("cpp-file", "*", "/\\.(cpp|h)\\b/"));
        fx.engine.update(makeScreen("Code", "main.py - project", "x"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 0u);
        fx.engine.update(makeScreen("Code", "Engine.CPP - project", "x"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 1u);
    }});

    tests.push_back({"ContextEngine_KeywordListsAreAlternatives", []() {
        Fixture fx;
        fx.engine.addContextPattern(makePattern("deadline", "*", "", {"deadline"}, {"due date"}));

        fx.engine.update(makeScreen("Notes", "todo", "nothing here"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 0u);

        // 仅音频命中
        fx.engine.update(std::nullopt, makeAudio("the Deadline moved"));
        CHECK_EQ(fx.fired.size(), 1u);

        // 仅屏幕命中（音频状态保留，但换成不相关的语音）
        fx.engine.update(makeScreen("Notes", "todo", "Due date: friday"), makeAudio("lunch"));
        CHECK_EQ(fx.fired.size(), 2u);
    }});

    tests.push_back({"ContextEngine_InactivePatternAndStoppedEngineDoNotFire", []() {
        Fixture fx;
        auto p = makePattern("off", "*");
        p.isActive = false;
        fx.engine.addContextPattern(p);
        fx.engine.addContextPattern(makePattern("on", "*"));

        fx.engine.update(makeScreen("Chrome", "t", "x"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 1u);
        CHECK_EQ(fx.fired[0].patternName, "on");

        fx.engine.stop();
        auto snap = fx.engine.update(makeScreen("Chrome", "t2", "y"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 1u);
        CHECK_EQ(snap.appName, "Chrome");
        CHECK_EQ(fx.engine.getContextSnapshots().size(), 2u);
    }});

    // ========== 免打扰 ==========
    tests.push_back({"ContextEngine_QuietHoursSuppressTriggers", []() {
        Fixture fx;
        fx.engine.addContextPattern(makePattern("p1", "*"));
        fx.engine.addContextPattern(makePattern("p2", "Chrome"));
        CHECK_TRUE(fx.engine.setQuietHours(22, 7));

        fx.engine.setHourSource([]() { return 23; });
        CHECK_TRUE(fx.engine.isQuietHours());
        fx.engine.update(makeScreen("Chrome", "t", "x"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 0u);
        CHECK_EQ(fx.engine.evaluate(*fx.engine.currentSnapshot()).size(), 0u);

        auto status = fx.engine.getStatus();
        CHECK_TRUE(status.isQuietHours);
        CHECK_EQ(status.triggersSuppressed, 2u);
        CHECK_EQ(status.snapshotsRecorded, 1u);

        fx.engine.setHourSource([]() { return 7; });
        CHECK_FALSE(fx.engine.isQuietHours());
        fx.engine.update(makeScreen("Chrome", "t", "x2"), std::nullopt);
        CHECK_EQ(fx.fired.size(), 2u);
    }});

    tests.push_back({"ContextEngine_QuietHourWindowRules", []() {
        CHECK_TRUE(ContextEngine::isHourInWindow(23, 22, 7));
        CHECK_TRUE(ContextEngine::isHourInWindow(0, 22, 7));
        CHECK_TRUE(ContextEngine::isHourInWindow(6, 22, 7));
        CHECK_FALSE(ContextEngine::isHourInWindow(7, 22, 7));
        CHECK_FALSE(ContextEngine::isHourInWindow(12, 22, 7));
        CHECK_TRUE(ContextEngine::isHourInWindow(9, 9, 17));
        CHECK_FALSE(ContextEngine::isHourInWindow(17, 9, 17));
        CHECK_FALSE(ContextEngine::isHourInWindow(5, 5, 5));

        Fixture fx;
        ErrorInfo err;
        CHECK_FALSE(fx.engine.setQuietHours(24, 7, &err));
        CHECK_FALSE(fx.engine.setQuietHours(-1, 7, &err));
        CHECK_TRUE(err.errorType == ErrorType::InvalidConfig);
        CHECK_TRUE(fx.engine.setQuietHours(12, 13));
        CHECK_TRUE(fx.engine.isQuietHours());
        fx.engine.clearQuietHours();
        CHECK_FALSE(fx.engine.isQuietHours());
    }});

    // ========== 融合 ==========
    tests.push_back({"ContextEngine_FusionKeepsLatestOfEachSource", []() {
        Fixture fx;
        fx.engine.update(makeScreen("Code", "main.cpp - Visual Studio Code", "int main()"), std::nullopt);
        auto snap = fx.engine.update(std::nullopt, makeAudio("let's debug this"));
        CHECK_EQ(snap.appName, "Code");
        CHECK_TRUE(snap.screenSnapshot.has_value());
        CHECK_TRUE(snap.audioSession.has_value());
        CHECK_TRUE(snap.userIntent.has_value());
        CHECK_EQ(*snap.userIntent, "coding");

        auto overridden = fx.engine.update(std::nullopt, std::nullopt, std::string("Terminal"));
        CHECK_EQ(overridden.appName, "Terminal");
        CHECK_EQ(fx.engine.currentSnapshot()->appName, "Terminal");
        CHECK_EQ(fx.engine.getContextSnapshots(2).size(), 2u);
    }});

    tests.push_back({"ContextEngine_InferUserIntent", []() {
        CHECK_EQ(*ContextEngine::inferUserIntent("Compose a reply"), "email_composition");
        CHECK_EQ(*ContextEngine::inferUserIntent("look up flights"), "information_search");
        CHECK_EQ(*ContextEngine::inferUserIntent("team meeting at 3"), "communication");
        CHECK_FALSE(ContextEngine::inferUserIntent("weather is nice").has_value());
        CHECK_FALSE(ContextEngine::inferUserIntent("   ").has_value());
    }});

    tests.push_back({"ContextEngine_ConcurrentUpdatesAreSerialized", []() {
        ErrorHandler logger{ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Error, true}};
        ContextEngine engine(logger, ContextEngine::Options{1000});
        engine.setHourSource([]() { return 12; });
        engine.addContextPattern(makePattern("all", "*"));
        std::atomic<int> fired{0};
        engine.setTriggerCallback([&](const Trigger&) { fired++; });
        engine.start();

        std::thread screen([&]() {
            for (int i = 0; i < 200; ++i) engine.update(makeScreen("Chrome", "t", std::to_string(i)), std::nullopt);
        });
        std::thread audio([&]() {
            for (int i = 0; i < 200; ++i) engine.update(std::nullopt, makeAudio(std::to_string(i)));
        });
        screen.join();
        audio.join();

        CHECK_EQ(fired.load(), 400);
        CHECK_EQ(engine.getStatus().snapshotsRecorded, 400u);
        CHECK_EQ(engine.getContextSnapshots().size(), 400u);
    }});

    return mini_test::run(tests);
}
