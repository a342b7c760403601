#include "delo/ambient/AssistantService.h"
#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/RecordStore.h"
#include "MiniTest.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace delo::ambient;
using namespace delo::ambient::types;

class FakeCapture : public ScreenCapture {
public:
    void setForeground(const std::string& app, const std::string& title) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_frame = ScreenFrame{app, title, 7, 4242, nowTimestamp()};
    }
    std::optional<ScreenFrame> captureForeground() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_frame;
    }
    std::string getLastError() const override { return "no window"; }

private:
    std::mutex m_mutex;
    std::optional<ScreenFrame> m_frame;
};

class FakeExtractor : public TextExtractor {
public:
    void setText(const std::string& t) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_text = t;
    }
    std::optional<std::string> extract(const ScreenFrame&, ErrorInfo*) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_text;
    }

private:
    std::mutex m_mutex;
    std::string m_text;
};

// 有声窗口返回固定文本
class FakeTranscriber : public Transcriber {
public:
    explicit FakeTranscriber(std::string text) : m_text(std::move(text)) {}
    std::optional<std::string> transcribe(const AudioChunk& chunk, ErrorInfo*) override {
        if (AudioSentinel::computeLevel(chunk.samples) < 0.05f) return std::string();
        return m_text;
    }

private:
    std::string m_text;
};

class FakeUrlOpener : public UrlOpener {
public:
    bool openExternal(const std::string& target, ErrorInfo*) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_opened.push_back(target);
        return true;
    }
    std::vector<std::string> opened() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_opened;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_opened;
};

// 记录收到的上下文
class RecordingClarifier : public Clarifier {
public:
    std::optional<Clarification> clarify(const std::string&, const std::string& context, ErrorInfo*) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_contexts.push_back(context);
        Clarification c;
        c.clarifiedIntent = "search for restaurants";
        c.actionSteps = {"search for restaurants"};
        return c;
    }
    std::vector<std::string> contexts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_contexts;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_contexts;
};

struct Fixture {
    ErrorHandler logger{ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Error, true}};
    std::shared_ptr<FakeCapture> capture = std::make_shared<FakeCapture>();
    std::shared_ptr<FakeExtractor> extractor = std::make_shared<FakeExtractor>();
    std::shared_ptr<FakeUrlOpener> opener = std::make_shared<FakeUrlOpener>();
    std::shared_ptr<RecordingClarifier> clarifier = std::make_shared<RecordingClarifier>();
    std::shared_ptr<InMemoryRecordStore> records = std::make_shared<InMemoryRecordStore>();

    AssistantService::Capabilities caps() const {
        AssistantService::Capabilities c;
        c.screenCapture = capture;
        c.textExtractor = extractor;
        c.transcriber = std::make_shared<FakeTranscriber>("the deadline is friday");
        c.clarifier = clarifier;
        c.urlOpener = opener;
        c.recordStore = records;
        return c;
    }

    static AssistantConfig config() {
        AssistantConfig cfg;
        cfg.platform = Platform::Linux;
        return cfg;
    }
};

static ContextPattern makePattern(const std::string& name, const std::string& app,
                                  std::vector<std::string> screenKeywords, std::vector<std::string> audioKeywords,
                                  std::vector<std::string> actions) {
    ContextPattern p;
    p.patternName = name;
    p.appName = app;
    p.screenKeywords = std::move(screenKeywords);
    p.audioKeywords = std::move(audioKeywords);
    p.triggerActions = std::move(actions);
    return p;
}

static AudioChunk makeChunk(float amplitude, uint32_t startMs) {
    AudioChunk c;
    c.sourceName = "microphone";
    c.sampleRate = 16000;
    c.samples.assign(1600, amplitude);
    c.capturedAt = fromUnixMillis(1700000000000ULL) + std::chrono::milliseconds(startMs);
    return c;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    // ========== 命令 ==========
    tests.push_back({"AssistantService_ExecuteCommandRecordsHistory", []() {
        Fixture fx;
        AssistantService service(Fixture::config(), fx.caps(), fx.logger);
        CHECK_TRUE(service.initialize());

        auto r = service.executeCommand("search for cats");
        CHECK_TRUE(r.success);
        CHECK_EQ(fx.opener->opened().size(), 1u);

        service.executeCommand("   ");
        auto history = service.getCommandHistory();
        CHECK_EQ(history.size(), 1u);
        CHECK_EQ(history[0].command, "search for cats");
        CHECK_TRUE(history[0].success);
        CHECK_EQ(fx.records->count("command_results"), 2u);

        auto suggestions = service.getCommandSuggestions("sea");
        CHECK_FALSE(suggestions.empty());
        CHECK_EQ(suggestions[0], "search for cats");
    }});

    tests.push_back({"AssistantService_ClarifierSeesCurrentContext", []() {
        Fixture fx;
        AssistantService service(Fixture::config(), fx.caps(), fx.logger);
        CHECK_TRUE(service.initialize());

        fx.capture->setForeground("Slack", "#dinner-plans");
        fx.extractor->setText("where should we eat tonight");
        CHECK_TRUE(service.screenSentinel().sample().has_value());

        auto r = service.executeCommand("book a table for two", "console");
        CHECK_TRUE(r.needsConfirmation());
        auto contexts = fx.clarifier->contexts();
        CHECK_EQ(contexts.size(), 1u);
        CHECK_EQ(contexts[0], "Active app: Slack; Window: #dinner-plans");

        auto pending = service.router().pendingRequestFor("console");
        CHECK_TRUE(pending.has_value());
        auto confirmed = service.confirmAndExecute(*pending, "yes");
        CHECK_TRUE(confirmed.executed);
        CHECK_TRUE(confirmed.success);
        // 原始命令 + 确认执行各一条
        CHECK_EQ(service.getCommandHistory().size(), 2u);
    }});

    // ========== 感知 -> Trigger -> 命令 ==========
    tests.push_back({"AssistantService_ScreenTriggerRunsAction", []() {
        Fixture fx;
        AssistantService service(Fixture::config(), fx.caps(), fx.logger);
        CHECK_TRUE(service.initialize());
        CHECK_TRUE(service.startContextManager());
        CHECK_TRUE(service.addContextPattern(
            makePattern("crash-helper", "Code", {"segfault"}, {}, {"search for segmentation fault"})));

        fx.capture->setForeground("Code", "main.cpp");
        fx.extractor->setText("Program crashed: segfault in main");
        CHECK_TRUE(service.screenSentinel().sample().has_value());
        CHECK_TRUE(service.waitForIdle(std::chrono::seconds(5)));

        auto results = fx.records->query(RecordQuery{"trigger_results", 0, std::nullopt, std::nullopt});
        CHECK_EQ(results.size(), 1u);
        CHECK_EQ(results[0].at("pattern_name").get<std::string>(), "crash-helper");
        CHECK_TRUE(results[0].at("result").at("success").get<bool>());
        auto opened = fx.opener->opened();
        CHECK_EQ(opened.size(), 1u);
        CHECK_EQ(opened[0], "https://www.google.com/search?q=segmentation%20fault");

        CHECK_EQ(fx.records->count("screen_snapshots"), 1u);
        CHECK_EQ(fx.records->count("context_snapshots"), 1u);
        CHECK_EQ(service.getContextSnapshots().size(), 1u);
        // Trigger 动作不写入用户命令历史
        CHECK_EQ(service.getCommandHistory().size(), 0u);
    }});

    tests.push_back({"AssistantService_AudioTriggerRunsAction", []() {
        Fixture fx;
        AssistantService service(Fixture::config(), fx.caps(), fx.logger);
        CHECK_TRUE(service.initialize());
        CHECK_TRUE(service.startContextManager());
        CHECK_TRUE(service.addContextPattern(makePattern("deadline", "", {}, {"deadline"}, {"help"})));

        for (uint32_t t = 0; t < 1000; t += 100) service.audioSentinel().feed(makeChunk(0.5f, t));
        for (uint32_t t = 1000; t < 3100; t += 100) service.audioSentinel().feed(makeChunk(0.0f, t));
        CHECK_TRUE(service.waitForIdle(std::chrono::seconds(5)));

        auto sessions = service.getAudioSessions();
        CHECK_EQ(sessions.size(), 1u);
        CHECK_EQ(sessions[0].transcript, "the deadline is friday");
        CHECK_EQ(service.searchTranscripts("FRIDAY").size(), 1u);

        auto results = fx.records->query(RecordQuery{"trigger_results", 0, std::nullopt, std::nullopt});
        CHECK_EQ(results.size(), 1u);
        CHECK_EQ(results[0].at("action").get<std::string>(), "help");
        CHECK_EQ(fx.records->count("audio_sessions"), 1u);
    }});

    tests.push_back({"AssistantService_QuietHoursSuppressTriggers", []() {
        Fixture fx;
        AssistantService service(Fixture::config(), fx.caps(), fx.logger);
        CHECK_TRUE(service.initialize());
        CHECK_TRUE(service.startContextManager());
        service.contextEngine().setHourSource([]() { return 23; });
        CHECK_TRUE(service.setQuietHours(22, 7));
        CHECK_TRUE(service.addContextPattern(
            makePattern("crash-helper", "Code", {"segfault"}, {}, {"search for segmentation fault"})));

        fx.capture->setForeground("Code", "main.cpp");
        fx.extractor->setText("segfault again");
        service.screenSentinel().sample();
        CHECK_TRUE(service.waitForIdle(std::chrono::seconds(5)));

        CHECK_EQ(fx.records->count("trigger_results"), 0u);
        CHECK_EQ(fx.opener->opened().size(), 0u);
        auto status = service.getStatus();
        CHECK_EQ(status.at("context").at("triggers_suppressed").get<uint64_t>(), 1u);
        CHECK_TRUE(status.at("context").at("is_quiet_hours").get<bool>());
    }});

    // ========== 配置 ==========
    tests.push_back({"AssistantService_UltraLightweightDisablesPerception", []() {
        Fixture fx;
        auto cfg = Fixture::config();
        cfg.ultraLightweight = true;
        AssistantService service(cfg, fx.caps(), fx.logger);
        CHECK_TRUE(service.initialize());
        CHECK_FALSE(service.startScreenPerception());
        CHECK_FALSE(service.startAudioPerception());
        CHECK_FALSE(service.screenSentinel().isRunning());
        CHECK_TRUE(service.startContextManager());
        CHECK_TRUE(service.executeCommand("search for cats").success);
    }});

    tests.push_back({"AssistantService_InvalidConfiguredQuietHours", []() {
        Fixture fx;
        auto cfg = Fixture::config();
        cfg.quietHoursStart = 30;
        cfg.quietHoursEnd = 7;
        AssistantService service(cfg, fx.caps(), fx.logger);
        ErrorInfo err;
        CHECK_FALSE(service.initialize(&err));
        CHECK_TRUE(err.errorType == ErrorType::InvalidConfig);
        // 服务仍可用
        CHECK_TRUE(service.executeCommand("search for cats").success);
    }});

    tests.push_back({"AssistantService_StatusShapeAndShutdown", []() {
        Fixture fx;
        AssistantService service(Fixture::config(), fx.caps(), fx.logger);
        CHECK_TRUE(service.initialize());
        service.executeCommand("search for cats");

        auto status = service.getStatus();
        CHECK_EQ(status.at("platform").get<std::string>(), "linux");
        CHECK_FALSE(status.at("ultra_lightweight").get<bool>());
        CHECK_TRUE(status.contains("screen"));
        CHECK_TRUE(status.contains("audio"));
        CHECK_EQ(status.at("router").at("statistics").at("search").get<uint64_t>(), 1u);
        CHECK_EQ(status.at("history_entries").get<size_t>(), 1u);
        CHECK_EQ(status.at("triggers").at("dropped").get<uint64_t>(), 0u);

        service.shutdown();
        service.shutdown();
        CHECK_FALSE(service.screenSentinel().isRunning());
        CHECK_FALSE(service.contextEngine().isActive());
    }});

    return mini_test::run(tests);
}
