#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/FilterStore.h"
#include "delo/ambient/ScreenSentinel.h"
#include "MiniTest.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace delo::ambient;
using namespace delo::ambient::types;

// 可控的前台窗口
class FakeCapture : public ScreenCapture {
public:
    void setForeground(const std::string& app, const std::string& title) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_frame = ScreenFrame{app, title, 1, 100, nowTimestamp()};
    }
    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_frame.reset();
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

// 返回预设文本；mode 控制失败/抛异常
class FakeExtractor : public TextExtractor {
public:
    enum class Mode { Ok, Fail, Throw };

    void setText(const std::string& t) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_text = t;
    }
    void setMode(Mode m) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_mode = m;
    }
    int calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }
    std::optional<std::string> extract(const ScreenFrame&, ErrorInfo* err) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls++;
        if (m_mode == Mode::Throw) throw std::runtime_error("ocr crashed");
        if (m_mode == Mode::Fail) {
            if (err) *err = ErrorInfo::make(ErrorType::SensingError, "ocr unavailable");
            return std::nullopt;
        }
        return m_text;
    }

private:
    mutable std::mutex m_mutex;
    std::string m_text;
    Mode m_mode{Mode::Ok};
    int m_calls{0};
};

struct Fixture {
    ErrorHandler logger;
    FilterStore filters;
    std::shared_ptr<FakeCapture> capture = std::make_shared<FakeCapture>();
    std::shared_ptr<FakeExtractor> extractor = std::make_shared<FakeExtractor>();
    std::vector<std::string> logLines;
    std::mutex logMutex;

    Fixture() {
        logger.setSink([this](ErrorHandler::LogLevel, const std::string& line) {
            std::lock_guard<std::mutex> lock(logMutex);
            logLines.push_back(line);
        });
    }

    ScreenSentinel::Options options(double diffThreshold = 0.0) const {
        ScreenSentinel::Options o;
        o.sampleIntervalMs = 60000;
        o.diffThreshold = diffThreshold;
        o.maxHistory = 10;
        return o;
    }
};

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    // ========== 内容比较 ==========
    tests.push_back({"ScreenSentinel_UnchangedContentEmitsOnce", []() {
        Fixture fx;
        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, fx.options());
        fx.capture->setForeground("Chrome", "Inbox");
        fx.extractor->setText("Hello world");

        int emitted = 0;
        sentinel.setSnapshotCallback([&](const ScreenSnapshot&) { emitted++; });

        auto first = sentinel.sample();
        CHECK_TRUE(first.has_value());
        CHECK_EQ(first->appName, "Chrome");
        CHECK_EQ(first->extractedText, "Hello world");
        CHECK_FALSE(sentinel.sample().has_value());
        CHECK_FALSE(sentinel.sample().has_value());
        CHECK_EQ(emitted, 1);

        auto stats = sentinel.getStats();
        CHECK_EQ(stats.ticks, 3u);
        CHECK_EQ(stats.emitted, 1u);
        CHECK_EQ(stats.skippedUnchanged, 2u);

        fx.extractor->setText("Hello world, new mail");
        auto changed = sentinel.sample();
        CHECK_TRUE(changed.has_value());
        CHECK_NE(changed->contentHash, first->contentHash);
        CHECK_EQ(sentinel.getRecentSnapshots().size(), 2u);
    }});

    tests.push_back({"ScreenSentinel_HashTrackedPerApp", []() {
        Fixture fx;
        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, fx.options());
        fx.extractor->setText("same text");
        fx.capture->setForeground("Chrome", "a");
        CHECK_TRUE(sentinel.sample().has_value());
        fx.capture->setForeground("Slack", "b");
        CHECK_TRUE(sentinel.sample().has_value());
        fx.capture->setForeground("Chrome", "a");
        CHECK_FALSE(sentinel.sample().has_value());

        sentinel.resetDiffState();
        CHECK_TRUE(sentinel.sample().has_value());
    }});

    tests.push_back({"ScreenSentinel_DiffThresholdSuppressesNearDuplicates", []() {
        Fixture fx;
        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, fx.options(0.5));
        fx.capture->setForeground("Code", "main.cpp");
        fx.extractor->setText("int main return zero");
        CHECK_TRUE(sentinel.sample().has_value());
        // 词集合相似度 3/5 = 0.6 >= 0.5
        fx.extractor->setText("int main return one");
        CHECK_FALSE(sentinel.sample().has_value());
        fx.extractor->setText("completely different words here");
        CHECK_TRUE(sentinel.sample().has_value());
    }});

    // ========== 过滤 ==========
    tests.push_back({"ScreenSentinel_BlacklistedAppProducesNothing", []() {
        Fixture fx;
        AppFilter f;
        f.appName = "Chrome";
        f.isBlacklisted = true;
        CHECK_TRUE(fx.filters.addAppFilter(f));

        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, fx.options());
        fx.capture->setForeground("Chrome", "Bank account");
        fx.extractor->setText("secret");
        CHECK_FALSE(sentinel.sample().has_value());
        CHECK_EQ(fx.extractor->calls(), 0);
        CHECK_EQ(sentinel.getStats().skippedFiltered, 1u);
        CHECK_EQ(sentinel.getRecentSnapshots().size(), 0u);
    }});

    // ========== 失败恢复 ==========
    tests.push_back({"ScreenSentinel_ExtractionFailureIsLoggedAndSkipped", []() {
        Fixture fx;
        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, fx.options());
        fx.capture->setForeground("Chrome", "Inbox");

        fx.extractor->setMode(FakeExtractor::Mode::Fail);
        CHECK_FALSE(sentinel.sample().has_value());
        fx.extractor->setMode(FakeExtractor::Mode::Throw);
        CHECK_FALSE(sentinel.sample().has_value());
        CHECK_EQ(sentinel.getStats().failures, 2u);
        {
            std::lock_guard<std::mutex> lock(fx.logMutex);
            CHECK_EQ(fx.logLines.size(), 2u);
            CHECK_TRUE(fx.logLines[0].find("SensingError") != std::string::npos);
        }

        fx.extractor->setMode(FakeExtractor::Mode::Ok);
        fx.extractor->setText("recovered");
        CHECK_TRUE(sentinel.sample().has_value());
    }});

    tests.push_back({"ScreenSentinel_NoForegroundWindow", []() {
        Fixture fx;
        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, fx.options());
        fx.capture->clear();
        CHECK_FALSE(sentinel.sample().has_value());
        CHECK_EQ(sentinel.getStats().failures, 0u);
    }});

    tests.push_back({"ScreenSentinel_HistoryBounded", []() {
        Fixture fx;
        auto o = fx.options();
        o.maxHistory = 3;
        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, o);
        fx.capture->setForeground("Notes", "n");
        for (int i = 0; i < 5; ++i) {
            fx.extractor->setText("note " + std::to_string(i));
            sentinel.sample();
        }
        auto all = sentinel.getRecentSnapshots();
        CHECK_EQ(all.size(), 3u);
        CHECK_EQ(all.back().extractedText, "note 4");
        auto last = sentinel.getRecentSnapshots(1);
        CHECK_EQ(last.size(), 1u);
        CHECK_EQ(last[0].extractedText, "note 4");
    }});

    // ========== 生命周期 ==========
    tests.push_back({"ScreenSentinel_StartSamplesImmediatelyAndStopIsIdempotent", []() {
        Fixture fx;
        ScreenSentinel sentinel(fx.filters, fx.capture, fx.extractor, fx.logger, fx.options());
        fx.capture->setForeground("Chrome", "Inbox");
        fx.extractor->setText("page");

        CHECK_TRUE(sentinel.start());
        CHECK_FALSE(sentinel.start());
        CHECK_TRUE(sentinel.isRunning());

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (sentinel.getStats().ticks == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        CHECK_TRUE(sentinel.getStats().ticks >= 1u);

        sentinel.stop();
        sentinel.stop();
        CHECK_FALSE(sentinel.isRunning());
        CHECK_EQ(sentinel.getRecentSnapshots().size(), 1u);
    }});

    tests.push_back({"ScreenSentinel_StartRequiresCapabilities", []() {
        Fixture fx;
        ScreenSentinel sentinel(fx.filters, fx.capture, nullptr, fx.logger, fx.options());
        CHECK_FALSE(sentinel.start());
        CHECK_FALSE(sentinel.isRunning());
    }});

    return mini_test::run(tests);
}
