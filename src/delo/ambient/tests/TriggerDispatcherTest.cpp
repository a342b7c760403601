#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/TriggerDispatcher.h"
#include "MiniTest.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace delo::ambient;
using namespace delo::ambient::types;

static Trigger makeTrigger(const std::string& name) {
    Trigger t;
    t.patternName = name;
    t.triggerActions = {"help"};
    t.firedAt = nowTimestamp();
    return t;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"TriggerDispatcher_DispatchesInOrder", []() {
        ErrorHandler logger;
        std::mutex mu;
        std::vector<std::string> seen;
        TriggerDispatcher dispatcher([&](const Trigger& t) {
            std::lock_guard<std::mutex> lock(mu);
            seen.push_back(t.patternName);
        }, logger);

        dispatcher.start();
        CHECK_TRUE(dispatcher.isRunning());
        for (int i = 0; i < 20; ++i) CHECK_TRUE(dispatcher.enqueue(makeTrigger("p" + std::to_string(i))));
        CHECK_TRUE(dispatcher.waitUntilIdle(std::chrono::seconds(5)));

        {
            std::lock_guard<std::mutex> lock(mu);
            CHECK_EQ(seen.size(), 20u);
            CHECK_EQ(seen.front(), "p0");
            CHECK_EQ(seen.back(), "p19");
        }
        auto stats = dispatcher.getStatistics();
        CHECK_EQ(stats.totalEnqueued, 20u);
        CHECK_EQ(stats.totalDispatched, 20u);
        CHECK_EQ(stats.currentSize, 0u);
        dispatcher.stop();
        CHECK_FALSE(dispatcher.isRunning());
    }});

    tests.push_back({"TriggerDispatcher_FullQueueDrops", []() {
        ErrorHandler logger{ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Error, true}};
        std::atomic<int> handled{0};
        TriggerDispatcher dispatcher([&](const Trigger&) { handled++; }, logger, 2);

        // 未启动时只排队
        CHECK_TRUE(dispatcher.enqueue(makeTrigger("a")));
        CHECK_TRUE(dispatcher.enqueue(makeTrigger("b")));
        CHECK_FALSE(dispatcher.enqueue(makeTrigger("c")));
        auto stats = dispatcher.getStatistics();
        CHECK_EQ(stats.totalDropped, 1u);
        CHECK_EQ(stats.currentSize, 2u);
        CHECK_EQ(stats.maxSize, 2u);

        dispatcher.start();
        CHECK_TRUE(dispatcher.waitUntilIdle(std::chrono::seconds(5)));
        CHECK_EQ(handled.load(), 2);
    }});

    tests.push_back({"TriggerDispatcher_HandlerFailureCounted", []() {
        ErrorHandler logger;
        std::vector<std::string> lines;
        std::mutex mu;
        logger.setSink([&](ErrorHandler::LogLevel, const std::string& line) {
            std::lock_guard<std::mutex> lock(mu);
            lines.push_back(line);
        });
        TriggerDispatcher dispatcher([](const Trigger& t) {
            if (t.patternName == "bad") throw std::runtime_error("router exploded");
        }, logger);

        dispatcher.start();
        dispatcher.enqueue(makeTrigger("bad"));
        dispatcher.enqueue(makeTrigger("good"));
        CHECK_TRUE(dispatcher.waitUntilIdle(std::chrono::seconds(5)));

        auto stats = dispatcher.getStatistics();
        CHECK_EQ(stats.totalDispatched, 2u);
        CHECK_EQ(stats.handlerFailures, 1u);
        std::lock_guard<std::mutex> lock(mu);
        CHECK_EQ(lines.size(), 1u);
        CHECK_TRUE(lines[0].find("router exploded") != std::string::npos);
    }});

    tests.push_back({"TriggerDispatcher_StopDrainsQueue", []() {
        ErrorHandler logger;
        std::atomic<int> handled{0};
        TriggerDispatcher dispatcher([&](const Trigger&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            handled++;
        }, logger);

        dispatcher.start();
        for (int i = 0; i < 10; ++i) dispatcher.enqueue(makeTrigger("t"));
        dispatcher.stop();
        CHECK_EQ(handled.load(), 10);
        CHECK_EQ(dispatcher.getStatistics().totalDispatched, 10u);
        dispatcher.stop();
    }});

    return mini_test::run(tests);
}
