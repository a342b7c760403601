#include "delo/ambient/FilterStore.h"
#include "MiniTest.h"

#include <string>
#include <vector>

using namespace delo::ambient;
using namespace delo::ambient::types;

static AppFilter makeAppFilter(const std::string& name, bool white, bool black,
                               std::vector<std::string> patterns = {}) {
    AppFilter f;
    f.appName = name;
    f.isWhitelisted = white;
    f.isBlacklisted = black;
    f.windowPatterns = std::move(patterns);
    return f;
}

static AudioFilter makeAudioFilter(const std::string& name, float threshold, std::vector<std::string> keywords = {}) {
    AudioFilter f;
    f.sourceName = name;
    f.volumeThreshold = threshold;
    f.keywords = std::move(keywords);
    return f;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    // ========== 注册校验 ==========
    tests.push_back({"FilterStore_RejectsInvalidAppFilters", []() {
        FilterStore store;
        ErrorInfo err;
        CHECK_FALSE(store.addAppFilter(makeAppFilter("", false, true), &err));
        CHECK_TRUE(err.errorType == ErrorType::InvalidConfig);

        CHECK_FALSE(store.addAppFilter(makeAppFilter("Chrome", true, true), &err));
        CHECK_TRUE(err.message.find("both") != std::string::npos);
        CHECK_EQ(store.listAppFilters().size(), 0u);
    }});

    tests.push_back({"FilterStore_RejectsOutOfRangeVolume", []() {
        FilterStore store;
        ErrorInfo err;
        CHECK_FALSE(store.addAudioFilter(makeAudioFilter("microphone", 1.5f), &err));
        CHECK_FALSE(store.addAudioFilter(makeAudioFilter("microphone", -0.1f), &err));
        CHECK_TRUE(store.addAudioFilter(makeAudioFilter("microphone", 0.0f), &err));
        CHECK_TRUE(store.addAudioFilter(makeAudioFilter("microphone", 1.0f), &err));
        CHECK_EQ(store.listAudioFilters().size(), 1u);
    }});

    tests.push_back({"FilterStore_ReAddReplacesCaseInsensitive", []() {
        FilterStore store;
        CHECK_TRUE(store.addAppFilter(makeAppFilter("Chrome", false, true)));
        CHECK_TRUE(store.addAppFilter(makeAppFilter("chrome", true, false)));
        auto list = store.listAppFilters();
        CHECK_EQ(list.size(), 1u);
        CHECK_TRUE(list[0].isWhitelisted);
        CHECK_TRUE(store.removeAppFilter("CHROME"));
        CHECK_FALSE(store.removeAppFilter("chrome"));
    }});

    // ========== 判定 ==========
    tests.push_back({"FilterStore_BlacklistBlocksApp", []() {
        FilterStore store;
        CHECK_TRUE(store.shouldMonitorApp("Chrome", "Inbox"));
        store.addAppFilter(makeAppFilter("Chrome", false, true));
        CHECK_FALSE(store.shouldMonitorApp("Chrome", "Inbox"));
        CHECK_FALSE(store.shouldMonitorApp("chrome", "anything"));
        CHECK_TRUE(store.shouldMonitorApp("Slack", "general"));
    }});

    tests.push_back({"FilterStore_WhitelistRestrictsOtherApps", []() {
        FilterStore store;
        store.addAppFilter(makeAppFilter("Code", true, false));
        CHECK_TRUE(store.shouldMonitorApp("Code", "main.cpp"));
        CHECK_FALSE(store.shouldMonitorApp("Slack", "general"));
    }});

    tests.push_back({"FilterStore_WhitelistWindowPatterns", []() {
        FilterStore store;
        store.addAppFilter(makeAppFilter("Chrome", true, false, {"Gmail", "Calendar"}));
        CHECK_TRUE(store.shouldMonitorApp("Chrome", "Inbox - gmail"));
        CHECK_TRUE(store.shouldMonitorApp("Chrome", "Google Calendar"));
        CHECK_FALSE(store.shouldMonitorApp("Chrome", "YouTube"));
    }});

    tests.push_back({"FilterStore_AudioRules", []() {
        FilterStore store;
        CHECK_TRUE(store.shouldCaptureAudio("microphone"));
        CHECK_TRUE(store.volumeThresholdFor("microphone", 0.1f) == 0.1f);

        AudioFilter black = makeAudioFilter("system", 0.2f);
        black.isBlacklisted = true;
        store.addAudioFilter(black);
        CHECK_FALSE(store.shouldCaptureAudio("System"));

        store.addAudioFilter(makeAudioFilter("microphone", 0.3f, {"meeting", "deadline"}));
        CHECK_TRUE(store.volumeThresholdFor("Microphone", 0.1f) == 0.3f);
        CHECK_TRUE(store.matchesAudioKeywords("microphone", "The Meeting starts soon"));
        CHECK_FALSE(store.matchesAudioKeywords("microphone", "lunch time"));
        CHECK_TRUE(store.matchesAudioKeywords("other", "lunch time"));
    }});

    // ========== 导入/导出 ==========
    tests.push_back({"FilterStore_JsonRoundTripAndRejects", []() {
        FilterStore store;
        store.addAppFilter(makeAppFilter("Chrome", false, true));
        store.addAudioFilter(makeAudioFilter("microphone", 0.25f, {"hello"}));
        auto j = store.toJson();

        FilterStore copy;
        CHECK_TRUE(copy.loadFromJson(j));
        CHECK_EQ(copy.listAppFilters().size(), 1u);
        CHECK_EQ(copy.listAudioFilters().size(), 1u);
        CHECK_FALSE(copy.shouldMonitorApp("Chrome", ""));

        nlohmann::json bad = {
            {"app_filters", nlohmann::json::array({
                {{"app_name", "Slack"}, {"is_whitelisted", true}, {"is_blacklisted", true}},
                {{"app_name", "Zoom"}, {"is_blacklisted", true}},
            })},
        };
        FilterStore partial;
        ErrorInfo err;
        CHECK_FALSE(partial.loadFromJson(bad, &err));
        CHECK_EQ(partial.listAppFilters().size(), 1u);
        CHECK_TRUE(err.details.has_value());
        CHECK_EQ(err.details->at("rejected").size(), 1u);
    }});

    return mini_test::run(tests);
}
