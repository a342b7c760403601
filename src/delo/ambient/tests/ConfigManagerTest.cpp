#include "delo/ambient/AssistantConfig.h"
#include "delo/ambient/ConfigManager.h"
#include "MiniTest.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

using namespace delo::ambient;

static bool containsAny(const std::vector<std::string>& xs, const std::string& needle) {
    for (const auto& x : xs) {
        if (x.find(needle) != std::string::npos) return true;
    }
    return false;
}

static void setEnvVar(const std::string& k, const std::string& v) {
#if defined(_WIN32)
    _putenv_s(k.c_str(), v.c_str());
#else
    setenv(k.c_str(), v.c_str(), 1);
#endif
}

static void unsetEnvVar(const std::string& k) {
#if defined(_WIN32)
    _putenv_s(k.c_str(), "");
#else
    unsetenv(k.c_str());
#endif
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"defaults_are_valid", []() {
        ConfigManager cm;
        const auto issues = cm.validate();
        CHECK_FALSE(ConfigManager::hasHardValidationErrors(issues));

        auto v = cm.get("perception.audio_silence_timeout_ms");
        CHECK_TRUE(v.has_value());
        CHECK_EQ(v->get<int>(), 2000);
        CHECK_FALSE(cm.get("perception.no_such_key").has_value());
    }});

    tests.push_back({"load_from_string_merges_defaults", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"router":{"fuzzy_threshold":0.8},"ultra_lightweight":true})", &err));
        CHECK_EQ(cm.get("router.fuzzy_threshold")->get<double>(), 0.8);
        CHECK_TRUE(cm.get("ultra_lightweight")->get<bool>());
        // 未给出的 section 保持默认
        CHECK_EQ(cm.get("history.max_entries")->get<int>(), 50);

        CHECK_TRUE(cm.set("context.quiet_hours_start", 22, &err));
        CHECK_EQ(cm.get("context.quiet_hours_start")->get<int>(), 22);
        CHECK_FALSE(cm.set("", 1, &err));
    }});

    tests.push_back({"parse_error_does_not_overwrite_old_config", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"history":{"max_entries":7}})", &err));
        const auto before = cm.getRaw().dump();
        CHECK_FALSE(cm.loadFromString(R"({"history":)", &err));
        CHECK_TRUE(err.errorType == ErrorType::InvalidConfig);
        CHECK_FALSE(cm.loadFromString("[1,2]", &err));
        CHECK_EQ(before, cm.getRaw().dump());
    }});

    tests.push_back({"load_missing_file_falls_back_to_default", []() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const auto dir = std::filesystem::temp_directory_path() / ("delo_cfg_" + std::to_string(stamp));
        const auto path = dir / "config.json";

        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromFile(path.string(), &err));
        CHECK_TRUE(err.details.has_value());
        CHECK_EQ(err.details->at("fallback").get<std::string>(), "default_config");
        CHECK_TRUE(std::filesystem::exists(path));

        // 生成的模板可以再次加载
        ConfigManager again;
        ErrorInfo err2;
        CHECK_TRUE(again.loadFromFile(path.string(), &err2));
        CHECK_FALSE(ConfigManager::hasHardValidationErrors(again.validate()));

        std::filesystem::remove_all(dir);
    }});

    tests.push_back({"validate_reports_ranges_and_types", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({
            "platform": "beos",
            "perception": {"volume_threshold": 1.5, "audio_silence_timeout_ms": 50},
            "context": {"quiet_hours_start": 25},
            "router": {"fuzzy_threshold": 0},
            "logging": {"min_level": "verbose"}
        })", &err));
        const auto issues = cm.validate();
        CHECK_TRUE(ConfigManager::hasHardValidationErrors(issues));
        CHECK_TRUE(containsAny(issues, "platform"));
        CHECK_TRUE(containsAny(issues, "perception.volume_threshold"));
        CHECK_TRUE(containsAny(issues, "perception.audio_silence_timeout_ms"));
        CHECK_TRUE(containsAny(issues, "context.quiet_hours_start"));
        CHECK_TRUE(containsAny(issues, "router.fuzzy_threshold"));
        CHECK_TRUE(containsAny(issues, "logging.min_level"));
    }});

    tests.push_back({"validate_warnings_are_soft", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({
            "perception": {"screen_sample_interval_ms": 5000},
            "context": {"quiet_hours_start": 22, "quiet_hours_end": -1}
        })", &err));
        const auto issues = cm.validate();
        CHECK_TRUE(containsAny(issues, "WARN: 'perception.screen_sample_interval_ms'"));
        CHECK_TRUE(containsAny(issues, "WARN: quiet hours"));
        CHECK_FALSE(ConfigManager::hasHardValidationErrors(issues));
    }});

    tests.push_back({"env_mapping_and_placeholders", []() {
        setEnvVar("DELO_ULTRA_LIGHTWEIGHT", "yes");
        setEnvVar("DELO_SILENCE_TIMEOUT_MS", "3500");
        setEnvVar("DELO_TEST_OCR_BIN", "/opt/ocr/bin/ocr");

        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"capture":{"text_command":"${DELO_TEST_OCR_BIN} --app {app}"}})", &err));
        CHECK_TRUE(cm.get("ultra_lightweight")->get<bool>());
        CHECK_EQ(cm.get("perception.audio_silence_timeout_ms")->get<int>(), 3500);
        CHECK_EQ(cm.get("capture.text_command")->get<std::string>(), "/opt/ocr/bin/ocr --app {app}");

        unsetEnvVar("DELO_ULTRA_LIGHTWEIGHT");
        unsetEnvVar("DELO_SILENCE_TIMEOUT_MS");
        unsetEnvVar("DELO_TEST_OCR_BIN");

        // 未设置的占位符保持原样
        ConfigManager raw;
        CHECK_TRUE(raw.loadFromString(R"({"history":{"path":"${DELO_TEST_UNSET_VAR}/h.json"}})", &err));
        CHECK_EQ(raw.get("history.path")->get<std::string>(), "${DELO_TEST_UNSET_VAR}/h.json");
    }});

    // ========== AssistantConfig ==========
    tests.push_back({"assistant_config_from_config", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({
            "platform": "macos",
            "perception": {"volume_threshold": 0.25, "min_utterance_ms": 800},
            "context": {"quiet_hours_start": 22, "quiet_hours_end": 7},
            "router": {"clarifier_timeout_ms": 1500},
            "history": {"max_entries": 20, "path": "/tmp/h.json"},
            "logging": {"min_level": "Debug"}
        })", &err));

        const auto c = AssistantConfig::fromConfig(cm);
        CHECK_TRUE(c.platform == Platform::MacOS);
        CHECK_TRUE(c.volumeThreshold == 0.25f);
        CHECK_EQ(c.minUtteranceMs, 800u);
        CHECK_TRUE(c.quietHoursStart == std::optional<int>(22));
        CHECK_TRUE(c.quietHoursEnd == std::optional<int>(7));
        CHECK_EQ(c.clarifierTimeoutMs, 1500u);
        CHECK_EQ(c.historyMaxEntries, static_cast<size_t>(20));
        CHECK_EQ(c.historyPath, "/tmp/h.json");
        CHECK_TRUE(c.logLevel == ErrorHandler::LogLevel::Debug);
        CHECK_EQ(c.audioSilenceTimeoutMs, 2000u);
    }});

    tests.push_back({"assistant_config_partial_quiet_hours_ignored", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"context": {"quiet_hours_start": 22}, "perception": {"max_history": "x"}})",
                                     &err));
        const auto c = AssistantConfig::fromConfig(cm);
        CHECK_FALSE(c.quietHoursStart.has_value());
        CHECK_FALSE(c.quietHoursEnd.has_value());
        // 类型错误时回退默认值
        CHECK_EQ(c.perceptionMaxHistory, static_cast<size_t>(100));
    }});

    return mini_test::run(tests);
}
