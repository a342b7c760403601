#include "delo/ambient/AssistantConfig.h"
#include "delo/ambient/AssistantService.h"
#include "delo/ambient/CompletionClarifier.h"
#include "delo/ambient/ConfigManager.h"
#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/ScreenCapture.h"
#include "delo/ambient/utils/AudioCapture.h"
#include "delo/ambient/utils/ProcessUtils.h"
#include "delo/ambient/utils/TextMatch.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

using delo::ambient::AssistantConfig;
using delo::ambient::AssistantService;
using delo::ambient::CommandResult;
using delo::ambient::CompletionClarifier;
using delo::ambient::ConfigManager;
using delo::ambient::ErrorHandler;
using delo::ambient::ErrorInfo;
using delo::ambient::ScreenCapture;

static void printHelp() {
    std::cout << "Commands:\n"
              << "  <text>           - run a command, e.g. \"search for react tutorial\"\n"
              << "  :yes / :no       - answer the pending confirmation\n"
              << "  :history         - show recent commands\n"
              << "  :suggest <text>  - show completions\n"
              << "  :status          - show perception/router status\n"
              << "  :help            - show this help\n"
              << "  :quit            - exit\n\n";
}

static void printCommandResult(const CommandResult& r) {
    std::cout << (r.success ? "[ OK ] " : "[FAIL] ") << r.summary() << "\n";
    if (r.execution.has_value()) {
        for (const auto& s : r.execution->action.nextSteps) std::cout << "  - " << s << "\n";
        if (r.execution->fallback.has_value()) {
            for (const auto& s : r.execution->fallback->nextSteps) std::cout << "  * " << s << "\n";
        }
    }
    if (r.route.fallback.has_value()) {
        for (const auto& s : r.route.fallback->nextSteps) std::cout << "  * " << s << "\n";
    }
    if (r.needsConfirmation() && r.route.clarification.has_value()) {
        for (const auto& s : r.route.clarification->actionSteps) std::cout << "  > " << s << "\n";
    }
}

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/delo_ambient_config.json";

    ConfigManager cfg;
    ErrorInfo err;
    // 文件不存在时会写出默认模板
    if (!cfg.loadFromFile(configPath, &err)) {
        std::cerr << "Failed to load config: " << err.toString() << "\n";
        return 1;
    }
    cfg.applyEnvironmentOverrides();

    const auto issues = cfg.validate();
    for (const auto& s : issues) {
        if (s.rfind("WARN:", 0) == 0) {
            std::cerr << "[WARN] " << s << "\n";
        } else {
            std::cerr << "[ERR ] " << s << "\n";
        }
    }
    if (ConfigManager::hasHardValidationErrors(issues)) return 1;

    const auto config = AssistantConfig::fromConfig(cfg);

    ErrorHandler logger;
    auto loggerCfg = logger.getLoggerConfig();
    loggerCfg.minLevel = config.logLevel;
    logger.setLoggerConfig(loggerCfg);

    AssistantService::Capabilities caps;
    caps.screenCapture = std::shared_ptr<ScreenCapture>(ScreenCapture::create());
    if (!config.textCommand.empty()) {
        caps.textExtractor = std::make_shared<delo::ambient::utils::CommandTextExtractor>(config.textCommand);
    }
    if (!config.transcribeCommand.empty()) {
        caps.transcriber = std::make_shared<delo::ambient::utils::CommandTranscriber>(config.transcribeCommand);
    }
    if (config.microphoneEnabled) {
        caps.audioSource = std::make_shared<delo::ambient::utils::MiniaudioCaptureSource>();
    }
    if (!config.completionCommand.empty()) {
        auto client = std::make_shared<delo::ambient::utils::CommandCompletionClient>(config.completionCommand);
        caps.clarifier = std::make_shared<CompletionClarifier>(client);
        caps.completionClient = client;
    }
    caps.urlOpener = std::make_shared<delo::ambient::utils::SystemUrlOpener>(config.platform);
    caps.appLauncher = std::make_shared<delo::ambient::utils::ProcessAppLauncher>(config.platform);

    AssistantService service(config, caps, logger);
    ErrorInfo initErr;
    if (!service.initialize(&initErr)) {
        std::cerr << "[WARN] " << initErr.message << "\n";
    }

    service.startContextManager();
    if (!config.ultraLightweight) {
        if (!service.startScreenPerception()) {
            std::cout << "Screen perception off (set capture.text_command to enable)\n";
        }
        if (config.microphoneEnabled && !service.startAudioPerception()) {
            std::cout << "Audio perception failed to start\n";
        }
    } else {
        std::cout << "Ultra-lightweight mode: perception disabled\n";
    }

    printHelp();

    std::string line;
    while (true) {
        std::cout << "\nDELO> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        const auto input = delo::ambient::utils::trimCopy(line);
        if (input.empty()) continue;

        if (input == ":quit" || input == ":exit") break;
        if (input == ":help") {
            printHelp();
            continue;
        }
        if (input == ":yes" || input == ":no") {
            auto pending = service.router().pendingRequestFor("console");
            if (!pending.has_value()) {
                std::cout << "Nothing to confirm.\n";
                continue;
            }
            auto r = service.confirmAndExecute(*pending, input == ":yes" ? "yes" : "no");
            std::cout << (r.success ? "[ OK ] " : "[FAIL] ") << r.message << "\n";
            for (const auto& step : r.results) {
                std::cout << "  - " << step.step << ": " << step.execution.action.message << "\n";
            }
            continue;
        }
        if (input == ":history") {
            for (const auto& e : service.getCommandHistory(10)) {
                std::cout << (e.success ? "  + " : "  - ") << e.command << "  (" << e.resultSummary << ")\n";
            }
            continue;
        }
        if (input.rfind(":suggest", 0) == 0) {
            const auto partial = delo::ambient::utils::trimCopy(input.substr(8));
            for (const auto& s : service.getCommandSuggestions(partial)) std::cout << "  " << s << "\n";
            continue;
        }
        if (input == ":status") {
            std::cout << service.getStatus().dump(2) << "\n";
            continue;
        }

        printCommandResult(service.executeCommand(input, "console"));
    }

    service.shutdown();
    return 0;
}
