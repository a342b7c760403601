#include "delo/ambient/utils/ProcessUtils.h"

#include <array>
#include <cstdio>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace delo::ambient::utils {

#if defined(_WIN32)
#define DELO_POPEN _popen
#define DELO_PCLOSE _pclose
#else
#define DELO_POPEN popen
#define DELO_PCLOSE pclose
#endif

std::optional<CommandOutput> runCommand(const std::string& command, ErrorInfo* err) {
    FILE* pipe = DELO_POPEN(command.c_str(), "r");
    if (!pipe) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::ExternalServiceError, "Failed to start process",
                                   nlohmann::json{{"command", command}});
        }
        return std::nullopt;
    }

    CommandOutput out;
    std::array<char, 4096> buf{};
    size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        out.output.append(buf.data(), n);
    }
    const int status = DELO_PCLOSE(pipe);
#if defined(_WIN32)
    out.exitCode = status;
#else
    out.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
    while (!out.output.empty() && (out.output.back() == '\n' || out.output.back() == '\r')) {
        out.output.pop_back();
    }
    return out;
}

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

std::string cmdEscape(const std::string& arg) {
    std::string out;
    out.reserve(arg.size() + 8);
    for (char c : arg) {
        switch (c) {
            case '^': case '&': case '|': case '<': case '>':
            case '(': case ')': case '%': case '"': case '!':
                out.push_back('^');
                out.push_back(c);
                break;
            case ' ':
                out += "^%20";
                break;
            case '\r': case '\n':
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string fillTemplate(std::string tmpl, const std::string& key, const std::string& value) {
    const std::string token = "{" + key + "}";
    size_t pos = tmpl.find(token);
    while (pos != std::string::npos) {
        tmpl.replace(pos, token.size(), value);
        pos = tmpl.find(token, pos + value.size());
    }
    return tmpl;
}

// ========== SystemUrlOpener ==========

SystemUrlOpener::SystemUrlOpener(Platform platform)
    : m_platform(platform)
{}

bool SystemUrlOpener::openExternal(const std::string& target, ErrorInfo* err) {
    std::string cmd;
    switch (m_platform) {
        case Platform::MacOS:
            cmd = "open " + shellQuote(target);
            break;
        case Platform::Windows:
            cmd = "start \"\" " + cmdEscape(target);
            break;
        default:
            cmd = "xdg-open " + shellQuote(target) + " >/dev/null 2>&1";
            break;
    }
    auto res = runCommand(cmd, err);
    if (!res.has_value()) return false;
    if (res->exitCode != 0) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::ExternalServiceError, "Opener exited with non-zero status",
                                   nlohmann::json{{"target", target}, {"exit_code", res->exitCode}});
        }
        return false;
    }
    return true;
}

// ========== ProcessAppLauncher ==========

ProcessAppLauncher::ProcessAppLauncher(Platform platform)
    : m_platform(platform)
{}

bool ProcessAppLauncher::launch(const types::AppInfo& app, ErrorInfo* err) {
    auto notInstalled = [&]() {
        if (err) {
            *err = ErrorInfo::make(ErrorType::ActionUnavailable, app.displayName + " is not installed",
                                   nlohmann::json{{"app", app.id}});
        }
        return false;
    };

    std::string cmd;
    switch (m_platform) {
        case Platform::MacOS:
            if (app.macAppName.empty()) return notInstalled();
            cmd = "open -a " + shellQuote(app.macAppName) + " >/dev/null 2>&1";
            break;
        case Platform::Windows:
            if (app.windowsCommand.empty()) return notInstalled();
            cmd = "start \"\" " + cmdEscape(app.windowsCommand);
            break;
        default: {
            std::string found;
            for (const auto& candidate : app.linuxCommands) {
                auto lookup = runCommand("command -v " + shellQuote(candidate) + " 2>/dev/null", err);
                if (!lookup.has_value()) return false;
                if (lookup->exitCode == 0 && !lookup->output.empty()) {
                    found = candidate;
                    break;
                }
            }
            if (found.empty()) return notInstalled();
            cmd = "nohup " + shellQuote(found) + " >/dev/null 2>&1 &";
            break;
        }
    }

    auto res = runCommand(cmd, err);
    if (!res.has_value()) return false;
    if (res->exitCode != 0) {
        // open -a / start 找不到应用时返回非零
        if (m_platform != Platform::Linux) return notInstalled();
        if (err) {
            *err = ErrorInfo::make(ErrorType::ExternalServiceError, "Launcher exited with non-zero status",
                                   nlohmann::json{{"app", app.id}, {"exit_code", res->exitCode}});
        }
        return false;
    }
    return true;
}

// ========== CommandTextExtractor ==========

CommandTextExtractor::CommandTextExtractor(std::string commandTemplate)
    : m_commandTemplate(std::move(commandTemplate))
{}

std::optional<std::string> CommandTextExtractor::extract(const types::ScreenFrame& frame, ErrorInfo* err) {
    if (m_commandTemplate.empty()) {
        if (err) *err = ErrorInfo::make(ErrorType::SensingError, "No text extraction command configured");
        return std::nullopt;
    }
    std::string cmd = fillTemplate(m_commandTemplate, "app", shellQuote(frame.appName));
    cmd = fillTemplate(cmd, "title", shellQuote(frame.windowTitle));

    auto res = runCommand(cmd, err);
    if (!res.has_value()) return std::nullopt;
    if (res->exitCode != 0) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::SensingError, "Text extraction command failed",
                                   nlohmann::json{{"exit_code", res->exitCode}, {"app", frame.appName}});
        }
        return std::nullopt;
    }
    return res->output;
}

// ========== CommandCompletionClient ==========

CommandCompletionClient::CommandCompletionClient(std::string commandTemplate)
    : m_commandTemplate(std::move(commandTemplate))
{}

std::optional<std::string> CommandCompletionClient::complete(const std::string& prompt, ErrorInfo* err) {
    if (m_commandTemplate.empty()) {
        if (err) *err = ErrorInfo::make(ErrorType::ExternalServiceError, "No completion command configured");
        return std::nullopt;
    }
    auto res = runCommand(fillTemplate(m_commandTemplate, "prompt", shellQuote(prompt)), err);
    if (!res.has_value()) return std::nullopt;
    if (res->exitCode != 0 || res->output.empty()) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::ExternalServiceError, "Completion command failed",
                                   nlohmann::json{{"exit_code", res->exitCode}});
        }
        return std::nullopt;
    }
    return res->output;
}

} // namespace delo::ambient::utils
