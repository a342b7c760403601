#include "delo/ambient/FallbackResolver.h"

#include "delo/ambient/utils/TextMatch.h"

#include <map>

namespace delo::ambient {

using types::FallbackAction;
using types::FallbackResponse;

namespace {

using Guide = std::vector<std::string>;

const std::map<std::string, Guide>& macPermissionGuides() {
    static const std::map<std::string, Guide> guides = {
        {"accessibility", {"Open System Preferences > Security & Privacy > Privacy",
                           "Select \"Accessibility\" from the left sidebar",
                           "Click the lock icon to make changes",
                           "Add DELO to the list of allowed apps",
                           "Restart DELO after granting permission"}},
        {"screen_recording", {"Open System Preferences > Security & Privacy > Privacy",
                              "Select \"Screen Recording\" from the left sidebar",
                              "Click the lock icon to make changes",
                              "Add DELO to the list of allowed apps",
                              "Restart DELO after granting permission"}},
        {"microphone", {"Open System Preferences > Security & Privacy > Privacy",
                        "Select \"Microphone\" from the left sidebar",
                        "Click the lock icon to make changes",
                        "Add DELO to the list of allowed apps"}},
        {"camera", {"Open System Preferences > Security & Privacy > Privacy",
                    "Select \"Camera\" from the left sidebar",
                    "Click the lock icon to make changes",
                    "Add DELO to the list of allowed apps"}},
        {"files", {"Open System Preferences > Security & Privacy > Privacy",
                   "Select \"Files and Folders\" from the left sidebar",
                   "Click the lock icon to make changes",
                   "Add DELO and select the folders you want to access"}},
    };
    return guides;
}

const std::map<std::string, Guide>& windowsPermissionGuides() {
    static const std::map<std::string, Guide> guides = {
        {"accessibility", {"Open Settings > Privacy & Security > Accessibility",
                           "Turn on \"Let apps access your accessibility features\"",
                           "Add DELO to the list of allowed apps"}},
        {"screen_recording", {"Open Settings > Privacy & Security > Screenshots and screen recording",
                              "Turn on screen capture access for desktop apps",
                              "Add DELO to the list of allowed apps"}},
        {"microphone", {"Open Settings > Privacy & Security > Microphone",
                        "Turn on \"Microphone access\"",
                        "Add DELO to the list of allowed apps"}},
        {"camera", {"Open Settings > Privacy & Security > Camera",
                    "Turn on \"Camera access\"",
                    "Add DELO to the list of allowed apps"}},
        {"files", {"Open Settings > Privacy & Security > File System",
                   "Turn on \"File System access\"",
                   "Add DELO to the list of allowed apps"}},
    };
    return guides;
}

const std::map<std::string, Guide>& linuxPermissionGuides() {
    static const std::map<std::string, Guide> guides = {
        {"accessibility", {"Open Settings > Accessibility",
                           "Enable assistive technologies (AT-SPI) for your session",
                           "Restart DELO after changing the setting"}},
        {"screen_recording", {"Allow DELO when the desktop portal asks to share your screen",
                              "On GNOME open Settings > Privacy > Screen Sharing",
                              "Under X11 make sure xdotool is installed"}},
        {"microphone", {"Open Settings > Privacy > Microphone",
                        "Turn on microphone access",
                        "Check the input device in Settings > Sound (PipeWire/PulseAudio)"}},
        {"camera", {"Open Settings > Privacy > Camera",
                    "Turn on camera access",
                    "Make sure your user is in the 'video' group"}},
        {"files", {"Grant folder access when the file chooser portal asks",
                   "For Flatpak installs add filesystem permissions with Flatseal"}},
    };
    return guides;
}

} // namespace

FallbackResolver::FallbackResolver(std::shared_ptr<UrlOpener> opener, const ErrorHandler& logger, Options options)
    : m_opener(std::move(opener))
    , m_logger(logger)
    , m_options(std::move(options))
{}

FallbackResponse FallbackResolver::genericFailure(const std::string& message) {
    FallbackResponse r;
    r.success = false;
    r.message = message;
    r.action = FallbackAction::ManualInstruction;
    r.nextSteps = {"Try rephrasing your request", "Break down complex actions into simpler steps"};
    return r;
}

FallbackResponse FallbackResolver::resolve(const types::FallbackRequest& request) const {
    try {
        return std::visit(types::Overloaded{
            [this](const types::MissingAppDetails& d) { return handleMissingApp(d); },
            [this](const types::MissingOAuthDetails& d) { return handleMissingOAuth(d); },
            [this](const types::MissingPermissionDetails& d) { return handleMissingPermission(d); },
            [this](const types::MissingScriptDetails& d) { return handleMissingScript(d); },
            [this](const types::UnknownActionDetails& d) { return handleUnknownAction(d); },
        }, request.details);
    } catch (const std::exception& e) {
        m_logger.log(ErrorHandler::LogLevel::Error, "FallbackResolver: resolve failed",
                     ErrorInfo::make(ErrorType::UnknownError, e.what(), request.toJson()));
        return genericFailure("Fallback handling failed. Please try a different approach.");
    }
}

FallbackResponse FallbackResolver::resolveJson(const nlohmann::json& request) const {
    auto parsed = types::FallbackRequest::fromJson(request);
    if (!parsed.has_value()) {
        m_logger.log(ErrorHandler::LogLevel::Warning, "FallbackResolver: unrecognized fallback request",
                     ErrorInfo::make(ErrorType::InvalidConfig, "Unknown fallback reason", request));
        return genericFailure("Unknown fallback reason");
    }
    return resolve(*parsed);
}

void FallbackResolver::openLink(const std::string& url) const {
    if (!m_options.openExternalLinks || !m_opener) return;
    ErrorInfo err;
    bool ok = false;
    try {
        ok = m_opener->openExternal(url, &err);
    } catch (const std::exception& e) {
        err = ErrorInfo::make(ErrorType::ExternalServiceError, e.what());
    }
    if (!ok) {
        err.context = std::map<std::string, std::string>{{"url", url}};
        m_logger.log(ErrorHandler::LogLevel::Warning, "FallbackResolver: failed to open link", err);
    }
}

// ========== 查表 ==========

std::optional<std::string> FallbackResolver::oauthUrlFor(const std::string& provider) {
    static const std::map<std::string, std::string> urls = {
        {"google", "https://accounts.google.com/oauth/authorize"},
        {"microsoft", "https://login.microsoftonline.com/oauth2/v2.0/authorize"},
        {"github", "https://github.com/login/oauth/authorize"},
        {"slack", "https://slack.com/oauth/v2/authorize"},
        {"discord", "https://discord.com/api/oauth2/authorize"},
        {"zoom", "https://zoom.us/oauth/authorize"},
        {"dropbox", "https://www.dropbox.com/oauth2/authorize"},
        {"box", "https://account.box.com/api/oauth2/authorize"},
    };
    auto it = urls.find(utils::toLowerCopy(utils::trimCopy(provider)));
    if (it == urls.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> FallbackResolver::permissionGuide(const std::string& permissionType) const {
    const auto key = utils::toLowerCopy(utils::trimCopy(permissionType));
    const std::map<std::string, Guide>* guides = nullptr;
    Guide generic;
    switch (m_options.platform) {
        case Platform::MacOS:
            guides = &macPermissionGuides();
            generic = {"Open System Preferences > Security & Privacy > Privacy"};
            break;
        case Platform::Windows:
            guides = &windowsPermissionGuides();
            generic = {"Open Settings > Privacy & Security"};
            break;
        default:
            guides = &linuxPermissionGuides();
            generic = {"Open Settings > Privacy"};
            break;
    }
    auto it = guides->find(key);
    if (it != guides->end()) return it->second;
    generic.push_back("Look for the relevant permission category");
    generic.push_back("Add " + m_options.assistantName + " to the allowed apps list");
    return generic;
}

std::string FallbackResolver::storeSearchUrl(const std::string& appName) const {
    const auto term = utils::urlEncode(appName);
    switch (m_options.platform) {
        case Platform::MacOS:
            return "macappstore://search.itunes.apple.com/WebObjects/MZSearch.woa/wa/search?media=software&term=" + term;
        case Platform::Windows:
            return "ms-windows-store://search/?query=" + term;
        default:
            return "https://flathub.org/apps/search?q=" + term;
    }
}

// ========== 分支 ==========

FallbackResponse FallbackResolver::handleMissingApp(const types::MissingAppDetails& d) const {
    if (utils::trimCopy(d.appName).empty()) {
        FallbackResponse r;
        r.success = false;
        r.message = "App name not specified in fallback request";
        r.action = FallbackAction::ManualInstruction;
        r.nextSteps = {"Tell " + m_options.assistantName + " which app you want to use"};
        return r;
    }

    FallbackResponse r;
    r.success = true;
    r.action = FallbackAction::InstallApp;
    r.message = "App \"" + d.appName + "\" is not installed. " + m_options.assistantName +
                " can help you install it or guide you through the process.";

    const bool hasUrl = !utils::trimCopy(d.appUrl).empty();
    switch (m_options.platform) {
        case Platform::MacOS:
            if (hasUrl) {
                r.nextSteps.push_back("Open browser to download: " + d.appUrl);
                r.nextSteps.push_back("Or install from Mac App Store if available");
            } else {
                r.nextSteps.push_back("Search for the app in Mac App Store");
                r.nextSteps.push_back("Or download from the official website");
            }
            break;
        case Platform::Windows:
            if (hasUrl) {
                r.nextSteps.push_back("Open browser to download: " + d.appUrl);
                r.nextSteps.push_back("Or install from Microsoft Store if available");
            } else {
                r.nextSteps.push_back("Search for the app in Microsoft Store");
                r.nextSteps.push_back("Or download from the official website");
            }
            break;
        default:
            if (hasUrl) {
                r.nextSteps.push_back("Open browser to download: " + d.appUrl);
                r.nextSteps.push_back("Or install it with your distribution's package manager");
            } else {
                r.nextSteps.push_back("Search for the app on Flathub or in your software center");
                r.nextSteps.push_back("Or install it with your distribution's package manager (apt, dnf, pacman)");
            }
            break;
    }

    openLink(storeSearchUrl(d.appName));
    return r;
}

FallbackResponse FallbackResolver::handleMissingOAuth(const types::MissingOAuthDetails& d) const {
    if (utils::trimCopy(d.oauthProvider).empty()) {
        FallbackResponse r;
        r.success = false;
        r.message = "OAuth provider not specified in fallback request";
        r.action = FallbackAction::ManualInstruction;
        r.nextSteps = {"Check which account the action needs access to"};
        return r;
    }

    FallbackResponse r;
    r.success = true;
    r.action = FallbackAction::OpenOAuth;
    r.message = "OAuth token for " + d.oauthProvider + " is required. Please complete the authorization flow.";

    if (auto url = oauthUrlFor(d.oauthProvider)) {
        r.nextSteps = {
            "Open OAuth authorization page for " + d.oauthProvider,
            "Complete the authorization flow",
            "Copy the authorization code or token",
            "Configure the token in " + m_options.assistantName + " settings",
        };
        openLink(*url);
    } else {
        r.nextSteps = {
            "Search for " + d.oauthProvider + " OAuth documentation",
            "Follow the official OAuth setup guide",
        };
    }
    return r;
}

FallbackResponse FallbackResolver::handleMissingPermission(const types::MissingPermissionDetails& d) const {
    if (utils::trimCopy(d.permissionType).empty()) {
        FallbackResponse r;
        r.success = false;
        r.message = "Permission type not specified in fallback request";
        r.action = FallbackAction::ManualInstruction;
        r.nextSteps = permissionGuide("");
        return r;
    }

    FallbackResponse r;
    r.success = true;
    r.action = FallbackAction::RequestPermission;
    r.message = d.permissionType + " permission is required for this feature. Please grant the permission in system settings.";
    r.nextSteps = permissionGuide(d.permissionType);
    return r;
}

FallbackResponse FallbackResolver::handleMissingScript(const types::MissingScriptDetails& d) const {
    const std::string scriptKind = m_options.platform == Platform::MacOS   ? "AppleScript"
                                   : m_options.platform == Platform::Windows ? "PowerShell script"
                                                                             : "shell script";
    FallbackResponse r;
    r.success = true;
    r.action = FallbackAction::GenerateScript;
    r.message = m_options.assistantName + " will generate a script for: " +
                (d.action.empty() ? std::string("unknown action") : d.action) +
                ". This may require installing or configuring apps.";
    r.nextSteps = {
        m_options.assistantName + " will analyze the requested action",
        "Generate an appropriate " + scriptKind + " or automation script",
        "Test the generated script for safety",
        "Cache it for future use",
        "If the script requires an app, offer to install it",
    };

    const bool mac = m_options.platform == Platform::MacOS;
    const auto low = utils::toLowerCopy(d.action);
    if (low.find("calendar") != std::string::npos || low.find("event") != std::string::npos) {
        r.nextSteps.push_back(std::string("Set up ") + (mac ? "Calendar.app" : "calendar") +
                              " integration if not already configured");
        r.nextSteps.push_back("Grant calendar permissions if needed");
    }
    if (low.find("email") != std::string::npos || low.find("mail") != std::string::npos) {
        r.nextSteps.push_back(std::string("Set up ") + (mac ? "Mail.app" : "mail client") +
                              " integration if not already configured");
        r.nextSteps.push_back("Configure email accounts if needed");
    }
    return r;
}

FallbackResponse FallbackResolver::handleUnknownAction(const types::UnknownActionDetails& d) const {
    FallbackResponse r;
    r.success = false;
    r.action = FallbackAction::ManualInstruction;
    r.message = "Unknown action requested: " + (d.action.empty() ? std::string("unspecified") : d.action) + ". " +
                m_options.assistantName + " cannot perform this action.";
    r.nextSteps = {
        "Try rephrasing your request",
        "Break down complex actions into simpler steps",
        "Check if the required app is installed",
        "Verify that necessary permissions are granted",
    };
    return r;
}

} // namespace delo::ambient
