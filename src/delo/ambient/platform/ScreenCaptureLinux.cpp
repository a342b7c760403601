#include "delo/ambient/platform/ScreenCaptureLinux.h"

#ifdef __linux__

#include "delo/ambient/utils/ProcessUtils.h"
#include "delo/ambient/utils/TextMatch.h"

#include <string>

namespace delo::ambient::platform {

bool ScreenCaptureLinux::toolAvailable() {
    auto res = utils::runCommand("command -v xdotool >/dev/null 2>&1");
    return res.has_value() && res->exitCode == 0;
}

std::string ScreenCaptureLinux::getLastError() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastError;
}

std::optional<std::string> ScreenCaptureLinux::query(const std::string& command) {
    ErrorInfo err;
    auto res = utils::runCommand(command + " 2>/dev/null", &err);
    if (!res.has_value()) {
        setLastError(err.message);
        return std::nullopt;
    }
    if (res->exitCode != 0) {
        setLastError("Command failed: " + command);
        return std::nullopt;
    }
    return utils::trimCopy(res->output);
}

std::optional<types::ScreenFrame> ScreenCaptureLinux::captureForeground() {
    auto windowId = query("xdotool getactivewindow");
    if (!windowId.has_value() || windowId->empty()) return std::nullopt;

    types::ScreenFrame frame;
    frame.capturedAt = types::nowTimestamp();
    try {
        frame.windowId = std::stoull(*windowId);
    } catch (const std::exception&) {
        setLastError("Unexpected window id: " + *windowId);
        return std::nullopt;
    }

    const auto idArg = std::to_string(frame.windowId);
    frame.windowTitle = query("xdotool getwindowname " + idArg).value_or("");

    // 进程名作为应用名；拿不到 pid 时退回窗口标题
    if (auto pid = query("xdotool getwindowpid " + idArg); pid.has_value() && !pid->empty()) {
        try {
            frame.processId = std::stoll(*pid);
        } catch (const std::exception&) {
            frame.processId = 0;
        }
    }
    if (frame.processId > 0) {
        frame.appName = query("ps -p " + std::to_string(frame.processId) + " -o comm=").value_or("");
    }
    if (frame.appName.empty()) frame.appName = frame.windowTitle;
    if (frame.appName.empty()) {
        setLastError("Unable to determine foreground application");
        return std::nullopt;
    }
    return frame;
}

} // namespace delo::ambient::platform

#endif // __linux__
