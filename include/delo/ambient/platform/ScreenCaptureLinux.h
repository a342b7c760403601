#pragma once

#include "delo/ambient/ScreenCapture.h"

#ifdef __linux__

#include <mutex>
#include <optional>
#include <string>

namespace delo::ambient::platform {

/**
 * @brief Linux 前台窗口定位
 *
 * X11 下通过 xdotool 查询活动窗口：
 * - getactivewindow / getwindowname / getwindowpid
 * - 进程名由 `ps -p PID -o comm=` 得到
 */
class ScreenCaptureLinux : public ScreenCapture {
public:
    ScreenCaptureLinux() = default;
    ~ScreenCaptureLinux() override = default;

    // 禁止拷贝
    ScreenCaptureLinux(const ScreenCaptureLinux&) = delete;
    ScreenCaptureLinux& operator=(const ScreenCaptureLinux&) = delete;

    std::optional<types::ScreenFrame> captureForeground() override;
    std::string getLastError() const override;

    // xdotool 是否可用
    static bool toolAvailable();

private:
    std::optional<std::string> query(const std::string& command);

    mutable std::mutex m_errorMutex;
    std::string m_lastError;

    void setLastError(const std::string& error) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = error;
    }
};

} // namespace delo::ambient::platform

#endif // __linux__
