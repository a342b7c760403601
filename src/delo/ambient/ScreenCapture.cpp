#include "delo/ambient/ScreenCapture.h"

#ifdef __linux__
#include "delo/ambient/platform/ScreenCaptureLinux.h"
#endif

namespace delo::ambient {

std::unique_ptr<ScreenCapture> ScreenCapture::create() {
#ifdef __linux__
    return std::make_unique<platform::ScreenCaptureLinux>();
#else
    // 其他平台暂未实现
    return nullptr;
#endif
}

bool ScreenCapture::isSupported() {
#ifdef __linux__
    return platform::ScreenCaptureLinux::toolAvailable();
#else
    return false;
#endif
}

} // namespace delo::ambient
