#pragma once

#include "delo/ambient/types/PerceptionTypes.h"

#include <memory>
#include <optional>
#include <string>

namespace delo::ambient {

/**
 * @brief 前台窗口采集接口
 *
 * 只负责定位前台应用与窗口标题；像素级截图不在此处实现，
 * 可见文本由 TextExtractor 根据返回的 frame 获取。
 */
class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;

    /**
     * @brief 获取当前前台窗口
     * @return frame；无法确定前台窗口时返回 std::nullopt，原因见 getLastError()
     */
    virtual std::optional<types::ScreenFrame> captureForeground() = 0;

    virtual std::string getLastError() const = 0;

    /**
     * @brief 工厂方法：创建平台特定的实例
     * @return 实例，不支持的平台返回 nullptr
     */
    static std::unique_ptr<ScreenCapture> create();

    static bool isSupported();
};

} // namespace delo::ambient
