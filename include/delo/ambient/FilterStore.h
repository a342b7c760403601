#pragma once

#include "delo/ambient/ErrorTypes.h"
#include "delo/ambient/types/PerceptionTypes.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient {

/**
 * @brief 应用/音频源的白名单与黑名单规则
 *
 * 规则按名称（大小写不敏感）存储，重复添加会替换旧规则。
 * 线程安全：感知线程读取与配置线程写入可以并发。
 */
class FilterStore {
public:
    FilterStore() = default;

    // 禁止拷贝/移动
    FilterStore(const FilterStore&) = delete;
    FilterStore& operator=(const FilterStore&) = delete;

    // ========== 注册 ==========

    /**
     * @brief 添加应用规则
     * @param filter 规则；名称为空或同时标记白/黑名单时被拒绝
     * @param err 可选错误输出
     * @return 是否添加成功
     */
    bool addAppFilter(const types::AppFilter& filter, ErrorInfo* err = nullptr);
    bool addAudioFilter(const types::AudioFilter& filter, ErrorInfo* err = nullptr);

    bool removeAppFilter(const std::string& appName);
    bool removeAudioFilter(const std::string& sourceName);

    std::vector<types::AppFilter> listAppFilters() const;
    std::vector<types::AudioFilter> listAudioFilters() const;

    // ========== 判定 ==========

    /**
     * @brief 是否采集该应用
     *
     * 黑名单 -> false；存在任何白名单规则时，未列入白名单 -> false；
     * 白名单规则带 windowPatterns 时，窗口标题需包含其中之一。
     */
    bool shouldMonitorApp(const std::string& appName, const std::string& windowTitle) const;

    // 黑名单 -> false；存在白名单时仅白名单来源为 true
    bool shouldCaptureAudio(const std::string& sourceName) const;

    // 有规则时返回规则阈值，否则 defaultThreshold
    float volumeThresholdFor(const std::string& sourceName, float defaultThreshold) const;

    // 规则无关键字时恒为 true；否则转写中需含任一关键字
    bool matchesAudioKeywords(const std::string& sourceName, const std::string& transcript) const;

    // ========== 导入/导出 ==========
    nlohmann::json toJson() const;

    /**
     * @brief 导入 {"app_filters": [...], "audio_filters": [...]}
     * @return 全部规则有效时返回 true；无效规则被跳过并记录在 err 中
     */
    bool loadFromJson(const nlohmann::json& j, ErrorInfo* err = nullptr);

private:
    static std::string keyOf(const std::string& name);

    mutable std::mutex m_mutex;
    std::map<std::string, types::AppFilter> m_appFilters;
    std::map<std::string, types::AudioFilter> m_audioFilters;
};

} // namespace delo::ambient
