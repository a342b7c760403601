#pragma once

#include "delo/ambient/ErrorTypes.h"
#include "delo/ambient/types/FallbackTypes.h"
#include "delo/ambient/types/IntentTypes.h"
#include "delo/ambient/types/PerceptionTypes.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient {

// ========== 外部协作者的窄接口 ==========
// 失败时返回 nullopt/false 并填写 err；实现抛出的 std::exception 由调用方捕获并记录。

/**
 * @brief 读取前台窗口可见文本（OCR/无障碍接口等）
 */
class TextExtractor {
public:
    virtual ~TextExtractor() = default;
    virtual std::optional<std::string> extract(const types::ScreenFrame& frame, ErrorInfo* err) = 0;
};

/**
 * @brief 语音转文字
 */
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::optional<std::string> transcribe(const types::AudioChunk& chunk, ErrorInfo* err) = 0;
};

/**
 * @brief 文本补全服务（任意 AI 提供方）
 */
class CompletionClient {
public:
    virtual ~CompletionClient() = default;
    virtual std::optional<std::string> complete(const std::string& prompt, ErrorInfo* err) = 0;
};

/**
 * @brief 命令澄清：本地匹配无结论时调用
 */
class Clarifier {
public:
    virtual ~Clarifier() = default;
    virtual std::optional<types::Clarification> clarify(const std::string& command,
                                                        const std::string& context,
                                                        ErrorInfo* err) = 0;
};

/**
 * @brief 动作执行结果
 *
 * 失败且可归类时填写 fallback，由路由器交给 FallbackResolver。
 */
struct ActionResult {
    bool success{false};
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    std::vector<std::string> nextSteps;
    std::optional<types::FallbackRequest> fallback;

    nlohmann::json toJson() const {
        nlohmann::json j{
            {"success", success},
            {"message", message},
            {"data", data},
            {"next_steps", nextSteps},
        };
        if (fallback.has_value()) j["fallback_request"] = fallback->toJson();
        return j;
    }
};

class ActionHandler {
public:
    virtual ~ActionHandler() = default;
    virtual ActionResult run(const types::Intent& intent) = 0;
};

/**
 * @brief 打开外部 URL / 应用（唯一的副作用出口）
 */
class UrlOpener {
public:
    virtual ~UrlOpener() = default;
    virtual bool openExternal(const std::string& target, ErrorInfo* err) = 0;
};

/**
 * @brief 启动本地应用
 *
 * 应用未安装时返回 false 并把 err.errorType 设为 ActionUnavailable。
 */
class AppLauncher {
public:
    virtual ~AppLauncher() = default;
    virtual bool launch(const types::AppInfo& app, ErrorInfo* err) = 0;
};

/**
 * @brief 音频来源：start 后持续回调音频块
 */
class AudioSource {
public:
    using ChunkCallback = std::function<void(types::AudioChunk chunk)>;

    virtual ~AudioSource() = default;
    virtual bool start(ChunkCallback cb, ErrorInfo* err) = 0;
    virtual void stop() = 0;
    virtual std::string sourceName() const = 0;
};

/**
 * @brief 记录查询条件
 */
struct RecordQuery {
    std::string collection;
    size_t limit{0};                  // 0 表示不限
    std::optional<std::string> field; // 与 contains 搭配：按字段做大小写不敏感子串匹配
    std::optional<std::string> contains;
};

/**
 * @brief 持久化存储（save/query）
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;
    virtual bool save(const std::string& collection, const nlohmann::json& record, ErrorInfo* err) = 0;
    // 按插入顺序返回，limit 截取最新的若干条
    virtual std::vector<nlohmann::json> query(const RecordQuery& q) const = 0;
};

} // namespace delo::ambient
