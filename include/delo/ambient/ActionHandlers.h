#pragma once

#include "delo/ambient/Capabilities.h"
#include "delo/ambient/CommandRouter.h"
#include "delo/ambient/types/ContextTypes.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace delo::ambient {

// ========== 内置动作 ==========

/**
 * @brief 打开应用：目录解析出的 app 交给 AppLauncher；未知或未安装 -> missing_app
 */
class OpenAppHandler : public ActionHandler {
public:
    explicit OpenAppHandler(std::shared_ptr<AppLauncher> launcher);
    ActionResult run(const types::Intent& intent) override;

private:
    std::shared_ptr<AppLauncher> m_launcher;
};

/**
 * @brief 在浏览器中打开搜索结果页
 *
 * 网页搜索与 YouTube 搜索共用，区别仅在 URL 前缀与提示文案。
 */
class UrlSearchHandler : public ActionHandler {
public:
    UrlSearchHandler(std::shared_ptr<UrlOpener> opener, std::string urlPrefix, std::string siteLabel);

    static std::shared_ptr<UrlSearchHandler> webSearch(std::shared_ptr<UrlOpener> opener);
    static std::shared_ptr<UrlSearchHandler> youtubeSearch(std::shared_ptr<UrlOpener> opener);

    std::string urlFor(const std::string& query) const;
    ActionResult run(const types::Intent& intent) override;

private:
    std::shared_ptr<UrlOpener> m_opener;
    std::string m_urlPrefix;
    std::string m_siteLabel;
};

/**
 * @brief 通过 mailto: 在默认邮件客户端起草邮件（不直接发送）
 */
class EmailDraftHandler : public ActionHandler {
public:
    explicit EmailDraftHandler(std::shared_ptr<UrlOpener> opener);

    static std::string mailtoFor(const std::string& recipient, const std::string& subject, const std::string& body);
    ActionResult run(const types::Intent& intent) override;

private:
    std::shared_ptr<UrlOpener> m_opener;
};

/**
 * @brief 列出支持的命令类别与示例
 */
class HelpHandler : public ActionHandler {
public:
    ActionResult run(const types::Intent& intent) override;
};

/**
 * @brief 总结当前屏幕：取融合上下文中的屏幕文本，交给补全服务生成摘要
 *
 * 补全服务返回 {summary, intent, suggestedActions[], intentCategory} JSON；
 * 非 JSON 文本整体作为摘要。suggestedActions 作为 nextSteps 返回。
 */
class SummarizeScreenHandler : public ActionHandler {
public:
    using SnapshotProvider = std::function<std::optional<types::ContextSnapshot>()>;

    SummarizeScreenHandler(std::shared_ptr<CompletionClient> client, SnapshotProvider snapshots);

    static std::string buildPrompt(const types::ContextSnapshot& snapshot, const std::string& focus);
    ActionResult run(const types::Intent& intent) override;

    static constexpr size_t kMaxScreenChars = 3000;

private:
    std::shared_ptr<CompletionClient> m_client;
    SnapshotProvider m_snapshots;
};

// 在 router 上注册以上内置动作；snapshots 为空时不注册 summarize
void registerBuiltinHandlers(CommandRouter& router,
                             std::shared_ptr<UrlOpener> opener,
                             std::shared_ptr<AppLauncher> launcher,
                             std::shared_ptr<CompletionClient> completion = nullptr,
                             SummarizeScreenHandler::SnapshotProvider snapshots = nullptr);

} // namespace delo::ambient
