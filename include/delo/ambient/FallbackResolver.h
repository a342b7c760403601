#pragma once

#include "delo/ambient/AssistantConfig.h"
#include "delo/ambient/Capabilities.h"
#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/types/FallbackTypes.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient {

/**
 * @brief 动作无法完成时，按原因分类给出恢复方案
 *
 * 五个分支由 std::visit 分派，新增原因时编译期即可发现遗漏。
 * 副作用只有通过 UrlOpener 打开外部链接（应用商店、OAuth 页面），失败只记录日志。
 * 不抛异常：任何内部异常都转为通用失败响应。
 */
class FallbackResolver {
public:
    struct Options {
        Platform platform{detectPlatform()};
        bool openExternalLinks{true};
        std::string assistantName{"DELO"};
    };

    FallbackResolver(std::shared_ptr<UrlOpener> opener, const ErrorHandler& logger, Options options);

    types::FallbackResponse resolve(const types::FallbackRequest& request) const;

    // 线上格式入口；无法识别的 reason 返回通用失败
    types::FallbackResponse resolveJson(const nlohmann::json& request) const;

    Platform platform() const { return m_options.platform; }

    // 已知 OAuth 提供方的授权地址（大小写不敏感）
    static std::optional<std::string> oauthUrlFor(const std::string& provider);

    // 平台权限指引；未知类型返回通用“打开隐私设置”步骤
    std::vector<std::string> permissionGuide(const std::string& permissionType) const;

    // 应用商店搜索地址
    std::string storeSearchUrl(const std::string& appName) const;

private:
    types::FallbackResponse handleMissingApp(const types::MissingAppDetails& d) const;
    types::FallbackResponse handleMissingOAuth(const types::MissingOAuthDetails& d) const;
    types::FallbackResponse handleMissingPermission(const types::MissingPermissionDetails& d) const;
    types::FallbackResponse handleMissingScript(const types::MissingScriptDetails& d) const;
    types::FallbackResponse handleUnknownAction(const types::UnknownActionDetails& d) const;

    void openLink(const std::string& url) const;

    static types::FallbackResponse genericFailure(const std::string& message);

    std::shared_ptr<UrlOpener> m_opener;
    const ErrorHandler& m_logger;
    Options m_options;
};

} // namespace delo::ambient
