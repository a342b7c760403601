#pragma once

#include "delo/ambient/AssistantConfig.h"
#include "delo/ambient/Capabilities.h"
#include "delo/ambient/ErrorTypes.h"

#include <optional>
#include <string>

namespace delo::ambient::utils {

struct CommandOutput {
    int exitCode{0};
    std::string output; // stdout（去掉末尾换行）
};

/**
 * @brief 通过 shell 执行命令并读取 stdout
 * @return 无法启动进程时返回 nullopt；非零退出码仍返回结果
 */
std::optional<CommandOutput> runCommand(const std::string& command, ErrorInfo* err = nullptr);

// 单引号包裹，供拼接 shell 命令
std::string shellQuote(const std::string& arg);

// cmd.exe 参数转义：元字符前加 ^，空格写成 %20，丢弃换行；结果不加引号，供 start 使用
std::string cmdEscape(const std::string& arg);

// 替换模板中所有 "{key}"
std::string fillTemplate(std::string tmpl, const std::string& key, const std::string& value);

/**
 * @brief 使用系统默认程序打开 URL（xdg-open / open / start）
 */
class SystemUrlOpener : public UrlOpener {
public:
    explicit SystemUrlOpener(Platform platform = detectPlatform());

    bool openExternal(const std::string& target, ErrorInfo* err) override;

private:
    Platform m_platform;
};

/**
 * @brief 按平台启动应用：Linux 依次查找 linuxCommands，macOS 用 open -a，Windows 用 start
 */
class ProcessAppLauncher : public AppLauncher {
public:
    explicit ProcessAppLauncher(Platform platform = detectPlatform());

    bool launch(const types::AppInfo& app, ErrorInfo* err) override;

private:
    Platform m_platform;
};

/**
 * @brief 执行外部命令获取窗口文本，命令模板支持 {app} 与 {title}
 */
class CommandTextExtractor : public TextExtractor {
public:
    explicit CommandTextExtractor(std::string commandTemplate);

    std::optional<std::string> extract(const types::ScreenFrame& frame, ErrorInfo* err) override;

private:
    std::string m_commandTemplate;
};

/**
 * @brief 执行外部命令完成文本补全，模板中的 {prompt} 替换为转义后的提示词
 */
class CommandCompletionClient : public CompletionClient {
public:
    explicit CommandCompletionClient(std::string commandTemplate);

    std::optional<std::string> complete(const std::string& prompt, ErrorInfo* err) override;

private:
    std::string m_commandTemplate;
};

} // namespace delo::ambient::utils
