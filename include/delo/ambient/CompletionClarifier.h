#pragma once

#include "delo/ambient/Capabilities.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace delo::ambient {

/**
 * @brief 基于 CompletionClient 的 Clarifier
 *
 * 请求补全服务返回 {clarifiedIntent, actionSteps[], context} JSON；
 * 返回非 JSON 文本时，取首行作为意图、编号行作为步骤。
 */
class CompletionClarifier : public Clarifier {
public:
    explicit CompletionClarifier(std::shared_ptr<CompletionClient> client);

    std::optional<types::Clarification> clarify(const std::string& command,
                                                const std::string& context,
                                                ErrorInfo* err) override;

    static std::string buildPrompt(const std::string& command, const std::string& context);

    /**
     * @brief 解析补全文本
     * @return 既无 JSON 也无可用文本时返回 nullopt
     */
    static std::optional<types::Clarification> parseResponse(const std::string& text);

    static constexpr size_t kMaxContextChars = 200;

private:
    std::shared_ptr<CompletionClient> m_client;
};

} // namespace delo::ambient
