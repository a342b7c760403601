#include "delo/ambient/CompletionClarifier.h"

#include "delo/ambient/utils/TextMatch.h"

#include <regex>
#include <sstream>

namespace delo::ambient {

CompletionClarifier::CompletionClarifier(std::shared_ptr<CompletionClient> client)
    : m_client(std::move(client))
{}

std::string CompletionClarifier::buildPrompt(const std::string& command, const std::string& context) {
    std::ostringstream oss;
    oss << "Clarify and expand this command for a desktop assistant. Return the user's likely intent and "
           "break it into clear, concise action steps.\n\n";
    oss << "User's command: \"" << command << "\"\n";
    const auto ctx = utils::trimCopy(context);
    if (!ctx.empty()) {
        oss << "Context: \"" << ctx.substr(0, kMaxContextChars) << (ctx.size() > kMaxContextChars ? "..." : "")
            << "\"\n";
    }
    oss << "\nEach action step should be a short command such as \"open chrome\" or \"search for <terms>\".\n";
    oss << "Format your response as JSON:\n"
           "{\n"
           "  \"clarifiedIntent\": \"clear description of what the user wants\",\n"
           "  \"actionSteps\": [\"step 1\", \"step 2\"],\n"
           "  \"context\": \"any additional context or assumptions\"\n"
           "}";
    return oss.str();
}

std::optional<types::Clarification> CompletionClarifier::parseResponse(const std::string& text) {
    const auto trimmed = utils::trimCopy(text);
    if (trimmed.empty()) return std::nullopt;

    // JSON 可能被包在 ```json 代码块或说明文字里
    const auto open = trimmed.find('{');
    const auto close = trimmed.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        try {
            auto parsed = nlohmann::json::parse(trimmed.substr(open, close - open + 1));
            if (auto c = types::Clarification::fromJson(parsed)) return c;
        } catch (const nlohmann::json::exception&) {
            // 按纯文本处理
        }
    }

    static const std::regex numbered(R"(^\s*\d+[.)]\s*(.+)$)");
    types::Clarification c;
    std::istringstream lines(trimmed);
    std::string line;
    while (std::getline(lines, line)) {
        const auto l = utils::trimCopy(line);
        if (l.empty() || utils::startsWith(l, "```")) continue;
        std::smatch m;
        if (std::regex_match(l, m, numbered)) {
            c.actionSteps.push_back(utils::trimCopy(m[1].str()));
        } else if (c.clarifiedIntent.empty()) {
            c.clarifiedIntent = l;
        }
    }
    if (c.clarifiedIntent.empty() && c.actionSteps.empty()) return std::nullopt;
    if (c.clarifiedIntent.empty()) c.clarifiedIntent = c.actionSteps.front();
    c.context = "Parsed from completion text";
    return c;
}

std::optional<types::Clarification> CompletionClarifier::clarify(const std::string& command,
                                                                 const std::string& context,
                                                                 ErrorInfo* err) {
    if (!m_client) {
        if (err) *err = ErrorInfo::make(ErrorType::ExternalServiceError, "No completion client configured");
        return std::nullopt;
    }

    auto text = m_client->complete(buildPrompt(command, context), err);
    if (!text.has_value()) return std::nullopt;

    auto c = parseResponse(*text);
    if (!c.has_value() && err) {
        *err = ErrorInfo::make(ErrorType::ExternalServiceError, "Completion response could not be parsed",
                               nlohmann::json{{"snippet", text->substr(0, 256)}});
    }
    return c;
}

} // namespace delo::ambient
