#pragma once

#include "delo/ambient/types/IntentTypes.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace delo::ambient::catalog {

/**
 * @brief 类别 -> 触发短语（精确匹配表）
 */
struct CategoryPhrases {
    types::IntentCategory category;
    std::vector<std::string> phrases;
};

/**
 * @brief 类别 -> 同义词（含常见拼写错误，模糊匹配表）
 */
struct CategorySynonyms {
    types::IntentCategory category;
    std::vector<std::string> words;
};

// 表的顺序即优先级顺序
const std::vector<CategoryPhrases>& phraseTable();
const std::vector<CategorySynonyms>& synonymTable();
const std::vector<types::AppInfo>& appCatalog();

// 所有触发短语（去重，按表顺序），用于补全建议
std::vector<std::string> allPhrases();

struct PhraseHit {
    types::IntentCategory category{types::IntentCategory::Unknown};
    std::string phrase;
    size_t position{0}; // 在规范化命令中的字节偏移
};

/**
 * @brief 类别层级：0 = 动作类别，1 = help/clipboard/system 等通用类别
 */
int categoryTier(types::IntentCategory category);

/**
 * @brief 精确短语匹配：按词边界查找
 *
 * 动作类别优先于通用类别（help/clipboard/system）；同一层级内最早出现者胜，
 * 同位置取最长短语。
 * @param normalized 已规范化的命令（见 utils::normalizeCommand）
 */
std::optional<PhraseHit> matchPhrase(const std::string& normalized);

struct SynonymHit {
    types::IntentCategory category{types::IntentCategory::Unknown};
    std::string word;       // 命令中的词
    std::string synonym;    // 命中的同义词
    size_t wordIndex{0};
    double similarity{0.0};
};

/**
 * @brief 逐词与同义词表比较（OSA 编辑距离），取相似度最高者
 *
 * 少于 4 个字符的词只接受与同义词完全相同。
 */
std::optional<SynonymHit> matchSynonym(const std::string& normalized, double threshold);

struct AppMatch {
    types::AppInfo app;
    double similarity{0.0};
    size_t wordsUsed{0}; // 命中所用的前缀词数
};

/**
 * @brief 在应用目录中解析名称：先精确匹配别名，再模糊匹配
 *
 * 依次尝试 name 的最长前缀词组，例如 "chrome please" 先试整体再试 "chrome"。
 */
std::optional<AppMatch> resolveApp(const std::string& name, double threshold);

} // namespace delo::ambient::catalog
