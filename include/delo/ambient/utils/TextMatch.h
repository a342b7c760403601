#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace delo::ambient::utils {

// ========== 大小写/空白 ==========
std::string trimCopy(std::string s);
std::string toLowerCopy(std::string s);

// 小写 + 去首尾空白 + 连续空白折叠为单个空格
std::string normalizeCommand(const std::string& s);

bool equalsIgnoreCase(const std::string& a, const std::string& b);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);
bool startsWith(const std::string& s, const std::string& prefix);

// 按空白切分
std::vector<std::string> splitWords(const std::string& s);

/**
 * @brief 在已规范化文本中按词边界查找短语
 * @return 起始下标；未找到返回 std::string::npos
 */
size_t findPhrase(const std::string& text, const std::string& phrase);

// ========== 模糊匹配 ==========

/**
 * @brief 编辑距离（optimal string alignment：插入/删除/替换/相邻交换各计 1）
 */
size_t editDistance(const std::string& a, const std::string& b);

/**
 * @brief 相似度 1 - d / max(len)，两空串视为 1.0
 */
double similarity(const std::string& a, const std::string& b);

// ========== 内容比较 ==========

// 32 位滚动哈希（h = h * 31 + c）
uint32_t contentHash(const std::string& text);

// 词集合 Jaccard 相似度（大小写不敏感），两空集视为 1.0
double jaccardSimilarity(const std::string& a, const std::string& b);

// URL 查询参数编码（空格编码为 %20）
std::string urlEncode(const std::string& s);

} // namespace delo::ambient::utils
