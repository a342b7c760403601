#pragma once

#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/ErrorTypes.h"
#include "delo/ambient/types/IntentTypes.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace delo::ambient {

/**
 * @brief 命令历史（只追加、有上限），可选 JSON 文件持久化
 */
class CommandHistory {
public:
    struct Options {
        size_t maxEntries{50};
        std::string path; // 为空则只保存在内存
        size_t maxSuggestions{5};
    };

    CommandHistory(const ErrorHandler& logger, Options options);

    // 禁止拷贝/移动
    CommandHistory(const CommandHistory&) = delete;
    CommandHistory& operator=(const CommandHistory&) = delete;
    CommandHistory(CommandHistory&&) = delete;
    CommandHistory& operator=(CommandHistory&&) = delete;

    /**
     * @brief 从 path 读取历史；文件不存在视为空历史
     * @return 文件存在但无法解析时返回 false
     */
    bool load(ErrorInfo* err = nullptr);

    /**
     * @brief 写回 path（path 为空时直接返回 true）
     */
    bool save(ErrorInfo* err = nullptr) const;

    // 追加一条记录；超出上限时丢弃最旧的。配置了 path 时立即写盘，失败只记录日志
    void append(const types::CommandHistoryEntry& entry);

    // 最近 limit 条（0 = 全部），最新的在末尾
    std::vector<types::CommandHistoryEntry> getCommandHistory(size_t limit = 0) const;

    size_t size() const;
    void clear();

    /**
     * @brief 补全建议
     *
     * 候选来自历史命令与 staticPhrases，大小写不敏感。
     * 前缀匹配优先于子串匹配；同类中历史命令按出现次数、再按最近使用排序，随后才是静态短语。
     * 结果去重，最多 maxSuggestions 条；partial 为空时返回空列表。
     */
    std::vector<std::string> getCommandSuggestions(const std::string& partial,
                                                   const std::vector<std::string>& staticPhrases) const;

private:
    void trimLocked();

    const ErrorHandler& m_logger;
    Options m_options;

    mutable std::mutex m_mutex;
    std::deque<types::CommandHistoryEntry> m_entries;
};

} // namespace delo::ambient
