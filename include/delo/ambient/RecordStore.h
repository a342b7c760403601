#pragma once

#include "delo/ambient/Capabilities.h"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace delo::ambient {

/**
 * @brief 内存中的 RecordStore，每个集合保留最近 maxPerCollection 条
 */
class InMemoryRecordStore : public RecordStore {
public:
    explicit InMemoryRecordStore(size_t maxPerCollection = 500);

    bool save(const std::string& collection, const nlohmann::json& record, ErrorInfo* err) override;
    std::vector<nlohmann::json> query(const RecordQuery& q) const override;

    size_t count(const std::string& collection) const;
    std::vector<std::string> collections() const;

private:
    size_t m_maxPerCollection;
    mutable std::mutex m_mutex;
    std::map<std::string, std::deque<nlohmann::json>> m_records;
};

} // namespace delo::ambient
