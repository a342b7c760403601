#include "delo/ambient/RecordStore.h"

#include "delo/ambient/utils/TextMatch.h"

namespace delo::ambient {

InMemoryRecordStore::InMemoryRecordStore(size_t maxPerCollection)
    : m_maxPerCollection(maxPerCollection == 0 ? 1 : maxPerCollection)
{}

bool InMemoryRecordStore::save(const std::string& collection, const nlohmann::json& record, ErrorInfo* err) {
    if (utils::trimCopy(collection).empty()) {
        if (err) *err = ErrorInfo::make(ErrorType::InvalidConfig, "Collection name must not be empty");
        return false;
    }
    if (!record.is_object()) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::InvalidConfig, "Record must be a JSON object",
                                   nlohmann::json{{"collection", collection}});
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& list = m_records[collection];
    list.push_back(record);
    while (list.size() > m_maxPerCollection) list.pop_front();
    return true;
}

std::vector<nlohmann::json> InMemoryRecordStore::query(const RecordQuery& q) const {
    std::vector<nlohmann::json> out;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(q.collection);
    if (it == m_records.end()) return out;

    for (const auto& rec : it->second) {
        if (q.field.has_value() && q.contains.has_value()) {
            if (!rec.contains(*q.field) || !rec.at(*q.field).is_string()) continue;
            if (!utils::containsIgnoreCase(rec.at(*q.field).get<std::string>(), *q.contains)) continue;
        }
        out.push_back(rec);
    }
    if (q.limit > 0 && out.size() > q.limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(q.limit));
    }
    return out;
}

size_t InMemoryRecordStore::count(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(collection);
    return it == m_records.end() ? 0 : it->second.size();
}

std::vector<std::string> InMemoryRecordStore::collections() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    for (const auto& kv : m_records) out.push_back(kv.first);
    return out;
}

} // namespace delo::ambient
