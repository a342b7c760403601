#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace delo::ambient::types {

// 通用时间戳（系统时钟）
using Timestamp = std::chrono::system_clock::time_point;

using RequestId = std::string;
using SessionId = std::string;

// 毫秒级 Unix 时间戳（用于日志/序列化）
inline uint64_t toUnixMillis(Timestamp tp) {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(tp.time_since_epoch()).count());
}

inline Timestamp fromUnixMillis(uint64_t ms) {
    using namespace std::chrono;
    return Timestamp(milliseconds(ms));
}

inline Timestamp nowTimestamp() { return std::chrono::system_clock::now(); }

// json 辅助：读取可缺省字段
template <typename T>
T jsonValueOr(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

inline std::vector<std::string> jsonStringList(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_array()) return out;
    for (const auto& v : j.at(key)) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

} // namespace delo::ambient::types
