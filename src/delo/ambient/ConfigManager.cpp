#include "delo/ambient/ConfigManager.h"

#include "delo/ambient/ErrorHandler.h"
#include "delo/ambient/utils/TextMatch.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace delo::ambient {

using utils::trimCopy;

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        // 1) 回退默认配置（内存）
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 2) 自动生成配置模板（落盘的是默认值，不含 env 替换结果）
        ErrorInfo saveErr;
        const bool saved = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::InvalidConfig;
            err->errorCode = 0;
            err->message = "Config file not found, using default config: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", saved}
            };
            if (!saved) (*err->details)["auto_create_failed"] = saveErr.toJson();
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::InvalidConfig;
            err->errorCode = 0;
            err->message = std::string("Config JSON parse failed: ") + e.what();
            err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        }
        return false;
    }

    if (!parsed.is_object()) {
        if (err) {
            err->errorType = ErrorType::InvalidConfig;
            err->errorCode = 0;
            err->message = "Config root must be a JSON object";
        }
        return false;
    }

    // 未给出的字段用默认值补齐（浅层按 section 合并）
    nlohmann::json merged = makeDefaultConfig();
    merged.merge_patch(parsed);

    applyEnvMappingOverrides(merged);
    replaceEnvPlaceholdersRecursive(merged);

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(merged);
    }
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    try {
        const std::filesystem::path p(path);
        const auto parent = p.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::exists(parent)) {
                if (err) {
                    err->errorType = ErrorType::InvalidConfig;
                    err->errorCode = 1;
                    err->message = "Failed to create config directory: " + parent.string();
                    err->details = nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}};
                }
                return false;
            }
        }

        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            if (err) {
                err->errorType = ErrorType::InvalidConfig;
                err->errorCode = 2;
                err->message = "Failed to open config file for write: " + path;
                err->details = nlohmann::json{{"path", path}};
            }
            return false;
        }

        ofs << makeDefaultConfig().dump(2) << "\n";
        ofs.flush();
        return true;
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::InvalidConfig;
            err->errorCode = 3;
            err->message = std::string("Failed to save config file: ") + e.what();
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        if (err) {
            err->errorType = ErrorType::InvalidConfig;
            err->errorCode = 0;
            err->message = "Empty keyPath";
        }
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    if (!p) {
        if (err) {
            err->errorType = ErrorType::InvalidConfig;
            err->errorCode = 0;
            err->message = "Failed to create keyPath: " + keyPath;
        }
        return false;
    }
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "DELO ambient assistant config template (auto-generated). JSON has no comments; use _comment fields.";
    j["ultra_lightweight"] = false;
    j["platform"] = "auto";
    j["perception"] = {
        {"_comment", "Sampling intervals in milliseconds. Screen interval recommended 30000..120000."},
        {"screen_sample_interval_ms", 60000},
        {"screen_diff_threshold", 0.0},
        {"audio_silence_timeout_ms", 2000},
        {"min_utterance_ms", 500},
        {"volume_threshold", 0.1},
        {"transcribe_window_ms", 1000},
        {"max_history", 100}
    };
    j["context"] = {
        {"_comment", "Quiet hours [start,end) in local hours 0..23; -1 disables. Wrapping past midnight is allowed."},
        {"quiet_hours_start", -1},
        {"quiet_hours_end", -1},
        {"max_history", 100}
    };
    j["router"] = {
        {"clarifier_timeout_ms", 2500},
        {"confirmation_ttl_ms", 120000},
        {"fuzzy_threshold", 0.7}
    };
    j["history"] = {
        {"_comment", "Empty path keeps command history in memory only."},
        {"max_entries", 50},
        {"path", ""}
    };
    j["capture"] = {
        {"_comment", "Shell commands used by the console host. {app}/{title} for text, {file} (temp WAV) for transcription, {prompt} for completion."},
        {"text_command", ""},
        {"transcribe_command", ""},
        {"completion_command", ""},
        {"microphone_enabled", false}
    };
    j["logging"] = {
        {"min_level", "warning"}
    };
    return j;
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
    if (s.empty()) return std::nullopt;
    return s;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        auto it = p->find(k);
        if (it == p->end()) return nullptr;
        p = &(*it);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    enum class Kind { String, Integer, Boolean };
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
        Kind kind;
    };
    const MapItem mapping[] = {
        {"ULTRA_LIGHTWEIGHT", "ultra_lightweight", Kind::Boolean},
        {"DELO_ULTRA_LIGHTWEIGHT", "ultra_lightweight", Kind::Boolean},
        {"DELO_SCREEN_INTERVAL_MS", "perception.screen_sample_interval_ms", Kind::Integer},
        {"DELO_SILENCE_TIMEOUT_MS", "perception.audio_silence_timeout_ms", Kind::Integer},
        {"DELO_HISTORY_PATH", "history.path", Kind::String},
        {"DELO_LOG_LEVEL", "logging.min_level", Kind::String},
        {"DELO_PLATFORM", "platform", Kind::String},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        const auto val = trimCopy(v.value());
        if (val.empty()) continue;
        nlohmann::json* p = getOrCreatePtrByPath(root, splitKeyPath(m.keyPath));
        switch (m.kind) {
            case Kind::Integer:
                try {
                    *p = std::stoll(val);
                } catch (const std::exception&) {
                    // 保留字符串，validate() 会报告类型错误
                    *p = val;
                }
                break;
            case Kind::Boolean: {
                const auto low = utils::toLowerCopy(val);
                *p = (low == "1" || low == "true" || low == "yes" || low == "on");
                break;
            }
            default:
                *p = val;
                break;
        }
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object() || node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME} 形式的占位符；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

static void checkIntRange(const nlohmann::json& section, const std::string& prefix, const char* key,
                          long long lo, long long hi, std::vector<std::string>& out) {
    if (!section.contains(key)) return;
    const auto& v = section.at(key);
    const std::string path = prefix + "." + key;
    if (!v.is_number_integer()) {
        out.push_back("Invalid '" + path + "' (integer required)");
        return;
    }
    const auto n = v.get<long long>();
    if (n < lo || n > hi) {
        out.push_back("Invalid '" + path + "' (range " + std::to_string(lo) + ".." + std::to_string(hi) + ")");
    }
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    if (cfgCopy.contains("ultra_lightweight") && !cfgCopy["ultra_lightweight"].is_boolean()) {
        out.push_back("Invalid 'ultra_lightweight' (boolean required)");
    }

    if (cfgCopy.contains("platform")) {
        const auto& p = cfgCopy["platform"];
        if (!p.is_string()) {
            out.push_back("Invalid 'platform' (string required)");
        } else {
            const auto v = p.get<std::string>();
            if (v != "auto" && v != "macos" && v != "windows" && v != "linux") {
                out.push_back("Invalid 'platform' (auto|macos|windows|linux): " + v);
            }
        }
    }

    // perception
    if (cfgCopy.contains("perception")) {
        const auto& pc = cfgCopy["perception"];
        if (!pc.is_object()) {
            out.push_back("Invalid 'perception' (object required)");
        } else {
            checkIntRange(pc, "perception", "screen_sample_interval_ms", 1000, 3600000, out);
            checkIntRange(pc, "perception", "audio_silence_timeout_ms", 100, 30000, out);
            checkIntRange(pc, "perception", "min_utterance_ms", 0, 60000, out);
            checkIntRange(pc, "perception", "transcribe_window_ms", 100, 60000, out);
            checkIntRange(pc, "perception", "max_history", 1, 100000, out);
            if (pc.contains("screen_sample_interval_ms") && pc["screen_sample_interval_ms"].is_number_integer()) {
                const auto t = pc["screen_sample_interval_ms"].get<long long>();
                if (t < 30000 || t > 120000) {
                    out.push_back("WARN: 'perception.screen_sample_interval_ms' outside recommended 30000..120000");
                }
            }
            if (pc.contains("volume_threshold")) {
                const auto& v = pc["volume_threshold"];
                if (!v.is_number() || v.get<double>() < 0.0 || v.get<double>() > 1.0) {
                    out.push_back("Invalid 'perception.volume_threshold' (number in [0,1] required)");
                }
            }
            if (pc.contains("screen_diff_threshold")) {
                const auto& v = pc["screen_diff_threshold"];
                if (!v.is_number() || v.get<double>() < 0.0 || v.get<double>() > 1.0) {
                    out.push_back("Invalid 'perception.screen_diff_threshold' (number in [0,1] required)");
                }
            }
        }
    }

    // context
    if (cfgCopy.contains("context") && cfgCopy["context"].is_object()) {
        const auto& ctx = cfgCopy["context"];
        checkIntRange(ctx, "context", "quiet_hours_start", -1, 23, out);
        checkIntRange(ctx, "context", "quiet_hours_end", -1, 23, out);
        checkIntRange(ctx, "context", "max_history", 1, 100000, out);
        const bool hasS = ctx.contains("quiet_hours_start") && ctx["quiet_hours_start"].is_number_integer();
        const bool hasE = ctx.contains("quiet_hours_end") && ctx["quiet_hours_end"].is_number_integer();
        if (hasS && hasE) {
            const auto s = ctx["quiet_hours_start"].get<long long>();
            const auto e = ctx["quiet_hours_end"].get<long long>();
            if ((s < 0) != (e < 0)) {
                out.push_back("WARN: quiet hours need both start and end; ignoring partial setting");
            }
        }
    }

    // router
    if (cfgCopy.contains("router") && cfgCopy["router"].is_object()) {
        const auto& r = cfgCopy["router"];
        checkIntRange(r, "router", "clarifier_timeout_ms", 100, 60000, out);
        checkIntRange(r, "router", "confirmation_ttl_ms", 1000, 86400000, out);
        if (r.contains("clarifier_timeout_ms") && r["clarifier_timeout_ms"].is_number_integer() &&
            r["clarifier_timeout_ms"].get<long long>() > 3000) {
            out.push_back("WARN: 'router.clarifier_timeout_ms' above 3000 may stall command input");
        }
        if (r.contains("fuzzy_threshold")) {
            const auto& v = r["fuzzy_threshold"];
            if (!v.is_number() || v.get<double>() <= 0.0 || v.get<double>() > 1.0) {
                out.push_back("Invalid 'router.fuzzy_threshold' (number in (0,1] required)");
            }
        }
    }

    // history
    if (cfgCopy.contains("history") && cfgCopy["history"].is_object()) {
        const auto& h = cfgCopy["history"];
        checkIntRange(h, "history", "max_entries", 1, 100000, out);
        if (h.contains("path") && !h["path"].is_string()) {
            out.push_back("Invalid 'history.path' (string required)");
        }
    }

    // logging
    if (cfgCopy.contains("logging") && cfgCopy["logging"].is_object()) {
        const auto& lg = cfgCopy["logging"];
        if (lg.contains("min_level")) {
            if (!lg["min_level"].is_string() ||
                !ErrorHandler::parseLogLevel(lg["min_level"].get<std::string>()).has_value()) {
                out.push_back("Invalid 'logging.min_level' (error|warning|info|debug)");
            }
        }
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!utils::startsWith(s, "WARN:")) return true;
    }
    return false;
}

} // namespace delo::ambient
