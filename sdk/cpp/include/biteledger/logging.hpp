#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace biteledger {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Parse "debug", "info", "warn"/"warning" or "error"; anything else is Info.
inline LogLevel parse_log_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "debug") return LogLevel::Debug;
    if (value == "warn" || value == "warning") return LogLevel::Warn;
    if (value == "error") return LogLevel::Error;
    return LogLevel::Info;
}

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

/// Minimum level written, read once from BITELEDGER_LOG_LEVEL.
inline LogLevel min_log_level() {
    static const LogLevel level = [] {
        const char* env = std::getenv("BITELEDGER_LOG_LEVEL");
        return env ? parse_log_level(env) : LogLevel::Info;
    }();
    return level;
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

inline void log_at(LogLevel level, const std::string& domain, const std::string& message,
                   const nlohmann::json& fields = {}) {
    if (level < min_log_level()) return;

    nlohmann::json log_entry = {
        {"level", level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << log_entry.dump() << std::endl;
}

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Error, domain, message, fields);
}

}  // namespace biteledger
