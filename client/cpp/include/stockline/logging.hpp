#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace stockline {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

inline nlohmann::json log_entry(const char* level, const std::string& domain,
                                const std::string& message, const nlohmann::json& fields) {
    nlohmann::json entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        entry[key] = value;
    }
    return entry;
}

/// One JSON object per line; lines from different threads never interleave.
inline void write_log(std::ostream& out, const nlohmann::json& entry) {
    static std::mutex mutex;
    auto line = entry.dump();
    std::lock_guard<std::mutex> lock(mutex);
    out << line << std::endl;
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    write_log(std::cout, log_entry("info", domain, message, fields));
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    write_log(std::cerr, log_entry("warn", domain, message, fields));
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    write_log(std::cerr, log_entry("error", domain, message, fields));
}

}  // namespace stockline
