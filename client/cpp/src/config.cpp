#include "stockline/config.hpp"
#include "stockline/logging.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace stockline {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

std::optional<long long> env_number(const char* name) {
    auto value = env(name);
    if (!value) return std::nullopt;
    std::optional<long long> number;
    try {
        size_t consumed = 0;
        auto parsed = std::stoll(*value, &consumed);
        if (consumed == value->size() && parsed >= 0) number = parsed;
    } catch (const std::logic_error&) {
        number.reset();
    }
    if (number) return number;
    log_warn("config", "ignored_unparsable_value", {{"variable", name}, {"value", *value}});
    return std::nullopt;
}

void read_millis(const char* name, std::chrono::milliseconds& field) {
    if (auto ms = env_number(name)) field = std::chrono::milliseconds(*ms);
}

} // anonymous namespace

Config Config::from_env() {
    Config config;
    if (auto value = env("STOCKLINE_REMOTE_ENDPOINT")) config.remote_endpoint = *value;
    if (auto value = env("STOCKLINE_DATA_DIR")) config.data_dir = *value;
    read_millis("STOCKLINE_SYNC_INTERVAL_MS", config.sync_interval);
    read_millis("STOCKLINE_REMOTE_TIMEOUT_MS", config.remote_timeout);
    read_millis("STOCKLINE_HEALTH_INTERVAL_MS", config.health_check_interval);
    read_millis("STOCKLINE_WARNING_TTL_MS", config.warning_ttl);
    read_millis("STOCKLINE_REALTIME_WINDOW_MS", config.realtime_window);
    if (auto n = env_number("STOCKLINE_RETRY_BUDGET")) config.retry_budget = static_cast<int>(*n);
    if (auto n = env_number("STOCKLINE_MAX_PENDING_OPS")) {
        config.max_pending_ops = static_cast<size_t>(*n);
    }
    if (auto n = env_number("STOCKLINE_STORAGE_CAPACITY_BYTES")) {
        config.storage_capacity_bytes = static_cast<size_t>(*n);
    }
    return config;
}

} // namespace stockline
