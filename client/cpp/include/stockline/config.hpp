#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace stockline {

/**
 * Runtime settings. Every field has a default; from_env() overrides the ones
 * whose STOCKLINE_* variable is set and parses.
 */
struct Config {
    std::string remote_endpoint = "localhost:50051";
    std::string data_dir = "./stockline-data";
    std::chrono::milliseconds sync_interval{30000};
    std::chrono::milliseconds remote_timeout{10000};
    int retry_budget = 3;
    size_t max_pending_ops = 2000;
    size_t storage_capacity_bytes = 5 * 1024 * 1024;
    std::chrono::milliseconds health_check_interval{60000};
    std::chrono::milliseconds warning_ttl{10000};
    std::chrono::milliseconds realtime_window{2000};

    static Config from_env();
};

} // namespace stockline
