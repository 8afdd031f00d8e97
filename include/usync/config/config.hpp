#pragma once

/**
 * @file config.hpp
 * @brief Runtime settings shared by indexing, packing and transfer
 *
 * Every key of the JSON form is optional; absent keys keep the defaults
 * below. Example:
 *
 *   {
 *     "segment_size": 768000,
 *     "max_pack_size": 5242880,
 *     "redundancy_copies": 1,
 *     "retry": { "max_attempts": 5, "initial_delay_ms": 1000 }
 *   }
 */

#include "usync/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace usync::config {

struct RetrySettings {
    std::uint32_t max_attempts = 5;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    double multiplier = 2.0;
    double jitter = 0.25;              // +/- fraction applied to each delay
};

struct SyncConfig {
    std::uint32_t segment_size = 768000;               // 750 KiB
    std::uint64_t max_pack_size = 5ULL * 1024 * 1024;
    std::uint32_t redundancy_copies = 0;
    std::uint32_t shard_count = 1;
    std::size_t worker_threads = 4;
    std::chrono::seconds lease_duration{300};
    std::uint32_t max_segment_attempts = 3;            // Per segment, per run
    RetrySettings retry;
    std::string database_path;                         // Empty: in-memory store
    std::string log_level = "info";
    bool skip_hidden = true;
};

/// Range checks applied after parsing; also usable on hand-built configs.
Result<void> validate(const SyncConfig& config);

Result<SyncConfig> parse_config(const std::string& text);
Result<SyncConfig> load_config(const std::string& path);

nlohmann::json to_json(const SyncConfig& config);

} // namespace usync::config
