#include "usync/config/config.hpp"

#include "usync/sync/packer.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace usync::config {
namespace {

// Reads an unsigned key, rejecting negatives and values past T's range
template<typename T>
Result<T> read_unsigned(const json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok(fallback);
    }
    if (!it->is_number_integer()) {
        return Err<T>(ErrorCode::Validation, std::string("Config key '") + key + "' must be an integer");
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > std::numeric_limits<T>::max()) {
            return Err<T>(ErrorCode::Validation, std::string("Config key '") + key + "' is out of range");
        }
        return Ok(static_cast<T>(value));
    }
    const auto value = it->get<std::int64_t>();
    if (value < 0) {
        return Err<T>(ErrorCode::Validation, std::string("Config key '") + key + "' must not be negative");
    }
    return Ok(static_cast<T>(value));
}

Result<double> read_double(const json& object, const char* key, double fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok(fallback);
    }
    if (!it->is_number()) {
        return Err<double>(ErrorCode::Validation, std::string("Config key '") + key + "' must be a number");
    }
    return Ok(it->get<double>());
}

Result<std::string> read_string(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok(fallback);
    }
    if (!it->is_string()) {
        return Err<std::string>(ErrorCode::Validation, std::string("Config key '") + key + "' must be a string");
    }
    return Ok(it->get<std::string>());
}

Result<bool> read_bool(const json& object, const char* key, bool fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok(fallback);
    }
    if (!it->is_boolean()) {
        return Err<bool>(ErrorCode::Validation, std::string("Config key '") + key + "' must be a boolean");
    }
    return Ok(it->get<bool>());
}

Result<RetrySettings> parse_retry(const json& object, RetrySettings settings) {
    if (!object.is_object()) {
        return Err<RetrySettings>(ErrorCode::Validation, "Config key 'retry' must be an object");
    }
    auto attempts = read_unsigned<std::uint32_t>(object, "max_attempts", settings.max_attempts);
    if (attempts.is_error()) {
        return Err<RetrySettings>(attempts.error());
    }
    auto initial = read_unsigned<std::uint64_t>(object, "initial_delay_ms",
                                                static_cast<std::uint64_t>(settings.initial_delay.count()));
    if (initial.is_error()) {
        return Err<RetrySettings>(initial.error());
    }
    auto max_delay = read_unsigned<std::uint64_t>(object, "max_delay_ms",
                                                  static_cast<std::uint64_t>(settings.max_delay.count()));
    if (max_delay.is_error()) {
        return Err<RetrySettings>(max_delay.error());
    }
    auto multiplier = read_double(object, "multiplier", settings.multiplier);
    if (multiplier.is_error()) {
        return Err<RetrySettings>(multiplier.error());
    }
    auto jitter = read_double(object, "jitter", settings.jitter);
    if (jitter.is_error()) {
        return Err<RetrySettings>(jitter.error());
    }

    settings.max_attempts = attempts.value();
    settings.initial_delay = std::chrono::milliseconds(initial.value());
    settings.max_delay = std::chrono::milliseconds(max_delay.value());
    settings.multiplier = multiplier.value();
    settings.jitter = jitter.value();
    return Ok(settings);
}

} // namespace

Result<void> validate(const SyncConfig& config) {
    if (config.segment_size == 0) {
        return Err<void>(ErrorCode::Validation, "segment_size must be positive");
    }
    if (config.max_pack_size < sync::kMinPackSize) {
        return Err<void>(ErrorCode::Validation,
                         "max_pack_size must be at least " + std::to_string(sync::kMinPackSize));
    }
    if (config.shard_count == 0) {
        return Err<void>(ErrorCode::Validation, "shard_count must be positive");
    }
    if (config.worker_threads == 0) {
        return Err<void>(ErrorCode::Validation, "worker_threads must be positive");
    }
    if (config.lease_duration.count() <= 0) {
        return Err<void>(ErrorCode::Validation, "lease_duration_seconds must be positive");
    }
    if (config.max_segment_attempts == 0) {
        return Err<void>(ErrorCode::Validation, "max_segment_attempts must be positive");
    }
    const auto& retry = config.retry;
    if (retry.max_attempts == 0) {
        return Err<void>(ErrorCode::Validation, "retry.max_attempts must be positive");
    }
    if (retry.initial_delay > retry.max_delay) {
        return Err<void>(ErrorCode::Validation, "retry.initial_delay_ms exceeds retry.max_delay_ms");
    }
    if (retry.multiplier < 1.0) {
        return Err<void>(ErrorCode::Validation, "retry.multiplier must be at least 1.0");
    }
    if (retry.jitter < 0.0 || retry.jitter >= 1.0) {
        return Err<void>(ErrorCode::Validation, "retry.jitter must be in [0, 1)");
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<void>(ErrorCode::Validation, "Unknown log_level '" + config.log_level + "'");
    }
    return Ok();
}

Result<SyncConfig> parse_config(const std::string& text) {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return Err<SyncConfig>(ErrorCode::Validation, "Config is not valid JSON");
    }
    if (!payload.is_object()) {
        return Err<SyncConfig>(ErrorCode::Validation, "Config must be a JSON object");
    }

    SyncConfig config;

    auto segment_size = read_unsigned<std::uint32_t>(payload, "segment_size", config.segment_size);
    if (segment_size.is_error()) {
        return Err<SyncConfig>(segment_size.error());
    }
    config.segment_size = segment_size.value();

    auto pack_size = read_unsigned<std::uint64_t>(payload, "max_pack_size", config.max_pack_size);
    if (pack_size.is_error()) {
        return Err<SyncConfig>(pack_size.error());
    }
    config.max_pack_size = pack_size.value();

    auto redundancy = read_unsigned<std::uint32_t>(payload, "redundancy_copies", config.redundancy_copies);
    if (redundancy.is_error()) {
        return Err<SyncConfig>(redundancy.error());
    }
    config.redundancy_copies = redundancy.value();

    auto shards = read_unsigned<std::uint32_t>(payload, "shard_count", config.shard_count);
    if (shards.is_error()) {
        return Err<SyncConfig>(shards.error());
    }
    config.shard_count = shards.value();

    auto workers = read_unsigned<std::size_t>(payload, "worker_threads", config.worker_threads);
    if (workers.is_error()) {
        return Err<SyncConfig>(workers.error());
    }
    config.worker_threads = workers.value();

    auto lease = read_unsigned<std::uint64_t>(payload, "lease_duration_seconds",
                                              static_cast<std::uint64_t>(config.lease_duration.count()));
    if (lease.is_error()) {
        return Err<SyncConfig>(lease.error());
    }
    config.lease_duration = std::chrono::seconds(lease.value());

    auto segment_attempts = read_unsigned<std::uint32_t>(payload, "max_segment_attempts",
                                                         config.max_segment_attempts);
    if (segment_attempts.is_error()) {
        return Err<SyncConfig>(segment_attempts.error());
    }
    config.max_segment_attempts = segment_attempts.value();

    if (auto it = payload.find("retry"); it != payload.end()) {
        auto retry = parse_retry(*it, config.retry);
        if (retry.is_error()) {
            return Err<SyncConfig>(retry.error());
        }
        config.retry = retry.value();
    }

    auto database = read_string(payload, "database_path", config.database_path);
    if (database.is_error()) {
        return Err<SyncConfig>(database.error());
    }
    config.database_path = database.value();

    auto level = read_string(payload, "log_level", config.log_level);
    if (level.is_error()) {
        return Err<SyncConfig>(level.error());
    }
    config.log_level = level.value();

    auto skip_hidden = read_bool(payload, "skip_hidden", config.skip_hidden);
    if (skip_hidden.is_error()) {
        return Err<SyncConfig>(skip_hidden.error());
    }
    config.skip_hidden = skip_hidden.value();

    if (auto valid = validate(config); valid.is_error()) {
        return Err<SyncConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<SyncConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<SyncConfig>(ErrorCode::Io, "Cannot open config file " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    auto config = parse_config(oss.str());
    if (config.is_ok()) {
        spdlog::debug("Loaded config from {}", path);
    }
    return config;
}

json to_json(const SyncConfig& config) {
    json j;
    j["segment_size"] = config.segment_size;
    j["max_pack_size"] = config.max_pack_size;
    j["redundancy_copies"] = config.redundancy_copies;
    j["shard_count"] = config.shard_count;
    j["worker_threads"] = config.worker_threads;
    j["lease_duration_seconds"] = config.lease_duration.count();
    j["max_segment_attempts"] = config.max_segment_attempts;
    j["retry"] = {
        {"max_attempts", config.retry.max_attempts},
        {"initial_delay_ms", config.retry.initial_delay.count()},
        {"max_delay_ms", config.retry.max_delay.count()},
        {"multiplier", config.retry.multiplier},
        {"jitter", config.retry.jitter},
    };
    j["database_path"] = config.database_path;
    j["log_level"] = config.log_level;
    j["skip_hidden"] = config.skip_hidden;
    return j;
}

} // namespace usync::config
