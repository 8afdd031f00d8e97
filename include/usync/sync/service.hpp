#pragma once

/**
 * @file service.hpp
 * @brief One object wiring store, events, indexing, upload, sharing and download
 *
 * The transport (and optional cipher) are supplied by the embedding program;
 * everything else is built from SyncConfig:
 * - database_path empty: in-memory store(s); otherwise SQLite file(s)
 * - shard_count > 1: a ShardedRecordStore over that many children, the
 *   SQLite files suffixed ".0", ".1", ...
 */

#include "usync/config/config.hpp"
#include "usync/core/result.hpp"
#include "usync/events/components.hpp"
#include "usync/events/event_bus.hpp"
#include "usync/metadata/store.hpp"
#include "usync/publishing/share.hpp"
#include "usync/security/cipher.hpp"
#include "usync/sync/versioning.hpp"
#include "usync/transfer/publisher.hpp"
#include "usync/transfer/queue.hpp"
#include "usync/transfer/retriever.hpp"
#include "usync/transfer/retry.hpp"
#include "usync/transfer/transport.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace usync::sync {

/// Time sources tests replace so nothing really waits.
struct ServiceHooks {
    transfer::Clock clock = transfer::system_clock_ms();
    transfer::RetryPolicy::Sleeper sleeper = transfer::RetryPolicy::default_sleeper();
};

class SyncService {
public:
    /// Storage error when a SQLite database cannot be opened.
    static Result<std::unique_ptr<metadata::RecordStore>> make_store(const config::SyncConfig& config);

    /// Validates the config, opens the store and wires the service.
    static Result<std::unique_ptr<SyncService>> create(config::SyncConfig config,
                                                       transfer::Transport& transport,
                                                       std::filesystem::path staging_root,
                                                       security::PayloadCipher* cipher = nullptr,
                                                       ServiceHooks hooks = {});

    SyncService(std::unique_ptr<metadata::RecordStore> store,
                config::SyncConfig config,
                transfer::Transport& transport,
                std::filesystem::path staging_root,
                security::PayloadCipher* cipher = nullptr,
                ServiceHooks hooks = {});

    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;

    Result<metadata::Folder> add_folder(const std::string& folder_id,
                                        const std::string& name,
                                        const std::string& path);

    /// Index once; a lost version race is retried a single time against the fresh snapshot.
    Result<IndexResult> index(const std::string& folder_id);

    Result<transfer::RunReport> upload(const std::string& folder_id);

    Result<metadata::Share> share(const std::string& folder_id,
                                  metadata::ShareType type,
                                  const nlohmann::json& details = nlohmann::json::object());

    Result<transfer::RunReport> download(const std::string& token, const std::filesystem::path& destination);

    transfer::TransferQueue& queue() noexcept { return queue_; }
    metadata::RecordStore& store() noexcept { return *store_; }
    events::EventBus& bus() noexcept { return bus_; }
    const events::MetricsComponent::Stats& stats() const { return metrics_.get_stats(); }
    const config::SyncConfig& config() const noexcept { return config_; }

private:
    config::SyncConfig config_;
    std::unique_ptr<metadata::RecordStore> store_;
    events::EventBus bus_;
    events::LoggerComponent logger_;
    events::MetricsComponent metrics_;
    transfer::RetryPolicy retry_;
    transfer::TransferQueue queue_;
    VersioningEngine engine_;
    transfer::Publisher publisher_;
    publishing::ShareService shares_;
    transfer::Retriever retriever_;
};

} // namespace usync::sync
