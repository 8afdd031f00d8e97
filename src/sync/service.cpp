#include "usync/sync/service.hpp"

#include "usync/metadata/memory_store.hpp"
#include "usync/metadata/sharded_store.hpp"
#include "usync/metadata/sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <vector>

namespace usync::sync {

namespace {

Result<std::unique_ptr<metadata::RecordStore>> open_one(const std::string& path) {
    using StorePtr = std::unique_ptr<metadata::RecordStore>;
    if (path.empty()) {
        return Ok<StorePtr>(std::make_unique<metadata::MemoryRecordStore>());
    }
    try {
        return Ok<StorePtr>(std::make_unique<metadata::SqliteRecordStore>(path));
    } catch (const std::exception& e) {
        return Err<StorePtr>(ErrorCode::Storage, "Failed to open store " + path + ": " + e.what());
    }
}

} // namespace

Result<std::unique_ptr<metadata::RecordStore>> SyncService::make_store(const config::SyncConfig& config) {
    using StorePtr = std::unique_ptr<metadata::RecordStore>;
    if (config.shard_count <= 1) {
        return open_one(config.database_path);
    }

    std::vector<StorePtr> shards;
    shards.reserve(config.shard_count);
    for (std::uint32_t i = 0; i < config.shard_count; ++i) {
        const auto path = config.database_path.empty() ? std::string()
                                                       : config.database_path + "." + std::to_string(i);
        auto shard = open_one(path);
        if (shard.is_error()) {
            return shard;
        }
        shards.push_back(std::move(shard.value()));
    }
    return Ok<StorePtr>(std::make_unique<metadata::ShardedRecordStore>(std::move(shards)));
}

Result<std::unique_ptr<SyncService>> SyncService::create(config::SyncConfig config,
                                                         transfer::Transport& transport,
                                                         std::filesystem::path staging_root,
                                                         security::PayloadCipher* cipher,
                                                         ServiceHooks hooks) {
    if (auto valid = config::validate(config); valid.is_error()) {
        return Err<std::unique_ptr<SyncService>>(valid.error());
    }
    auto store = make_store(config);
    if (store.is_error()) {
        return Err<std::unique_ptr<SyncService>>(store.error());
    }
    return Ok(std::make_unique<SyncService>(std::move(store.value()), std::move(config), transport,
                                            std::move(staging_root), cipher, std::move(hooks)));
}

SyncService::SyncService(std::unique_ptr<metadata::RecordStore> store,
                         config::SyncConfig config,
                         transfer::Transport& transport,
                         std::filesystem::path staging_root,
                         security::PayloadCipher* cipher,
                         ServiceHooks hooks)
    : config_(std::move(config)),
      store_(std::move(store)),
      logger_(bus_),
      metrics_(bus_),
      retry_(config_.retry, std::move(hooks.sleeper)),
      queue_(*store_, transfer::QueueOptions::from_config(config_), std::move(hooks.clock), &bus_),
      engine_(*store_, config_, &bus_),
      publisher_(*store_, transport, queue_, retry_, config_, cipher, &bus_),
      shares_(*store_, transport, retry_, cipher, &bus_),
      retriever_(*store_, transport, queue_, retry_, config_, std::move(staging_root), cipher) {}

Result<metadata::Folder> SyncService::add_folder(const std::string& folder_id,
                                                 const std::string& name,
                                                 const std::string& path) {
    return engine_.create_folder(folder_id, name, path);
}

Result<IndexResult> SyncService::index(const std::string& folder_id) {
    auto indexed = engine_.index_folder(folder_id);
    if (indexed.is_error() && indexed.error().code == ErrorCode::ConcurrencyConflict) {
        spdlog::warn("Folder {} moved on while indexing, indexing again", folder_id);
        indexed = engine_.index_folder(folder_id);
    }
    return indexed;
}

Result<transfer::RunReport> SyncService::upload(const std::string& folder_id) {
    return publisher_.upload(folder_id);
}

Result<metadata::Share> SyncService::share(const std::string& folder_id,
                                           metadata::ShareType type,
                                           const nlohmann::json& details) {
    return shares_.publish(folder_id, type, details);
}

Result<transfer::RunReport> SyncService::download(const std::string& token,
                                                  const std::filesystem::path& destination) {
    return retriever_.download(token, destination);
}

} // namespace usync::sync
