#pragma once

/**
 * @file publisher.hpp
 * @brief Upload side: not-yet-uploaded segments -> packs -> transport locators
 *
 * FLOW (per worker batch):
 * 1. Claim up to one pack's worth of segments from the upload session
 * 2. Read each segment from the folder on disk, re-checking its hash
 * 3. Pack by redundancy index, so copies never share a pack with their primary
 * 4. Seal (optional), post through the retry policy
 * 5. Attach the pack locator to every segment it carries, mark them complete
 */

#include "usync/config/config.hpp"
#include "usync/core/result.hpp"
#include "usync/events/event_bus.hpp"
#include "usync/metadata/store.hpp"
#include "usync/security/cipher.hpp"
#include "usync/sync/packer.hpp"
#include "usync/sync/segment_io.hpp"
#include "usync/transfer/queue.hpp"
#include "usync/transfer/retry.hpp"
#include "usync/transfer/transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace usync::transfer {

/// Separator between the locators of a segment split across packs.
constexpr char kLocatorSeparator = ';';

std::vector<std::string> split_locators(const std::string& joined);

class Publisher {
public:
    Publisher(metadata::RecordStore& store,
              Transport& transport,
              TransferQueue& queue,
              RetryPolicy& retry,
              config::SyncConfig config,
              security::PayloadCipher* cipher = nullptr,
              events::EventBus* bus = nullptr);

    /// Deterministic, so a restarted publisher resumes the same session.
    static std::string session_id_for(const std::string& folder_id, std::uint64_t version);

    /**
     * @brief Upload order: primaries before copies, then by path and index
     *
     * Validation error when the folder has never been indexed.
     */
    Result<SessionPlan> plan_upload(const std::string& folder_id) const;

    /// Start or resume the upload session of the folder's current version and drain it.
    Result<RunReport> upload(const std::string& folder_id);

private:
    std::vector<Result<std::size_t>> upload_batch(const metadata::Folder& folder,
                                                  const std::vector<metadata::SegmentProgress>& claims);
    Result<std::string> post_pack(const std::string& folder_id,
                                  const std::string& session_id,
                                  const sync::Pack& pack);
    std::size_t pack_budget() const;

    metadata::RecordStore& store_;
    Transport& transport_;
    TransferQueue& queue_;
    RetryPolicy& retry_;
    config::SyncConfig config_;
    security::PayloadCipher* cipher_;
    events::EventBus* bus_;
    sync::SegmentIo io_;
};

} // namespace usync::transfer
