#pragma once

/**
 * @file retriever.hpp
 * @brief Download side: share token -> manifest -> verified files on disk
 *
 * FLOW:
 * 1. Resolve the Share and fetch its manifest through the retry policy
 * 2. Build a download session over the effective primary segments of every
 *    file in the manifest (resumed if it already exists)
 * 3. Workers fetch the pack(s) holding each segment (cached per run), check
 *    the segment hash and write it into the session's staging file
 * 4. Files whose segments are all complete are verified and moved into the
 *    destination
 *
 * A segment whose primary cannot be fetched or fails its hash check is
 * retried from its redundant copies, in redundancy order.
 */

#include "usync/config/config.hpp"
#include "usync/core/result.hpp"
#include "usync/metadata/manifest.hpp"
#include "usync/metadata/store.hpp"
#include "usync/security/cipher.hpp"
#include "usync/sync/packer.hpp"
#include "usync/sync/segment_io.hpp"
#include "usync/transfer/queue.hpp"
#include "usync/transfer/retry.hpp"
#include "usync/transfer/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace usync::transfer {

class Retriever {
public:
    Retriever(metadata::RecordStore& store,
              Transport& transport,
              TransferQueue& queue,
              RetryPolicy& retry,
              config::SyncConfig config,
              std::filesystem::path staging_root,
              security::PayloadCipher* cipher = nullptr);

    static std::string session_id_for(const std::string& token, const std::filesystem::path& destination);

    /// Integrity error when the manifest describes another folder version than the share.
    Result<metadata::ManifestTree> fetch_manifest(const metadata::Share& share);

    Result<RunReport> download(const std::string& token, const std::filesystem::path& destination);

private:
    struct SegmentSource {
        metadata::ManifestFile file;
        metadata::Segment primary;
        std::vector<metadata::Segment> copies;   ///< Ascending redundancy index
    };

    Result<std::vector<SegmentSource>> resolve_sources(const metadata::Share& share,
                                                       const metadata::ManifestTree& tree) const;
    Result<std::shared_ptr<const std::vector<sync::UnpackedEntry>>> fetch_pack(const std::string& folder_id,
                                                                               const std::string& locator);
    Result<std::vector<std::uint8_t>> fetch_segment(const metadata::Segment& segment);
    Result<std::size_t> retrieve(const metadata::SegmentProgress& claim, const SegmentSource& source);
    Result<void> finalize(const std::string& session_id,
                          const metadata::ManifestTree& tree,
                          const std::filesystem::path& destination,
                          RunReport& report);

    metadata::RecordStore& store_;
    Transport& transport_;
    TransferQueue& queue_;
    RetryPolicy& retry_;
    config::SyncConfig config_;
    std::filesystem::path staging_root_;
    security::PayloadCipher* cipher_;
    sync::SegmentIo io_;

    std::mutex cache_mutex_;
    std::unordered_map<std::string, std::shared_ptr<const std::vector<sync::UnpackedEntry>>> pack_cache_;
};

} // namespace usync::transfer
