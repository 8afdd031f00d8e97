#pragma once

#include "usync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace usync::sync {

/**
 * @brief Disk side of segment transfer
 *
 * Uploads read segment bytes straight from the indexed file. Downloads
 * write each verified segment at its offset in a per-session staging file
 * (staging_root/session_id/path), and finalize_file() moves the staging file
 * into place once the whole-file hash matches.
 */
class SegmentIo {
public:
    /// Integrity error when the bytes on disk no longer hash to expected_hash.
    Result<std::vector<std::uint8_t>> read_segment(const std::filesystem::path& source,
                                                   std::uint64_t offset,
                                                   std::uint32_t size,
                                                   const std::string& expected_hash) const;

    Result<void> apply_segment(const std::string& session_id,
                               const std::string& file_path,
                               std::uint64_t offset,
                               const std::vector<std::uint8_t>& data,
                               const std::string& expected_hash,
                               const std::filesystem::path& staging_root) const;

    Result<void> finalize_file(const std::string& session_id,
                               const std::string& file_path,
                               std::uint64_t expected_size,
                               const std::string& expected_hash,
                               const std::filesystem::path& staging_root,
                               const std::filesystem::path& destination_root) const;

    /// True when `path` exists with exactly this size and SHA-256.
    Result<bool> file_matches(const std::filesystem::path& path,
                              std::uint64_t expected_size,
                              const std::string& expected_hash) const;

    /// Remove what is left of a session's staging tree.
    Result<void> discard_staging(const std::string& session_id,
                                 const std::filesystem::path& staging_root) const;

    static std::filesystem::path make_staging_path(const std::filesystem::path& staging_root,
                                                   const std::string& session_id,
                                                   const std::string& file_path);

private:
    static Result<void> check_relative(const std::string& file_path);
    static Result<void> ensure_parent_exists(const std::filesystem::path& path);
};

} // namespace usync::sync
