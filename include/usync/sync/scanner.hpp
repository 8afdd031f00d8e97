#pragma once

#include "usync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace usync::sync {

struct ScannedSegment {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint32_t size = 0;
    std::string hash;                  ///< SHA-256 hex of the segment bytes
};

/**
 * @brief One regular file as found on disk
 */
struct ScannedFile {
    std::string path;                  ///< Relative to the scan root (POSIX style)
    std::uint64_t size = 0;
    std::int64_t modified_time = 0;
    std::string hash;                  ///< SHA-256 hex of the whole file
    std::vector<ScannedSegment> segments; ///< Fixed-offset tiling, gapless by index
};

struct ScanResult {
    std::vector<ScannedFile> files;    ///< Sorted by path
    std::uint64_t total_size = 0;
};

/**
 * @brief Walks a folder and hashes every file at fixed segment boundaries
 *
 * Files are hashed in parallel on a worker pool; within one file the read is
 * sequential, so segment indices are assigned in offset order.
 * Entries whose name starts with '.' are skipped (directories pruned) when
 * skip_hidden is set.
 */
class FolderScanner {
public:
    FolderScanner(std::uint32_t segment_size, bool skip_hidden = true, std::size_t threads = 4);

    Result<ScanResult> scan(const std::filesystem::path& root) const;

    /// Hash a single file; exposed for callers that re-verify one file.
    static Result<ScannedFile> hash_file(const std::filesystem::path& absolute_path,
                                         const std::string& relative_path,
                                         std::uint32_t segment_size);

    std::uint32_t segment_size() const noexcept { return segment_size_; }

private:
    std::uint32_t segment_size_;
    bool skip_hidden_;
    std::size_t threads_;
};

} // namespace usync::sync
