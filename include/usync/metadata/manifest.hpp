#pragma once

/**
 * @file manifest.hpp
 * @brief Compact binary snapshot of one folder version's file tree
 *
 * The manifest is what a share recipient fetches first: it carries the full
 * layout (directories, file sizes, hashes, segment counts) and nothing else.
 *
 * BINARY FORMAT (before zlib compression, integers big-endian):
 * [magic "USBI": 4 bytes] [format version: 2 bytes]
 * [folder_id: u16 length + bytes] [folder_version: varint]
 * [folder_count: 4 bytes] [file_count: 4 bytes] [total_size: 8 bytes]
 * [dictionary_size: 4 bytes] dictionary_size x [u16 length + component bytes]
 * folder_count x [depth: varint] depth x [component index: varint]
 *                [file_count: varint] [subfolder_count: varint]
 * file_count x   [depth: varint] depth x [component index: varint]
 *                [size: varint] [sha256: 32 bytes] [mtime: varint] [segments: varint]
 *
 * Dictionary, folders and files are each sorted before emission, so one
 * logical tree always encodes to the same bytes.
 */

#include "usync/core/result.hpp"
#include "usync/metadata/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace usync {
namespace metadata {

struct ManifestFolder {
    std::string path;                  // "" is the folder root
    std::uint32_t file_count = 0;      // Direct children only
    std::uint32_t subfolder_count = 0;

    bool operator==(const ManifestFolder& other) const {
        return path == other.path && file_count == other.file_count &&
               subfolder_count == other.subfolder_count;
    }
};

struct ManifestFile {
    std::string path;
    std::uint64_t size = 0;
    std::string hash;                  // SHA-256 hex
    std::int64_t modified_time = 0;
    std::uint32_t segment_count = 0;

    bool operator==(const ManifestFile& other) const {
        return path == other.path && size == other.size && hash == other.hash &&
               modified_time == other.modified_time && segment_count == other.segment_count;
    }
};

struct ManifestTree {
    std::string folder_id;
    std::uint64_t folder_version = 0;
    std::vector<ManifestFolder> folders;
    std::vector<ManifestFile> files;

    std::uint64_t total_size() const;

    /// Order-insensitive: two trees are equal when their canonical forms are.
    bool operator==(const ManifestTree& other) const;
    bool operator!=(const ManifestTree& other) const { return !(*this == other); }
};

constexpr std::uint16_t kManifestFormatVersion = 1;

/// Sort folders and files by path.
ManifestTree canonicalize(ManifestTree tree);

/**
 * @brief Build the tree of one folder version from its live file heads
 *
 * Deleted files are left out. Every ancestor directory of a live file gets a
 * folder record, the root included.
 */
ManifestTree build_manifest(const std::string& folder_id,
                            std::uint64_t folder_version,
                            const std::vector<File>& files);

/**
 * @brief Serialize and compress at the maximum zlib level
 *
 * Validation errors: empty or duplicate paths, empty path components,
 * hashes that are not 64 hex chars, components or folder ids over 65535 bytes.
 */
Result<std::vector<std::uint8_t>> encode_manifest(const ManifestTree& tree);

/**
 * @brief Exact inverse of encode_manifest()
 *
 * Format error on corrupt compression, wrong magic or unknown version;
 * Truncation error when declared counts or lengths run past the buffer.
 */
Result<ManifestTree> decode_manifest(const std::vector<std::uint8_t>& blob);

} // namespace metadata
} // namespace usync
