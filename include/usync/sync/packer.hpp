#pragma once

/**
 * @file packer.hpp
 * @brief Bins segments into size-bounded transport containers
 *
 * PACK FORMAT (integers big-endian):
 * [magic "USPK": 4 bytes] [format version: 2 bytes] [entry_count: 4 bytes]
 * entry_count x [segment_id: u16 length + bytes] [part_index: 4 bytes]
 *               [part_count: 4 bytes] [length: 4 bytes]
 * payloads, in entry order
 *
 * The encoded pack, header included, never exceeds the bound passed to
 * pack(). A segment too large for an empty pack is cut into parts first;
 * each part carries its index so the receiver can stitch them back.
 */

#include "usync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace usync::sync {

constexpr std::uint16_t kPackFormatVersion = 1;
constexpr std::size_t kPackHeaderSize = 10;
constexpr std::size_t kPackEntryFixedSize = 14;   // id length + part index + part count + length

/// Smallest pack bound the configuration accepts.
constexpr std::size_t kMinPackSize = 1024;

struct SegmentPayload {
    std::string segment_id;
    std::vector<std::uint8_t> data;
};

struct PackEntry {
    std::string segment_id;
    std::uint32_t part_index = 0;
    std::uint32_t part_count = 1;
    std::uint32_t length = 0;

    bool operator==(const PackEntry& other) const {
        return segment_id == other.segment_id && part_index == other.part_index &&
               part_count == other.part_count && length == other.length;
    }
};

struct Pack {
    std::vector<PackEntry> entries;
    std::vector<std::uint8_t> bytes;   ///< Encoded form, ready to post
};

struct UnpackedEntry {
    PackEntry entry;
    std::vector<std::uint8_t> data;
};

inline std::size_t pack_entry_overhead(const std::string& segment_id) {
    return kPackEntryFixedSize + segment_id.size();
}

/**
 * @brief Greedily fill packs in input order
 *
 * Each pack takes segments until the next one would push it past
 * max_pack_size, then a new pack opens. Validation error for empty
 * segments, empty or oversized ids, or a bound that cannot hold one byte.
 */
Result<std::vector<Pack>> pack(const std::vector<SegmentPayload>& segments, std::size_t max_pack_size);

/**
 * @brief Decode one pack into its entries, in order
 *
 * Format error on bad magic or version; Truncation error when declared
 * lengths run past the buffer.
 */
Result<std::vector<UnpackedEntry>> unpack(const std::vector<std::uint8_t>& bytes);

/**
 * @brief Stitch split parts back into whole segments
 *
 * Output is ordered by first appearance. Truncation error when a segment's
 * parts are incomplete, Format error when they disagree on the part count.
 */
Result<std::vector<SegmentPayload>> reassemble(const std::vector<UnpackedEntry>& parts);

} // namespace usync::sync
