#include "usync/sync/packer.hpp"

#include "usync/core/byte_buffer.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <unordered_map>

namespace usync::sync {
namespace {

constexpr std::array<std::uint8_t, 4> kMagic = {'U', 'S', 'P', 'K'};
constexpr std::size_t kMaxIdLength = 0xFFFF;

struct Item {
    const SegmentPayload* source;
    std::size_t offset;
    std::size_t length;
    std::uint32_t part_index;
    std::uint32_t part_count;
};

Pack encode(const std::vector<Item>& items) {
    Pack result;
    ByteWriter writer;
    writer.write_bytes(kMagic.data(), kMagic.size());
    writer.write_uint16(kPackFormatVersion);
    writer.write_uint32(static_cast<std::uint32_t>(items.size()));
    for (const auto& item : items) {
        PackEntry entry;
        entry.segment_id = item.source->segment_id;
        entry.part_index = item.part_index;
        entry.part_count = item.part_count;
        entry.length = static_cast<std::uint32_t>(item.length);
        writer.write_short_string(entry.segment_id);
        writer.write_uint32(entry.part_index);
        writer.write_uint32(entry.part_count);
        writer.write_uint32(entry.length);
        result.entries.push_back(std::move(entry));
    }
    for (const auto& item : items) {
        writer.write_bytes(item.source->data.data() + item.offset, item.length);
    }
    result.bytes = writer.release();
    return result;
}

} // namespace

Result<std::vector<Pack>> pack(const std::vector<SegmentPayload>& segments, std::size_t max_pack_size) {
    // Cut every segment into items that fit an empty pack on their own
    std::vector<Item> items;
    for (const auto& segment : segments) {
        if (segment.segment_id.empty() || segment.segment_id.size() > kMaxIdLength) {
            return Err<std::vector<Pack>>(ErrorCode::Validation, "Segment id must be 1..65535 bytes");
        }
        if (segment.data.empty()) {
            return Err<std::vector<Pack>>(ErrorCode::Validation, "Segment " + segment.segment_id + " is empty");
        }
        const std::size_t overhead = kPackHeaderSize + pack_entry_overhead(segment.segment_id);
        if (max_pack_size <= overhead) {
            return Err<std::vector<Pack>>(ErrorCode::Validation,
                                          "Pack bound " + std::to_string(max_pack_size) +
                                          " cannot hold segment " + segment.segment_id);
        }
        const std::size_t capacity = max_pack_size - overhead;
        const std::size_t parts = (segment.data.size() + capacity - 1) / capacity;
        for (std::size_t part = 0; part < parts; ++part) {
            const std::size_t offset = part * capacity;
            items.push_back(Item{&segment, offset, std::min(capacity, segment.data.size() - offset),
                                 static_cast<std::uint32_t>(part), static_cast<std::uint32_t>(parts)});
        }
    }

    std::vector<Pack> packs;
    std::vector<Item> current;
    std::size_t current_size = kPackHeaderSize;
    for (const auto& item : items) {
        const std::size_t cost = pack_entry_overhead(item.source->segment_id) + item.length;
        if (!current.empty() && current_size + cost > max_pack_size) {
            packs.push_back(encode(current));
            current.clear();
            current_size = kPackHeaderSize;
        }
        current.push_back(item);
        current_size += cost;
    }
    if (!current.empty()) {
        packs.push_back(encode(current));
    }
    return Ok(std::move(packs));
}

Result<std::vector<UnpackedEntry>> unpack(const std::vector<std::uint8_t>& bytes) {
    ByteReader reader(bytes);

    auto magic = reader.read_bytes(kMagic.size());
    if (magic.is_error()) {
        return Err<std::vector<UnpackedEntry>>(magic.error());
    }
    if (!std::equal(kMagic.begin(), kMagic.end(), magic.value().begin())) {
        return Err<std::vector<UnpackedEntry>>(ErrorCode::Format, "Not a pack (bad magic)");
    }
    auto version = reader.read_uint16();
    if (version.is_error()) {
        return Err<std::vector<UnpackedEntry>>(version.error());
    }
    if (version.value() != kPackFormatVersion) {
        return Err<std::vector<UnpackedEntry>>(ErrorCode::Format,
                                               "Unsupported pack version: " + std::to_string(version.value()));
    }
    auto count = reader.read_uint32();
    if (count.is_error()) {
        return Err<std::vector<UnpackedEntry>>(count.error());
    }
    if (static_cast<std::uint64_t>(count.value()) * kPackEntryFixedSize > reader.remaining()) {
        return Err<std::vector<UnpackedEntry>>(ErrorCode::Truncation,
                                               "Pack declares " + std::to_string(count.value()) +
                                               " entries but holds " + std::to_string(reader.remaining()) + " bytes");
    }

    std::vector<UnpackedEntry> entries(count.value());
    for (auto& unpacked : entries) {
        auto id = reader.read_short_string();
        if (id.is_error()) {
            return Err<std::vector<UnpackedEntry>>(id.error());
        }
        auto part_index = reader.read_uint32();
        if (part_index.is_error()) {
            return Err<std::vector<UnpackedEntry>>(part_index.error());
        }
        auto part_count = reader.read_uint32();
        if (part_count.is_error()) {
            return Err<std::vector<UnpackedEntry>>(part_count.error());
        }
        auto length = reader.read_uint32();
        if (length.is_error()) {
            return Err<std::vector<UnpackedEntry>>(length.error());
        }
        if (part_count.value() == 0 || part_index.value() >= part_count.value()) {
            return Err<std::vector<UnpackedEntry>>(ErrorCode::Format, "Pack entry has invalid part numbering");
        }
        unpacked.entry.segment_id = std::move(id.value());
        unpacked.entry.part_index = part_index.value();
        unpacked.entry.part_count = part_count.value();
        unpacked.entry.length = length.value();
    }

    for (auto& unpacked : entries) {
        auto data = reader.read_bytes(unpacked.entry.length);
        if (data.is_error()) {
            return Err<std::vector<UnpackedEntry>>(data.error());
        }
        unpacked.data = std::move(data.value());
    }
    if (reader.remaining() != 0) {
        return Err<std::vector<UnpackedEntry>>(ErrorCode::Format, "Trailing bytes after pack payloads");
    }
    return Ok(std::move(entries));
}

Result<std::vector<SegmentPayload>> reassemble(const std::vector<UnpackedEntry>& parts) {
    std::vector<std::string> order;
    std::unordered_map<std::string, std::map<std::uint32_t, const UnpackedEntry*>> grouped;
    std::unordered_map<std::string, std::uint32_t> expected;

    for (const auto& part : parts) {
        const auto& id = part.entry.segment_id;
        auto [it, inserted] = expected.emplace(id, part.entry.part_count);
        if (inserted) {
            order.push_back(id);
        } else if (it->second != part.entry.part_count) {
            return Err<std::vector<SegmentPayload>>(ErrorCode::Format, "Parts of " + id + " disagree on part count");
        }
        grouped[id][part.entry.part_index] = &part;
    }

    std::vector<SegmentPayload> segments;
    segments.reserve(order.size());
    for (const auto& id : order) {
        const auto& pieces = grouped[id];
        if (pieces.size() != expected[id]) {
            return Err<std::vector<SegmentPayload>>(ErrorCode::Truncation,
                                                    "Segment " + id + " has " + std::to_string(pieces.size()) +
                                                    " of " + std::to_string(expected[id]) + " parts");
        }
        SegmentPayload segment;
        segment.segment_id = id;
        for (const auto& [index, piece] : pieces) {
            segment.data.insert(segment.data.end(), piece->data.begin(), piece->data.end());
        }
        segments.push_back(std::move(segment));
    }
    return Ok(std::move(segments));
}

} // namespace usync::sync
