#include "usync/metadata/manifest.hpp"

#include "usync/core/byte_buffer.hpp"
#include "usync/core/hash.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <unordered_map>

namespace usync::metadata {
namespace {

constexpr std::array<std::uint8_t, 4> kMagic = {'U', 'S', 'B', 'I'};
constexpr std::size_t kMaxComponentLength = 0xFFFF;

// Smallest possible encodings, used to reject impossible counts up front
constexpr std::size_t kMinFolderRecord = 3;
constexpr std::size_t kMinFileRecord = 4 + hash::kSha256Size;

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    if (path.empty()) {
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        const auto slash = path.find('/', start);
        if (slash == std::string::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

std::string parent_of(const std::string& path) {
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

Result<void> validate_components(const std::string& path, bool allow_root) {
    if (path.empty()) {
        if (allow_root) {
            return Ok();
        }
        return Err<void>(ErrorCode::Validation, "Manifest file path must not be empty");
    }
    for (const auto& part : split_path(path)) {
        if (part.empty()) {
            return Err<void>(ErrorCode::Validation, "Empty path component in " + path);
        }
        if (part.size() > kMaxComponentLength) {
            return Err<void>(ErrorCode::Validation, "Path component too long in " + path);
        }
    }
    return Ok();
}

void write_path(ByteWriter& writer,
                const std::string& path,
                const std::unordered_map<std::string, std::uint64_t>& dictionary) {
    const auto parts = split_path(path);
    writer.write_varint(parts.size());
    for (const auto& part : parts) {
        writer.write_varint(dictionary.at(part));
    }
}

Result<std::string> read_path(ByteReader& reader, const std::vector<std::string>& dictionary) {
    auto depth = reader.read_varint();
    if (depth.is_error()) {
        return Err<std::string>(depth.error());
    }
    if (depth.value() > reader.remaining()) {
        return Err<std::string>(ErrorCode::Truncation, "Path depth exceeds remaining buffer");
    }
    std::string path;
    for (std::uint64_t i = 0; i < depth.value(); ++i) {
        auto index = reader.read_varint();
        if (index.is_error()) {
            return Err<std::string>(index.error());
        }
        if (index.value() >= dictionary.size()) {
            return Err<std::string>(ErrorCode::Format,
                                    "Path component index " + std::to_string(index.value()) + " out of range");
        }
        if (i > 0) {
            path += '/';
        }
        path += dictionary[index.value()];
    }
    return Ok(std::move(path));
}

// Per-record counts are varints on the wire but 32-bit in the tree.
Result<std::uint32_t> read_count(ByteReader& reader, const char* what) {
    auto value = reader.read_varint();
    if (value.is_error()) {
        return Err<std::uint32_t>(value.error());
    }
    if (value.value() > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::uint32_t>(ErrorCode::Format,
                                  std::string(what) + " count out of range: " + std::to_string(value.value()));
    }
    return Ok(static_cast<std::uint32_t>(value.value()));
}

Result<std::vector<std::uint8_t>> inflate_blob(const std::vector<std::uint8_t>& blob) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Format, "inflateInit failed");
    }
    stream.next_in = const_cast<Bytef*>(blob.data());
    stream.avail_in = static_cast<uInt>(blob.size());

    std::vector<std::uint8_t> out;
    std::array<std::uint8_t, 16384> chunk{};
    int rc = Z_OK;
    do {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            const std::string message = stream.msg ? stream.msg : "inflate failed";
            inflateEnd(&stream);
            return Err<std::vector<std::uint8_t>>(ErrorCode::Format, "Corrupt manifest compression: " + message);
        }
        out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - stream.avail_out));
        if (rc == Z_BUF_ERROR) {
            // No progress possible with a full output chunk: the input ran out
            inflateEnd(&stream);
            return Err<std::vector<std::uint8_t>>(ErrorCode::Truncation, "Compressed manifest ends early");
        }
    } while (rc != Z_STREAM_END);

    const bool trailing = stream.avail_in != 0;
    inflateEnd(&stream);
    if (trailing) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Format, "Trailing bytes after compressed manifest");
    }
    return Ok(std::move(out));
}

} // namespace

std::uint64_t ManifestTree::total_size() const {
    std::uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    return total;
}

bool ManifestTree::operator==(const ManifestTree& other) const {
    if (folder_id != other.folder_id || folder_version != other.folder_version) {
        return false;
    }
    const auto lhs = canonicalize(*this);
    const auto rhs = canonicalize(other);
    return lhs.folders == rhs.folders && lhs.files == rhs.files;
}

ManifestTree canonicalize(ManifestTree tree) {
    std::sort(tree.folders.begin(), tree.folders.end(),
              [](const ManifestFolder& lhs, const ManifestFolder& rhs) { return lhs.path < rhs.path; });
    std::sort(tree.files.begin(), tree.files.end(),
              [](const ManifestFile& lhs, const ManifestFile& rhs) { return lhs.path < rhs.path; });
    return tree;
}

ManifestTree build_manifest(const std::string& folder_id,
                            std::uint64_t folder_version,
                            const std::vector<File>& files) {
    ManifestTree tree;
    tree.folder_id = folder_id;
    tree.folder_version = folder_version;

    std::map<std::string, std::uint32_t> direct_files;
    std::map<std::string, std::set<std::string>> subfolders;
    direct_files[""] = 0;

    for (const auto& file : files) {
        if (file.is_deleted) {
            continue;
        }
        ManifestFile entry;
        entry.path = file.path;
        entry.size = file.current_size;
        entry.hash = file.current_hash;
        entry.modified_time = file.modified_time;
        entry.segment_count = file.segment_count;
        tree.files.push_back(std::move(entry));

        std::string directory = parent_of(file.path);
        direct_files[directory] += 1;
        while (!directory.empty()) {
            const std::string parent = parent_of(directory);
            subfolders[parent].insert(directory);
            direct_files.emplace(directory, 0);
            directory = parent;
        }
    }

    for (const auto& [path, count] : direct_files) {
        ManifestFolder folder;
        folder.path = path;
        folder.file_count = count;
        auto it = subfolders.find(path);
        folder.subfolder_count = it == subfolders.end() ? 0 : static_cast<std::uint32_t>(it->second.size());
        tree.folders.push_back(std::move(folder));
    }
    return canonicalize(std::move(tree));
}

Result<std::vector<std::uint8_t>> encode_manifest(const ManifestTree& input) {
    const ManifestTree tree = canonicalize(input);

    if (tree.folder_id.size() > kMaxComponentLength) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Validation, "Folder id too long for manifest");
    }

    std::set<std::string> components;
    std::set<std::string> seen_folders;
    for (const auto& folder : tree.folders) {
        if (auto valid = validate_components(folder.path, true); valid.is_error()) {
            return Err<std::vector<std::uint8_t>>(valid.error());
        }
        if (!seen_folders.insert(folder.path).second) {
            return Err<std::vector<std::uint8_t>>(ErrorCode::Validation, "Duplicate folder " + folder.path);
        }
        for (auto& part : split_path(folder.path)) {
            components.insert(std::move(part));
        }
    }

    std::set<std::string> seen_files;
    std::vector<std::vector<std::uint8_t>> digests;
    digests.reserve(tree.files.size());
    for (const auto& file : tree.files) {
        if (auto valid = validate_components(file.path, false); valid.is_error()) {
            return Err<std::vector<std::uint8_t>>(valid.error());
        }
        if (!seen_files.insert(file.path).second) {
            return Err<std::vector<std::uint8_t>>(ErrorCode::Validation, "Duplicate file " + file.path);
        }
        std::vector<std::uint8_t> digest;
        if (!hash::is_sha256_hex(file.hash) || !hash::from_hex(file.hash, digest)) {
            return Err<std::vector<std::uint8_t>>(ErrorCode::Validation, "Invalid content hash for " + file.path);
        }
        digests.push_back(std::move(digest));
        for (auto& part : split_path(file.path)) {
            components.insert(std::move(part));
        }
    }

    std::unordered_map<std::string, std::uint64_t> dictionary;
    ByteWriter writer;
    writer.write_bytes(kMagic.data(), kMagic.size());
    writer.write_uint16(kManifestFormatVersion);
    writer.write_short_string(tree.folder_id);
    writer.write_varint(tree.folder_version);
    writer.write_uint32(static_cast<std::uint32_t>(tree.folders.size()));
    writer.write_uint32(static_cast<std::uint32_t>(tree.files.size()));
    writer.write_uint64(tree.total_size());

    writer.write_uint32(static_cast<std::uint32_t>(components.size()));
    for (const auto& component : components) {
        dictionary.emplace(component, dictionary.size());
        writer.write_short_string(component);
    }

    for (const auto& folder : tree.folders) {
        write_path(writer, folder.path, dictionary);
        writer.write_varint(folder.file_count);
        writer.write_varint(folder.subfolder_count);
    }

    for (std::size_t i = 0; i < tree.files.size(); ++i) {
        const auto& file = tree.files[i];
        write_path(writer, file.path, dictionary);
        writer.write_varint(file.size);
        writer.write_bytes(digests[i].data(), digests[i].size());
        writer.write_varint(static_cast<std::uint64_t>(file.modified_time));
        writer.write_varint(file.segment_count);
    }

    const auto& raw = writer.data();
    uLongf compressed_size = compressBound(static_cast<uLong>(raw.size()));
    std::vector<std::uint8_t> compressed(compressed_size);
    const int rc = compress2(compressed.data(), &compressed_size, raw.data(),
                             static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Format, "zlib compress2 failed: " + std::to_string(rc));
    }
    compressed.resize(compressed_size);
    return Ok(std::move(compressed));
}

Result<ManifestTree> decode_manifest(const std::vector<std::uint8_t>& blob) {
    auto inflated = inflate_blob(blob);
    if (inflated.is_error()) {
        return Err<ManifestTree>(inflated.error());
    }
    ByteReader reader(inflated.value());

    auto magic = reader.read_bytes(kMagic.size());
    if (magic.is_error()) {
        return Err<ManifestTree>(magic.error());
    }
    if (!std::equal(kMagic.begin(), kMagic.end(), magic.value().begin())) {
        return Err<ManifestTree>(ErrorCode::Format, "Not a manifest (bad magic)");
    }
    auto version = reader.read_uint16();
    if (version.is_error()) {
        return Err<ManifestTree>(version.error());
    }
    if (version.value() != kManifestFormatVersion) {
        return Err<ManifestTree>(ErrorCode::Format,
                                 "Unsupported manifest version: " + std::to_string(version.value()));
    }

    ManifestTree tree;
    auto folder_id = reader.read_short_string();
    if (folder_id.is_error()) {
        return Err<ManifestTree>(folder_id.error());
    }
    tree.folder_id = std::move(folder_id.value());
    auto folder_version = reader.read_varint();
    if (folder_version.is_error()) {
        return Err<ManifestTree>(folder_version.error());
    }
    tree.folder_version = folder_version.value();

    auto folder_count = reader.read_uint32();
    if (folder_count.is_error()) {
        return Err<ManifestTree>(folder_count.error());
    }
    auto file_count = reader.read_uint32();
    if (file_count.is_error()) {
        return Err<ManifestTree>(file_count.error());
    }
    auto total_size = reader.read_uint64();
    if (total_size.is_error()) {
        return Err<ManifestTree>(total_size.error());
    }
    auto dictionary_size = reader.read_uint32();
    if (dictionary_size.is_error()) {
        return Err<ManifestTree>(dictionary_size.error());
    }

    const std::uint64_t minimum_records =
        static_cast<std::uint64_t>(dictionary_size.value()) * 2 +
        static_cast<std::uint64_t>(folder_count.value()) * kMinFolderRecord +
        static_cast<std::uint64_t>(file_count.value()) * kMinFileRecord;
    if (minimum_records > reader.remaining()) {
        return Err<ManifestTree>(ErrorCode::Truncation,
                                 "Declared counts need at least " + std::to_string(minimum_records) +
                                 " bytes, " + std::to_string(reader.remaining()) + " remain");
    }

    std::vector<std::string> dictionary;
    dictionary.reserve(dictionary_size.value());
    for (std::uint32_t i = 0; i < dictionary_size.value(); ++i) {
        auto component = reader.read_short_string();
        if (component.is_error()) {
            return Err<ManifestTree>(component.error());
        }
        dictionary.push_back(std::move(component.value()));
    }

    tree.folders.reserve(folder_count.value());
    for (std::uint32_t i = 0; i < folder_count.value(); ++i) {
        ManifestFolder folder;
        auto path = read_path(reader, dictionary);
        if (path.is_error()) {
            return Err<ManifestTree>(path.error());
        }
        folder.path = std::move(path.value());
        auto files_here = read_count(reader, "File");
        if (files_here.is_error()) {
            return Err<ManifestTree>(files_here.error());
        }
        auto subfolders = read_count(reader, "Subfolder");
        if (subfolders.is_error()) {
            return Err<ManifestTree>(subfolders.error());
        }
        folder.file_count = files_here.value();
        folder.subfolder_count = subfolders.value();
        tree.folders.push_back(std::move(folder));
    }

    tree.files.reserve(file_count.value());
    for (std::uint32_t i = 0; i < file_count.value(); ++i) {
        ManifestFile file;
        auto path = read_path(reader, dictionary);
        if (path.is_error()) {
            return Err<ManifestTree>(path.error());
        }
        file.path = std::move(path.value());
        auto size = reader.read_varint();
        if (size.is_error()) {
            return Err<ManifestTree>(size.error());
        }
        file.size = size.value();
        auto digest = reader.read_bytes(hash::kSha256Size);
        if (digest.is_error()) {
            return Err<ManifestTree>(digest.error());
        }
        file.hash = hash::to_hex(digest.value().data(), digest.value().size());
        auto modified = reader.read_varint();
        if (modified.is_error()) {
            return Err<ManifestTree>(modified.error());
        }
        file.modified_time = static_cast<std::int64_t>(modified.value());
        auto segments = read_count(reader, "Segment");
        if (segments.is_error()) {
            return Err<ManifestTree>(segments.error());
        }
        file.segment_count = segments.value();
        tree.files.push_back(std::move(file));
    }

    if (reader.remaining() != 0) {
        return Err<ManifestTree>(ErrorCode::Format, "Trailing bytes after manifest records");
    }
    if (tree.total_size() != total_size.value()) {
        return Err<ManifestTree>(ErrorCode::Format, "Manifest total size disagrees with its file records");
    }
    return Ok(std::move(tree));
}

} // namespace usync::metadata
