#include "usync/sync/versioning.hpp"

#include "usync/core/hash.hpp"
#include "usync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <unordered_map>

using usync::metadata::ChangeType;
using usync::metadata::File;
using usync::metadata::FileVersion;
using usync::metadata::FolderVersionDelta;
using usync::metadata::Segment;

namespace usync::sync {
namespace {

constexpr std::size_t kIdLength = 32;

Result<void> check_snapshot(const FolderSnapshot& previous) {
    if (previous.version > 0 && !previous.header) {
        return Err<void>(ErrorCode::Integrity,
                         "Folder " + previous.folder_id + " at version " +
                         std::to_string(previous.version) + " has no version header");
    }

    std::uint64_t live_files = 0;
    std::uint64_t live_bytes = 0;
    for (const auto& file : previous.files) {
        if (file.is_deleted) {
            continue;
        }
        live_files += 1;
        live_bytes += file.current_size;

        auto it = previous.segments.find(file.file_id);
        const std::size_t recorded = it == previous.segments.end() ? 0 : it->second.size();
        if (recorded != file.segment_count) {
            return Err<void>(ErrorCode::Integrity,
                             "File " + file.path + " declares " + std::to_string(file.segment_count) +
                             " segments but " + std::to_string(recorded) + " are recorded");
        }
        std::uint64_t covered = 0;
        for (std::size_t i = 0; i < recorded; ++i) {
            const auto& segment = it->second[i];
            if (segment.segment_index != i || segment.offset != covered) {
                return Err<void>(ErrorCode::Integrity,
                                 "Segments of " + file.path + " do not tile the file at index " +
                                 std::to_string(i));
            }
            covered += segment.size;
        }
        if (covered != file.current_size) {
            return Err<void>(ErrorCode::Integrity,
                             "Segments of " + file.path + " cover " + std::to_string(covered) +
                             " bytes, file declares " + std::to_string(file.current_size));
        }
    }

    if (previous.header) {
        if (previous.header->file_count != live_files || previous.header->total_size != live_bytes) {
            return Err<void>(ErrorCode::Integrity,
                             "Folder " + previous.folder_id + " version " + std::to_string(previous.version) +
                             " declares " + std::to_string(previous.header->file_count) + " files / " +
                             std::to_string(previous.header->total_size) + " bytes, records hold " +
                             std::to_string(live_files) + " / " + std::to_string(live_bytes));
        }
    }
    return Ok();
}

Result<void> check_scan(const ScanResult& current, std::uint32_t segment_size) {
    for (const auto& file : current.files) {
        const std::uint64_t expected = (file.size + segment_size - 1) / segment_size;
        if (file.segments.size() != expected) {
            return Err<void>(ErrorCode::Validation,
                             "Scan of " + file.path + " was not segmented at " + std::to_string(segment_size));
        }
        for (std::size_t i = 0; i < file.segments.size(); ++i) {
            const auto& segment = file.segments[i];
            if (segment.index != i || segment.offset != i * static_cast<std::uint64_t>(segment_size)) {
                return Err<void>(ErrorCode::Validation, "Scan of " + file.path + " has misaligned segments");
            }
        }
    }
    return Ok();
}

} // namespace

std::string make_file_id(const std::string& folder_id, const std::string& path) {
    return hash::sha256_hex(folder_id + ":" + path).substr(0, kIdLength);
}

std::string make_segment_id(const std::string& file_id,
                            std::uint64_t version,
                            std::uint32_t segment_index,
                            std::uint32_t redundancy_index) {
    const std::string key = file_id + ":" + std::to_string(version) + ":" +
                            std::to_string(segment_index) + ":" + std::to_string(redundancy_index);
    return hash::sha256_hex(key).substr(0, kIdLength);
}

std::vector<Segment> effective_segments(const std::vector<Segment>& all,
                                        std::uint64_t version,
                                        std::uint32_t segment_count,
                                        std::uint32_t redundancy_index) {
    std::vector<const Segment*> best(segment_count, nullptr);
    for (const auto& segment : all) {
        if (segment.redundancy_index != redundancy_index || segment.version > version ||
            segment.segment_index >= segment_count) {
            continue;
        }
        const Segment*& slot = best[segment.segment_index];
        if (slot == nullptr || segment.version > slot->version) {
            slot = &segment;
        }
    }

    std::vector<Segment> result;
    result.reserve(segment_count);
    for (const Segment* segment : best) {
        if (segment != nullptr) {
            result.push_back(*segment);
        }
    }
    return result;
}

Result<FolderSnapshot> load_snapshot(const metadata::RecordStore& store, const std::string& folder_id) {
    auto folder = store.get_folder(folder_id);
    if (folder.is_error()) {
        return Err<FolderSnapshot>(folder.error());
    }

    FolderSnapshot snapshot;
    snapshot.folder_id = folder_id;
    snapshot.version = folder.value().current_version;

    if (snapshot.version > 0) {
        auto header = store.get_folder_version(folder_id, snapshot.version);
        if (header.is_error()) {
            if (header.error().code == ErrorCode::NotFound) {
                return Err<FolderSnapshot>(ErrorCode::Integrity,
                                           "Folder " + folder_id + " has no header for version " +
                                           std::to_string(snapshot.version));
            }
            return Err<FolderSnapshot>(header.error());
        }
        snapshot.header = header.value();
    }

    auto files = store.list_files(folder_id);
    if (files.is_error()) {
        return Err<FolderSnapshot>(files.error());
    }
    snapshot.files = std::move(files.value());

    for (const auto& file : snapshot.files) {
        if (file.is_deleted) {
            continue;
        }
        auto all = store.list_segments(folder_id, file.file_id);
        if (all.is_error()) {
            return Err<FolderSnapshot>(all.error());
        }
        snapshot.segments[file.file_id] = effective_segments(all.value(), file.current_version, file.segment_count);
    }
    return Ok(std::move(snapshot));
}

Result<FolderVersionDelta> compute_delta(const FolderSnapshot& previous,
                                         const ScanResult& current,
                                         const DeltaOptions& options) {
    if (options.segment_size == 0) {
        return Err<FolderVersionDelta>(ErrorCode::Validation, "Segment size must be positive");
    }
    if (auto valid = check_snapshot(previous); valid.is_error()) {
        return Err<FolderVersionDelta>(valid.error());
    }
    if (auto valid = check_scan(current, options.segment_size); valid.is_error()) {
        return Err<FolderVersionDelta>(valid.error());
    }

    const std::uint64_t next_version = previous.version + 1;

    FolderVersionDelta delta;
    delta.folder_id = previous.folder_id;
    delta.base_version = previous.version;
    delta.folder_version.folder_id = previous.folder_id;
    delta.folder_version.version = next_version;

    std::map<std::string, const File*> known;
    for (const auto& file : previous.files) {
        known.emplace(file.path, &file);
    }

    std::set<std::string> seen;
    for (const auto& scanned : current.files) {
        seen.insert(scanned.path);
        delta.folder_version.file_count += 1;
        delta.folder_version.total_size += scanned.size;

        auto known_it = known.find(scanned.path);
        const File* prior = known_it == known.end() ? nullptr : known_it->second;
        const bool live_before = prior != nullptr && !prior->is_deleted;

        if (live_before && prior->current_hash == scanned.hash && prior->current_size == scanned.size) {
            continue;
        }

        const std::string file_id = live_before ? prior->file_id : make_file_id(previous.folder_id, scanned.path);

        std::vector<std::uint32_t> changed;
        if (live_before) {
            const auto& prior_segments = previous.segments.at(prior->file_id);
            for (const auto& segment : scanned.segments) {
                if (segment.index >= prior_segments.size() ||
                    prior_segments[segment.index].content_hash != segment.hash ||
                    prior_segments[segment.index].size != segment.size) {
                    changed.push_back(segment.index);
                }
            }
            delta.folder_version.changes.modified += 1;
        } else {
            for (const auto& segment : scanned.segments) {
                changed.push_back(segment.index);
            }
            delta.folder_version.changes.added += 1;
        }

        File head;
        head.file_id = file_id;
        head.folder_id = previous.folder_id;
        head.path = scanned.path;
        head.current_version = next_version;
        head.current_size = scanned.size;
        head.current_hash = scanned.hash;
        head.modified_time = scanned.modified_time;
        head.segment_count = static_cast<std::uint32_t>(scanned.segments.size());
        head.is_deleted = false;
        delta.files.push_back(head);

        FileVersion version;
        version.file_id = file_id;
        version.folder_id = previous.folder_id;
        version.version = next_version;
        version.size = scanned.size;
        version.hash = scanned.hash;
        version.modified_time = scanned.modified_time;
        version.change_type = live_before ? ChangeType::Modify : ChangeType::Create;
        version.segment_count = head.segment_count;
        version.changed_segments = changed;
        delta.file_versions.push_back(std::move(version));

        for (std::uint32_t index : changed) {
            const auto& source = scanned.segments[index];
            for (std::uint32_t copy = 0; copy <= options.redundancy_copies; ++copy) {
                Segment segment;
                segment.segment_id = make_segment_id(file_id, next_version, index, copy);
                segment.folder_id = previous.folder_id;
                segment.file_id = file_id;
                segment.version = next_version;
                segment.segment_index = index;
                segment.offset = source.offset;
                segment.size = source.size;
                segment.content_hash = source.hash;
                segment.redundancy_index = copy;
                delta.segments.push_back(std::move(segment));
            }
        }
    }

    for (const auto& [path, prior] : known) {
        if (prior->is_deleted || seen.count(path) > 0) {
            continue;
        }
        File head = *prior;
        head.current_version = next_version;
        head.is_deleted = true;
        delta.files.push_back(head);

        FileVersion version;
        version.file_id = prior->file_id;
        version.folder_id = previous.folder_id;
        version.version = next_version;
        version.modified_time = prior->modified_time;
        version.change_type = ChangeType::Delete;
        delta.file_versions.push_back(std::move(version));
        delta.folder_version.changes.deleted += 1;
    }

    return Ok(std::move(delta));
}

VersioningEngine::VersioningEngine(metadata::RecordStore& store,
                                   config::SyncConfig config,
                                   events::EventBus* bus)
    : store_(store), config_(std::move(config)), bus_(bus) {}

Result<metadata::Folder> VersioningEngine::create_folder(const std::string& folder_id,
                                                         const std::string& name,
                                                         const std::string& path) {
    if (path.empty()) {
        return Err<metadata::Folder>(ErrorCode::Validation, "Folder path must not be empty");
    }
    metadata::Folder folder;
    folder.folder_id = folder_id;
    folder.name = name;
    folder.path = path;
    folder.current_version = 0;
    if (auto created = store_.create_folder(folder); created.is_error()) {
        return Err<metadata::Folder>(created.error());
    }
    spdlog::info("Registered folder {} ({}) at {}", folder_id, name, path);
    return Ok(std::move(folder));
}

Result<IndexResult> VersioningEngine::index_folder(const std::string& folder_id) {
    auto folder = store_.get_folder(folder_id);
    if (folder.is_error()) {
        return Err<IndexResult>(folder.error());
    }
    auto snapshot = load_snapshot(store_, folder_id);
    if (snapshot.is_error()) {
        return Err<IndexResult>(snapshot.error());
    }

    FolderScanner scanner(config_.segment_size, config_.skip_hidden, config_.worker_threads);
    auto scan = scanner.scan(folder.value().path);
    if (scan.is_error()) {
        return Err<IndexResult>(scan.error());
    }

    DeltaOptions options;
    options.segment_size = config_.segment_size;
    options.redundancy_copies = config_.redundancy_copies;
    auto delta = compute_delta(snapshot.value(), scan.value(), options);
    if (delta.is_error()) {
        return Err<IndexResult>(delta.error());
    }

    IndexResult result;
    result.version = snapshot.value().version;
    if (delta.value().empty()) {
        spdlog::debug("Folder {} unchanged at version {}", folder_id, result.version);
        return Ok(result);
    }

    if (auto applied = store_.apply_delta(delta.value()); applied.is_error()) {
        return Err<IndexResult>(applied.error());
    }

    result.version = delta.value().folder_version.version;
    result.changed = true;
    result.changes = delta.value().folder_version.changes;
    result.new_segments = delta.value().segments.size();
    for (const auto& segment : delta.value().segments) {
        result.scheduled_bytes += segment.size;
    }

    spdlog::info("Indexed folder {} -> version {} ({} added, {} modified, {} deleted, {} new segments)",
                 folder_id, result.version, result.changes.added, result.changes.modified,
                 result.changes.deleted, result.new_segments);
    if (bus_ != nullptr) {
        bus_->emit(events::FolderIndexedEvent{folder_id, result.version, result.changes, result.new_segments});
    }
    return Ok(result);
}

} // namespace usync::sync
