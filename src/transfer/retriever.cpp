#include "usync/transfer/retriever.hpp"

#include "usync/core/hash.hpp"
#include "usync/sync/versioning.hpp"
#include "usync/transfer/publisher.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace usync::transfer {

using metadata::SegmentProgress;
using Bytes = std::vector<std::uint8_t>;

Retriever::Retriever(metadata::RecordStore& store,
                     Transport& transport,
                     TransferQueue& queue,
                     RetryPolicy& retry,
                     config::SyncConfig config,
                     fs::path staging_root,
                     security::PayloadCipher* cipher)
    : store_(store),
      transport_(transport),
      queue_(queue),
      retry_(retry),
      config_(std::move(config)),
      staging_root_(std::move(staging_root)),
      cipher_(cipher) {}

std::string Retriever::session_id_for(const std::string& token, const fs::path& destination) {
    const auto key = token + "|" + fs::absolute(destination).lexically_normal().generic_string();
    return "download-" + hash::sha256_hex(key).substr(0, 32);
}

Result<metadata::ManifestTree> Retriever::fetch_manifest(const metadata::Share& share) {
    if (share.manifest_locator.empty()) {
        return Err<metadata::ManifestTree>(ErrorCode::NotFound, "Share has no published manifest");
    }

    auto blob = retry_.run<Bytes>("Fetching manifest", [&] { return transport_.fetch(share.manifest_locator); });
    if (blob.is_error()) {
        return Err<metadata::ManifestTree>(blob.error());
    }
    if (cipher_ != nullptr) {
        auto opened = cipher_->open(share.folder_id, blob.value());
        if (opened.is_error()) {
            return Err<metadata::ManifestTree>(opened.error());
        }
        blob.value() = std::move(opened.value());
    }

    auto tree = metadata::decode_manifest(blob.value());
    if (tree.is_error()) {
        return tree;
    }
    if (tree.value().folder_id != share.folder_id || tree.value().folder_version != share.folder_version) {
        return Err<metadata::ManifestTree>(
            ErrorCode::Integrity,
            "Manifest describes " + tree.value().folder_id + " v" + std::to_string(tree.value().folder_version) +
            ", share points at " + share.folder_id + " v" + std::to_string(share.folder_version));
    }
    return tree;
}

Result<RunReport> Retriever::download(const std::string& token, const fs::path& destination) {
    auto share = store_.get_share(token);
    if (share.is_error()) {
        return Err<RunReport>(share.error());
    }
    auto tree = fetch_manifest(share.value());
    if (tree.is_error()) {
        return Err<RunReport>(tree.error());
    }
    auto sources = resolve_sources(share.value(), tree.value());
    if (sources.is_error()) {
        return Err<RunReport>(sources.error());
    }

    SessionPlan plan;
    plan.session_id = session_id_for(token, destination);
    plan.direction = metadata::TransferDirection::Download;
    plan.target = token;
    plan.folder_id = share.value().folder_id;
    plan.folder_version = share.value().folder_version;

    std::unordered_map<std::string, const SegmentSource*> by_segment;
    for (const auto& source : sources.value()) {
        plan.segments.push_back({source.primary.segment_id, source.file.path, source.primary.segment_index});
        by_segment.emplace(source.primary.segment_id, &source);
    }

    auto session = queue_.start_or_resume(plan);
    if (session.is_error()) {
        return Err<RunReport>(session.error());
    }
    spdlog::info("Downloading {} v{} into {}: {} files, {} segments", plan.folder_id, plan.folder_version,
                 destination.string(), tree.value().files.size(), session.value().total_segments);

    auto report = queue_.run(
        plan.session_id,
        [this, &by_segment](const SegmentProgress& claim) -> Result<std::size_t> {
            auto it = by_segment.find(claim.segment_id);
            if (it == by_segment.end()) {
                return Err<std::size_t>(ErrorCode::Integrity,
                                        "Segment " + claim.segment_id + " is not part of the shared version");
            }
            return retrieve(claim, *it->second);
        },
        config_.worker_threads);

    {
        std::lock_guard lock(cache_mutex_);
        pack_cache_.clear();
    }
    if (report.is_error()) {
        return report;
    }

    if (auto placed = finalize(plan.session_id, tree.value(), destination, report.value()); placed.is_error()) {
        return Err<RunReport>(placed.error());
    }
    return report;
}

Result<std::vector<Retriever::SegmentSource>> Retriever::resolve_sources(const metadata::Share& share,
                                                                         const metadata::ManifestTree& tree) const {
    std::vector<SegmentSource> sources;
    for (const auto& file : tree.files) {
        if (file.segment_count == 0) {
            continue;
        }
        const auto file_id = sync::make_file_id(share.folder_id, file.path);
        auto all = store_.list_segments(share.folder_id, file_id);
        if (all.is_error()) {
            return Err<std::vector<SegmentSource>>(all.error());
        }

        const auto primaries = sync::effective_segments(all.value(), share.folder_version, file.segment_count, 0);
        if (primaries.size() != file.segment_count) {
            return Err<std::vector<SegmentSource>>(
                ErrorCode::Integrity, "Only " + std::to_string(primaries.size()) + " of " +
                                      std::to_string(file.segment_count) + " segments recorded for " + file.path);
        }

        std::set<std::uint32_t> redundancy;
        for (const auto& segment : all.value()) {
            if (segment.redundancy_index > 0) {
                redundancy.insert(segment.redundancy_index);
            }
        }
        std::map<std::uint32_t, std::map<std::uint32_t, metadata::Segment>> copies;   // index -> copy -> segment
        for (const auto copy : redundancy) {
            for (auto& segment : sync::effective_segments(all.value(), share.folder_version, file.segment_count, copy)) {
                copies[segment.segment_index].emplace(copy, std::move(segment));
            }
        }

        for (const auto& primary : primaries) {
            SegmentSource source{file, primary, {}};
            for (const auto& [copy, segment] : copies[primary.segment_index]) {
                if (segment.content_hash == primary.content_hash && segment.size == primary.size) {
                    source.copies.push_back(segment);
                }
            }
            sources.push_back(std::move(source));
        }
    }
    return Ok(std::move(sources));
}

Result<std::shared_ptr<const std::vector<sync::UnpackedEntry>>> Retriever::fetch_pack(const std::string& folder_id,
                                                                                      const std::string& locator) {
    using Entries = std::shared_ptr<const std::vector<sync::UnpackedEntry>>;
    {
        std::lock_guard lock(cache_mutex_);
        auto it = pack_cache_.find(locator);
        if (it != pack_cache_.end()) {
            return Ok(it->second);
        }
    }

    auto bytes = retry_.run<Bytes>("Fetching pack", [&] { return transport_.fetch(locator); });
    if (bytes.is_error()) {
        return Err<Entries>(bytes.error());
    }
    if (cipher_ != nullptr) {
        auto opened = cipher_->open(folder_id, bytes.value());
        if (opened.is_error()) {
            return Err<Entries>(opened.error());
        }
        bytes.value() = std::move(opened.value());
    }
    auto entries = sync::unpack(bytes.value());
    if (entries.is_error()) {
        return Err<Entries>(entries.error());
    }

    Entries shared = std::make_shared<const std::vector<sync::UnpackedEntry>>(std::move(entries.value()));
    std::lock_guard lock(cache_mutex_);
    auto [it, inserted] = pack_cache_.emplace(locator, shared);
    spdlog::debug("Fetched pack {} ({} entries, {})", locator, it->second->size(), inserted ? "cached" : "raced");
    return Ok(it->second);
}

Result<Bytes> Retriever::fetch_segment(const metadata::Segment& segment) {
    if (!segment.uploaded || segment.locator.empty()) {
        return Err<Bytes>(ErrorCode::NotFound, "Segment " + segment.segment_id + " has not been uploaded");
    }

    std::vector<sync::UnpackedEntry> parts;
    for (const auto& locator : split_locators(segment.locator)) {
        auto pack = fetch_pack(segment.folder_id, locator);
        if (pack.is_error()) {
            return Err<Bytes>(pack.error());
        }
        for (const auto& entry : *pack.value()) {
            if (entry.entry.segment_id == segment.segment_id) {
                parts.push_back(entry);
            }
        }
    }
    if (parts.empty()) {
        return Err<Bytes>(ErrorCode::Integrity, "No pack carries segment " + segment.segment_id);
    }

    auto whole = sync::reassemble(parts);
    if (whole.is_error()) {
        return Err<Bytes>(whole.error());
    }
    return Ok(std::move(whole.value().front().data));
}

Result<std::size_t> Retriever::retrieve(const SegmentProgress& claim, const SegmentSource& source) {
    std::vector<const metadata::Segment*> candidates{&source.primary};
    for (const auto& copy : source.copies) {
        candidates.push_back(&copy);
    }

    Error last;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = *candidates[i];
        auto data = fetch_segment(candidate);
        if (data.is_ok() && (data.value().size() != source.primary.size ||
                             hash::sha256_hex(data.value().data(), data.value().size()) !=
                                 source.primary.content_hash)) {
            data = Err<Bytes>(ErrorCode::Integrity, "Fetched bytes do not match segment hash");
        }

        if (data.is_ok()) {
            auto applied = io_.apply_segment(claim.session_id, source.file.path, source.primary.offset,
                                             data.value(), source.primary.content_hash, staging_root_);
            if (applied.is_error()) {
                return Err<std::size_t>(applied.error());
            }
            if (candidate.redundancy_index > 0) {
                spdlog::info("Segment {} of {} recovered from redundancy copy {}", claim.segment_index,
                             source.file.path, candidate.redundancy_index);
            }
            return Ok(data.value().size());
        }

        last = data.error();
        if (i + 1 < candidates.size()) {
            spdlog::warn("Segment {} of {} unavailable from copy {} ({}), trying next copy", claim.segment_index,
                         source.file.path, candidate.redundancy_index, to_string(last));
        }
    }
    return Err<std::size_t>(last);
}

Result<void> Retriever::finalize(const std::string& session_id,
                                 const metadata::ManifestTree& tree,
                                 const fs::path& destination,
                                 RunReport& report) {
    auto rows = store_.list_progress(session_id);
    if (rows.is_error()) {
        return Err<void>(rows.error());
    }
    std::unordered_map<std::string, std::uint32_t> complete;
    for (const auto& row : rows.value()) {
        if (row.status == metadata::SegmentStatus::Complete) {
            ++complete[row.file_path];
        }
    }

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "Failed to create " + destination.string() + ": " + ec.message());
    }

    bool all_placed = true;
    std::size_t placed = 0;
    for (const auto& file : tree.files) {
        if (complete[file.path] < file.segment_count) {
            all_placed = false;
            continue;
        }

        // Already moved into place by an earlier run that stopped before cleanup.
        auto present = io_.file_matches(destination / file.path, file.size, file.hash);
        if (present.is_ok() && present.value()) {
            continue;
        }

        auto moved = io_.finalize_file(session_id, file.path, file.size, file.hash, staging_root_, destination);
        if (moved.is_error()) {
            spdlog::error("Could not place {}: {}", file.path, to_string(moved.error()));
            report.failures.push_back({file.path, 0, "", to_string(moved.error())});
            all_placed = false;
            continue;
        }
        ++placed;
    }

    if (all_placed) {
        if (auto cleaned = io_.discard_staging(session_id, staging_root_); cleaned.is_error()) {
            spdlog::warn("{}", cleaned.error().message);
        }
    }
    if (!report.failures.empty() && report.outcome == RunOutcome::Succeeded) {
        report.outcome = RunOutcome::PartiallySucceeded;
    }
    spdlog::info("Placed {} files into {}", placed, destination.string());
    return Ok();
}

} // namespace usync::transfer
