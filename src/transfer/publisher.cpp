#include "usync/transfer/publisher.hpp"

#include "usync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <tuple>
#include <unordered_map>

namespace fs = std::filesystem;

namespace usync::transfer {

using metadata::SegmentProgress;

std::vector<std::string> split_locators(const std::string& joined) {
    std::vector<std::string> locators;
    std::size_t start = 0;
    while (start <= joined.size()) {
        const auto end = joined.find(kLocatorSeparator, start);
        const auto piece = joined.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!piece.empty()) {
            locators.push_back(piece);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return locators;
}

Publisher::Publisher(metadata::RecordStore& store,
                     Transport& transport,
                     TransferQueue& queue,
                     RetryPolicy& retry,
                     config::SyncConfig config,
                     security::PayloadCipher* cipher,
                     events::EventBus* bus)
    : store_(store),
      transport_(transport),
      queue_(queue),
      retry_(retry),
      config_(std::move(config)),
      cipher_(cipher),
      bus_(bus) {}

std::string Publisher::session_id_for(const std::string& folder_id, std::uint64_t version) {
    return "upload-" + folder_id + "-v" + std::to_string(version);
}

Result<SessionPlan> Publisher::plan_upload(const std::string& folder_id) const {
    auto folder = store_.get_folder(folder_id);
    if (folder.is_error()) {
        return Err<SessionPlan>(folder.error());
    }
    if (folder.value().current_version == 0) {
        return Err<SessionPlan>(ErrorCode::Validation, "Folder has not been indexed yet: " + folder_id);
    }

    auto files = store_.list_files(folder_id);
    if (files.is_error()) {
        return Err<SessionPlan>(files.error());
    }
    std::unordered_map<std::string, std::string> paths;
    for (const auto& file : files.value()) {
        paths.emplace(file.file_id, file.path);
    }

    auto segments = store_.list_unuploaded_segments(folder_id);
    if (segments.is_error()) {
        return Err<SessionPlan>(segments.error());
    }
    auto& pending = segments.value();
    std::sort(pending.begin(), pending.end(), [&paths](const metadata::Segment& a, const metadata::Segment& b) {
        return std::tie(a.redundancy_index, paths[a.file_id], a.version, a.segment_index) <
               std::tie(b.redundancy_index, paths[b.file_id], b.version, b.segment_index);
    });

    SessionPlan plan;
    plan.session_id = session_id_for(folder_id, folder.value().current_version);
    plan.direction = metadata::TransferDirection::Upload;
    plan.target = folder_id;
    plan.folder_id = folder_id;
    plan.folder_version = folder.value().current_version;
    plan.segments.reserve(pending.size());
    for (const auto& segment : pending) {
        plan.segments.push_back({segment.segment_id, paths[segment.file_id], segment.segment_index});
    }
    return Ok(std::move(plan));
}

Result<RunReport> Publisher::upload(const std::string& folder_id) {
    auto folder = store_.get_folder(folder_id);
    if (folder.is_error()) {
        return Err<RunReport>(folder.error());
    }
    auto plan = plan_upload(folder_id);
    if (plan.is_error()) {
        return Err<RunReport>(plan.error());
    }
    auto session = queue_.start_or_resume(plan.value());
    if (session.is_error()) {
        return Err<RunReport>(session.error());
    }

    spdlog::info("Uploading folder {} version {}: {} of {} segments left", folder_id,
                 session.value().folder_version,
                 session.value().total_segments - session.value().completed_segments,
                 session.value().total_segments);

    const std::size_t batch_size =
        std::max<std::size_t>(1, pack_budget() / std::max<std::uint32_t>(1, config_.segment_size));
    const auto& target = folder.value();
    return queue_.run_batches(
        session.value().session_id,
        [this, &target](const std::vector<SegmentProgress>& claims) { return upload_batch(target, claims); },
        config_.worker_threads, batch_size);
}

std::vector<Result<std::size_t>> Publisher::upload_batch(const metadata::Folder& folder,
                                                         const std::vector<SegmentProgress>& claims) {
    std::vector<Result<std::size_t>> results(claims.size(), Ok(std::size_t{0}));
    std::vector<bool> failed(claims.size(), false);
    auto fail = [&](std::size_t index, const Error& error) {
        results[index] = Err<std::size_t>(error);
        failed[index] = true;
    };

    std::vector<sync::SegmentPayload> payloads(claims.size());
    std::map<std::uint32_t, std::vector<std::size_t>> by_redundancy;
    for (std::size_t i = 0; i < claims.size(); ++i) {
        auto segment = store_.get_segment(folder.folder_id, claims[i].segment_id);
        if (segment.is_error()) {
            fail(i, segment.error());
            continue;
        }
        const auto& record = segment.value();
        auto data = io_.read_segment(fs::path(folder.path) / claims[i].file_path, record.offset, record.size,
                                     record.content_hash);
        if (data.is_error()) {
            fail(i, data.error());
            continue;
        }
        payloads[i] = {record.segment_id, std::move(data.value())};
        by_redundancy[record.redundancy_index].push_back(i);
    }

    for (const auto& [redundancy, members] : by_redundancy) {
        std::vector<sync::SegmentPayload> input;
        std::unordered_map<std::string, std::size_t> claim_of;
        std::vector<std::size_t> sizes(claims.size(), 0);
        input.reserve(members.size());
        for (const auto index : members) {
            claim_of.emplace(payloads[index].segment_id, index);
            sizes[index] = payloads[index].data.size();
            input.push_back(std::move(payloads[index]));
        }

        auto packs = sync::pack(input, pack_budget());
        if (packs.is_error()) {
            for (const auto index : members) {
                fail(index, packs.error());
            }
            continue;
        }

        std::unordered_map<std::string, std::vector<std::string>> locators;
        for (const auto& pack : packs.value()) {
            auto posted = post_pack(folder.folder_id, claims.front().session_id, pack);
            for (const auto& entry : pack.entries) {
                const auto index = claim_of.at(entry.segment_id);
                if (posted.is_error()) {
                    fail(index, posted.error());
                    continue;
                }
                auto& list = locators[entry.segment_id];
                if (list.empty() || list.back() != posted.value()) {
                    list.push_back(posted.value());
                }
            }
        }

        for (const auto index : members) {
            if (failed[index]) {
                continue;
            }
            const auto& parts = locators[claims[index].segment_id];
            std::string joined;
            for (const auto& locator : parts) {
                if (!joined.empty()) {
                    joined.push_back(kLocatorSeparator);
                }
                joined += locator;
            }
            auto attached = store_.attach_locator(folder.folder_id, claims[index].segment_id, joined);
            if (attached.is_error()) {
                fail(index, attached.error());
                continue;
            }
            results[index] = Ok(sizes[index]);
        }
        spdlog::debug("Redundancy group {} of batch done ({} segments)", redundancy, members.size());
    }
    return results;
}

// Sealing grows each pack, so the packer gets what is left of the article bound.
std::size_t Publisher::pack_budget() const {
    const std::size_t sealing = cipher_ != nullptr ? cipher_->overhead() : 0;
    return config_.max_pack_size > sealing ? config_.max_pack_size - sealing : 0;
}

Result<std::string> Publisher::post_pack(const std::string& folder_id,
                                         const std::string& session_id,
                                         const sync::Pack& pack) {
    std::vector<std::uint8_t> payload = pack.bytes;
    if (cipher_ != nullptr) {
        auto sealed = cipher_->seal(folder_id, payload);
        if (sealed.is_error()) {
            return Err<std::string>(sealed.error());
        }
        payload = std::move(sealed.value());
    }

    RoutingMetadata routing{folder_id, session_id, "pack", pack.entries.size()};
    auto posted = retry_.run<std::string>("Posting pack", [&] { return transport_.post(payload, routing); });
    if (posted.is_error()) {
        return posted;
    }

    spdlog::info("Posted pack {} ({} entries, {} bytes)", posted.value(), pack.entries.size(), payload.size());
    if (bus_ != nullptr) {
        bus_->emit(events::PackPostedEvent(session_id, posted.value(), pack.entries.size(), payload.size()));
    }
    return posted;
}

} // namespace usync::transfer
