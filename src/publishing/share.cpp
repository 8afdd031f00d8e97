#include "usync/publishing/share.hpp"

#include "usync/events/events.hpp"
#include "usync/metadata/manifest.hpp"
#include "usync/security/token.hpp"
#include "usync/sync/versioning.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace usync::publishing {

using json = nlohmann::json;
using metadata::Share;

ShareService::ShareService(metadata::RecordStore& store,
                           transfer::Transport& transport,
                           transfer::RetryPolicy& retry,
                           security::PayloadCipher* cipher,
                           events::EventBus* bus)
    : store_(store), transport_(transport), retry_(retry), cipher_(cipher), bus_(bus) {}

Result<std::vector<std::uint8_t>> ShareService::encode_current_manifest(const std::string& folder_id) const {
    using Bytes = std::vector<std::uint8_t>;
    auto folder = store_.get_folder(folder_id);
    if (folder.is_error()) {
        return Err<Bytes>(folder.error());
    }
    auto files = store_.list_files(folder_id);
    if (files.is_error()) {
        return Err<Bytes>(files.error());
    }
    const auto tree = metadata::build_manifest(folder_id, folder.value().current_version, files.value());
    return metadata::encode_manifest(tree);
}

Result<Share> ShareService::publish(const std::string& folder_id,
                                    metadata::ShareType type,
                                    const json& details) {
    if (!details.is_object()) {
        return Err<Share>(ErrorCode::Validation, "Share metadata must be a JSON object");
    }

    auto folder = store_.get_folder(folder_id);
    if (folder.is_error()) {
        return Err<Share>(folder.error());
    }
    const auto version = folder.value().current_version;
    if (version == 0) {
        return Err<Share>(ErrorCode::Validation, "Folder has not been indexed yet: " + folder_id);
    }

    auto files = store_.list_files(folder_id);
    if (files.is_error()) {
        return Err<Share>(files.error());
    }
    if (auto uploaded = check_uploaded(folder_id, version, files.value()); uploaded.is_error()) {
        return Err<Share>(uploaded.error());
    }

    auto blob = metadata::encode_manifest(metadata::build_manifest(folder_id, version, files.value()));
    if (blob.is_error()) {
        return Err<Share>(blob.error());
    }
    auto payload = std::move(blob.value());
    if (cipher_ != nullptr) {
        auto sealed = cipher_->seal(folder_id, payload);
        if (sealed.is_error()) {
            return Err<Share>(sealed.error());
        }
        payload = std::move(sealed.value());
    }

    transfer::RoutingMetadata routing{folder_id, "", "manifest", 0};
    auto locator = retry_.run<std::string>("Posting manifest", [&] { return transport_.post(payload, routing); });
    if (locator.is_error()) {
        return Err<Share>(locator.error());
    }
    if (bus_ != nullptr) {
        bus_->emit(events::ManifestPublishedEvent(folder_id, version, locator.value(), payload.size()));
    }

    auto token = security::generate_share_token();
    if (token.is_error()) {
        return Err<Share>(token.error());
    }

    Share share;
    share.token = std::move(token.value());
    share.folder_id = folder_id;
    share.folder_version = version;
    share.share_type = type;
    share.metadata = details.dump();
    share.manifest_locator = std::move(locator.value());
    share.created_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    if (auto created = store_.create_share(share); created.is_error()) {
        return Err<Share>(created.error());
    }

    spdlog::info("Published {} share of {} version {} (manifest {} bytes)", metadata::to_string(type),
                 folder_id, version, payload.size());
    if (bus_ != nullptr) {
        bus_->emit(events::ShareCreatedEvent(folder_id, version, type));
    }
    return Ok(std::move(share));
}

Result<Share> ShareService::resolve(const std::string& token) const {
    return store_.get_share(token);
}

Result<json> ShareService::share_metadata(const Share& share) {
    auto parsed = json::parse(share.metadata, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Err<json>(ErrorCode::Format, "Share metadata is not a JSON object");
    }
    return Ok(std::move(parsed));
}

Result<void> ShareService::check_uploaded(const std::string& folder_id,
                                          std::uint64_t version,
                                          const std::vector<metadata::File>& files) const {
    std::size_t missing = 0;
    std::string first;
    for (const auto& file : files) {
        if (file.is_deleted || file.segment_count == 0) {
            continue;
        }
        auto all = store_.list_segments(folder_id, file.file_id);
        if (all.is_error()) {
            return Err<void>(all.error());
        }
        const auto tiling = sync::effective_segments(all.value(), version, file.segment_count);
        if (tiling.size() != file.segment_count) {
            return Err<void>(ErrorCode::Integrity, "Segment tiling incomplete for " + file.path);
        }
        for (const auto& segment : tiling) {
            if (!segment.uploaded) {
                if (missing++ == 0) {
                    first = file.path;
                }
            }
        }
    }
    if (missing > 0) {
        return Err<void>(ErrorCode::Validation,
                         std::to_string(missing) + " segments not uploaded yet (first in " + first + ")");
    }
    return Ok();
}

} // namespace usync::publishing
