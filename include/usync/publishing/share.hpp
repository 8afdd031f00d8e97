#pragma once

/**
 * @file share.hpp
 * @brief Publishes a folder version's manifest and hands out share tokens
 *
 * A share pins one immutable folder version. Publishing requires every
 * segment of that version's live files to carry a transport locator, so a
 * recipient holding the token can fetch everything it needs.
 */

#include "usync/core/result.hpp"
#include "usync/events/event_bus.hpp"
#include "usync/metadata/store.hpp"
#include "usync/metadata/types.hpp"
#include "usync/security/cipher.hpp"
#include "usync/transfer/retry.hpp"
#include "usync/transfer/transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace usync::publishing {

class ShareService {
public:
    ShareService(metadata::RecordStore& store,
                 transfer::Transport& transport,
                 transfer::RetryPolicy& retry,
                 security::PayloadCipher* cipher = nullptr,
                 events::EventBus* bus = nullptr);

    /// Encoded manifest of the folder's current version.
    Result<std::vector<std::uint8_t>> encode_current_manifest(const std::string& folder_id) const;

    /**
     * @brief Post the current version's manifest and record a Share for it
     *
     * Validation error when the folder was never indexed, when details is
     * not a JSON object or when live segments are still waiting for upload.
     */
    Result<metadata::Share> publish(const std::string& folder_id,
                                    metadata::ShareType type,
                                    const nlohmann::json& details = nlohmann::json::object());

    Result<metadata::Share> resolve(const std::string& token) const;

    /// Format error when the stored metadata is not a JSON object.
    static Result<nlohmann::json> share_metadata(const metadata::Share& share);

private:
    Result<void> check_uploaded(const std::string& folder_id,
                                std::uint64_t version,
                                const std::vector<metadata::File>& files) const;

    metadata::RecordStore& store_;
    transfer::Transport& transport_;
    transfer::RetryPolicy& retry_;
    security::PayloadCipher* cipher_;
    events::EventBus* bus_;
};

} // namespace usync::publishing
