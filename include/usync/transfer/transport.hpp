#pragma once

/**
 * @file transport.hpp
 * @brief Store-and-forward transport seen from the sync core
 *
 * A post returns an opaque locator; fetch(locator) returns the posted bytes.
 * Both may fail with TransientTransport (busy, unavailable, timeout: retry)
 * or TerminalTransport (rejected: do not retry). Connection handling and
 * subject obfuscation live behind this interface.
 */

#include "usync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace usync::transfer {

struct RoutingMetadata {
    std::string folder_id;
    std::string session_id;
    std::string kind;                  ///< "pack" or "manifest"
    std::size_t segment_count = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::string> post(const std::vector<std::uint8_t>& payload,
                                     const RoutingMetadata& routing) = 0;
    virtual Result<std::vector<std::uint8_t>> fetch(const std::string& locator) = 0;
};

/**
 * @brief In-process transport keyed by random locators
 *
 * Hooks run before every call and may return an error to inject failures.
 */
class MemoryTransport : public Transport {
public:
    using PostHook = std::function<std::optional<Error>(const RoutingMetadata&)>;
    using FetchHook = std::function<std::optional<Error>(const std::string& locator)>;

    Result<std::string> post(const std::vector<std::uint8_t>& payload,
                             const RoutingMetadata& routing) override;
    Result<std::vector<std::uint8_t>> fetch(const std::string& locator) override;

    void set_post_hook(PostHook hook);
    void set_fetch_hook(FetchHook hook);

    /// Forget a posted payload, as an expired article would be.
    bool drop(const std::string& locator);

    std::size_t post_count() const;
    std::size_t fetch_count() const;
    std::size_t stored_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::uint8_t>> articles_;
    PostHook post_hook_;
    FetchHook fetch_hook_;
    std::size_t posts_ = 0;
    std::size_t fetches_ = 0;
};

} // namespace usync::transfer
