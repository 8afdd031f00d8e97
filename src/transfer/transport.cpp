#include "usync/transfer/transport.hpp"

#include "usync/core/hash.hpp"

#include <openssl/rand.h>

namespace usync::transfer {

Result<std::string> MemoryTransport::post(const std::vector<std::uint8_t>& payload,
                                          const RoutingMetadata& routing) {
    PostHook hook;
    {
        std::lock_guard lock(mutex_);
        hook = post_hook_;
    }
    if (hook) {
        if (auto injected = hook(routing)) {
            return Err<std::string>(*injected);
        }
    }

    std::uint8_t nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        return Err<std::string>(ErrorCode::TransientTransport, "RAND_bytes failed while naming article");
    }
    std::string locator = hash::to_hex(nonce, sizeof(nonce)) + "@usync";

    std::lock_guard lock(mutex_);
    articles_.emplace(locator, payload);
    ++posts_;
    return Ok(std::move(locator));
}

Result<std::vector<std::uint8_t>> MemoryTransport::fetch(const std::string& locator) {
    FetchHook hook;
    {
        std::lock_guard lock(mutex_);
        hook = fetch_hook_;
        ++fetches_;
    }
    if (hook) {
        if (auto injected = hook(locator)) {
            return Err<std::vector<std::uint8_t>>(*injected);
        }
    }

    std::lock_guard lock(mutex_);
    auto it = articles_.find(locator);
    if (it == articles_.end()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::TerminalTransport, "No such article: " + locator);
    }
    return Ok(it->second);
}

void MemoryTransport::set_post_hook(PostHook hook) {
    std::lock_guard lock(mutex_);
    post_hook_ = std::move(hook);
}

void MemoryTransport::set_fetch_hook(FetchHook hook) {
    std::lock_guard lock(mutex_);
    fetch_hook_ = std::move(hook);
}

bool MemoryTransport::drop(const std::string& locator) {
    std::lock_guard lock(mutex_);
    return articles_.erase(locator) > 0;
}

std::size_t MemoryTransport::post_count() const {
    std::lock_guard lock(mutex_);
    return posts_;
}

std::size_t MemoryTransport::fetch_count() const {
    std::lock_guard lock(mutex_);
    return fetches_;
}

std::size_t MemoryTransport::stored_count() const {
    std::lock_guard lock(mutex_);
    return articles_.size();
}

} // namespace usync::transfer
