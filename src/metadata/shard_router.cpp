#include "usync/metadata/shard_router.hpp"

#include "usync/core/hash.hpp"

#include <stdexcept>

namespace usync::metadata {

ShardRouter::ShardRouter(std::uint32_t shard_count) : shard_count_(shard_count) {
    if (shard_count_ == 0) {
        throw std::invalid_argument("Shard count must be positive");
    }
}

std::uint32_t ShardRouter::shard_for(std::string_view key) const {
    const auto digest = hash::md5(key);

    // Horner reduction keeps the 128-bit value below 2^40 at every step
    std::uint64_t remainder = 0;
    for (std::uint8_t byte : digest) {
        remainder = (remainder * 256 + byte) % shard_count_;
    }
    return static_cast<std::uint32_t>(remainder);
}

} // namespace usync::metadata
