#pragma once

#include <cstdint>
#include <string_view>

namespace usync {
namespace metadata {

/**
 * @brief Maps a storage key to one of N shards
 *
 * shard = MD5(key) read as a big-endian 128-bit integer, mod N. Pure and
 * stateless; the mapping only changes when N does, and changing N is an
 * offline migration.
 */
class ShardRouter {
public:
    /// Throws std::invalid_argument when shard_count is zero.
    explicit ShardRouter(std::uint32_t shard_count);

    std::uint32_t shard_for(std::string_view key) const;
    std::uint32_t shard_count() const { return shard_count_; }

private:
    std::uint32_t shard_count_;
};

} // namespace metadata
} // namespace usync
