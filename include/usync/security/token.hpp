#pragma once

#include "usync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace usync::security {

constexpr std::size_t kShareTokenBytes = 32;

/// RFC 4648 base32 without padding, lowercase.
std::string base32_encode(const std::uint8_t* data, std::size_t size);

/**
 * @brief Unguessable share token
 *
 * kShareTokenBytes from RAND_bytes, base32-encoded. The token carries no
 * prefix, type or checksum.
 */
Result<std::string> generate_share_token();

} // namespace usync::security
