#include "usync/security/token.hpp"

#include <openssl/rand.h>

#include <array>

namespace usync::security {

namespace {
constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz234567";
}

std::string base32_encode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve((size * 8 + 4) / 5);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = 0; i < size; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            out.push_back(kAlphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

Result<std::string> generate_share_token() {
    std::array<std::uint8_t, kShareTokenBytes> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return Err<std::string>(ErrorCode::Io, "RAND_bytes failed to produce a share token");
    }
    return Ok(base32_encode(raw.data(), raw.size()));
}

} // namespace usync::security
