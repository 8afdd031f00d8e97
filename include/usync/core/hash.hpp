#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace usync::hash {

constexpr std::size_t kSha256Size = 32;
constexpr std::size_t kSha256HexSize = kSha256Size * 2;

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, std::size_t size);

    /// Finish the digest; the object must not be updated afterwards.
    std::array<std::uint8_t, kSha256Size> finish();
    std::string finish_hex();

private:
    struct Context;
    std::unique_ptr<Context> ctx_;
};

std::string sha256_hex(const void* data, std::size_t size);
std::string sha256_hex(std::string_view text);

/// MD5 digest (16 bytes); used only for stable key routing, never for integrity.
std::array<std::uint8_t, 16> md5(std::string_view text);

std::string to_hex(const std::uint8_t* data, std::size_t size);

/// Decode lowercase/uppercase hex; returns false on odd length or bad digit.
bool from_hex(std::string_view hex, std::vector<std::uint8_t>& out);

/// True for the canonical form to_hex() produces: 64 lowercase hex digits.
bool is_sha256_hex(std::string_view hex);

} // namespace usync::hash
