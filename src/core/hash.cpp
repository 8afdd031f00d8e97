#include "usync/core/hash.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace usync::hash {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

struct Sha256::Context {
    EVP_MD_CTX* md = nullptr;
};

Sha256::Sha256() : ctx_(std::make_unique<Context>()) {
    ctx_->md = EVP_MD_CTX_new();
    if (ctx_->md == nullptr || EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1) {
        if (ctx_->md != nullptr) {
            EVP_MD_CTX_free(ctx_->md);
        }
        throw std::runtime_error("EVP sha256 init failed");
    }
}

Sha256::~Sha256() {
    if (ctx_ && ctx_->md != nullptr) {
        EVP_MD_CTX_free(ctx_->md);
    }
}

void Sha256::update(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_->md, data, size) != 1) {
        throw std::runtime_error("EVP sha256 update failed");
    }
}

std::array<std::uint8_t, kSha256Size> Sha256::finish() {
    std::array<std::uint8_t, kSha256Size> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_->md, digest.data(), &length) != 1 || length != kSha256Size) {
        throw std::runtime_error("EVP sha256 final failed");
    }
    return digest;
}

std::string Sha256::finish_hex() {
    const auto digest = finish();
    return to_hex(digest.data(), digest.size());
}

std::string sha256_hex(const void* data, std::size_t size) {
    Sha256 hasher;
    hasher.update(data, size);
    return hasher.finish_hex();
}

std::string sha256_hex(std::string_view text) {
    return sha256_hex(text.data(), text.size());
}

std::array<std::uint8_t, 16> md5(std::string_view text) {
    std::array<std::uint8_t, 16> digest{};
    unsigned int length = 0;
    if (EVP_Digest(text.data(), text.size(), digest.data(), &length, EVP_md5(), nullptr) != 1 ||
        length != digest.size()) {
        throw std::runtime_error("EVP md5 failed");
    }
    return digest;
}

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        result += digits[(data[i] >> 4) & 0xF];
        result += digits[data[i] & 0xF];
    }
    return result;
}

bool from_hex(std::string_view hex, std::vector<std::uint8_t>& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.clear();
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return true;
}

bool is_sha256_hex(std::string_view hex) {
    if (hex.size() != kSha256HexSize) {
        return false;
    }
    for (char c : hex) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // namespace usync::hash
