#include "usync/security/cipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace usync::security {

namespace {

struct CtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter>;

} // namespace

AesGcmCipher::AesGcmCipher(KeyProvider keys) : keys_(std::move(keys)) {}

Result<std::vector<std::uint8_t>> AesGcmCipher::generate_key() {
    std::vector<std::uint8_t> key(kKeySize);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Io, "RAND_bytes failed to produce a key");
    }
    return Ok(std::move(key));
}

Result<std::vector<std::uint8_t>> AesGcmCipher::key_for(const std::string& folder_id) const {
    if (!keys_) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Validation, "No key provider configured");
    }
    auto key = keys_(folder_id);
    if (key.is_ok() && key.value().size() != kKeySize) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Validation,
                                              "Key for folder " + folder_id + " is not 32 bytes");
    }
    return key;
}

Result<std::vector<std::uint8_t>> AesGcmCipher::seal(const std::string& folder_id,
                                                     const std::vector<std::uint8_t>& plain) {
    using Bytes = std::vector<std::uint8_t>;
    auto key = key_for(folder_id);
    if (key.is_error()) {
        return key;
    }

    Bytes out(kNonceSize + plain.size() + kTagSize);
    if (RAND_bytes(out.data(), static_cast<int>(kNonceSize)) != 1) {
        return Err<Bytes>(ErrorCode::Io, "RAND_bytes failed to produce a nonce");
    }

    CtxPtr ctx(EVP_CIPHER_CTX_new());
    int length = 0;
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.value().data(), out.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), nullptr, &length,
                          reinterpret_cast<const unsigned char*>(folder_id.data()),
                          static_cast<int>(folder_id.size())) != 1) {
        return Err<Bytes>(ErrorCode::Io, "AES-GCM setup failed");
    }

    int written = 0;
    if (!plain.empty() &&
        EVP_EncryptUpdate(ctx.get(), out.data() + kNonceSize, &written, plain.data(),
                          static_cast<int>(plain.size())) != 1) {
        return Err<Bytes>(ErrorCode::Io, "AES-GCM encryption failed");
    }
    int tail = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + kNonceSize + written, &tail) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            out.data() + kNonceSize + plain.size()) != 1) {
        return Err<Bytes>(ErrorCode::Io, "AES-GCM finalization failed");
    }
    return Ok(std::move(out));
}

Result<std::vector<std::uint8_t>> AesGcmCipher::open(const std::string& folder_id,
                                                     const std::vector<std::uint8_t>& sealed) {
    using Bytes = std::vector<std::uint8_t>;
    if (sealed.size() < kNonceSize + kTagSize) {
        return Err<Bytes>(ErrorCode::Truncation, "Sealed payload shorter than nonce and tag");
    }
    auto key = key_for(folder_id);
    if (key.is_error()) {
        return key;
    }

    const std::size_t body = sealed.size() - kNonceSize - kTagSize;
    Bytes plain(body);
    Bytes tag(sealed.end() - static_cast<std::ptrdiff_t>(kTagSize), sealed.end());

    CtxPtr ctx(EVP_CIPHER_CTX_new());
    int length = 0;
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.value().data(), sealed.data()) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &length,
                          reinterpret_cast<const unsigned char*>(folder_id.data()),
                          static_cast<int>(folder_id.size())) != 1) {
        return Err<Bytes>(ErrorCode::Io, "AES-GCM setup failed");
    }

    int written = 0;
    if (body > 0 &&
        EVP_DecryptUpdate(ctx.get(), plain.data(), &written, sealed.data() + kNonceSize,
                          static_cast<int>(body)) != 1) {
        return Err<Bytes>(ErrorCode::Integrity, "AES-GCM decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        return Err<Bytes>(ErrorCode::Io, "AES-GCM tag setup failed");
    }
    unsigned char scratch[kTagSize];
    int tail = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), body > 0 ? plain.data() + written : scratch, &tail) != 1) {
        return Err<Bytes>(ErrorCode::Integrity, "Payload failed authentication for folder " + folder_id);
    }
    return Ok(std::move(plain));
}

} // namespace usync::security
