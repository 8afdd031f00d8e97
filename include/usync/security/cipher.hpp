#pragma once

/**
 * @file cipher.hpp
 * @brief Payload sealing applied to packs and manifests around the transport
 *
 * Keys are per folder and come from the caller; usync never stores them.
 */

#include "usync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace usync::security {

class PayloadCipher {
public:
    virtual ~PayloadCipher() = default;

    virtual Result<std::vector<std::uint8_t>> seal(const std::string& folder_id,
                                                   const std::vector<std::uint8_t>& plain) = 0;

    /// Integrity error when the payload was not sealed under this folder's key.
    virtual Result<std::vector<std::uint8_t>> open(const std::string& folder_id,
                                                   const std::vector<std::uint8_t>& sealed) = 0;

    /// Bytes seal() adds to every payload.
    virtual std::size_t overhead() const noexcept = 0;
};

/**
 * @brief AES-256-GCM with a random 96-bit nonce per payload
 *
 * Layout: [nonce: 12 bytes] [ciphertext] [tag: 16 bytes]. The folder id is
 * bound as additional authenticated data.
 */
class AesGcmCipher : public PayloadCipher {
public:
    static constexpr std::size_t kKeySize = 32;
    static constexpr std::size_t kNonceSize = 12;
    static constexpr std::size_t kTagSize = 16;

    using KeyProvider = std::function<Result<std::vector<std::uint8_t>>(const std::string& folder_id)>;

    explicit AesGcmCipher(KeyProvider keys);

    Result<std::vector<std::uint8_t>> seal(const std::string& folder_id,
                                           const std::vector<std::uint8_t>& plain) override;
    Result<std::vector<std::uint8_t>> open(const std::string& folder_id,
                                           const std::vector<std::uint8_t>& sealed) override;
    std::size_t overhead() const noexcept override { return kNonceSize + kTagSize; }

    /// Fresh random key from the OpenSSL CSPRNG.
    static Result<std::vector<std::uint8_t>> generate_key();

private:
    Result<std::vector<std::uint8_t>> key_for(const std::string& folder_id) const;

    KeyProvider keys_;
};

} // namespace usync::security
