#include "usync/security/cipher.hpp"
#include "usync/security/token.hpp"

#include <gtest/gtest.h>

#include <map>
#include <set>

using usync::ErrorCode;
using usync::Ok;
using usync::Result;
using usync::security::AesGcmCipher;
using usync::security::base32_encode;
using usync::security::generate_share_token;

namespace {

using Bytes = std::vector<std::uint8_t>;

std::string encode(const std::string& text) {
    return base32_encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

Bytes bytes_of(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

AesGcmCipher make_cipher(std::map<std::string, Bytes>& keys) {
    return AesGcmCipher([&keys](const std::string& folder_id) -> Result<Bytes> {
        auto it = keys.find(folder_id);
        if (it == keys.end()) {
            return usync::Err<Bytes>(ErrorCode::NotFound, "No key for " + folder_id);
        }
        return Ok(it->second);
    });
}

} // namespace

TEST(Base32Test, MatchesRfc4648Vectors) {
    EXPECT_EQ(encode(""), "");
    EXPECT_EQ(encode("f"), "my");
    EXPECT_EQ(encode("fo"), "mzxq");
    EXPECT_EQ(encode("foo"), "mzxw6");
    EXPECT_EQ(encode("foob"), "mzxw6yq");
    EXPECT_EQ(encode("fooba"), "mzxw6ytb");
    EXPECT_EQ(encode("foobar"), "mzxw6ytboi");
}

TEST(ShareTokenTest, TokensAreLongRandomAndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto token = generate_share_token();
        ASSERT_TRUE(token.is_ok());
        EXPECT_EQ(token.value().size(), 52u);
        EXPECT_EQ(token.value().find_first_not_of("abcdefghijklmnopqrstuvwxyz234567"), std::string::npos);
        seen.insert(token.value());
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(AesGcmCipherTest, SealThenOpen) {
    std::map<std::string, Bytes> keys{{"docs", AesGcmCipher::generate_key().value()}};
    auto cipher = make_cipher(keys);

    const auto plain = bytes_of("segment payload bytes");
    auto sealed = cipher.seal("docs", plain);
    ASSERT_TRUE(sealed.is_ok()) << sealed.error().message;
    EXPECT_EQ(sealed.value().size(), plain.size() + AesGcmCipher::kNonceSize + AesGcmCipher::kTagSize);
    EXPECT_NE(sealed.value(), plain);

    auto again = cipher.seal("docs", plain);
    ASSERT_TRUE(again.is_ok());
    EXPECT_NE(again.value(), sealed.value());

    auto opened = cipher.open("docs", sealed.value());
    ASSERT_TRUE(opened.is_ok()) << opened.error().message;
    EXPECT_EQ(opened.value(), plain);

    auto empty = cipher.seal("docs", {});
    ASSERT_TRUE(empty.is_ok());
    auto empty_opened = cipher.open("docs", empty.value());
    ASSERT_TRUE(empty_opened.is_ok());
    EXPECT_TRUE(empty_opened.value().empty());
}

TEST(AesGcmCipherTest, WrongKeyOrFolderFailsAuthentication) {
    const auto shared_key = AesGcmCipher::generate_key().value();
    std::map<std::string, Bytes> keys{
        {"docs", shared_key},
        {"photos", shared_key},
        {"other", AesGcmCipher::generate_key().value()},
    };
    auto cipher = make_cipher(keys);

    auto sealed = cipher.seal("docs", bytes_of("secret"));
    ASSERT_TRUE(sealed.is_ok());

    // Same key, different folder: the folder id is authenticated too
    auto wrong_folder = cipher.open("photos", sealed.value());
    ASSERT_TRUE(wrong_folder.is_error());
    EXPECT_EQ(wrong_folder.error().code, ErrorCode::Integrity);

    auto wrong_key = cipher.open("other", sealed.value());
    ASSERT_TRUE(wrong_key.is_error());
    EXPECT_EQ(wrong_key.error().code, ErrorCode::Integrity);

    auto tampered = sealed.value();
    tampered[AesGcmCipher::kNonceSize] ^= 0x01;
    auto corrupt = cipher.open("docs", tampered);
    ASSERT_TRUE(corrupt.is_error());
    EXPECT_EQ(corrupt.error().code, ErrorCode::Integrity);
}

TEST(AesGcmCipherTest, ShortInputAndBadKeys) {
    std::map<std::string, Bytes> keys{{"docs", AesGcmCipher::generate_key().value()}, {"short", Bytes(16, 1)}};
    auto cipher = make_cipher(keys);

    auto truncated = cipher.open("docs", Bytes(AesGcmCipher::kNonceSize + AesGcmCipher::kTagSize - 1, 0));
    ASSERT_TRUE(truncated.is_error());
    EXPECT_EQ(truncated.error().code, ErrorCode::Truncation);

    auto short_key = cipher.seal("short", bytes_of("x"));
    ASSERT_TRUE(short_key.is_error());
    EXPECT_EQ(short_key.error().code, ErrorCode::Validation);

    auto unknown = cipher.seal("nobody", bytes_of("x"));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}
