#include <string>

#include <gtest/gtest.h>

#include "lb/common/base64.h"

namespace lb::test {

static Uint8View as_bytes(std::string_view str) {
    return {(const uint8_t *) str.data(), str.size()};
}

static std::string as_string(const Uint8Vector &bytes) {
    return {bytes.begin(), bytes.end()};
}

// RFC 4648 test vectors
static const std::pair<std::string_view, std::string_view> VECTORS[] = {
        {"", ""},
        {"f", "Zg=="},
        {"fo", "Zm8="},
        {"foo", "Zm9v"},
        {"foob", "Zm9vYg=="},
        {"fooba", "Zm9vYmE="},
        {"foobar", "Zm9vYmFy"},
};

TEST(Base64Test, Encode) {
    for (const auto &[plain, encoded] : VECTORS) {
        ASSERT_EQ(encode_to_base64(as_bytes(plain)), encoded);
    }
}

TEST(Base64Test, Decode) {
    for (const auto &[plain, encoded] : VECTORS) {
        std::optional<Uint8Vector> decoded = decode_base64(encoded);
        ASSERT_TRUE(decoded.has_value()) << encoded;
        ASSERT_EQ(as_string(*decoded), plain);
    }

    std::optional<Uint8Vector> unpadded = decode_base64("Zm9vYg");
    ASSERT_TRUE(unpadded.has_value());
    ASSERT_EQ(as_string(*unpadded), "foob");
}

TEST(Base64Test, DecodeInvalid) {
    ASSERT_FALSE(decode_base64("Zm9v!").has_value());
    ASSERT_FALSE(decode_base64("Z").has_value());
    ASSERT_FALSE(decode_base64("Zm=9").has_value());
}

} // namespace lb::test
