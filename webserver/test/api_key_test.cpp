#include <gtest/gtest.h>

#include "lb/common/logger.h"
#include "lb/dns/webserver/api_key.h"

namespace lb::dns::test {

// `apisecret` hashed with ln=10,p=1,r=8
static constexpr auto HASHED_KEY
        = "$scrypt$ln=10,p=1,r=8$9v8JxDfzQVyTpBkTbkUqYg==$bDQzAOHeK1G9UvTPypNhrX48w974ZXbFPtRKS34+aso=";

static ApiKey parse(std::string_view configured) {
    auto [key, err] = ApiKey::parse(configured);
    EXPECT_FALSE(err.has_value()) << *err;
    return std::move(key.value());
}

TEST(ApiKeyTest, Plain) {
    ApiKey key = parse("apisecret");
    ASSERT_FALSE(key.is_hashed());
    ASSERT_TRUE(key.matches("apisecret"));
    ASSERT_FALSE(key.matches("apisecre"));
    ASSERT_FALSE(key.matches("apisecret2"));
    ASSERT_FALSE(key.matches(""));
}

TEST(ApiKeyTest, EmptyMatchesNothing) {
    ApiKey key = parse("");
    ASSERT_FALSE(key.matches(""));
    ASSERT_FALSE(key.matches("apisecret"));
}

TEST(ApiKeyTest, Hashed) {
    Logger::set_log_level(LogLevel::LOG_LEVEL_DEBUG);
    ApiKey key = parse(HASHED_KEY);
    ASSERT_TRUE(key.is_hashed());
    ASSERT_TRUE(key.matches("apisecret"));
    ASSERT_FALSE(key.matches("apisecreT"));
    ASSERT_FALSE(key.matches(""));
}

TEST(ApiKeyTest, HashedWithRandomSalt) {
    std::optional<std::string> first = ApiKey::hash("password", {.log_n = 8, .r = 8, .p = 1});
    std::optional<std::string> second = ApiKey::hash("password", {.log_n = 8, .r = 8, .p = 1});
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_NE(*first, *second);
    ASSERT_EQ(first->rfind("$scrypt$ln=8,p=1,r=8$", 0), 0u) << *first;

    ApiKey key = parse(*first);
    ASSERT_TRUE(key.matches("password"));
    ASSERT_FALSE(key.matches("Password"));
}

TEST(ApiKeyTest, Malformed) {
    for (std::string_view configured : {
                 "$scrypt$",
                 "$scrypt$ln=10,p=1,r=8$c2FsdA==",
                 "$scrypt$ln=10,p=1,r=8$c2FsdA==$!!!",
                 "$scrypt$ln=10,x=1$c2FsdA==$aGFzaA==",
                 "$scrypt$ln=abc$c2FsdA==$aGFzaA==",
                 "$scrypt$ln=0$c2FsdA==$aGFzaA==",
                 "$scrypt$ln=64$c2FsdA==$aGFzaA==",
         }) {
        auto [key, err] = ApiKey::parse(configured);
        ASSERT_FALSE(key.has_value()) << configured;
        ASSERT_TRUE(err.has_value()) << configured;
    }
}

} // namespace lb::dns::test
