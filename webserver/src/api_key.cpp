#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "lb/common/base64.h"
#include "lb/common/logger.h"
#include "lb/common/utils.h"
#include "lb/dns/webserver/api_key.h"

namespace lb::dns {

static const Logger g_log{"api_key"};

static constexpr std::string_view SCRYPT_PREFIX = "$scrypt$";
static constexpr size_t SALT_SIZE = 16;
static constexpr size_t HASH_SIZE = 32;
// Keeps hashing of a misconfigured key from eating all the memory
static constexpr uint32_t MAX_LOG_N = 20;

static std::optional<ApiKey::ScryptParams> parse_scrypt_params(std::string_view str) {
    ApiKey::ScryptParams params;
    for (std::string_view part : utils::split_by(str, ',')) {
        size_t eq = part.find('=');
        if (eq == std::string_view::npos) {
            return std::nullopt;
        }
        std::string_view name = part.substr(0, eq);
        std::optional<uint32_t> value = utils::to_integer<uint32_t>(part.substr(eq + 1));
        if (!value.has_value() || *value == 0) {
            return std::nullopt;
        }
        if (name == "ln") {
            params.log_n = *value;
        } else if (name == "r") {
            params.r = *value;
        } else if (name == "p") {
            params.p = *value;
        } else {
            return std::nullopt;
        }
    }
    if (params.log_n > MAX_LOG_N) {
        return std::nullopt;
    }
    return params;
}

ApiKey::ParseResult ApiKey::parse(std::string_view configured) {
    ApiKey key;
    if (!utils::starts_with(configured, SCRYPT_PREFIX)) {
        key.m_plain = std::string{configured};
        return {std::move(key), std::nullopt};
    }

    std::vector<std::string_view> parts = utils::split_by(configured.substr(SCRYPT_PREFIX.size()), '$');
    if (parts.size() != 3) {
        return {std::nullopt, "Hashed key must have parameters, salt and hash"};
    }
    std::optional<ScryptParams> params = parse_scrypt_params(parts[0]);
    if (!params.has_value()) {
        return {std::nullopt, LB_FMT("Invalid scrypt parameters: {}", parts[0])};
    }
    std::optional<Uint8Vector> salt = decode_base64(parts[1]);
    std::optional<Uint8Vector> hash = decode_base64(parts[2]);
    if (!salt.has_value() || !hash.has_value() || hash->empty()) {
        return {std::nullopt, "Hashed key has invalid salt or hash encoding"};
    }

    key.m_hashed = Hashed{.params = *params, .salt = std::move(*salt), .hash = std::move(*hash)};
    return {std::move(key), std::nullopt};
}

std::optional<Uint8Vector> ApiKey::scrypt(
        std::string_view password, Uint8View salt, const ScryptParams &params, size_t out_len) {
    uint64_t n = uint64_t(1) << params.log_n;
    // Memory used by the algorithm, see `EVP_PBE_scrypt`
    uint64_t max_mem = 128 * uint64_t(params.r) * (n + params.p + 2) + 1024;

    Uint8Vector out(out_len);
    if (1 != EVP_PBE_scrypt(password.data(), password.size(), salt.data(), salt.size(), n, params.r, params.p,
                     max_mem, out.data(), out.size())) {
        warnlog(g_log, "scrypt failed: ln={} r={} p={}", params.log_n, params.r, params.p);
        return std::nullopt;
    }
    return out;
}

std::optional<std::string> ApiKey::hash(std::string_view password, const ScryptParams &params) {
    Uint8Vector salt(SALT_SIZE);
    if (1 != RAND_bytes(salt.data(), salt.size())) {
        errlog(g_log, "Failed to generate salt");
        return std::nullopt;
    }
    std::optional<Uint8Vector> hashed = scrypt(password, {salt.data(), salt.size()}, params, HASH_SIZE);
    if (!hashed.has_value()) {
        return std::nullopt;
    }
    return LB_FMT("{}ln={},p={},r={}${}${}", SCRYPT_PREFIX, params.log_n, params.p, params.r,
            encode_to_base64({salt.data(), salt.size()}), encode_to_base64({hashed->data(), hashed->size()}));
}

bool ApiKey::matches(std::string_view presented) const {
    if (!m_hashed.has_value()) {
        return !m_plain.empty() && m_plain.size() == presented.size()
                && 0 == CRYPTO_memcmp(m_plain.data(), presented.data(), presented.size());
    }

    const Hashed &hashed = *m_hashed;
    std::optional<Uint8Vector> computed = scrypt(presented, {hashed.salt.data(), hashed.salt.size()},
            hashed.params, hashed.hash.size());
    return computed.has_value() && 0 == CRYPTO_memcmp(computed->data(), hashed.hash.data(), hashed.hash.size());
}

} // namespace lb::dns
