#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lb/common/defs.h"

namespace lb::dns {

struct ApiKeyScryptParams {
    uint32_t log_n = 10; // log2 of the CPU/memory cost
    uint32_t r = 8;      // Block size
    uint32_t p = 1;      // Parallelization
};

/**
 * Pre-shared key authenticating the management API requests.
 *
 * Configured either in plain text or hashed with scrypt:
 * `$scrypt$ln=<log2 N>,p=<p>,r=<r>$<base64 salt>$<base64 hash>`.
 */
class ApiKey {
public:
    using ParseResult = std::pair<std::optional<ApiKey>, ErrString>;

    using ScryptParams = ApiKeyScryptParams;

    /**
     * Parse a configured key. An empty key is valid and matches nothing.
     * @return the key, or nullopt and the error description if a hashed key is malformed
     */
    static ParseResult parse(std::string_view configured);

    /**
     * Hash a password into the form accepted by `parse`, using a random salt
     * @return the hashed form, or nullopt if hashing failed
     */
    static std::optional<std::string> hash(std::string_view password, const ScryptParams &params = {});

    /**
     * Check a key presented by a client, in constant time for keys of the same length
     */
    [[nodiscard]] bool matches(std::string_view presented) const;

    [[nodiscard]] bool is_hashed() const {
        return m_hashed.has_value();
    }

private:
    struct Hashed {
        ScryptParams params;
        Uint8Vector salt;
        Uint8Vector hash;
    };

    std::string m_plain;
    std::optional<Hashed> m_hashed;

    ApiKey() = default;

    static std::optional<Uint8Vector> scrypt(std::string_view password, Uint8View salt, const ScryptParams &params,
            size_t out_len);
};

} // namespace lb::dns
