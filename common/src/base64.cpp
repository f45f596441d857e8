#include <array>

#include "lb/common/base64.h"

namespace lb {

static constexpr std::string_view BASE64_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
static constexpr char PADDING = '=';
static constexpr uint8_t INVALID = 0xff;

static constexpr std::array<uint8_t, 256> make_basis() {
    std::array<uint8_t, 256> basis{};
    for (uint8_t &x : basis) {
        x = INVALID;
    }
    for (size_t i = 0; i < BASE64_ALPHABET.size(); ++i) {
        basis[(uint8_t) BASE64_ALPHABET[i]] = (uint8_t) i;
    }
    return basis;
}

static constexpr std::array<uint8_t, 256> BASIS = make_basis();

std::string encode_to_base64(Uint8View data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t group = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        result.push_back(BASE64_ALPHABET[(group >> 18) & 0x3f]);
        result.push_back(BASE64_ALPHABET[(group >> 12) & 0x3f]);
        result.push_back(BASE64_ALPHABET[(group >> 6) & 0x3f]);
        result.push_back(BASE64_ALPHABET[group & 0x3f]);
    }
    size_t rest = data.size() - i;
    if (rest > 0) {
        uint32_t group = (data[i] << 16) | ((rest > 1) ? (data[i + 1] << 8) : 0);
        result.push_back(BASE64_ALPHABET[(group >> 18) & 0x3f]);
        result.push_back(BASE64_ALPHABET[(group >> 12) & 0x3f]);
        result.push_back((rest > 1) ? BASE64_ALPHABET[(group >> 6) & 0x3f] : PADDING);
        result.push_back(PADDING);
    }
    return result;
}

std::optional<Uint8Vector> decode_base64(std::string_view data) {
    while (!data.empty() && data.back() == PADDING) {
        data.remove_suffix(1);
    }
    if (data.size() % 4 == 1) {
        return std::nullopt;
    }

    Uint8Vector result;
    result.reserve(data.size() / 4 * 3 + 2);
    uint32_t group = 0;
    size_t bits = 0;
    for (char c : data) {
        uint8_t value = BASIS[(uint8_t) c];
        if (value == INVALID) {
            return std::nullopt;
        }
        group = (group << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back((group >> bits) & 0xff);
        }
    }
    return result;
}

} // namespace lb
