#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "lb/common/defs.h"

namespace lb {

/**
 * Creates padded Base64-encoded string from data (RFC 4648 standard alphabet)
 * @param data data to encode
 * @return Base64 encoded string
 */
std::string encode_to_base64(Uint8View data);

/**
 * Decode data from Base64-encoded string. Padding is optional.
 * @param data Base64-encoded string
 * @return decoded bytes, or nullopt if the string is not valid Base64
 */
std::optional<Uint8Vector> decode_base64(std::string_view data);

} // namespace lb
