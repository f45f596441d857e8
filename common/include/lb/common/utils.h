#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "lb/common/defs.h"

/**
 * Macros for fmt::format with compile-time checked FMT_STRING
 */
#define LB_FMT(FORMAT, ...) fmt::format(FMT_STRING(FORMAT), __VA_ARGS__)

namespace lb::utils {

/**
 * Transform string in lowercase
 */
static inline std::string to_lower(std::string_view str) {
    std::string lwr;
    lwr.reserve(str.length());
    std::transform(str.cbegin(), str.cend(), std::back_inserter(lwr), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    return lwr;
}

/**
 * Trim whitespaces-only prefix and suffix
 */
static inline void trim(std::string_view &str) {
    while (!str.empty() && std::isspace((unsigned char) str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace((unsigned char) str.back())) {
        str.remove_suffix(1);
    }
}

/**
 * Check if string starts with prefix
 */
static inline constexpr bool starts_with(std::string_view str, std::string_view prefix) {
    return str.length() >= prefix.length() && 0 == str.compare(0, prefix.length(), prefix);
}

/**
 * Check if string ends with suffix
 */
static inline constexpr bool ends_with(std::string_view str, std::string_view suffix) {
    return str.length() >= suffix.length()
            && 0 == str.compare(str.length() - suffix.length(), suffix.length(), suffix);
}

/**
 * Parse a decimal integer. The whole string must be a number fitting into `T`.
 */
template <typename T>
std::optional<T> to_integer(std::string_view str) {
    T result = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return result;
}

/**
 * Splits string by delimiter. Empty and whitespace-only parts are skipped, the others are trimmed.
 */
std::vector<std::string_view> split_by(std::string_view str, char delim);

/**
 * Normalize a domain name: lower case, with exactly one trailing dot.
 * The root domain is represented as ".".
 */
std::string normalize_domain(std::string_view domain);

/**
 * Check if `domain` is `suffix` itself or one of its subdomains. Both must be normalized.
 */
bool is_subdomain_or_same(std::string_view domain, std::string_view suffix);

} // namespace lb::utils
