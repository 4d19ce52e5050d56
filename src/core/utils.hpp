#pragma once

#include <string>
#include <optional>
#include <cctype>
#include <cstdlib>

namespace fee_estimator {

/**
 * Shared helpers for the controller, the mirror node client and the tests.
 */
namespace utils {

/**
 * Lower-case hex encoding of raw bytes.
 */
inline std::string hex_encode(const std::string& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0F]);
    }
    return out;
}

/**
 * Decode a hex string (optional "0x" prefix, either case).
 * Returns std::nullopt on odd length or non-hex characters.
 */
inline std::optional<std::string> hex_decode(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) start = 2;
    if ((hex.size() - start) % 2 != 0) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    std::string out;
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

/**
 * Read an environment variable; std::nullopt when unset or empty.
 */
inline std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

} // namespace utils
} // namespace fee_estimator
