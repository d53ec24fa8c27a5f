#pragma once

/// @file base64.hpp
/// @brief Base64 codec for the XML-RPC <base64> element

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rivet::util {

/// Encode bytes as standard (RFC 4648) base64 with padding
inline std::string base64_encode(std::string_view data) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    const size_t len = data.size();

    std::string result;
    result.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t triple = static_cast<uint32_t>(bytes[i]) << 16;
        if (i + 1 < len) triple |= static_cast<uint32_t>(bytes[i + 1]) << 8;
        if (i + 2 < len) triple |= bytes[i + 2];

        result += table[(triple >> 18) & 0x3F];
        result += table[(triple >> 12) & 0x3F];
        result += (i + 1 < len) ? table[(triple >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? table[triple & 0x3F] : '=';
    }

    return result;
}

/// Decode base64 text. Whitespace (line breaks inside <base64> elements)
/// is skipped; any other character outside the alphabet, or data after
/// the padding, makes the input invalid.
inline std::optional<std::string> base64_decode(std::string_view encoded) {
    auto sextet = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::string result;
    result.reserve(encoded.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits_collected = 0;
    bool padded = false;

    for (char c : encoded) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        if (c == '=') {
            padded = true;
            continue;
        }
        if (padded) return std::nullopt;

        int value = sextet(c);
        if (value < 0) return std::nullopt;

        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits_collected += 6;

        if (bits_collected >= 8) {
            bits_collected -= 8;
            result += static_cast<char>((buffer >> bits_collected) & 0xFF);
        }
    }

    return result;
}

} // namespace rivet::util
