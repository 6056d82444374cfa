#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "types/result.hpp"

namespace regionbridge {

namespace base64_detail {
    inline constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    inline constexpr uint8_t kInvalid = 0xFF;

    constexpr std::array<uint8_t, 256> make_decode_table() noexcept {
        std::array<uint8_t, 256> table{};
        for (auto& entry : table) entry = kInvalid;
        for (uint8_t i = 0; i < 64; ++i) {
            table[static_cast<unsigned char>(kAlphabet[i])] = i;
        }
        return table;
    }

    inline constexpr auto kDecodeTable = make_decode_table();
} // namespace base64_detail

/// @brief Encode bytes as Base64 (RFC 4648 standard alphabet)
/// @note Output is padded with '=' and has no line breaks
[[nodiscard]] inline std::string base64_encode(std::span<const std::byte> bytes) {
    using base64_detail::kAlphabet;

    std::string encoded;
    encoded.reserve(4 * ((bytes.size() + 2) / 3));

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const uint32_t triple = (std::to_integer<uint32_t>(bytes[i]) << 16) |
                                (std::to_integer<uint32_t>(bytes[i + 1]) << 8) |
                                std::to_integer<uint32_t>(bytes[i + 2]);
        encoded += kAlphabet[(triple >> 18) & 0x3F];
        encoded += kAlphabet[(triple >> 12) & 0x3F];
        encoded += kAlphabet[(triple >> 6) & 0x3F];
        encoded += kAlphabet[triple & 0x3F];
    }

    const std::size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        const uint32_t value = std::to_integer<uint32_t>(bytes[i]) << 16;
        encoded += kAlphabet[(value >> 18) & 0x3F];
        encoded += kAlphabet[(value >> 12) & 0x3F];
        encoded += "==";
    } else if (remaining == 2) {
        const uint32_t value = (std::to_integer<uint32_t>(bytes[i]) << 16) |
                               (std::to_integer<uint32_t>(bytes[i + 1]) << 8);
        encoded += kAlphabet[(value >> 18) & 0x3F];
        encoded += kAlphabet[(value >> 12) & 0x3F];
        encoded += kAlphabet[(value >> 6) & 0x3F];
        encoded += '=';
    }
    return encoded;
}

/// @brief Decode padded standard Base64
/// @retval DecodeError Length not a multiple of four, a character outside the
///         alphabet, or misplaced padding
[[nodiscard]] inline Result<std::vector<std::byte>> base64_decode(std::string_view text) noexcept {
    using base64_detail::kDecodeTable;
    using base64_detail::kInvalid;

    if (text.size() % 4 != 0) {
        return Err(Error::Code::DecodeError, "Base64 length must be a multiple of 4");
    }

    std::size_t padding = 0;
    if (!text.empty() && text.back() == '=') ++padding;
    if (padding == 1 && text[text.size() - 2] == '=') ++padding;

    try {
        std::vector<std::byte> decoded;
        decoded.reserve(text.size() / 4 * 3);

        for (std::size_t i = 0; i < text.size(); i += 4) {
            const bool last = i + 4 == text.size();
            uint32_t quad = 0;
            for (std::size_t j = 0; j < 4; ++j) {
                const char ch = text[i + j];
                if (ch == '=' && last && j >= 4 - padding) {
                    quad <<= 6;
                    continue;
                }
                const uint8_t value = kDecodeTable[static_cast<unsigned char>(ch)];
                if (value == kInvalid) {
                    return Err(Error::Code::DecodeError,
                               "Invalid Base64 character at offset " + std::to_string(i + j));
                }
                quad = (quad << 6) | value;
            }

            decoded.push_back(static_cast<std::byte>((quad >> 16) & 0xFF));
            if (!last || padding < 2) decoded.push_back(static_cast<std::byte>((quad >> 8) & 0xFF));
            if (!last || padding < 1) decoded.push_back(static_cast<std::byte>(quad & 0xFF));
        }
        return Ok(std::move(decoded));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while decoding Base64");
    }
}

} // namespace regionbridge
