#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>
#include "../types/result.hpp"

namespace regionbridge {

/// Compression of TIFF strip payloads; values are the TIFF Compression tag codes
enum class TiffCompression : uint16_t {
    None     = 1,
    PackBits = 32773,
    Zstd     = 50000
};

[[nodiscard]] constexpr std::string_view to_string(TiffCompression compression) noexcept {
    switch (compression) {
        case TiffCompression::None: return "none";
        case TiffCompression::PackBits: return "packbits";
        case TiffCompression::Zstd: return "zstd";
    }
    return "unknown";
}

/// @brief Concept for a strip compressor
///
/// compress() appends the encoded form of input to output starting at offset,
/// growing output as needed, and returns the number of bytes written.
template <typename T>
concept StripCompressor = requires(const T& compressor,
                                   std::vector<std::byte>& output,
                                   std::size_t offset,
                                   std::span<const std::byte> input) {
    { compressor.compress(output, offset, input) } -> std::same_as<Result<std::size_t>>;
    { T::scheme() } -> std::same_as<TiffCompression>;
};

/// @brief Grow output so that it holds at least required bytes
[[nodiscard]] inline Result<void> reserve_output(std::vector<std::byte>& output, std::size_t required) noexcept {
    if (output.size() >= required) {
        return Ok();
    }
    try {
        output.resize(required);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to resize output buffer");
    } catch (const std::length_error&) {
        return Err(Error::Code::MemoryError, "Output buffer too large");
    }
    return Ok();
}

} // namespace regionbridge
