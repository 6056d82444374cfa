#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <span>
#include <utility>
#include <vector>
#include "../types/result.hpp"

namespace regionbridge {

/// @brief Growable in-memory byte sink with little-endian helpers
///
/// Values are appended at the end; patch_u32() rewrites an already written
/// 32-bit field, which the TIFF writer uses to link IFDs after the fact.
/// @note Not thread-safe
class OutputBuffer {
public:
    OutputBuffer() noexcept = default;

    [[nodiscard]] std::size_t size() const noexcept {
        return buffer_.size();
    }

    /// @brief Give up ownership of the written bytes
    [[nodiscard]] std::vector<std::byte> release() noexcept {
        return std::exchange(buffer_, {});
    }

    /// @brief Underlying vector, for writers that encode in place
    [[nodiscard]] std::vector<std::byte>& data() noexcept {
        return buffer_;
    }

    [[nodiscard]] Result<void> write_bytes(std::span<const std::byte> data) noexcept {
        try {
            buffer_.insert(buffer_.end(), data.begin(), data.end());
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to grow output buffer");
        }
        return Ok();
    }

    [[nodiscard]] Result<void> write_u8(uint8_t value) noexcept {
        return write_le(value);
    }

    [[nodiscard]] Result<void> write_u16(uint16_t value) noexcept {
        return write_le(value);
    }

    [[nodiscard]] Result<void> write_u32(uint32_t value) noexcept {
        return write_le(value);
    }

    /// @brief Pad with zero bytes up to a multiple of alignment
    [[nodiscard]] Result<void> align(std::size_t alignment) noexcept {
        while (buffer_.size() % alignment != 0) {
            auto written = write_u8(0);
            if (!written) return written;
        }
        return Ok();
    }

    /// @brief Overwrite a 32-bit little-endian field
    /// @retval OutOfBounds The field lies past the written data
    [[nodiscard]] Result<void> patch_u32(std::size_t offset, uint32_t value) noexcept {
        if (offset + 4 > buffer_.size()) {
            return Err(Error::Code::OutOfBounds, "Patch offset beyond written data");
        }
        for (std::size_t i = 0; i < 4; ++i) {
            buffer_[offset + i] = static_cast<std::byte>((value >> (8 * i)) & 0xFF);
        }
        return Ok();
    }

private:
    template <typename T>
    [[nodiscard]] Result<void> write_le(T value) noexcept {
        std::byte encoded[sizeof(T)];
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            encoded[i] = static_cast<std::byte>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF);
        }
        return write_bytes(encoded);
    }

    std::vector<std::byte> buffer_;
};

} // namespace regionbridge
