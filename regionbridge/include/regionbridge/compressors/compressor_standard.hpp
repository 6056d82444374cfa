#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>
#include "compressor_base.hpp"

namespace regionbridge {

/// Stores strips verbatim
class NoneCompressor {
public:
    [[nodiscard]] static constexpr TiffCompression scheme() noexcept {
        return TiffCompression::None;
    }

    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        auto grown = reserve_output(output, offset + input.size());
        if (!grown) return grown.error();
        if (!input.empty()) {
            std::memcpy(output.data() + offset, input.data(), input.size());
        }
        return Ok(input.size());
    }
};

/// @brief PackBits run-length encoding (TIFF 6.0, section 9)
///
/// Control byte n followed by data:
/// - 0 <= n <= 127: n + 1 literal bytes follow
/// - -127 <= n <= -1: the next byte is repeated 1 - n times
///
/// Runs of three or more identical bytes are replicated; anything shorter is
/// folded into the surrounding literal run. Each row is encoded separately,
/// as readers expect.
class PackBitsCompressor {
public:
    /// @param row_bytes Bytes per row; runs never cross a row boundary (0 = whole input)
    explicit constexpr PackBitsCompressor(std::size_t row_bytes = 0) noexcept
        : row_bytes_(row_bytes) {}

    [[nodiscard]] static constexpr TiffCompression scheme() noexcept {
        return TiffCompression::PackBits;
    }

    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        if (input.empty()) {
            return Ok(std::size_t{0});
        }

        // Worst case: one control byte per 128 literal bytes, per row
        const std::size_t row_bytes = row_bytes_ == 0 ? input.size() : row_bytes_;
        const std::size_t rows = (input.size() + row_bytes - 1) / row_bytes;
        const std::size_t worst_case = input.size() + rows * ((row_bytes + 127) / 128);
        auto grown = reserve_output(output, offset + worst_case);
        if (!grown) return grown.error();

        std::size_t out_pos = offset;
        for (std::size_t start = 0; start < input.size(); start += row_bytes) {
            std::size_t end = start + row_bytes < input.size() ? start + row_bytes : input.size();
            out_pos = encode_row(output, out_pos, input.subspan(start, end - start));
        }
        return Ok(out_pos - offset);
    }

private:
    static std::size_t repeat_length(std::span<const std::byte> row, std::size_t pos) noexcept {
        std::size_t length = 1;
        while (pos + length < row.size() && length < 128 && row[pos + length] == row[pos]) {
            ++length;
        }
        return length;
    }

    static std::size_t encode_row(
        std::vector<std::byte>& output,
        std::size_t out_pos,
        std::span<const std::byte> row) noexcept {

        std::size_t pos = 0;
        while (pos < row.size()) {
            std::size_t run = repeat_length(row, pos);
            if (run >= 3 || (run == 2 && pos + run == row.size())) {
                output[out_pos++] = static_cast<std::byte>(static_cast<uint8_t>(257 - run));
                output[out_pos++] = row[pos];
                pos += run;
                continue;
            }

            std::size_t literal_start = pos;
            std::size_t literal_length = 0;
            while (pos < row.size() && literal_length < 128) {
                if (repeat_length(row, pos) >= 3) break;
                ++pos;
                ++literal_length;
            }
            output[out_pos++] = static_cast<std::byte>(literal_length - 1);
            std::memcpy(output.data() + out_pos, row.data() + literal_start, literal_length);
            out_pos += literal_length;
        }
        return out_pos;
    }

    std::size_t row_bytes_;
};

static_assert(StripCompressor<NoneCompressor>);
static_assert(StripCompressor<PackBitsCompressor>);

} // namespace regionbridge
