#pragma once

#include <bit>
#include <csetjmp>
#include <cstddef>
#include <cstring>
#include <new>
#include <string>
#include <vector>
#include <png.h>
#include "../raster.hpp"
#include "../types/result.hpp"

namespace regionbridge {

namespace png_detail {

    struct WriteState {
        std::vector<std::byte>* output = nullptr;
        bool out_of_memory = false;
        char message[256] = {};
    };

    inline void write_callback(png_structp png, png_bytep data, png_size_t length) {
        auto* state = static_cast<WriteState*>(png_get_io_ptr(png));
        try {
            auto* first = reinterpret_cast<const std::byte*>(data);
            state->output->insert(state->output->end(), first, first + length);
        } catch (const std::bad_alloc&) {
            state->out_of_memory = true;
        }
        // Leave the handler before jumping out of libpng
        if (state->out_of_memory) {
            png_error(png, "out of memory");
        }
    }

    inline void flush_callback(png_structp) {}

    inline void error_callback(png_structp png, png_const_charp message) {
        auto* state = static_cast<WriteState*>(png_get_error_ptr(png));
        std::strncpy(state->message, message, sizeof(state->message) - 1);
        png_longjmp(png, 1);
    }

    inline void warning_callback(png_structp, png_const_charp) {}

    [[nodiscard]] inline int color_type(uint16_t channels) noexcept {
        switch (channels) {
            case 1: return PNG_COLOR_TYPE_GRAY;
            case 3: return PNG_COLOR_TYPE_RGB;
            default: return PNG_COLOR_TYPE_RGB_ALPHA;
        }
    }

    /// Everything between setjmp and the last libpng call; no C++ objects
    /// with destructors live in this frame
    [[nodiscard]] inline bool write_image(
        png_structp png,
        png_infop info,
        const Raster& raster,
        png_bytep* rows,
        int compression_level) {

        if (setjmp(png_jmpbuf(png))) {
            return false;
        }
        png_set_compression_level(png, compression_level);
        png_set_IHDR(png, info, raster.width(), raster.height(),
                     static_cast<int>(8 * bytes_per_sample(raster.pixel_type())),
                     color_type(raster.channels()),
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
        png_write_info(png, info);
        if (raster.pixel_type() == PixelType::UInt16 && std::endian::native == std::endian::little) {
            png_set_swap(png);   // PNG stores 16-bit samples big-endian
        }
        png_write_image(png, rows);
        png_write_end(png, nullptr);
        return true;
    }

} // namespace png_detail

/// @brief Encode a raster as PNG with libpng
/// @param raster 8- or 16-bit raster with 1 (gray), 3 (RGB) or 4 (RGBA)
///        channels
/// @note Two-channel rasters are rejected rather than stored as gray + alpha,
///       which would turn the second channel into transparency
/// @param compression_level zlib level, 0 (none) to 9 (smallest)
/// @return Result<std::vector<std::byte>> with the PNG file bytes
/// @retval EncodeError Unsupported pixel type or channel count, or libpng failure
/// @retval InvalidArgument compression_level outside 0..9
/// @retval MemoryError Allocation failed
[[nodiscard]] inline Result<std::vector<std::byte>> encode_png(
    const Raster& raster,
    int compression_level = 6) noexcept {

    if (raster.pixel_type() == PixelType::Float32) {
        return Err(Error::Code::EncodeError, "PNG cannot store floating point samples");
    }
    if (raster.channels() != 1 && raster.channels() != 3 && raster.channels() != 4) {
        return Err(Error::Code::EncodeError,
                   "PNG supports 1, 3 or 4 channels, got " + std::to_string(raster.channels()));
    }
    if (compression_level < 0 || compression_level > 9) {
        return Err(Error::Code::InvalidArgument, "PNG compression level must be within 0..9");
    }

    std::vector<std::byte> output;
    std::vector<png_bytep> rows;
    png_detail::WriteState state;
    try {
        output.reserve(raster.bytes().size() / 2 + 1024);
        rows.resize(raster.height());
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while preparing PNG");
    }
    state.output = &output;

    // libpng only reads through the row pointers
    auto* base = const_cast<png_bytep>(reinterpret_cast<const png_byte*>(raster.bytes().data()));
    for (uint32_t y = 0; y < raster.height(); ++y) {
        rows[y] = base + y * raster.row_stride();
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &state,
                                              png_detail::error_callback,
                                              png_detail::warning_callback);
    if (png == nullptr) {
        return Err(Error::Code::MemoryError, "Failed to create PNG write struct");
    }
    png_infop info = png_create_info_struct(png);
    if (info == nullptr) {
        png_destroy_write_struct(&png, nullptr);
        return Err(Error::Code::MemoryError, "Failed to create PNG info struct");
    }
    png_set_write_fn(png, &state, png_detail::write_callback, png_detail::flush_callback);

    const bool ok = png_detail::write_image(png, info, raster, rows.data(), compression_level);
    png_destroy_write_struct(&png, &info);

    if (!ok) {
        if (state.out_of_memory) {
            return Err(Error::Code::MemoryError, "Out of memory while writing PNG");
        }
        return Err(Error::Code::EncodeError, std::string("libpng: ") + state.message);
    }
    return Ok(std::move(output));
}

} // namespace regionbridge
