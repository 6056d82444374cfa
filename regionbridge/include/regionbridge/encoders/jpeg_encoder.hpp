#pragma once

#include <csetjmp>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <new>
#include <string>
#include <vector>
#include <jpeglib.h>
#include "../raster.hpp"
#include "../types/result.hpp"

namespace regionbridge {

namespace jpeg_detail {

    /// libjpeg error manager that jumps back instead of calling exit()
    struct ErrorManager {
        jpeg_error_mgr base;
        std::jmp_buf jump;
        char message[JMSG_LENGTH_MAX];
    };

    inline void error_exit(j_common_ptr info) {
        auto* manager = reinterpret_cast<ErrorManager*>(info->err);
        (*info->err->format_message)(info, manager->message);
        std::longjmp(manager->jump, 1);
    }

    inline void output_message(j_common_ptr) {}

    /// Everything between setjmp and jpeg_finish_compress; no C++ objects
    /// with destructors live in this frame
    [[nodiscard]] inline bool compress(
        jpeg_compress_struct& cinfo,
        ErrorManager& errors,
        const Raster& raster,
        int quality,
        unsigned char** buffer,
        unsigned long* size) {

        if (setjmp(errors.jump)) {
            return false;
        }
        jpeg_create_compress(&cinfo);
        jpeg_mem_dest(&cinfo, buffer, size);

        cinfo.image_width = raster.width();
        cinfo.image_height = raster.height();
        cinfo.input_components = raster.channels();
        cinfo.in_color_space = raster.channels() == 3 ? JCS_RGB : JCS_GRAYSCALE;
        jpeg_set_defaults(&cinfo);
        jpeg_set_quality(&cinfo, quality, TRUE);

        jpeg_start_compress(&cinfo, TRUE);
        auto* base = const_cast<JSAMPLE*>(reinterpret_cast<const JSAMPLE*>(raster.bytes().data()));
        while (cinfo.next_scanline < cinfo.image_height) {
            JSAMPROW row = base + static_cast<std::size_t>(cinfo.next_scanline) * raster.row_stride();
            jpeg_write_scanlines(&cinfo, &row, 1);
        }
        jpeg_finish_compress(&cinfo);
        return true;
    }

} // namespace jpeg_detail

/// @brief Encode a raster as baseline JPEG with libjpeg
/// @param raster 8-bit raster with 1 (gray) or 3 (RGB) channels
/// @param quality Quality factor, 1 to 100
/// @return Result<std::vector<std::byte>> with the JFIF file bytes
/// @retval EncodeError Unsupported pixel type or channel count, or libjpeg failure
/// @retval InvalidArgument quality outside 1..100
[[nodiscard]] inline Result<std::vector<std::byte>> encode_jpeg(
    const Raster& raster,
    int quality = 90) noexcept {

    if (raster.pixel_type() != PixelType::UInt8) {
        return Err(Error::Code::EncodeError,
                   "JPEG needs 8-bit samples, got " + std::string(to_string(raster.pixel_type())));
    }
    if (raster.channels() != 1 && raster.channels() != 3) {
        return Err(Error::Code::EncodeError,
                   "JPEG supports 1 or 3 channels, got " + std::to_string(raster.channels()));
    }
    if (quality < 1 || quality > 100) {
        return Err(Error::Code::InvalidArgument, "JPEG quality must be within 1..100");
    }

    jpeg_compress_struct cinfo{};
    jpeg_detail::ErrorManager errors{};
    cinfo.err = jpeg_std_error(&errors.base);
    errors.base.error_exit = jpeg_detail::error_exit;
    errors.base.output_message = jpeg_detail::output_message;

    unsigned char* buffer = nullptr;
    unsigned long size = 0;

    const bool ok = jpeg_detail::compress(cinfo, errors, raster, quality, &buffer, &size);
    jpeg_destroy_compress(&cinfo);

    if (!ok) {
        std::free(buffer);
        return Err(Error::Code::EncodeError, std::string("libjpeg: ") + errors.message);
    }

    try {
        auto* first = reinterpret_cast<const std::byte*>(buffer);
        std::vector<std::byte> output(first, first + size);
        std::free(buffer);
        return Ok(std::move(output));
    } catch (const std::bad_alloc&) {
        std::free(buffer);
        return Err(Error::Code::MemoryError, "Out of memory while copying JPEG data");
    }
}

} // namespace regionbridge
