#pragma once

/**
 * @file region_exporter.hpp
 * @brief Rasterize a rectangle of an image source and encode it as bytes
 *
 * Single-plane formats (png, jpg/jpeg, tif/tiff) read the request's (z, t)
 * plane with every channel and hand the raster to libpng, libjpeg or the
 * TIFF writer. The ImageJ hyperstack format ("imagej tif", "imagej tiff")
 * reads every (z, t) plane of the rectangle and writes one page per channel,
 * z and t in ImageJ order:
 *
 *     page = c + z * C + t * C * Z
 *
 * so channels vary fastest. RGB sources count as a single channel and store
 * one colour page per (z, t).
 *
 * @note Pixel reads run on the calling thread; callers exporting many regions
 *       parallelize at the call site
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "compressors/compressor_base.hpp"
#include "export_format.hpp"
#include "image_source.hpp"
#include "region_request.hpp"
#include "types/result.hpp"

namespace regionbridge {

/// @brief Codec parameters for exports
struct ExportOptions {
    TiffCompression tiff_compression = TiffCompression::None;
    int jpeg_quality = 90;            ///< 1..100
    int png_compression_level = 6;    ///< 0..9
};

/// @brief Encoded payload of one export call, owned by the caller
struct EncodedImage {
    std::vector<std::byte> bytes;
    ExportFormat format = ExportFormat::Png;
    std::size_t planes = 1;   ///< Number of planes (TIFF pages) packaged
};

/// @brief Export a rectangle of an image source
/// @param source Image to read
/// @param request Rectangle, downsample and plane
/// @param format Format name, see parse_export_format()
/// @param options Codec parameters
/// @return Result<EncodedImage>
/// @retval UnsupportedFormat Unknown format name
/// @retval IOError / OutOfBounds / InvalidArgument Propagated from the source read
/// @retval EncodeError The codec cannot represent the raster
/// @retval OutOfBounds A TIFF payload would exceed 4 GiB
template <PixelSource Source>
[[nodiscard]] Result<EncodedImage> export_region(
    const Source& source,
    const PixelRegionRequest& request,
    std::string_view format,
    const ExportOptions& options = {}) noexcept;

/// @brief Export the full extent of the default plane
/// @retval InvalidArgument downsample <= 0
template <PixelSource Source>
[[nodiscard]] Result<EncodedImage> export_region(
    const Source& source,
    double downsample,
    std::string_view format,
    const ExportOptions& options = {}) noexcept;

/// @brief Export with an already resolved format
template <PixelSource Source>
[[nodiscard]] Result<EncodedImage> export_region(
    const Source& source,
    const PixelRegionRequest& request,
    ExportFormat format,
    const ExportOptions& options = {}) noexcept;

/// @brief export_region() followed by Base64 encoding
template <PixelSource Source>
[[nodiscard]] Result<std::string> export_region_base64(
    const Source& source,
    const PixelRegionRequest& request,
    std::string_view format,
    const ExportOptions& options = {}) noexcept;

template <PixelSource Source>
[[nodiscard]] Result<std::string> export_region_base64(
    const Source& source,
    double downsample,
    std::string_view format,
    const ExportOptions& options = {}) noexcept;

/// @brief Export every c/z/t plane of the rectangle as an ImageJ hyperstack
template <PixelSource Source>
[[nodiscard]] Result<EncodedImage> export_tiff_stack(
    const Source& source,
    const PixelRegionRequest& request,
    const ExportOptions& options = {}) noexcept;

/// @brief Hyperstack of the full image extent
template <PixelSource Source>
[[nodiscard]] Result<EncodedImage> export_tiff_stack(
    const Source& source,
    double downsample,
    const ExportOptions& options = {}) noexcept;

template <PixelSource Source>
[[nodiscard]] Result<std::string> export_tiff_stack_base64(
    const Source& source,
    const PixelRegionRequest& request,
    const ExportOptions& options = {}) noexcept;

template <PixelSource Source>
[[nodiscard]] Result<std::string> export_tiff_stack_base64(
    const Source& source,
    double downsample,
    const ExportOptions& options = {}) noexcept;

/// @brief Request covering the whole image at the default plane
/// @retval InvalidArgument downsample <= 0, or the image is too large for
///         32-bit request coordinates
[[nodiscard]] Result<PixelRegionRequest> full_extent_request(
    const ImageMetadata& metadata,
    double downsample);

} // namespace regionbridge

#define REGIONBRIDGE_REGION_EXPORTER_HEADER
#include "impl/region_exporter_impl.hpp"
