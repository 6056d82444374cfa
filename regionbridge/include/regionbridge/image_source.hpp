#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "raster.hpp"
#include "types/plane.hpp"
#include "types/result.hpp"

namespace regionbridge {

/// @brief Static description of a multi-dimensional image
struct ImageMetadata {
    std::string id;
    uint32_t width = 0;
    uint32_t height = 0;
    uint16_t channels = 1;
    uint32_t size_z = 1;
    uint32_t size_time = 1;
    PixelType pixel_type = PixelType::UInt8;
    bool rgb = false;   ///< Packed 8-bit RGB: one colour page per (z, t) in stacks
};

/// @brief Concept for an image that can be read region by region
///
/// read_pixels() returns an interleaved raster of the requested rectangle
/// (level-0 coordinates) of one plane, downsampled by the given factor.
/// A plane with c == Plane::kAllChannels returns every channel, otherwise the
/// single named channel.
///
/// Errors are reported through Result:
/// - IOError: backing storage could not be read
/// - OutOfBounds: plane or rectangle outside the image
/// - InvalidArgument: non-positive downsample or empty rectangle
template <typename T>
concept PixelSource = requires(const T& source, const Plane& plane, double downsample, int32_t coord) {
    { source.metadata() } -> std::same_as<const ImageMetadata&>;
    { source.read_pixels(plane, downsample, coord, coord, coord, coord) } -> std::same_as<Result<Raster>>;
};

/// @brief Image held fully in memory, one full-resolution raster per (z, t)
///
/// @note Requests extending past the image are clamped to it; a request with
///       no overlap fails with OutOfBounds
/// @note Downsampling picks the nearest source pixel
/// @note Thread-safe for concurrent reads
class InMemoryImageSource {
public:
    /// @brief Build a source from its planes
    /// @param metadata Image description (dimensions must match the planes)
    /// @param planes One raster per (z, t), index z + t * size_z, each with
    ///        metadata.channels channels
    /// @retval InvalidArgument Plane count or raster shape does not match
    [[nodiscard]] static Result<InMemoryImageSource> create(
        ImageMetadata metadata,
        std::vector<Raster> planes) noexcept;

    [[nodiscard]] const ImageMetadata& metadata() const noexcept {
        return metadata_;
    }

    [[nodiscard]] Result<Raster> read_pixels(
        const Plane& plane,
        double downsample,
        int32_t x,
        int32_t y,
        int32_t width,
        int32_t height) const noexcept;

private:
    InMemoryImageSource(ImageMetadata metadata, std::vector<Raster> planes)
        : metadata_(std::move(metadata)), planes_(std::move(planes)) {}

    ImageMetadata metadata_;
    std::vector<Raster> planes_;
};

static_assert(PixelSource<InMemoryImageSource>, "InMemoryImageSource must satisfy PixelSource");

} // namespace regionbridge

#define REGIONBRIDGE_IMAGE_SOURCE_HEADER
#include "impl/image_source_impl.hpp"
