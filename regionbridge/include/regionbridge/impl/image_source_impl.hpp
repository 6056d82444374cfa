// Do not include this file directly. Include "image_source.hpp" instead.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <new>
#include <string>

#ifndef REGIONBRIDGE_IMAGE_SOURCE_HEADER
#include "../image_source.hpp" // for linters
#endif

namespace regionbridge {

inline Result<InMemoryImageSource> InMemoryImageSource::create(
    ImageMetadata metadata,
    std::vector<Raster> planes) noexcept {

    if (metadata.width == 0 || metadata.height == 0 || metadata.channels == 0 ||
        metadata.size_z == 0 || metadata.size_time == 0) {
        return Err(Error::Code::InvalidArgument, "Image dimensions must be positive");
    }
    if (metadata.rgb && (metadata.channels != 3 || metadata.pixel_type != PixelType::UInt8)) {
        return Err(Error::Code::InvalidArgument, "RGB images must have three 8-bit channels");
    }

    const std::size_t expected = static_cast<std::size_t>(metadata.size_z) * metadata.size_time;
    if (planes.size() != expected) {
        return Err(Error::Code::InvalidArgument,
                   "Expected " + std::to_string(expected) + " planes, got " + std::to_string(planes.size()));
    }
    for (const auto& plane : planes) {
        if (plane.width() != metadata.width || plane.height() != metadata.height ||
            plane.channels() != metadata.channels || plane.pixel_type() != metadata.pixel_type) {
            return Err(Error::Code::InvalidArgument, "Plane raster does not match the image metadata");
        }
    }
    return Ok(InMemoryImageSource{std::move(metadata), std::move(planes)});
}

inline Result<Raster> InMemoryImageSource::read_pixels(
    const Plane& plane,
    double downsample,
    int32_t x,
    int32_t y,
    int32_t width,
    int32_t height) const noexcept {

    if (!(downsample > 0.0) || !std::isfinite(downsample)) {
        return Err(Error::Code::InvalidArgument, "Downsample must be a positive number");
    }
    if (width <= 0 || height <= 0) {
        return Err(Error::Code::InvalidArgument, "Region must have a positive area");
    }
    if (x < 0 || y < 0) {
        return Err(Error::Code::InvalidArgument, "Region origin must not be negative");
    }
    if (plane.z() < 0 || static_cast<uint32_t>(plane.z()) >= metadata_.size_z ||
        plane.t() < 0 || static_cast<uint32_t>(plane.t()) >= metadata_.size_time) {
        return Err(Error::Code::OutOfBounds, "Plane z/t outside the image");
    }
    if (plane.has_channel() && static_cast<uint32_t>(plane.c()) >= metadata_.channels) {
        return Err(Error::Code::OutOfBounds, "Channel outside the image");
    }
    if (static_cast<uint32_t>(x) >= metadata_.width || static_cast<uint32_t>(y) >= metadata_.height) {
        return Err(Error::Code::OutOfBounds, "Region does not intersect the image");
    }

    // Clamp to the image
    const auto x1 = std::min<int64_t>(static_cast<int64_t>(x) + width, metadata_.width);
    const auto y1 = std::min<int64_t>(static_cast<int64_t>(y) + height, metadata_.height);
    const auto region_w = static_cast<double>(x1 - x);
    const auto region_h = static_cast<double>(y1 - y);

    // Range check in double before narrowing to uint32_t
    constexpr double max_extent = std::numeric_limits<uint32_t>::max();
    const double scaled_w = std::round(region_w / downsample);
    const double scaled_h = std::round(region_h / downsample);
    if (scaled_w > max_extent || scaled_h > max_extent) {
        return Err(Error::Code::InvalidArgument,
                   "Downsampled region exceeds 32-bit raster dimensions");
    }
    const auto out_w = static_cast<uint32_t>(std::max(1.0, scaled_w));
    const auto out_h = static_cast<uint32_t>(std::max(1.0, scaled_h));

    const Raster& source = planes_[static_cast<std::size_t>(plane.z()) +
                                   static_cast<std::size_t>(plane.t()) * metadata_.size_z];
    const uint16_t out_channels = plane.has_channel() ? uint16_t{1} : metadata_.channels;

    auto result = Raster::create(out_w, out_h, out_channels, metadata_.pixel_type);
    if (!result) return result;
    Raster& output = result.value();

    const std::size_t sample_size = bytes_per_sample(metadata_.pixel_type);
    const std::size_t copy_size = out_channels * sample_size;
    const std::size_t channel_offset = plane.has_channel() ? static_cast<std::size_t>(plane.c()) * sample_size : 0;
    const std::byte* src = source.bytes().data();
    std::byte* dst = output.bytes().data();

    for (uint32_t oy = 0; oy < out_h; ++oy) {
        auto sy = static_cast<int64_t>(y + std::floor((oy + 0.5) * region_h / out_h));
        sy = std::clamp<int64_t>(sy, y, y1 - 1);
        for (uint32_t ox = 0; ox < out_w; ++ox) {
            auto sx = static_cast<int64_t>(x + std::floor((ox + 0.5) * region_w / out_w));
            sx = std::clamp<int64_t>(sx, x, x1 - 1);
            const std::size_t src_offset =
                static_cast<std::size_t>(sy) * source.row_stride() +
                static_cast<std::size_t>(sx) * source.pixel_stride() + channel_offset;
            std::memcpy(dst, src + src_offset, copy_size);
            dst += copy_size;
        }
    }
    return result;
}

} // namespace regionbridge
