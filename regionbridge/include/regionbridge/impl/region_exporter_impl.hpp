// Do not include this file directly. Include "region_exporter.hpp" instead.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <new>
#include <tuple>
#include <utility>
#include "../base64.hpp"
#include "../encoders/jpeg_encoder.hpp"
#include "../encoders/png_encoder.hpp"
#include "../logging.hpp"
#include "../tiff_stack_writer.hpp"

#ifndef REGIONBRIDGE_REGION_EXPORTER_HEADER
#include "../region_exporter.hpp" // for linters
#endif

namespace regionbridge {

namespace export_detail {

    template <typename T>
    inline void accumulate_range(std::span<const T> samples, double& lo, double& hi) noexcept {
        for (T value : samples) {
            const auto v = static_cast<double>(value);
            if (std::isnan(v)) continue;
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }

    /// Display range over all pages, as ImageJ stores it in the description
    inline std::pair<double, double> display_range(const std::vector<Raster>& pages) noexcept {
        double lo = std::numeric_limits<double>::infinity();
        double hi = -std::numeric_limits<double>::infinity();
        for (const auto& page : pages) {
            switch (page.pixel_type()) {
                case PixelType::UInt8: accumulate_range(page.samples<uint8_t>(), lo, hi); break;
                case PixelType::UInt16: accumulate_range(page.samples<uint16_t>(), lo, hi); break;
                case PixelType::Float32: accumulate_range(page.samples<float>(), lo, hi); break;
            }
        }
        if (lo > hi) return {0.0, 0.0};
        return {lo, hi};
    }

    [[nodiscard]] inline Result<std::vector<std::byte>> encode_single_tiff(
        const Raster& raster,
        bool rgb,
        const ExportOptions& options) noexcept {

        TiffStackWriter writer({.compression = options.tiff_compression});
        auto page = writer.add_page(raster, {}, rgb);
        if (!page) return page.error();
        return writer.finish();
    }

    template <PixelSource Source>
    [[nodiscard]] Result<EncodedImage> export_single_plane(
        const Source& source,
        const PixelRegionRequest& request,
        ExportFormat format,
        const ExportOptions& options) noexcept {

        auto raster = source.read_pixels(request.plane(), request.downsample(),
                                         request.x(), request.y(), request.width(), request.height());
        if (!raster) return raster.error();

        Result<std::vector<std::byte>> bytes = Err(Error::Code::UnsupportedFormat, "Unhandled format");
        switch (format) {
            case ExportFormat::Png:
                bytes = encode_png(raster.value(), options.png_compression_level);
                break;
            case ExportFormat::Jpeg:
                bytes = encode_jpeg(raster.value(), options.jpeg_quality);
                break;
            case ExportFormat::Tiff:
                bytes = encode_single_tiff(raster.value(), source.metadata().rgb, options);
                break;
            case ExportFormat::ImageJTiff:
                break;
        }
        if (!bytes) return bytes.error();
        return Ok(EncodedImage{std::move(bytes).value(), format, 1});
    }

    template <PixelSource Source>
    [[nodiscard]] Result<EncodedImage> export_hyperstack(
        const Source& source,
        const PixelRegionRequest& request,
        const ExportOptions& options) noexcept {

        const ImageMetadata& metadata = source.metadata();
        const bool rgb = metadata.rgb;
        const uint32_t size_c = rgb ? 1u : metadata.channels;
        const uint32_t size_z = metadata.size_z;
        const uint32_t size_t_ = metadata.size_time;

        try {
            std::vector<Raster> pages;
            pages.reserve(static_cast<std::size_t>(size_c) * size_z * size_t_);

            // page = c + z * C + t * C * Z
            for (uint32_t t = 0; t < size_t_; ++t) {
                for (uint32_t z = 0; z < size_z; ++z) {
                    auto plane = source.read_pixels(
                        Plane::at(static_cast<int32_t>(z), static_cast<int32_t>(t)),
                        request.downsample(), request.x(), request.y(), request.width(), request.height());
                    if (!plane) return plane.error();

                    if (rgb || size_c == 1) {
                        pages.push_back(std::move(plane).value());
                        continue;
                    }
                    for (uint32_t c = 0; c < size_c; ++c) {
                        auto channel = plane.value().extract_channel(static_cast<uint16_t>(c));
                        if (!channel) return channel.error();
                        pages.push_back(std::move(channel).value());
                    }
                }
            }

            ImageJDescription description{
                .channels = size_c,
                .slices = size_z,
                .frames = size_t_,
                .rgb = rgb};
            if (rgb) {
                description.max = 255.0;
            } else {
                std::tie(description.min, description.max) = display_range(pages);
            }
            const std::string header = description.to_string();

            TiffStackWriter writer({.compression = options.tiff_compression});
            for (std::size_t i = 0; i < pages.size(); ++i) {
                auto written = writer.add_page(pages[i], i == 0 ? std::string_view(header) : std::string_view{}, rgb);
                if (!written) return written.error();
            }

            auto bytes = writer.finish();
            if (!bytes) return bytes.error();
            return Ok(EncodedImage{std::move(bytes).value(), ExportFormat::ImageJTiff, pages.size()});
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Out of memory while assembling hyperstack");
        }
    }

    inline Result<std::string> to_base64(Result<EncodedImage> image) noexcept {
        if (!image) return image.error();
        try {
            return Ok(base64_encode(image.value().bytes));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Out of memory while encoding Base64");
        }
    }

} // namespace export_detail

inline Result<PixelRegionRequest> full_extent_request(
    const ImageMetadata& metadata,
    double downsample) {

    constexpr auto max_coord = static_cast<uint32_t>(std::numeric_limits<int32_t>::max());
    if (metadata.width > max_coord || metadata.height > max_coord) {
        return Err(Error::Code::InvalidArgument, "Image too large for a single region request");
    }
    return PixelRegionRequest::create(metadata.id, downsample, 0, 0,
                                      static_cast<int32_t>(metadata.width),
                                      static_cast<int32_t>(metadata.height));
}

template <PixelSource Source>
inline Result<EncodedImage> export_region(
    const Source& source,
    const PixelRegionRequest& request,
    ExportFormat format,
    const ExportOptions& options) noexcept {

    Result<EncodedImage> result = is_multi_plane(format)
        ? export_detail::export_hyperstack(source, request, options)
        : export_detail::export_single_plane(source, request, format, options);

    if (result) {
        logger()->debug("Exported {}x{}+{}+{} of '{}' at downsample {} as {} ({} planes, {} bytes)",
                        request.width(), request.height(), request.x(), request.y(),
                        request.image_id(), request.downsample(), to_string(format),
                        result.value().planes, result.value().bytes.size());
    } else {
        logger()->debug("Export of '{}' as {} failed: {} ({})",
                        request.image_id(), to_string(format),
                        result.error().message, to_string(result.error().code));
    }
    return result;
}

template <PixelSource Source>
inline Result<EncodedImage> export_region(
    const Source& source,
    const PixelRegionRequest& request,
    std::string_view format,
    const ExportOptions& options) noexcept {

    auto parsed = parse_export_format(format);
    if (!parsed) return parsed.error();
    return export_region(source, request, parsed.value(), options);
}

template <PixelSource Source>
inline Result<EncodedImage> export_region(
    const Source& source,
    double downsample,
    std::string_view format,
    const ExportOptions& options) noexcept {

    auto parsed = parse_export_format(format);
    if (!parsed) return parsed.error();
    auto request = full_extent_request(source.metadata(), downsample);
    if (!request) return request.error();
    return export_region(source, request.value(), parsed.value(), options);
}

template <PixelSource Source>
inline Result<std::string> export_region_base64(
    const Source& source,
    const PixelRegionRequest& request,
    std::string_view format,
    const ExportOptions& options) noexcept {
    return export_detail::to_base64(export_region(source, request, format, options));
}

template <PixelSource Source>
inline Result<std::string> export_region_base64(
    const Source& source,
    double downsample,
    std::string_view format,
    const ExportOptions& options) noexcept {
    return export_detail::to_base64(export_region(source, downsample, format, options));
}

template <PixelSource Source>
inline Result<EncodedImage> export_tiff_stack(
    const Source& source,
    const PixelRegionRequest& request,
    const ExportOptions& options) noexcept {
    return export_region(source, request, ExportFormat::ImageJTiff, options);
}

template <PixelSource Source>
inline Result<EncodedImage> export_tiff_stack(
    const Source& source,
    double downsample,
    const ExportOptions& options) noexcept {
    auto request = full_extent_request(source.metadata(), downsample);
    if (!request) return request.error();
    return export_region(source, request.value(), ExportFormat::ImageJTiff, options);
}

template <PixelSource Source>
inline Result<std::string> export_tiff_stack_base64(
    const Source& source,
    const PixelRegionRequest& request,
    const ExportOptions& options) noexcept {
    return export_detail::to_base64(export_tiff_stack(source, request, options));
}

template <PixelSource Source>
inline Result<std::string> export_tiff_stack_base64(
    const Source& source,
    double downsample,
    const ExportOptions& options) noexcept {
    return export_detail::to_base64(export_tiff_stack(source, downsample, options));
}

} // namespace regionbridge
