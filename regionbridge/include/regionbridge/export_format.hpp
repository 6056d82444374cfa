#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include "types/result.hpp"

namespace regionbridge {

/// Encodings produced by the region exporter
enum class ExportFormat : uint8_t {
    Png,
    Jpeg,
    Tiff,        ///< Single-page TIFF of one plane
    ImageJTiff   ///< Multi-page ImageJ hyperstack of every c/z/t plane
};

[[nodiscard]] constexpr std::string_view to_string(ExportFormat format) noexcept {
    switch (format) {
        case ExportFormat::Png: return "png";
        case ExportFormat::Jpeg: return "jpeg";
        case ExportFormat::Tiff: return "tiff";
        case ExportFormat::ImageJTiff: return "imagej tiff";
    }
    return "unknown";
}

/// @brief True for formats that package several planes in one payload
[[nodiscard]] constexpr bool is_multi_plane(ExportFormat format) noexcept {
    return format == ExportFormat::ImageJTiff;
}

/// @brief Resolve a caller-supplied format name
/// @param name One of "png", "jpg", "jpeg", "tif", "tiff", "imagej tif",
///             "imagej tiff"; matching is case-insensitive
/// @retval UnsupportedFormat Any other name
[[nodiscard]] inline Result<ExportFormat> parse_export_format(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "png") return Ok(ExportFormat::Png);
    if (lower == "jpg" || lower == "jpeg") return Ok(ExportFormat::Jpeg);
    if (lower == "tif" || lower == "tiff") return Ok(ExportFormat::Tiff);
    if (lower == "imagej tif" || lower == "imagej tiff") return Ok(ExportFormat::ImageJTiff);

    return Err(Error::Code::UnsupportedFormat, "Unsupported export format '" + std::string(name) + "'");
}

} // namespace regionbridge
