#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include "types/result.hpp"

namespace regionbridge {

/// Sample type of a raster
enum class PixelType : uint8_t {
    UInt8,
    UInt16,
    Float32
};

[[nodiscard]] constexpr std::size_t bytes_per_sample(PixelType type) noexcept {
    switch (type) {
        case PixelType::UInt8: return 1;
        case PixelType::UInt16: return 2;
        case PixelType::Float32: return 4;
    }
    return 0;
}

[[nodiscard]] constexpr std::string_view to_string(PixelType type) noexcept {
    switch (type) {
        case PixelType::UInt8: return "uint8";
        case PixelType::UInt16: return "uint16";
        case PixelType::Float32: return "float32";
    }
    return "unknown";
}

/// Map a C++ sample type to its PixelType
template <typename T>
struct pixel_type_of;

template <> struct pixel_type_of<uint8_t> { static constexpr PixelType value = PixelType::UInt8; };
template <> struct pixel_type_of<uint16_t> { static constexpr PixelType value = PixelType::UInt16; };
template <> struct pixel_type_of<float> { static constexpr PixelType value = PixelType::Float32; };

template <typename T>
inline constexpr PixelType pixel_type_of_v = pixel_type_of<T>::value;

/// @brief Interleaved (chunky) 2D pixel buffer
///
/// Samples are stored row by row, channels interleaved within a pixel, in
/// native byte order. The buffer size is always
/// width * height * channels * bytes_per_sample(pixel_type).
class Raster {
public:
    Raster() = default;

    /// @brief Allocate a zero-filled raster
    /// @retval InvalidArgument Zero width, height or channel count
    /// @retval MemoryError Allocation failed, or the byte size overflows
    [[nodiscard]] static Result<Raster> create(
        uint32_t width,
        uint32_t height,
        uint16_t channels,
        PixelType pixel_type) noexcept {

        if (width == 0 || height == 0 || channels == 0) {
            return Err(Error::Code::InvalidArgument, "Raster dimensions must be positive");
        }
        const std::size_t limit = std::vector<std::byte>().max_size();
        const std::size_t pixel_bytes = static_cast<std::size_t>(channels) * bytes_per_sample(pixel_type);
        if (static_cast<std::size_t>(width) > limit / pixel_bytes ||
            static_cast<std::size_t>(height) > limit / (static_cast<std::size_t>(width) * pixel_bytes)) {
            return Err(Error::Code::MemoryError, "Raster byte size exceeds the addressable limit");
        }
        try {
            Raster raster;
            raster.width_ = width;
            raster.height_ = height;
            raster.channels_ = channels;
            raster.pixel_type_ = pixel_type;
            raster.data_.resize(static_cast<std::size_t>(width) * height * channels * bytes_per_sample(pixel_type));
            return Ok(std::move(raster));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate raster");
        }
    }

    /// @brief Build a raster from typed samples
    /// @retval OutOfBounds samples.size() does not match the dimensions
    template <typename T>
    [[nodiscard]] static Result<Raster> from_samples(
        uint32_t width,
        uint32_t height,
        uint16_t channels,
        std::span<const T> samples) noexcept {

        auto raster = create(width, height, channels, pixel_type_of_v<T>);
        if (!raster) return raster;
        if (samples.size() != raster.value().sample_count()) {
            return Err(Error::Code::OutOfBounds, "Sample count does not match raster dimensions");
        }
        std::memcpy(raster.value().data_.data(), samples.data(), samples.size_bytes());
        return raster;
    }

    [[nodiscard]] uint32_t width() const noexcept { return width_; }
    [[nodiscard]] uint32_t height() const noexcept { return height_; }
    [[nodiscard]] uint16_t channels() const noexcept { return channels_; }
    [[nodiscard]] PixelType pixel_type() const noexcept { return pixel_type_; }

    [[nodiscard]] std::size_t sample_count() const noexcept {
        return static_cast<std::size_t>(width_) * height_ * channels_;
    }

    [[nodiscard]] std::size_t pixel_stride() const noexcept {
        return channels_ * bytes_per_sample(pixel_type_);
    }

    [[nodiscard]] std::size_t row_stride() const noexcept {
        return width_ * pixel_stride();
    }

    [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return data_; }
    [[nodiscard]] std::span<std::byte> bytes() noexcept { return data_; }

    /// @brief Typed view of the samples
    /// @pre T matches pixel_type()
    template <typename T>
    [[nodiscard]] std::span<const T> samples() const noexcept {
        return {reinterpret_cast<const T*>(data_.data()), sample_count()};
    }

    template <typename T>
    [[nodiscard]] std::span<T> samples() noexcept {
        return {reinterpret_cast<T*>(data_.data()), sample_count()};
    }

    /// @brief Copy one channel into a new single-channel raster
    /// @retval OutOfBounds channel >= channels()
    [[nodiscard]] Result<Raster> extract_channel(uint16_t channel) const noexcept {
        if (channel >= channels_) {
            return Err(Error::Code::OutOfBounds, "Channel index out of range");
        }
        auto result = create(width_, height_, 1, pixel_type_);
        if (!result) return result;

        const std::size_t sample_size = bytes_per_sample(pixel_type_);
        const std::size_t stride = pixel_stride();
        std::byte* dst = result.value().data_.data();
        const std::byte* src = data_.data() + channel * sample_size;
        const std::size_t pixels = static_cast<std::size_t>(width_) * height_;
        for (std::size_t i = 0; i < pixels; ++i) {
            std::memcpy(dst + i * sample_size, src + i * stride, sample_size);
        }
        return result;
    }

    bool operator==(const Raster&) const = default;

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    uint16_t channels_ = 0;
    PixelType pixel_type_ = PixelType::UInt8;
    std::vector<std::byte> data_;
};

} // namespace regionbridge
