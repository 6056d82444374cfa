#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include "types/plane.hpp"
#include "types/result.hpp"

namespace regionbridge {

/// @brief Rectangle of one image plane at a given downsample
/// @note Coordinates are level-0 (full resolution) pixels
/// @note Only constructible through create(), which enforces
///       width > 0, height > 0, downsample > 0 and x, y >= 0
class PixelRegionRequest {
public:
    /// @brief Validate and build a request
    /// @retval InvalidArgument Empty rectangle, negative origin or non-positive downsample
    [[nodiscard]] static Result<PixelRegionRequest> create(
        std::string image_id,
        double downsample,
        int32_t x,
        int32_t y,
        int32_t width,
        int32_t height,
        int32_t z = 0,
        int32_t t = 0) {

        if (!(downsample > 0.0) || !std::isfinite(downsample)) {
            return Err(Error::Code::InvalidArgument,
                       "Downsample must be positive, got " + std::to_string(downsample));
        }
        if (width <= 0 || height <= 0) {
            return Err(Error::Code::InvalidArgument,
                       "Region must have a positive area, got " +
                       std::to_string(width) + "x" + std::to_string(height));
        }
        if (x < 0 || y < 0) {
            return Err(Error::Code::InvalidArgument, "Region origin must not be negative");
        }
        if (z < 0 || t < 0) {
            return Err(Error::Code::InvalidArgument, "Plane z/t must not be negative");
        }
        return Ok(PixelRegionRequest{std::move(image_id), downsample, x, y, width, height, z, t});
    }

    [[nodiscard]] const std::string& image_id() const noexcept { return image_id_; }
    [[nodiscard]] double downsample() const noexcept { return downsample_; }
    [[nodiscard]] int32_t x() const noexcept { return x_; }
    [[nodiscard]] int32_t y() const noexcept { return y_; }
    [[nodiscard]] int32_t width() const noexcept { return width_; }
    [[nodiscard]] int32_t height() const noexcept { return height_; }
    [[nodiscard]] int32_t z() const noexcept { return z_; }
    [[nodiscard]] int32_t t() const noexcept { return t_; }

    /// Plane read for single-plane exports: every channel at (z, t)
    [[nodiscard]] Plane plane() const noexcept { return Plane::at(z_, t_); }

    bool operator==(const PixelRegionRequest&) const = default;

private:
    PixelRegionRequest(std::string image_id, double downsample,
                       int32_t x, int32_t y, int32_t width, int32_t height,
                       int32_t z, int32_t t)
        : image_id_(std::move(image_id)), downsample_(downsample),
          x_(x), y_(y), width_(width), height_(height), z_(z), t_(t) {}

    std::string image_id_;
    double downsample_;
    int32_t x_;
    int32_t y_;
    int32_t width_;
    int32_t height_;
    int32_t z_;
    int32_t t_;
};

} // namespace regionbridge
