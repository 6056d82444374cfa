#pragma once

#include <cstdint>

namespace regionbridge {

/// @brief Coordinate of one 2-D slice along the channel, depth and time axes
/// @note c == -1 means "no specific channel" (all channels)
/// @note Immutable value type, component-wise equality
class Plane {
public:
    static constexpr int32_t kAllChannels = -1;

    constexpr Plane() noexcept = default;

    constexpr Plane(int32_t c, int32_t z, int32_t t) noexcept
        : c_(c), z_(z), t_(t) {}

    /// @brief The default plane (-1, 0, 0)
    [[nodiscard]] static constexpr Plane default_plane() noexcept {
        return Plane{};
    }

    /// @brief Plane at (z, t) without a specific channel
    [[nodiscard]] static constexpr Plane at(int32_t z, int32_t t) noexcept {
        return Plane{kAllChannels, z, t};
    }

    [[nodiscard]] constexpr int32_t c() const noexcept { return c_; }
    [[nodiscard]] constexpr int32_t z() const noexcept { return z_; }
    [[nodiscard]] constexpr int32_t t() const noexcept { return t_; }

    [[nodiscard]] constexpr bool has_channel() const noexcept {
        return c_ != kAllChannels;
    }

    constexpr bool operator==(const Plane&) const noexcept = default;

private:
    int32_t c_ = kAllChannels;
    int32_t z_ = 0;
    int32_t t_ = 0;
};

} // namespace regionbridge
