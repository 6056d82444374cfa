#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>
#include <nlohmann/json.hpp>
#include "types/plane.hpp"
#include "types/result.hpp"

namespace regionbridge {

/// @brief Encode a plane as {"c": int, "z": int, "t": int}
[[nodiscard]] inline nlohmann::json encode_plane(const Plane& plane) {
    return nlohmann::json{
        {"c", plane.c()},
        {"z", plane.z()},
        {"t", plane.t()}
    };
}

namespace detail {
    /// Read one plane coordinate; absent or null members keep the fallback.
    /// Integral numbers and strings holding a whole int32 are accepted.
    [[nodiscard]] inline Result<int32_t> read_plane_member(
        const nlohmann::json& object,
        const char* key,
        int32_t fallback) noexcept {

        auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            return Ok(fallback);
        }
        if (it->is_number_integer()) {
            auto value = it->get<int64_t>();
            if (value < std::numeric_limits<int32_t>::min() ||
                value > std::numeric_limits<int32_t>::max()) {
                return Err(Error::Code::DecodeError,
                           std::string("Plane member '") + key + "' out of range");
            }
            return Ok(static_cast<int32_t>(value));
        }
        if (it->is_number_float()) {
            double value = it->get<double>();
            if (std::isfinite(value) && value == std::trunc(value) &&
                value >= std::numeric_limits<int32_t>::min() &&
                value <= std::numeric_limits<int32_t>::max()) {
                return Ok(static_cast<int32_t>(value));
            }
        }
        if (it->is_string()) {
            // Quoted integers, as lenient JSON readers accept them
            const auto& text = it->get_ref<const std::string&>();
            int32_t value = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc{} && end == text.data() + text.size() && !text.empty()) {
                return Ok(value);
            }
        }
        return Err(Error::Code::DecodeError,
                   std::string("Plane member '") + key + "' is not an integer");
    }
} // namespace detail

/// @brief Decode a plane from its compact representation
/// @param json Either the bare {"c","z","t"} object or an object wrapping it
///             under a "plane" member
/// @return Result<Plane>
/// @retval DecodeError json is not an object, or a coordinate is not an integer
/// @note Missing members take the default plane's value, so {"z": 3} is (-1, 3, 0)
/// @note Unknown members are ignored
[[nodiscard]] inline Result<Plane> decode_plane(const nlohmann::json& json) noexcept {
    if (json.is_null()) {
        return Ok(Plane::default_plane());
    }
    if (!json.is_object()) {
        return Err(Error::Code::DecodeError, "Plane must be a JSON object");
    }

    auto wrapped = json.find("plane");
    if (wrapped != json.end() && wrapped->is_object()) {
        return decode_plane(*wrapped);
    }

    const Plane fallback = Plane::default_plane();
    auto c = detail::read_plane_member(json, "c", fallback.c());
    if (!c) return c.error();
    auto z = detail::read_plane_member(json, "z", fallback.z());
    if (!z) return z.error();
    auto t = detail::read_plane_member(json, "t", fallback.t());
    if (!t) return t.error();

    return Ok(Plane{c.value(), z.value(), t.value()});
}

} // namespace regionbridge
