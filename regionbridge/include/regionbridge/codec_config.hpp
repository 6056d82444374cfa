#pragma once

#include <cstddef>

namespace regionbridge {

/// @brief Collection sizes at which bulk codec stages switch to the worker pool
struct DispatchThresholds {
    std::size_t decode_array = 10;    ///< json_to_objects over a JSON array
    std::size_t chunk_encode = 4;     ///< collection_to_geojson_chunks, per chunk
    std::size_t feature_list = 100;   ///< objects_to_geojson_list, per object
};

/// @brief Immutable configuration passed to every geometry codec call
///
/// - null_tolerant: strip null members before decoding. When false, an
///   explicit null for an optional member is a DecodeError.
/// - plane_adapter: write and read the compact {"c","z","t"} plane member.
///   When false, planes are not serialized and decode to the default plane.
/// - pretty_print: indent emitted text by two spaces.
struct CodecConfig {
    bool null_tolerant = true;
    bool plane_adapter = true;
    bool pretty_print = false;
    DispatchThresholds thresholds{};

    [[nodiscard]] constexpr int indent() const noexcept {
        return pretty_print ? 2 : -1;
    }
};

} // namespace regionbridge
