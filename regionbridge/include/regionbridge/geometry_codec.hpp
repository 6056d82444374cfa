#pragma once

/**
 * @file geometry_codec.hpp
 * @brief Conversion between region objects and the GeoJSON exchange format
 *
 * ## Layout
 *
 * A region object is written as one Feature:
 *
 * @code{.json}
 * {
 *   "type": "Feature",
 *   "id": "5b0c2b5e-...",
 *   "geometry": {"type": "Polygon", "coordinates": [[[0,0],[10,0],[10,10],[0,0]]]},
 *   "properties": {
 *     "objectType": "annotation",
 *     "classification": {"name": "Tumor", "color": [200, 0, 0]},
 *     "measurements": {"Area": 50.0}
 *   },
 *   "plane": {"c": -1, "z": 0, "t": 0}
 * }
 * @endcode
 *
 * Rectangles, ellipses and lines have no GeoJSON type of their own. They are
 * written as Polygon / LineString with an extra "shape" member naming the
 * original kind, so that they decode back to the same shape. Geometries
 * without that member decode to Polygon, Polyline, MultiPolygon or Points.
 *
 * ## Leniency
 *
 * Decoding fails only on malformed JSON syntax and on members of the wrong
 * type. Null members (with CodecConfig::null_tolerant), unexpected top level
 * values, empty objects and Features without geometry degrade to empty
 * results instead of failing the batch.
 *
 * @note All functions are noexcept and report errors through Result<T>
 * @note Bulk stages run on default_dispatcher() above the thresholds carried
 *       by the CodecConfig; output order never depends on the path taken
 */

#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec_config.hpp"
#include "types/geometry.hpp"
#include "types/region_object.hpp"
#include "types/result.hpp"

namespace regionbridge {

// ============================================================================
// Encoding
// ============================================================================

/// @brief Build the GeoJSON geometry object of a shape (no plane member)
/// @param shape Shape to encode
/// @return GeoJSON geometry object
[[nodiscard]] nlohmann::json shape_to_json(const Shape& shape);

/// @brief Build the bare geometry object of a region
/// @note The plane is nested in the geometry object when config.plane_adapter is set
[[nodiscard]] Result<nlohmann::json> region_to_json(
    const Region& region,
    const CodecConfig& config) noexcept;

/// @brief Build the Feature object of a region object
[[nodiscard]] Result<nlohmann::json> object_to_json(
    const RegionObject& object,
    const CodecConfig& config) noexcept;

/// @brief Encode one region object as a Feature
/// @param object Region object to encode
/// @param config Codec configuration
/// @return Result<std::string> containing the Feature text
/// @retval EncodeError A string member is not valid UTF-8
[[nodiscard]] Result<std::string> object_to_geojson(
    const RegionObject& object,
    const CodecConfig& config) noexcept;

/// @brief Encode a region as a bare geometry (no classification or measurements)
/// @param region Region to encode
/// @param config Codec configuration
/// @return Result<std::string> containing the geometry text
[[nodiscard]] Result<std::string> region_to_geojson(
    const Region& region,
    const CodecConfig& config) noexcept;

/// @brief Encode region objects as one FeatureCollection
/// @param objects Objects to encode, in output order
/// @param config Codec configuration
/// @return Result<std::string> containing the FeatureCollection text
/// @note An empty input produces a valid, empty FeatureCollection
/// @note Prefer collection_to_geojson_chunks() when the text may exceed
///       transport or string size limits
[[nodiscard]] Result<std::string> collection_to_geojson(
    std::span<const RegionObject> objects,
    const CodecConfig& config) noexcept;

/// @brief Encode region objects as several FeatureCollections of bounded size
/// @param objects Objects to encode
/// @param chunk_size Maximum number of features per collection
/// @param config Codec configuration
/// @return Result<std::vector<std::string>> with ceil(n / chunk_size) collections
/// @retval InvalidArgument chunk_size <= 0
/// @note Concatenating the features of all collections in order reproduces
///       the input order
/// @note Chunks are encoded concurrently when there are at least
///       config.thresholds.chunk_encode of them
[[nodiscard]] Result<std::vector<std::string>> collection_to_geojson_chunks(
    std::span<const RegionObject> objects,
    int chunk_size,
    const CodecConfig& config) noexcept;

/// @brief Encode each region object as its own Feature text
/// @note Objects are encoded concurrently when there are at least
///       config.thresholds.feature_list of them
[[nodiscard]] Result<std::vector<std::string>> objects_to_geojson_list(
    std::span<const RegionObject> objects,
    const CodecConfig& config) noexcept;

// ============================================================================
// Decoding
// ============================================================================

/// @brief Parse exchange-format text
/// @retval DecodeError Malformed JSON syntax
[[nodiscard]] Result<nlohmann::json> parse_geojson(std::string_view text) noexcept;

/// @brief Decode a GeoJSON geometry object into a shape
/// @retval DecodeError Unknown geometry type or malformed coordinates
[[nodiscard]] Result<Shape> json_to_shape(const nlohmann::json& geometry) noexcept;

/// @brief Decode a bare geometry object into a region
/// @note The plane is read from a "plane" member of the geometry object
[[nodiscard]] Result<Region> json_to_region(
    const nlohmann::json& geometry,
    const CodecConfig& config) noexcept;

/// @brief Decode region objects from a parsed tree
/// @param json One of:
///   - an array: each element is decoded and the results concatenated in order
///   - a FeatureCollection (any object with a "features" member)
///   - an empty object: no objects
///   - a Feature or bare geometry object: one object (none if it has no geometry)
///   Any other JSON value yields an empty sequence.
/// @param config Codec configuration
/// @return Result<std::vector<RegionObject>> in document order
/// @retval DecodeError A member has the wrong type, or (without null
///         tolerance) an optional member is an explicit null
[[nodiscard]] Result<std::vector<RegionObject>> json_to_objects(
    const nlohmann::json& json,
    const CodecConfig& config) noexcept;

/// @brief Parse and decode region objects from exchange-format text
/// @retval DecodeError Malformed JSON syntax, see also json_to_objects()
[[nodiscard]] Result<std::vector<RegionObject>> geojson_to_objects(
    std::string_view text,
    const CodecConfig& config) noexcept;

/// @brief Parse and decode bare regions from exchange-format text
/// @note Accepts an array of geometries, a single geometry, a Feature or a
///       FeatureCollection; classification and measurements are ignored
[[nodiscard]] Result<std::vector<Region>> geojson_to_regions(
    std::string_view text,
    const CodecConfig& config) noexcept;

} // namespace regionbridge

#define REGIONBRIDGE_GEOMETRY_CODEC_HEADER
#include "impl/geometry_codec_impl.hpp"
