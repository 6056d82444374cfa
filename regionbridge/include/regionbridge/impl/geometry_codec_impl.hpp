// Do not include this file directly. Include "geometry_codec.hpp" instead.

#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <new>
#include <numbers>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "../chunker.hpp"
#include "../logging.hpp"
#include "../null_sanitizer.hpp"
#include "../parallel_dispatch.hpp"
#include "../plane_codec.hpp"

#ifndef REGIONBRIDGE_GEOMETRY_CODEC_HEADER
#include "../geometry_codec.hpp" // for linters
#endif

namespace regionbridge {

namespace geojson_detail {

    using nlohmann::json;

    /// Vertex count of the polygon written for an ellipse
    inline constexpr int kEllipseVertices = 64;

    // ------------------------------------------------------------------------
    // Encoding helpers
    // ------------------------------------------------------------------------

    [[nodiscard]] inline json point_to_json(const Point2& p) {
        return json::array({p.x, p.y});
    }

    [[nodiscard]] inline json points_to_json(const std::vector<Point2>& points) {
        auto coords = json::array();
        for (const auto& p : points) {
            coords.push_back(point_to_json(p));
        }
        return coords;
    }

    /// Rings are stored open; GeoJSON wants them closed
    [[nodiscard]] inline json ring_to_json(const std::vector<Point2>& ring) {
        auto coords = points_to_json(ring);
        if (!ring.empty()) {
            coords.push_back(point_to_json(ring.front()));
        }
        return coords;
    }

    [[nodiscard]] inline json polygon_to_json(const Polygon& polygon) {
        auto rings = json::array();
        rings.push_back(ring_to_json(polygon.exterior));
        for (const auto& hole : polygon.holes) {
            rings.push_back(ring_to_json(hole));
        }
        return rings;
    }

    [[nodiscard]] inline json bounds_hint(ShapeKind kind, double x, double y, double w, double h) {
        return json{
            {"type", std::string(to_string(kind))},
            {"bounds", json::array({x, y, w, h})}
        };
    }

    struct ShapeEncoder {
        json operator()(const Rectangle& r) const {
            std::vector<Point2> ring{
                {r.x, r.y},
                {r.x + r.width, r.y},
                {r.x + r.width, r.y + r.height},
                {r.x, r.y + r.height}
            };
            return json{
                {"type", "Polygon"},
                {"coordinates", json::array({ring_to_json(ring)})},
                {"shape", bounds_hint(ShapeKind::Rectangle, r.x, r.y, r.width, r.height)}
            };
        }

        json operator()(const Ellipse& e) const {
            const double rx = e.width / 2.0;
            const double ry = e.height / 2.0;
            const double cx = e.x + rx;
            const double cy = e.y + ry;
            std::vector<Point2> ring;
            ring.reserve(kEllipseVertices);
            for (int i = 0; i < kEllipseVertices; ++i) {
                double angle = 2.0 * std::numbers::pi * i / kEllipseVertices;
                ring.push_back({cx + rx * std::cos(angle), cy + ry * std::sin(angle)});
            }
            return json{
                {"type", "Polygon"},
                {"coordinates", json::array({ring_to_json(ring)})},
                {"shape", bounds_hint(ShapeKind::Ellipse, e.x, e.y, e.width, e.height)}
            };
        }

        json operator()(const Line& l) const {
            return json{
                {"type", "LineString"},
                {"coordinates", json::array({point_to_json(l.start), point_to_json(l.end)})},
                {"shape", json{{"type", std::string(to_string(ShapeKind::Line))}}}
            };
        }

        json operator()(const Polyline& p) const {
            return json{
                {"type", "LineString"},
                {"coordinates", points_to_json(p.vertices)}
            };
        }

        json operator()(const Polygon& p) const {
            return json{
                {"type", "Polygon"},
                {"coordinates", polygon_to_json(p)}
            };
        }

        json operator()(const MultiPolygon& m) const {
            auto polygons = json::array();
            for (const auto& polygon : m.polygons) {
                polygons.push_back(polygon_to_json(polygon));
            }
            return json{
                {"type", "MultiPolygon"},
                {"coordinates", std::move(polygons)}
            };
        }

        json operator()(const Points& p) const {
            if (p.points.size() == 1) {
                return json{
                    {"type", "Point"},
                    {"coordinates", point_to_json(p.points.front())}
                };
            }
            return json{
                {"type", "MultiPoint"},
                {"coordinates", points_to_json(p.points)}
            };
        }
    };

    [[nodiscard]] inline json color_to_json(const Color& color) {
        return json::array({color.r, color.g, color.b});
    }

    [[nodiscard]] inline json classification_to_json(const Classification& classification) {
        json result = json::object();
        if (classification.names().size() == 1) {
            result["name"] = classification.names().front();
        } else {
            result["names"] = classification.names();
        }
        if (classification.color()) {
            result["color"] = color_to_json(*classification.color());
        }
        return result;
    }

    /// Non-finite values have no JSON number form
    [[nodiscard]] inline json measurement_to_json(double value) {
        if (std::isnan(value)) return "NaN";
        if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
        return value;
    }

    [[nodiscard]] inline Result<std::string> dump(const json& document, const CodecConfig& config) noexcept {
        try {
            return Ok(document.dump(config.indent()));
        } catch (const json::exception& e) {
            return Err(Error::Code::EncodeError, e.what());
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Out of memory while writing GeoJSON");
        }
    }

    // ------------------------------------------------------------------------
    // Decoding helpers
    // ------------------------------------------------------------------------

    [[nodiscard]] inline Result<Point2> json_to_point(const json& coords) {
        if (!coords.is_array() || coords.size() < 2 ||
            !coords[0].is_number() || !coords[1].is_number()) {
            return Err(Error::Code::DecodeError, "Coordinate must be an array of at least two numbers");
        }
        return Ok(Point2{coords[0].get<double>(), coords[1].get<double>()});
    }

    [[nodiscard]] inline Result<std::vector<Point2>> json_to_points(const json& coords) {
        if (!coords.is_array()) {
            return Err(Error::Code::DecodeError, "Coordinate list must be an array");
        }
        std::vector<Point2> points;
        points.reserve(coords.size());
        for (const auto& element : coords) {
            auto point = json_to_point(element);
            if (!point) return point.error();
            points.push_back(point.value());
        }
        return Ok(std::move(points));
    }

    [[nodiscard]] inline Result<std::vector<Point2>> json_to_ring(const json& coords) {
        auto points = json_to_points(coords);
        if (!points) return points;
        auto& ring = points.value();
        if (ring.size() > 1 && ring.front() == ring.back()) {
            ring.pop_back();
        }
        return points;
    }

    [[nodiscard]] inline Result<Polygon> json_to_polygon(const json& coords) {
        if (!coords.is_array() || coords.empty()) {
            return Err(Error::Code::DecodeError, "Polygon needs at least one ring");
        }
        Polygon polygon;
        for (std::size_t i = 0; i < coords.size(); ++i) {
            auto ring = json_to_ring(coords[i]);
            if (!ring) return ring.error();
            if (i == 0) {
                polygon.exterior = std::move(ring).value();
            } else {
                polygon.holes.push_back(std::move(ring).value());
            }
        }
        return Ok(std::move(polygon));
    }

    /// Name of the original shape kind written by ShapeEncoder, if any
    [[nodiscard]] inline std::optional<std::string> shape_hint(const json& geometry) {
        auto it = geometry.find("shape");
        if (it == geometry.end()) return std::nullopt;
        if (it->is_string()) return it->get<std::string>();
        if (it->is_object()) {
            auto type = it->find("type");
            if (type != it->end() && type->is_string()) return type->get<std::string>();
        }
        return std::nullopt;
    }

    [[nodiscard]] inline std::optional<std::array<double, 4>> hint_bounds(const json& geometry) {
        auto it = geometry.find("shape");
        if (it == geometry.end() || !it->is_object()) return std::nullopt;
        auto bounds = it->find("bounds");
        if (bounds == it->end() || !bounds->is_array() || bounds->size() != 4) return std::nullopt;
        std::array<double, 4> values{};
        for (std::size_t i = 0; i < 4; ++i) {
            if (!(*bounds)[i].is_number()) return std::nullopt;
            values[i] = (*bounds)[i].get<double>();
        }
        return values;
    }

    [[nodiscard]] inline Result<Color> json_to_color(const json& value) {
        if (value.is_array() && value.size() >= 3) {
            std::array<uint8_t, 3> rgb{};
            for (std::size_t i = 0; i < 3; ++i) {
                if (!value[i].is_number_integer()) {
                    return Err(Error::Code::DecodeError, "Color components must be integers");
                }
                auto component = value[i].get<int64_t>();
                if (component < 0 || component > 255) {
                    return Err(Error::Code::DecodeError, "Color component out of range");
                }
                rgb[i] = static_cast<uint8_t>(component);
            }
            return Ok(Color{rgb[0], rgb[1], rgb[2]});
        }
        if (value.is_number_integer()) {
            // Packed (A)RGB integer
            auto packed = static_cast<uint32_t>(value.get<int64_t>());
            return Ok(Color{
                static_cast<uint8_t>((packed >> 16) & 0xFF),
                static_cast<uint8_t>((packed >> 8) & 0xFF),
                static_cast<uint8_t>(packed & 0xFF)});
        }
        return Err(Error::Code::DecodeError, "Color must be an [r, g, b] array or a packed integer");
    }

    [[nodiscard]] inline Result<std::optional<Classification>> json_to_classification(const json& value) {
        if (value.is_string()) {
            const auto& name = value.get_ref<const std::string&>();
            if (name.empty()) return Ok(std::optional<Classification>{});
            return Ok(std::optional<Classification>{Classification{name}});
        }
        if (!value.is_object()) {
            return Err(Error::Code::DecodeError, "Classification must be an object or a string");
        }

        std::optional<Color> color;
        if (auto it = value.find("color"); it != value.end()) {
            auto decoded = json_to_color(*it);
            if (!decoded) return decoded.error();
            color = decoded.value();
        }

        std::vector<std::string> names;
        if (auto it = value.find("names"); it != value.end() && it->is_array()) {
            for (const auto& name : *it) {
                if (!name.is_string()) {
                    return Err(Error::Code::DecodeError, "Classification names must be strings");
                }
                names.push_back(name.get<std::string>());
            }
        } else if (auto name = value.find("name"); name != value.end()) {
            if (!name->is_string()) {
                return Err(Error::Code::DecodeError, "Classification name must be a string");
            }
            names.push_back(name->get<std::string>());
        }

        if (names.empty()) {
            return Ok(std::optional<Classification>{});
        }
        return Ok(std::optional<Classification>{Classification{std::move(names), color}});
    }

    /// Numbers, or the strings written for non-finite values
    [[nodiscard]] inline std::optional<double> json_to_measurement(const json& value) {
        if (value.is_number()) return value.get<double>();
        if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            if (text == "NaN") return std::numeric_limits<double>::quiet_NaN();
            if (text == "Infinity") return std::numeric_limits<double>::infinity();
            if (text == "-Infinity") return -std::numeric_limits<double>::infinity();
        }
        return std::nullopt;
    }

    [[nodiscard]] inline Result<MeasurementMap> json_to_measurements(const json& value) {
        MeasurementMap measurements;
        if (value.is_object()) {
            for (const auto& [name, entry] : value.items()) {
                if (auto number = json_to_measurement(entry)) {
                    measurements[name] = *number;
                }
            }
            return Ok(std::move(measurements));
        }
        if (value.is_array()) {
            // Legacy list layout: [{"name": ..., "value": ...}]
            for (const auto& entry : value) {
                if (!entry.is_object()) continue;
                auto name = entry.find("name");
                auto number = entry.find("value");
                if (name == entry.end() || !name->is_string() || number == entry.end()) continue;
                if (auto parsed = json_to_measurement(*number)) {
                    measurements[name->get<std::string>()] = *parsed;
                }
            }
            return Ok(std::move(measurements));
        }
        return Err(Error::Code::DecodeError, "Measurements must be an object or a list");
    }

    /// Path of the first null member, following objects only
    [[nodiscard]] inline std::optional<std::string> find_null_member(const json& value) {
        if (!value.is_object()) return std::nullopt;
        for (const auto& [key, member] : value.items()) {
            if (member.is_null()) return key;
            if (auto nested = find_null_member(member)) return key + "." + *nested;
        }
        return std::nullopt;
    }

    [[nodiscard]] inline Result<void> check_nulls(const json& value, const CodecConfig& config) {
        if (config.null_tolerant) return Ok();
        if (auto path = find_null_member(value)) {
            return Err(Error::Code::DecodeError, "Unexpected null member '" + *path + "'");
        }
        return Ok();
    }

    [[nodiscard]] inline bool is_feature(const json& value) {
        auto type = value.find("type");
        if (type != value.end() && type->is_string() && type->get_ref<const std::string&>() == "Feature") {
            return true;
        }
        return value.contains("geometry") || value.contains("properties");
    }

    [[nodiscard]] inline std::string object_id(const json& feature) {
        auto id = feature.find("id");
        if (id != feature.end()) {
            if (id->is_string() && !id->get_ref<const std::string&>().empty()) {
                return id->get<std::string>();
            }
            if (id->is_number()) {
                return id->dump();
            }
        }
        return generate_object_id();
    }

    /// Feature-level plane first, then the plane nested in the geometry
    [[nodiscard]] inline Result<Plane> read_plane(
        const json* feature,
        const json& geometry,
        const CodecConfig& config) {

        if (!config.plane_adapter) {
            return Ok(Plane::default_plane());
        }
        if (feature != nullptr) {
            if (auto it = feature->find("plane"); it != feature->end()) {
                return decode_plane(*it);
            }
        }
        if (auto it = geometry.find("plane"); it != geometry.end()) {
            return decode_plane(*it);
        }
        return Ok(Plane::default_plane());
    }

    [[nodiscard]] inline Result<void> apply_properties(
        const json& properties,
        RegionObject& object) {

        if (auto it = properties.find("classification"); it != properties.end()) {
            auto classification = json_to_classification(*it);
            if (!classification) return classification.error();
            object.set_classification(std::move(classification).value());
        }
        if (auto it = properties.find("name"); it != properties.end()) {
            if (!it->is_string()) {
                return Err(Error::Code::DecodeError, "Property 'name' must be a string");
            }
            object.set_name(it->get<std::string>());
        }
        if (auto it = properties.find("color"); it != properties.end()) {
            auto color = json_to_color(*it);
            if (!color) return color.error();
            object.set_color(color.value());
        }
        if (auto it = properties.find("isLocked"); it != properties.end()) {
            if (!it->is_boolean()) {
                return Err(Error::Code::DecodeError, "Property 'isLocked' must be a boolean");
            }
            object.set_locked(it->get<bool>());
        }
        if (auto it = properties.find("measurements"); it != properties.end()) {
            auto measurements = json_to_measurements(*it);
            if (!measurements) return measurements.error();
            object.measurements() = std::move(measurements).value();
        }
        return Ok();
    }

    /// Decode one Feature or bare geometry; empty when the Feature has no geometry
    [[nodiscard]] inline Result<std::optional<RegionObject>> decode_object(
        const json& value,
        const CodecConfig& config) {

        const bool feature = is_feature(value);
        const json* geometry = &value;
        const json* properties = nullptr;

        if (feature) {
            auto it = value.find("geometry");
            if (it == value.end() || !it->is_object()) {
                logger()->warn("Skipping feature '{}' without geometry",
                               value.contains("id") ? value["id"].dump() : std::string("?"));
                return Ok(std::optional<RegionObject>{});
            }
            geometry = &*it;
            if (auto props = value.find("properties"); props != value.end()) {
                if (!props->is_object()) {
                    return Err(Error::Code::DecodeError, "Feature properties must be an object");
                }
                properties = &*props;
            }
        }

        auto shape = json_to_shape(*geometry);
        if (!shape) return shape.error();

        auto plane = read_plane(feature ? &value : nullptr, *geometry, config);
        if (!plane) return plane.error();

        ObjectType type = ObjectType::Annotation;
        if (properties != nullptr) {
            if (auto it = properties->find("objectType"); it != properties->end() && it->is_string()) {
                type = object_type_from_string(it->get_ref<const std::string&>());
            }
        }

        RegionObject object{
            feature ? object_id(value) : generate_object_id(),
            Region{std::move(shape).value(), plane.value()},
            type};

        if (properties != nullptr) {
            auto applied = apply_properties(*properties, object);
            if (!applied) return applied.error();
        }
        return Ok(std::optional<RegionObject>{std::move(object)});
    }

    inline void collect_regions(
        const json& value,
        const CodecConfig& config,
        std::vector<Region>& regions,
        Result<void>& status) {

        if (!status) return;

        if (value.is_array()) {
            for (const auto& element : value) {
                collect_regions(element, config, regions, status);
                if (!status) return;
            }
            return;
        }
        if (!value.is_object() || value.empty()) {
            return;
        }
        if (auto features = value.find("features"); features != value.end()) {
            collect_regions(*features, config, regions, status);
            return;
        }

        json element = value;
        if (config.null_tolerant) {
            strip_nulls(element);
        } else if (auto checked = check_nulls(element, config); !checked) {
            status = checked;
            return;
        }

        const bool feature = is_feature(element);
        const json* geometry = &element;
        if (feature) {
            auto it = element.find("geometry");
            if (it == element.end() || !it->is_object()) return;
            geometry = &*it;
        }

        auto shape = json_to_shape(*geometry);
        if (!shape) {
            status = shape.error();
            return;
        }
        auto plane = read_plane(feature ? &element : nullptr, *geometry, config);
        if (!plane) {
            status = plane.error();
            return;
        }
        regions.emplace_back(std::move(shape).value(), plane.value());
    }

} // namespace geojson_detail

// ============================================================================
// Encoding
// ============================================================================

inline nlohmann::json shape_to_json(const Shape& shape) {
    return std::visit(geojson_detail::ShapeEncoder{}, shape);
}

inline Result<nlohmann::json> region_to_json(
    const Region& region,
    const CodecConfig& config) noexcept {
    try {
        auto geometry = shape_to_json(region.shape());
        if (config.plane_adapter) {
            geometry["plane"] = encode_plane(region.plane());
        }
        return Ok(std::move(geometry));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while building geometry");
    }
}

inline Result<nlohmann::json> object_to_json(
    const RegionObject& object,
    const CodecConfig& config) noexcept {
    using geojson_detail::json;
    try {
        json properties = json::object();
        properties["objectType"] = std::string(to_string(object.object_type()));
        if (object.classification()) {
            properties["classification"] = geojson_detail::classification_to_json(*object.classification());
        }
        if (object.name()) {
            properties["name"] = *object.name();
        }
        if (object.color()) {
            properties["color"] = geojson_detail::color_to_json(*object.color());
        }
        if (object.locked()) {
            properties["isLocked"] = true;
        }
        if (!object.measurements().empty()) {
            json measurements = json::object();
            for (const auto& [name, value] : object.measurements()) {
                measurements[name] = geojson_detail::measurement_to_json(value);
            }
            properties["measurements"] = std::move(measurements);
        }

        json feature = json::object();
        feature["type"] = "Feature";
        feature["id"] = object.id();
        feature["geometry"] = shape_to_json(object.region().shape());
        feature["properties"] = std::move(properties);
        if (config.plane_adapter) {
            feature["plane"] = encode_plane(object.region().plane());
        }
        return Ok(std::move(feature));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while building feature");
    }
}

inline Result<std::string> object_to_geojson(
    const RegionObject& object,
    const CodecConfig& config) noexcept {
    auto feature = object_to_json(object, config);
    if (!feature) return feature.error();
    return geojson_detail::dump(feature.value(), config);
}

inline Result<std::string> region_to_geojson(
    const Region& region,
    const CodecConfig& config) noexcept {
    auto geometry = region_to_json(region, config);
    if (!geometry) return geometry.error();
    return geojson_detail::dump(geometry.value(), config);
}

inline Result<std::string> collection_to_geojson(
    std::span<const RegionObject> objects,
    const CodecConfig& config) noexcept {
    using geojson_detail::json;
    try {
        json features = json::array();
        for (const auto& object : objects) {
            auto feature = object_to_json(object, config);
            if (!feature) return feature.error();
            features.push_back(std::move(feature).value());
        }
        json collection = json::object();
        collection["type"] = "FeatureCollection";
        collection["features"] = std::move(features);
        return geojson_detail::dump(collection, config);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while building feature collection");
    }
}

inline Result<std::vector<std::string>> collection_to_geojson_chunks(
    std::span<const RegionObject> objects,
    int chunk_size,
    const CodecConfig& config) noexcept {

    try {
        auto chunks = partition(objects, chunk_size);
        if (!chunks) return chunks.error();

        const auto& groups = chunks.value();
        logger()->debug("Encoding {} objects as {} feature collections ({})",
                        objects.size(), groups.size(),
                        select_execution(groups.size(), config.thresholds.chunk_encode) == ExecutionMode::Concurrent
                            ? "concurrent" : "sequential");

        return default_dispatcher().map(
            std::span<const std::vector<RegionObject>>(groups),
            config.thresholds.chunk_encode,
            [&config](const std::vector<RegionObject>& group) {
                return collection_to_geojson(std::span<const RegionObject>(group), config);
            });
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while partitioning objects");
    }
}

inline Result<std::vector<std::string>> objects_to_geojson_list(
    std::span<const RegionObject> objects,
    const CodecConfig& config) noexcept {

    try {
        return default_dispatcher().map(
            objects,
            config.thresholds.feature_list,
            [&config](const RegionObject& object) {
                return object_to_geojson(object, config);
            });
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while encoding features");
    }
}

// ============================================================================
// Decoding
// ============================================================================

inline Result<nlohmann::json> parse_geojson(std::string_view text) noexcept {
    try {
        return Ok(nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        return Err(Error::Code::DecodeError, e.what());
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while parsing GeoJSON");
    }
}

inline Result<Shape> json_to_shape(const nlohmann::json& geometry) noexcept {
    using namespace geojson_detail;
    try {
        if (!geometry.is_object()) {
            return Err(Error::Code::DecodeError, "Geometry must be a JSON object");
        }
        auto type_it = geometry.find("type");
        if (type_it == geometry.end() || !type_it->is_string()) {
            return Err(Error::Code::DecodeError, "Geometry has no type");
        }
        const auto& type = type_it->get_ref<const std::string&>();

        auto coords_it = geometry.find("coordinates");
        if (coords_it == geometry.end()) {
            return Err(Error::Code::DecodeError, "Geometry '" + type + "' has no coordinates");
        }
        const auto& coords = *coords_it;
        const auto hint = shape_hint(geometry);

        if (type == "Point") {
            auto point = json_to_point(coords);
            if (!point) return point.error();
            return Ok(Shape{Points{{point.value()}}});
        }
        if (type == "MultiPoint") {
            auto points = json_to_points(coords);
            if (!points) return points.error();
            return Ok(Shape{Points{std::move(points).value()}});
        }
        if (type == "LineString") {
            auto points = json_to_points(coords);
            if (!points) return points.error();
            auto& vertices = points.value();
            if (hint == "line" && vertices.size() == 2) {
                return Ok(Shape{Line{vertices[0], vertices[1]}});
            }
            return Ok(Shape{Polyline{std::move(vertices)}});
        }
        if (type == "Polygon") {
            auto polygon = json_to_polygon(coords);
            if (!polygon) return polygon.error();
            if (auto bounds = hint_bounds(geometry)) {
                const auto [x, y, w, h] = *bounds;
                if (hint == "rectangle") return Ok(Shape{Rectangle{x, y, w, h}});
                if (hint == "ellipse") return Ok(Shape{Ellipse{x, y, w, h}});
            }
            return Ok(Shape{std::move(polygon).value()});
        }
        if (type == "MultiPolygon") {
            if (!coords.is_array()) {
                return Err(Error::Code::DecodeError, "MultiPolygon coordinates must be an array");
            }
            MultiPolygon multi;
            for (const auto& element : coords) {
                auto polygon = json_to_polygon(element);
                if (!polygon) return polygon.error();
                multi.polygons.push_back(std::move(polygon).value());
            }
            return Ok(Shape{std::move(multi)});
        }
        return Err(Error::Code::DecodeError, "Unsupported geometry type '" + type + "'");
    } catch (const nlohmann::json::exception& e) {
        return Err(Error::Code::DecodeError, e.what());
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while decoding geometry");
    }
}

inline Result<Region> json_to_region(
    const nlohmann::json& geometry,
    const CodecConfig& config) noexcept {
    try {
        auto shape = json_to_shape(geometry);
        if (!shape) return shape.error();
        auto plane = geojson_detail::read_plane(nullptr, geometry, config);
        if (!plane) return plane.error();
        return Ok(Region{std::move(shape).value(), plane.value()});
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while decoding geometry");
    }
}

inline Result<std::vector<RegionObject>> json_to_objects(
    const nlohmann::json& json,
    const CodecConfig& config) noexcept {

    try {
        if (json.is_array()) {
            const auto& elements = json.get_ref<const nlohmann::json::array_t&>();
            auto decoded = default_dispatcher().map(
                std::span<const nlohmann::json>(elements),
                config.thresholds.decode_array,
                [&config](const nlohmann::json& element) {
                    return json_to_objects(element, config);
                });
            if (!decoded) return decoded.error();

            std::vector<RegionObject> objects;
            for (auto& group : decoded.value()) {
                for (auto& object : group) {
                    objects.push_back(std::move(object));
                }
            }
            return Ok(std::move(objects));
        }

        if (json.is_object()) {
            if (json.empty()) {
                return Ok(std::vector<RegionObject>{});
            }
            if (auto features = json.find("features"); features != json.end()) {
                return json_to_objects(*features, config);
            }

            nlohmann::json element = json;
            if (config.null_tolerant) {
                strip_nulls(element);
            } else if (auto checked = geojson_detail::check_nulls(element, config); !checked) {
                return checked.error();
            }

            auto object = geojson_detail::decode_object(element, config);
            if (!object) return object.error();

            std::vector<RegionObject> objects;
            if (object.value()) {
                objects.push_back(std::move(*object.value()));
            }
            return Ok(std::move(objects));
        }

        return Ok(std::vector<RegionObject>{});
    } catch (const nlohmann::json::exception& e) {
        return Err(Error::Code::DecodeError, e.what());
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while decoding objects");
    }
}

inline Result<std::vector<RegionObject>> geojson_to_objects(
    std::string_view text,
    const CodecConfig& config) noexcept {
    auto parsed = parse_geojson(text);
    if (!parsed) return parsed.error();
    return json_to_objects(parsed.value(), config);
}

inline Result<std::vector<Region>> geojson_to_regions(
    std::string_view text,
    const CodecConfig& config) noexcept {
    auto parsed = parse_geojson(text);
    if (!parsed) return parsed.error();

    try {
        std::vector<Region> regions;
        Result<void> status = Ok();
        geojson_detail::collect_regions(parsed.value(), config, regions, status);
        if (!status) return status.error();
        return Ok(std::move(regions));
    } catch (const nlohmann::json::exception& e) {
        return Err(Error::Code::DecodeError, e.what());
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while decoding regions");
    }
}

} // namespace regionbridge
