#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../regionbridge/include/regionbridge/geometry_codec.hpp"

using namespace regionbridge;
using nlohmann::json;

namespace {

Polygon square_with_hole() {
    Polygon polygon;
    polygon.exterior = {{0, 0}, {100, 0}, {100, 100}, {0, 100}};
    polygon.holes = {{{40, 40}, {60, 40}, {60, 60}, {40, 60}}};
    return polygon;
}

/// One object of every shape kind, spread over several planes
std::vector<RegionObject> sample_objects() {
    std::vector<RegionObject> objects;

    RegionObject rectangle{"rect-1", Region{Rectangle{10, 20, 30, 40}, Plane{-1, 0, 0}}};
    rectangle.set_classification(Classification{"Tumor", Color{200, 0, 0}});
    rectangle.measurements()["Area"] = 1200.0;
    objects.push_back(rectangle);

    RegionObject ellipse{"ellipse-1", Region{Ellipse{5, 5, 50, 20}, Plane{1, 2, 0}}, ObjectType::Detection};
    ellipse.set_name(std::string("nucleus"));
    objects.push_back(ellipse);

    RegionObject line{"line-1", Region{Line{{0, 0}, {25.5, 12.25}}, Plane{-1, 3, 1}}};
    line.set_locked(true);
    objects.push_back(line);

    RegionObject polyline{"polyline-1", Region{Polyline{{{0, 0}, {5, 5}, {10, 0}}}}};
    objects.push_back(polyline);

    RegionObject polygon{"polygon-1", Region{square_with_hole(), Plane{0, 0, 4}}, ObjectType::Cell};
    polygon.set_classification(Classification{std::vector<std::string>{"Tumor", "Positive"}});
    polygon.set_color(Color{1, 2, 3});
    polygon.measurements()["Area"] = 9600.0;
    polygon.measurements()["Perimeter"] = 480.0;
    objects.push_back(polygon);

    MultiPolygon multi;
    multi.polygons.push_back(Polygon{{{0, 0}, {1, 0}, {1, 1}}, {}});
    multi.polygons.push_back(Polygon{{{5, 5}, {6, 5}, {6, 6}}, {}});
    objects.push_back(RegionObject{"multi-1", Region{multi}});

    objects.push_back(RegionObject{"point-1", Region{Points{{{3, 4}}}}});
    objects.push_back(RegionObject{"points-1", Region{Points{{{1, 1}, {2, 2}, {3, 3}}}}});
    return objects;
}

std::vector<RegionObject> many_objects(int n) {
    std::vector<RegionObject> objects;
    for (int i = 0; i < n; ++i) {
        RegionObject object{"obj-" + std::to_string(i),
                            Region{Rectangle{static_cast<double>(i), 0, 1, 1}, Plane{-1, i % 3, 0}},
                            ObjectType::Detection};
        object.measurements()["Index"] = i;
        objects.push_back(std::move(object));
    }
    return objects;
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST(GeometryCodecEncode, FeatureLayout) {
    auto objects = sample_objects();
    auto text = object_to_geojson(objects[0], CodecConfig{});
    ASSERT_TRUE(text.is_ok());

    auto feature = json::parse(text.value());
    EXPECT_EQ(feature["type"], "Feature");
    EXPECT_EQ(feature["id"], "rect-1");
    EXPECT_EQ(feature["geometry"]["type"], "Polygon");
    EXPECT_EQ(feature["geometry"]["shape"]["type"], "rectangle");
    EXPECT_EQ(feature["properties"]["objectType"], "annotation");
    EXPECT_EQ(feature["properties"]["classification"]["name"], "Tumor");
    EXPECT_EQ(feature["properties"]["classification"]["color"], json::array({200, 0, 0}));
    EXPECT_EQ(feature["properties"]["measurements"]["Area"], 1200.0);
    EXPECT_FALSE(feature["properties"].contains("isLocked"));
    EXPECT_EQ(feature["plane"], (json{{"c", -1}, {"z", 0}, {"t", 0}}));
}

TEST(GeometryCodecEncode, PolygonRingsAreClosed) {
    auto geometry = shape_to_json(Shape{square_with_hole()});
    const auto& rings = geometry["coordinates"];
    ASSERT_EQ(rings.size(), 2u);
    ASSERT_EQ(rings[0].size(), 5u);
    EXPECT_EQ(rings[0].front(), rings[0].back());
    EXPECT_EQ(rings[1].front(), rings[1].back());
}

TEST(GeometryCodecEncode, EmptyCollectionIsValid) {
    std::vector<RegionObject> objects;
    auto text = collection_to_geojson(objects, CodecConfig{});
    ASSERT_TRUE(text.is_ok());

    auto collection = json::parse(text.value());
    EXPECT_EQ(collection["type"], "FeatureCollection");
    EXPECT_TRUE(collection["features"].is_array());
    EXPECT_TRUE(collection["features"].empty());
}

TEST(GeometryCodecEncode, PrettyPrintIndents) {
    auto objects = sample_objects();
    CodecConfig pretty;
    pretty.pretty_print = true;

    auto compact = object_to_geojson(objects[0], CodecConfig{});
    auto indented = object_to_geojson(objects[0], pretty);
    ASSERT_TRUE(compact.is_ok());
    ASSERT_TRUE(indented.is_ok());
    EXPECT_EQ(compact.value().find('\n'), std::string::npos);
    EXPECT_NE(indented.value().find("\n  \"geometry\""), std::string::npos);
    EXPECT_EQ(json::parse(compact.value()), json::parse(indented.value()));
}

TEST(GeometryCodecEncode, NonFiniteMeasurementsAreStrings) {
    RegionObject object{"nan-1", Region{Rectangle{0, 0, 1, 1}}};
    object.measurements()["Ratio"] = std::numeric_limits<double>::quiet_NaN();
    object.measurements()["Max"] = std::numeric_limits<double>::infinity();
    object.measurements()["Min"] = -std::numeric_limits<double>::infinity();

    auto text = object_to_geojson(object, CodecConfig{});
    ASSERT_TRUE(text.is_ok());
    auto feature = json::parse(text.value());
    EXPECT_EQ(feature["properties"]["measurements"]["Ratio"], "NaN");
    EXPECT_EQ(feature["properties"]["measurements"]["Max"], "Infinity");
    EXPECT_EQ(feature["properties"]["measurements"]["Min"], "-Infinity");

    auto decoded = geojson_to_objects(text.value(), CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    const auto& measurements = decoded.value()[0].measurements();
    EXPECT_TRUE(std::isnan(measurements.at("Ratio")));
    EXPECT_EQ(measurements.at("Max"), std::numeric_limits<double>::infinity());
    EXPECT_EQ(measurements.at("Min"), -std::numeric_limits<double>::infinity());
}

TEST(GeometryCodecEncode, InvalidUtf8IsEncodeError) {
    RegionObject object{"bad-name", Region{Rectangle{0, 0, 1, 1}}};
    object.set_name(std::string("\xff\xfe"));
    auto text = object_to_geojson(object, CodecConfig{});
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code, Error::Code::EncodeError);
}

TEST(GeometryCodecEncode, RegionWithoutPlaneAdapter) {
    Region region{Rectangle{1, 2, 3, 4}, Plane{0, 5, 6}};

    auto with_plane = region_to_geojson(region, CodecConfig{});
    ASSERT_TRUE(with_plane.is_ok());
    EXPECT_EQ(json::parse(with_plane.value())["plane"]["z"], 5);

    CodecConfig no_plane;
    no_plane.plane_adapter = false;
    auto without_plane = region_to_geojson(region, no_plane);
    ASSERT_TRUE(without_plane.is_ok());
    EXPECT_FALSE(json::parse(without_plane.value()).contains("plane"));
}

// ============================================================================
// Round trips
// ============================================================================

TEST(GeometryCodecRoundTrip, CollectionPreservesEveryShapeKind) {
    auto objects = sample_objects();
    auto text = collection_to_geojson(objects, CodecConfig{});
    ASSERT_TRUE(text.is_ok());

    auto decoded = geojson_to_objects(text.value(), CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), objects.size());

    for (std::size_t i = 0; i < objects.size(); ++i) {
        EXPECT_EQ(decoded.value()[i].region().kind(), objects[i].region().kind()) << objects[i].id();
        EXPECT_EQ(decoded.value()[i], objects[i]) << objects[i].id();
    }
}

TEST(GeometryCodecRoundTrip, SingleFeature) {
    auto objects = sample_objects();
    for (const auto& object : objects) {
        auto text = object_to_geojson(object, CodecConfig{});
        ASSERT_TRUE(text.is_ok());
        auto decoded = geojson_to_objects(text.value(), CodecConfig{});
        ASSERT_TRUE(decoded.is_ok());
        ASSERT_EQ(decoded.value().size(), 1u);
        EXPECT_EQ(decoded.value()[0], object);
    }
}

TEST(GeometryCodecRoundTrip, BareRegions) {
    auto objects = sample_objects();
    for (const auto& object : objects) {
        auto text = region_to_geojson(object.region(), CodecConfig{});
        ASSERT_TRUE(text.is_ok());
        auto regions = geojson_to_regions(text.value(), CodecConfig{});
        ASSERT_TRUE(regions.is_ok());
        ASSERT_EQ(regions.value().size(), 1u);
        EXPECT_EQ(regions.value()[0], object.region());
    }
}

TEST(GeometryCodecRoundTrip, PlaneAdapterDisabledGivesDefaultPlane) {
    CodecConfig config;
    config.plane_adapter = false;

    RegionObject object{"p", Region{Rectangle{0, 0, 2, 2}, Plane{2, 3, 4}}};
    auto text = object_to_geojson(object, config);
    ASSERT_TRUE(text.is_ok());

    auto decoded = geojson_to_objects(text.value(), config);
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    EXPECT_EQ(decoded.value()[0].region().plane(), Plane::default_plane());
}

// ============================================================================
// Decoding
// ============================================================================

TEST(GeometryCodecDecode, MissingPlaneIsDefaultPlane) {
    auto decoded = geojson_to_objects(R"({
        "type": "Feature",
        "id": "no-plane",
        "geometry": {"type": "Polygon", "coordinates": [[[0,0],[4,0],[4,4],[0,0]]]},
        "properties": {"objectType": "annotation"}
    })", CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    EXPECT_EQ(decoded.value()[0].region().plane(), Plane::default_plane());
    EXPECT_EQ(decoded.value()[0].region().kind(), ShapeKind::Polygon);

    const auto& polygon = std::get<Polygon>(decoded.value()[0].region().shape());
    EXPECT_EQ(polygon.exterior.size(), 3u);
}

TEST(GeometryCodecDecode, PlaneNestedInGeometry) {
    auto decoded = geojson_to_objects(
        R"({"type": "Point", "coordinates": [1, 2], "plane": {"c": 0, "z": 7, "t": 1}})",
        CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    EXPECT_EQ(decoded.value()[0].region().plane(), (Plane{0, 7, 1}));
    EXPECT_FALSE(decoded.value()[0].id().empty());
}

TEST(GeometryCodecDecode, NullsToleratedByDefault) {
    const char* text = R"({
        "type": "Feature",
        "id": "with-nulls",
        "geometry": {"type": "Point", "coordinates": [5, 6]},
        "properties": {"classification": null, "name": null, "measurements": {"Area": null, "Perimeter": 3}},
        "plane": null
    })";

    auto tolerant = geojson_to_objects(text, CodecConfig{});
    ASSERT_TRUE(tolerant.is_ok());
    ASSERT_EQ(tolerant.value().size(), 1u);
    const auto& object = tolerant.value()[0];
    EXPECT_FALSE(object.classification().has_value());
    EXPECT_FALSE(object.name().has_value());
    EXPECT_EQ(object.measurements().size(), 1u);
    EXPECT_EQ(object.region().plane(), Plane::default_plane());

    CodecConfig strict;
    strict.null_tolerant = false;
    auto rejected = geojson_to_objects(text, strict);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, Error::Code::DecodeError);
}

TEST(GeometryCodecDecode, TopLevelArrayIsConcatenated) {
    auto decoded = geojson_to_objects(R"([
        {"type": "Feature", "id": "a", "geometry": {"type": "Point", "coordinates": [0, 0]}},
        {"type": "FeatureCollection", "features": [
            {"type": "Feature", "id": "b", "geometry": {"type": "Point", "coordinates": [1, 1]}},
            {"type": "Feature", "id": "c", "geometry": {"type": "Point", "coordinates": [2, 2]}}
        ]},
        {},
        42,
        {"type": "Feature", "id": "d", "geometry": {"type": "Point", "coordinates": [3, 3]}}
    ])", CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 4u);
    EXPECT_EQ(decoded.value()[0].id(), "a");
    EXPECT_EQ(decoded.value()[1].id(), "b");
    EXPECT_EQ(decoded.value()[2].id(), "c");
    EXPECT_EQ(decoded.value()[3].id(), "d");
}

TEST(GeometryCodecDecode, DegenerateInputsGiveEmptyResults) {
    for (const char* text : {"{}", "[]", "42", "\"text\"", "null", "true"}) {
        auto decoded = geojson_to_objects(text, CodecConfig{});
        ASSERT_TRUE(decoded.is_ok()) << text;
        EXPECT_TRUE(decoded.value().empty()) << text;
    }
}

TEST(GeometryCodecDecode, FeatureWithoutGeometryIsSkipped) {
    auto decoded = geojson_to_objects(R"({"type": "FeatureCollection", "features": [
        {"type": "Feature", "id": "empty", "properties": {"name": "ghost"}},
        {"type": "Feature", "id": "kept", "geometry": {"type": "Point", "coordinates": [0, 0]}}
    ]})", CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    EXPECT_EQ(decoded.value()[0].id(), "kept");
}

TEST(GeometryCodecDecode, MalformedTextIsDecodeError) {
    for (const char* text : {"{\"type\": \"Feature\"", "[1, 2", "not json", ""}) {
        auto decoded = geojson_to_objects(text, CodecConfig{});
        ASSERT_TRUE(decoded.is_error()) << text;
        EXPECT_EQ(decoded.error().code, Error::Code::DecodeError);
    }
}

TEST(GeometryCodecDecode, WrongMemberTypesAreDecodeErrors) {
    const char* cases[] = {
        R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": "oops"}})",
        R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": [0, 0]}, "properties": {"name": 7}})",
        R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": [0, 0]}, "properties": {"isLocked": "yes"}})",
        R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": [0, 0]}, "plane": {"z": "one"}})",
        R"({"type": "Feature", "geometry": {"type": "GeometryCollection", "coordinates": []}})",
    };
    for (const char* text : cases) {
        auto decoded = geojson_to_objects(text, CodecConfig{});
        ASSERT_TRUE(decoded.is_error()) << text;
        EXPECT_EQ(decoded.error().code, Error::Code::DecodeError) << text;
    }
}

TEST(GeometryCodecDecode, ErrorInsideArrayFailsTheBatch) {
    std::string text = "[";
    for (int i = 0; i < 30; ++i) {
        if (i > 0) text += ",";
        text += i == 17
            ? R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": [0]}})"
            : R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": [0, 0]}})";
    }
    text += "]";

    auto decoded = geojson_to_objects(text, CodecConfig{});
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::DecodeError);
}

TEST(GeometryCodecDecode, ClassificationForms) {
    auto decoded = geojson_to_objects(R"([
        {"type": "Feature", "id": "s", "geometry": {"type": "Point", "coordinates": [0, 0]},
         "properties": {"classification": "Stroma"}},
        {"type": "Feature", "id": "n", "geometry": {"type": "Point", "coordinates": [0, 0]},
         "properties": {"classification": {"names": ["Tumor", "Negative"], "color": 16711680}}}
    ])", CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 2u);

    const auto& stroma = decoded.value()[0].classification();
    ASSERT_TRUE(stroma.has_value());
    EXPECT_EQ(stroma->to_string(), "Stroma");
    EXPECT_FALSE(stroma->color().has_value());

    const auto& derived = decoded.value()[1].classification();
    ASSERT_TRUE(derived.has_value());
    EXPECT_EQ(derived->to_string(), "Tumor: Negative");
    EXPECT_EQ(derived->color(), (Color{255, 0, 0}));
}

TEST(GeometryCodecDecode, LegacyMeasurementList) {
    auto decoded = geojson_to_objects(R"({
        "type": "Feature",
        "geometry": {"type": "Point", "coordinates": [0, 0]},
        "properties": {"measurements": [
            {"name": "Area", "value": 12.5},
            {"name": "Label", "value": "text"},
            {"value": 3}
        ]}
    })", CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    const auto& measurements = decoded.value()[0].measurements();
    ASSERT_EQ(measurements.size(), 1u);
    EXPECT_EQ(measurements.at("Area"), 12.5);
}

TEST(GeometryCodecDecode, NumericIdIsKeptAsText) {
    auto decoded = geojson_to_objects(
        R"({"type": "Feature", "id": 17, "geometry": {"type": "Point", "coordinates": [0, 0]}})",
        CodecConfig{});
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    EXPECT_EQ(decoded.value()[0].id(), "17");
}

TEST(GeometryCodecDecode, RegionsIgnoreProperties) {
    auto regions = geojson_to_regions(R"({"type": "FeatureCollection", "features": [
        {"type": "Feature", "geometry": {"type": "LineString", "coordinates": [[0,0],[1,1],[2,0]]},
         "properties": {"classification": "Tumor"}, "plane": {"c": -1, "z": 2, "t": 0}},
        {"type": "Feature", "properties": {}}
    ]})", CodecConfig{});
    ASSERT_TRUE(regions.is_ok());
    ASSERT_EQ(regions.value().size(), 1u);
    EXPECT_EQ(regions.value()[0].kind(), ShapeKind::Polyline);
    EXPECT_EQ(regions.value()[0].plane(), (Plane{-1, 2, 0}));
}

// ============================================================================
// Chunked and per-object encoding
// ============================================================================

TEST(GeometryCodecChunks, CeilCountAndOrder) {
    auto objects = many_objects(23);
    auto chunks = collection_to_geojson_chunks(objects, 5, CodecConfig{});
    ASSERT_TRUE(chunks.is_ok());
    ASSERT_EQ(chunks.value().size(), 5u);

    std::vector<std::string> ids;
    for (const auto& text : chunks.value()) {
        auto collection = json::parse(text);
        EXPECT_EQ(collection["type"], "FeatureCollection");
        EXPECT_LE(collection["features"].size(), 5u);
        for (const auto& feature : collection["features"]) {
            ids.push_back(feature["id"].get<std::string>());
        }
    }
    ASSERT_EQ(ids.size(), objects.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(ids[i], objects[i].id());
    }
}

TEST(GeometryCodecChunks, RejectsNonPositiveChunkSize) {
    auto objects = many_objects(3);
    auto chunks = collection_to_geojson_chunks(objects, 0, CodecConfig{});
    ASSERT_TRUE(chunks.is_error());
    EXPECT_EQ(chunks.error().code, Error::Code::InvalidArgument);
}

TEST(GeometryCodecChunks, EmptyInputGivesNoChunks) {
    std::vector<RegionObject> objects;
    auto chunks = collection_to_geojson_chunks(objects, 10, CodecConfig{});
    ASSERT_TRUE(chunks.is_ok());
    EXPECT_TRUE(chunks.value().empty());
}

TEST(GeometryCodecChunks, SequentialAndConcurrentOutputsMatch) {
    auto objects = many_objects(250);

    CodecConfig sequential;
    sequential.thresholds = {.decode_array = 1000000, .chunk_encode = 1000000, .feature_list = 1000000};
    CodecConfig concurrent;
    concurrent.thresholds = {.decode_array = 0, .chunk_encode = 0, .feature_list = 0};

    auto seq_chunks = collection_to_geojson_chunks(objects, 7, sequential);
    auto par_chunks = collection_to_geojson_chunks(objects, 7, concurrent);
    ASSERT_TRUE(seq_chunks.is_ok());
    ASSERT_TRUE(par_chunks.is_ok());
    EXPECT_EQ(seq_chunks.value(), par_chunks.value());

    auto seq_list = objects_to_geojson_list(objects, sequential);
    auto par_list = objects_to_geojson_list(objects, concurrent);
    ASSERT_TRUE(seq_list.is_ok());
    ASSERT_TRUE(par_list.is_ok());
    EXPECT_EQ(seq_list.value(), par_list.value());

    auto collection = collection_to_geojson(objects, sequential);
    ASSERT_TRUE(collection.is_ok());
    const std::string as_array = json::parse(collection.value())["features"].dump();
    auto seq_decoded = geojson_to_objects(as_array, sequential);
    auto par_decoded = geojson_to_objects(as_array, concurrent);
    ASSERT_TRUE(seq_decoded.is_ok());
    ASSERT_TRUE(par_decoded.is_ok());
    EXPECT_EQ(seq_decoded.value(), objects);
    EXPECT_EQ(par_decoded.value(), objects);
}

TEST(GeometryCodecList, OneFeaturePerObject) {
    auto objects = sample_objects();
    auto list = objects_to_geojson_list(objects, CodecConfig{});
    ASSERT_TRUE(list.is_ok());
    ASSERT_EQ(list.value().size(), objects.size());
    for (std::size_t i = 0; i < objects.size(); ++i) {
        auto feature = json::parse(list.value()[i]);
        EXPECT_EQ(feature["type"], "Feature");
        EXPECT_EQ(feature["id"], objects[i].id());
    }
}
