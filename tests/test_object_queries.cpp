#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>

#include "../regionbridge/include/regionbridge/regionbridge.hpp"

using namespace regionbridge;

namespace {

RegionObject make_object(std::string id, MeasurementMap measurements) {
    RegionObject object{std::move(id), Region{Rectangle{0, 0, 10, 10}}, ObjectType::Detection};
    object.measurements() = std::move(measurements);
    return object;
}

std::vector<RegionObject> sample_objects() {
    return {
        make_object("a", {{"Area", 100.0}, {"Perimeter", 40.0}}),
        make_object("b", {{"Area", 25.0}, {"Nucleus: Hematoxylin OD mean", 0.4}}),
        make_object("c", {}),
    };
}

} // namespace

TEST(ObjectQueries, IdsFollowInputOrder) {
    auto objects = sample_objects();
    EXPECT_EQ(object_ids(objects), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ObjectQueries, IdsOfEmptyInput) {
    std::vector<RegionObject> objects;
    EXPECT_TRUE(object_ids(objects).empty());
    EXPECT_TRUE(measurement_names(objects).empty());
}

TEST(ObjectQueries, MeasurementNamesAreDistinctInFirstSeenOrder) {
    auto objects = sample_objects();
    EXPECT_EQ(measurement_names(objects),
              (std::vector<std::string>{"Area", "Perimeter", "Nucleus: Hematoxylin OD mean"}));
}

TEST(ObjectQueries, MeasurementValuesLeaveGapsForMissingEntries) {
    auto objects = sample_objects();

    auto area = measurement_values(objects, "Area");
    ASSERT_EQ(area.size(), 3u);
    EXPECT_EQ(area[0], 100.0);
    EXPECT_EQ(area[1], 25.0);
    EXPECT_FALSE(area[2].has_value());

    auto perimeter = measurement_values(objects, "Perimeter");
    ASSERT_EQ(perimeter.size(), 3u);
    EXPECT_EQ(perimeter[0], 40.0);
    EXPECT_FALSE(perimeter[1].has_value());

    auto unknown = measurement_values(objects, "Eccentricity");
    ASSERT_EQ(unknown.size(), 3u);
    for (const auto& value : unknown) {
        EXPECT_FALSE(value.has_value());
    }
}

TEST(ObjectQueries, NonFiniteValuesAreReturnedAsIs) {
    std::vector<RegionObject> objects{make_object("x", {{"Ratio", std::nan("")}})};
    auto values = measurement_values(objects, "Ratio");
    ASSERT_EQ(values.size(), 1u);
    ASSERT_TRUE(values[0].has_value());
    EXPECT_TRUE(std::isnan(*values[0]));
}

TEST(ObjectQueries, QueriesOverDecodedFeatures) {
    const char* text = R"({
        "type": "FeatureCollection",
        "features": [
            {"type": "Feature", "id": "cell-1",
             "geometry": {"type": "Point", "coordinates": [1, 2]},
             "properties": {"measurements": {"Area": 12.5, "Circularity": 0.9}}},
            {"type": "Feature", "id": "cell-2",
             "geometry": {"type": "Point", "coordinates": [3, 4]},
             "properties": {"measurements": {"Area": 7.0}}}
        ]
    })";

    auto objects = geojson_to_objects(text, CodecConfig{});
    ASSERT_TRUE(objects.is_ok());
    EXPECT_EQ(object_ids(objects.value()), (std::vector<std::string>{"cell-1", "cell-2"}));
    EXPECT_EQ(measurement_names(objects.value()), (std::vector<std::string>{"Area", "Circularity"}));

    auto circularity = measurement_values(objects.value(), "Circularity");
    ASSERT_EQ(circularity.size(), 2u);
    EXPECT_EQ(circularity[0], 0.9);
    EXPECT_FALSE(circularity[1].has_value());
}
