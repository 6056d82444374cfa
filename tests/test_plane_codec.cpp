#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "../regionbridge/include/regionbridge/plane_codec.hpp"

using namespace regionbridge;
using nlohmann::json;

// ============================================================================
// Encoding
// ============================================================================

TEST(PlaneCodecEncode, WritesAllThreeMembers) {
    auto encoded = encode_plane(Plane{2, 5, 7});
    EXPECT_EQ(encoded, (json{{"c", 2}, {"z", 5}, {"t", 7}}));
}

TEST(PlaneCodecEncode, DefaultPlaneKeepsAllChannelsMarker) {
    auto encoded = encode_plane(Plane::default_plane());
    EXPECT_EQ(encoded["c"], -1);
    EXPECT_EQ(encoded["z"], 0);
    EXPECT_EQ(encoded["t"], 0);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(PlaneCodecDecode, RoundTripIsExact) {
    for (const Plane& plane : {Plane{-1, 0, 0}, Plane{0, 3, 1}, Plane{12, 40, 99}}) {
        auto decoded = decode_plane(encode_plane(plane));
        ASSERT_TRUE(decoded.is_ok());
        EXPECT_EQ(decoded.value(), plane);

        // Repeated cycles stay stable
        auto again = decode_plane(encode_plane(decoded.value()));
        ASSERT_TRUE(again.is_ok());
        EXPECT_EQ(again.value(), plane);
    }
}

TEST(PlaneCodecDecode, MissingMembersFallBackToDefaultPlane) {
    auto decoded = decode_plane(json{{"z", 3}});
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), (Plane{-1, 3, 0}));
}

TEST(PlaneCodecDecode, EmptyObjectIsDefaultPlane) {
    auto decoded = decode_plane(json::object());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), Plane::default_plane());
}

TEST(PlaneCodecDecode, NullIsDefaultPlane) {
    auto decoded = decode_plane(json(nullptr));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), Plane::default_plane());
}

TEST(PlaneCodecDecode, NullMemberCountsAsMissing) {
    auto decoded = decode_plane(json{{"c", nullptr}, {"z", 2}, {"t", nullptr}});
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), (Plane{-1, 2, 0}));
}

TEST(PlaneCodecDecode, AcceptsWrappedObject) {
    auto decoded = decode_plane(json{{"plane", {{"c", 1}, {"z", 2}, {"t", 3}}}});
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), (Plane{1, 2, 3}));
}

TEST(PlaneCodecDecode, IgnoresUnknownMembers) {
    auto decoded = decode_plane(json{{"c", 0}, {"z", 1}, {"t", 2}, {"extra", "ignored"}});
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), (Plane{0, 1, 2}));
}

TEST(PlaneCodecDecode, AcceptsIntegralFloats) {
    auto decoded = decode_plane(json{{"z", 4.0}});
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().z(), 4);
}

TEST(PlaneCodecDecode, RejectsNonIntegerMember) {
    auto text = decode_plane(json{{"z", "three"}});
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code, Error::Code::DecodeError);

    auto fraction = decode_plane(json{{"t", 1.5}});
    ASSERT_TRUE(fraction.is_error());
    EXPECT_EQ(fraction.error().code, Error::Code::DecodeError);
}

TEST(PlaneCodecDecode, AcceptsQuotedIntegers) {
    auto decoded = decode_plane(json{{"c", "1"}, {"z", "-2"}, {"t", "7"}});
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), (Plane{1, -2, 7}));
}

TEST(PlaneCodecDecode, RejectsPartiallyNumericStrings) {
    for (const char* text : {"", "1.5", "2x", " 3", "99999999999"}) {
        auto decoded = decode_plane(json{{"z", text}});
        ASSERT_TRUE(decoded.is_error()) << '"' << text << '"';
        EXPECT_EQ(decoded.error().code, Error::Code::DecodeError);
    }
}

TEST(PlaneCodecDecode, RejectsOutOfRangeMember) {
    auto decoded = decode_plane(json{{"c", 1LL << 40}});
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::DecodeError);
}

TEST(PlaneCodecDecode, RejectsNonObject) {
    auto decoded = decode_plane(json::array({1, 2, 3}));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::DecodeError);
}
