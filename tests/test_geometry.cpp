#include <gtest/gtest.h>

#include "geo/geometry.h"
#include "geo/landmarks.h"
#include "geo/region.h"

#include <stdexcept>

using namespace cinemap::geo;
using json = nlohmann::json;

class GeometryTest : public ::testing::Test {
protected:
    const Coordinate unionSquare{-122.4074, 37.7881};
    const Coordinate fairmont{-122.4100, 37.7924};
    const Coordinate goldenGate{-122.4786, 37.8199};
};

TEST_F(GeometryTest, HaversineDistances) {
    EXPECT_DOUBLE_EQ(haversineMeters(unionSquare, unionSquare), 0.0);
    double d = haversineMeters(unionSquare, fairmont);
    EXPECT_GT(d, 450.0);
    EXPECT_LT(d, 600.0);
    EXPECT_NEAR(haversineMeters(unionSquare, fairmont), haversineMeters(fairmont, unionSquare), 1e-9);
    EXPECT_GT(haversineMeters(unionSquare, goldenGate), toMeters(3.0, DistanceUnit::Miles));
}

TEST_F(GeometryTest, Units) {
    EXPECT_EQ(unitFromString("mi"), DistanceUnit::Miles);
    EXPECT_EQ(unitFromString(""), DistanceUnit::Miles);
    EXPECT_EQ(unitFromString(" KM "), DistanceUnit::Kilometers);
    EXPECT_EQ(unitFromString("meters"), DistanceUnit::Meters);
    EXPECT_EQ(unitFromString("feet"), DistanceUnit::Feet);
    EXPECT_FALSE(unitFromString("parsec").has_value());

    EXPECT_DOUBLE_EQ(toMeters(2.0, DistanceUnit::Kilometers), 2000.0);
    EXPECT_NEAR(toMeters(1.0, DistanceUnit::Miles), 1609.344, 1e-6);
}

TEST_F(GeometryTest, ParseWKT) {
    auto p = GeometryParser::parseWKT("POINT(-122.4 37.8)");
    ASSERT_TRUE(p.isPoint());
    EXPECT_DOUBLE_EQ(p.coords[0].lon(), -122.4);
    EXPECT_DOUBLE_EQ(p.coords[0].lat(), 37.8);

    auto poly = GeometryParser::parseWKT("POLYGON((0 0, 10 0, 10 10, 0 10, 0 0))");
    ASSERT_TRUE(poly.isPolygon());
    ASSERT_EQ(poly.rings.size(), 1u);
    auto mbr = poly.computeMBR();
    EXPECT_DOUBLE_EQ(mbr.maxx, 10.0);
    EXPECT_DOUBLE_EQ(mbr.miny, 0.0);

    EXPECT_THROW(GeometryParser::parseWKT("LINESTRING(0 0, 1 1)"), std::runtime_error);
    EXPECT_THROW(GeometryParser::parseWKT("POINT()"), std::runtime_error);
}

TEST_F(GeometryTest, ParseRegionForms) {
    auto box = GeometryParser::parseRegion(json::array({-122.5, 37.7, -122.3, 37.9}));
    EXPECT_TRUE(box.isBox());

    json geojson = {{"type", "Polygon"},
                    {"coordinates", {{{-122.5, 37.7}, {-122.3, 37.7}, {-122.3, 37.9}, {-122.5, 37.9}, {-122.5, 37.7}}}}};
    EXPECT_TRUE(GeometryParser::parseRegion(geojson).isPolygon());

    EXPECT_THROW(GeometryParser::parseRegion(json::array({1, 2, 0, 3})), std::runtime_error);
    EXPECT_THROW(GeometryParser::parseRegion(42), std::runtime_error);
}

TEST_F(GeometryTest, PointFromJsonIsLenient) {
    auto a = GeometryParser::pointFromJson(json{{"type", "Point"}, {"coordinates", {-122.4, 37.8}}});
    ASSERT_TRUE(a.has_value());
    EXPECT_DOUBLE_EQ(a->lon(), -122.4);

    auto b = GeometryParser::pointFromJson(json{{"lat", 37.8}, {"lon", "-122.4"}});
    ASSERT_TRUE(b.has_value());
    EXPECT_DOUBLE_EQ(b->lat(), 37.8);

    EXPECT_TRUE(GeometryParser::pointFromJson("POINT(1 2)").has_value());
    EXPECT_FALSE(GeometryParser::pointFromJson(nullptr).has_value());
    EXPECT_FALSE(GeometryParser::pointFromJson("None").has_value());
    EXPECT_FALSE(GeometryParser::pointFromJson("not a point").has_value());
    EXPECT_FALSE(GeometryParser::pointFromJson(json::array({1})).has_value());
}

TEST_F(GeometryTest, RegionCoversInsideAndBoundary) {
    RegionMatcher square(GeometryParser::parseWKT("POLYGON((0 0, 10 0, 10 10, 0 10, 0 0))"));
    EXPECT_TRUE(square.covers(Coordinate(5, 5)));
    EXPECT_TRUE(square.covers(Coordinate(10, 5)));
    EXPECT_FALSE(square.covers(Coordinate(11, 5)));

    RegionMatcher box(GeometryParser::parseRegion(json::array({-122.42, 37.78, -122.40, 37.80})));
    EXPECT_TRUE(box.covers(unionSquare));
    EXPECT_FALSE(box.covers(goldenGate));
}

TEST_F(GeometryTest, RegionWithHole) {
    RegionMatcher donut(GeometryParser::parseWKT(
        "POLYGON((0 0, 10 0, 10 10, 0 10, 0 0), (4 4, 6 4, 6 6, 4 6, 4 4))"));
    EXPECT_TRUE(donut.covers(Coordinate(1, 1)));
    EXPECT_FALSE(donut.covers(Coordinate(5, 5)));
}

TEST(LandmarkRegistryTest, BuiltinLookupIgnoresCaseAndArticle) {
    const auto& reg = LandmarkRegistry::builtin();
    auto us = reg.find("union square");
    ASSERT_TRUE(us.has_value());
    EXPECT_NEAR(us->lat(), 37.7881, 1e-9);
    EXPECT_TRUE(reg.find("The Embarcadero").has_value());
    EXPECT_TRUE(reg.find("  GOLDEN GATE BRIDGE ").has_value());
    EXPECT_FALSE(reg.find("Mordor").has_value());
}

TEST(LandmarkRegistryTest, AddOverridesExisting) {
    LandmarkRegistry reg;
    const size_t before = reg.all().size();
    reg.add("Union Square", Coordinate(1, 2));
    reg.add("Dolores Park", Coordinate(-122.4276, 37.7596));
    EXPECT_EQ(reg.all().size(), before + 1);
    EXPECT_DOUBLE_EQ(reg.find("union square")->x, 1.0);
    EXPECT_TRUE(reg.find("dolores park").has_value());
}
