#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace geo {

// Longitude/latitude pair (WGS84). x = lon, y = lat.
struct Coordinate {
    double x;
    double y;
    
    Coordinate() : x(0.0), y(0.0) {}
    Coordinate(double x_, double y_) : x(x_), y(y_) {}

    double lon() const { return x; }
    double lat() const { return y; }

    bool operator==(const Coordinate& o) const { return x == o.x && y == o.y; }
};

// Minimum Bounding Rectangle
struct MBR {
    double minx = 0.0;
    double miny = 0.0;
    double maxx = 0.0;
    double maxy = 0.0;
    
    MBR() = default;
    MBR(double minx_, double miny_, double maxx_, double maxy_)
        : minx(minx_), miny(miny_), maxx(maxx_), maxy(maxy_) {}
    
    bool intersects(const MBR& other) const {
        return !(minx > other.maxx || maxx < other.minx ||
                 miny > other.maxy || maxy < other.miny);
    }
    
    bool contains(double x, double y) const {
        return x >= minx && x <= maxx && y >= miny && y <= maxy;
    }
    
    // Expand MBR by distance (meters, approximate for lat/lon)
    MBR expand(double distance_meters) const;
};

enum class GeometryType {
    Point,
    Polygon,
    Box
};

// Parsed geometry; only the shapes the filter language accepts.
struct GeometryInfo {
    GeometryType type = GeometryType::Point;
    std::vector<Coordinate> coords;              // Point: 1 coord, Box: 2 corners (min, max)
    std::vector<std::vector<Coordinate>> rings;  // Polygon: outer ring first, then holes

    bool isPoint() const { return type == GeometryType::Point; }
    bool isPolygon() const { return type == GeometryType::Polygon; }
    bool isBox() const { return type == GeometryType::Box; }

    MBR computeMBR() const;
};

enum class DistanceUnit { Meters, Kilometers, Miles, Feet };

// "mi", "mile(s)", "km", "m", "meter(s)", "ft", "feet"; std::nullopt on unknown.
std::optional<DistanceUnit> unitFromString(std::string_view unit);
double toMeters(double value, DistanceUnit unit);

// Great-circle distance in meters (mean Earth radius).
double haversineMeters(const Coordinate& a, const Coordinate& b);

class GeometryParser {
public:
    // POINT(lon lat), POLYGON((lon lat, ...), (hole ...)). Throws std::runtime_error.
    static GeometryInfo parseWKT(const std::string& wkt);

    // GeoJSON Point / Polygon object. Throws std::runtime_error.
    static GeometryInfo parseGeoJSON(const nlohmann::json& j);

    // Region operand of intersects/within: WKT string, GeoJSON object or
    // bbox array [minx, miny, maxx, maxy]. Throws std::runtime_error.
    static GeometryInfo parseRegion(const nlohmann::json& value);

    // Lenient point reader used while loading records: GeoJSON Point, "POINT(x y)",
    // [lon, lat] or {"lat":..,"lon":..}. Returns std::nullopt for anything unusable.
    static std::optional<Coordinate> pointFromJson(const nlohmann::json& value);

    static nlohmann::json toGeoJSON(const Coordinate& point);
};

} // namespace geo
} // namespace cinemap
