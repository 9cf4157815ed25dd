#include "geo/geometry.h"
#include "utils/normalizer.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cinemap {
namespace geo {

using json = nlohmann::json;

// Constants
constexpr double EARTH_RADIUS_METERS = 6371000.0;  // Mean Earth radius
constexpr double DEG_TO_RAD = M_PI / 180.0;
constexpr double METERS_PER_DEGREE_APPROX = 111320.0;  // At equator
constexpr double METERS_PER_MILE = 1609.344;
constexpr double METERS_PER_FOOT = 0.3048;

MBR MBR::expand(double distance_meters) const {
    double delta_deg = distance_meters / METERS_PER_DEGREE_APPROX;
    return MBR(minx - delta_deg, miny - delta_deg, maxx + delta_deg, maxy + delta_deg);
}

MBR GeometryInfo::computeMBR() const {
    if (coords.empty() && rings.empty()) {
        return MBR();
    }
    
    MBR mbr;
    const Coordinate& first = coords.empty() ? rings[0][0] : coords[0];
    mbr.minx = mbr.maxx = first.x;
    mbr.miny = mbr.maxy = first.y;
    
    auto update_mbr = [&](const Coordinate& c) {
        mbr.minx = std::min(mbr.minx, c.x);
        mbr.maxx = std::max(mbr.maxx, c.x);
        mbr.miny = std::min(mbr.miny, c.y);
        mbr.maxy = std::max(mbr.maxy, c.y);
    };
    
    for (const auto& c : coords) update_mbr(c);
    for (const auto& ring : rings) {
        for (const auto& c : ring) update_mbr(c);
    }
    return mbr;
}

std::optional<DistanceUnit> unitFromString(std::string_view unit) {
    std::string u = utils::Normalizer::toLower(utils::Normalizer::trim(unit));
    if (u.empty() || u == "mi" || u == "mile" || u == "miles") return DistanceUnit::Miles;
    if (u == "km" || u == "kilometer" || u == "kilometers" || u == "kilometre" || u == "kilometres") return DistanceUnit::Kilometers;
    if (u == "m" || u == "meter" || u == "meters" || u == "metre" || u == "metres") return DistanceUnit::Meters;
    if (u == "ft" || u == "foot" || u == "feet") return DistanceUnit::Feet;
    return std::nullopt;
}

double toMeters(double value, DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::Meters: return value;
        case DistanceUnit::Kilometers: return value * 1000.0;
        case DistanceUnit::Miles: return value * METERS_PER_MILE;
        case DistanceUnit::Feet: return value * METERS_PER_FOOT;
    }
    return value;
}

double haversineMeters(const Coordinate& a, const Coordinate& b) {
    double dlat = (b.lat() - a.lat()) * DEG_TO_RAD;
    double dlon = (b.lon() - a.lon()) * DEG_TO_RAD;
    
    double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(a.lat() * DEG_TO_RAD) * std::cos(b.lat() * DEG_TO_RAD) *
               std::sin(dlon / 2) * std::sin(dlon / 2);
    
    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return EARTH_RADIUS_METERS * c;
}

namespace {

// "x y, x y, ..." -> coordinates
std::vector<Coordinate> parseCoordList(const std::string& body) {
    std::vector<Coordinate> out;
    std::stringstream ss(body);
    std::string pair;
    while (std::getline(ss, pair, ',')) {
        std::istringstream ps(pair);
        double x = 0.0, y = 0.0;
        if (!(ps >> x >> y)) {
            throw std::runtime_error("Invalid WKT coordinate: '" + utils::Normalizer::trim(pair) + "'");
        }
        out.emplace_back(x, y);
    }
    return out;
}

std::vector<Coordinate> ringFromJson(const json& ring) {
    if (!ring.is_array()) throw std::runtime_error("GeoJSON ring must be an array");
    std::vector<Coordinate> out;
    for (const auto& c : ring) {
        if (!c.is_array() || c.size() < 2 || !c[0].is_number() || !c[1].is_number()) {
            throw std::runtime_error("GeoJSON position must be [x, y]");
        }
        out.emplace_back(c[0].get<double>(), c[1].get<double>());
    }
    return out;
}

void validatePolygon(const GeometryInfo& g) {
    if (g.rings.empty() || g.rings[0].size() < 3) {
        throw std::runtime_error("Polygon needs an outer ring with at least 3 positions");
    }
}

std::optional<double> numberOf(const json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        auto s = utils::Normalizer::canonical(v.get<std::string>());
        if (!s) return std::nullopt;
        try {
            size_t idx = 0;
            double d = std::stod(*s, &idx);
            if (idx != s->size()) return std::nullopt;
            return d;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

GeometryInfo GeometryParser::parseWKT(const std::string& wkt) {
    std::string up = wkt;
    std::transform(up.begin(), up.end(), up.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    up = utils::Normalizer::trim(up);

    GeometryInfo g;
    if (up.rfind("POINT", 0) == 0) {
        size_t a = up.find('('), b = up.find(')');
        if (a == std::string::npos || b == std::string::npos || b <= a + 1) throw std::runtime_error("Invalid POINT WKT");
        auto pts = parseCoordList(up.substr(a + 1, b - a - 1));
        if (pts.size() != 1) throw std::runtime_error("Invalid POINT WKT");
        g.type = GeometryType::Point;
        g.coords = std::move(pts);
        return g;
    }
    if (up.rfind("POLYGON", 0) == 0) {
        size_t a = up.find("(("), b = up.rfind("))");
        if (a == std::string::npos || b == std::string::npos || b <= a + 1) throw std::runtime_error("Invalid POLYGON WKT");
        std::string body = up.substr(a + 1, b - a);  // "(ring), (ring)"
        g.type = GeometryType::Polygon;
        size_t pos = 0;
        while ((pos = body.find('(', pos)) != std::string::npos) {
            size_t close = body.find(')', pos);
            if (close == std::string::npos) throw std::runtime_error("Invalid POLYGON WKT");
            g.rings.push_back(parseCoordList(body.substr(pos + 1, close - pos - 1)));
            pos = close + 1;
        }
        validatePolygon(g);
        return g;
    }
    throw std::runtime_error("Unsupported WKT (POINT, POLYGON): " + wkt);
}

GeometryInfo GeometryParser::parseGeoJSON(const json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw std::runtime_error("GeoJSON geometry needs a 'type'");
    }
    std::string type = j["type"].get<std::string>();
    if (!j.contains("coordinates")) throw std::runtime_error("GeoJSON geometry needs 'coordinates'");
    const auto& coords = j["coordinates"];

    GeometryInfo g;
    if (type == "Point") {
        auto pts = ringFromJson(json::array({coords}));
        g.type = GeometryType::Point;
        g.coords = std::move(pts);
        return g;
    }
    if (type == "Polygon") {
        if (!coords.is_array()) throw std::runtime_error("GeoJSON Polygon coordinates must be an array");
        g.type = GeometryType::Polygon;
        for (const auto& ring : coords) g.rings.push_back(ringFromJson(ring));
        validatePolygon(g);
        return g;
    }
    throw std::runtime_error("Unsupported GeoJSON geometry type: " + type);
}

GeometryInfo GeometryParser::parseRegion(const json& value) {
    if (value.is_string()) return parseWKT(value.get<std::string>());
    if (value.is_object()) {
        if (value.contains("geometry")) return parseGeoJSON(value["geometry"]);
        return parseGeoJSON(value);
    }
    if (value.is_array() && value.size() == 4) {
        std::vector<double> v;
        for (const auto& e : value) {
            if (!e.is_number()) throw std::runtime_error("Bounding box must be [minx, miny, maxx, maxy]");
            v.push_back(e.get<double>());
        }
        if (v[0] > v[2] || v[1] > v[3]) throw std::runtime_error("Bounding box min must not exceed max");
        GeometryInfo g;
        g.type = GeometryType::Box;
        g.coords = {Coordinate(v[0], v[1]), Coordinate(v[2], v[3])};
        return g;
    }
    throw std::runtime_error("Region must be WKT, GeoJSON or [minx, miny, maxx, maxy]");
}

std::optional<Coordinate> GeometryParser::pointFromJson(const json& value) {
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) {
        if (utils::Normalizer::isAbsent(value.get<std::string>())) return std::nullopt;
        try {
            auto g = parseWKT(value.get<std::string>());
            if (g.isPoint()) return g.coords.front();
        } catch (const std::runtime_error&) {
            return std::nullopt;
        }
        return std::nullopt;
    }
    if (value.is_array()) {
        if (value.size() < 2) return std::nullopt;
        auto x = numberOf(value[0]);
        auto y = numberOf(value[1]);
        if (!x || !y) return std::nullopt;
        return Coordinate(*x, *y);
    }
    if (value.is_object()) {
        if (value.contains("type") && value.contains("coordinates")) {
            if (value["type"] != "Point") return std::nullopt;
            return pointFromJson(value["coordinates"]);
        }
        auto lookup = [&](std::initializer_list<const char*> keys) -> std::optional<double> {
            for (const char* k : keys) {
                if (value.contains(k)) return numberOf(value[k]);
            }
            return std::nullopt;
        };
        auto lat = lookup({"lat", "latitude", "Lat", "Latitude"});
        auto lon = lookup({"lon", "lng", "longitude", "Lon", "Longitude"});
        if (!lat || !lon) return std::nullopt;
        return Coordinate(*lon, *lat);
    }
    return std::nullopt;
}

json GeometryParser::toGeoJSON(const Coordinate& point) {
    return json{{"type", "Point"}, {"coordinates", {point.x, point.y}}};
}

} // namespace geo
} // namespace cinemap
