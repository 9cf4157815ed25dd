#include "geo/region.h"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/box.hpp>

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace cinemap { namespace geo {

namespace bg = boost::geometry;
using Point = bg::model::d2::point_xy<double>;
using Polygon = bg::model::polygon<Point>;
using Box = bg::model::box<Point>;

struct RegionMatcher::Impl {
    std::variant<Polygon, Box, Point> shape;
};

/// Convert GeometryInfo to Boost.Geometry polygon
static Polygon toBoostPolygon(const GeometryInfo& geom) {
    Polygon poly;
    for (size_t i = 0; i < geom.rings.size(); ++i) {
        if (i == 0) {
            // Outer ring
            for (const auto& coord : geom.rings[i]) {
                bg::append(poly.outer(), Point(coord.x, coord.y));
            }
        } else {
            // Inner ring (hole)
            Polygon::ring_type hole;
            for (const auto& coord : geom.rings[i]) {
                bg::append(hole, Point(coord.x, coord.y));
            }
            poly.inners().push_back(hole);
        }
    }
    // User-supplied rings may be open or wound either way.
    bg::correct(poly);
    return poly;
}

RegionMatcher::RegionMatcher(const GeometryInfo& region)
    : bounds_(region.computeMBR()) {
    auto impl = std::make_shared<Impl>();
    switch (region.type) {
        case GeometryType::Polygon:
            impl->shape = toBoostPolygon(region);
            break;
        case GeometryType::Box:
            impl->shape = Box(Point(region.coords[0].x, region.coords[0].y),
                              Point(region.coords[1].x, region.coords[1].y));
            break;
        case GeometryType::Point:
            if (region.coords.empty()) throw std::runtime_error("Empty point region");
            impl->shape = Point(region.coords[0].x, region.coords[0].y);
            break;
    }
    impl_ = std::move(impl);
}

bool RegionMatcher::covers(const Coordinate& point) const {
    if (!bounds_.contains(point.x, point.y)) {
        return false;
    }
    Point p(point.x, point.y);
    return std::visit([&](const auto& shape) -> bool {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, Point>) {
            return bg::equals(shape, p);
        } else {
            return bg::covered_by(p, shape);
        }
    }, impl_->shape);
}

}} // namespace cinemap::geo
