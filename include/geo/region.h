#pragma once

#include "geo/geometry.h"

#include <memory>

namespace cinemap {
namespace geo {

// Exact point-in-region test for intersects/within leaves. The region is
// converted to a Boost.Geometry polygon/box once; covers() is then cheap
// and safe to call from several threads.
class RegionMatcher {
public:
    explicit RegionMatcher(const GeometryInfo& region);

    // True when the point lies inside the region or on its boundary.
    bool covers(const Coordinate& point) const;

    const MBR& bounds() const { return bounds_; }

private:
    struct Impl;
    std::shared_ptr<const Impl> impl_;
    MBR bounds_;
};

} // namespace geo
} // namespace cinemap
