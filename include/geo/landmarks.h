#pragma once

#include "geo/geometry.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cinemap {
namespace geo {

/**
 * @brief Named reference points for within_distance centers
 *
 * Lookup is case-insensitive and ignores surrounding whitespace and a leading
 * "the " ("the Embarcadero"). Built-in San Francisco landmarks are always
 * present; configuration may add or override entries.
 */
class LandmarkRegistry {
public:
    struct Landmark {
        std::string name;
        Coordinate point;
    };

    LandmarkRegistry();

    void add(const std::string& name, const Coordinate& point);
    std::optional<Coordinate> find(std::string_view name) const;
    std::vector<Landmark> all() const;

    static const LandmarkRegistry& builtin();

private:
    static std::string key(std::string_view name);

    std::vector<Landmark> landmarks_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace geo
} // namespace cinemap
