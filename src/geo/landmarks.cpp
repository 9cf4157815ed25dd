#include "geo/landmarks.h"
#include "utils/normalizer.h"

namespace cinemap {
namespace geo {

using utils::Normalizer;

LandmarkRegistry::LandmarkRegistry() {
    add("Union Square", Coordinate(-122.4074, 37.7881));
    add("Embarcadero", Coordinate(-122.3923, 37.7956));
    add("Golden Gate Bridge", Coordinate(-122.4786, 37.8199));
    add("Fisherman's Wharf", Coordinate(-122.4178, 37.8080));
    add("Alcatraz Island", Coordinate(-122.4230, 37.8270));
    add("Coit Tower", Coordinate(-122.4058, 37.8024));
}

std::string LandmarkRegistry::key(std::string_view name) {
    std::string k = Normalizer::toLower(Normalizer::trim(name));
    if (k.rfind("the ", 0) == 0) k.erase(0, 4);
    return k;
}

void LandmarkRegistry::add(const std::string& name, const Coordinate& point) {
    auto k = key(name);
    auto it = index_.find(k);
    if (it != index_.end()) {
        landmarks_[it->second].point = point;
        return;
    }
    index_.emplace(k, landmarks_.size());
    landmarks_.push_back({Normalizer::trim(name), point});
}

std::optional<Coordinate> LandmarkRegistry::find(std::string_view name) const {
    auto it = index_.find(key(name));
    if (it == index_.end()) return std::nullopt;
    return landmarks_[it->second].point;
}

std::vector<LandmarkRegistry::Landmark> LandmarkRegistry::all() const {
    return landmarks_;
}

const LandmarkRegistry& LandmarkRegistry::builtin() {
    static const LandmarkRegistry registry;
    return registry;
}

} // namespace geo
} // namespace cinemap
