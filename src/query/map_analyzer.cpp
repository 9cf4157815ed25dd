#include "query/map_analyzer.h"
#include "utils/normalizer.h"

namespace cinemap {
namespace query {

using json = nlohmann::json;
using utils::Normalizer;

namespace {

const json* fieldCI(const json& obj, std::initializer_list<const char*> names) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        for (const char* n : names) {
            if (Normalizer::equalsIgnoreCase(it.key(), n)) return &it.value();
        }
    }
    return nullptr;
}

} // namespace

std::string MapAnalyzer::dataType(const json& data) {
    if (data.is_null()) return "None";
    if (data.is_object()) return "Dict";
    if (data.is_array()) return "List";
    if (data.is_string()) return "str";
    if (data.is_boolean()) return "bool";
    if (data.is_number_float()) return "float";
    return "int";
}

json MapAnalyzer::analyze(const ResultEnvelope& result) const {
    return analyzeData(result.data);
}

json MapAnalyzer::analyzeData(const json& data) const {
    json out = {
        {"can_map", false},
        {"reason", ""},
        {"location_data", nullptr},
        {"data_type", dataType(data)}
    };
    if (data.is_null()) {
        out["reason"] = "No data in result";
        return out;
    }
    if (data.is_primitive()) {
        out["reason"] = "Data is scalar (" + dataType(data) + "), not mappable";
        return out;
    }

    std::vector<MapPoint> points;
    if (data.is_array()) {
        points = fromList(data);
    } else if (data.is_object()) {
        points = fromDict(data);
    }

    if (points.empty()) {
        out["reason"] = "No location data found in result";
        return out;
    }
    json locations = json::array();
    for (const auto& p : points) {
        locations.push_back({
            {"location_name", p.name},
            {"lon", p.point.lon()},
            {"lat", p.point.lat()},
            {"metadata", p.metadata}
        });
    }
    out["can_map"] = true;
    out["reason"] = "Found " + std::to_string(points.size()) + " mappable locations";
    out["location_data"] = std::move(locations);
    return out;
}

bool MapAnalyzer::probe(const json& list) const {
    size_t n = 0;
    for (const auto& item : list) {
        if (n++ >= probe_size_) break;
        if (item.is_string() && store_.isKnownLocation(item.get<std::string>())) return true;
    }
    return false;
}

json MapAnalyzer::storeMetadata(const std::string& location) const {
    auto rec = store_.locationRecord(location);
    if (!rec) return json::object();
    const auto& r = store_.at(*rec);
    auto title = Normalizer::canonical(r.title);
    return {
        {"title", title ? json(*title) : json(nullptr)},
        {"year", r.year ? json(*r.year) : json(nullptr)}
    };
}

std::optional<MapAnalyzer::MapPoint> MapAnalyzer::lookup(const std::string& location, json metadata) const {
    auto point = store_.locationPoint(location);
    if (!point) return std::nullopt;
    auto name = Normalizer::canonical(location);
    return MapPoint{name.value_or(location), *point, std::move(metadata)};
}

std::vector<MapAnalyzer::MapPoint> MapAnalyzer::fromList(const json& list) const {
    std::vector<MapPoint> out;
    if (list.empty()) return out;

    if (list.front().is_string()) {
        if (!probe(list)) return out;
        for (const auto& item : list) {
            if (!item.is_string()) continue;
            const std::string loc = item.get<std::string>();
            if (auto p = lookup(loc, storeMetadata(loc))) out.push_back(std::move(*p));
        }
        return out;
    }
    if (list.front().is_object()) {
        return fromRows(list);
    }
    return out;
}

std::vector<MapAnalyzer::MapPoint> MapAnalyzer::fromRows(const json& rows) const {
    std::vector<MapPoint> out;
    for (const auto& row : rows) {
        if (!row.is_object()) continue;

        json metadata = json::object();
        if (const json* t = fieldCI(row, {"title", "film_title"})) metadata["film_title"] = *t;
        if (const json* y = fieldCI(row, {"year", "release_year"})) metadata["year"] = *y;

        const json* loc = fieldCI(row, {"locations", "location", "place"});
        const json* geom = fieldCI(row, {"geometry"});

        // Rows that carry their own point win over the name lookup.
        if (geom) {
            if (auto p = geo::GeometryParser::pointFromJson(*geom)) {
                std::string name = "Unknown";
                if (loc && loc->is_string()) name = loc->get<std::string>();
                out.push_back(MapPoint{name, *p, metadata});
                continue;
            }
        }
        if (!loc) continue;
        if (loc->is_string()) {
            if (auto p = lookup(loc->get<std::string>(), metadata)) out.push_back(std::move(*p));
        } else if (loc->is_array()) {
            for (const auto& l : *loc) {
                if (!l.is_string()) continue;
                if (auto p = lookup(l.get<std::string>(), metadata)) out.push_back(std::move(*p));
            }
        }
    }
    return out;
}

std::vector<MapAnalyzer::MapPoint> MapAnalyzer::fromDict(const json& dict) const {
    std::vector<MapPoint> out;
    if (dict.empty()) return out;

    // {"Vertigo (1958)": ["Fort Point", ...]}
    for (auto it = dict.begin(); it != dict.end(); ++it) {
        if (!it.value().is_array() || !probe(it.value())) continue;
        for (const auto& item : it.value()) {
            if (!item.is_string()) continue;
            if (auto p = lookup(item.get<std::string>(), json{{"group", it.key()}})) out.push_back(std::move(*p));
        }
    }
    if (!out.empty()) return out;

    // {"Fort Point": 4, ...}
    for (auto it = dict.begin(); it != dict.end(); ++it) {
        if (!store_.isKnownLocation(it.key())) continue;
        if (auto p = lookup(it.key(), json{{"value", it.value()}})) out.push_back(std::move(*p));
    }
    if (!out.empty()) return out;

    // {"locations": [...]} / {"location": "..."}
    if (const json* loc = fieldCI(dict, {"locations", "location"})) {
        if (loc->is_array()) return fromList(*loc);
        if (loc->is_string()) {
            const std::string l = loc->get<std::string>();
            if (auto p = lookup(l, storeMetadata(l))) out.push_back(std::move(*p));
        }
    }
    return out;
}

} // namespace query
} // namespace cinemap
