#include "storage/record_store.h"
#include "utils/logger.h"
#include "utils/normalizer.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace cinemap {

using json = nlohmann::json;
using utils::Normalizer;

namespace {

bool hasSuffix(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return Normalizer::equalsIgnoreCase(
        std::string_view(s).substr(s.size() - suffix.size()), suffix);
}

// Column values arrive as strings, numbers or null depending on the export.
std::string cellText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return {};
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isnan(d)) return {};
        if (std::floor(d) == d && std::fabs(d) < 1e15) {
            return std::to_string(static_cast<long long>(d));
        }
        std::ostringstream ss;
        ss << d;
        return ss.str();
    }
    return v.dump();
}

// "2003", "2003.0" -> 2003. Anything else is not a year.
std::optional<int> parseYear(const std::string& text) {
    auto c = Normalizer::canonical(text);
    if (!c) return std::nullopt;
    try {
        size_t pos = 0;
        double d = std::stod(*c, &pos);
        if (pos != c->size() || !std::isfinite(d) || std::floor(d) != d) return std::nullopt;
        if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(d);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string canonicalYearText(const std::string& raw, const std::optional<int>& year) {
    if (year) return std::to_string(*year);
    return raw;
}

const json* findMember(const json& obj, std::initializer_list<const char*> names) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        for (const char* n : names) {
            if (Normalizer::equalsIgnoreCase(it.key(), n)) return &it.value();
        }
    }
    return nullptr;
}

std::optional<double> numberOf(const json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        try {
            size_t pos = 0;
            const std::string s = v.get<std::string>();
            double d = std::stod(s, &pos);
            if (pos == s.size()) return d;
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

} // namespace

RecordStore::RecordStore(ConstructTag, std::vector<LocationRecord> records)
    : records_(std::move(records)) {
    buildIndexes();
}

RecordStorePtr RecordStore::fromRecords(std::vector<LocationRecord> records) {
    return std::make_shared<const RecordStore>(ConstructTag{}, std::move(records));
}

LocationRecord RecordStore::recordFromJson(const json& input, size_t ordinal) {
    // GeoJSON Feature: columns live in "properties"
    const json* props = &input;
    const json* featureGeometry = nullptr;
    if (input.contains("properties") && input["properties"].is_object()) {
        props = &input["properties"];
        if (input.contains("geometry")) featureGeometry = &input["geometry"];
    }

    LocationRecord r;
    for (auto it = props->begin(); it != props->end(); ++it) {
        auto field = fieldFromString(it.key());
        if (!field) continue;
        switch (*field) {
            case RecordField::Id: r.id = cellText(it.value()); break;
            case RecordField::Title: r.title = cellText(it.value()); break;
            case RecordField::Year: r.year_text = cellText(it.value()); break;
            case RecordField::Locations: r.locations = cellText(it.value()); break;
            case RecordField::FunFacts: r.fun_facts = cellText(it.value()); break;
            case RecordField::Director: r.director = cellText(it.value()); break;
            case RecordField::Writer: r.writer = cellText(it.value()); break;
            case RecordField::Actor1: r.actor_1 = cellText(it.value()); break;
            case RecordField::Actor2: r.actor_2 = cellText(it.value()); break;
            case RecordField::Actor3: r.actor_3 = cellText(it.value()); break;
            case RecordField::Geometry:
                if (!featureGeometry) r.geometry = geo::GeometryParser::pointFromJson(it.value());
                break;
            case RecordField::Actor:
                break;
        }
    }
    if (featureGeometry) {
        r.geometry = geo::GeometryParser::pointFromJson(*featureGeometry);
    }
    if (!r.geometry) {
        const json* lat = findMember(*props, {"lat", "latitude"});
        const json* lon = findMember(*props, {"lon", "lng", "longitude"});
        if (lat && lon) {
            auto la = numberOf(*lat);
            auto lo = numberOf(*lon);
            if (la && lo) r.geometry = geo::Coordinate(*lo, *la);
        }
    }

    if (Normalizer::isAbsent(r.id)) r.id = std::to_string(ordinal);
    r.year = parseYear(r.year_text);
    r.year_text = canonicalYearText(r.year_text, r.year);
    return r;
}

std::pair<RecordStore::Status, RecordStorePtr> RecordStore::fromJson(const json& doc) {
    const json* rows = nullptr;
    if (doc.is_array()) {
        rows = &doc;
    } else if (doc.is_object()) {
        if (doc.value("type", "") == "FeatureCollection" && doc.contains("features")) {
            rows = &doc["features"];
        } else if (doc.contains("records")) {
            rows = &doc["records"];
        }
    }
    if (!rows || !rows->is_array()) {
        return {Status::Error("expected a JSON array of records, {\"records\": [...]} or a FeatureCollection"), nullptr};
    }

    std::vector<LocationRecord> records;
    records.reserve(rows->size());
    for (size_t i = 0; i < rows->size(); ++i) {
        const auto& row = (*rows)[i];
        if (!row.is_object()) {
            return {Status::Error("record " + std::to_string(i) + " is not an object"), nullptr};
        }
        records.push_back(recordFromJson(row, i));
    }
    return {Status::OK(), fromRecords(std::move(records))};
}

std::pair<RecordStore::Status, RecordStorePtr> RecordStore::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return {Status::Error("cannot open data file: " + path), nullptr};
    }

    if (hasSuffix(path, ".jsonl") || hasSuffix(path, ".ndjson")) {
        std::vector<LocationRecord> records;
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (Normalizer::trim(line).empty()) continue;
            json row;
            try {
                row = json::parse(line);
            } catch (const json::parse_error& e) {
                return {Status::Error(path + ":" + std::to_string(lineNo) + ": " + e.what()), nullptr};
            }
            if (!row.is_object()) {
                return {Status::Error(path + ":" + std::to_string(lineNo) + ": record is not an object"), nullptr};
            }
            records.push_back(recordFromJson(row, records.size()));
        }
        auto store = fromRecords(std::move(records));
        CINEMAP_INFO("Loaded {} records ({} productions) from {}", store->size(), store->productionCount(), path);
        return {Status::OK(), store};
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        return {Status::Error(path + ": " + e.what()), nullptr};
    }
    auto [st, store] = fromJson(doc);
    if (!st.ok) {
        return {Status::Error(path + ": " + st.message), nullptr};
    }
    CINEMAP_INFO("Loaded {} records ({} productions) from {}", store->size(), store->productionCount(), path);
    return {st, store};
}

void RecordStore::buildIndexes() {
    record_production_.resize(records_.size());
    std::vector<std::unordered_set<std::string>> seenLocations;

    for (size_t i = 0; i < records_.size(); ++i) {
        const auto& r = records_[i];
        ProductionId pid = r.production();
        auto [it, inserted] = production_index_.emplace(pid, productions_.size());
        if (inserted) {
            productions_.push_back(std::move(pid));
            production_records_.emplace_back();
            production_locations_.emplace_back();
            seenLocations.emplace_back();
        }
        const size_t ord = it->second;
        record_production_[i] = ord;
        production_records_[ord].push_back(i);

        if (auto loc = Normalizer::canonical(r.locations)) {
            if (seenLocations[ord].insert(*loc).second) {
                production_locations_[ord].push_back(*loc);
            }
            auto [ref, fresh] = locations_.emplace(*loc, LocationRef{i, r.geometry.has_value()});
            if (!fresh && !ref->second.has_point && r.geometry) {
                ref->second = LocationRef{i, true};
            }
        }
    }
}

std::optional<size_t> RecordStore::findProduction(const ProductionId& id) const {
    auto it = production_index_.find(id);
    if (it == production_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<size_t> RecordStore::locationRecord(std::string_view location) const {
    auto c = Normalizer::canonical(location);
    if (!c) return std::nullopt;
    auto it = locations_.find(*c);
    if (it == locations_.end()) return std::nullopt;
    return it->second.record;
}

std::optional<geo::Coordinate> RecordStore::locationPoint(std::string_view location) const {
    auto rec = locationRecord(location);
    if (!rec) return std::nullopt;
    return records_[*rec].geometry;
}

bool RecordStore::isKnownLocation(std::string_view location) const {
    return locationRecord(location).has_value();
}

} // namespace cinemap
