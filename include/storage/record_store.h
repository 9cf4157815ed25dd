#pragma once

#include "storage/location_record.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {

class RecordStore;
using RecordStorePtr = std::shared_ptr<const RecordStore>;

/**
 * @brief Immutable in-memory set of location records
 *
 * Loaded once and shared read-only by every evaluation. Record indices are
 * stable: every selection mask in the engine is a vector aligned 1:1 with
 * records(). Production and location lookups are computed at load time from
 * the raw columns and never change afterwards.
 */
class RecordStore {
public:
    struct Status {
        bool ok = true;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, std::move(msg)}; }
        explicit operator bool() const { return ok; }
    };

    // .jsonl / .ndjson: one record object per line. Anything else: a JSON
    // array of records, {"records": [...]}, or a GeoJSON FeatureCollection.
    static std::pair<Status, RecordStorePtr> loadFile(const std::string& path);
    static std::pair<Status, RecordStorePtr> fromJson(const nlohmann::json& doc);
    static RecordStorePtr fromRecords(std::vector<LocationRecord> records);

    // Single record from a flat object (or a GeoJSON Feature). Column names
    // are matched case-insensitively; geometry from "geometry", "Lat"/"Lon"
    // or "Latitude"/"Longitude". Unusable geometry becomes absent.
    static LocationRecord recordFromJson(const nlohmann::json& obj, size_t ordinal);

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const LocationRecord& at(size_t idx) const { return records_.at(idx); }
    const std::vector<LocationRecord>& records() const { return records_; }

    // Productions in order of first occurrence.
    size_t productionCount() const { return productions_.size(); }
    const ProductionId& production(size_t ordinal) const { return productions_.at(ordinal); }
    size_t productionOf(size_t recordIdx) const { return record_production_.at(recordIdx); }
    std::optional<size_t> findProduction(const ProductionId& id) const;

    // Record indices of a production, original order.
    const std::vector<size_t>& recordsOf(size_t ordinal) const { return production_records_.at(ordinal); }

    // Distinct non-absent location descriptions of a production over the
    // full, unfiltered store, in first-occurrence order.
    const std::vector<std::string>& distinctLocationsOf(size_t ordinal) const {
        return production_locations_.at(ordinal);
    }

    // First known geometry of a location description (exact text match).
    std::optional<geo::Coordinate> locationPoint(std::string_view location) const;
    // Record that supplied locationPoint(), or the first record naming the
    // location when none has geometry.
    std::optional<size_t> locationRecord(std::string_view location) const;
    bool isKnownLocation(std::string_view location) const;

private:
    struct ConstructTag {
        explicit ConstructTag() = default;
    };

public:
    // Only reachable through fromRecords(); the tag type is private.
    RecordStore(ConstructTag, std::vector<LocationRecord> records);

private:
    void buildIndexes();

    std::vector<LocationRecord> records_;
    std::vector<ProductionId> productions_;
    std::vector<size_t> record_production_;
    std::vector<std::vector<size_t>> production_records_;
    std::vector<std::vector<std::string>> production_locations_;
    std::unordered_map<ProductionId, size_t, ProductionIdHash> production_index_;
    struct LocationRef {
        size_t record = 0;
        bool has_point = false;
    };
    std::unordered_map<std::string, LocationRef> locations_;
};

} // namespace cinemap
