#pragma once

#include "query/result_assembler.h"
#include "storage/record_store.h"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace query {

/**
 * @brief Decides whether a result can be drawn on a map
 *
 * Structural probing only: scalars are never mappable; lists of known
 * location descriptions, mappings whose values or keys are location
 * descriptions, and rows carrying a location or geometry are. Output:
 *
 * {
 *   "can_map": true,
 *   "reason": "Found 3 mappable locations",
 *   "data_type": "Dict",
 *   "location_data": [{"location_name", "lon", "lat", "metadata"}] | null
 * }
 */
class MapAnalyzer {
public:
    explicit MapAnalyzer(const RecordStore& store, size_t probe_size = 5)
        : store_(store), probe_size_(probe_size) {}

    nlohmann::json analyze(const ResultEnvelope& result) const;
    nlohmann::json analyzeData(const nlohmann::json& data) const;

private:
    struct MapPoint {
        std::string name;
        geo::Coordinate point;
        nlohmann::json metadata;
    };

    std::vector<MapPoint> fromList(const nlohmann::json& list) const;
    std::vector<MapPoint> fromRows(const nlohmann::json& rows) const;
    std::vector<MapPoint> fromDict(const nlohmann::json& dict) const;

    bool probe(const nlohmann::json& list) const;
    std::optional<MapPoint> lookup(const std::string& location, nlohmann::json metadata) const;
    nlohmann::json storeMetadata(const std::string& location) const;

    static std::string dataType(const nlohmann::json& data);

    const RecordStore& store_;
    size_t probe_size_;
};

} // namespace query
} // namespace cinemap
