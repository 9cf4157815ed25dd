#pragma once

#include "query/filter_node.h"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace geo { class LandmarkRegistry; }

namespace query {

enum class ResultShape {
    Mapping,        // "Title (Year)" -> [locations]
    DistinctList,
    Tabular,
    GeoRows         // tabular + geometry
};

std::optional<ResultShape> shapeFromString(std::string_view shape);
const char* shapeToString(ResultShape shape);

/**
 * @brief Parsed input of one evaluation
 *
 * {
 *   "tasks": ["filter by director", "deduplicate by production", "count distinct productions"],
 *   "filters": [{"field": "Director", "condition": "==", "value": "Hitchcock", "type": "attribute"}],
 *   "filter_logic": "AND",
 *   "production_level": true, "expand_locations": false, ...
 * }
 *
 * Optional flags stay unset when absent so engine defaults apply.
 */
struct StructuredQuery {
    std::string query_id;
    std::vector<std::string> tasks;
    std::vector<FilterNodePtr> filters;
    LogicOp filter_logic = LogicOp::And;

    std::optional<bool> production_level;
    bool expand_locations = false;
    std::optional<bool> actor_any_slot;
    std::optional<bool> strip_city_qualifier;
    std::optional<ResultShape> result_shape;
    std::optional<size_t> top_n;
    std::optional<bool> restrict_names_to_filter;

    // Throws ModificationRejected for write intents (checked first) and
    // ConfigurationError for malformed input.
    static StructuredQuery fromJson(const nlohmann::json& j, const geo::LandmarkRegistry& landmarks);

    // Raises ModificationRejected when the input is an upstream refusal
    // ({"error": true, "message", "requested_operation"}) or names a write
    // operation in "intent"/"operation".
    static void rejectModification(const nlohmann::json& j);

    nlohmann::json toJSON() const;
};

} // namespace query
} // namespace cinemap
