#include "query/structured_query.h"
#include "query/errors.h"
#include "geo/landmarks.h"
#include "utils/normalizer.h"

#include <array>

namespace cinemap {
namespace query {

using json = nlohmann::json;
using utils::Normalizer;

namespace {

constexpr std::array<std::string_view, 9> kWriteOperations = {
    "add", "insert", "update", "delete", "remove", "save", "modify", "create", "drop"
};

std::optional<bool> optionalBool(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_boolean()) {
        throw ConfigurationError(std::string("'") + key + "' must be a boolean, got " + j[key].dump());
    }
    return j[key].get<bool>();
}

} // namespace

std::optional<ResultShape> shapeFromString(std::string_view shape) {
    const std::string s = Normalizer::toLower(Normalizer::trim(shape));
    if (s == "mapping" || s == "map" || s == "grouped") return ResultShape::Mapping;
    if (s == "distinct_list" || s == "list" || s == "distinct") return ResultShape::DistinctList;
    if (s == "tabular" || s == "table" || s == "rows") return ResultShape::Tabular;
    if (s == "geo_rows" || s == "geo" || s == "raw_geo_rows") return ResultShape::GeoRows;
    return std::nullopt;
}

const char* shapeToString(ResultShape shape) {
    switch (shape) {
        case ResultShape::Mapping: return "mapping";
        case ResultShape::DistinctList: return "distinct_list";
        case ResultShape::Tabular: return "tabular";
        case ResultShape::GeoRows: return "geo_rows";
    }
    return "unknown";
}

void StructuredQuery::rejectModification(const json& j) {
    if (!j.is_object()) return;

    if (j.contains("error") && j["error"].is_boolean() && j["error"].get<bool>()) {
        std::string message = "Modification requests are not supported; the dataset is read-only.";
        std::string op;
        if (j.contains("message") && j["message"].is_string()) message = j["message"].get<std::string>();
        if (j.contains("requested_operation") && j["requested_operation"].is_string()) {
            op = j["requested_operation"].get<std::string>();
        }
        throw ModificationRejected(message, op);
    }

    for (const char* key : {"intent", "operation"}) {
        if (!j.contains(key) || !j[key].is_string()) continue;
        const std::string op = j[key].get<std::string>();
        const std::string lower = Normalizer::toLower(Normalizer::trim(op));
        for (auto w : kWriteOperations) {
            if (lower == w) {
                throw ModificationRejected("Data modification is not permitted: '" + op + "' was requested.", op);
            }
        }
    }
}

StructuredQuery StructuredQuery::fromJson(const json& j, const geo::LandmarkRegistry& landmarks) {
    if (!j.is_object()) {
        throw ConfigurationError("Structured query must be a JSON object");
    }
    rejectModification(j);

    StructuredQuery q;
    for (const char* key : {"query_id", "id"}) {
        if (j.contains(key) && j[key].is_string()) {
            q.query_id = j[key].get<std::string>();
            break;
        }
    }

    if (j.contains("tasks") && !j["tasks"].is_null()) {
        const json& tasks = j["tasks"];
        if (tasks.is_string()) {
            q.tasks.push_back(tasks.get<std::string>());
        } else if (tasks.is_array()) {
            for (const auto& t : tasks) {
                if (!t.is_string()) throw ConfigurationError("Task must be a string, got " + t.dump());
                q.tasks.push_back(t.get<std::string>());
            }
        } else {
            throw ConfigurationError("'tasks' must be an array of strings");
        }
    }

    FilterParser parser(landmarks);
    if (j.contains("filters")) {
        q.filters = parser.parseList(j["filters"]);
    }
    if (j.contains("filter_logic") && !j["filter_logic"].is_null()) {
        if (!j["filter_logic"].is_string()) throw ConfigurationError("'filter_logic' must be AND or OR");
        q.filter_logic = logicFromString(j["filter_logic"].get<std::string>());
    }

    q.production_level = optionalBool(j, "production_level");
    if (j.contains("granularity") && !j["granularity"].is_null()) {
        const json& g = j["granularity"];
        const std::string s = g.is_string() ? Normalizer::toLower(g.get<std::string>()) : "";
        if (s == "production" || s == "film" || s == "production_level") {
            q.production_level = true;
        } else if (s == "location" || s == "record" || s == "location_level") {
            q.production_level = false;
        } else {
            throw ConfigurationError("Unknown granularity " + g.dump());
        }
    }

    q.expand_locations = optionalBool(j, "expand_locations").value_or(false);
    q.actor_any_slot = optionalBool(j, "actor_any_slot");
    q.strip_city_qualifier = optionalBool(j, "strip_city_qualifier");
    q.restrict_names_to_filter = optionalBool(j, "restrict_names_to_filter");

    if (j.contains("result_shape") && !j["result_shape"].is_null()) {
        const json& s = j["result_shape"];
        auto shape = s.is_string() ? shapeFromString(s.get<std::string>()) : std::nullopt;
        if (!shape) throw ConfigurationError("Unknown result_shape " + s.dump());
        q.result_shape = shape;
    }

    if (j.contains("top_n") && !j["top_n"].is_null()) {
        const json& n = j["top_n"];
        if (!n.is_number_integer() || n.get<long long>() <= 0) {
            throw ConfigurationError("'top_n' must be a positive integer, got " + n.dump());
        }
        q.top_n = static_cast<size_t>(n.get<long long>());
    }
    return q;
}

json StructuredQuery::toJSON() const {
    json filtersJson = json::array();
    for (const auto& f : filters) filtersJson.push_back(f->toJSON());

    json j = {
        {"tasks", tasks},
        {"filters", std::move(filtersJson)},
        {"filter_logic", logicToString(filter_logic)},
        {"expand_locations", expand_locations}
    };
    if (!query_id.empty()) j["query_id"] = query_id;
    if (production_level) j["production_level"] = *production_level;
    if (actor_any_slot) j["actor_any_slot"] = *actor_any_slot;
    if (strip_city_qualifier) j["strip_city_qualifier"] = *strip_city_qualifier;
    if (result_shape) j["result_shape"] = shapeToString(*result_shape);
    if (top_n) j["top_n"] = *top_n;
    if (restrict_names_to_filter) j["restrict_names_to_filter"] = *restrict_names_to_filter;
    return j;
}

} // namespace query
} // namespace cinemap
