#pragma once

#include "query/structured_query.h"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace query {

enum class TaskKind {
    CountProductions,
    ListProductions,
    CountLocations,
    ListLocations,
    CountPersons,
    ListPersons,
    RankPersons,        // top-N by distinct productions
    CountByYear,        // productions per release year
    RankLocations,      // most filmed location descriptions
    ExpandLocations,    // productions with their complete location sets
    RawRows             // matching records as rows
};

enum class Granularity { Production, Location };

enum class PersonRole { Actor, Director, Writer };

const char* kindToString(TaskKind kind);
const char* granularityToString(Granularity g);
const char* roleToString(PersonRole role);

// Which aggregation a query asks for; resolved once per evaluation.
struct TaskIntent {
    TaskKind kind = TaskKind::ListProductions;
    Granularity unit = Granularity::Production;
    PersonRole role = PersonRole::Actor;
    size_t top_n = 10;
    bool with_geometry = false;     // RawRows: attach GeoJSON points
    bool distinct = false;          // ListLocations/CountLocations: unique descriptions only

    bool isPersonKind() const {
        return kind == TaskKind::CountPersons || kind == TaskKind::ListPersons || kind == TaskKind::RankPersons;
    }

    nlohmann::json toJSON() const;
};

/**
 * @brief Maps plain-language task steps to a TaskIntent
 *
 * Keyword rules only. The last task carrying a decisive verb (count, list,
 * rank, per year, map, expand) decides; within that task the first object
 * noun (film, location, actor, director, writer) decides unit or role.
 * Explicit query flags are applied on top.
 *
 * The production_level / granularity hint only sets the unit of RawRows
 * intents and of the default when no task is decisive. Count, list, rank,
 * histogram and expansion intents keep the unit their task implies; the
 * engine reports a contradicting hint as "granularity_hint_overridden".
 */
class TaskClassifier {
public:
    explicit TaskClassifier(size_t default_top_n = 10) : default_top_n_(default_top_n) {}

    TaskIntent classify(const StructuredQuery& query) const;

    // Intent of a single task; std::nullopt when the step is not decisive
    // ("filter rows by year", "deduplicate by production").
    std::optional<TaskIntent> classifyTask(const std::string& task) const;

    // "top 5 actors" -> 5; "the most frequent actor" -> 1.
    static std::optional<size_t> requestedCount(const std::string& task);

private:
    size_t default_top_n_;
};

} // namespace query
} // namespace cinemap
