#include "query/task_classifier.h"
#include <array>
#include <cctype>
#include <initializer_list>

namespace cinemap {
namespace query {

using json = nlohmann::json;

namespace {

enum class Noun { Production, Location, Row, Actor, Director, Writer };

struct Phrase {
    std::string_view text;
    Noun noun;
};

constexpr std::array<Phrase, 30> kNouns = {{
    {"film", Noun::Production}, {"films", Noun::Production},
    {"movie", Noun::Production}, {"movies", Noun::Production},
    {"production", Noun::Production}, {"productions", Noun::Production},
    {"title", Noun::Production}, {"titles", Noun::Production},
    {"location", Noun::Location}, {"locations", Noun::Location},
    {"site", Noun::Location}, {"sites", Noun::Location},
    {"place", Noun::Location}, {"places", Noun::Location},
    {"spot", Noun::Location}, {"spots", Noun::Location},
    {"row", Noun::Row}, {"rows", Noun::Row},
    {"record", Noun::Row}, {"records", Noun::Row},
    {"actor", Noun::Actor}, {"actors", Noun::Actor},
    {"actress", Noun::Actor}, {"actresses", Noun::Actor},
    {"cast", Noun::Actor},
    {"director", Noun::Director}, {"directors", Noun::Director},
    {"writer", Noun::Writer}, {"writers", Noun::Writer},
    {"screenwriters", Noun::Writer}
}};

constexpr std::array<std::string_view, 10> kNumberWords = {
    "one", "two", "three", "four", "five", "six", "seven", "eight", "nine", "ten"
};

// " word word word " - lower case, punctuation dropped, single spaces.
std::string words(const std::string& text) {
    std::string out = " ";
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || ch == '\'') {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (out.back() != ' ') {
            out.push_back(' ');
        }
    }
    if (out.back() != ' ') out.push_back(' ');
    return out;
}

bool has(const std::string& w, std::string_view phrase) {
    std::string needle = " ";
    needle.append(phrase);
    needle.push_back(' ');
    return w.find(needle) != std::string::npos;
}

bool hasAny(const std::string& w, std::initializer_list<std::string_view> phrases) {
    for (auto p : phrases) {
        if (has(w, p)) return true;
    }
    return false;
}

// First object noun of the task; with skipProductions, film nouns are ignored.
std::optional<Noun> firstNoun(const std::string& w, bool skipProductions) {
    size_t best = std::string::npos;
    std::optional<Noun> found;
    for (const auto& p : kNouns) {
        if (skipProductions && p.noun == Noun::Production) continue;
        std::string needle = " ";
        needle.append(p.text);
        needle.push_back(' ');
        size_t pos = w.find(needle);
        if (pos != std::string::npos && pos < best) {
            best = pos;
            found = p.noun;
        }
    }
    return found;
}

PersonRole roleOf(Noun n) {
    switch (n) {
        case Noun::Director: return PersonRole::Director;
        case Noun::Writer: return PersonRole::Writer;
        default: return PersonRole::Actor;
    }
}

bool isRole(Noun n) {
    return n == Noun::Actor || n == Noun::Director || n == Noun::Writer;
}

TaskIntent make(TaskKind kind, Granularity unit) {
    TaskIntent t;
    t.kind = kind;
    t.unit = unit;
    return t;
}

bool isListKind(TaskKind k) {
    return k == TaskKind::ListProductions || k == TaskKind::ListLocations ||
           k == TaskKind::RawRows || k == TaskKind::ExpandLocations;
}

} // namespace

const char* kindToString(TaskKind kind) {
    switch (kind) {
        case TaskKind::CountProductions: return "count_productions";
        case TaskKind::ListProductions: return "list_productions";
        case TaskKind::CountLocations: return "count_locations";
        case TaskKind::ListLocations: return "list_locations";
        case TaskKind::CountPersons: return "count_persons";
        case TaskKind::ListPersons: return "list_persons";
        case TaskKind::RankPersons: return "rank_persons";
        case TaskKind::CountByYear: return "count_by_year";
        case TaskKind::RankLocations: return "rank_locations";
        case TaskKind::ExpandLocations: return "expand_locations";
        case TaskKind::RawRows: return "raw_rows";
    }
    return "unknown";
}

const char* granularityToString(Granularity g) {
    return g == Granularity::Production ? "production" : "location";
}

const char* roleToString(PersonRole role) {
    switch (role) {
        case PersonRole::Actor: return "actor";
        case PersonRole::Director: return "director";
        case PersonRole::Writer: return "writer";
    }
    return "unknown";
}

json TaskIntent::toJSON() const {
    json j = {
        {"kind", kindToString(kind)},
        {"unit", granularityToString(unit)}
    };
    if (isPersonKind()) j["role"] = roleToString(role);
    if (kind == TaskKind::RankPersons || kind == TaskKind::RankLocations) j["top_n"] = top_n;
    if (kind == TaskKind::RawRows) j["with_geometry"] = with_geometry;
    if (kind == TaskKind::ListLocations || kind == TaskKind::CountLocations) j["distinct"] = distinct;
    return j;
}

std::optional<size_t> TaskClassifier::requestedCount(const std::string& task) {
    const std::string w = words(task);
    size_t pos = w.find(" top ");
    if (pos != std::string::npos) {
        size_t start = pos + 5;
        size_t end = w.find(' ', start);
        const std::string next = w.substr(start, end - start);
        if (!next.empty() && std::isdigit(static_cast<unsigned char>(next[0]))) {
            try {
                long n = std::stol(next);
                if (n > 0) return static_cast<size_t>(n);
            } catch (const std::exception&) {
            }
        }
        for (size_t i = 0; i < kNumberWords.size(); ++i) {
            if (next == kNumberWords[i]) return i + 1;
        }
    }
    // "the most frequent actor": a single winner
    if (has(w, "the most") &&
        hasAny(w, {"actor", "actress", "director", "writer", "location", "place", "site"})) {
        return 1;
    }
    return std::nullopt;
}

std::optional<TaskIntent> TaskClassifier::classifyTask(const std::string& task) const {
    const std::string w = words(task);

    // Preparation steps ("filter rows by year", "union actor columns") never decide the output.
    if (hasAny(w.substr(0, w.find(' ', 1) + 1), {"filter", "deduplicate", "dedupe", "drop", "clean",
                                                  "normalize", "normalise", "union", "merge", "combine",
                                                  "restrict", "exclude", "strip", "trim", "coerce"})) {
        return std::nullopt;
    }

    if (hasAny(w, {"with their locations", "with all their locations", "all of their locations",
                   "all their locations", "with all locations", "locations of each", "locations for each",
                   "locations per film", "locations per movie", "locations per production",
                   "group locations by", "expand locations", "aggregate all locations"})) {
        return make(TaskKind::ExpandLocations, Granularity::Production);
    }

    if (hasAny(w, {"per year", "each year", "per release year", "year by year"}) ||
        (hasAny(w, {"by year", "by release year"}) &&
         hasAny(w, {"count", "how many", "number of", "group", "grouped", "histogram", "breakdown", "distribution"}))) {
        return make(TaskKind::CountByYear, Granularity::Production);
    }

    if (hasAny(w, {"top", "most", "rank", "ranked", "frequent", "frequently", "popular", "often"})) {
        if (auto n = firstNoun(w, true)) {
            TaskIntent t;
            if (isRole(*n)) {
                t = make(TaskKind::RankPersons, Granularity::Production);
                t.role = roleOf(*n);
            } else {
                t = make(TaskKind::RankLocations, Granularity::Location);
            }
            t.top_n = requestedCount(task).value_or(default_top_n_);
            return t;
        }
    }

    if (hasAny(w, {"count", "how many", "number of", "total"})) {
        auto n = firstNoun(w, false);
        if (!n || *n == Noun::Production) return make(TaskKind::CountProductions, Granularity::Production);
        if (*n == Noun::Location || *n == Noun::Row) {
            TaskIntent t = make(TaskKind::CountLocations, Granularity::Location);
            t.distinct = *n == Noun::Location && hasAny(w, {"distinct", "unique", "different"});
            return t;
        }
        TaskIntent t = make(TaskKind::CountPersons, Granularity::Production);
        t.role = roleOf(*n);
        return t;
    }

    if (hasAny(w, {"map", "plot", "coordinates", "geometry", "geometries", "geo"})) {
        TaskIntent t = make(TaskKind::RawRows, Granularity::Location);
        t.with_geometry = true;
        return t;
    }

    if (hasAny(w, {"list", "show", "return", "find", "get", "which", "what", "display", "select", "give", "name"})) {
        auto n = firstNoun(w, false);
        if (!n) return std::nullopt;
        if (*n == Noun::Production) return make(TaskKind::ListProductions, Granularity::Production);
        if (*n == Noun::Row) return make(TaskKind::RawRows, Granularity::Location);
        if (*n == Noun::Location) {
            TaskIntent t = make(TaskKind::ListLocations, Granularity::Location);
            t.distinct = hasAny(w, {"distinct", "unique", "different"});
            return t;
        }
        TaskIntent t = make(TaskKind::ListPersons, Granularity::Production);
        t.role = roleOf(*n);
        return t;
    }
    return std::nullopt;
}

TaskIntent TaskClassifier::classify(const StructuredQuery& query) const {
    std::optional<TaskIntent> decided;
    std::optional<size_t> requested;
    bool actorUnion = false;
    for (const auto& task : query.tasks) {
        if (auto t = classifyTask(task)) decided = t;
        if (auto n = requestedCount(task)) requested = n;
        const std::string w = words(task);
        if (has(w, "union") && hasAny(w, {"actor", "actors"})) actorUnion = true;
    }

    TaskIntent intent;
    if (decided) {
        intent = *decided;
    } else if (query.production_level && !*query.production_level) {
        intent = make(TaskKind::RawRows, Granularity::Location);
    } else {
        intent = make(TaskKind::ListProductions, Granularity::Production);
    }
    // "union actor columns" with a person verb but no role noun
    if (actorUnion && intent.isPersonKind()) intent.role = PersonRole::Actor;

    if (query.expand_locations && isListKind(intent.kind)) {
        intent.kind = TaskKind::ExpandLocations;
        intent.unit = Granularity::Production;
    }

    if (query.result_shape && isListKind(intent.kind)) {
        switch (*query.result_shape) {
            case ResultShape::Mapping:
                intent.kind = TaskKind::ExpandLocations;
                intent.unit = Granularity::Production;
                break;
            case ResultShape::DistinctList:
                if (intent.kind == TaskKind::ExpandLocations) {
                    intent.kind = TaskKind::ListProductions;
                } else if (intent.kind == TaskKind::RawRows) {
                    intent.kind = intent.unit == Granularity::Production ? TaskKind::ListProductions
                                                                         : TaskKind::ListLocations;
                }
                intent.distinct = true;
                break;
            case ResultShape::Tabular:
            case ResultShape::GeoRows:
                if (intent.kind == TaskKind::ListLocations) intent.unit = Granularity::Location;
                if (intent.kind == TaskKind::ListProductions || intent.kind == TaskKind::ExpandLocations) {
                    intent.unit = Granularity::Production;
                }
                intent.kind = TaskKind::RawRows;
                intent.with_geometry = *query.result_shape == ResultShape::GeoRows;
                break;
        }
    }

    if (intent.kind == TaskKind::RawRows && query.production_level) {
        intent.unit = *query.production_level ? Granularity::Production : Granularity::Location;
    }

    if (query.top_n) {
        intent.top_n = *query.top_n;
    } else if (requested && (intent.kind == TaskKind::RankPersons || intent.kind == TaskKind::RankLocations)) {
        intent.top_n = *requested;
    } else if (intent.kind != TaskKind::RankPersons && intent.kind != TaskKind::RankLocations) {
        intent.top_n = default_top_n_;
    }
    return intent;
}

} // namespace query
} // namespace cinemap
