#pragma once

#include "geo/geometry.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cinemap {

// Columns of the location dataset. Actor is the logical union of the three
// billing slots; it never names a stored column of its own.
enum class RecordField {
    Id,
    Title,
    Year,
    Locations,
    FunFacts,
    Director,
    Writer,
    Actor1,
    Actor2,
    Actor3,
    Actor,
    Geometry
};

// Case-insensitive, accepts the dataset's spellings ("Fun Facts", "Fun_Facts",
// "Actor 1", "Release Year", ...). std::nullopt for unknown names.
std::optional<RecordField> fieldFromString(std::string_view name);
const char* fieldName(RecordField field);

inline bool isActorField(RecordField f) {
    return f == RecordField::Actor || f == RecordField::Actor1 ||
           f == RecordField::Actor2 || f == RecordField::Actor3;
}

inline bool isTextField(RecordField f) {
    return f != RecordField::Year && f != RecordField::Geometry;
}

// Identity of a production. All records sharing it carry identical
// production-level columns (title, year, director, writer, actor slots).
struct ProductionId {
    std::string title;
    std::string year;   // canonical year text, empty when absent

    // "Mystic River (2003)"; just the title when the year is absent.
    std::string label() const {
        return year.empty() ? title : title + " (" + year + ")";
    }

    bool operator==(const ProductionId& o) const { return title == o.title && year == o.year; }
    bool operator!=(const ProductionId& o) const { return !(*this == o); }
};

struct ProductionIdHash {
    size_t operator()(const ProductionId& p) const noexcept {
        size_t h = std::hash<std::string>{}(p.title);
        return h ^ (std::hash<std::string>{}(p.year) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

// One shooting location of one production, exactly as stored.
struct LocationRecord {
    std::string id;
    std::string title;
    std::string year_text;
    std::optional<int> year;          // numeric view of year_text; absent when not a number
    std::string locations;
    std::string fun_facts;
    std::string director;
    std::string writer;
    std::string actor_1;
    std::string actor_2;
    std::string actor_3;
    std::optional<geo::Coordinate> geometry;

    // Raw stored text of a column. Actor and Geometry are not single columns
    // and yield an empty view.
    std::string_view text(RecordField field) const;

    ProductionId production() const;
};

} // namespace cinemap
