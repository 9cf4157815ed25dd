#include "storage/location_record.h"
#include "utils/normalizer.h"

#include <cctype>

namespace cinemap {

namespace {

// "Fun Facts" / "fun_facts" / "FUN-FACTS" -> "funfacts"
std::string squash(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == ' ' || c == '_' || c == '-') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

std::optional<RecordField> fieldFromString(std::string_view name) {
    const std::string k = squash(name);
    if (k == "id") return RecordField::Id;
    if (k == "title") return RecordField::Title;
    if (k == "year" || k == "releaseyear") return RecordField::Year;
    if (k == "locations" || k == "location") return RecordField::Locations;
    if (k == "funfacts" || k == "funfact") return RecordField::FunFacts;
    if (k == "director") return RecordField::Director;
    if (k == "writer") return RecordField::Writer;
    if (k == "actor1") return RecordField::Actor1;
    if (k == "actor2") return RecordField::Actor2;
    if (k == "actor3") return RecordField::Actor3;
    if (k == "actor" || k == "actors") return RecordField::Actor;
    if (k == "geometry" || k == "geom" || k == "point") return RecordField::Geometry;
    return std::nullopt;
}

const char* fieldName(RecordField field) {
    switch (field) {
        case RecordField::Id: return "id";
        case RecordField::Title: return "title";
        case RecordField::Year: return "year";
        case RecordField::Locations: return "locations";
        case RecordField::FunFacts: return "fun_facts";
        case RecordField::Director: return "director";
        case RecordField::Writer: return "writer";
        case RecordField::Actor1: return "actor_1";
        case RecordField::Actor2: return "actor_2";
        case RecordField::Actor3: return "actor_3";
        case RecordField::Actor: return "actor";
        case RecordField::Geometry: return "geometry";
    }
    return "unknown";
}

std::string_view LocationRecord::text(RecordField field) const {
    switch (field) {
        case RecordField::Id: return id;
        case RecordField::Title: return title;
        case RecordField::Year: return year_text;
        case RecordField::Locations: return locations;
        case RecordField::FunFacts: return fun_facts;
        case RecordField::Director: return director;
        case RecordField::Writer: return writer;
        case RecordField::Actor1: return actor_1;
        case RecordField::Actor2: return actor_2;
        case RecordField::Actor3: return actor_3;
        case RecordField::Actor:
        case RecordField::Geometry:
            break;
    }
    return {};
}

ProductionId LocationRecord::production() const {
    ProductionId p;
    p.title = utils::Normalizer::canonical(title).value_or("");
    p.year = utils::Normalizer::canonical(year_text).value_or("");
    return p;
}

} // namespace cinemap
