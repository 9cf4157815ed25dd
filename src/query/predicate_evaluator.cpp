#include "query/predicate_evaluator.h"
#include "utils/normalizer.h"

#include <algorithm>
#include <array>

namespace cinemap {
namespace query {

using utils::Normalizer;

namespace {

bool isPersonField(RecordField f) {
    return f == RecordField::Director || f == RecordField::Writer || isActorField(f);
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

size_t countSelected(const SelectionMask& mask) {
    return static_cast<size_t>(std::count(mask.begin(), mask.end(), uint8_t{1}));
}

PredicateEvaluator::PredicateEvaluator(const RecordStore& store, EvaluationOptions options)
    : store_(store), options_(options) {}

PredicateEvaluator::Compiled PredicateEvaluator::compile(const FilterLeaf& leaf) const {
    Compiled c;
    c.terms = leaf.comparand.terms;
    if (leaf.field == RecordField::Locations && options_.strip_city_qualifier) {
        for (auto& t : c.terms) {
            auto stripped = Normalizer::stripCityQualifier(t);
            if (stripped && !stripped->empty()) t = *stripped;
        }
    }
    if (leaf.comparand.region) {
        c.region.emplace(*leaf.comparand.region);
    }
    return c;
}

SelectionMask PredicateEvaluator::evaluate(const FilterLeaf& leaf) const {
    const Compiled c = compile(leaf);
    const auto& records = store_.records();
    SelectionMask mask(records.size(), 0);
    for (size_t i = 0; i < records.size(); ++i) {
        mask[i] = test(leaf, c, records[i]) ? 1 : 0;
    }
    return mask;
}

bool PredicateEvaluator::matches(const FilterLeaf& leaf, const LocationRecord& record) const {
    return test(leaf, compile(leaf), record);
}

bool PredicateEvaluator::stripsQualifier(const FilterLeaf& leaf) const {
    return leaf.field == RecordField::Locations && options_.strip_city_qualifier &&
           compile(leaf).terms != leaf.comparand.terms;
}

bool PredicateEvaluator::test(const FilterLeaf& leaf, const Compiled& c, const LocationRecord& record) const {
    if (leaf.kind == ConditionKind::Spatial) {
        return matchSpatial(leaf, c, record);
    }
    if (leaf.field == RecordField::Year) {
        return matchYear(leaf, record);
    }

    std::array<std::string_view, 3> slots;
    size_t n = 0;
    if (leaf.field == RecordField::Actor) {
        slots[n++] = record.actor_1;
        if (options_.actor_any_slot) {
            slots[n++] = record.actor_2;
            slots[n++] = record.actor_3;
        }
    } else {
        slots[n++] = record.text(leaf.field);
    }

    const FilterOp positive = positiveForm(leaf.op);
    bool anyPresent = false;
    for (size_t i = 0; i < n; ++i) {
        if (Normalizer::isAbsent(slots[i])) continue;
        anyPresent = true;
        if (matchText(leaf, positive, c.terms, slots[i])) {
            return !isNegativeOp(leaf.op);
        }
    }
    return anyPresent && isNegativeOp(leaf.op);
}

bool PredicateEvaluator::matchesName(const FilterLeaf& leaf, std::string_view name) const {
    if (leaf.kind != ConditionKind::Attribute || leaf.field == RecordField::Year) return false;
    if (Normalizer::isAbsent(name)) return false;
    const Compiled c = compile(leaf);
    const bool hit = matchText(leaf, positiveForm(leaf.op), c.terms, name);
    return isNegativeOp(leaf.op) ? !hit : hit;
}

bool PredicateEvaluator::matchText(const FilterLeaf& leaf, FilterOp positive,
                                   const std::vector<std::string>& terms, std::string_view value) const {
    const std::string v = Normalizer::toLower(Normalizer::trim(value));
    for (const auto& t : terms) {
        switch (positive) {
            case FilterOp::Eq:
            case FilterOp::In:
                if (v == t) return true;
                // "Hitchcock" names the person as well as "Alfred Hitchcock"
                if (isPersonField(leaf.field) && t.find(' ') == std::string::npos &&
                    Normalizer::toLower(Normalizer::surname(v)) == t) {
                    return true;
                }
                break;
            case FilterOp::Contains:
                if (v.find(t) != std::string::npos) return true;
                break;
            case FilterOp::StartsWith:
                if (startsWith(v, t)) return true;
                break;
            case FilterOp::EndsWith:
                if (endsWith(v, t)) return true;
                break;
            case FilterOp::SurnameStartsWith:
                if (startsWith(Normalizer::surname(v), t)) return true;
                break;
            default:
                return false;
        }
    }
    return false;
}

bool PredicateEvaluator::matchYear(const FilterLeaf& leaf, const LocationRecord& record) const {
    if (!record.year) return false;
    const double y = *record.year;
    const Comparand& c = leaf.comparand;
    auto listed = [&] {
        return std::find(c.numbers.begin(), c.numbers.end(), y) != c.numbers.end();
    };
    switch (leaf.op) {
        case FilterOp::Eq:
        case FilterOp::In:
            return listed();
        case FilterOp::Neq:
        case FilterOp::NotIn:
            return !listed();
        case FilterOp::Gt: return c.lower && y > *c.lower;
        case FilterOp::Gte: return c.lower && y >= *c.lower;
        case FilterOp::Lt: return c.upper && y < *c.upper;
        case FilterOp::Lte: return c.upper && y <= *c.upper;
        case FilterOp::Between: return c.lower && c.upper && y >= *c.lower && y <= *c.upper;
        default:
            return false;
    }
}

bool PredicateEvaluator::matchSpatial(const FilterLeaf& leaf, const Compiled& c, const LocationRecord& record) const {
    if (!record.geometry) return false;
    if (leaf.op == FilterOp::WithinDistance) {
        return leaf.comparand.center &&
               geo::haversineMeters(*record.geometry, *leaf.comparand.center) <= leaf.comparand.radius_meters;
    }
    return c.region && c.region->covers(*record.geometry);
}

} // namespace query
} // namespace cinemap
