#pragma once

#include "geo/region.h"
#include "query/filter_node.h"
#include "storage/record_store.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cinemap {
namespace query {

// One entry per record of the store, in store order. Never re-indexed.
using SelectionMask = std::vector<uint8_t>;

size_t countSelected(const SelectionMask& mask);

struct EvaluationOptions {
    bool actor_any_slot = true;         // "actor" means any of the three slots
    bool strip_city_qualifier = false;  // drop "in San Francisco" & co. from location terms
};

/**
 * @brief Evaluates one filter leaf against the full record store
 *
 * The mask is always computed from the stored columns, never from a reduced
 * or cleaned selection. Absent values (see Normalizer::canonical) match
 * neither a condition nor its negation; records without geometry never match
 * a spatial condition. Multi-slot actor fields match a positive operator when
 * any present slot matches, and a negative operator when at least one slot is
 * present and none matches the positive form.
 */
class PredicateEvaluator {
public:
    explicit PredicateEvaluator(const RecordStore& store, EvaluationOptions options = {});

    SelectionMask evaluate(const FilterLeaf& leaf) const;

    // Single-record form of evaluate().
    bool matches(const FilterLeaf& leaf, const LocationRecord& record) const;

    // Applies the leaf to one person name, as used to restrict aggregated
    // names. Absent names never match.
    bool matchesName(const FilterLeaf& leaf, std::string_view name) const;

    // True when the city qualifier rule rewrites one of the leaf's terms.
    bool stripsQualifier(const FilterLeaf& leaf) const;

    const EvaluationOptions& options() const { return options_; }

private:
    struct Compiled {
        std::vector<std::string> terms;
        std::optional<geo::RegionMatcher> region;
    };

    Compiled compile(const FilterLeaf& leaf) const;
    bool test(const FilterLeaf& leaf, const Compiled& c, const LocationRecord& record) const;
    bool matchText(const FilterLeaf& leaf, FilterOp positive, const std::vector<std::string>& terms,
                   std::string_view value) const;
    bool matchYear(const FilterLeaf& leaf, const LocationRecord& record) const;
    bool matchSpatial(const FilterLeaf& leaf, const Compiled& c, const LocationRecord& record) const;

    const RecordStore& store_;
    EvaluationOptions options_;
};

} // namespace query
} // namespace cinemap
