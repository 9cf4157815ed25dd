#pragma once

#include "query/task_classifier.h"
#include "storage/record_store.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace query {

// One (production, person) pair of the long-form sequence.
struct PersonCredit {
    size_t production;      // production ordinal in the store
    std::string name;       // trimmed, never shortened
};

struct RankedName {
    std::string name;
    size_t productions = 0;
};

/**
 * @brief Person-field aggregation over production representatives
 *
 * Reads the role's columns (three slots for actors) of each representative,
 * drops absent values, trims names and emits each (production, name) pair
 * once. An optional name predicate filters full names; returned names are
 * always the full stored names.
 */
class PersonAggregator {
public:
    using NamePredicate = std::function<bool(std::string_view)>;

    PersonAggregator(const RecordStore& store, PersonRole role, bool actor_any_slot = true);

    void setNamePredicate(NamePredicate predicate) { predicate_ = std::move(predicate); }
    bool hasNamePredicate() const { return static_cast<bool>(predicate_); }

    std::vector<PersonCredit> longForm(const std::vector<size_t>& representatives) const;

    // Distinct names, first-encountered order.
    static std::vector<std::string> distinctNames(const std::vector<PersonCredit>& credits);

    // Names by number of distinct productions, descending. Equal counts keep
    // first-encountered order. top_n == 0 returns every name.
    static std::vector<RankedName> rank(const std::vector<PersonCredit>& credits, size_t top_n);

    static nlohmann::json toJSON(const std::vector<RankedName>& ranked);

private:
    const RecordStore& store_;
    PersonRole role_;
    bool actor_any_slot_;
    NamePredicate predicate_;
};

} // namespace query
} // namespace cinemap
