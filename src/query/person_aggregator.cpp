#include "query/person_aggregator.h"
#include "utils/normalizer.h"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

namespace cinemap {
namespace query {

using utils::Normalizer;

PersonAggregator::PersonAggregator(const RecordStore& store, PersonRole role, bool actor_any_slot)
    : store_(store), role_(role), actor_any_slot_(actor_any_slot) {}

std::vector<PersonCredit> PersonAggregator::longForm(const std::vector<size_t>& representatives) const {
    std::vector<PersonCredit> out;
    std::set<std::pair<size_t, std::string>> seen;

    for (size_t idx : representatives) {
        const LocationRecord& r = store_.at(idx);
        const size_t ord = store_.productionOf(idx);

        std::vector<const std::string*> columns;
        switch (role_) {
            case PersonRole::Director:
                columns = {&r.director};
                break;
            case PersonRole::Writer:
                columns = {&r.writer};
                break;
            case PersonRole::Actor:
                columns = {&r.actor_1};
                if (actor_any_slot_) {
                    columns.push_back(&r.actor_2);
                    columns.push_back(&r.actor_3);
                }
                break;
        }

        for (const std::string* col : columns) {
            auto name = Normalizer::canonical(*col);
            if (!name) continue;
            if (predicate_ && !predicate_(*name)) continue;
            if (!seen.emplace(ord, *name).second) continue;
            out.push_back(PersonCredit{ord, std::move(*name)});
        }
    }
    return out;
}

std::vector<std::string> PersonAggregator::distinctNames(const std::vector<PersonCredit>& credits) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& c : credits) {
        if (seen.insert(c.name).second) out.push_back(c.name);
    }
    return out;
}

std::vector<RankedName> PersonAggregator::rank(const std::vector<PersonCredit>& credits, size_t top_n) {
    std::vector<RankedName> ranked;
    std::unordered_map<std::string, size_t> slot;
    for (const auto& c : credits) {
        auto [it, inserted] = slot.emplace(c.name, ranked.size());
        if (inserted) ranked.push_back(RankedName{c.name, 0});
        ++ranked[it->second].productions;
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedName& a, const RankedName& b) {
        return a.productions > b.productions;
    });
    if (top_n > 0 && ranked.size() > top_n) ranked.resize(top_n);
    return ranked;
}

nlohmann::json PersonAggregator::toJSON(const std::vector<RankedName>& ranked) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : ranked) {
        out.push_back({{"name", r.name}, {"count", r.productions}});
    }
    return out;
}

} // namespace query
} // namespace cinemap
