#include "query/result_assembler.h"
#include "utils/normalizer.h"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace cinemap {
namespace query {

using json = nlohmann::json;
using utils::Normalizer;

namespace {

std::string counted(size_t n, const std::string& singular, const std::string& plural) {
    return std::to_string(n) + " " + (n == 1 ? singular : plural);
}

const char* roleSingular(PersonRole role) {
    switch (role) {
        case PersonRole::Actor: return "actor";
        case PersonRole::Director: return "director";
        case PersonRole::Writer: return "writer";
    }
    return "person";
}

std::string rolePlural(PersonRole role) {
    return std::string(roleSingular(role)) + "s";
}

ResultEnvelope emptyEnvelope(json data, const std::string& what, const char* resultType) {
    ResultEnvelope env;
    env.data = std::move(data);
    env.summary = "No matching " + what + " were found.";
    env.metadata["result_type"] = resultType;
    env.metadata["empty"] = true;
    return env;
}

ResultEnvelope envelope(json data, std::string summary, const char* resultType) {
    ResultEnvelope env;
    env.data = std::move(data);
    env.summary = std::move(summary);
    env.metadata["result_type"] = resultType;
    env.metadata["empty"] = false;
    return env;
}

json cell(const std::string& value) {
    auto c = Normalizer::canonical(value);
    return c ? json(*c) : json(nullptr);
}

} // namespace

ResultEnvelope ResultAssembler::productionCount(const std::vector<size_t>& representatives) const {
    const size_t n = representatives.size();
    if (n == 0) return emptyEnvelope(size_t{0}, "productions", "scalar");
    return envelope(n, "Found " + counted(n, "production", "productions") + " matching the filters.", "scalar");
}

ResultEnvelope ResultAssembler::productionList(const std::vector<size_t>& representatives) const {
    json list = json::array();
    for (size_t idx : representatives) {
        list.push_back(store_.production(store_.productionOf(idx)).label());
    }
    if (list.empty()) return emptyEnvelope(std::move(list), "productions", "list");
    const size_t n = list.size();
    return envelope(std::move(list), "Found " + counted(n, "production", "productions") + " matching the filters.", "list");
}

ResultEnvelope ResultAssembler::locationCount(const std::vector<size_t>& observations, bool distinct) const {
    size_t n = 0;
    if (distinct) {
        std::unordered_set<std::string> seen;
        for (size_t idx : observations) {
            if (auto loc = Normalizer::canonical(store_.at(idx).locations)) seen.insert(*loc);
        }
        n = seen.size();
    } else {
        n = observations.size();
    }
    if (n == 0) return emptyEnvelope(size_t{0}, "locations", "scalar");
    const std::string what = distinct ? counted(n, "distinct location", "distinct locations")
                                      : counted(n, "location record", "location records");
    return envelope(n, "Found " + what + " matching the filters.", "scalar");
}

ResultEnvelope ResultAssembler::locationList(const std::vector<size_t>& observations, bool distinct) const {
    json list = json::array();
    std::unordered_set<std::string> seen;
    for (size_t idx : observations) {
        auto loc = Normalizer::canonical(store_.at(idx).locations);
        if (!loc) continue;
        if (distinct && !seen.insert(*loc).second) continue;
        list.push_back(*loc);
    }
    if (list.empty()) return emptyEnvelope(std::move(list), "locations", "list");
    const size_t n = list.size();
    return envelope(std::move(list),
                    "Found " + counted(n, "location", "locations") + " across " +
                        counted(observations.size(), "matching record", "matching records") + ".",
                    "list");
}

ResultEnvelope ResultAssembler::locationRanking(const std::vector<size_t>& observations, size_t top_n) const {
    // location -> distinct productions filmed there
    std::vector<RankedName> ranked;
    std::unordered_map<std::string, size_t> slot;
    std::set<std::pair<std::string, size_t>> seen;
    for (size_t idx : observations) {
        auto loc = Normalizer::canonical(store_.at(idx).locations);
        if (!loc) continue;
        if (!seen.emplace(*loc, store_.productionOf(idx)).second) continue;
        auto [it, inserted] = slot.emplace(*loc, ranked.size());
        if (inserted) ranked.push_back(RankedName{*loc, 0});
        ++ranked[it->second].productions;
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedName& a, const RankedName& b) {
        return a.productions > b.productions;
    });
    if (top_n > 0 && ranked.size() > top_n) ranked.resize(top_n);

    json list = json::array();
    for (const auto& r : ranked) {
        list.push_back({{"location", r.name}, {"count", r.productions}});
    }
    if (list.empty()) return emptyEnvelope(std::move(list), "locations", "ranking");
    return envelope(std::move(list),
                    "Top " + counted(ranked.size(), "location", "locations") + " by number of productions, led by " +
                        ranked.front().name + " (" + std::to_string(ranked.front().productions) + ").",
                    "ranking");
}

ResultEnvelope ResultAssembler::personCount(const std::vector<PersonCredit>& credits, PersonRole role) const {
    const size_t n = PersonAggregator::distinctNames(credits).size();
    if (n == 0) return emptyEnvelope(size_t{0}, rolePlural(role), "scalar");
    return envelope(n, "Found " + counted(n, std::string("distinct ") + roleSingular(role), "distinct " + rolePlural(role)) +
                           " in the matching productions.",
                    "scalar");
}

ResultEnvelope ResultAssembler::personList(const std::vector<PersonCredit>& credits, PersonRole role) const {
    const auto names = PersonAggregator::distinctNames(credits);
    if (names.empty()) return emptyEnvelope(json::array(), rolePlural(role), "list");
    std::set<size_t> productions;
    for (const auto& c : credits) productions.insert(c.production);
    return envelope(names,
                    "Found " + counted(names.size(), roleSingular(role), rolePlural(role)) + " across " +
                        counted(productions.size(), "production", "productions") + ".",
                    "list");
}

ResultEnvelope ResultAssembler::personRanking(const std::vector<PersonCredit>& credits, PersonRole role, size_t top_n) const {
    const auto ranked = PersonAggregator::rank(credits, top_n);
    if (ranked.empty()) return emptyEnvelope(json::array(), rolePlural(role), "ranking");
    return envelope(PersonAggregator::toJSON(ranked),
                    "Top " + counted(ranked.size(), roleSingular(role), rolePlural(role)) +
                        " by number of productions, led by " + ranked.front().name + " (" +
                        std::to_string(ranked.front().productions) + ").",
                    "ranking");
}

ResultEnvelope ResultAssembler::yearHistogram(const std::vector<size_t>& representatives) const {
    json histogram = json::object();
    for (size_t idx : representatives) {
        const auto& r = store_.at(idx);
        const std::string key = r.year ? std::to_string(*r.year) : "unknown";
        histogram[key] = histogram.value(key, 0) + 1;
    }
    if (histogram.empty()) return emptyEnvelope(std::move(histogram), "productions", "histogram");
    const size_t years = histogram.size();
    return envelope(std::move(histogram),
                    counted(representatives.size(), "production", "productions") + " spread over " +
                        counted(years, "year", "years") + ".",
                    "histogram");
}

ResultEnvelope ResultAssembler::expansion(const std::vector<size_t>& representatives) const {
    json mapping = json::object();
    std::vector<size_t> productions;
    size_t total = 0;

    for (size_t idx : representatives) {
        const size_t ord = store_.productionOf(idx);
        productions.push_back(ord);

        // Re-expand from the full store, not from the filtered selection.
        json locations = json::array();
        std::unordered_set<std::string> seen;
        for (size_t rec : store_.recordsOf(ord)) {
            auto loc = Normalizer::canonical(store_.at(rec).locations);
            if (loc && seen.insert(*loc).second) locations.push_back(*loc);
        }
        total += locations.size();
        mapping[store_.production(ord).label()] = std::move(locations);
    }

    const auto violations = checkExpansion(store_, mapping, productions);
    json violationsJson = json::array();
    for (const auto& v : violations) violationsJson.push_back(v.toJSON());

    ResultEnvelope env;
    if (mapping.empty()) {
        env = emptyEnvelope(std::move(mapping), "productions", "mapping");
    } else {
        env = envelope(std::move(mapping),
                       "Found " + counted(productions.size(), "production", "productions") + " with " +
                           counted(total, "location", "locations") + " in total.",
                       "mapping");
    }
    env.metadata["self_check"] = {
        {"performed", true},
        {"passed", violations.empty()},
        {"violations", std::move(violationsJson)}
    };
    env.metadata["alignment_violation"] = !violations.empty();
    return env;
}

std::vector<ExpansionViolation> ResultAssembler::checkExpansion(const RecordStore& store,
                                                                const json& mapping,
                                                                const std::vector<size_t>& productions) {
    std::vector<ExpansionViolation> out;
    for (size_t ord : productions) {
        const std::string label = store.production(ord).label();
        const size_t expected = store.distinctLocationsOf(ord).size();
        size_t actual = 0;
        auto it = mapping.find(label);
        if (it != mapping.end() && it->is_array()) {
            std::set<std::string> distinct;
            for (const auto& loc : *it) {
                if (loc.is_string()) distinct.insert(loc.get<std::string>());
            }
            actual = distinct.size();
        }
        if (actual != expected) {
            out.push_back(ExpansionViolation{label, expected, actual});
        }
    }
    return out;
}

json ResultAssembler::rowJson(const LocationRecord& r, bool with_geometry) const {
    json row = {
        {"id", r.id},
        {"Title", cell(r.title)},
        {"Year", r.year ? json(*r.year) : json(nullptr)},
        {"Locations", cell(r.locations)},
        {"Fun_Facts", cell(r.fun_facts)},
        {"Director", cell(r.director)},
        {"Writer", cell(r.writer)},
        {"Actor_1", cell(r.actor_1)},
        {"Actor_2", cell(r.actor_2)},
        {"Actor_3", cell(r.actor_3)}
    };
    if (with_geometry) {
        row["geometry"] = r.geometry ? geo::GeometryParser::toGeoJSON(*r.geometry) : json(nullptr);
    }
    return row;
}

ResultEnvelope ResultAssembler::rows(const std::vector<size_t>& records, bool with_geometry) const {
    json out = json::array();
    for (size_t idx : records) {
        out.push_back(rowJson(store_.at(idx), with_geometry));
    }
    const char* type = with_geometry ? "geo_rows" : "tabular";
    if (out.empty()) return emptyEnvelope(std::move(out), "records", type);
    const size_t n = out.size();
    return envelope(std::move(out), "Returned " + counted(n, "matching row", "matching rows") + ".", type);
}

} // namespace query
} // namespace cinemap
