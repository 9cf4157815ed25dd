// Filter evaluation benchmarks: leaf masks, memoized trees, full pipeline

#include <benchmark/benchmark.h>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "geo/landmarks.h"
#include "query/filter_evaluator.h"
#include "query/query_engine.h"
#include "query/structured_query.h"
#include "storage/record_store.h"

using cinemap::LocationRecord;
using cinemap::RecordStore;
using cinemap::RecordStorePtr;
using cinemap::query::FilterEvaluator;
using cinemap::query::QueryEngine;
using cinemap::query::StructuredQuery;
using json = nlohmann::json;

namespace {

const char* kDirectors[] = {"Alfred Hitchcock", "Clint Eastwood", "Don Siegel", "Philip Kaufman", "Chris Columbus"};
const char* kActors[] = {"James Stewart", "Kim Novak", "Sean Penn", "Nicolas Cage", "Sean Connery", "None", ""};

RecordStorePtr makeStore(size_t productions, size_t locationsPerProduction) {
    std::vector<LocationRecord> records;
    records.reserve(productions * locationsPerProduction);
    for (size_t p = 0; p < productions; ++p) {
        for (size_t l = 0; l < locationsPerProduction; ++l) {
            LocationRecord r;
            r.id = std::to_string(records.size());
            r.title = "Film " + std::to_string(p);
            r.year = static_cast<int>(1930 + p % 90);
            r.year_text = std::to_string(*r.year);
            r.locations = "Street " + std::to_string((p * 7 + l) % 500);
            r.director = kDirectors[p % 5];
            r.writer = "Writer " + std::to_string(p % 40);
            r.actor_1 = kActors[p % 7];
            r.actor_2 = kActors[(p + 2) % 7];
            r.actor_3 = kActors[(p + 4) % 7];
            if (l % 4 != 0) {
                r.geometry = cinemap::geo::Coordinate(-122.50 + 0.0001 * static_cast<double>((p + l) % 1000),
                                                      37.70 + 0.0001 * static_cast<double>((p * 3 + l) % 1000));
            }
            records.push_back(std::move(r));
        }
    }
    return RecordStore::fromRecords(std::move(records));
}

const json& compositeQuery() {
    static const json q = json::parse(R"({
        "tasks": ["count distinct productions"],
        "filters": [
            {"logic": "OR", "conditions": [
                {"field": "Director", "condition": "==", "value": "Hitchcock", "type": "attribute"},
                {"field": "Actor", "condition": "contains", "value": "Stewart", "type": "attribute"}
            ]},
            {"field": "Year", "condition": "between", "value": [1940, 1979], "type": "attribute"},
            {"field": "geometry", "condition": "within_distance",
             "value": {"center": "Union Square", "radius": 5, "unit": "mi"}, "type": "spatial"}
        ],
        "filter_logic": "AND"
    })");
    return q;
}

} // namespace

static void BM_FilterTree_Composite(benchmark::State& state) {
    auto store = makeStore(static_cast<size_t>(state.range(0)), 8);
    auto query = StructuredQuery::fromJson(compositeQuery(), cinemap::geo::LandmarkRegistry::builtin());

    for (auto _ : state) {
        FilterEvaluator evaluator(*store);
        auto mask = evaluator.evaluateAll(query.filters, query.filter_logic);
        benchmark::DoNotOptimize(mask.data());
    }
    state.counters["records"] = static_cast<double>(store->size());
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(store->size()));
}
BENCHMARK(BM_FilterTree_Composite)->Arg(1000)->Arg(10000)->Unit(benchmark::kMicrosecond);

static void BM_FilterTree_RepeatedSubtree(benchmark::State& state) {
    auto store = makeStore(5000, 8);
    json leaf = {{"field", "Actor"}, {"condition", "contains"}, {"value", "Sean"}, {"type", "attribute"}};
    json repeated = {{"logic", "AND"}, {"conditions", json::array()}};
    for (int i = 0; i < state.range(0); ++i) {
        repeated["conditions"].push_back({{"logic", "OR"}, {"conditions", {leaf, leaf}}});
    }
    cinemap::query::FilterParser parser(cinemap::geo::LandmarkRegistry::builtin());
    auto node = parser.parse(repeated);

    for (auto _ : state) {
        FilterEvaluator evaluator(*store);
        auto mask = evaluator.evaluate(*node);
        benchmark::DoNotOptimize(mask.data());
    }
    state.SetLabel("memoized");
}
BENCHMARK(BM_FilterTree_RepeatedSubtree)->Arg(2)->Arg(16)->Unit(benchmark::kMicrosecond);

static void BM_Engine_RankActors(benchmark::State& state) {
    auto store = makeStore(static_cast<size_t>(state.range(0)), 8);
    QueryEngine engine(store);
    json q = {
        {"tasks", {"union actor columns", "top 5 most frequent actors"}},
        {"filters", json::array()},
        {"filter_logic", "AND"}
    };

    for (auto _ : state) {
        auto env = engine.evaluate(q);
        benchmark::DoNotOptimize(env.data);
    }
}
BENCHMARK(BM_Engine_RankActors)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

static void BM_Engine_ExpandLocations(benchmark::State& state) {
    auto store = makeStore(static_cast<size_t>(state.range(0)), 8);
    QueryEngine engine(store);
    json q = {
        {"tasks", json::array()},
        {"filters", {{{"field", "Actor"}, {"condition", "contains"}, {"value", "Sean Penn"}, {"type", "attribute"}}}},
        {"filter_logic", "AND"},
        {"production_level", true},
        {"expand_locations", true}
    };

    for (auto _ : state) {
        auto env = engine.evaluate(q);
        benchmark::DoNotOptimize(env.data);
    }
}
BENCHMARK(BM_Engine_ExpandLocations)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
