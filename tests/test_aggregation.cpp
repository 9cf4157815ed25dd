#include <gtest/gtest.h>

#include "query/granularity_resolver.h"
#include "query/person_aggregator.h"
#include "query/result_assembler.h"
#include "test_fixtures.h"

using namespace cinemap;
using namespace cinemap::query;
using json = nlohmann::json;

class AggregationTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = test::sampleStore();
    }

    SelectionMask maskOf(std::initializer_list<size_t> selected) const {
        SelectionMask mask(store_->size(), 0);
        for (size_t i : selected) mask[i] = 1;
        return mask;
    }

    SelectionMask all() const { return SelectionMask(store_->size(), 1); }

    RecordStorePtr store_;
};

// ---------------------------------------------------------------------------
// GranularityResolver
// ---------------------------------------------------------------------------

TEST_F(AggregationTest, RepresentativesAreFirstSelectedRecord) {
    GranularityResolver resolver(*store_);
    auto mask = maskOf({2, 1, 5, 6, 9});
    EXPECT_EQ(resolver.observations(mask), (std::vector<size_t>{1, 2, 5, 6, 9}));
    EXPECT_EQ(resolver.representatives(mask), (std::vector<size_t>{1, 5, 9}));
    EXPECT_EQ(resolver.resolve(mask, Granularity::Production), resolver.representatives(mask));
    EXPECT_EQ(resolver.resolve(mask, Granularity::Location), resolver.observations(mask));
    EXPECT_EQ(resolver.productions(mask), (std::vector<size_t>{0, 2, 4}));
}

TEST_F(AggregationTest, RepresentativesCountEachProductionOnce) {
    GranularityResolver resolver(*store_);
    EXPECT_EQ(resolver.representatives(all()).size(), store_->productionCount());
    EXPECT_TRUE(resolver.representatives(SelectionMask(store_->size(), 0)).empty());
}

// ---------------------------------------------------------------------------
// PersonAggregator
// ---------------------------------------------------------------------------

TEST_F(AggregationTest, ActorUnionDropsAbsentNames) {
    GranularityResolver resolver(*store_);
    PersonAggregator actors(*store_, PersonRole::Actor);
    auto credits = actors.longForm(resolver.representatives(maskOf({12, 13, 14})));
    // Dark Passage: Bogart, Bacall ("nan" dropped); Street Scene: nobody
    ASSERT_EQ(credits.size(), 2u);
    EXPECT_EQ(credits[0].name, "Humphrey Bogart");
    EXPECT_EQ(credits[1].name, "Lauren Bacall");
    EXPECT_EQ(credits[0].production, store_->productionOf(12));
}

TEST_F(AggregationTest, PairsAreDeduplicatedPerProduction) {
    LocationRecord a;
    a.title = "Twins";
    a.year_text = "1988";
    a.year = 1988;
    a.locations = "A";
    a.actor_1 = "Danny DeVito";
    a.actor_2 = " Danny DeVito ";
    a.actor_3 = "Arnold Schwarzenegger";
    LocationRecord b = a;
    b.locations = "B";
    auto store = RecordStore::fromRecords({a, b});

    PersonAggregator actors(*store, PersonRole::Actor);
    auto credits = actors.longForm({0, 1});
    ASSERT_EQ(credits.size(), 2u);
    EXPECT_EQ(credits[0].name, "Danny DeVito");
    EXPECT_EQ(credits[1].name, "Arnold Schwarzenegger");
}

TEST_F(AggregationTest, RankingByDistinctProductions) {
    GranularityResolver resolver(*store_);
    PersonAggregator actors(*store_, PersonRole::Actor);
    auto ranked = PersonAggregator::rank(actors.longForm(resolver.representatives(all())), 3);
    ASSERT_EQ(ranked.size(), 3u);
    // Sean Penn is met before Humphrey Bogart; ties keep that order
    EXPECT_EQ(ranked[0].name, "Sean Penn");
    EXPECT_EQ(ranked[0].productions, 2u);
    EXPECT_EQ(ranked[1].name, "Humphrey Bogart");
    EXPECT_EQ(ranked[1].productions, 2u);
    EXPECT_EQ(ranked[2].name, "James Stewart");
    EXPECT_EQ(ranked[2].productions, 1u);

    auto everyone = PersonAggregator::rank(actors.longForm(resolver.representatives(all())), 0);
    EXPECT_EQ(everyone.size(), 18u);

    json j = PersonAggregator::toJSON(ranked);
    EXPECT_EQ(j[0]["name"], "Sean Penn");
    EXPECT_EQ(j[0]["count"], 2);
}

TEST_F(AggregationTest, NamePredicateKeepsFullNames) {
    GranularityResolver resolver(*store_);
    PersonAggregator actors(*store_, PersonRole::Actor);
    EXPECT_FALSE(actors.hasNamePredicate());
    actors.setNamePredicate([](std::string_view name) { return name.find("Sean") != std::string_view::npos; });
    EXPECT_TRUE(actors.hasNamePredicate());

    auto names = PersonAggregator::distinctNames(actors.longForm(resolver.representatives(all())));
    EXPECT_EQ(names, (std::vector<std::string>{"Sean Penn", "Sean Connery"}));
}

TEST_F(AggregationTest, DirectorAndWriterColumns) {
    GranularityResolver resolver(*store_);
    PersonAggregator directors(*store_, PersonRole::Director);
    auto names = PersonAggregator::distinctNames(directors.longForm(resolver.representatives(all())));
    EXPECT_EQ(names.size(), 6u);
    EXPECT_EQ(names.front(), "Alfred Hitchcock");

    PersonAggregator writers(*store_, PersonRole::Writer);
    auto credits = writers.longForm(resolver.representatives(maskOf({0, 3})));
    EXPECT_EQ(PersonAggregator::distinctNames(credits), (std::vector<std::string>{"Alec Coppel", "Evan Hunter"}));
}

TEST_F(AggregationTest, FirstSlotOnlyWhenUnionDisabled) {
    GranularityResolver resolver(*store_);
    PersonAggregator actors(*store_, PersonRole::Actor, false);
    auto names = PersonAggregator::distinctNames(actors.longForm(resolver.representatives(maskOf({9}))));
    EXPECT_EQ(names, (std::vector<std::string>{"Sean Connery"}));
}

// ---------------------------------------------------------------------------
// ResultAssembler
// ---------------------------------------------------------------------------

TEST_F(AggregationTest, ProductionCountAndList) {
    ResultAssembler assembler(*store_);
    auto count = assembler.productionCount({0, 3});
    EXPECT_EQ(count.data, 2);
    EXPECT_FALSE(count.isEmpty());
    EXPECT_EQ(count.metadata["result_type"], "scalar");
    EXPECT_EQ(count.summary, "Found 2 productions matching the filters.");

    auto list = assembler.productionList({0, 3});
    EXPECT_EQ(list.data, json::array({"Vertigo (1958)", "The Birds (1963)"}));

    auto none = assembler.productionCount({});
    EXPECT_TRUE(none.isEmpty());
    EXPECT_EQ(none.data, 0);
    EXPECT_EQ(none.summary, "No matching productions were found.");
}

TEST_F(AggregationTest, LocationListKeepsDuplicatesUnlessDistinct) {
    ResultAssembler assembler(*store_);
    auto raw = assembler.locationList({4, 5, 6}, false);
    EXPECT_EQ(raw.data, json::array({"Pier 39", "Crissy Field", "Pier 39"}));
    auto distinct = assembler.locationList({4, 5, 6}, true);
    EXPECT_EQ(distinct.data, json::array({"Pier 39", "Crissy Field"}));

    EXPECT_EQ(assembler.locationCount({4, 5, 6}, false).data, 3);
    EXPECT_EQ(assembler.locationCount({4, 5, 6}, true).data, 2);

    // Absent location only
    EXPECT_TRUE(assembler.locationList({8}, false).isEmpty());
}

TEST_F(AggregationTest, LocationRankingCountsProductions) {
    LocationRecord a;
    a.title = "A";
    a.locations = "City Hall";
    LocationRecord b = a;
    LocationRecord c = a;
    c.title = "B";
    LocationRecord d = c;
    d.locations = "Coit Tower";
    auto store = RecordStore::fromRecords({d, a, b, c});

    ResultAssembler assembler(*store);
    auto env = assembler.locationRanking({0, 1, 2, 3}, 10);
    ASSERT_EQ(env.data.size(), 2u);
    EXPECT_EQ(env.data[0]["location"], "City Hall");
    EXPECT_EQ(env.data[0]["count"], 2);
    EXPECT_EQ(env.data[1]["location"], "Coit Tower");
    EXPECT_EQ(env.metadata["result_type"], "ranking");
}

TEST_F(AggregationTest, PersonEnvelopes) {
    ResultAssembler assembler(*store_);
    GranularityResolver resolver(*store_);
    PersonAggregator actors(*store_, PersonRole::Actor);
    auto credits = actors.longForm(resolver.representatives(maskOf({4, 7})));

    auto count = assembler.personCount(credits, PersonRole::Actor);
    EXPECT_EQ(count.data, 5);

    auto list = assembler.personList(credits, PersonRole::Actor);
    EXPECT_EQ(list.data[0], "Sean Penn");
    EXPECT_EQ(list.summary, "Found 5 actors across 2 productions.");

    auto ranking = assembler.personRanking(credits, PersonRole::Actor, 1);
    EXPECT_EQ(ranking.summary, "Top 1 actor by number of productions, led by Sean Penn (2).");

    EXPECT_TRUE(assembler.personList({}, PersonRole::Director).isEmpty());
    EXPECT_EQ(assembler.personList({}, PersonRole::Director).summary, "No matching directors were found.");
}

TEST_F(AggregationTest, YearHistogram) {
    ResultAssembler assembler(*store_);
    GranularityResolver resolver(*store_);
    auto env = assembler.yearHistogram(resolver.representatives(maskOf({0, 1, 3, 14})));
    EXPECT_EQ(env.data["1958"], 1);
    EXPECT_EQ(env.data["1963"], 1);
    EXPECT_EQ(env.data["unknown"], 1);
    EXPECT_EQ(env.metadata["result_type"], "histogram");
}

TEST_F(AggregationTest, ExpansionUsesFullStore) {
    ResultAssembler assembler(*store_);
    // Only Pier 39 of Mystic River matched; Crissy Field still belongs to the production
    auto env = assembler.expansion({6, 7});
    EXPECT_EQ(env.data["Mystic River (2003)"], json::array({"Pier 39", "Crissy Field"}));
    EXPECT_EQ(env.data["Milk (2008)"], json::array({"Castro Theatre"}));
    EXPECT_EQ(env.summary, "Found 2 productions with 3 locations in total.");
    EXPECT_TRUE(env.metadata["self_check"]["performed"].get<bool>());
    EXPECT_TRUE(env.metadata["self_check"]["passed"].get<bool>());
    EXPECT_FALSE(env.alignmentViolation());
}

TEST_F(AggregationTest, ExpansionCheckReportsMisalignment) {
    const size_t mystic = store_->productionOf(4);
    const size_t milk = store_->productionOf(7);
    json mapping = {
        {"Mystic River (2003)", {"Pier 39"}},
        {"Milk (2008)", {"Castro Theatre", "Castro Theatre"}}
    };
    auto violations = ResultAssembler::checkExpansion(*store_, mapping, {mystic, milk});
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].production, "Mystic River (2003)");
    EXPECT_EQ(violations[0].expected, 2u);
    EXPECT_EQ(violations[0].actual, 1u);

    auto missing = ResultAssembler::checkExpansion(*store_, json::object(), {milk});
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].actual, 0u);
}

TEST_F(AggregationTest, RowsCarryNullsAndGeometry) {
    ResultAssembler assembler(*store_);
    auto env = assembler.rows({8, 9}, true);
    ASSERT_EQ(env.data.size(), 2u);
    EXPECT_TRUE(env.data[0]["Locations"].is_null());
    EXPECT_TRUE(env.data[0]["geometry"].is_null());
    EXPECT_EQ(env.data[1]["Title"], "The Rock");
    EXPECT_EQ(env.data[1]["Year"], 1996);
    EXPECT_EQ(env.data[1]["geometry"]["type"], "Point");
    EXPECT_EQ(env.metadata["result_type"], "geo_rows");

    auto plain = assembler.rows({9}, false);
    EXPECT_FALSE(plain.data[0].contains("geometry"));
    EXPECT_EQ(plain.metadata["result_type"], "tabular");
    EXPECT_EQ(plain.summary, "Returned 1 matching row.");
}
