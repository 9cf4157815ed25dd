#include <gtest/gtest.h>

#include "query/errors.h"
#include "query/filter_evaluator.h"
#include "geo/landmarks.h"
#include "test_fixtures.h"

using namespace cinemap;
using namespace cinemap::query;
using json = nlohmann::json;

class FilterEvaluatorTest : public ::testing::Test {
protected:
    FilterEvaluatorTest() : parser_(geo::LandmarkRegistry::builtin()) {}

    void SetUp() override {
        store_ = test::sampleStore();
    }

    static std::vector<size_t> indices(const SelectionMask& mask) {
        std::vector<size_t> out;
        for (size_t i = 0; i < mask.size(); ++i) {
            if (mask[i]) out.push_back(i);
        }
        return out;
    }

    FilterParser parser_;
    RecordStorePtr store_;

    const json hitchcock = {{"field", "Director"}, {"condition", "=="}, {"value", "Hitchcock"}};
    const json stewart = {{"field", "Actor"}, {"condition", "contains"}, {"value", "Stewart"}};
    const json penn = {{"field", "Actor"}, {"condition", "contains"}, {"value", "Sean Penn"}};
    const json forties = {{"field", "Year"}, {"condition", "between"}, {"value", {1940, 1949}}};
};

TEST_F(FilterEvaluatorTest, EmptyFilterListSelectsEverything) {
    FilterEvaluator eval(*store_);
    auto mask = eval.evaluateAll({}, LogicOp::And);
    EXPECT_EQ(countSelected(mask), store_->size());
    EXPECT_EQ(eval.leafEvaluations(), 0u);
}

TEST_F(FilterEvaluatorTest, TopLevelAnd) {
    FilterEvaluator eval(*store_);
    auto filters = parser_.parseList(json::array({hitchcock, stewart}));
    EXPECT_EQ(indices(eval.evaluateAll(filters, LogicOp::And)), (std::vector<size_t>{0, 1, 2}));
}

TEST_F(FilterEvaluatorTest, TopLevelOr) {
    FilterEvaluator eval(*store_);
    auto filters = parser_.parseList(json::array({hitchcock, penn}));
    EXPECT_EQ(indices(eval.evaluateAll(filters, LogicOp::Or)), (std::vector<size_t>{0, 1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST_F(FilterEvaluatorTest, MaskAlgebraMatchesPerRecordTruth) {
    FilterEvaluator eval(*store_);
    auto a = parser_.parse(hitchcock);
    auto b = parser_.parse(forties);
    const auto ma = eval.evaluate(*a);
    const auto mb = eval.evaluate(*b);

    auto both = eval.evaluate(*FilterNode::makeComposite(LogicOp::And, {a, b}));
    auto either = eval.evaluate(*FilterNode::makeComposite(LogicOp::Or, {a, b}));
    ASSERT_EQ(both.size(), store_->size());
    for (size_t i = 0; i < store_->size(); ++i) {
        EXPECT_EQ(both[i], ma[i] & mb[i]) << i;
        EXPECT_EQ(either[i], ma[i] | mb[i]) << i;
    }
    EXPECT_EQ(countSelected(both), 0u);
    EXPECT_EQ(countSelected(either), 7u);
}

TEST_F(FilterEvaluatorTest, NestedComposite) {
    // Hitchcock OR (Sean Penn AND year > 2005)
    json tree = {{"logic", "OR"}, {"conditions", {
        hitchcock,
        {{"logic", "AND"}, {"conditions", {penn, {{"field", "Year"}, {"condition", ">"}, {"value", 2005}}}}}
    }}};
    FilterEvaluator eval(*store_);
    EXPECT_EQ(indices(eval.evaluate(*parser_.parse(tree))), (std::vector<size_t>{0, 1, 2, 3, 7, 8}));
}

TEST_F(FilterEvaluatorTest, IdenticalSubtreesAreEvaluatedOnce) {
    json tree = {{"logic", "AND"}, {"conditions", {
        {{"logic", "OR"}, {"conditions", {hitchcock, penn}}},
        {{"logic", "OR"}, {"conditions", {penn, hitchcock}}},
        {{"logic", "OR"}, {"conditions", {hitchcock, penn}}}
    }}};
    FilterEvaluator eval(*store_);
    auto mask = eval.evaluate(*parser_.parse(tree));
    EXPECT_EQ(countSelected(mask), 9u);
    EXPECT_EQ(eval.leafEvaluations(), 2u);
    EXPECT_GE(eval.memoHits(), 3u);

    // A second evaluation of the same tree is a single memo hit
    const size_t hits = eval.memoHits();
    eval.evaluate(*parser_.parse(tree));
    EXPECT_EQ(eval.memoHits(), hits + 1);
    EXPECT_EQ(eval.leafEvaluations(), 2u);
}

TEST_F(FilterEvaluatorTest, OptionsReachPredicates) {
    EvaluationOptions options;
    options.actor_any_slot = false;
    FilterEvaluator eval(*store_, options);
    EXPECT_FALSE(eval.predicates().options().actor_any_slot);

    json bacall = {{"field", "Actor"}, {"condition", "contains"}, {"value", "Bacall"}};
    EXPECT_EQ(countSelected(eval.evaluate(*parser_.parse(bacall))), 0u);
}
