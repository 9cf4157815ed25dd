#pragma once

#include "query/predicate_evaluator.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace cinemap {
namespace query {

/**
 * @brief Folds filter trees into selection masks
 *
 * Leaves go to the PredicateEvaluator; composites intersect (AND) or unite
 * (OR) their children's masks. Masks are memoized by structural key, so an
 * identical sub-tree is evaluated once per evaluator. One instance per query
 * evaluation; not shared between threads.
 */
class FilterEvaluator {
public:
    FilterEvaluator(const RecordStore& store, EvaluationOptions options = {});

    SelectionMask evaluate(const FilterNode& node);

    // Top-level filter list combined by filter_logic. An empty list selects
    // every record.
    SelectionMask evaluateAll(const std::vector<FilterNodePtr>& filters, LogicOp logic);

    const PredicateEvaluator& predicates() const { return predicates_; }

    size_t leafEvaluations() const { return leaf_evaluations_; }
    size_t memoHits() const { return memo_hits_; }

private:
    SelectionMask combine(const std::vector<FilterNodePtr>& children, LogicOp logic);

    const RecordStore& store_;
    PredicateEvaluator predicates_;
    std::unordered_map<std::string, SelectionMask> memo_;
    size_t leaf_evaluations_ = 0;
    size_t memo_hits_ = 0;
};

} // namespace query
} // namespace cinemap
