#include "query/filter_evaluator.h"
#include "query/errors.h"
#include "utils/logger.h"

namespace cinemap {
namespace query {

FilterEvaluator::FilterEvaluator(const RecordStore& store, EvaluationOptions options)
    : store_(store), predicates_(store, options) {}

SelectionMask FilterEvaluator::evaluate(const FilterNode& node) {
    const std::string key = node.structuralKey();
    auto it = memo_.find(key);
    if (it != memo_.end()) {
        ++memo_hits_;
        return it->second;
    }

    SelectionMask mask;
    if (node.isLeaf()) {
        ++leaf_evaluations_;
        mask = predicates_.evaluate(node.leaf);
        CINEMAP_TRACE("Leaf {} {} selected {} of {} records",
                      fieldName(node.leaf.field), opToString(node.leaf.op),
                      countSelected(mask), mask.size());
    } else {
        mask = combine(node.composite.children, node.composite.logic);
    }
    memo_.emplace(key, mask);
    return mask;
}

SelectionMask FilterEvaluator::evaluateAll(const std::vector<FilterNodePtr>& filters, LogicOp logic) {
    if (filters.empty()) {
        return SelectionMask(store_.size(), 1);
    }
    return combine(filters, logic);
}

SelectionMask FilterEvaluator::combine(const std::vector<FilterNodePtr>& children, LogicOp logic) {
    if (children.empty()) {
        throw ConfigurationError(std::string("Composite filter (") + logicToString(logic) + ") has no conditions");
    }
    SelectionMask acc = evaluate(*children.front());
    for (size_t c = 1; c < children.size(); ++c) {
        const SelectionMask next = evaluate(*children[c]);
        for (size_t i = 0; i < acc.size(); ++i) {
            acc[i] = static_cast<uint8_t>(logic == LogicOp::And ? (acc[i] & next[i]) : (acc[i] | next[i]));
        }
    }
    return acc;
}

} // namespace query
} // namespace cinemap
