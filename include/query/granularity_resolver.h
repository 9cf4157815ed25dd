#pragma once

#include "query/predicate_evaluator.h"
#include "query/task_classifier.h"

#include <vector>

namespace cinemap {
namespace query {

/**
 * @brief Turns a selection mask into the observations a task counts
 *
 * Location level keeps every selected record. Production level keeps one
 * representative per (title, year): the first selected record in store
 * order. Production-unit tasks must always go through representatives()
 * before any aggregation.
 */
class GranularityResolver {
public:
    explicit GranularityResolver(const RecordStore& store) : store_(store) {}

    std::vector<size_t> resolve(const SelectionMask& mask, Granularity unit) const;

    std::vector<size_t> observations(const SelectionMask& mask) const;
    std::vector<size_t> representatives(const SelectionMask& mask) const;

    // Production ordinals touched by the mask, first-occurrence order.
    std::vector<size_t> productions(const SelectionMask& mask) const;

private:
    const RecordStore& store_;
};

} // namespace query
} // namespace cinemap
