#pragma once

#include "query/person_aggregator.h"
#include "query/task_classifier.h"
#include "storage/record_store.h"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace query {

/**
 * @brief Output of one evaluation
 *
 * data:     scalar, list, mapping or rows
 * summary:  one sentence
 * metadata: granularity, cleaning_rules, task_intent, self_check, ...
 */
struct ResultEnvelope {
    nlohmann::json data;
    std::string summary;
    nlohmann::json metadata = nlohmann::json::object();

    // Nothing matched; not an error.
    bool isEmpty() const { return metadata.value("empty", false); }
    bool alignmentViolation() const { return metadata.value("alignment_violation", false); }

    nlohmann::json toJSON() const {
        return {{"data", data}, {"summary", summary}, {"metadata", metadata}};
    }
};

// One production whose re-expanded location set disagrees with the store.
struct ExpansionViolation {
    std::string production;
    size_t expected = 0;
    size_t actual = 0;

    nlohmann::json toJSON() const {
        return {{"production", production}, {"expected", expected}, {"actual", actual}};
    }
};

/**
 * @brief Builds result envelopes from resolved selections
 *
 * Payload, summary, "result_type" and "empty" are set here; the engine adds
 * the query-wide metadata.
 */
class ResultAssembler {
public:
    explicit ResultAssembler(const RecordStore& store) : store_(store) {}

    ResultEnvelope productionCount(const std::vector<size_t>& representatives) const;
    ResultEnvelope productionList(const std::vector<size_t>& representatives) const;

    ResultEnvelope locationCount(const std::vector<size_t>& observations, bool distinct) const;
    ResultEnvelope locationList(const std::vector<size_t>& observations, bool distinct) const;
    ResultEnvelope locationRanking(const std::vector<size_t>& observations, size_t top_n) const;

    ResultEnvelope personCount(const std::vector<PersonCredit>& credits, PersonRole role) const;
    ResultEnvelope personList(const std::vector<PersonCredit>& credits, PersonRole role) const;
    ResultEnvelope personRanking(const std::vector<PersonCredit>& credits, PersonRole role, size_t top_n) const;

    ResultEnvelope yearHistogram(const std::vector<size_t>& representatives) const;

    // Hybrid expansion: every selected production mapped to all of its
    // distinct locations in the full store, followed by the self-check.
    ResultEnvelope expansion(const std::vector<size_t>& representatives) const;

    ResultEnvelope rows(const std::vector<size_t>& records, bool with_geometry) const;

    // Compares a "Title (Year)" -> [locations] mapping with the store's
    // distinct location counts of the given productions.
    static std::vector<ExpansionViolation> checkExpansion(const RecordStore& store,
                                                         const nlohmann::json& mapping,
                                                         const std::vector<size_t>& productions);

    nlohmann::json rowJson(const LocationRecord& record, bool with_geometry) const;

private:
    const RecordStore& store_;
};

} // namespace query
} // namespace cinemap
