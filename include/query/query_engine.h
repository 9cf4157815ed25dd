#pragma once

#include "geo/landmarks.h"
#include "query/filter_node.h"
#include "query/result_assembler.h"
#include "query/structured_query.h"
#include "query/task_classifier.h"
#include "storage/record_store.h"
#include "utils/diagnostic_sink.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace utils { struct EngineConfig; }

namespace query {

/**
 * @brief Single entry point: structured query in, result envelope out
 *
 * Pipeline: parse -> filter masks over the full store -> task intent ->
 * granularity -> aggregation -> envelope. evaluate() is const and may run
 * concurrently from any number of threads; every evaluation owns its masks
 * and memo, the store is shared read-only and the diagnostic sink serializes
 * its own appends.
 *
 * ModificationRejected and ConfigurationError propagate to the caller after
 * a diagnostic entry was written. Failed hybrid-expansion self-checks do not
 * throw: the envelope carries "alignment_violation": true.
 */
struct QueryEngineOptions {
    size_t default_top_n = 10;
    bool actor_any_slot = true;
    bool strip_city_qualifier = false;
};

class QueryEngine {
public:
    using Options = QueryEngineOptions;

    QueryEngine(RecordStorePtr store,
                std::shared_ptr<utils::IDiagnosticSink> sink = nullptr,
                Options options = {},
                geo::LandmarkRegistry landmarks = geo::LandmarkRegistry());

    static Options optionsFrom(const utils::EngineConfig& config);
    static geo::LandmarkRegistry landmarksFrom(const utils::EngineConfig& config);

    ResultEnvelope evaluate(const nlohmann::json& query) const;
    ResultEnvelope evaluate(const StructuredQuery& query) const;

    const RecordStore& store() const { return *store_; }
    const geo::LandmarkRegistry& landmarks() const { return landmarks_; }
    const Options& options() const { return options_; }

private:
    ResultEnvelope run(const StructuredQuery& query, const std::string& query_id) const;
    std::string nextQueryId() const;
    void record(nlohmann::json entry) const;
    void recordFailure(const std::string& query_id, const char* outcome, const nlohmann::json& details) const;

    RecordStorePtr store_;
    std::shared_ptr<utils::IDiagnosticSink> sink_;
    Options options_;
    geo::LandmarkRegistry landmarks_;
    TaskClassifier classifier_;
    mutable std::atomic<uint64_t> query_counter_{0};
};

// Same-role leaves reachable from the root through AND-only composites.
// With all_operators == false only name patterns (surname_starts_with,
// starts_with, ends_with) qualify.
std::vector<const FilterLeaf*> collectNameLeaves(const std::vector<FilterNodePtr>& filters,
                                                 LogicOp filter_logic,
                                                 PersonRole role,
                                                 bool all_operators);

} // namespace query
} // namespace cinemap
