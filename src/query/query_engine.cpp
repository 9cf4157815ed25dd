#include "query/query_engine.h"
#include "query/errors.h"
#include "query/filter_evaluator.h"
#include "query/granularity_resolver.h"
#include "query/person_aggregator.h"
#include "utils/engine_config.h"
#include "utils/logger.h"

#include <chrono>
#include <stdexcept>

namespace cinemap {
namespace query {

using json = nlohmann::json;

namespace {

bool roleMatches(RecordField field, PersonRole role) {
    switch (role) {
        case PersonRole::Actor: return isActorField(field);
        case PersonRole::Director: return field == RecordField::Director;
        case PersonRole::Writer: return field == RecordField::Writer;
    }
    return false;
}

bool isNamePattern(FilterOp op) {
    return op == FilterOp::SurnameStartsWith || op == FilterOp::StartsWith || op == FilterOp::EndsWith;
}

void collectFrom(const FilterNode& node, PersonRole role, bool all_operators,
                 std::vector<const FilterLeaf*>& out) {
    if (node.isLeaf()) {
        const FilterLeaf& leaf = node.leaf;
        if (leaf.kind == ConditionKind::Attribute && roleMatches(leaf.field, role) &&
            (all_operators || isNamePattern(leaf.op))) {
            out.push_back(&leaf);
        }
        return;
    }
    // Below an OR a leaf no longer constrains every result.
    if (node.composite.logic == LogicOp::Or && node.composite.children.size() > 1) return;
    for (const auto& child : node.composite.children) {
        collectFrom(*child, role, all_operators, out);
    }
}

bool hasLeaf(const std::vector<FilterNodePtr>& filters, bool (*pred)(const FilterLeaf&)) {
    std::vector<const FilterNode*> stack;
    for (const auto& f : filters) stack.push_back(f.get());
    while (!stack.empty()) {
        const FilterNode* n = stack.back();
        stack.pop_back();
        if (n->isLeaf()) {
            if (pred(n->leaf)) return true;
        } else {
            for (const auto& c : n->composite.children) stack.push_back(c.get());
        }
    }
    return false;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

std::vector<const FilterLeaf*> collectNameLeaves(const std::vector<FilterNodePtr>& filters,
                                                 LogicOp filter_logic,
                                                 PersonRole role,
                                                 bool all_operators) {
    std::vector<const FilterLeaf*> out;
    if (filter_logic == LogicOp::Or && filters.size() > 1) return out;
    for (const auto& f : filters) {
        collectFrom(*f, role, all_operators, out);
    }
    return out;
}

QueryEngine::QueryEngine(RecordStorePtr store,
                         std::shared_ptr<utils::IDiagnosticSink> sink,
                         Options options,
                         geo::LandmarkRegistry landmarks)
    : store_(std::move(store))
    , sink_(sink ? std::move(sink) : std::make_shared<utils::NullDiagnosticSink>())
    , options_(options)
    , landmarks_(std::move(landmarks))
    , classifier_(options.default_top_n)
{
    if (!store_) {
        throw std::invalid_argument("QueryEngine requires a record store");
    }
}

QueryEngine::Options QueryEngine::optionsFrom(const utils::EngineConfig& config) {
    Options o;
    o.default_top_n = config.query.default_top_n;
    o.actor_any_slot = config.query.actor_any_slot;
    o.strip_city_qualifier = config.query.strip_city_qualifier;
    return o;
}

geo::LandmarkRegistry QueryEngine::landmarksFrom(const utils::EngineConfig& config) {
    geo::LandmarkRegistry registry;
    for (const auto& lm : config.landmarks) {
        registry.add(lm.name, geo::Coordinate(lm.lon, lm.lat));
    }
    return registry;
}

std::string QueryEngine::nextQueryId() const {
    return "q-" + std::to_string(++query_counter_);
}

void QueryEngine::record(json entry) const {
    entry["ts"] = nowMillis();
    sink_->append(entry);
}

void QueryEngine::recordFailure(const std::string& query_id, const char* outcome, const json& details) const {
    json entry = details;
    entry["query_id"] = query_id;
    entry["outcome"] = outcome;
    record(std::move(entry));
}

ResultEnvelope QueryEngine::evaluate(const json& query) const {
    StructuredQuery parsed;
    std::string id;
    if (query.is_object()) {
        if (query.contains("query_id") && query["query_id"].is_string()) id = query["query_id"].get<std::string>();
        else if (query.contains("id") && query["id"].is_string()) id = query["id"].get<std::string>();
    }
    if (id.empty()) id = nextQueryId();

    try {
        parsed = StructuredQuery::fromJson(query, landmarks_);
    } catch (const ModificationRejected& e) {
        CINEMAP_WARN("[{}] Modification request rejected: {} (operation '{}')", id, e.what(), e.requestedOperation());
        recordFailure(id, "modification_rejected",
                      {{"error", e.what()}, {"requested_operation", e.requestedOperation()}});
        throw;
    } catch (const ConfigurationError& e) {
        CINEMAP_WARN("[{}] Invalid query: {}", id, e.what());
        recordFailure(id, "configuration_error", {{"error", e.what()}});
        throw;
    }
    parsed.query_id = id;
    return evaluate(parsed);
}

ResultEnvelope QueryEngine::evaluate(const StructuredQuery& query) const {
    const std::string id = query.query_id.empty() ? nextQueryId() : query.query_id;
    try {
        return run(query, id);
    } catch (const ConfigurationError& e) {
        CINEMAP_WARN("[{}] Invalid query: {}", id, e.what());
        recordFailure(id, "configuration_error", {{"error", e.what()}});
        throw;
    }
}

ResultEnvelope QueryEngine::run(const StructuredQuery& query, const std::string& id) const {
    const auto started = std::chrono::steady_clock::now();
    const RecordStore& store = *store_;

    EvaluationOptions eval;
    eval.actor_any_slot = query.actor_any_slot.value_or(options_.actor_any_slot);
    eval.strip_city_qualifier = query.strip_city_qualifier.value_or(options_.strip_city_qualifier);

    FilterEvaluator filters(store, eval);
    const SelectionMask mask = filters.evaluateAll(query.filters, query.filter_logic);

    const TaskIntent intent = classifier_.classify(query);
    GranularityResolver resolver(store);
    ResultAssembler assembler(store);

    CINEMAP_DEBUG("[{}] intent={} unit={} matched={} of {}", id, kindToString(intent.kind),
                  granularityToString(intent.unit), countSelected(mask), store.size());

    json cleaning = json::array({"null_canonicalization", "whitespace_trim"});
    if (intent.unit == Granularity::Production) cleaning.push_back("production_deduplication");

    bool namesRestricted = false;
    bool actorUnion = false;
    ResultEnvelope env;
    switch (intent.kind) {
        case TaskKind::CountProductions:
            env = assembler.productionCount(resolver.representatives(mask));
            break;
        case TaskKind::ListProductions:
            env = assembler.productionList(resolver.representatives(mask));
            break;
        case TaskKind::CountLocations:
            env = assembler.locationCount(resolver.observations(mask), intent.distinct);
            break;
        case TaskKind::ListLocations:
            env = assembler.locationList(resolver.observations(mask), intent.distinct);
            break;
        case TaskKind::RankLocations:
            env = assembler.locationRanking(resolver.observations(mask), intent.top_n);
            break;
        case TaskKind::CountByYear:
            env = assembler.yearHistogram(resolver.representatives(mask));
            break;
        case TaskKind::ExpandLocations:
            env = assembler.expansion(resolver.representatives(mask));
            break;
        case TaskKind::RawRows:
            env = assembler.rows(resolver.resolve(mask, intent.unit), intent.with_geometry);
            break;
        case TaskKind::CountPersons:
        case TaskKind::ListPersons:
        case TaskKind::RankPersons: {
            PersonAggregator aggregator(store, intent.role, eval.actor_any_slot);
            const bool restrictAll = query.restrict_names_to_filter.value_or(false);
            const bool restrictNone = query.restrict_names_to_filter && !*query.restrict_names_to_filter;
            if (!restrictNone) {
                auto leaves = collectNameLeaves(query.filters, query.filter_logic, intent.role, restrictAll);
                if (!leaves.empty()) {
                    const PredicateEvaluator& predicates = filters.predicates();
                    aggregator.setNamePredicate([leaves, &predicates](std::string_view name) {
                        for (const FilterLeaf* leaf : leaves) {
                            if (!predicates.matchesName(*leaf, name)) return false;
                        }
                        return true;
                    });
                    namesRestricted = true;
                }
            }
            const auto credits = aggregator.longForm(resolver.representatives(mask));
            if (intent.kind == TaskKind::CountPersons) {
                env = assembler.personCount(credits, intent.role);
            } else if (intent.kind == TaskKind::ListPersons) {
                env = assembler.personList(credits, intent.role);
            } else {
                env = assembler.personRanking(credits, intent.role, intent.top_n);
            }
            actorUnion = intent.role == PersonRole::Actor && eval.actor_any_slot;
            break;
        }
    }

    if (namesRestricted) cleaning.push_back("name_filter_on_full_names");
    if (eval.actor_any_slot && hasLeaf(query.filters, [](const FilterLeaf& l) { return l.field == RecordField::Actor; })) {
        actorUnion = true;
    }
    if (actorUnion) cleaning.push_back("actor_slot_union");
    if (hasLeaf(query.filters, [](const FilterLeaf& l) { return l.field == RecordField::Year; })) {
        cleaning.push_back("year_numeric_coercion");
    }
    if (eval.strip_city_qualifier) {
        std::vector<const FilterNode*> stack;
        for (const auto& f : query.filters) stack.push_back(f.get());
        bool stripped = false;
        while (!stack.empty() && !stripped) {
            const FilterNode* n = stack.back();
            stack.pop_back();
            if (n->isLeaf()) {
                stripped = filters.predicates().stripsQualifier(n->leaf);
            } else {
                for (const auto& c : n->composite.children) stack.push_back(c.get());
            }
        }
        if (stripped) cleaning.push_back("city_qualifier_stripped");
    }

    const size_t matchedRecords = countSelected(mask);
    const size_t matchedProductions = resolver.representatives(mask).size();
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started).count();

    json& meta = env.metadata;
    meta["query_id"] = id;
    meta["granularity"] = granularityToString(intent.unit);
    meta["cleaning_rules"] = std::move(cleaning);
    meta["task_intent"] = intent.toJSON();
    meta["filter_logic"] = logicToString(query.filter_logic);
    meta["matched_records"] = matchedRecords;
    meta["matched_productions"] = matchedProductions;
    meta["records_scanned"] = store.size();
    meta["leaf_evaluations"] = filters.leafEvaluations();
    meta["memo_hits"] = filters.memoHits();
    meta["elapsed_us"] = elapsed;
    if (query.production_level) {
        // The decisive task chose the unit; a contradicting hint is reported, not applied.
        const bool overridden = *query.production_level != (intent.unit == Granularity::Production);
        meta["granularity_hint_overridden"] = overridden;
        if (overridden) {
            CINEMAP_DEBUG("[{}] granularity hint '{}' overridden by task '{}'", id,
                          *query.production_level ? "production" : "location", kindToString(intent.kind));
        }
    }
    if (!meta.contains("self_check")) {
        meta["self_check"] = {{"performed", false}};
    }
    if (!meta.contains("alignment_violation")) {
        meta["alignment_violation"] = false;
    }

    const char* outcome = env.isEmpty() ? "empty" : "success";
    if (env.alignmentViolation()) {
        outcome = "alignment_violation";
        CINEMAP_WARN("[{}] Location self-check failed: {}", id, meta["self_check"]["violations"].dump());
    }
    CINEMAP_INFO("[{}] {} ({} records, {} productions matched, {} us)", id, env.summary,
                 matchedRecords, matchedProductions, elapsed);

    record({
        {"query_id", id},
        {"outcome", outcome},
        {"granularity", meta["granularity"]},
        {"summary", env.summary},
        {"query", query.toJSON()},
        {"metadata", meta}
    });
    return env;
}

} // namespace query
} // namespace cinemap
