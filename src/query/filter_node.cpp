#include "query/filter_node.h"
#include "query/errors.h"
#include "geo/landmarks.h"
#include "utils/normalizer.h"

#include <cctype>
#include <stdexcept>

namespace cinemap {
namespace query {

using json = nlohmann::json;
using utils::Normalizer;

namespace {

std::string opKey(std::string_view op) {
    std::string k = Normalizer::toLower(Normalizer::trim(op));
    for (auto& c : k) {
        if (c == ' ' || c == '-') c = '_';
    }
    return k;
}

bool isPersonField(RecordField f) {
    return f == RecordField::Director || f == RecordField::Writer || isActorField(f);
}

bool isNumericOp(FilterOp op) {
    return op == FilterOp::Gt || op == FilterOp::Gte || op == FilterOp::Lt ||
           op == FilterOp::Lte || op == FilterOp::Between;
}

[[noreturn]] void fail(const std::string& what, const json& node) {
    throw ConfigurationError(what + " in filter " + node.dump());
}

std::string scalarText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number_float()) {
        json tmp = v;
        return tmp.dump();
    }
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return {};
}

std::optional<double> toNumber(const json& v) {
    if (v.is_number()) return v.get<double>();
    if (!v.is_string()) return std::nullopt;
    auto c = Normalizer::canonical(v.get<std::string>());
    if (!c) return std::nullopt;
    try {
        size_t pos = 0;
        double d = std::stod(*c, &pos);
        if (pos == c->size()) return d;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

const json* member(const json& obj, std::initializer_list<const char*> names) {
    if (!obj.is_object()) return nullptr;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        for (const char* n : names) {
            if (Normalizer::equalsIgnoreCase(it.key(), n)) return &it.value();
        }
    }
    return nullptr;
}

// "1940-1949", "1940 to 1949", "1940 and 1949"
bool splitRange(const std::string& text, std::string& lo, std::string& hi) {
    const std::string lower = Normalizer::toLower(text);
    for (std::string_view sep : {" and ", " to ", "-", ".."}) {
        size_t pos = lower.find(sep, 1);
        if (pos != std::string::npos) {
            lo = Normalizer::trim(std::string_view(text).substr(0, pos));
            hi = Normalizer::trim(std::string_view(text).substr(pos + sep.size()));
            return true;
        }
    }
    return false;
}

// "1.5 mi", "800m", 2
bool parseRadius(const json& v, double& amount, std::optional<geo::DistanceUnit>& unit) {
    if (v.is_number()) {
        amount = v.get<double>();
        return true;
    }
    if (!v.is_string()) return false;
    const std::string s = Normalizer::trim(v.get<std::string>());
    try {
        size_t pos = 0;
        amount = std::stod(s, &pos);
        std::string rest = Normalizer::trim(std::string_view(s).substr(pos));
        if (!rest.empty()) {
            unit = geo::unitFromString(rest);
            if (!unit) return false;
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::optional<FilterOp> opFromString(std::string_view op) {
    const std::string k = opKey(op);
    if (k == "==" || k == "=" || k == "eq" || k == "equals" || k == "equal" || k == "is") return FilterOp::Eq;
    if (k == "!=" || k == "<>" || k == "neq" || k == "ne" || k == "not_equals" || k == "is_not") return FilterOp::Neq;
    if (k == "contains" || k == "like" || k == "includes") return FilterOp::Contains;
    if (k == "not_contains" || k == "not_like" || k == "does_not_contain") return FilterOp::NotContains;
    if (k == "starts_with" || k == "startswith" || k == "begins_with") return FilterOp::StartsWith;
    if (k == "ends_with" || k == "endswith") return FilterOp::EndsWith;
    if (k == "in" || k == "one_of") return FilterOp::In;
    if (k == "not_in") return FilterOp::NotIn;
    if (k == "surname_starts_with" || k == "last_name_starts_with") return FilterOp::SurnameStartsWith;
    if (k == ">" || k == "gt" || k == "greater_than" || k == "after") return FilterOp::Gt;
    if (k == ">=" || k == "gte") return FilterOp::Gte;
    if (k == "<" || k == "lt" || k == "less_than" || k == "before") return FilterOp::Lt;
    if (k == "<=" || k == "lte") return FilterOp::Lte;
    if (k == "between" || k == "range") return FilterOp::Between;
    if (k == "within_distance" || k == "within_radius" || k == "near" || k == "dwithin") return FilterOp::WithinDistance;
    if (k == "intersects") return FilterOp::Intersects;
    if (k == "within" || k == "inside") return FilterOp::Within;
    return std::nullopt;
}

const char* opToString(FilterOp op) {
    switch (op) {
        case FilterOp::Eq: return "eq";
        case FilterOp::Neq: return "neq";
        case FilterOp::Contains: return "contains";
        case FilterOp::NotContains: return "not_contains";
        case FilterOp::StartsWith: return "starts_with";
        case FilterOp::EndsWith: return "ends_with";
        case FilterOp::In: return "in";
        case FilterOp::NotIn: return "not_in";
        case FilterOp::SurnameStartsWith: return "surname_starts_with";
        case FilterOp::Gt: return "gt";
        case FilterOp::Gte: return "gte";
        case FilterOp::Lt: return "lt";
        case FilterOp::Lte: return "lte";
        case FilterOp::Between: return "between";
        case FilterOp::WithinDistance: return "within_distance";
        case FilterOp::Intersects: return "intersects";
        case FilterOp::Within: return "within";
    }
    return "unknown";
}

const char* logicToString(LogicOp logic) {
    return logic == LogicOp::And ? "AND" : "OR";
}

LogicOp logicFromString(std::string_view logic) {
    if (Normalizer::equalsIgnoreCase(Normalizer::trim(logic), "and")) return LogicOp::And;
    if (Normalizer::equalsIgnoreCase(Normalizer::trim(logic), "or")) return LogicOp::Or;
    throw ConfigurationError("Unknown filter logic '" + std::string(logic) + "' (expected AND or OR)");
}

FilterOp positiveForm(FilterOp op) {
    switch (op) {
        case FilterOp::Neq: return FilterOp::Eq;
        case FilterOp::NotContains: return FilterOp::Contains;
        case FilterOp::NotIn: return FilterOp::In;
        default: return op;
    }
}

// ============================================================================
// FilterNode
// ============================================================================

json FilterNode::toJSON() const {
    if (isLeaf()) {
        return {
            {"field", fieldName(leaf.field)},
            {"condition", opToString(leaf.op)},
            {"value", leaf.value},
            {"type", leaf.kind == ConditionKind::Spatial ? "spatial" : "attribute"}
        };
    }
    json conditions = json::array();
    for (const auto& child : composite.children) {
        conditions.push_back(child->toJSON());
    }
    return {{"logic", logicToString(composite.logic)}, {"conditions", std::move(conditions)}};
}

FilterNodePtr FilterNode::makeLeaf(FilterLeaf leaf) {
    auto node = std::make_shared<FilterNode>();
    node->type = Type::Leaf;
    node->leaf = std::move(leaf);
    return node;
}

FilterNodePtr FilterNode::makeComposite(LogicOp logic, std::vector<FilterNodePtr> children) {
    if (children.empty()) {
        throw ConfigurationError(std::string("Composite filter (") + logicToString(logic) + ") has no conditions");
    }
    auto node = std::make_shared<FilterNode>();
    node->type = Type::Composite;
    node->composite.logic = logic;
    node->composite.children = std::move(children);
    return node;
}

// ============================================================================
// FilterParser
// ============================================================================

FilterParser::FilterParser(const geo::LandmarkRegistry& landmarks)
    : landmarks_(landmarks) {}

std::vector<FilterNodePtr> FilterParser::parseList(const json& filters) const {
    std::vector<FilterNodePtr> out;
    if (filters.is_null()) return out;
    if (!filters.is_array()) {
        throw ConfigurationError("'filters' must be an array, got " + filters.dump());
    }
    out.reserve(filters.size());
    for (const auto& f : filters) {
        out.push_back(parse(f));
    }
    return out;
}

FilterNodePtr FilterParser::parse(const json& node) const {
    if (!node.is_object()) {
        throw ConfigurationError("Filter node must be an object, got " + node.dump());
    }
    if (node.contains("conditions") || node.contains("logic")) {
        return parseComposite(node);
    }
    return parseLeaf(node);
}

FilterNodePtr FilterParser::parseComposite(const json& node) const {
    LogicOp logic = LogicOp::And;
    if (node.contains("logic")) {
        if (!node["logic"].is_string()) fail("Composite logic must be a string", node);
        try {
            logic = logicFromString(node["logic"].get<std::string>());
        } catch (const ConfigurationError& e) {
            fail(e.what(), node);
        }
    }
    const json* conditions = member(node, {"conditions"});
    if (!conditions || !conditions->is_array()) fail("Composite filter needs a 'conditions' array", node);
    if (conditions->empty()) fail("Composite filter has no conditions", node);

    std::vector<FilterNodePtr> children;
    children.reserve(conditions->size());
    for (const auto& c : *conditions) {
        children.push_back(parse(c));
    }
    return FilterNode::makeComposite(logic, std::move(children));
}

FilterNodePtr FilterParser::parseLeaf(const json& node) const {
    const json* field = member(node, {"field", "column"});
    if (!field || !field->is_string()) fail("Filter is missing 'field'", node);
    const json* cond = member(node, {"condition", "operator", "op"});
    if (!cond || !cond->is_string()) fail("Filter is missing 'condition'", node);
    const json* value = member(node, {"value", "values"});
    if (!value) fail("Filter is missing 'value'", node);

    FilterLeaf leaf;
    auto f = fieldFromString(field->get<std::string>());
    if (!f) fail("Unknown field '" + field->get<std::string>() + "'", node);
    auto op = opFromString(cond->get<std::string>());
    if (!op) fail("Unknown operator '" + cond->get<std::string>() + "'", node);
    leaf.field = *f;
    leaf.op = *op;
    leaf.value = *value;
    leaf.kind = isSpatialOp(*op) ? ConditionKind::Spatial : ConditionKind::Attribute;

    if (const json* type = member(node, {"type", "kind"})) {
        const std::string t = type->is_string() ? Normalizer::toLower(type->get<std::string>()) : "";
        if (t == "spatial") {
            if (leaf.kind != ConditionKind::Spatial) fail("Operator '" + std::string(opToString(*op)) + "' is not spatial", node);
        } else if (t == "attribute") {
            if (leaf.kind != ConditionKind::Attribute) fail("Spatial operator on an attribute condition", node);
        } else {
            fail("Unknown condition type " + type->dump(), node);
        }
    }

    if (leaf.kind == ConditionKind::Spatial) {
        if (leaf.field != RecordField::Geometry && leaf.field != RecordField::Locations) {
            fail("Spatial operator '" + std::string(opToString(*op)) + "' needs the geometry field", node);
        }
        leaf.field = RecordField::Geometry;
        resolveSpatial(leaf, node);
    } else {
        if (leaf.field == RecordField::Geometry) {
            fail("Operator '" + std::string(opToString(*op)) + "' is not valid on geometry", node);
        }
        resolveAttribute(leaf, node);
    }
    return FilterNode::makeLeaf(std::move(leaf));
}

void FilterParser::resolveAttribute(FilterLeaf& leaf, const json& node) const {
    const json& v = leaf.value;
    const bool list = leaf.op == FilterOp::In || leaf.op == FilterOp::NotIn;
    Comparand& c = leaf.comparand;

    if (leaf.field == RecordField::Year) {
        auto number = [&](const json& x) {
            auto n = toNumber(x);
            if (!n) fail("Non-numeric year comparand " + x.dump(), node);
            return *n;
        };
        switch (leaf.op) {
            case FilterOp::Eq:
            case FilterOp::Neq:
                if (v.is_array()) fail("Operator expects a single year", node);
                c.numbers.push_back(number(v));
                return;
            case FilterOp::In:
            case FilterOp::NotIn:
                if (v.is_array()) {
                    if (v.empty()) fail("Empty year list", node);
                    for (const auto& x : v) c.numbers.push_back(number(x));
                } else {
                    c.numbers.push_back(number(v));
                }
                return;
            case FilterOp::Gt:
            case FilterOp::Gte:
                c.lower = number(v);
                return;
            case FilterOp::Lt:
            case FilterOp::Lte:
                c.upper = number(v);
                return;
            case FilterOp::Between: {
                if (v.is_array() && v.size() == 2) {
                    c.lower = number(v[0]);
                    c.upper = number(v[1]);
                } else if (v.is_object()) {
                    const json* lo = member(v, {"min", "from", "start", "low"});
                    const json* hi = member(v, {"max", "to", "end", "high"});
                    if (!lo || !hi) fail("Range needs min and max", node);
                    c.lower = number(*lo);
                    c.upper = number(*hi);
                } else if (v.is_string()) {
                    std::string lo, hi;
                    if (!splitRange(v.get<std::string>(), lo, hi)) fail("Unreadable year range", node);
                    c.lower = number(json(lo));
                    c.upper = number(json(hi));
                } else {
                    fail("Unreadable year range", node);
                }
                return;
            }
            default:
                fail("Operator '" + std::string(opToString(leaf.op)) + "' is not valid on year", node);
        }
    }

    if (isNumericOp(leaf.op)) {
        fail("Operator '" + std::string(opToString(leaf.op)) + "' is only valid on year", node);
    }
    if (leaf.op == FilterOp::SurnameStartsWith && !isPersonField(leaf.field)) {
        fail("surname_starts_with is only valid on person fields", node);
    }

    auto addTerm = [&](const json& x) {
        if (!x.is_string() && !x.is_number() && !x.is_boolean()) fail("Unsupported comparand " + x.dump(), node);
        auto t = Normalizer::canonical(scalarText(x));
        if (!t) fail("Empty comparand", node);
        c.terms.push_back(Normalizer::toLower(*t));
    };
    if (v.is_array()) {
        if (!list) fail("Operator '" + std::string(opToString(leaf.op)) + "' expects a single value", node);
        if (v.empty()) fail("Empty value list", node);
        for (const auto& x : v) addTerm(x);
    } else {
        addTerm(v);
    }
}

void FilterParser::resolveSpatial(FilterLeaf& leaf, const json& node) const {
    const json& v = leaf.value;
    Comparand& c = leaf.comparand;

    if (leaf.op == FilterOp::WithinDistance) {
        if (!v.is_object()) fail("within_distance needs {center, radius, unit}", node);
        const json* center = member(v, {"center", "point", "location", "landmark"});
        if (!center) fail("within_distance is missing its center point", node);
        const json* radius = member(v, {"radius", "distance"});
        if (!radius) fail("within_distance is missing its radius", node);

        double amount = 0.0;
        std::optional<geo::DistanceUnit> unit;
        if (!parseRadius(*radius, amount, unit) || amount < 0.0) fail("Invalid radius " + radius->dump(), node);
        if (!unit) {
            const json* u = member(v, {"unit", "units"});
            if (u && !u->is_string()) fail("Invalid unit " + u->dump(), node);
            unit = geo::unitFromString(u ? u->get<std::string>() : "");
            if (!unit) fail("Unknown distance unit " + u->dump(), node);
        }
        c.center = resolveCenter(*center, node);
        c.radius_meters = geo::toMeters(amount, *unit);
        return;
    }

    try {
        c.region = geo::GeometryParser::parseRegion(v);
    } catch (const std::runtime_error& e) {
        fail(std::string("Unreadable region: ") + e.what(), node);
    }
}

geo::Coordinate FilterParser::resolveCenter(const json& center, const json& node) const {
    if (center.is_string()) {
        const std::string name = center.get<std::string>();
        if (auto p = landmarks_.find(name)) return *p;
        if (auto p = geo::GeometryParser::pointFromJson(center)) return *p;
        fail("Unknown landmark '" + name + "'", node);
    }
    if (auto p = geo::GeometryParser::pointFromJson(center)) return *p;
    fail("Unreadable center point " + center.dump(), node);
}

} // namespace query
} // namespace cinemap
