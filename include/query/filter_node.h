#pragma once

#include "geo/geometry.h"
#include "storage/location_record.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace geo { class LandmarkRegistry; }

namespace query {

// ============================================================================
// Operators
// ============================================================================

enum class FilterOp {
    // Text (case-insensitive on canonicalized values)
    Eq,                 // ==, =, equals, is
    Neq,                // !=
    Contains,           // contains, like
    NotContains,
    StartsWith,
    EndsWith,
    In,
    NotIn,
    SurnameStartsWith,

    // Numeric (year)
    Gt,
    Gte,
    Lt,
    Lte,
    Between,            // inclusive

    // Spatial
    WithinDistance,
    Intersects,
    Within
};

enum class LogicOp { And, Or };

enum class ConditionKind { Attribute, Spatial };

std::optional<FilterOp> opFromString(std::string_view op);
const char* opToString(FilterOp op);
const char* logicToString(LogicOp logic);
// "AND"/"OR" (any case); throws ConfigurationError otherwise.
LogicOp logicFromString(std::string_view logic);

inline bool isSpatialOp(FilterOp op) {
    return op == FilterOp::WithinDistance || op == FilterOp::Intersects || op == FilterOp::Within;
}

inline bool isNegativeOp(FilterOp op) {
    return op == FilterOp::Neq || op == FilterOp::NotContains || op == FilterOp::NotIn;
}

// Positive counterpart of a negative operator; identity otherwise.
FilterOp positiveForm(FilterOp op);

// ============================================================================
// Filter nodes
// ============================================================================

struct FilterNode;
using FilterNodePtr = std::shared_ptr<const FilterNode>;

// Comparand of a leaf, validated and resolved at parse time.
struct Comparand {
    std::vector<std::string> terms;          // text operators
    std::vector<double> numbers;             // year eq/neq/in/not_in
    std::optional<double> lower;             // gt/gte/between
    std::optional<double> upper;             // lt/lte/between

    std::optional<geo::Coordinate> center;   // within_distance
    double radius_meters = 0.0;
    std::optional<geo::GeometryInfo> region; // intersects/within
};

struct FilterLeaf {
    RecordField field = RecordField::Title;
    FilterOp op = FilterOp::Eq;
    ConditionKind kind = ConditionKind::Attribute;
    nlohmann::json value;                    // comparand as written
    Comparand comparand;
};

struct FilterComposite {
    LogicOp logic = LogicOp::And;
    std::vector<FilterNodePtr> children;
};

struct FilterNode {
    enum class Type { Leaf, Composite };

    Type type = Type::Leaf;
    FilterLeaf leaf;
    FilterComposite composite;

    bool isLeaf() const { return type == Type::Leaf; }
    bool isComposite() const { return type == Type::Composite; }

    // Canonical JSON form; equal sub-trees produce equal dumps.
    nlohmann::json toJSON() const;
    std::string structuralKey() const { return toJSON().dump(); }

    static FilterNodePtr makeLeaf(FilterLeaf leaf);
    static FilterNodePtr makeComposite(LogicOp logic, std::vector<FilterNodePtr> children);
};

/**
 * @brief Builds filter trees from their JSON form
 *
 * Leaf:      {"field": "Director", "condition": "==", "value": "Hitchcock", "type": "attribute"}
 * Composite: {"logic": "OR", "conditions": [ ... ]}
 *
 * Every problem (unknown field/operator, operator not valid for the field,
 * empty composite, missing or unresolvable spatial parameters) raises
 * ConfigurationError naming the offending node.
 */
class FilterParser {
public:
    explicit FilterParser(const geo::LandmarkRegistry& landmarks);

    FilterNodePtr parse(const nlohmann::json& node) const;
    std::vector<FilterNodePtr> parseList(const nlohmann::json& filters) const;

private:
    FilterNodePtr parseLeaf(const nlohmann::json& node) const;
    FilterNodePtr parseComposite(const nlohmann::json& node) const;
    void resolveAttribute(FilterLeaf& leaf, const nlohmann::json& node) const;
    void resolveSpatial(FilterLeaf& leaf, const nlohmann::json& node) const;
    geo::Coordinate resolveCenter(const nlohmann::json& center, const nlohmann::json& node) const;

    const geo::LandmarkRegistry& landmarks_;
};

} // namespace query
} // namespace cinemap
