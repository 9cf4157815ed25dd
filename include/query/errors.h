#pragma once

#include <stdexcept>
#include <string>

namespace cinemap {
namespace query {

/**
 * @brief Thrown when a query is malformed
 *
 * Unknown field or operator, operator not valid for the field, composite
 * without children, spatial condition without center or radius. Fatal for
 * the query; never retried.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief Thrown when the query asks to change data
 *
 * Carries the upstream refusal verbatim; the query is never evaluated.
 */
class ModificationRejected : public std::runtime_error {
public:
    ModificationRejected(const std::string& message, const std::string& requested_operation)
        : std::runtime_error(message)
        , requested_operation_(requested_operation)
    {}

    const std::string& requestedOperation() const { return requested_operation_; }

private:
    std::string requested_operation_;
};

} // namespace query
} // namespace cinemap
