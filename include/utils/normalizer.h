#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cinemap {
namespace utils {

class Normalizer {
public:
    // Null canonicalization: trims the value; empty, whitespace-only and the
    // stand-ins "none", "nan", "null", "n/a", "<na>" (any case) become absent.
    // canonical(canonical(x)) == canonical(x).
    static std::optional<std::string> canonical(std::string_view value);
    static bool isAbsent(std::string_view value) { return !canonical(value).has_value(); }

    static std::string trim(std::string_view text);
    static std::string toLower(std::string_view text);
    static bool equalsIgnoreCase(std::string_view a, std::string_view b);

    // Last whitespace-separated token of a trimmed name ("Nicolas Cage" -> "Cage").
    static std::string surname(std::string_view fullName);

    // Removes generic city/region qualifiers ("in San Francisco", "SF", "California", ...)
    // from a search term. Returns std::nullopt when nothing was removed.
    static std::optional<std::string> stripCityQualifier(std::string_view text);
};

} // namespace utils
} // namespace cinemap
