#include "utils/normalizer.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace cinemap {
namespace utils {

namespace {

constexpr std::array<std::string_view, 5> kNullTokens = {"none", "nan", "null", "n/a", "<na>"};

// Longest phrases first so "in san francisco" wins over "san francisco".
constexpr std::array<std::string_view, 8> kCityQualifiers = {
    "in san francisco", "san francisco, ca", "san francisco", "california",
    "in sf", ", sf", ", ca", "sf"
};

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string Normalizer::trim(std::string_view text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && isSpace(text[b])) ++b;
    while (e > b && isSpace(text[e - 1])) --e;
    return std::string(text.substr(b, e - b));
}

std::string Normalizer::toLower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool Normalizer::equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> Normalizer::canonical(std::string_view value) {
    std::string t = trim(value);
    if (t.empty()) return std::nullopt;
    for (auto tok : kNullTokens) {
        if (equalsIgnoreCase(t, tok)) return std::nullopt;
    }
    return t;
}

std::string Normalizer::surname(std::string_view fullName) {
    std::string t = trim(fullName);
    auto pos = std::find_if(t.rbegin(), t.rend(), isSpace);
    if (pos == t.rend()) return t;
    return std::string(pos.base(), t.end());
}

std::optional<std::string> Normalizer::stripCityQualifier(std::string_view text) {
    std::string out(text);
    bool changed = false;

    for (auto phrase : kCityQualifiers) {
        std::string lower = toLower(out);
        size_t pos = lower.find(phrase);
        while (pos != std::string::npos) {
            size_t end = pos + phrase.size();
            // Only whole words: "sf" must not eat the middle of "Transfer".
            bool leftOk = pos == 0 || !isWordChar(lower[pos - 1]) || !isWordChar(phrase.front());
            // Qualifiers trail a name or precede a comma; "California Street" stays intact.
            size_t next = end;
            while (next < lower.size() && isSpace(lower[next])) ++next;
            bool rightOk = next >= lower.size() || lower[next] == ',' ||
                           (next == end && !isWordChar(lower[end]));
            if (leftOk && rightOk) {
                out.erase(pos, phrase.size());
                lower.erase(pos, phrase.size());
                changed = true;
                pos = lower.find(phrase, pos);
            } else {
                pos = lower.find(phrase, pos + 1);
            }
        }
    }
    if (!changed) return std::nullopt;

    // Collapse whitespace left behind and drop dangling separators.
    std::string collapsed;
    collapsed.reserve(out.size());
    for (char c : out) {
        if (isSpace(c) && (collapsed.empty() || isSpace(collapsed.back()))) continue;
        collapsed.push_back(c);
    }
    std::string result = trim(collapsed);
    while (!result.empty() && (result.back() == ',' || isSpace(result.back()))) result.pop_back();
    while (!result.empty() && (result.front() == ',' || isSpace(result.front()))) result.erase(0, 1);
    return result;
}

} // namespace utils
} // namespace cinemap
