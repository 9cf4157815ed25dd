#include "query/granularity_resolver.h"

namespace cinemap {
namespace query {

std::vector<size_t> GranularityResolver::resolve(const SelectionMask& mask, Granularity unit) const {
    return unit == Granularity::Production ? representatives(mask) : observations(mask);
}

std::vector<size_t> GranularityResolver::observations(const SelectionMask& mask) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < mask.size() && i < store_.size(); ++i) {
        if (mask[i]) out.push_back(i);
    }
    return out;
}

std::vector<size_t> GranularityResolver::representatives(const SelectionMask& mask) const {
    std::vector<uint8_t> seen(store_.productionCount(), 0);
    std::vector<size_t> out;
    for (size_t i = 0; i < mask.size() && i < store_.size(); ++i) {
        if (!mask[i]) continue;
        const size_t ord = store_.productionOf(i);
        if (seen[ord]) continue;
        seen[ord] = 1;
        out.push_back(i);
    }
    return out;
}

std::vector<size_t> GranularityResolver::productions(const SelectionMask& mask) const {
    std::vector<size_t> out;
    for (size_t idx : representatives(mask)) {
        out.push_back(store_.productionOf(idx));
    }
    return out;
}

} // namespace query
} // namespace cinemap
