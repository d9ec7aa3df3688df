#include "TypeMatcher.hpp"

namespace evhistory {

bool TypeMatcher::covers(const TypeFilterSet& filters, const TypeHandle& candidate) {
    if (filters.empty() || !candidate.valid()) return false;

    // Walking the candidate's ancestry keeps this linear in the hierarchy depth
    for (auto type = candidate; type.valid(); type = type.parent()) {
        if (filters.count(type) > 0) {
            return true;
        }
    }
    return false;
}

} // namespace evhistory
