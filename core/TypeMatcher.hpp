#pragma once

#include "EventType.hpp"

namespace evhistory {

class TypeMatcher {
public:
    // True iff some member of filters is the candidate type or one of its ancestors.
    // An empty set covers nothing.
    static bool covers(const TypeFilterSet& filters, const TypeHandle& candidate);
};

} // namespace evhistory
