#include "QueryEngine.hpp"
#include "../TypeMatcher.hpp"

namespace evhistory::domain {

QueryEngine::QueryEngine(const HistoryLog& log) : log_(log) {
}

std::vector<EventRecord> QueryEngine::query(const OptionalFilter& includes,
                                            const OptionalFilter& excludes) const {
    std::vector<EventRecord> matches;
    for (auto& record : log_.snapshot()) {
        if (QueryEngine::matches(record, includes, excludes)) {
            matches.push_back(std::move(record));
        }
    }
    return matches;
}

std::string QueryEngine::render(const OptionalFilter& filteredOut,
                                const OptionalFilter& highlighted,
                                const ports::IRecordFormatter& formatter) const {
    std::string text;
    for (const auto& record : log_.snapshot()) {
        const auto& eventType = record.eventType();
        if (filteredOut && TypeMatcher::covers(*filteredOut, eventType)) {
            continue;
        }
        bool emphasis = highlighted && TypeMatcher::covers(*highlighted, eventType);
        text += formatter.format(record, emphasis);
    }
    return text;
}

bool QueryEngine::matches(const EventRecord& record,
                          const OptionalFilter& includes,
                          const OptionalFilter& excludes) {
    const auto& eventType = record.eventType();
    if (includes && !TypeMatcher::covers(*includes, eventType)) return false;
    if (excludes && TypeMatcher::covers(*excludes, eventType)) return false;
    return true;
}

} // namespace evhistory::domain
