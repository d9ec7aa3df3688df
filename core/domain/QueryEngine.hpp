#pragma once

#include "../EventRecord.hpp"
#include "../EventType.hpp"
#include "../ports/IRecordFormatter.hpp"
#include "HistoryLog.hpp"
#include <optional>
#include <string>
#include <vector>

namespace evhistory::domain {

using OptionalFilter = std::optional<TypeFilterSet>;

/**
 * @brief Read-only type-filtered views of a HistoryLog
 *
 * Both operations work on a snapshot, so they run alongside recording and
 * never see a partially applied clear().
 */
class QueryEngine {
public:
    explicit QueryEngine(const HistoryLog& log);

    /**
     * @brief Records covered by @p includes and not covered by @p excludes
     * @param includes Absent means every type is included
     * @param excludes Absent means nothing is excluded
     * @return Matching records in arrival order
     */
    std::vector<EventRecord> query(const OptionalFilter& includes,
                                   const OptionalFilter& excludes) const;

    /**
     * @brief Concatenated encoding of the history
     * @param filteredOut Records covered by this set produce no output
     * @param highlighted Records covered by this set are encoded with emphasis
     * @param formatter Per-record encoder
     */
    std::string render(const OptionalFilter& filteredOut,
                       const OptionalFilter& highlighted,
                       const ports::IRecordFormatter& formatter) const;

    static bool matches(const EventRecord& record,
                        const OptionalFilter& includes,
                        const OptionalFilter& excludes);

private:
    const HistoryLog& log_;
};

} // namespace evhistory::domain
