#pragma once

#include "../EventRecord.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace evhistory::domain {

/**
 * @brief Ordered, append-only store of recorded events
 *
 * Every operation takes the same lock, so a snapshot sees either all of a
 * clear() or none of it, and never a half-finished append.
 */
class HistoryLog {
public:
    explicit HistoryLog(size_t maxEntries = 0);

    void append(EventRecord record);
    void clear();

    // Copy of the current contents in arrival order
    std::vector<EventRecord> snapshot() const;

    size_t size() const;
    bool empty() const;

    size_t maxEntries() const;
    void setMaxEntries(size_t maxEntries);
    uint64_t evictedCount() const;

private:
    void trimLocked();

    mutable std::mutex mutex_;
    std::deque<EventRecord> records_;
    size_t maxEntries_;
    uint64_t evicted_ = 0;
};

} // namespace evhistory::domain
