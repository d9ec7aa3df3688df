#include "HistoryLog.hpp"

namespace evhistory::domain {

HistoryLog::HistoryLog(size_t maxEntries) : maxEntries_(maxEntries) {
}

void HistoryLog::append(EventRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
    trimLocked();
}

void HistoryLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

std::vector<EventRecord> HistoryLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<EventRecord>(records_.begin(), records_.end());
}

size_t HistoryLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool HistoryLog::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.empty();
}

size_t HistoryLog::maxEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxEntries_;
}

void HistoryLog::setMaxEntries(size_t maxEntries) {
    std::lock_guard<std::mutex> lock(mutex_);
    maxEntries_ = maxEntries;
    trimLocked();
}

uint64_t HistoryLog::evictedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

void HistoryLog::trimLocked() {
    if (maxEntries_ == 0) return;

    while (records_.size() > maxEntries_) {
        records_.pop_front();
        ++evicted_;
    }
}

} // namespace evhistory::domain
