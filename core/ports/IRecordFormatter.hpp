#pragma once

#include "../EventRecord.hpp"
#include <string>

namespace evhistory::ports {

// Encodes one history entry for display; output is concatenated in history order
class IRecordFormatter {
public:
    virtual ~IRecordFormatter() = default;

    virtual std::string format(const EventRecord& record, bool highlighted) const = 0;
};

} // namespace evhistory::ports
