#pragma once

#include "../HistoryConfig.hpp"
#include "../ports/IRecordFormatter.hpp"
#include <memory>
#include <string>

namespace evhistory::adapters {

// One HTML line per record: timestamp, type and summary; <b> on emphasis
class HtmlRecordFormatter : public ports::IRecordFormatter {
public:
    std::string format(const EventRecord& record, bool highlighted) const override;

    static std::string escape(const std::string& text);
};

// "[timestamp] #seq Type: summary", prefixed with "* " on emphasis
class PlainTextRecordFormatter : public ports::IRecordFormatter {
public:
    static constexpr const char* EMPHASIS_MARKER = "* ";

    std::string format(const EventRecord& record, bool highlighted) const override;
};

// One JSON object per line
class JsonLinesRecordFormatter : public ports::IRecordFormatter {
public:
    std::string format(const EventRecord& record, bool highlighted) const override;
};

std::shared_ptr<const ports::IRecordFormatter> makeRecordFormatter(OutputFormat format);

} // namespace evhistory::adapters
