#include "RecordFormatters.hpp"
#include "../JsonCodec.hpp"
#include <sstream>

namespace evhistory::adapters {

std::string HtmlRecordFormatter::format(const EventRecord& record, bool highlighted) const {
    std::ostringstream ss;
    if (highlighted) ss << "<b>";

    if (!record.timestamp().empty()) {
        ss << "<font color=\"gray\">[" << escape(record.timestamp()) << "]</font> ";
    }
    ss << "<font color=\"green\">" << escape(record.eventType().name()) << "</font>";
    if (!record.source().empty()) {
        ss << " <i>" << escape(record.source()) << "</i>";
    }
    ss << ": " << escape(record.renderedForm());

    if (highlighted) ss << "</b>";
    ss << "<br>\n";
    return ss.str();
}

std::string HtmlRecordFormatter::escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            default: result += c; break;
        }
    }
    return result;
}

std::string PlainTextRecordFormatter::format(const EventRecord& record, bool highlighted) const {
    std::ostringstream ss;
    if (highlighted) ss << EMPHASIS_MARKER;

    if (!record.timestamp().empty()) {
        ss << '[' << record.timestamp() << "] ";
    }
    ss << '#' << record.occurredAt() << ' ' << record.eventType().name();
    if (!record.source().empty()) {
        ss << " (" << record.source() << ')';
    }
    ss << ": " << record.renderedForm() << '\n';
    return ss.str();
}

std::string JsonLinesRecordFormatter::format(const EventRecord& record, bool highlighted) const {
    auto j = JsonCodec::recordToJson(record);
    if (highlighted) {
        j["highlighted"] = true;
    }
    return j.dump() + "\n";
}

std::shared_ptr<const ports::IRecordFormatter> makeRecordFormatter(OutputFormat format) {
    switch (format) {
        case OutputFormat::Html:
            return std::make_shared<HtmlRecordFormatter>();
        case OutputFormat::JsonLines:
            return std::make_shared<JsonLinesRecordFormatter>();
        case OutputFormat::Text:
        default:
            return std::make_shared<PlainTextRecordFormatter>();
    }
}

} // namespace evhistory::adapters
