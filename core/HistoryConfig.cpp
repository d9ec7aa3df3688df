#include "HistoryConfig.hpp"
#include <stdexcept>
#include <unordered_map>

namespace evhistory {

std::string formatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Html: return "html";
        case OutputFormat::JsonLines: return "jsonl";
        default: return "unknown";
    }
}

OutputFormat stringToFormat(const std::string& str) {
    static const std::unordered_map<std::string, OutputFormat> formatMap = {
        {"text", OutputFormat::Text},
        {"html", OutputFormat::Html},
        {"jsonl", OutputFormat::JsonLines},
        {"json", OutputFormat::JsonLines}
    };

    auto it = formatMap.find(str);
    if (it == formatMap.end()) {
        throw std::runtime_error("unknown output format '" + str + "' (expected text, html or jsonl)");
    }
    return it->second;
}

void applyTypeDeclarations(const HistoryConfig& config, TypeRegistry& registry) {
    for (const auto& decl : config.types) {
        if (decl.parent.empty()) {
            registry.declare(decl.name);
        } else {
            registry.declare(decl.name, decl.parent);
        }
    }
}

} // namespace evhistory
