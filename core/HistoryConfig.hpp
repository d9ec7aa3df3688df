#pragma once

#include "EventType.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace evhistory {

enum class OutputFormat {
    Text,
    Html,
    JsonLines
};

struct TypeDeclaration {
    std::string name;
    std::string parent;     ///< Empty means directly under the root type
};

/**
 * @brief Recorder settings
 *
 * Defaults reproduce the plain recorder: unbounded history, dormant until
 * the first listener registers, plain text rendering, quiet.
 */
struct HistoryConfig {
    size_t maxEntries = 0;                  ///< Oldest records are evicted beyond this; 0 = unbounded
    bool startActive = false;               ///< Force recording on at construction
    OutputFormat format = OutputFormat::Text;
    bool verbose = false;                   ///< Lifecycle logging on stdout

    std::vector<TypeDeclaration> types;     ///< Declared in order, parents first
};

std::string formatToString(OutputFormat format);

/** @throws std::runtime_error for names other than text, html, jsonl */
OutputFormat stringToFormat(const std::string& str);

/**
 * @brief Declare every configured type in @p registry
 * @throws std::invalid_argument if a parent is undeclared or a type conflicts
 */
void applyTypeDeclarations(const HistoryConfig& config, TypeRegistry& registry);

} // namespace evhistory
