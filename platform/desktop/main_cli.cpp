/**
 * @file main_cli.cpp
 * @brief Command-line front end for the event history recorder
 *
 * Reads JSON-lines events from a file or stdin, dispatches them through the
 * event bus into the recorder, and prints the recorded history either as
 * rendered text or as a JSON query result.
 *
 * Input line format:
 *   {"type": "ui.Click", "parent": "ui.Event", "source": "button1",
 *    "message": "clicked", "extras": {"x": "10"}}
 *
 * @note Type names used in filters must be declared in the config file or
 *       appear in the input
 */

#include "TomlConfig.hpp"
#include "EventType.hpp"
#include "IClock.hpp"
#include "JsonCodec.hpp"
#include "domain/EventBus.hpp"
#include "domain/EventHistory.hpp"
#include "adapters/CallbackListener.hpp"
#include "adapters/RecordFormatters.hpp"
#include <iostream>
#include <fstream>
#include <optional>
#include <sstream>
#include <signal.h>
#include <cstdlib>

using namespace evhistory;

/// Global flag for graceful shutdown coordination
static volatile sig_atomic_t g_running = 1;

void signalHandler(int) {
    g_running = 0;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>       Configuration file (TOML)\n"
              << "  --input <file>        JSON-lines event file (default: stdin)\n"
              << "  --format <name>       Output format: text, html, jsonl\n"
              << "  --max-entries <n>     Keep at most n records (0 = unbounded)\n"
              << "  --follow              Print each event as it is recorded\n"
              << "  --filter <types>      Omit these types (and subtypes) from the output\n"
              << "  --highlight <types>   Emphasise these types (and subtypes)\n"
              << "  --include <types>     Query: keep only these types (and subtypes)\n"
              << "  --exclude <types>     Query: drop these types (and subtypes)\n"
              << "  --json                Print the query result as a JSON array\n"
              << "  --verbose             Log lifecycle messages\n"
              << "  --help                Show this help message\n"
              << "\n<types> is a comma-separated list of type names.\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [history]\n"
              << "  max_entries = 1000\n"
              << "  format = \"text\"\n"
              << "  [types]\n"
              << "  ui.Event = \"Event\"\n"
              << "  ui.Click = \"ui.Event\"\n"
              << std::endl;
}

std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

// Environment variables take precedence over the config file
void applyEnvironment(HistoryConfig& config) {
    std::string maxEntries = safeGetEnv("EVHISTORY_MAX_ENTRIES");
    std::string format = safeGetEnv("EVHISTORY_FORMAT");
    std::string startActive = safeGetEnv("EVHISTORY_START_ACTIVE");

    if (!maxEntries.empty()) config.maxEntries = TomlConfig::parseSize("EVHISTORY_MAX_ENTRIES", maxEntries);
    if (!format.empty()) config.format = stringToFormat(format);
    if (!startActive.empty()) config.startActive = TomlConfig::parseBool("EVHISTORY_START_ACTIVE", startActive);
}

std::vector<std::string> splitList(const std::string& list) {
    std::vector<std::string> items;
    std::istringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Unknown names are reported and skipped; they cannot match any recorded event
domain::OptionalFilter resolveFilter(const TypeRegistry& registry,
                                     const std::optional<std::string>& option,
                                     const char* optionName) {
    if (!option) return std::nullopt;

    TypeFilterSet filter;
    for (const auto& name : splitList(*option)) {
        if (auto type = registry.find(name)) {
            filter.insert(*type);
        } else {
            std::cerr << "[CLI] Warning: unknown type '" << name << "' in " << optionName << std::endl;
        }
    }
    return filter;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::string configFile;
    std::string inputFile;
    std::optional<std::string> formatOption;
    std::optional<std::string> maxEntriesOption;
    std::optional<std::string> filterOption;
    std::optional<std::string> highlightOption;
    std::optional<std::string> includeOption;
    std::optional<std::string> excludeOption;
    bool follow = false;
    bool jsonOutput = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && hasValue) {
            configFile = argv[++i];
        } else if (arg == "--input" && hasValue) {
            inputFile = argv[++i];
        } else if (arg == "--format" && hasValue) {
            formatOption = argv[++i];
        } else if (arg == "--max-entries" && hasValue) {
            maxEntriesOption = argv[++i];
        } else if (arg == "--filter" && hasValue) {
            filterOption = argv[++i];
        } else if (arg == "--highlight" && hasValue) {
            highlightOption = argv[++i];
        } else if (arg == "--include" && hasValue) {
            includeOption = argv[++i];
        } else if (arg == "--exclude" && hasValue) {
            excludeOption = argv[++i];
        } else if (arg == "--follow") {
            follow = true;
        } else if (arg == "--json") {
            jsonOutput = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    HistoryConfig config;
    TypeRegistry registry;
    try {
        if (!configFile.empty()) {
            config = TomlConfig::loadFromFile(configFile);
        }
        applyEnvironment(config);
        if (formatOption) config.format = stringToFormat(*formatOption);
        if (maxEntriesOption) config.maxEntries = TomlConfig::parseSize("--max-entries", *maxEntriesOption);
        if (verbose) config.verbose = true;

        applyTypeDeclarations(config, registry);
    } catch (const std::exception& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;
        return 1;
    }

    std::ifstream inputStream;
    if (!inputFile.empty()) {
        inputStream.open(inputFile);
        if (!inputStream.is_open()) {
            std::cerr << "[CLI] Could not open input file: " << inputFile << std::endl;
            return 1;
        }
    }
    std::istream& input = inputFile.empty() ? std::cin : inputStream;

    auto clock = std::make_shared<SystemClock>();
    auto formatter = adapters::makeRecordFormatter(config.format);
    auto bus = std::make_shared<domain::EventBus>(config.verbose);

    domain::EventHistory history(clock, formatter, config);
    history.attach(bus, registry.root());

    std::shared_ptr<adapters::CallbackListener> follower;
    if (follow) {
        follower = adapters::makeListener([&formatter](const EventRecord& record) {
            std::cout << formatter->format(record, false) << std::flush;
        });
        history.addListener(follower);
    }

    // The tool exists to record, so recording stays on without a listener too
    history.setActive(true);

    std::string line;
    int lineNumber = 0;
    int rejected = 0;
    while (g_running && std::getline(input, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        try {
            bus->publish(JsonCodec::deserialize(line, registry));
            bus->processEvents();
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[CLI] line " << lineNumber << ": invalid event: " << e.what() << std::endl;
            ++rejected;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[CLI] line " << lineNumber << ": " << e.what() << std::endl;
            ++rejected;
        }
    }

    if (follower) {
        history.removeListener(follower);
    }

    if (config.verbose) {
        std::cout << "[CLI] Recorded " << history.size() << " events";
        if (rejected > 0) std::cout << ", rejected " << rejected << " lines";
        std::cout << std::endl;
    }

    if (includeOption || excludeOption || jsonOutput) {
        auto records = history.events(resolveFilter(registry, includeOption, "--include"),
                                      resolveFilter(registry, excludeOption, "--exclude"));
        if (jsonOutput) {
            std::cout << JsonCodec::recordsToJson(records).dump(2) << std::endl;
        } else {
            for (const auto& record : records) {
                std::cout << formatter->format(record, false);
            }
        }
    } else {
        std::cout << history.toText(resolveFilter(registry, filterOption, "--filter"),
                                    resolveFilter(registry, highlightOption, "--highlight"));
    }

    history.shutdown();
    return rejected > 0 ? 2 : 0;
}
