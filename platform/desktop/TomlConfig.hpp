/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the event history tools
 *
 * Provides a small TOML-subset parser for recorder settings and event type
 * declarations, shared by the command-line tool and the viewer.
 *
 * Supported Sections:
 * - [history]: capacity, initial activation, output format, logging
 * - [types]: event type hierarchy as `name = "parent"` pairs
 *
 * @note Simple line-based parser; arrays, inline tables and multi-line
 *       strings are not supported
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include "HistoryConfig.hpp"

namespace evhistory {

/**
 * @brief TOML configuration file parser
 *
 * Unknown sections and keys are ignored with a warning so that one file can
 * also carry settings for the surrounding application.
 */
class TomlConfig {
public:
    /**
     * @brief Load and parse a configuration file
     * @param filename Path to TOML configuration file
     * @return Parsed configuration; defaults if the file cannot be opened
     * @throws std::runtime_error on malformed values
     */
    static HistoryConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename
                      << ", using defaults" << std::endl;
            return HistoryConfig{};
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return loadFromString(buffer.str());
    }

    /**
     * @brief Parse configuration text
     * @param content TOML document
     * @throws std::runtime_error on malformed values
     * @note Type declarations keep file order, so parents must come first
     */
    static HistoryConfig loadFromString(const std::string& content) {
        HistoryConfig config;
        std::istringstream input(content);

        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            // Handle section headers
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                } else {
                    throw std::runtime_error("line " + std::to_string(lineNumber) +
                                             ": unterminated section header");
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] Warning: ignoring line " << lineNumber
                          << ": " << line << std::endl;
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(key);
            unquote(value);

            if (currentSection == "history") {
                if (key == "max_entries") {
                    config.maxEntries = parseSize(key, value);
                } else if (key == "start_active") {
                    config.startActive = parseBool(key, value);
                } else if (key == "format") {
                    config.format = stringToFormat(value);
                } else if (key == "verbose") {
                    config.verbose = parseBool(key, value);
                } else {
                    std::cerr << "[Config] Warning: unknown key history." << key << std::endl;
                }
            } else if (currentSection == "types") {
                config.types.push_back(TypeDeclaration{key, value});
            } else {
                std::cerr << "[Config] Warning: ignoring key " << key << " in section ["
                          << currentSection << "]" << std::endl;
            }
        }

        return config;
    }

    static size_t parseSize(const std::string& key, const std::string& value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("invalid value for " + key + ": '" + value + "'");
        }
        try {
            return static_cast<size_t>(std::stoull(value));
        } catch (const std::out_of_range&) {
            throw std::runtime_error("value for " + key + " is out of range: '" + value + "'");
        }
    }

    static bool parseBool(const std::string& key, const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::runtime_error("invalid boolean for " + key + ": '" + value + "'");
    }

private:
    /**
     * @brief Remove a trailing comment, leaving '#' inside quotes alone
     * @param line Line to strip (modified in place)
     */
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace evhistory
