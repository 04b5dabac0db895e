#include "voxelforge/core/config_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace voxelforge {

namespace {

// Includes nested deeper than this are ignored (guards against cycles)
constexpr int MAX_INCLUDE_DEPTH = 8;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

std::optional<bool> ConfigValue::asBool() const {
    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<double> ConfigValue::asDouble() const {
    if (!numbers_.empty()) {
        return numbers_[0];
    }
    if (text_.empty()) return std::nullopt;

    char* end = nullptr;
    double val = std::strtod(text_.c_str(), &end);
    if (end == text_.c_str() || *end != '\0') return std::nullopt;
    return val;
}

std::optional<int64_t> ConfigValue::asInt() const {
    if (!numbers_.empty()) {
        return static_cast<int64_t>(numbers_[0]);
    }
    if (text_.empty()) return std::nullopt;

    char* end = nullptr;
    long long val = std::strtoll(text_.c_str(), &end, 10);
    if (end == text_.c_str() || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(val);
}

std::optional<uint32_t> ConfigValue::asHexColor() const {
    std::string_view digits = text_;
    if (!digits.empty() && digits.front() == '#') {
        digits.remove_prefix(1);
    } else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.remove_prefix(2);
    }
    if (digits.size() != 6) return std::nullopt;

    uint32_t rgb = 0;
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        rgb <<= 4;
        if (c >= '0' && c <= '9') {
            rgb |= static_cast<uint32_t>(c - '0');
        } else {
            rgb |= static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
        }
    }
    return rgb;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    // Last entry wins
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key && !it->hasSuffix()) {
            return &(*it);
        }
    }
    return nullptr;
}

const ConfigEntry* ConfigDocument::get(std::string_view key, std::string_view suffix) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key && it->suffix == suffix) {
            return &(*it);
        }
    }
    return nullptr;
}

std::vector<const ConfigEntry*> ConfigDocument::getAll(std::string_view key) const {
    std::vector<const ConfigEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            result.push_back(&entry);
        }
    }
    return result;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Base path for relative includes
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseString(buffer.str(), basePath);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    ConfigDocument doc;
    ConfigEntry currentEntry;
    int lineNumber = 0;

    std::string_view remaining = content;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNumber;

        // Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, lineNumber, currentEntry, doc, basePath);
    }

    flushEntry(currentEntry, doc);

    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNumber, ConfigEntry& currentEntry,
                             ConfigDocument& doc, const std::string& basePath) const {
    if (trim(line).empty()) {
        return;
    }

    // Indented line: numeric data for the current entry
    if (std::isspace(static_cast<unsigned char>(line[0]))) {
        auto numbers = parseDataLine(line);
        if (!numbers.empty() && !currentEntry.key.empty()) {
            currentEntry.dataLines.push_back(std::move(numbers));
        }
        return;
    }

    flushEntry(currentEntry, doc);

    if (line[0] == '#') {
        return;
    }

    currentEntry.lineNumber = lineNumber;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // Bare key with no value
        currentEntry.key = std::string(trim(line));
        return;
    }

    currentEntry.key = std::string(trim(line.substr(0, colonPos)));

    // key:suffix: value
    auto rest = line.substr(colonPos + 1);
    auto secondColon = rest.find(':');
    if (secondColon != std::string_view::npos) {
        currentEntry.suffix = std::string(trim(rest.substr(0, secondColon)));
        rest = rest.substr(secondColon + 1);
    }

    // Trailing comment
    auto hashPos = rest.find('#');
    if (hashPos != std::string_view::npos) {
        rest = rest.substr(0, hashPos);
    }
    rest = trim(rest);

    if (currentEntry.key == "include") {
        std::string includePath(rest);
        currentEntry = ConfigEntry{};

        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            return;
        }

        std::string resolvedPath = includeResolver_
            ? includeResolver_(includePath)
            : basePath + includePath;

        ++includeDepth_;
        auto includedDoc = parseFile(resolvedPath);
        --includeDepth_;

        if (includedDoc) {
            for (const auto& entry : *includedDoc) {
                doc.addEntry(entry);
            }
        }
        return;
    }

    if (!rest.empty()) {
        currentEntry.value = ConfigValue(rest);
    }
}

std::vector<double> ConfigParser::parseDataLine(std::string_view line) const {
    std::vector<double> numbers;
    std::string buffer(line);

    const char* cursor = buffer.c_str();
    while (*cursor != '\0') {
        while (*cursor != '\0' && std::isspace(static_cast<unsigned char>(*cursor))) {
            ++cursor;
        }
        if (*cursor == '\0' || *cursor == '#') break;

        char* end = nullptr;
        double val = std::strtod(cursor, &end);
        if (end == cursor) {
            // Not a number - skip this token
            while (*cursor != '\0' && !std::isspace(static_cast<unsigned char>(*cursor))) {
                ++cursor;
            }
        } else {
            numbers.push_back(val);
            cursor = end;
        }
    }

    return numbers;
}

void ConfigParser::flushEntry(ConfigEntry& entry, ConfigDocument& doc) const {
    if (!entry.key.empty()) {
        doc.addEntry(std::move(entry));
    }
    entry = ConfigEntry{};
}

}  // namespace voxelforge
