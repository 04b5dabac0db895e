#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxelforge {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief A configuration value that can be a string, number, or list of numbers
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}
    explicit ConfigValue(std::vector<double> numbers) : numbers_(std::move(numbers)) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    [[nodiscard]] std::optional<bool> asBool() const;
    [[nodiscard]] std::optional<double> asDouble() const;
    [[nodiscard]] std::optional<int64_t> asInt() const;

    /// Parse as a hex color ("4caf50", "#4caf50" or "0x4caf50")
    [[nodiscard]] std::optional<uint32_t> asHexColor() const;

    [[nodiscard]] const std::vector<double>& asNumbers() const { return numbers_; }
    [[nodiscard]] bool hasNumbers() const { return !numbers_.empty(); }

    [[nodiscard]] bool empty() const { return text_.empty() && numbers_.empty(); }

private:
    std::string text_;
    std::vector<double> numbers_;
};

// ============================================================================
// ConfigEntry - A key-value pair with optional suffix and data lines
// ============================================================================

/**
 * @brief A configuration entry
 *
 * Represents entries like:
 *   key: value
 *   key:suffix: value
 *   key:suffix:
 *       60 10 4 0.5 2 0.02
 */
struct ConfigEntry {
    std::string key;
    std::string suffix;
    ConfigValue value;
    std::vector<std::vector<double>> dataLines;  // Indented lines, parsed as numbers
    int lineNumber = 0;                          // 1-based, for diagnostics

    [[nodiscard]] bool hasSuffix() const { return !suffix.empty(); }
    [[nodiscard]] bool hasData() const { return !dataLines.empty(); }

    /// "key" or "key:suffix"
    [[nodiscard]] std::string fullKey() const {
        return hasSuffix() ? key + ":" + suffix : key;
    }
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief A parsed configuration document
 *
 * Entries are kept in file order. Lookups return the last entry with a
 * matching key, so later lines (and later includes) override earlier ones.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] const ConfigEntry* get(std::string_view key, std::string_view suffix) const;

    [[nodiscard]] std::vector<const ConfigEntry*> getAll(std::string_view key) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration files
// ============================================================================

/**
 * @brief Parser for simple line-based configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * key: value
 * key:suffix: value
 * key:suffix:
 *     1.0 2.0 3.0
 * include: other_file.conf
 * ```
 *
 * Includes are resolved relative to the including file unless an include
 * resolver is set. A missing include is skipped.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// Parse a file; nullopt if it cannot be opened
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    void parseLine(std::string_view line, int lineNumber, ConfigEntry& currentEntry,
                   ConfigDocument& doc, const std::string& basePath) const;

    [[nodiscard]] std::vector<double> parseDataLine(std::string_view line) const;

    void flushEntry(ConfigEntry& entry, ConfigDocument& doc) const;

    IncludeResolver includeResolver_;
    mutable int includeDepth_ = 0;
};

}  // namespace voxelforge
