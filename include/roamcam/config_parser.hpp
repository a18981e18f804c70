#pragma once

/**
 * @file config_parser.hpp
 * @brief Line-based `key: value` configuration files
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roamcam {

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
    explicit ConfigValue(std::vector<float> numbers) : numbers_(std::move(numbers)) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    /// true/yes/on/1 and false/no/off/0; anything else yields defaultVal
    [[nodiscard]] bool asBool(bool defaultVal = false) const;

    [[nodiscard]] float asFloat(float defaultVal = 0.0f) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;

    /// Whitespace-separated numbers in the value text ("1.5 0 -3")
    [[nodiscard]] std::vector<float> asFloatList() const;

    /// True if the whole text is one number
    [[nodiscard]] bool isNumber() const;

    /// True if the text is a recognized boolean word
    [[nodiscard]] bool isBool() const;

    [[nodiscard]] const std::vector<float>& asNumbers() const { return numbers_; }
    [[nodiscard]] bool hasNumbers() const { return !numbers_.empty(); }

    [[nodiscard]] bool empty() const { return text_.empty() && numbers_.empty(); }

private:
    std::string text_;
    std::vector<float> numbers_;
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
 *       data line 1
 *       data line 2
 */
struct ConfigEntry {
    std::string key;
    std::string suffix;
    ConfigValue value;
    std::vector<std::vector<float>> dataLines;  // Indented data lines (parsed as floats)
    std::string source;                         // File the entry came from (for diagnostics)
    int line = 0;

    [[nodiscard]] bool hasSuffix() const { return !suffix.empty(); }
    [[nodiscard]] bool hasData() const { return !dataLines.empty(); }
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief A parsed configuration document
 *
 * Entries are kept in file order. Lookups return the last entry with the
 * key, so later lines and later includes override earlier ones.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] const ConfigEntry* get(std::string_view key, std::string_view suffix) const;

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] float getFloat(std::string_view key, float defaultVal = 0.0f) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    /// Numbers on the value, or on the first data line if the value is empty
    [[nodiscard]] std::vector<float> getFloatList(std::string_view key) const;

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
 * @brief Parser for simple configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * player.radius: 0.3
 * spawn: 0 0 5
 * key:suffix:
 *     1.0 2.0 3.0
 * include: other_file.conf
 * ```
 *
 * Includes are resolved relative to the including file unless a resolver
 * is installed. Included entries are inserted where the directive appears.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    /// Nested includes deeper than this are skipped with a warning
    static constexpr int MAX_INCLUDE_DEPTH = 8;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /**
     * @brief Parse a configuration file
     * @param path Filesystem path to the file
     * @return Parsed document, or nullopt if the file cannot be opened
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param content The configuration content
     * @param basePath Directory for resolving relative includes
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    std::optional<ConfigDocument> parseFileAtDepth(const std::string& path, int depth) const;
    ConfigDocument parseStringAtDepth(std::string_view content, const std::string& basePath,
                                      const std::string& source, int depth) const;

    void parseLine(std::string_view line, int lineNumber, ConfigEntry& currentEntry,
                   ConfigDocument& doc, const std::string& basePath,
                   const std::string& source, int depth) const;

    std::vector<float> parseDataLine(std::string_view line) const;

    void flushEntry(ConfigEntry& entry, ConfigDocument& doc) const;

    IncludeResolver includeResolver_;
};

}  // namespace roamcam
