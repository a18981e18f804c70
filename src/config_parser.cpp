#include "roamcam/config_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace roamcam {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Numbers separated by whitespace; non-numeric tokens are skipped
std::vector<float> parseNumbers(std::string_view line) {
    std::vector<float> numbers;
    std::string buffer(line);  // strtof needs a terminated string

    const char* p = buffer.c_str();
    const char* endOfBuffer = p + buffer.size();
    while (p < endOfBuffer) {
        while (p < endOfBuffer && std::isspace(static_cast<unsigned char>(*p))) {
            ++p;
        }
        if (p >= endOfBuffer) break;

        char* end;
        float val = std::strtof(p, &end);
        if (end == p) {
            while (p < endOfBuffer && !std::isspace(static_cast<unsigned char>(*p))) {
                ++p;
            }
        } else {
            numbers.push_back(val);
            p = end;
        }
    }
    return numbers;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

bool ConfigValue::isBool() const {
    return text_ == "true" || text_ == "yes" || text_ == "on" || text_ == "1" ||
           text_ == "false" || text_ == "no" || text_ == "off" || text_ == "0";
}

bool ConfigValue::asBool(bool defaultVal) const {
    if (text_.empty()) return defaultVal;

    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return defaultVal;
}

float ConfigValue::asFloat(float defaultVal) const {
    if (!numbers_.empty()) {
        return numbers_[0];
    }
    if (text_.empty()) return defaultVal;

    char* end;
    float val = std::strtof(text_.c_str(), &end);
    if (end == text_.c_str()) return defaultVal;
    return val;
}

int ConfigValue::asInt(int defaultVal) const {
    if (!numbers_.empty()) {
        return static_cast<int>(numbers_[0]);
    }
    if (text_.empty()) return defaultVal;

    char* end;
    long val = std::strtol(text_.c_str(), &end, 10);
    if (end == text_.c_str()) return defaultVal;
    return static_cast<int>(val);
}

std::vector<float> ConfigValue::asFloatList() const {
    if (!numbers_.empty()) {
        return numbers_;
    }
    return parseNumbers(text_);
}

bool ConfigValue::isNumber() const {
    if (!numbers_.empty()) return numbers_.size() == 1;
    if (text_.empty()) return false;

    char* end;
    std::strtof(text_.c_str(), &end);
    return end != text_.c_str() && trim(std::string_view(end)).empty();
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
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

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

float ConfigDocument::getFloat(std::string_view key, float defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asFloat(defaultVal);
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

std::vector<float> ConfigDocument::getFloatList(std::string_view key) const {
    auto* entry = get(key);
    if (!entry) {
        return {};
    }
    if (!entry->value.empty()) {
        return entry->value.asFloatList();
    }
    if (entry->hasData()) {
        return entry->dataLines.front();
    }
    return {};
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
    return parseFileAtDepth(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    return parseStringAtDepth(content, basePath, "<string>", 0);
}

std::optional<ConfigDocument> ConfigParser::parseFileAtDepth(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Extract base path for relative includes
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseStringAtDepth(buffer.str(), basePath, path, depth);
}

ConfigDocument ConfigParser::parseStringAtDepth(std::string_view content, const std::string& basePath,
                                                const std::string& source, int depth) const {
    ConfigDocument doc;
    ConfigEntry currentEntry;

    std::string_view remaining = content;
    int lineNumber = 0;

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

        parseLine(line, lineNumber, currentEntry, doc, basePath, source, depth);
    }

    flushEntry(currentEntry, doc);
    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNumber, ConfigEntry& currentEntry,
                             ConfigDocument& doc, const std::string& basePath,
                             const std::string& source, int depth) const {
    if (trim(line).empty()) {
        return;
    }

    // Indented: data line belonging to the current entry
    if (std::isspace(static_cast<unsigned char>(line[0]))) {
        auto numbers = parseDataLine(line);
        if (!numbers.empty()) {
            currentEntry.dataLines.push_back(std::move(numbers));
        }
        return;
    }

    flushEntry(currentEntry, doc);
    currentEntry = ConfigEntry{};

    if (line[0] == '#') {
        return;
    }

    currentEntry.source = source;
    currentEntry.line = lineNumber;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // No colon - simple key with no value
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
    rest = trim(rest);

    if (currentEntry.key == "include") {
        std::string includePath(rest);
        currentEntry = ConfigEntry{};  // The directive itself is not an entry

        if (depth >= MAX_INCLUDE_DEPTH) {
            std::cerr << "[ConfigParser] Include depth exceeded at " << source << ":" << lineNumber
                      << ", skipping '" << includePath << "'\n";
            return;
        }

        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath) : basePath + includePath;
        if (auto includedDoc = parseFileAtDepth(resolvedPath, depth + 1)) {
            for (const auto& entry : *includedDoc) {
                doc.addEntry(entry);
            }
        } else {
            std::cerr << "[ConfigParser] Cannot open include '" << resolvedPath << "' from "
                      << source << ":" << lineNumber << "\n";
        }
        return;
    }

    if (!rest.empty()) {
        currentEntry.value = ConfigValue(rest);
    }
}

std::vector<float> ConfigParser::parseDataLine(std::string_view line) const {
    return parseNumbers(line);
}

void ConfigParser::flushEntry(ConfigEntry& entry, ConfigDocument& doc) const {
    if (!entry.key.empty()) {
        doc.addEntry(std::move(entry));
        entry = ConfigEntry{};
    }
}

}  // namespace roamcam
