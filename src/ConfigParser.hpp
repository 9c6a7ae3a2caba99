#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "Rules.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Parses a JSON rules document into a RuleSet. Missing keys keep their defaults.
class ConfigParser {
public:
    // Read-only access to the loaded rule set (defaults until load() succeeds).
    const RuleSet& getRules() const;
    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::filesystem::path& filePath);

    // Validate and convert a parsed document; throws ParseError.
    static RuleSet parse(const nlohmann::ordered_json& data);
    // Parse JSON text and convert it; throws ParseError.
    static RuleSet parseText(const std::string& text);

private:
    static void parseExtensions(const nlohmann::ordered_json& value, RuleSet& rules);
    // by_glob / by_mime: an object whose key order decides which rule wins.
    static OrderedRules parseOrderedRules(const nlohmann::ordered_json& value, const std::string& sectionName);
    static DateRule parseDateRule(const nlohmann::ordered_json& value);
    static std::vector<SizeBucket> parseSizeBuckets(const nlohmann::ordered_json& value);
    static DuplicatePolicy parseDuplicatePolicy(const nlohmann::ordered_json& value);

    RuleSet m_rules;
};

#endif
