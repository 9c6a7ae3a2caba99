#include "ConfigParser.hpp"

#include "OrganizerErrors.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

namespace {
std::string requireString(const json& value, const std::string& what) {
    if (!value.is_string()) {
        throw ParseError("`" + what + "` must be a string.");
    }
    return value.get<std::string>();
}

bool requireBool(const json& value, const std::string& what) {
    if (!value.is_boolean()) {
        throw ParseError("`" + what + "` must be a boolean value.");
    }
    return value.get<bool>();
}

void requireObject(const json& value, const std::string& what) {
    if (!value.is_object()) {
        throw ParseError("`" + what + "` must be an object.");
    }
}
} // namespace

const RuleSet& ConfigParser::getRules() const {
    return m_rules;
}

bool ConfigParser::load(const std::filesystem::path& filePath) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << filePath << std::endl;
        return false;
    }

    std::ostringstream text;
    text << jsonFile.rdbuf();

    try {
        m_rules = parseText(text.str());
    } catch (const ParseError& e) {
        std::cerr << "Invalid configuration in " << filePath << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "Loaded " << m_rules.extensionMap.size() << " extension, " << m_rules.globMap.size() << " glob and "
              << m_rules.mimeMap.size() << " MIME rule(s) from " << filePath << std::endl;
    return true;
}

RuleSet ConfigParser::parseText(const std::string& text) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("Failed to parse configuration: ") + e.what());
    }
    return parse(data);
}

RuleSet ConfigParser::parse(const json& data) {
    requireObject(data, "configuration");

    RuleSet rules;

    if (auto it = data.find("unknown_folder"); it != data.end()) {
        rules.unknownFolder = requireString(*it, "unknown_folder");
        if (rules.unknownFolder.empty()) {
            throw ParseError("`unknown_folder` cannot be empty.");
        }
    }

    if (auto it = data.find("exclude_dirs"); it != data.end()) {
        if (!it->is_array()) {
            throw ParseError("`exclude_dirs` must be an array of directory names.");
        }
        rules.excludeDirs.clear();
        for (const auto& dir : *it) {
            rules.excludeDirs.push_back(requireString(dir, "exclude_dirs[]"));
        }
    }

    if (auto it = data.find("exclude_hidden"); it != data.end()) {
        rules.excludeHidden = requireBool(*it, "exclude_hidden");
    }

    if (auto it = data.find("prefer_extension_over_glob"); it != data.end()) {
        rules.preferExtensionOverGlob = requireBool(*it, "prefer_extension_over_glob");
    }

    if (auto it = data.find("by_extension"); it != data.end()) {
        parseExtensions(*it, rules);
    }
    if (auto it = data.find("by_glob"); it != data.end()) {
        rules.globMap = parseOrderedRules(*it, "by_glob");
    }
    if (auto it = data.find("by_mime"); it != data.end()) {
        rules.mimeMap = parseOrderedRules(*it, "by_mime");
    }
    if (auto it = data.find("by_date"); it != data.end()) {
        rules.dateRule = parseDateRule(*it);
    }
    if (auto it = data.find("size_buckets"); it != data.end()) {
        rules.sizeBuckets = parseSizeBuckets(*it);
    }
    if (auto it = data.find("duplicates"); it != data.end()) {
        rules.duplicatePolicy = parseDuplicatePolicy(*it);
    }

    return rules;
}

void ConfigParser::parseExtensions(const json& value, RuleSet& rules) {
    requireObject(value, "by_extension");
    for (auto it = value.begin(); it != value.end(); ++it) {
        rules.addExtension(it.key(), requireString(it.value(), "by_extension." + it.key()));
    }
}

OrderedRules ConfigParser::parseOrderedRules(const json& value, const std::string& sectionName) {
    requireObject(value, sectionName);
    OrderedRules result;
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (it.key().empty()) {
            throw ParseError("`" + sectionName + "` contains an empty pattern.");
        }
        result.emplace_back(it.key(), requireString(it.value(), sectionName + "." + it.key()));
    }
    return result;
}

DateRule ConfigParser::parseDateRule(const json& value) {
    requireObject(value, "by_date");
    DateRule rule;
    if (auto it = value.find("enabled"); it != value.end()) {
        rule.enabled = requireBool(*it, "by_date.enabled");
    }
    if (auto it = value.find("base_folder"); it != value.end()) {
        rule.baseFolder = requireString(*it, "by_date.base_folder");
    }
    if (auto it = value.find("group"); it != value.end()) {
        const std::string group = requireString(*it, "by_date.group");
        const auto parsed = dateGroupingFromString(group);
        if (!parsed) {
            throw ParseError("`by_date.group` must be one of year, month, day (got `" + group + "`).");
        }
        rule.group = *parsed;
    }
    return rule;
}

std::vector<SizeBucket> ConfigParser::parseSizeBuckets(const json& value) {
    if (!value.is_array()) {
        throw ParseError("`size_buckets` must be an array.");
    }

    std::vector<SizeBucket> buckets;
    for (const auto& entry : value) {
        requireObject(entry, "size_buckets[]");

        SizeBucket bucket;
        auto folderIt = entry.find("folder");
        if (folderIt == entry.end()) {
            throw ParseError("Every size bucket needs a `folder`.");
        }
        bucket.folder = requireString(*folderIt, "size_buckets[].folder");

        if (auto maxIt = entry.find("max_mb"); maxIt != entry.end() && !maxIt->is_null()) {
            if (!maxIt->is_number()) {
                throw ParseError("`size_buckets[].max_mb` must be a number.");
            }
            const double maxMegabytes = maxIt->get<double>();
            if (maxMegabytes < 0) {
                throw ParseError("`size_buckets[].max_mb` cannot be negative.");
            }
            bucket.maxMegabytes = maxMegabytes;
        }

        buckets.push_back(std::move(bucket));
    }
    return buckets;
}

DuplicatePolicy ConfigParser::parseDuplicatePolicy(const json& value) {
    requireObject(value, "duplicates");
    DuplicatePolicy policy;
    if (auto it = value.find("action"); it != value.end()) {
        const std::string action = requireString(*it, "duplicates.action");
        const auto parsed = duplicateActionFromString(action);
        if (!parsed) {
            throw ParseError("`duplicates.action` must be one of skip, separate, hardlink (got `" + action + "`).");
        }
        policy.action = *parsed;
    }
    if (auto it = value.find("folder"); it != value.end()) {
        policy.folder = requireString(*it, "duplicates.folder");
        if (policy.folder.empty()) {
            throw ParseError("`duplicates.folder` cannot be empty.");
        }
    }
    return policy;
}
