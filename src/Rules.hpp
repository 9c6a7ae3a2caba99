#ifndef RULES_HPP
#define RULES_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

enum class DateGrouping { Year, Month, Day };

enum class DuplicateAction { Skip, Separate, Hardlink };

// Optional "By Date/<year>/<month>/<day>" prefix derived from the modification time.
struct DateRule {
    bool enabled = false;
    std::string baseFolder = "By Date";
    DateGrouping group = DateGrouping::Month;
};

// Files up to maxMegabytes (inclusive) land under folder; no limit means catch-all.
struct SizeBucket {
    std::optional<double> maxMegabytes;
    std::string folder;
};

struct DuplicatePolicy {
    DuplicateAction action = DuplicateAction::Separate;
    std::string folder = "Duplicates";
};

// Ordered (pattern, folder) pairs; resolution takes the first match.
using OrderedRules = std::vector<std::pair<std::string, std::string>>;

// Classification and placement rules. Treated as read-only once loaded.
struct RuleSet {
    std::string unknownFolder = "Others";
    std::vector<std::string> excludeDirs{".git", "__pycache__", "node_modules"};
    bool excludeHidden = true;
    // Kept for configuration compatibility: extension rules are always consulted before globs.
    bool preferExtensionOverGlob = true;
    std::unordered_map<std::string, std::string> extensionMap;
    OrderedRules globMap;
    OrderedRules mimeMap;
    DateRule dateRule;
    std::vector<SizeBucket> sizeBuckets;
    DuplicatePolicy duplicatePolicy;

    // Insert an extension rule, normalizing the key first. Empty extensions are ignored.
    void addExtension(const std::string& extension, std::string folder);
};

// Normalize extensions (trim whitespace, enforce a single dot prefix, lower-case).
std::string normalizeExtension(std::string extension);

std::optional<DateGrouping> dateGroupingFromString(const std::string& text);
std::optional<DuplicateAction> duplicateActionFromString(const std::string& text);

#endif
