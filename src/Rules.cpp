#include "Rules.hpp"

#include <algorithm>
#include <cctype>

void RuleSet::addExtension(const std::string& extension, std::string folder) {
    std::string normalized = normalizeExtension(extension);
    if (normalized.empty()) {
        return;
    }
    extensionMap[std::move(normalized)] = std::move(folder);
}

std::string normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty() || extension == ".") {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

std::optional<DateGrouping> dateGroupingFromString(const std::string& text) {
    if (text == "year") {
        return DateGrouping::Year;
    }
    if (text == "month") {
        return DateGrouping::Month;
    }
    if (text == "day") {
        return DateGrouping::Day;
    }
    return std::nullopt;
}

std::optional<DuplicateAction> duplicateActionFromString(const std::string& text) {
    if (text == "skip") {
        return DuplicateAction::Skip;
    }
    if (text == "separate") {
        return DuplicateAction::Separate;
    }
    if (text == "hardlink") {
        return DuplicateAction::Hardlink;
    }
    return std::nullopt;
}
