#include "RuleResolver.hpp"

#include "MimeTypes.hpp"
#include "OrganizerErrors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <system_error>

#include <fnmatch.h>
#include <sys/stat.h>

namespace {
constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;

std::vector<std::string> pathComponents(const std::filesystem::path& path) {
    std::vector<std::string> parts;
    for (const auto& part : path) {
        const std::string text = part.string();
        if (text.empty() || text == "/") {
            continue;
        }
        parts.push_back(text);
    }
    return parts;
}

std::string twoDigits(int value) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02d", value);
    return buffer;
}
} // namespace

CandidateFile inspectFile(const std::filesystem::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        throwIoError("Unable to stat", path, std::error_code(errno, std::generic_category()));
    }

    CandidateFile candidate;
    candidate.path = path;
    candidate.size = static_cast<std::uintmax_t>(info.st_size);
    candidate.modified = info.st_mtime;
    return candidate;
}

bool globMatches(const std::string& pattern, const std::filesystem::path& file) {
    if (pattern.empty()) {
        return false;
    }

    const std::filesystem::path patternPath(pattern);
    const auto patternParts = pathComponents(patternPath);
    const auto fileParts = pathComponents(file);
    if (patternParts.empty() || patternParts.size() > fileParts.size()) {
        return false;
    }

    // Absolute patterns are anchored at the root and must cover every component.
    if (patternPath.is_absolute() && (!file.is_absolute() || patternParts.size() != fileParts.size())) {
        return false;
    }

    const std::size_t offset = fileParts.size() - patternParts.size();
    for (std::size_t i = 0; i < patternParts.size(); ++i) {
        if (::fnmatch(patternParts[i].c_str(), fileParts[offset + i].c_str(), 0) != 0) {
            return false;
        }
    }
    return true;
}

RuleResolver::RuleResolver(RuleSet rules) : m_rules(std::move(rules)) {}

std::optional<std::string> RuleResolver::matchFolderFor(const std::filesystem::path& file) const {
    std::string extension = file.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (!extension.empty()) {
        auto it = m_rules.extensionMap.find(extension);
        if (it != m_rules.extensionMap.end()) {
            return it->second;
        }
    }

    for (const auto& [pattern, folder] : m_rules.globMap) {
        if (globMatches(pattern, file)) {
            return folder;
        }
    }

    if (const auto mime = guessMimeType(file)) {
        for (const auto& [prefix, folder] : m_rules.mimeMap) {
            if (mime->compare(0, prefix.size(), prefix) == 0) {
                return folder;
            }
        }
    }

    return std::nullopt;
}

std::string RuleResolver::classificationFolder(const std::filesystem::path& file) const {
    auto folder = matchFolderFor(file);
    if (!folder || folder->empty()) {
        return m_rules.unknownFolder;
    }
    return *folder;
}

std::optional<std::string> RuleResolver::matchSizeBucket(std::uintmax_t sizeBytes) const {
    const double megabytes = static_cast<double>(sizeBytes) / kBytesPerMegabyte;
    for (const auto& bucket : m_rules.sizeBuckets) {
        if (bucket.folder.empty()) {
            continue;
        }
        if (!bucket.maxMegabytes || megabytes <= *bucket.maxMegabytes) {
            return bucket.folder;
        }
    }
    return std::nullopt;
}

std::vector<std::string> RuleResolver::dateSegments(std::time_t modified) const {
    if (!m_rules.dateRule.enabled) {
        return {};
    }

    std::tm local {};
    localtime_r(&modified, &local);

    char year[8];
    std::snprintf(year, sizeof(year), "%04d", local.tm_year + 1900);

    std::vector<std::string> segments{m_rules.dateRule.baseFolder, year};
    if (m_rules.dateRule.group == DateGrouping::Month || m_rules.dateRule.group == DateGrouping::Day) {
        segments.push_back(twoDigits(local.tm_mon + 1));
    }
    if (m_rules.dateRule.group == DateGrouping::Day) {
        segments.push_back(twoDigits(local.tm_mday));
    }
    return segments;
}

std::filesystem::path RuleResolver::computeDestination(const CandidateFile& file,
                                                       const std::filesystem::path& destRoot) const {
    std::filesystem::path target = destRoot;
    if (const auto bucket = matchSizeBucket(file.size)) {
        target /= *bucket;
    }
    for (const auto& segment : dateSegments(file.modified)) {
        target /= segment;
    }
    target /= classificationFolder(file.path);
    return target / file.path.filename();
}
