#ifndef RULE_RESOLVER_HPP
#define RULE_RESOLVER_HPP

#include "Rules.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// A regular file discovered while walking the source tree.
struct CandidateFile {
    std::filesystem::path path;
    std::uintmax_t size = 0;
    std::time_t modified = 0;
};

// Stat a file into a CandidateFile; throws IoError/PermissionError when it cannot be read.
CandidateFile inspectFile(const std::filesystem::path& path);

// True when the glob pattern matches the trailing components of the path (the whole path for absolute patterns).
bool globMatches(const std::string& pattern, const std::filesystem::path& file);

// Computes the relative destination of a file from the configured rules.
class RuleResolver {
public:
    explicit RuleResolver(RuleSet rules);

    // Extension, then glob, then MIME prefix; empty when nothing matches.
    std::optional<std::string> matchFolderFor(const std::filesystem::path& file) const;
    // matchFolderFor() falling back to the unknown folder.
    std::string classificationFolder(const std::filesystem::path& file) const;
    // First bucket whose limit admits the size; buckets without a limit always match.
    std::optional<std::string> matchSizeBucket(std::uintmax_t sizeBytes) const;
    // "<base>/<yyyy>[/<mm>[/<dd>]]" segments for the local-time date of the timestamp, empty when disabled.
    std::vector<std::string> dateSegments(std::time_t modified) const;

    // destRoot / sizeBucket? / dateSegments? / classification / file name.
    std::filesystem::path computeDestination(const CandidateFile& file, const std::filesystem::path& destRoot) const;

private:
    RuleSet m_rules;
};

#endif
