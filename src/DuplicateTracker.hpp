#ifndef DUPLICATE_TRACKER_HPP
#define DUPLICATE_TRACKER_HPP

#include "Rules.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

enum class DuplicateOutcome {
    Unique,   // first file with this content; place normally
    Skip,     // leave the file untouched
    Redirect  // place at DuplicateDecision::destination instead
};

struct DuplicateDecision {
    DuplicateOutcome outcome = DuplicateOutcome::Unique;
    std::filesystem::path destination;
    std::filesystem::path firstSeen;
    std::string fingerprint;
};

// Remembers the first file seen for every content fingerprint during one organize run.
class DuplicateTracker {
public:
    DuplicateTracker(DuplicatePolicy policy, std::filesystem::path destRoot);

    // Hash source and apply the duplicate policy. normalDestination is returned untouched
    // for unique files. Throws IoError when the file cannot be read.
    DuplicateDecision check(const std::filesystem::path& source, const std::filesystem::path& normalDestination);

    // Same as check() with a fingerprint computed by the caller.
    DuplicateDecision checkFingerprint(const std::string& fingerprint,
                                       const std::filesystem::path& source,
                                       const std::filesystem::path& normalDestination);

    std::size_t uniqueCount() const { return m_firstSeen.size(); }

private:
    DuplicatePolicy m_policy;
    std::filesystem::path m_destRoot;
    std::unordered_map<std::string, std::filesystem::path> m_firstSeen;
};

#endif
