#include "DuplicateTracker.hpp"

#include "ContentHasher.hpp"

#include <utility>

DuplicateTracker::DuplicateTracker(DuplicatePolicy policy, std::filesystem::path destRoot)
    : m_policy(std::move(policy)), m_destRoot(std::move(destRoot)) {}

DuplicateDecision DuplicateTracker::check(const std::filesystem::path& source,
                                          const std::filesystem::path& normalDestination) {
    return checkFingerprint(hashFile(source), source, normalDestination);
}

DuplicateDecision DuplicateTracker::checkFingerprint(const std::string& fingerprint,
                                                     const std::filesystem::path& source,
                                                     const std::filesystem::path& normalDestination) {
    DuplicateDecision decision;
    decision.fingerprint = fingerprint;
    decision.destination = normalDestination;

    auto [it, inserted] = m_firstSeen.emplace(fingerprint, source);
    if (inserted) {
        return decision;
    }

    decision.firstSeen = it->second;
    switch (m_policy.action) {
    case DuplicateAction::Skip:
        decision.outcome = DuplicateOutcome::Skip;
        decision.destination.clear();
        break;
    case DuplicateAction::Separate:
        decision.outcome = DuplicateOutcome::Redirect;
        decision.destination = m_destRoot / m_policy.folder / source.filename();
        break;
    case DuplicateAction::Hardlink:
        // Every duplicate is named after the first file with this content, not after itself.
        decision.outcome = DuplicateOutcome::Redirect;
        decision.destination = m_destRoot / m_policy.folder / it->second.filename();
        break;
    }
    return decision;
}
