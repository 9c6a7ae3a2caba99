#include <catch2/catch.hpp>

#include "DuplicateTracker.hpp"
#include "TestHelpers.hpp"

namespace fs = std::filesystem;

namespace {
DuplicatePolicy policy(DuplicateAction action, const std::string& folder = "Dupes") {
    DuplicatePolicy result;
    result.action = action;
    result.folder = folder;
    return result;
}
} // namespace

TEST_CASE("First occurrence of a fingerprint keeps its normal destination") {
    DuplicateTracker tracker(policy(DuplicateAction::Separate), "/dest");
    const auto decision = tracker.checkFingerprint("aaa", "/src/a.txt", "/dest/Text/a.txt");

    CHECK(decision.outcome == DuplicateOutcome::Unique);
    CHECK(decision.destination == fs::path("/dest/Text/a.txt"));
    CHECK(tracker.uniqueCount() == 1);
}

TEST_CASE("Skip policy leaves later copies alone") {
    DuplicateTracker tracker(policy(DuplicateAction::Skip), "/dest");
    tracker.checkFingerprint("aaa", "/src/a.txt", "/dest/Text/a.txt");
    const auto decision = tracker.checkFingerprint("aaa", "/src/b.txt", "/dest/Text/b.txt");

    CHECK(decision.outcome == DuplicateOutcome::Skip);
    CHECK(decision.destination.empty());
    CHECK(decision.firstSeen == fs::path("/src/a.txt"));
}

TEST_CASE("Separate policy redirects into the duplicates folder under the file's own name") {
    DuplicateTracker tracker(policy(DuplicateAction::Separate), "/dest");
    tracker.checkFingerprint("aaa", "/src/a.txt", "/dest/Text/a.txt");
    const auto decision = tracker.checkFingerprint("aaa", "/src/sub/b.txt", "/dest/Text/b.txt");

    CHECK(decision.outcome == DuplicateOutcome::Redirect);
    CHECK(decision.destination == fs::path("/dest/Dupes/b.txt"));
}

TEST_CASE("Hardlink policy names every duplicate after the first file seen") {
    DuplicateTracker tracker(policy(DuplicateAction::Hardlink), "/dest");
    tracker.checkFingerprint("aaa", "/src/a.txt", "/dest/Text/a.txt");
    const auto second = tracker.checkFingerprint("aaa", "/src/b.txt", "/dest/Text/b.txt");
    const auto third = tracker.checkFingerprint("aaa", "/src/c.txt", "/dest/Text/c.txt");

    CHECK(second.destination == fs::path("/dest/Dupes/a.txt"));
    CHECK(third.destination == fs::path("/dest/Dupes/a.txt"));
    CHECK(third.firstSeen == fs::path("/src/a.txt"));
    CHECK(tracker.uniqueCount() == 1);
}

TEST_CASE("check() fingerprints real file contents") {
    TempDir dir;
    writeFile(dir.path() / "one.txt", "same");
    writeFile(dir.path() / "two.txt", "same");
    writeFile(dir.path() / "three.txt", "different");

    DuplicateTracker tracker(policy(DuplicateAction::Separate), dir.path() / "out");
    CHECK(tracker.check(dir.path() / "one.txt", "x").outcome == DuplicateOutcome::Unique);
    CHECK(tracker.check(dir.path() / "three.txt", "y").outcome == DuplicateOutcome::Unique);
    CHECK(tracker.check(dir.path() / "two.txt", "z").outcome == DuplicateOutcome::Redirect);
    CHECK(tracker.uniqueCount() == 2);
}
