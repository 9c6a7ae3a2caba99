#include <catch2/catch.hpp>

#include "FileMover.hpp"
#include "OrganizerErrors.hpp"
#include "TestHelpers.hpp"


namespace fs = std::filesystem;

TEST_CASE("Move creates parent folders and removes the source") {
    TempDir dir;
    const auto src = dir.path() / "in" / "a.txt";
    writeFile(src, "alpha");

    const auto record = placeFile(src, dir.path() / "out" / "Text" / "a.txt", PlacementMode::Move);

    CHECK(record.action == PlacementAction::Move);
    CHECK(record.source == src);
    CHECK(record.destination == dir.path() / "out" / "Text" / "a.txt");
    CHECK_FALSE(fs::exists(src));
    CHECK(readFile(record.destination) == "alpha");
}

TEST_CASE("Copy keeps the source and preserves the modification time") {
    TempDir dir;
    const auto src = dir.path() / "a.txt";
    writeFile(src, "alpha");
    setModifiedTime(src, localNoon(2020, 2, 2));

    const auto record = placeFile(src, dir.path() / "out" / "a.txt", PlacementMode::Copy);

    CHECK(record.action == PlacementAction::Copy);
    CHECK(fs::exists(src));
    CHECK(readFile(record.destination) == "alpha");
    CHECK(fs::last_write_time(record.destination) == fs::last_write_time(src));
}

TEST_CASE("Hardlink shares the inode on the same filesystem") {
    TempDir dir;
    const auto src = dir.path() / "a.txt";
    writeFile(src, "alpha");

    const auto record = placeFile(src, dir.path() / "out" / "a.txt", PlacementMode::Hardlink);

    REQUIRE(record.action == PlacementAction::Hardlink);
    CHECK(fs::hard_link_count(src) == 2);
    CHECK(fs::equivalent(src, record.destination));
}

TEST_CASE("Placement re-resolves conflicts instead of overwriting") {
    TempDir dir;
    const auto src = dir.path() / "a.txt";
    writeFile(src, "new");
    writeFile(dir.path() / "out" / "a.txt", "old");

    const auto record = placeFile(src, dir.path() / "out" / "a.txt", PlacementMode::Copy);

    CHECK(record.destination == dir.path() / "out" / "a(1).txt");
    CHECK(readFile(dir.path() / "out" / "a.txt") == "old");
    CHECK(readFile(record.destination) == "new");
}

TEST_CASE("Missing sources propagate as IoError") {
    TempDir dir;
    CHECK_THROWS_AS(placeFile(dir.path() / "ghost.txt", dir.path() / "out" / "ghost.txt", PlacementMode::Move), IoError);
    CHECK_THROWS_AS(placeFile(dir.path() / "ghost.txt", dir.path() / "out" / "ghost.txt", PlacementMode::Copy), IoError);
}

TEST_CASE("ensureDirectory fails when a file blocks the path") {
    TempDir dir;
    writeFile(dir.path() / "blocker", "x");
    CHECK_THROWS_AS(ensureDirectory(dir.path() / "blocker" / "child"), IoError);
}
