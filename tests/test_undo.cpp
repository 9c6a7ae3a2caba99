#include <catch2/catch.hpp>

#include "Organizer.hpp"
#include "OrganizerErrors.hpp"
#include "TestHelpers.hpp"
#include "UndoManifest.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {
RuleSet sortingRules() {
    RuleSet rules;
    rules.addExtension(".txt", "Text");
    rules.addExtension(".png", "Images");
    rules.dateRule.enabled = true;
    rules.dateRule.group = DateGrouping::Day;
    return rules;
}

std::size_t countFiles(const fs::path& root) {
    std::size_t count = 0;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}
} // namespace

TEST_CASE("Undo of a move run restores every file to its original path") {
    TempDir dir;
    const auto src = dir.path() / "src";
    const auto dest = dir.path() / "dest";
    const auto manifest = dir.path() / "undo.json";
    writeFile(src / "a.txt", "a");
    writeFile(src / "pics" / "b.png", "b");
    writeFile(src / "pics" / "deeper" / "c.dat", "c");

    RecordingSink sink;
    const auto placed = organize(src, dest, sortingRules(), PlacementMode::Move, false, manifest, sink);
    REQUIRE(placed.size() == 3);
    REQUIRE(countFiles(src) == 0);

    const auto undone = undoRun(manifest, sink);

    REQUIRE(undone.size() == 3);
    CHECK(readFile(src / "a.txt") == "a");
    CHECK(readFile(src / "pics" / "b.png") == "b");
    CHECK(readFile(src / "pics" / "deeper" / "c.dat") == "c");
    CHECK(countFiles(dest) == 0);
    CHECK(sink.count(EventKind::Undone) == 3);
    // The manifest is read, not consumed.
    CHECK(fs::exists(manifest));
}

TEST_CASE("Undo replays operations most recent first") {
    TempDir dir;
    const auto manifest = dir.path() / "undo.json";
    writeFile(dir.path() / "dest" / "one.txt", "1");
    writeFile(dir.path() / "dest" / "two.txt", "2");
    writeManifest(manifest, {
        {dir.path() / "src" / "one.txt", dir.path() / "dest" / "one.txt", PlacementAction::Move},
        {dir.path() / "src" / "two.txt", dir.path() / "dest" / "two.txt", PlacementAction::Copy},
    });

    RecordingSink sink;
    const auto undone = undoRun(manifest, sink);

    REQUIRE(undone.size() == 2);
    CHECK(undone[0].source == dir.path() / "dest" / "two.txt");
    CHECK(undone[0].destination == dir.path() / "src" / "two.txt");
    CHECK(undone[0].action == PlacementAction::Undo);
    CHECK(undone[1].source == dir.path() / "dest" / "one.txt");
}

TEST_CASE("Undo skips entries whose placed file was deleted") {
    TempDir dir;
    const auto src = dir.path() / "src";
    const auto dest = dir.path() / "dest";
    const auto manifest = dir.path() / "undo.json";
    writeFile(src / "keep.txt", "keep");
    writeFile(src / "gone.txt", "gone");
    writeFile(src / "also.png", "also");

    RecordingSink sink;
    organize(src, dest, sortingRules(), PlacementMode::Move, false, manifest, sink);

    const auto operations = readManifest(manifest);
    REQUIRE(operations.size() == 3);
    for (const auto& op : operations) {
        if (op.source.filename() == "gone.txt") {
            fs::remove(op.destination);
        }
    }

    RecordingSink undoSink;
    const auto undone = undoRun(manifest, undoSink);

    CHECK(undone.size() == 2);
    CHECK(undoSink.count(EventKind::UndoMissing) == 1);
    CHECK(readFile(src / "keep.txt") == "keep");
    CHECK(readFile(src / "also.png") == "also");
    CHECK_FALSE(fs::exists(src / "gone.txt"));
}

TEST_CASE("Undo never overwrites a file that reappeared at the original path") {
    TempDir dir;
    const auto manifest = dir.path() / "undo.json";
    writeFile(dir.path() / "dest" / "a.txt", "placed");
    writeFile(dir.path() / "src" / "a.txt", "newer");
    writeManifest(manifest, {{dir.path() / "src" / "a.txt", dir.path() / "dest" / "a.txt", PlacementAction::Move}});

    RecordingSink sink;
    const auto undone = undoRun(manifest, sink);

    REQUIRE(undone.size() == 1);
    CHECK(undone[0].destination == dir.path() / "src" / "a(1).txt");
    CHECK(readFile(dir.path() / "src" / "a.txt") == "newer");
    CHECK(readFile(dir.path() / "src" / "a(1).txt") == "placed");
}

TEST_CASE("Undo of a copy run moves the copy back beside the untouched original") {
    TempDir dir;
    const auto src = dir.path() / "src";
    const auto dest = dir.path() / "dest";
    const auto manifest = dir.path() / "undo.json";
    writeFile(src / "a.txt", "a");

    RecordingSink sink;
    organize(src, dest, sortingRules(), PlacementMode::Copy, false, manifest, sink);
    const auto undone = undoRun(manifest, sink);

    REQUIRE(undone.size() == 1);
    CHECK(undone[0].destination == src / "a(1).txt");
    CHECK(countFiles(dest) == 0);
}

TEST_CASE("Missing or malformed manifests are errors") {
    TempDir dir;
    RecordingSink sink;
    CHECK_THROWS_AS(undoRun(dir.path() / "none.json", sink), NotFoundError);

    writeFile(dir.path() / "broken.json", "{ not json");
    CHECK_THROWS_AS(undoRun(dir.path() / "broken.json", sink), ParseError);

    writeFile(dir.path() / "wrong.json", R"({"operations": [{"src": 1, "dst": "x"}]})");
    CHECK_THROWS_AS(undoRun(dir.path() / "wrong.json", sink), ParseError);

    writeFile(dir.path() / "empty.json", R"({})");
    CHECK(undoRun(dir.path() / "empty.json", sink).empty());
}

TEST_CASE("Manifest keeps only applied operations, in order") {
    TempDir dir;
    const auto manifest = dir.path() / "nested" / "undo.json";
    writeFile(manifest, R"({"operations": [{"src": "old", "dst": "old", "action": "move"}]})");

    const std::size_t written = writeManifest(manifest, {
        {"/s/1", "/d/1", PlacementAction::Hardlink},
        {"/s/2", "", PlacementAction::SkipDuplicate},
        {"/s/3", "/d/3", PlacementAction::PlanMove},
        {"/s/4", "/d/4", PlacementAction::Copy},
    });
    CHECK(written == 2);
    CHECK_FALSE(fs::exists(dir.path() / "nested" / "undo.json.tmp"));

    const auto document = nlohmann::json::parse(readFile(manifest));
    REQUIRE(document.at("operations").size() == 2);
    CHECK(document["operations"][0] == nlohmann::json{{"src", "/s/1"}, {"dst", "/d/1"}, {"action", "hardlink"}});
    CHECK(document["operations"][1]["action"].get<std::string>() == "copy");
}
