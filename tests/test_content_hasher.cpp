#include <catch2/catch.hpp>

#include "ContentHasher.hpp"
#include "OrganizerErrors.hpp"
#include "TestHelpers.hpp"

TEST_CASE("hashFile produces the SHA-256 hex digest") {
    TempDir dir;
    writeFile(dir.path() / "empty.bin", "");
    writeFile(dir.path() / "abc.txt", "abc");

    CHECK(hashFile(dir.path() / "empty.bin") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(hashFile(dir.path() / "abc.txt") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Files larger than one chunk hash by content") {
    TempDir dir;
    const std::string big(kHashChunkSize * 2 + 123, 'z');
    std::string other = big;
    other.back() = 'y';
    writeFile(dir.path() / "a.bin", big);
    writeFile(dir.path() / "b.bin", big);
    writeFile(dir.path() / "c.bin", other);

    const auto a = hashFile(dir.path() / "a.bin");
    CHECK(a.size() == 64);
    CHECK(a == hashFile(dir.path() / "b.bin"));
    CHECK(a != hashFile(dir.path() / "c.bin"));
}

TEST_CASE("Unreadable files raise IoError") {
    TempDir dir;
    CHECK_THROWS_AS(hashFile(dir.path() / "missing.bin"), IoError);
}
