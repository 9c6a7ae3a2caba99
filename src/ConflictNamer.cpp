#include "ConflictNamer.hpp"

#include "OrganizerErrors.hpp"

#include <string>
#include <system_error>

namespace {
// Dangling symlinks count as taken.
bool entryExists(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        throwIoError("Failed to check for existing file", path, ec);
    }
    return std::filesystem::exists(status);
}
} // namespace

std::filesystem::path nextNonConflictingName(const std::filesystem::path& path) {
    if (!entryExists(path)) {
        return path;
    }

    const std::filesystem::path parent = path.parent_path();
    const std::string stem = path.stem().string();
    const std::string extension = path.extension().string();
    for (std::size_t counter = 1;; ++counter) {
        auto candidate = parent / (stem + "(" + std::to_string(counter) + ")" + extension);
        if (!entryExists(candidate)) {
            return candidate;
        }
    }
}
