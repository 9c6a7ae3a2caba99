#include "FileMover.hpp"

#include "ConflictNamer.hpp"
#include "OrganizerErrors.hpp"

#include <system_error>

namespace {
void moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) {
    std::error_code renameErr;
    std::filesystem::rename(sourcePath, targetPath, renameErr);
    if (!renameErr) {
        return;
    }

    if (renameErr != std::errc::cross_device_link) {
        throwIoError("Failed to move `" + sourcePath.string() + "` to", targetPath, renameErr);
    }

    copyPreservingMetadata(sourcePath, targetPath);

    std::error_code removeErr;
    std::filesystem::remove(sourcePath, removeErr);
    if (removeErr) {
        throwIoError("Failed to remove original file after cross-device copy", sourcePath, removeErr);
    }
}
} // namespace

void ensureDirectory(const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }

    std::error_code mkdirErr;
    std::filesystem::create_directories(path, mkdirErr);
    if (mkdirErr) {
        throwIoError("Failed to create destination directory", path, mkdirErr);
    }
}

void copyPreservingMetadata(const std::filesystem::path& source, const std::filesystem::path& destination) {
    std::error_code copyErr;
    std::filesystem::copy_file(source, destination, std::filesystem::copy_options::none, copyErr);
    if (copyErr) {
        throwIoError("Failed to copy `" + source.string() + "` to", destination, copyErr);
    }

    std::error_code timeErr;
    const auto modified = std::filesystem::last_write_time(source, timeErr);
    if (!timeErr) {
        std::filesystem::last_write_time(destination, modified, timeErr);
    }
    if (timeErr) {
        throwIoError("Failed to preserve modification time on", destination, timeErr);
    }
}

PlacementRecord placeFile(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          PlacementMode mode) {
    ensureDirectory(destination.parent_path());
    const std::filesystem::path target = nextNonConflictingName(destination);

    switch (mode) {
    case PlacementMode::Hardlink: {
        std::error_code linkErr;
        std::filesystem::create_hard_link(source, target, linkErr);
        if (!linkErr) {
            return {source, target, actionFor(PlacementMode::Hardlink)};
        }
        copyPreservingMetadata(source, target);
        return {source, target, actionFor(PlacementMode::Copy)};
    }
    case PlacementMode::Copy:
        copyPreservingMetadata(source, target);
        return {source, target, actionFor(mode)};
    case PlacementMode::Move:
        break;
    }

    moveFile(source, target);
    return {source, target, actionFor(mode)};
}
