#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include "PlacementRecord.hpp"

#include <filesystem>

// Create path and every missing parent; throws IoError/PermissionError on failure.
void ensureDirectory(const std::filesystem::path& path);

// Copy contents, permissions and modification time. Fails if destination exists.
void copyPreservingMetadata(const std::filesystem::path& source, const std::filesystem::path& destination);

// Place source at destination using the requested mode.
//
// The destination is re-checked for conflicts right before acting and its parent
// directories are created. Hardlinks that the OS refuses (e.g. across devices) degrade
// to a copy, and moves across devices become copy + delete, so the returned record
// holds the action actually taken and the final path. Unrecoverable failures throw
// IoError/PermissionError.
PlacementRecord placeFile(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          PlacementMode mode);

#endif
