#ifndef UNDO_MANIFEST_HPP
#define UNDO_MANIFEST_HPP

#include "PlacementRecord.hpp"

#include <filesystem>
#include <vector>

// Replace the manifest at path with {"operations": [{"src", "dst", "action"}, ...]}.
// Only move/copy/hardlink records are written, in the order given. The document is
// written to a sibling temporary file and renamed over the target.
// Returns the number of operations written.
std::size_t writeManifest(const std::filesystem::path& path, const std::vector<PlacementRecord>& records);

// Load the operations recorded in a manifest, in the order they were applied.
// Throws NotFoundError when the file is missing and ParseError when it is malformed.
std::vector<PlacementRecord> readManifest(const std::filesystem::path& path);

#endif
