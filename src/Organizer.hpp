#ifndef ORGANIZER_HPP
#define ORGANIZER_HPP

#include "EventSink.hpp"
#include "PlacementRecord.hpp"
#include "Rules.hpp"

#include <filesystem>
#include <optional>
#include <vector>

// Every regular file under root, skipping excluded and (optionally) hidden directories
// and hidden files. Excluded directories are pruned; their contents are never visited.
std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& root, const RuleSet& rules);

// True when child is root itself or lies somewhere underneath it (paths are resolved first).
bool isWithinDirectory(const std::filesystem::path& child, const std::filesystem::path& root);

// Classify every file under sourceRoot and place it under destRoot.
//
// Fails fast with NotFoundError when sourceRoot is missing and ConfigurationError when
// destRoot equals or lies inside sourceRoot. Duplicate content is detected within this
// call only. In a dry run nothing on disk changes and plan-* actions are reported.
// Otherwise, when undoManifest is set, the move/copy/hardlink records are written there,
// replacing any earlier manifest. I/O failures propagate immediately; files already
// placed stay where they are.
std::vector<PlacementRecord> organize(const std::filesystem::path& sourceRoot,
                                      const std::filesystem::path& destRoot,
                                      const RuleSet& rules,
                                      PlacementMode mode,
                                      bool dryRun,
                                      const std::optional<std::filesystem::path>& undoManifest,
                                      EventSink& sink);

// Restore the files recorded in a manifest, most recent operation first.
// Entries whose placed file is gone are reported through the sink and skipped.
// Throws NotFoundError when the manifest does not exist.
std::vector<PlacementRecord> undoRun(const std::filesystem::path& manifestPath, EventSink& sink);

#endif
