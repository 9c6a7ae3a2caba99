#include "Organizer.hpp"

#include "ConflictNamer.hpp"
#include "DuplicateTracker.hpp"
#include "FileMover.hpp"
#include "OrganizerErrors.hpp"
#include "RuleResolver.hpp"
#include "UndoManifest.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

namespace {
constexpr char kHiddenMarker = '.';

bool isHiddenName(const std::filesystem::path& name) {
    const std::string text = name.string();
    return !text.empty() && text.front() == kHiddenMarker;
}

bool isExcludedDirectory(const std::filesystem::path& dir, const RuleSet& rules) {
    const std::string name = dir.filename().string();
    if (rules.excludeHidden && isHiddenName(name)) {
        return true;
    }
    return std::find(rules.excludeDirs.begin(), rules.excludeDirs.end(), name) != rules.excludeDirs.end();
}

std::filesystem::path resolvedPath(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        throwIoError("Unable to resolve", path, ec);
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        throwIoError("Unable to resolve", path, ec);
    }
    return canonical.lexically_normal();
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return text;
}

void validateRoots(const std::filesystem::path& sourceRoot, const std::filesystem::path& destRoot) {
    std::error_code ec;
    const bool sourceExists = std::filesystem::exists(sourceRoot, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throwIoError("Unable to access source folder", sourceRoot, ec);
    }
    if (!sourceExists) {
        throw NotFoundError("Source folder not found: " + sourceRoot.string());
    }
    if (!std::filesystem::is_directory(sourceRoot, ec)) {
        throw ConfigurationError("Source is not a directory: " + sourceRoot.string());
    }

    if (resolvedPath(sourceRoot) == resolvedPath(destRoot)) {
        throw ConfigurationError("Destination must differ from source.");
    }
    if (isWithinDirectory(destRoot, sourceRoot)) {
        throw ConfigurationError("Destination directory cannot be inside the source directory.");
    }
}
} // namespace

bool isWithinDirectory(const std::filesystem::path& child, const std::filesystem::path& root) {
    // A trailing separator shows up as an empty final component.
    auto components = [](const std::filesystem::path& path) {
        std::vector<std::filesystem::path> parts;
        for (const auto& part : path) {
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
        return parts;
    };

    const auto childParts = components(resolvedPath(child));
    const auto rootParts = components(resolvedPath(root));
    if (rootParts.size() > childParts.size()) {
        return false;
    }
    return std::equal(rootParts.begin(), rootParts.end(), childParts.begin());
}

std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& root, const RuleSet& rules) {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator iter(root, ec);
    if (ec) {
        throwIoError("Unable to enumerate", root, ec);
    }

    // Last entry reached; a failed increment leaves the iterator at end, so errors report this path.
    std::filesystem::path current = root;
    for (auto end = std::filesystem::recursive_directory_iterator(); iter != end; iter.increment(ec)) {
        if (ec) {
            throwIoError("Unable to enumerate", current, ec);
        }

        const auto& entry = *iter;
        current = entry.path();
        std::error_code typeErr;
        if (entry.is_directory(typeErr) && !entry.is_symlink(typeErr)) {
            if (isExcludedDirectory(entry.path(), rules)) {
                iter.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file(typeErr) || typeErr) {
            continue;
        }
        if (rules.excludeHidden && isHiddenName(entry.path().filename())) {
            continue;
        }
        files.push_back(entry.path());
    }

    if (ec) {
        throwIoError("Unable to enumerate", current, ec);
    }
    return files;
}

std::vector<PlacementRecord> organize(const std::filesystem::path& sourceRoot,
                                      const std::filesystem::path& destRoot,
                                      const RuleSet& rules,
                                      PlacementMode mode,
                                      bool dryRun,
                                      const std::optional<std::filesystem::path>& undoManifest,
                                      EventSink& sink) {
    validateRoots(sourceRoot, destRoot);

    const RuleResolver resolver(rules);
    DuplicateTracker duplicates(rules.duplicatePolicy, destRoot);
    std::vector<PlacementRecord> results;

    for (const auto& file : collectFiles(sourceRoot, rules)) {
        const CandidateFile candidate = inspectFile(file);
        std::filesystem::path destination = resolver.computeDestination(candidate, destRoot);
        // The hardlink duplicate policy links every file, not only the duplicates.
        const PlacementMode effectiveMode =
            rules.duplicatePolicy.action == DuplicateAction::Hardlink ? PlacementMode::Hardlink : mode;

        const DuplicateDecision decision = duplicates.check(file, destination);
        if (decision.outcome == DuplicateOutcome::Skip) {
            PlacementRecord record{file, {}, PlacementAction::SkipDuplicate};
            sink.onEvent({EventKind::DuplicateSkipped, file, {}, record.action,
                          "Duplicate (skip): `" + file.string() + "` (same as `" + decision.firstSeen.string() + "`)"});
            results.push_back(std::move(record));
            continue;
        }
        if (decision.outcome == DuplicateOutcome::Redirect) {
            destination = decision.destination;
        }

        const std::filesystem::path finalDestination = nextNonConflictingName(destination);

        if (dryRun) {
            PlacementRecord record{file, finalDestination, planActionFor(effectiveMode)};
            sink.onEvent({EventKind::Planned, file, finalDestination, record.action,
                          upper(toString(record.action)) + ": `" + file.string() + "` -> `" +
                              finalDestination.string() + "`"});
            results.push_back(std::move(record));
            continue;
        }

        PlacementRecord record = placeFile(file, finalDestination, effectiveMode);
        sink.onEvent({EventKind::Placed, record.source, record.destination, record.action,
                      upper(toString(record.action)) + ": `" + file.filename().string() + "` -> `" +
                          record.destination.string() + "`"});
        results.push_back(std::move(record));
    }

    if (!dryRun && undoManifest) {
        const std::size_t written = writeManifest(*undoManifest, results);
        sink.onEvent({EventKind::ManifestSaved, {}, *undoManifest, std::nullopt,
                      "Undo manifest saved (" + std::to_string(written) + " operation(s)) -> `" +
                          undoManifest->string() + "`"});
    }

    return results;
}

std::vector<PlacementRecord> undoRun(const std::filesystem::path& manifestPath, EventSink& sink) {
    const std::vector<PlacementRecord> operations = readManifest(manifestPath);

    std::vector<PlacementRecord> undone;
    for (auto it = operations.rbegin(); it != operations.rend(); ++it) {
        const std::filesystem::path& placed = it->destination;
        const std::filesystem::path& original = it->source;

        std::error_code ec;
        const auto status = std::filesystem::symlink_status(placed, ec);
        if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
            throwIoError("Unable to access", placed, ec);
        }
        if (!std::filesystem::exists(status)) {
            sink.onEvent({EventKind::UndoMissing, placed, original, std::nullopt,
                          "Missing file for undo: `" + placed.string() + "`"});
            continue;
        }

        ensureDirectory(original.parent_path());
        const std::filesystem::path restored = nextNonConflictingName(original);

        // Always a rename: other hardlinks created by the run are left in place.
        std::error_code renameErr;
        std::filesystem::rename(placed, restored, renameErr);
        if (renameErr) {
            throwIoError("Failed to restore `" + placed.string() + "` to", restored, renameErr);
        }

        sink.onEvent({EventKind::Undone, placed, restored, PlacementAction::Undo,
                      "UNDO: `" + placed.string() + "` -> `" + restored.string() + "`"});
        undone.push_back({placed, restored, PlacementAction::Undo});
    }

    return undone;
}
