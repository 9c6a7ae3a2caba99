#ifndef PLACEMENT_RECORD_HPP
#define PLACEMENT_RECORD_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// How a file is placed at its destination.
enum class PlacementMode { Move, Copy, Hardlink };

// What actually happened (or would happen) to a file.
enum class PlacementAction {
    Move,
    Copy,
    Hardlink,
    SkipDuplicate,
    PlanMove,
    PlanCopy,
    PlanHardlink,
    Undo
};

// One processed file. Destination is empty for skipped duplicates.
struct PlacementRecord {
    std::filesystem::path source;
    std::filesystem::path destination;
    PlacementAction action;
};

std::string toString(PlacementAction action);
std::optional<PlacementAction> actionFromString(std::string_view text);

std::string toString(PlacementMode mode);
std::optional<PlacementMode> modeFromString(std::string_view text);

// Action reported for a real placement performed with the given mode.
PlacementAction actionFor(PlacementMode mode);
// Action reported when the placement is only planned.
PlacementAction planActionFor(PlacementMode mode);
// True for the actions that are written to the undo manifest.
bool isUndoable(PlacementAction action);

#endif
