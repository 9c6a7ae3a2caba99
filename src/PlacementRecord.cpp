#include "PlacementRecord.hpp"

#include <array>
#include <utility>

namespace {
constexpr std::array<std::pair<PlacementAction, std::string_view>, 8> kActionNames{{
    {PlacementAction::Move, "move"},
    {PlacementAction::Copy, "copy"},
    {PlacementAction::Hardlink, "hardlink"},
    {PlacementAction::SkipDuplicate, "skip-duplicate"},
    {PlacementAction::PlanMove, "plan-move"},
    {PlacementAction::PlanCopy, "plan-copy"},
    {PlacementAction::PlanHardlink, "plan-hardlink"},
    {PlacementAction::Undo, "undo"},
}};
}

std::string toString(PlacementAction action) {
    for (const auto& [value, name] : kActionNames) {
        if (value == action) {
            return std::string(name);
        }
    }
    return "unknown";
}

std::optional<PlacementAction> actionFromString(std::string_view text) {
    for (const auto& [value, name] : kActionNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

std::string toString(PlacementMode mode) {
    switch (mode) {
    case PlacementMode::Move:
        return "move";
    case PlacementMode::Copy:
        return "copy";
    case PlacementMode::Hardlink:
        return "hardlink";
    }
    return "move";
}

std::optional<PlacementMode> modeFromString(std::string_view text) {
    if (text == "move") {
        return PlacementMode::Move;
    }
    if (text == "copy") {
        return PlacementMode::Copy;
    }
    if (text == "hardlink") {
        return PlacementMode::Hardlink;
    }
    return std::nullopt;
}

PlacementAction actionFor(PlacementMode mode) {
    switch (mode) {
    case PlacementMode::Copy:
        return PlacementAction::Copy;
    case PlacementMode::Hardlink:
        return PlacementAction::Hardlink;
    case PlacementMode::Move:
        break;
    }
    return PlacementAction::Move;
}

PlacementAction planActionFor(PlacementMode mode) {
    switch (mode) {
    case PlacementMode::Copy:
        return PlacementAction::PlanCopy;
    case PlacementMode::Hardlink:
        return PlacementAction::PlanHardlink;
    case PlacementMode::Move:
        break;
    }
    return PlacementAction::PlanMove;
}

bool isUndoable(PlacementAction action) {
    return action == PlacementAction::Move || action == PlacementAction::Copy || action == PlacementAction::Hardlink;
}
