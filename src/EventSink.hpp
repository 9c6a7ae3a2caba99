#ifndef EVENT_SINK_HPP
#define EVENT_SINK_HPP

#include "PlacementRecord.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

enum class EventKind {
    Placed,
    Planned,
    DuplicateSkipped,
    ManifestSaved,
    Undone,
    UndoMissing
};

// A status update emitted once per processed file or run-level event.
struct OrganizerEvent {
    EventKind kind;
    std::filesystem::path source;
    std::filesystem::path destination;
    std::optional<PlacementAction> action;
    std::string message;
};

// Receives status events from organize() and undoRun(); the core never prints on its own.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvent(const OrganizerEvent& event) = 0;
};

// Drops every event.
class NullEventSink : public EventSink {
public:
    void onEvent(const OrganizerEvent&) override {}
};

// Writes event messages to out and warnings to err.
class ConsoleEventSink : public EventSink {
public:
    ConsoleEventSink(std::ostream& out, std::ostream& err);
    void onEvent(const OrganizerEvent& event) override;

private:
    std::ostream& m_out;
    std::ostream& m_err;
};

#endif
