#include "EventSink.hpp"

#include <ostream>

ConsoleEventSink::ConsoleEventSink(std::ostream& out, std::ostream& err) : m_out(out), m_err(err) {}

void ConsoleEventSink::onEvent(const OrganizerEvent& event) {
    if (event.kind == EventKind::UndoMissing) {
        m_err << "Warning: " << event.message << std::endl;
        return;
    }
    m_out << event.message << std::endl;
}
