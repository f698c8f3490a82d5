// =================================================================
// src/Switchboard/SessionEvents.cpp
// =================================================================
// Helpers over the session event variant.

#include "Switchboard/SessionEvents.hpp"
#include <chrono>
#include <type_traits>

namespace Switchboard {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const EventHeader& headerOf(const SessionEvent& event) {
    return std::visit([](const auto& e) -> const EventHeader& { return e.header; }, event);
}

std::string eventTypeName(const SessionEvent& event) {
    return std::visit(overloaded{
        [](const SessionStartedEvent&) { return std::string("session_started"); },
        [](const AgentStatusUpdateEvent&) { return std::string("agent_status_update"); },
        [](const PhaseUpdateEvent&) { return std::string("phase_update"); },
        [](const SessionCompleteEvent&) { return std::string("session_complete"); },
        [](const SessionErrorEvent&) { return std::string("session_error"); }
    }, event);
}

bool isTerminalEvent(const SessionEvent& event) {
    return std::visit(overloaded{
        [](const SessionStartedEvent&) { return false; },
        [](const AgentStatusUpdateEvent& e) { return isTerminal(e.status); },
        [](const PhaseUpdateEvent&) { return false; },
        [](const SessionCompleteEvent&) { return true; },
        [](const SessionErrorEvent&) { return true; }
    }, event);
}

bool isSessionEndEvent(const SessionEvent& event) {
    return std::holds_alternative<SessionCompleteEvent>(event) ||
           std::holds_alternative<SessionErrorEvent>(event);
}

int64_t currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace Switchboard
