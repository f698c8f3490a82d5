// =================================================================
// include/Switchboard/SessionEvents.hpp
// =================================================================
// Closed set of events a session publishes to its observers.

#pragma once

#include "Switchboard/SessionTypes.hpp"
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstdint>

namespace Switchboard {

/**
 * @brief Fields shared by every event
 *
 * Session-level events carry an empty agent_name and their own sequence.
 * (session_id, agent_name, sequence) identifies an event for deduplication.
 */
struct EventHeader {
    std::string session_id;
    std::string agent_name;
    uint64_t sequence = 0;
    int64_t timestamp_ms = 0;   ///< Milliseconds since the Unix epoch
};

struct SessionStartedEvent {
    EventHeader header;
    std::string query_text;
    std::vector<std::string> agent_ids;
    bool escalation_required = false;
};

struct AgentStatusUpdateEvent {
    EventHeader header;
    AgentStatus status = AgentStatus::IDLE;
    double progress = 0.0;
    std::string current_task;
    std::string error;
};

struct PhaseUpdateEvent {
    EventHeader header;
    SessionState state = SessionState::CREATED;
    double progress = 0.0;
    std::string description;
};

struct SessionCompleteEvent {
    EventHeader header;
    SessionState final_state = SessionState::COMPLETED;
    std::vector<std::string> failed_agents;
    double average_confidence = 0.0;
    std::string summary;
    std::optional<std::string> human_response;
};

struct SessionErrorEvent {
    EventHeader header;
    std::string message;
    std::vector<std::string> failed_agents;
};

/**
 * @brief Every event kind, matched exhaustively with std::visit
 */
using SessionEvent = std::variant<
    SessionStartedEvent,
    AgentStatusUpdateEvent,
    PhaseUpdateEvent,
    SessionCompleteEvent,
    SessionErrorEvent
>;

/**
 * @brief Header of any event
 */
const EventHeader& headerOf(const SessionEvent& event);

/**
 * @brief Wire type name ("session_started", "agent_status_update", ...)
 */
std::string eventTypeName(const SessionEvent& event);

/**
 * @brief True for FINISHED/ERROR agent updates, session_complete and session_error
 */
bool isTerminalEvent(const SessionEvent& event);

/**
 * @brief True for session_complete and session_error
 */
bool isSessionEndEvent(const SessionEvent& event);

/**
 * @brief Current wall-clock time in epoch milliseconds
 */
int64_t currentTimestampMs();

/**
 * @brief Receives events published by sessions
 *
 * Called from agent task threads; implementations must be thread-safe.
 */
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void onSessionEvent(const SessionEvent& event) = 0;
};

} // namespace Switchboard
