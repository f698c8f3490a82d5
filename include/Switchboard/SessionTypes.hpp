// =================================================================
// include/Switchboard/SessionTypes.hpp
// =================================================================
// Core data types for orchestration sessions and escalations.

#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace Switchboard {

/**
 * @brief Per-agent lifecycle status, in forward order
 */
enum class AgentStatus {
    IDLE,           ///< Not started
    ANALYZING,      ///< Reading the query
    PROCESSING,     ///< Waiting on the execution backend
    COLLABORATING,  ///< Sharing findings with sibling agents
    COMPLETING,     ///< Formatting the result
    FINISHED,       ///< Terminal: result available
    ERROR           ///< Terminal: failed or cancelled
};

/**
 * @brief Overall session lifecycle state
 */
enum class SessionState {
    CREATED,        ///< Built, not yet dispatched
    DISPATCHING,    ///< Agent tasks running
    AGGREGATING,    ///< All agents settled, combining results
    ESCALATED,      ///< Waiting on a human response
    COMPLETED,      ///< Terminal: at least one agent finished
    FAILED          ///< Terminal: every agent errored
};

/**
 * @brief Why a query was escalated to a human
 */
enum class EscalationReason {
    COMPLEX_ISSUE,      ///< Complexity bucket is high
    NEGATIVE_SENTIMENT, ///< Sentiment polarity <= -1
    BROAD_MATCH         ///< More than two agents recommended
};

/**
 * @brief Escalation priority
 */
enum class EscalationPriority {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class EscalationStatus {
    PENDING,
    RESOLVED
};

/**
 * @brief How an escalation was resolved
 */
enum class EscalationResolution {
    NONE,           ///< Still pending
    HUMAN_RESPONSE, ///< A human answered
    TIMEOUT,        ///< Auto-resolved after the escalation window
    CANCELLED       ///< Session ended before a human answered
};

/**
 * @brief A customer query entering the engine
 */
struct Query {
    std::string text;                                   ///< Raw query text
    std::string session_id;                             ///< Owning session
    std::chrono::system_clock::time_point created_at;   ///< Submission time
    std::unordered_map<std::string, std::string> context; ///< Caller-supplied context
};

/**
 * @brief Runtime state of one agent within a session
 */
struct AgentRuntimeState {
    AgentStatus status = AgentStatus::IDLE;             ///< Current status
    double progress = 0.0;                              ///< 0-100, non-decreasing within a status
    std::string current_task;                           ///< Human-readable current step
    std::chrono::system_clock::time_point last_updated; ///< Time of last accepted update
    uint64_t sequence = 0;                              ///< Accepted update counter
    std::string error;                                  ///< Error text when status is ERROR
};

/**
 * @brief Result returned by one agent
 */
struct AgentResult {
    std::string agent_id;                         ///< Agent that produced the result
    std::string content;                          ///< Result content
    double confidence = 0.0;                      ///< Backend-reported confidence
    bool success = false;                         ///< False when the agent errored
    std::string error_message;                    ///< Error if failed
    std::chrono::milliseconds execution_time{0};  ///< Time spent in the agent task
};

/**
 * @brief Escalation attached to a session
 */
struct EscalationRecord {
    std::string session_id;
    std::string query_text;
    std::vector<std::string> agent_ids;                  ///< Agents selected for the session
    std::vector<EscalationReason> reasons;
    EscalationPriority priority = EscalationPriority::MEDIUM;
    std::chrono::system_clock::time_point triggered_at;
    EscalationStatus status = EscalationStatus::PENDING;
    std::string human_response;
    EscalationResolution resolution = EscalationResolution::NONE;
    std::optional<std::chrono::system_clock::time_point> resolved_at;

    /**
     * @brief Reasons joined with ", " for display
     */
    std::string reasonText() const;
};

/**
 * @brief Combined outcome of a session
 */
struct AggregatedResult {
    std::vector<AgentResult> agent_results;       ///< Results in dispatch order
    std::vector<std::string> failed_agent_ids;    ///< Agents that ended in ERROR
    std::string combined_content;                 ///< "[agent] content" blocks
    double average_confidence = 0.0;              ///< Over successful agents
    std::optional<std::string> human_response;    ///< Folded-in human answer
};

/**
 * @brief Immutable copy of a session handed to readers
 */
struct SessionSnapshot {
    std::string session_id;
    Query query;
    std::vector<std::string> selected_agent_ids;
    std::map<std::string, AgentRuntimeState> agent_states;
    SessionState state = SessionState::CREATED;
    std::optional<EscalationRecord> escalation;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<AggregatedResult> result;
};

std::string agentStatusToString(AgentStatus status);
AgentStatus stringToAgentStatus(const std::string& str);

/**
 * @brief True for FINISHED and ERROR
 */
bool isTerminal(AgentStatus status);

/**
 * @brief Check whether an agent may move from one status to another
 *
 * Forward moves and same-status progress updates are allowed. Anything out of
 * a terminal status and any backward move is rejected. ERROR is reachable from
 * every non-terminal status.
 *
 * @param from Current status
 * @param to Requested status
 * @return True if the transition is allowed
 */
bool isValidTransition(AgentStatus from, AgentStatus to);

/**
 * @brief Apply a status update to an agent's runtime state
 *
 * Progress is clamped to [0, 100]. A new status takes the requested progress,
 * a repeated status keeps the larger value and ERROR keeps the last one. The
 * sequence is bumped for every accepted update.
 *
 * @param state State to update in place
 * @param status Requested status
 * @param progress Requested progress
 * @param task Current task description
 * @param error Error text, recorded for ERROR only
 * @return False if the transition is invalid, state is left untouched
 */
bool applyAgentUpdate(AgentRuntimeState& state, AgentStatus status, double progress,
                      const std::string& task, const std::string& error = "");

std::string sessionStateToString(SessionState state);
SessionState stringToSessionState(const std::string& str);

/**
 * @brief True for COMPLETED and FAILED
 */
bool isTerminal(SessionState state);

/**
 * @brief Final session state from the settled agent results
 * @param results One result per dispatched agent
 * @return COMPLETED if any agent succeeded, otherwise FAILED
 */
SessionState deriveFinalState(const std::vector<AgentResult>& results);

std::string escalationReasonToString(EscalationReason reason);
std::string escalationPriorityToString(EscalationPriority priority);
std::string escalationStatusToString(EscalationStatus status);
std::string escalationResolutionToString(EscalationResolution resolution);

} // namespace Switchboard
