// =================================================================
// src/Switchboard/SessionTypes.cpp
// =================================================================
// String conversions and transition rules for session types.

#include "Switchboard/SessionTypes.hpp"
#include <algorithm>

namespace Switchboard {

std::string EscalationRecord::reasonText() const {
    std::string text;
    for (size_t i = 0; i < reasons.size(); i++) {
        if (i > 0) text += ", ";
        text += escalationReasonToString(reasons[i]);
    }
    return text;
}

std::string agentStatusToString(AgentStatus status) {
    switch (status) {
        case AgentStatus::IDLE: return "IDLE";
        case AgentStatus::ANALYZING: return "ANALYZING";
        case AgentStatus::PROCESSING: return "PROCESSING";
        case AgentStatus::COLLABORATING: return "COLLABORATING";
        case AgentStatus::COMPLETING: return "COMPLETING";
        case AgentStatus::FINISHED: return "FINISHED";
        case AgentStatus::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

AgentStatus stringToAgentStatus(const std::string& str) {
    if (str == "ANALYZING") return AgentStatus::ANALYZING;
    if (str == "PROCESSING") return AgentStatus::PROCESSING;
    if (str == "COLLABORATING") return AgentStatus::COLLABORATING;
    if (str == "COMPLETING") return AgentStatus::COMPLETING;
    if (str == "FINISHED") return AgentStatus::FINISHED;
    if (str == "ERROR") return AgentStatus::ERROR;
    return AgentStatus::IDLE;
}

bool isTerminal(AgentStatus status) {
    return status == AgentStatus::FINISHED || status == AgentStatus::ERROR;
}

bool isValidTransition(AgentStatus from, AgentStatus to) {
    if (isTerminal(from)) {
        return false;
    }
    if (to == AgentStatus::ERROR) {
        return true;
    }
    return static_cast<int>(to) >= static_cast<int>(from);
}

bool applyAgentUpdate(AgentRuntimeState& state, AgentStatus status, double progress,
                      const std::string& task, const std::string& error) {
    if (!isValidTransition(state.status, status)) {
        return false;
    }

    double requested = std::max(0.0, std::min(100.0, progress));
    if (status == AgentStatus::ERROR) {
        state.error = error;
    } else if (status != state.status) {
        state.progress = requested;
    } else {
        state.progress = std::max(state.progress, requested);
    }

    state.status = status;
    state.current_task = task;
    state.last_updated = std::chrono::system_clock::now();
    state.sequence++;
    return true;
}

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::CREATED: return "CREATED";
        case SessionState::DISPATCHING: return "DISPATCHING";
        case SessionState::AGGREGATING: return "AGGREGATING";
        case SessionState::ESCALATED: return "ESCALATED";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

SessionState stringToSessionState(const std::string& str) {
    if (str == "DISPATCHING") return SessionState::DISPATCHING;
    if (str == "AGGREGATING") return SessionState::AGGREGATING;
    if (str == "ESCALATED") return SessionState::ESCALATED;
    if (str == "COMPLETED") return SessionState::COMPLETED;
    if (str == "FAILED") return SessionState::FAILED;
    return SessionState::CREATED;
}

bool isTerminal(SessionState state) {
    return state == SessionState::COMPLETED || state == SessionState::FAILED;
}

SessionState deriveFinalState(const std::vector<AgentResult>& results) {
    bool any_succeeded = std::any_of(results.begin(), results.end(),
        [](const AgentResult& r) { return r.success; });
    return any_succeeded ? SessionState::COMPLETED : SessionState::FAILED;
}

std::string escalationReasonToString(EscalationReason reason) {
    switch (reason) {
        case EscalationReason::COMPLEX_ISSUE: return "COMPLEX_ISSUE";
        case EscalationReason::NEGATIVE_SENTIMENT: return "NEGATIVE_SENTIMENT";
        case EscalationReason::BROAD_MATCH: return "BROAD_MATCH";
        default: return "UNKNOWN";
    }
}

std::string escalationPriorityToString(EscalationPriority priority) {
    switch (priority) {
        case EscalationPriority::LOW: return "LOW";
        case EscalationPriority::MEDIUM: return "MEDIUM";
        case EscalationPriority::HIGH: return "HIGH";
        case EscalationPriority::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string escalationStatusToString(EscalationStatus status) {
    return status == EscalationStatus::RESOLVED ? "RESOLVED" : "PENDING";
}

std::string escalationResolutionToString(EscalationResolution resolution) {
    switch (resolution) {
        case EscalationResolution::HUMAN_RESPONSE: return "HUMAN_RESPONSE";
        case EscalationResolution::TIMEOUT: return "TIMEOUT";
        case EscalationResolution::CANCELLED: return "CANCELLED";
        case EscalationResolution::NONE:
        default:
            return "NONE";
    }
}

} // namespace Switchboard
