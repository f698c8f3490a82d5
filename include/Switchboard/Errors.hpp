// =================================================================
// include/Switchboard/Errors.hpp
// =================================================================
// Exception taxonomy shared by the routing engine.

#pragma once

#include <stdexcept>
#include <string>

namespace Switchboard {

/**
 * @brief Base class for all engine errors
 */
class SwitchboardError : public std::runtime_error {
public:
    explicit SwitchboardError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid query, rejected before scoring. Never retried.
 */
class InputError : public SwitchboardError {
public:
    explicit InputError(const std::string& message)
        : SwitchboardError("Invalid input: " + message) {}
};

/**
 * @brief One agent's backend call failed. Converted to a per-agent ERROR state.
 */
class AgentTaskError : public SwitchboardError {
public:
    AgentTaskError(const std::string& agent_id, const std::string& message)
        : SwitchboardError("Agent '" + agent_id + "' failed: " + message),
          m_agent_id(agent_id), m_reason(message) {}

    const std::string& agentId() const { return m_agent_id; }
    const std::string& reason() const { return m_reason; }

private:
    std::string m_agent_id;
    std::string m_reason;
};

/**
 * @brief No human response arrived within the escalation window
 */
class EscalationTimeoutError : public SwitchboardError {
public:
    explicit EscalationTimeoutError(const std::string& session_id)
        : SwitchboardError("Escalation timed out for session " + session_id) {}
};

/**
 * @brief Realtime connection lost. Drives reconnect, never a session failure.
 */
class TransportError : public SwitchboardError {
public:
    explicit TransportError(const std::string& message)
        : SwitchboardError("Transport error: " + message) {}
};

/**
 * @brief Agent Index could not be loaded and no fallback profile is usable
 */
class ConfigError : public SwitchboardError {
public:
    explicit ConfigError(const std::string& message)
        : SwitchboardError("Configuration error: " + message) {}
};

} // namespace Switchboard
