// =================================================================
// include/Switchboard/OrchestrationSession.hpp
// =================================================================
// One query's fan-out to its agents, escalation wait and aggregation.

#pragma once

#include "Switchboard/SessionTypes.hpp"
#include "Switchboard/SessionEvents.hpp"
#include "Switchboard/CancellationToken.hpp"
#include "Switchboard/ExecutionBackend.hpp"
#include "Switchboard/HumanEscalationChannel.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <chrono>
#include <future>
#include <mutex>
#include <condition_variable>

namespace Switchboard {

/**
 * @brief Session behaviour settings
 */
struct SessionConfig {
    std::chrono::milliseconds escalation_timeout{300000};   ///< Wait for a human before auto-resolving
    std::string timeout_response =                          ///< Recorded when the escalation window expires
        "No operator responded in time; the automated answer was delivered.";
    std::string human_agent_id = "human_operator";          ///< Id of the synthetic human result
};

/**
 * @brief Runs one query through its selected agents
 *
 * State machine: CREATED -> DISPATCHING -> AGGREGATING -> [ESCALATED] ->
 * COMPLETED | FAILED. Each selected agent runs in its own std::async task and
 * is the only writer of its AgentRuntimeState slot. Agent failures settle as
 * ERROR and never abort siblings. Every accepted state change is published to
 * the observer as an immutable event.
 */
class OrchestrationSession {
public:
    /**
     * @brief Constructor
     * @param query Query to answer
     * @param agent_ids Agents to dispatch, must not be empty
     * @param escalation Pending escalation record, if the query needs a human
     * @param backend Execution backend
     * @param channel Human escalation channel, may be null
     * @param observer Event observer, may be null, must outlive the session
     * @param config Session settings
     * @throws SwitchboardError if agent_ids is empty or backend is null
     */
    OrchestrationSession(Query query,
                         std::vector<std::string> agent_ids,
                         std::optional<EscalationRecord> escalation,
                         std::shared_ptr<ExecutionBackend> backend,
                         std::shared_ptr<HumanEscalationChannel> channel,
                         SessionObserver* observer,
                         const SessionConfig& config = SessionConfig());

    /**
     * @brief Destructor, cancels and waits for a running session
     */
    ~OrchestrationSession();

    OrchestrationSession(const OrchestrationSession&) = delete;
    OrchestrationSession& operator=(const OrchestrationSession&) = delete;

    /**
     * @brief Run the session in the background
     */
    void start();

    /**
     * @brief Run the session on the calling thread until it is terminal
     * @return Aggregated result
     * @throws SwitchboardError if the session was already started
     */
    AggregatedResult run();

    /**
     * @brief Signal cancellation to every running agent and the escalation wait
     */
    void cancel();

    /**
     * @brief Wait for a terminal state
     * @param timeout Maximum time to wait
     * @return Result, or nullopt if still running
     */
    std::optional<AggregatedResult> waitForCompletion(std::chrono::milliseconds timeout) const;

    SessionSnapshot snapshot() const;
    SessionState getState() const;
    bool isFinished() const;
    bool isCancelled() const { return m_cancel->isCancelled(); }

    const std::string& getId() const { return m_query.session_id; }
    const Query& getQuery() const { return m_query; }
    const std::vector<std::string>& getAgentIds() const { return m_agent_ids; }
    std::optional<std::chrono::system_clock::time_point> getCompletedAt() const;

private:
    struct AgentSlot {
        mutable std::mutex mutex;
        AgentRuntimeState state;
    };

    Query m_query;
    std::vector<std::string> m_agent_ids;
    std::shared_ptr<ExecutionBackend> m_backend;
    std::shared_ptr<HumanEscalationChannel> m_channel;
    SessionObserver* m_observer;
    SessionConfig m_config;
    std::shared_ptr<CancellationToken> m_cancel;

    std::map<std::string, std::unique_ptr<AgentSlot>> m_slots;

    mutable std::mutex m_state_mutex;
    mutable std::condition_variable m_completion_cv;
    SessionState m_state = SessionState::CREATED;
    std::optional<EscalationRecord> m_escalation;
    std::optional<AggregatedResult> m_result;
    std::chrono::system_clock::time_point m_created_at;
    std::optional<std::chrono::system_clock::time_point> m_completed_at;
    uint64_t m_session_sequence = 0;
    bool m_started = false;

    std::future<AggregatedResult> m_runner;

    /**
     * @brief Apply a state update to one agent's slot
     *
     * Only the task that owns the slot calls this. Rules are those of
     * applyAgentUpdate().
     *
     * @param agent_id Agent whose slot to update
     * @param status New status
     * @param progress Requested progress
     * @param task Current task description
     * @param error Error text for ERROR
     * @return True if the update was accepted
     */
    bool updateAgentState(const std::string& agent_id, AgentStatus status, double progress,
                          const std::string& task, const std::string& error = "");

    AgentResult runAgent(const std::string& agent_id);
    std::optional<std::string> awaitHuman(const EscalationRecord& record);
    void resolveEscalation(std::future<std::optional<std::string>>& pending);
    AggregatedResult aggregate(const std::vector<AgentResult>& results) const;

    void transitionTo(SessionState state, double progress, const std::string& description);
    void finish(const AggregatedResult& result, SessionState final_state);

    EventHeader nextSessionHeader();
    void publish(const SessionEvent& event);
};

} // namespace Switchboard
