// =================================================================
// include/Switchboard/Orchestrator.hpp
// =================================================================
// Routing pipeline and registry of running sessions.

#pragma once

#include "Switchboard/AgentIndex.hpp"
#include "Switchboard/QueryAnalyzer.hpp"
#include "Switchboard/AgentScorer.hpp"
#include "Switchboard/AgentSelector.hpp"
#include "Switchboard/EscalationDecider.hpp"
#include "Switchboard/OrchestrationSession.hpp"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <memory>
#include <optional>
#include <chrono>
#include <functional>
#include <mutex>
#include <atomic>

namespace Switchboard {

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    SelectorConfig selector;                        ///< Selection limits
    EscalationConfig escalation;                    ///< Escalation thresholds
    SessionConfig session;                          ///< Per-session settings
    std::chrono::seconds session_retention{600};    ///< Keep finished sessions this long
};

/**
 * @brief Everything decided about a query before dispatch
 */
struct RoutingDecision {
    std::string query_text;                         ///< Trimmed query text
    QueryAnalysis analysis;                         ///< Keywords, complexity, sentiment
    AgentSelection selection;                       ///< Ranked scores and recommendation
    EscalationDecision escalation;                  ///< Escalation verdict
    std::chrono::microseconds routing_time{0};      ///< Time spent routing

    std::vector<std::string> selectedAgentIds() const { return selection.selectedAgentIds(); }
};

/**
 * @brief Orchestrator statistics
 */
struct OrchestratorStatistics {
    size_t total_queries = 0;                       ///< Sessions submitted
    size_t rejected_queries = 0;                    ///< Queries rejected as invalid
    size_t completed_sessions = 0;                  ///< Sessions that reached COMPLETED
    size_t failed_sessions = 0;                     ///< Sessions that reached FAILED
    size_t cancelled_sessions = 0;                  ///< Sessions ended by the caller
    size_t escalated_sessions = 0;                  ///< Sessions that needed a human
    size_t fallback_selections = 0;                 ///< Selections that used the fallback
    double average_session_time = 0.0;              ///< Average session duration in ms
    std::unordered_map<std::string, size_t> agent_usage;    ///< Dispatches per agent
    std::unordered_map<std::string, size_t> agent_failures; ///< ERROR outcomes per agent
    std::chrono::system_clock::time_point last_reset;       ///< Last statistics reset
};

/**
 * @brief Entry point of the engine
 *
 * Runs the synchronous pipeline (analyze, score, select, decide), then starts
 * an OrchestrationSession per query and keeps it addressable by id until it
 * has been finished for longer than session_retention. Session events pass
 * through the orchestrator, which tallies statistics, to the observer given
 * at construction.
 */
class Orchestrator : public SessionObserver {
public:
    /**
     * @brief Constructor
     * @param index Agent index, must outlive the orchestrator
     * @param backend Execution backend shared by all sessions
     * @param channel Human escalation channel, may be null
     * @param observer Downstream event observer, may be null
     * @param config Orchestrator configuration
     * @param jitter Confidence jitter source, uniform when null
     */
    Orchestrator(AgentIndex& index,
                 std::shared_ptr<ExecutionBackend> backend,
                 std::shared_ptr<HumanEscalationChannel> channel = nullptr,
                 SessionObserver* observer = nullptr,
                 const OrchestratorConfig& config = OrchestratorConfig(),
                 std::shared_ptr<JitterSource> jitter = nullptr);

    /**
     * @brief Destructor, cancels and joins every running session
     */
    ~Orchestrator() override;

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Route a query without dispatching it
     * @param text Query text
     * @return Routing decision
     * @throws InputError if the text is empty or whitespace
     * @throws ConfigError if no agent profiles are available
     */
    virtual RoutingDecision routeQuery(const std::string& text) const;

    /**
     * @brief Route a query and start its session
     * @param text Query text
     * @param context Caller-supplied context passed to the backend
     * @return Session id
     * @throws InputError if the text is empty or whitespace
     */
    virtual std::string submitQuery(const std::string& text,
                                    const std::unordered_map<std::string, std::string>& context = {});

    /**
     * @brief Cancel a running session
     * @return False if the session is unknown
     */
    virtual bool endSession(const std::string& session_id);

    /**
     * @brief Wait for a session to finish
     * @return Result, or nullopt if unknown or still running after the timeout
     */
    virtual std::optional<AggregatedResult> waitForResult(const std::string& session_id,
                                                          std::chrono::milliseconds timeout);

    virtual std::optional<SessionSnapshot> getSessionSnapshot(const std::string& session_id) const;

    /**
     * @brief Ids of sessions that have not reached a terminal state
     */
    virtual std::vector<std::string> getActiveSessions() const;

    virtual OrchestratorStatistics getStatistics() const;
    virtual void resetStatistics();

    /**
     * @brief Drop finished sessions older than session_retention
     * @param now Reference time
     * @return Number of sessions dropped
     */
    virtual size_t purgeExpiredSessions(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief Called with the id of every purged session
     */
    void setSessionPurgedCallback(std::function<void(const std::string&)> callback);

    void onSessionEvent(const SessionEvent& event) override;

    /**
     * @brief Formatted statistics and session overview
     */
    virtual std::string getStatusReport() const;

    OrchestratorConfig getConfig() const;
    void setConfig(const OrchestratorConfig& config);

    AgentIndex& getIndex() { return m_index; }

    /**
     * @brief Analyzer used by routeQuery, for rule overrides before the first query
     */
    QueryAnalyzer& getAnalyzer() { return m_analyzer; }

protected:
    /**
     * @brief Generate a unique session id
     */
    virtual std::string generateSessionId();

private:
    AgentIndex& m_index;
    std::shared_ptr<ExecutionBackend> m_backend;
    std::shared_ptr<HumanEscalationChannel> m_channel;
    SessionObserver* m_observer;

    mutable std::mutex m_config_mutex;
    OrchestratorConfig m_config;
    QueryAnalyzer m_analyzer;
    AgentScorer m_scorer;
    AgentSelector m_selector;
    EscalationDecider m_decider;

    mutable std::mutex m_sessions_mutex;
    std::map<std::string, std::shared_ptr<OrchestrationSession>> m_sessions;
    std::function<void(const std::string&)> m_purged_callback;

    mutable std::mutex m_stats_mutex;
    OrchestratorStatistics m_stats;
    std::unordered_map<std::string, int64_t> m_session_started_ms;
    double m_total_session_time = 0.0;
    std::atomic<uint64_t> m_session_counter{0};

    static std::string trim(const std::string& text);
    std::shared_ptr<OrchestrationSession> findSession(const std::string& session_id) const;
    void recordSessionEnd(const EventHeader& header, bool completed, const std::vector<std::string>& failed_agents);
};

} // namespace Switchboard
