// =================================================================
// src/Switchboard/OrchestrationSession.cpp
// =================================================================
// Implementation of the per-query orchestration state machine.

#include "Switchboard/OrchestrationSession.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace Switchboard {

OrchestrationSession::OrchestrationSession(Query query,
                                           std::vector<std::string> agent_ids,
                                           std::optional<EscalationRecord> escalation,
                                           std::shared_ptr<ExecutionBackend> backend,
                                           std::shared_ptr<HumanEscalationChannel> channel,
                                           SessionObserver* observer,
                                           const SessionConfig& config)
    : m_query(std::move(query)),
      m_agent_ids(std::move(agent_ids)),
      m_backend(std::move(backend)),
      m_channel(std::move(channel)),
      m_observer(observer),
      m_config(config),
      m_cancel(std::make_shared<CancellationToken>()),
      m_escalation(std::move(escalation)) {

    if (m_agent_ids.empty()) {
        throw SwitchboardError("Session " + m_query.session_id + " has no agents to dispatch");
    }
    if (!m_backend) {
        throw SwitchboardError("Session " + m_query.session_id + " has no execution backend");
    }

    auto now = std::chrono::system_clock::now();
    m_created_at = m_query.created_at.time_since_epoch().count() == 0 ? now : m_query.created_at;

    for (const auto& agent_id : m_agent_ids) {
        auto slot = std::make_unique<AgentSlot>();
        slot->state.last_updated = now;
        if (!m_slots.emplace(agent_id, std::move(slot)).second) {
            throw SwitchboardError("Agent " + agent_id + " selected twice for session " + m_query.session_id);
        }
    }
}

OrchestrationSession::~OrchestrationSession() {
    if (m_runner.valid()) {
        if (!isFinished()) {
            cancel();
        }
        m_runner.wait();
    }
}

void OrchestrationSession::start() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_started || m_runner.valid()) {
        throw SwitchboardError("Session already started: " + getId());
    }
    m_runner = std::async(std::launch::async, &OrchestrationSession::run, this);
}

AggregatedResult OrchestrationSession::run() {
    SessionStartedEvent started;
    std::optional<EscalationRecord> escalation;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_started) {
            throw SwitchboardError("Session already started: " + getId());
        }
        m_started = true;

        started.header = nextSessionHeader();
        started.query_text = m_query.text;
        started.agent_ids = m_agent_ids;
        started.escalation_required = m_escalation.has_value();
        escalation = m_escalation;
    }

    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(getId(), m_query.text, m_agent_ids.size());
    publish(started);

    transitionTo(SessionState::DISPATCHING, 10.0,
                 "Dispatching " + std::to_string(m_agent_ids.size()) + " agent(s)");

    // The human is asked in parallel with the agents
    std::future<std::optional<std::string>> pending_human;
    if (escalation) {
        pending_human = std::async(std::launch::async, &OrchestrationSession::awaitHuman, this, *escalation);
    }

    std::vector<std::future<AgentResult>> futures;
    futures.reserve(m_agent_ids.size());
    for (const auto& agent_id : m_agent_ids) {
        futures.push_back(std::async(std::launch::async, &OrchestrationSession::runAgent, this, agent_id));
    }

    std::vector<AgentResult> results;
    results.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            AgentResult error_result;
            error_result.agent_id = m_agent_ids[i];
            error_result.error_message = e.what();
            updateAgentState(m_agent_ids[i], AgentStatus::ERROR, 0.0, "Failed", e.what());
            results.push_back(error_result);
        }
    }

    transitionTo(SessionState::AGGREGATING, 80.0, "All agents settled");

    if (escalation) {
        transitionTo(SessionState::ESCALATED, 90.0, "Waiting for human response");
        resolveEscalation(pending_human);
    }

    // Final state and failed ids both come from the agent results
    AggregatedResult result = aggregate(results);
    SessionState final_state = deriveFinalState(results);

    finish(result, final_state);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(getId(), sessionStateToString(final_state),
                                        result.failed_agent_ids.size(), duration.count());

    return result;
}

void OrchestrationSession::cancel() {
    if (m_cancel->isCancelled()) {
        return;
    }
    m_cancel->cancel();
    Logger::getInstance().info("Session", "Cancellation requested", getId());
}

std::optional<AggregatedResult> OrchestrationSession::waitForCompletion(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_state_mutex);
    if (!m_completion_cv.wait_for(lock, timeout, [this] { return m_result.has_value() && isTerminal(m_state); })) {
        return std::nullopt;
    }
    return m_result;
}

bool OrchestrationSession::updateAgentState(const std::string& agent_id, AgentStatus status, double progress,
                                            const std::string& task, const std::string& error) {
    auto it = m_slots.find(agent_id);
    if (it == m_slots.end()) {
        Logger::getInstance().warning("Session", "Update for agent not in session: " + agent_id, getId());
        return false;
    }

    AgentStatusUpdateEvent event;
    bool status_changed = false;
    {
        AgentSlot& slot = *it->second;
        std::lock_guard<std::mutex> lock(slot.mutex);
        AgentRuntimeState& state = slot.state;

        status_changed = state.status != status;
        if (!applyAgentUpdate(state, status, progress, task, error)) {
            Logger::getInstance().debug("Session",
                "Rejected transition " + agentStatusToString(state.status) + " -> " +
                agentStatusToString(status) + " for " + agent_id, getId());
            return false;
        }

        event.header.session_id = getId();
        event.header.agent_name = agent_id;
        event.header.sequence = state.sequence;
        event.header.timestamp_ms = currentTimestampMs();
        event.status = state.status;
        event.progress = state.progress;
        event.current_task = state.current_task;
        event.error = state.error;
    }

    if (status_changed) {
        Logger::getInstance().logAgentTransition(getId(), agent_id, agentStatusToString(status), event.progress);
    }

    publish(event);
    return true;
}

SessionSnapshot OrchestrationSession::snapshot() const {
    SessionSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        snap.state = m_state;
        snap.escalation = m_escalation;
        snap.completed_at = m_completed_at;
        snap.result = m_result;
    }

    snap.session_id = getId();
    snap.query = m_query;
    snap.selected_agent_ids = m_agent_ids;
    snap.created_at = m_created_at;

    for (const auto& [agent_id, slot] : m_slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        snap.agent_states[agent_id] = slot->state;
    }

    return snap;
}

SessionState OrchestrationSession::getState() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_state;
}

bool OrchestrationSession::isFinished() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return isTerminal(m_state);
}

std::optional<std::chrono::system_clock::time_point> OrchestrationSession::getCompletedAt() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_completed_at;
}

AgentResult OrchestrationSession::runAgent(const std::string& agent_id) {
    auto start_time = std::chrono::steady_clock::now();

    AgentResult result;
    result.agent_id = agent_id;

    try {
        if (m_cancel->isCancelled()) {
            throw AgentTaskError(agent_id, "cancelled");
        }

        updateAgentState(agent_id, AgentStatus::ANALYZING, 10.0, "Analyzing query");
        updateAgentState(agent_id, AgentStatus::ANALYZING, 25.0, "Identifying relevant knowledge");
        updateAgentState(agent_id, AgentStatus::PROCESSING, 30.0, "Calling execution backend");

        ExecutionResult execution = m_backend->execute(agent_id, m_query, *m_cancel,
            [this, &agent_id](double fraction, const std::string& task) {
                double clamped = std::max(0.0, std::min(1.0, fraction));
                updateAgentState(agent_id, AgentStatus::PROCESSING, 30.0 + 50.0 * clamped, task);
            });

        if (m_cancel->isCancelled()) {
            throw AgentTaskError(agent_id, "cancelled");
        }

        updateAgentState(agent_id, AgentStatus::COLLABORATING, 85.0, "Sharing findings with other agents");
        updateAgentState(agent_id, AgentStatus::COMPLETING, 95.0, "Preparing response");
        updateAgentState(agent_id, AgentStatus::FINISHED, 100.0, "Completed");

        result.success = true;
        result.content = execution.content;
        result.confidence = execution.confidence;

    } catch (const AgentTaskError& e) {
        result.error_message = m_cancel->isCancelled() ? "cancelled" : e.reason();
    } catch (const std::exception& e) {
        result.error_message = m_cancel->isCancelled() ? "cancelled" : e.what();
    } catch (...) {
        result.error_message = "unknown backend failure";
    }

    if (!result.success) {
        updateAgentState(agent_id, AgentStatus::ERROR, 0.0, "Failed", result.error_message);
    }

    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    return result;
}

std::optional<std::string> OrchestrationSession::awaitHuman(const EscalationRecord& record) {
    if (!m_channel) {
        Logger::getInstance().warning("Session", "No escalation channel configured", getId());
        return std::nullopt;
    }

    try {
        return m_channel->escalate(record, *m_cancel, m_config.escalation_timeout);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Session", "Escalation channel failed: " + std::string(e.what()), getId());
        return std::nullopt;
    }
}

void OrchestrationSession::resolveEscalation(std::future<std::optional<std::string>>& pending) {
    std::optional<std::string> response = pending.valid() ? pending.get() : std::nullopt;

    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (!m_escalation) {
        return;
    }

    EscalationRecord& record = *m_escalation;
    record.status = EscalationStatus::RESOLVED;
    record.resolved_at = std::chrono::system_clock::now();

    if (response) {
        record.resolution = EscalationResolution::HUMAN_RESPONSE;
        record.human_response = *response;
        Logger::getInstance().info("Session", "Escalation answered by operator", getId());
    } else if (m_cancel->isCancelled()) {
        record.resolution = EscalationResolution::CANCELLED;
        Logger::getInstance().info("Session", "Escalation cancelled with session", getId());
    } else {
        record.resolution = EscalationResolution::TIMEOUT;
        record.human_response = m_config.timeout_response;
        Logger::getInstance().warning("Session", EscalationTimeoutError(getId()).what(),
            "Auto-resolved after " + std::to_string(m_config.escalation_timeout.count()) + "ms");
    }
}

AggregatedResult OrchestrationSession::aggregate(const std::vector<AgentResult>& results) const {
    AggregatedResult aggregated;
    aggregated.agent_results = results;

    std::ostringstream combined;
    double confidence_sum = 0.0;
    size_t succeeded = 0;

    for (const auto& result : results) {
        if (!result.success) {
            aggregated.failed_agent_ids.push_back(result.agent_id);
            continue;
        }
        if (succeeded > 0) combined << "\n\n";
        combined << "[" << result.agent_id << "] " << result.content;
        confidence_sum += result.confidence;
        succeeded++;
    }

    aggregated.average_confidence = succeeded > 0 ? confidence_sum / static_cast<double>(succeeded) : 0.0;

    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_escalation && m_escalation->resolution == EscalationResolution::HUMAN_RESPONSE) {
            AgentResult human;
            human.agent_id = m_config.human_agent_id;
            human.content = m_escalation->human_response;
            human.confidence = 1.0;
            human.success = true;
            aggregated.agent_results.push_back(human);
            aggregated.human_response = human.content;

            if (succeeded > 0) combined << "\n\n";
            combined << "[" << human.agent_id << "] " << human.content;
        }
    }

    aggregated.combined_content = combined.str();
    return aggregated;
}

void OrchestrationSession::transitionTo(SessionState state, double progress, const std::string& description) {
    PhaseUpdateEvent event;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_state = state;
        event.header = nextSessionHeader();
        event.state = state;
        event.progress = progress;
        event.description = description;
    }

    Logger::getInstance().debug("Session", "Phase " + sessionStateToString(state) + ": " + description, getId());
    publish(event);
}

void OrchestrationSession::finish(const AggregatedResult& result, SessionState final_state) {
    std::optional<SessionEvent> terminal_event;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_state = final_state;
        m_completed_at = std::chrono::system_clock::now();

        if (final_state == SessionState::COMPLETED) {
            SessionCompleteEvent complete;
            complete.header = nextSessionHeader();
            complete.final_state = final_state;
            complete.failed_agents = result.failed_agent_ids;
            complete.average_confidence = result.average_confidence;
            complete.human_response = result.human_response;

            std::ostringstream summary;
            summary << (m_agent_ids.size() - result.failed_agent_ids.size()) << " of "
                    << m_agent_ids.size() << " agent(s) completed";
            complete.summary = summary.str();
            terminal_event = complete;
        } else {
            SessionErrorEvent failure;
            failure.header = nextSessionHeader();
            failure.message = "All " + std::to_string(m_agent_ids.size()) + " agent(s) failed";
            failure.failed_agents = result.failed_agent_ids;
            terminal_event = failure;
        }
    }

    publish(*terminal_event);

    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_result = result;
    }
    m_completion_cv.notify_all();
}

EventHeader OrchestrationSession::nextSessionHeader() {
    // Caller holds m_state_mutex
    EventHeader header;
    header.session_id = getId();
    header.sequence = ++m_session_sequence;
    header.timestamp_ms = currentTimestampMs();
    return header;
}

void OrchestrationSession::publish(const SessionEvent& event) {
    if (!m_observer) {
        return;
    }
    try {
        m_observer->onSessionEvent(event);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Session", "Observer failed on " + eventTypeName(event) + ": " + e.what(), getId());
    }
}

} // namespace Switchboard
