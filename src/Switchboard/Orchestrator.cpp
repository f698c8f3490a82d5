// =================================================================
// src/Switchboard/Orchestrator.cpp
// =================================================================
// Implementation of the routing pipeline and session registry.

#include "Switchboard/Orchestrator.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Switchboard {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Orchestrator::Orchestrator(AgentIndex& index,
                           std::shared_ptr<ExecutionBackend> backend,
                           std::shared_ptr<HumanEscalationChannel> channel,
                           SessionObserver* observer,
                           const OrchestratorConfig& config,
                           std::shared_ptr<JitterSource> jitter)
    : m_index(index),
      m_backend(std::move(backend)),
      m_channel(std::move(channel)),
      m_observer(observer),
      m_config(config),
      m_scorer(std::move(jitter)),
      m_selector(config.selector),
      m_decider(config.escalation) {

    if (!m_backend) {
        throw SwitchboardError("Orchestrator requires an execution backend");
    }

    m_stats.last_reset = std::chrono::system_clock::now();

    Logger::getInstance().info("Orchestrator", "Initialized",
        "backend: " + m_backend->getName() + ", agents: " + std::to_string(m_index.size()));
}

Orchestrator::~Orchestrator() {
    std::map<std::string, std::shared_ptr<OrchestrationSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        sessions.swap(m_sessions);
    }

    for (const auto& [session_id, session] : sessions) {
        if (!session->isFinished()) {
            session->cancel();
        }
    }

    // Session destructors join their runners
    sessions.clear();
}

RoutingDecision Orchestrator::routeQuery(const std::string& text) const {
    auto start_time = std::chrono::steady_clock::now();

    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        throw InputError("query text is empty");
    }

    m_index.refreshIfStale();
    auto snapshot = m_index.snapshot();
    if (!snapshot || snapshot->empty()) {
        throw ConfigError("no agent profiles are loaded");
    }

    AgentSelector selector;
    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        selector = m_selector;
    }

    RoutingDecision decision;
    decision.query_text = trimmed;
    decision.analysis = m_analyzer.analyze(trimmed);
    decision.selection = selector.select(m_scorer.scoreAll(*snapshot, trimmed, decision.analysis));

    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        decision.escalation = m_decider.decide(decision.analysis, decision.selection.recommended.size());
    }

    decision.routing_time = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);

    Logger::getInstance().logRoutingDecision(decision);
    return decision;
}

std::string Orchestrator::submitQuery(const std::string& text,
                                      const std::unordered_map<std::string, std::string>& context) {
    purgeExpiredSessions();

    RoutingDecision decision;
    try {
        decision = routeQuery(text);
    } catch (const InputError&) {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.rejected_queries++;
        throw;
    }

    Query query;
    query.text = decision.query_text;
    query.session_id = generateSessionId();
    query.created_at = std::chrono::system_clock::now();
    query.context = context;

    std::vector<std::string> agent_ids = decision.selectedAgentIds();

    std::optional<EscalationRecord> escalation;
    SessionConfig session_config;
    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        if (decision.escalation.escalate) {
            escalation = m_decider.createRecord(decision.escalation, query, agent_ids);
        }
        session_config = m_config.session;
    }

    auto session = std::make_shared<OrchestrationSession>(
        query, agent_ids, escalation, m_backend, m_channel, this, session_config);

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.total_queries++;
        if (decision.selection.fallback_used) m_stats.fallback_selections++;
        if (decision.escalation.escalate) m_stats.escalated_sessions++;
        for (const auto& agent_id : agent_ids) {
            m_stats.agent_usage[agent_id]++;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        m_sessions[query.session_id] = session;
    }

    session->start();

    std::ostringstream agents;
    for (size_t i = 0; i < agent_ids.size(); ++i) {
        if (i > 0) agents << ", ";
        agents << agent_ids[i];
    }
    Logger::getInstance().info("Orchestrator", "Submitted session " + query.session_id,
        "agents: " + agents.str() + (escalation ? ", escalated" : ""));

    return query.session_id;
}

bool Orchestrator::endSession(const std::string& session_id) {
    auto session = findSession(session_id);
    if (!session) {
        Logger::getInstance().warning("Orchestrator", "End requested for unknown session", session_id);
        return false;
    }

    if (!session->isFinished()) {
        session->cancel();
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.cancelled_sessions++;
    }

    Logger::getInstance().info("Orchestrator", "Session ended by caller", session_id);
    return true;
}

std::optional<AggregatedResult> Orchestrator::waitForResult(const std::string& session_id,
                                                            std::chrono::milliseconds timeout) {
    auto session = findSession(session_id);
    if (!session) {
        return std::nullopt;
    }
    return session->waitForCompletion(timeout);
}

std::optional<SessionSnapshot> Orchestrator::getSessionSnapshot(const std::string& session_id) const {
    auto session = findSession(session_id);
    if (!session) {
        return std::nullopt;
    }
    return session->snapshot();
}

std::vector<std::string> Orchestrator::getActiveSessions() const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);

    std::vector<std::string> active;
    for (const auto& [session_id, session] : m_sessions) {
        if (!session->isFinished()) {
            active.push_back(session_id);
        }
    }
    return active;
}

OrchestratorStatistics Orchestrator::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

void Orchestrator::resetStatistics() {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_stats = OrchestratorStatistics{};
    m_stats.last_reset = std::chrono::system_clock::now();
    m_total_session_time = 0.0;
}

size_t Orchestrator::purgeExpiredSessions(std::chrono::system_clock::time_point now) {
    auto retention = getConfig().session_retention;

    std::vector<std::shared_ptr<OrchestrationSession>> expired;
    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            auto completed_at = it->second->getCompletedAt();
            if (it->second->isFinished() && completed_at && *completed_at + retention <= now) {
                expired.push_back(it->second);
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
        callback = m_purged_callback;
    }

    for (const auto& session : expired) {
        Logger::getInstance().debug("Orchestrator", "Purged finished session", session->getId());
        if (callback) {
            callback(session->getId());
        }
    }

    return expired.size();
}

void Orchestrator::setSessionPurgedCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    m_purged_callback = std::move(callback);
}

void Orchestrator::onSessionEvent(const SessionEvent& event) {
    std::visit(overloaded{
        [this](const SessionStartedEvent& e) {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_session_started_ms[e.header.session_id] = e.header.timestamp_ms;
        },
        [this](const AgentStatusUpdateEvent& e) {
            if (e.status == AgentStatus::ERROR) {
                std::lock_guard<std::mutex> lock(m_stats_mutex);
                m_stats.agent_failures[e.header.agent_name]++;
            }
        },
        [](const PhaseUpdateEvent&) {},
        [this](const SessionCompleteEvent& e) {
            recordSessionEnd(e.header, true, e.failed_agents);
        },
        [this](const SessionErrorEvent& e) {
            recordSessionEnd(e.header, false, e.failed_agents);
        }
    }, event);

    if (m_observer) {
        m_observer->onSessionEvent(event);
    }
}

std::string Orchestrator::getStatusReport() const {
    OrchestratorStatistics stats = getStatistics();
    std::vector<std::string> active = getActiveSessions();

    std::ostringstream report;
    report << "Switchboard Status Report\n";
    report << "=========================\n\n";

    report << "Sessions:\n";
    report << "  Submitted: " << stats.total_queries << "\n";
    report << "  Active: " << active.size() << "\n";
    report << "  Completed: " << stats.completed_sessions << "\n";
    report << "  Failed: " << stats.failed_sessions << "\n";
    report << "  Cancelled: " << stats.cancelled_sessions << "\n";
    report << "  Escalated: " << stats.escalated_sessions << "\n";
    report << "  Rejected Queries: " << stats.rejected_queries << "\n";
    report << "  Average Session Time: " << std::fixed << std::setprecision(0)
           << stats.average_session_time << "ms\n";
    report << "  Fallback Selections: " << stats.fallback_selections << "\n\n";

    report << "Agent Usage:\n";
    for (const auto& [agent_id, count] : stats.agent_usage) {
        size_t failures = stats.agent_failures.count(agent_id) ? stats.agent_failures.at(agent_id) : 0;
        report << "  " << agent_id << ": " << count << " dispatches, " << failures << " failures\n";
    }

    return report.str();
}

OrchestratorConfig Orchestrator::getConfig() const {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    return m_config;
}

void Orchestrator::setConfig(const OrchestratorConfig& config) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_config = config;
    m_selector.setConfig(config.selector);
    m_decider = EscalationDecider(config.escalation);
}

std::string Orchestrator::generateSessionId() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream oss;
    oss << "session_" << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");

    // Add milliseconds and a counter for uniqueness
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    oss << "_" << std::setfill('0') << std::setw(3) << ms.count();
    oss << "_" << ++m_session_counter;

    return oss.str();
}

std::string Orchestrator::trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::shared_ptr<OrchestrationSession> Orchestrator::findSession(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    auto it = m_sessions.find(session_id);
    return it == m_sessions.end() ? nullptr : it->second;
}

void Orchestrator::recordSessionEnd(const EventHeader& header, bool completed,
                                    const std::vector<std::string>& failed_agents) {
    std::lock_guard<std::mutex> lock(m_stats_mutex);

    if (completed) {
        m_stats.completed_sessions++;
    } else {
        m_stats.failed_sessions++;
    }

    auto started = m_session_started_ms.find(header.session_id);
    if (started != m_session_started_ms.end()) {
        m_total_session_time += static_cast<double>(header.timestamp_ms - started->second);
        m_session_started_ms.erase(started);
    }

    size_t finished = m_stats.completed_sessions + m_stats.failed_sessions;
    m_stats.average_session_time = m_total_session_time / static_cast<double>(finished);

    if (!failed_agents.empty()) {
        Logger::getInstance().debug("Orchestrator",
            std::to_string(failed_agents.size()) + " agent(s) failed", header.session_id);
    }
}

} // namespace Switchboard
