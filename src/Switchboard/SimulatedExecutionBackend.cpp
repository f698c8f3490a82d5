// =================================================================
// src/Switchboard/SimulatedExecutionBackend.cpp
// =================================================================
// Implementation of the simulated execution backend.

#include "Switchboard/SimulatedExecutionBackend.hpp"
#include "Switchboard/Errors.hpp"
#include <algorithm>

namespace Switchboard {

SimulatedExecutionBackend::SimulatedExecutionBackend(const SimulationConfig& config)
    : m_config(config) {
    if (m_config.steps == 0) {
        m_config.steps = 1;
    }
}

ExecutionResult SimulatedExecutionBackend::execute(const std::string& agent_id,
                                                   const Query& query,
                                                   const CancellationToken& cancel,
                                                   const ProgressCallback& on_progress) {
    m_call_count++;

    SimulationConfig config;
    ExecutionResult result;
    bool has_response = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        config = m_config;
        auto it = m_responses.find(agent_id);
        if (it != m_responses.end()) {
            result = it->second;
            has_response = true;
        }
    }

    auto step_delay = config.latency / static_cast<long>(config.steps);

    for (size_t step = 1; step <= config.steps; ++step) {
        if (cancel.waitFor(step_delay)) {
            throw AgentTaskError(agent_id, "cancelled");
        }
        if (on_progress) {
            on_progress(static_cast<double>(step) / static_cast<double>(config.steps),
                        "Working on step " + std::to_string(step) + "/" + std::to_string(config.steps));
        }
    }

    if (config.failing_agents.count(agent_id) > 0) {
        throw AgentTaskError(agent_id, config.failure_message);
    }

    if (!has_response) {
        result.content = "Agent " + agent_id + " reviewed: " + query.text;
        result.confidence = config.default_confidence;
    }

    return result;
}

void SimulatedExecutionBackend::setResponse(const std::string& agent_id, const std::string& content, double confidence) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_responses[agent_id] = ExecutionResult{content, std::max(0.0, std::min(1.0, confidence))};
}

void SimulatedExecutionBackend::setFailing(const std::string& agent_id, bool failing) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (failing) {
        m_config.failing_agents.insert(agent_id);
    } else {
        m_config.failing_agents.erase(agent_id);
    }
}

void SimulatedExecutionBackend::setLatency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.latency = latency;
}

} // namespace Switchboard
