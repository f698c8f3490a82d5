// =================================================================
// include/Switchboard/SimulatedExecutionBackend.hpp
// =================================================================
// In-process execution backend with canned answers, for demos and tests.

#pragma once

#include "Switchboard/ExecutionBackend.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <chrono>
#include <mutex>
#include <atomic>

namespace Switchboard {

/**
 * @brief Simulation settings
 */
struct SimulationConfig {
    std::chrono::milliseconds latency{400};     ///< Total simulated work per agent
    size_t steps = 4;                           ///< Progress reports per call
    double default_confidence = 0.85;           ///< Confidence of canned answers
    std::unordered_set<std::string> failing_agents; ///< Agents that always fail
    std::string failure_message = "simulated backend failure";
};

/**
 * @brief Produces canned results after a configurable delay
 *
 * Sleeps in steps on the cancellation token so cancelled sessions settle
 * promptly.
 */
class SimulatedExecutionBackend : public ExecutionBackend {
public:
    explicit SimulatedExecutionBackend(const SimulationConfig& config = SimulationConfig());

    ExecutionResult execute(const std::string& agent_id,
                            const Query& query,
                            const CancellationToken& cancel,
                            const ProgressCallback& on_progress) override;

    std::string getName() const override { return "simulated"; }

    /**
     * @brief Fix the answer returned for an agent
     */
    void setResponse(const std::string& agent_id, const std::string& content, double confidence);

    /**
     * @brief Make an agent fail (or succeed again)
     */
    void setFailing(const std::string& agent_id, bool failing);

    void setLatency(std::chrono::milliseconds latency);

    /**
     * @brief Number of execute() calls so far
     */
    size_t getCallCount() const { return m_call_count.load(); }

private:
    SimulationConfig m_config;
    std::unordered_map<std::string, ExecutionResult> m_responses;
    mutable std::mutex m_mutex;
    std::atomic<size_t> m_call_count{0};
};

} // namespace Switchboard
