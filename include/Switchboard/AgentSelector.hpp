// =================================================================
// include/Switchboard/AgentSelector.hpp
// =================================================================
// Ranks scored agents and picks the set to dispatch.

#pragma once

#include "Switchboard/AgentScorer.hpp"
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Configuration for AgentSelector
 */
struct SelectorConfig {
    size_t max_recommended = 3;                      ///< Cap on recommended agents
    double min_recommended_score = 30.0;             ///< Score a recommended agent must exceed
    std::string default_agent_id = "general_support"; ///< Fallback when every score is 0
};

/**
 * @brief Outcome of agent selection
 */
struct AgentSelection {
    std::vector<AgentScore> ranked;        ///< Every score, best first
    std::vector<AgentScore> recommended;   ///< Agents to dispatch, never empty
    bool fallback_used = false;            ///< True when no agent qualified on its own
    std::string selection_reason;          ///< Human-readable reason

    /**
     * @brief Ids of the recommended agents, in rank order
     */
    std::vector<std::string> selectedAgentIds() const;
};

/**
 * @brief Picks the agents to dispatch from a set of scores
 *
 * Ranking is by score descending, then historical success rate descending,
 * then agent id ascending. Agents that would trigger and score above the
 * minimum are recommended, up to the cap. When none qualify exactly one
 * fallback agent is chosen, so the selection is never empty.
 */
class AgentSelector {
public:
    explicit AgentSelector(const SelectorConfig& config = SelectorConfig());

    /**
     * @brief Rank scores and choose the agents to dispatch
     * @param scores One score per indexed agent
     * @return Selection with a non-empty recommended list
     * @throws ConfigError if scores is empty
     */
    AgentSelection select(std::vector<AgentScore> scores) const;

    /**
     * @brief Sort scores into deterministic rank order
     * @param scores Scores to sort in place
     */
    static void rankScores(std::vector<AgentScore>& scores);

    void setConfig(const SelectorConfig& config);
    const SelectorConfig& getConfig() const { return m_config; }

private:
    SelectorConfig m_config;

    const AgentScore& chooseFallback(const std::vector<AgentScore>& ranked) const;
};

} // namespace Switchboard
