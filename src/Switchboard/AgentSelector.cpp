// =================================================================
// src/Switchboard/AgentSelector.cpp
// =================================================================
// Implementation of agent ranking and selection.

#include "Switchboard/AgentSelector.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace Switchboard {

std::vector<std::string> AgentSelection::selectedAgentIds() const {
    std::vector<std::string> ids;
    ids.reserve(recommended.size());
    for (const auto& score : recommended) {
        ids.push_back(score.agent_id);
    }
    return ids;
}

AgentSelector::AgentSelector(const SelectorConfig& config)
    : m_config(config) {
}

AgentSelection AgentSelector::select(std::vector<AgentScore> scores) const {
    if (scores.empty()) {
        throw ConfigError("agent index is empty, nothing to select");
    }

    AgentSelection selection;
    rankScores(scores);
    selection.ranked = std::move(scores);

    for (const auto& score : selection.ranked) {
        if (selection.recommended.size() >= m_config.max_recommended) {
            break;
        }
        if (score.wouldTrigger() && score.score > m_config.min_recommended_score) {
            selection.recommended.push_back(score);
        }
    }

    std::ostringstream reason;
    if (!selection.recommended.empty()) {
        reason << selection.recommended.size() << " agent(s) above threshold";
    } else {
        const AgentScore& fallback = chooseFallback(selection.ranked);
        selection.recommended.push_back(fallback);
        selection.fallback_used = true;
        reason << "No agent above threshold, falling back to " << fallback.agent_id
               << " (score " << std::fixed << std::setprecision(1) << fallback.score << ")";
    }
    selection.selection_reason = reason.str();

    return selection;
}

void AgentSelector::rankScores(std::vector<AgentScore>& scores) {
    std::sort(scores.begin(), scores.end(), [](const AgentScore& a, const AgentScore& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.historical_success_rate != b.historical_success_rate) {
            return a.historical_success_rate > b.historical_success_rate;
        }
        return a.agent_id < b.agent_id;
    });
}

void AgentSelector::setConfig(const SelectorConfig& config) {
    m_config = config;
}

const AgentScore& AgentSelector::chooseFallback(const std::vector<AgentScore>& ranked) const {
    const AgentScore& top = ranked.front();
    if (top.score > 0.0) {
        return top;
    }

    auto it = std::find_if(ranked.begin(), ranked.end(), [this](const AgentScore& score) {
        return score.agent_id == m_config.default_agent_id;
    });
    if (it != ranked.end()) {
        return *it;
    }

    Logger::getInstance().debug("AgentSelector",
        "Default agent not indexed, using top-ranked agent", m_config.default_agent_id);
    return top;
}

} // namespace Switchboard
