// =================================================================
// include/Switchboard/EscalationDecider.hpp
// =================================================================
// Decides whether a query needs a human in the loop.

#pragma once

#include "Switchboard/QueryAnalyzer.hpp"
#include "Switchboard/SessionTypes.hpp"
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Thresholds for escalation
 */
struct EscalationConfig {
    int negative_sentiment_threshold = -1;  ///< Escalate when sentiment <= this
    size_t broad_match_limit = 2;           ///< Escalate when more agents than this are recommended
};

/**
 * @brief Escalation verdict for one query
 */
struct EscalationDecision {
    bool escalate = false;
    std::vector<EscalationReason> reasons;
    EscalationPriority priority = EscalationPriority::LOW;
};

/**
 * @brief Applies escalate = high complexity OR sentiment <= -1 OR more than two recommended agents
 */
class EscalationDecider {
public:
    explicit EscalationDecider(const EscalationConfig& config = EscalationConfig());

    /**
     * @brief Decide whether to escalate
     * @param analysis Query analysis
     * @param recommended_count Number of recommended agents
     * @return Decision with reasons and priority
     */
    EscalationDecision decide(const QueryAnalysis& analysis, size_t recommended_count) const;

    /**
     * @brief Build the PENDING record attached to a session
     * @param decision Positive escalation decision
     * @param query Escalated query
     * @param agent_ids Agents dispatched for the query
     * @return Pending escalation record
     */
    EscalationRecord createRecord(const EscalationDecision& decision,
                                  const Query& query,
                                  const std::vector<std::string>& agent_ids) const;

    const EscalationConfig& getConfig() const { return m_config; }

private:
    EscalationConfig m_config;
};

} // namespace Switchboard
