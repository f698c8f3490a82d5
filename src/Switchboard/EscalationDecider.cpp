// =================================================================
// src/Switchboard/EscalationDecider.cpp
// =================================================================
// Implementation of the escalation rule.

#include "Switchboard/EscalationDecider.hpp"
#include <chrono>

namespace Switchboard {

EscalationDecider::EscalationDecider(const EscalationConfig& config)
    : m_config(config) {
}

EscalationDecision EscalationDecider::decide(const QueryAnalysis& analysis, size_t recommended_count) const {
    EscalationDecision decision;

    bool complex = analysis.complexity == Complexity::HIGH;
    bool negative = analysis.sentiment <= m_config.negative_sentiment_threshold;
    bool broad = recommended_count > m_config.broad_match_limit;

    if (complex) decision.reasons.push_back(EscalationReason::COMPLEX_ISSUE);
    if (negative) decision.reasons.push_back(EscalationReason::NEGATIVE_SENTIMENT);
    if (broad) decision.reasons.push_back(EscalationReason::BROAD_MATCH);

    decision.escalate = complex || negative || broad;

    if (complex && negative) {
        decision.priority = EscalationPriority::CRITICAL;
    } else if (complex || negative) {
        decision.priority = EscalationPriority::HIGH;
    } else if (broad) {
        decision.priority = EscalationPriority::MEDIUM;
    } else {
        decision.priority = EscalationPriority::LOW;
    }

    return decision;
}

EscalationRecord EscalationDecider::createRecord(const EscalationDecision& decision,
                                                 const Query& query,
                                                 const std::vector<std::string>& agent_ids) const {
    EscalationRecord record;
    record.session_id = query.session_id;
    record.query_text = query.text;
    record.agent_ids = agent_ids;
    record.reasons = decision.reasons;
    record.priority = decision.priority;
    record.triggered_at = std::chrono::system_clock::now();
    record.status = EscalationStatus::PENDING;
    return record;
}

} // namespace Switchboard
