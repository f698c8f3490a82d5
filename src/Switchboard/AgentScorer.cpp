// =================================================================
// src/Switchboard/AgentScorer.cpp
// =================================================================
// Implementation of agent relevance scoring.

#include "Switchboard/AgentScorer.hpp"
#include <algorithm>
#include <sstream>

namespace Switchboard {

UniformJitterSource::UniformJitterSource(double max_jitter)
    : m_engine(std::random_device{}()), m_distribution(0.0, max_jitter) {
}

UniformJitterSource::UniformJitterSource(double max_jitter, unsigned int seed)
    : m_engine(seed), m_distribution(0.0, max_jitter) {
}

double UniformJitterSource::next() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_distribution(m_engine);
}

AgentScorer::AgentScorer(std::shared_ptr<JitterSource> jitter, const ScorerWeights& weights)
    : m_jitter(jitter ? std::move(jitter) : std::make_shared<UniformJitterSource>()),
      m_weights(weights) {
}

AgentScore AgentScorer::scoreAgent(const AgentProfile& profile,
                                   const std::string& query_text,
                                   const QueryAnalysis& analysis,
                                   const CategoryCueMap& category_cues) const {
    AgentScore result;
    result.agent_id = profile.id;
    result.agent_name = profile.name;
    result.category = profile.category;
    result.confidence_threshold = profile.confidence_threshold;
    result.historical_success_rate = profile.historical_success_rate;

    std::string query_lower = QueryAnalyzer::toLower(query_text);
    double score = 0.0;

    for (const auto& keyword : profile.keywords) {
        if (!keyword.empty() && query_lower.find(keyword) != std::string::npos) {
            result.matched_keywords.push_back(keyword);
        }
    }
    score += m_weights.keyword_weight * static_cast<double>(result.matched_keywords.size());

    auto cues = category_cues.find(profile.category);
    if (cues != category_cues.end()) {
        bool cue_present = std::any_of(cues->second.begin(), cues->second.end(),
            [&query_lower](const std::string& cue) {
                return !cue.empty() && query_lower.find(cue) != std::string::npos;
            });
        if (cue_present) {
            result.category_boost = m_weights.category_boost;
        }
    }
    score += result.category_boost;

    // Expertise entries match on their leading word
    for (const auto& skill : profile.expertise) {
        std::istringstream iss(QueryAnalyzer::toLower(skill));
        std::string lead_word;
        if (iss >> lead_word && query_lower.find(lead_word) != std::string::npos) {
            result.matched_expertise.push_back(skill);
        }
    }
    score += m_weights.expertise_weight * static_cast<double>(result.matched_expertise.size());

    score += (profile.historical_success_rate - m_weights.success_rate_baseline) /
             m_weights.success_rate_divisor;

    if (analysis.complexity == Complexity::HIGH &&
        profile.confidence_threshold > m_weights.complexity_bonus_threshold) {
        result.complexity_bonus = m_weights.complexity_bonus;
    }
    score += result.complexity_bonus;

    result.score = clampScore(score);
    result.confidence = std::min(m_weights.max_confidence, result.score + m_jitter->next());

    return result;
}

std::vector<AgentScore> AgentScorer::scoreAll(const IndexSnapshot& snapshot,
                                              const std::string& query_text,
                                              const QueryAnalysis& analysis) const {
    std::vector<AgentScore> scores;
    scores.reserve(snapshot.profiles.size());

    for (const auto& profile : snapshot.profiles) {
        scores.push_back(scoreAgent(profile, query_text, analysis, snapshot.category_cues));
    }

    return scores;
}

void AgentScorer::setJitterSource(std::shared_ptr<JitterSource> jitter) {
    if (jitter) {
        m_jitter = std::move(jitter);
    }
}

double AgentScorer::clampScore(double score) {
    return std::max(0.0, std::min(100.0, score));
}

} // namespace Switchboard
