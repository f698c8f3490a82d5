// =================================================================
// include/Switchboard/AgentScorer.hpp
// =================================================================
// Relevance scoring of agent profiles against a query.

#pragma once

#include "Switchboard/AgentIndex.hpp"
#include "Switchboard/QueryAnalyzer.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <random>

namespace Switchboard {

/**
 * @brief Source of the display-only confidence jitter
 */
class JitterSource {
public:
    virtual ~JitterSource() = default;

    /**
     * @brief Next jitter value
     */
    virtual double next() = 0;
};

/**
 * @brief Uniform jitter in [0, max)
 */
class UniformJitterSource : public JitterSource {
public:
    explicit UniformJitterSource(double max_jitter = 10.0);
    UniformJitterSource(double max_jitter, unsigned int seed);

    double next() override;

private:
    std::mutex m_mutex;
    std::mt19937 m_engine;
    std::uniform_real_distribution<double> m_distribution;
};

/**
 * @brief Constant jitter, for deterministic output
 */
class FixedJitterSource : public JitterSource {
public:
    explicit FixedJitterSource(double value = 0.0) : m_value(value) {}

    double next() override { return m_value; }

private:
    double m_value;
};

/**
 * @brief Score of one agent against one query
 */
struct AgentScore {
    std::string agent_id;                          ///< Scored agent
    std::string agent_name;                        ///< Display name
    std::string category;                          ///< Agent category
    double score = 0.0;                            ///< Relevance in [0,100]
    double confidence = 0.0;                       ///< Displayed confidence, includes jitter
    std::vector<std::string> matched_keywords;     ///< Profile keywords found in the query
    std::vector<std::string> matched_expertise;    ///< Expertise entries whose lead word matched
    double category_boost = 0.0;                   ///< Category cue contribution
    double complexity_bonus = 0.0;                 ///< High-complexity contribution
    double confidence_threshold = 0.0;             ///< Agent's trigger threshold
    double historical_success_rate = 0.0;          ///< Agent's success rate

    /**
     * @brief Whether the score clears the agent's trigger threshold
     */
    bool wouldTrigger() const { return score > confidence_threshold * 100.0; }
};

/**
 * @brief Weights of the scoring formula
 */
struct ScorerWeights {
    double keyword_weight = 15.0;          ///< Per matched keyword
    double category_boost = 10.0;          ///< When a category cue is present
    double expertise_weight = 8.0;         ///< Per matched expertise entry
    double success_rate_baseline = 80.0;   ///< Success rate that contributes nothing
    double success_rate_divisor = 4.0;     ///< (rate - baseline) / divisor
    double complexity_bonus = 5.0;         ///< High complexity on a demanding agent
    double complexity_bonus_threshold = 0.7; ///< Threshold above which the bonus applies
    double max_confidence = 95.0;          ///< Cap on displayed confidence
};

/**
 * @brief Computes a 0-100 relevance score and display confidence per agent
 *
 * score = 15*keywords + categoryBoost + 8*expertise + (successRate-80)/4 + complexityBonus,
 * clamped to [0,100]. Jitter feeds the displayed confidence only and never the
 * score, so ranking and triggering stay deterministic.
 */
class AgentScorer {
public:
    /**
     * @brief Constructor
     * @param jitter Jitter source, UniformJitterSource when null
     * @param weights Formula weights
     */
    explicit AgentScorer(std::shared_ptr<JitterSource> jitter = nullptr,
                         const ScorerWeights& weights = ScorerWeights());

    /**
     * @brief Score one profile
     * @param profile Agent profile
     * @param query_text Raw query text
     * @param analysis Analysis of the same text
     * @param category_cues Domain cues per category
     * @return Agent score
     */
    AgentScore scoreAgent(const AgentProfile& profile,
                          const std::string& query_text,
                          const QueryAnalysis& analysis,
                          const CategoryCueMap& category_cues) const;

    /**
     * @brief Score every profile of an index snapshot, in snapshot order
     */
    std::vector<AgentScore> scoreAll(const IndexSnapshot& snapshot,
                                     const std::string& query_text,
                                     const QueryAnalysis& analysis) const;

    void setJitterSource(std::shared_ptr<JitterSource> jitter);
    const ScorerWeights& getWeights() const { return m_weights; }

    static double clampScore(double score);

private:
    std::shared_ptr<JitterSource> m_jitter;
    ScorerWeights m_weights;
};

} // namespace Switchboard
