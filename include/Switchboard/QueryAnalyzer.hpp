// =================================================================
// include/Switchboard/QueryAnalyzer.hpp
// =================================================================
// Header for query analysis: keywords, complexity and sentiment.

#pragma once

#include <string>
#include <vector>
#include <unordered_set>

namespace Switchboard {

/**
 * @brief Complexity bucket derived from the query text
 */
enum class Complexity {
    LOW,        ///< score <= 4
    MEDIUM,     ///< 4 < score <= 8
    HIGH        ///< score > 8
};

/**
 * @brief Result of analyzing one query
 */
struct QueryAnalysis {
    std::vector<std::string> keywords;    ///< At most 8 keywords in first-seen order
    Complexity complexity = Complexity::LOW; ///< Complexity bucket
    double complexity_score = 0.0;        ///< Raw complexity score
    int sentiment = 0;                    ///< Positive minus negative lexicon hits
    size_t word_count = 0;                ///< Whitespace-separated words
    size_t question_marks = 0;            ///< Number of '?' characters
    size_t technical_term_hits = 0;       ///< Technical terms found in the text
};

/**
 * @brief Word lists driving the analysis
 */
struct AnalyzerRules {
    std::unordered_set<std::string> stop_words;
    std::vector<std::string> technical_terms;
    std::unordered_set<std::string> positive_words;
    std::unordered_set<std::string> negative_words;
    size_t max_keywords = 8;
    size_t min_keyword_length = 3;

    /**
     * @brief Built-in rule set
     */
    static AnalyzerRules defaults();
};

/**
 * @brief Derives keywords, complexity bucket and sentiment polarity from raw text
 *
 * Pure and synchronous. One instance can be shared between threads as long as
 * the rules are not replaced concurrently.
 */
class QueryAnalyzer {
public:
    explicit QueryAnalyzer(const AnalyzerRules& rules = AnalyzerRules::defaults());

    /**
     * @brief Run every analysis step on a query
     * @param text Raw query text
     * @return Combined analysis
     */
    QueryAnalysis analyze(const std::string& text) const;

    /**
     * @brief Extract up to max_keywords distinct keywords in first-seen order
     * @param text Raw query text
     * @return Lower-cased keywords without stop words or short tokens
     */
    std::vector<std::string> extractKeywords(const std::string& text) const;

    /**
     * @brief Bucket the query complexity
     * @param text Raw query text
     * @return Complexity bucket
     */
    Complexity assessComplexity(const std::string& text) const;

    /**
     * @brief Raw complexity score: words/10 + questionMarks*2 + technicalHits*1.5
     * @param text Raw query text
     * @return Unbucketed score
     */
    double computeComplexityScore(const std::string& text) const;

    /**
     * @brief Signed sentiment: positive token hits minus negative token hits
     * @param text Raw query text
     * @return Sentiment polarity
     */
    int assessSentiment(const std::string& text) const;

    /**
     * @brief Replace the analysis rules
     * @param rules New rule set
     */
    void updateRules(const AnalyzerRules& rules);

    const AnalyzerRules& getRules() const { return m_rules; }

    /**
     * @brief Load rule overrides from a YAML file
     *
     * Recognized keys: stop_words, technical_terms, positive_words,
     * negative_words, max_keywords. Missing keys keep their current value.
     *
     * @param rules_path Path to YAML rules file
     * @return True if loaded successfully
     */
    bool loadRulesFromFile(const std::string& rules_path);

    /**
     * @brief Lower-case a string (ASCII)
     */
    static std::string toLower(const std::string& text);

    /**
     * @brief Split lower-cased text on anything that is not [a-z0-9_]
     * @param text Raw text
     * @return Tokens in order, including duplicates
     */
    static std::vector<std::string> tokenize(const std::string& text);

private:
    AnalyzerRules m_rules;

    size_t countWords(const std::string& text) const;
    size_t countTechnicalTerms(const std::string& lower_text) const;
};

/**
 * @brief Convert Complexity to its lower-case wire name ("low", "medium", "high")
 */
std::string complexityToString(Complexity complexity);

/**
 * @brief Parse a complexity name, LOW if unrecognized
 */
Complexity stringToComplexity(const std::string& str);

} // namespace Switchboard
