// =================================================================
// src/Switchboard/QueryAnalyzer.cpp
// =================================================================
// Implementation for query analysis.

#include "Switchboard/QueryAnalyzer.hpp"
#include "Switchboard/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <sstream>
#include <cctype>

namespace Switchboard {

AnalyzerRules AnalyzerRules::defaults() {
    AnalyzerRules rules;

    rules.stop_words = {
        "the", "is", "at", "which", "on", "and", "a", "an", "are", "how",
        "what", "when", "where", "why", "for", "but", "not", "you", "all",
        "can", "was", "our", "out", "has", "have", "its", "may", "who",
        "with", "this", "that", "from", "they", "there", "been", "will",
        "would", "could", "should", "into", "about", "your", "just"
    };

    rules.technical_terms = {
        "api", "webhook", "ssl", "database", "authentication", "integration"
    };

    rules.positive_words = {
        "good", "great", "excellent", "perfect", "successful", "thanks",
        "thank", "love", "happy", "awesome", "appreciate"
    };

    // Customer-frustration vocabulary. Technical symptom words such as
    // "failing" or "error" describe the problem, not the customer's mood.
    rules.negative_words = {
        "broken", "wrong", "bad", "terrible", "awful", "horrible", "angry",
        "frustrated", "frustrating", "unacceptable", "worst", "useless",
        "hate", "disappointed", "ridiculous", "furious"
    };

    return rules;
}

QueryAnalyzer::QueryAnalyzer(const AnalyzerRules& rules)
    : m_rules(rules) {
}

QueryAnalysis QueryAnalyzer::analyze(const std::string& text) const {
    QueryAnalysis analysis;

    if (text.empty()) {
        return analysis;
    }

    std::string lower_text = toLower(text);

    analysis.keywords = extractKeywords(text);
    analysis.word_count = countWords(text);
    analysis.question_marks = static_cast<size_t>(std::count(text.begin(), text.end(), '?'));
    analysis.technical_term_hits = countTechnicalTerms(lower_text);
    analysis.complexity_score = computeComplexityScore(text);
    analysis.complexity = assessComplexity(text);
    analysis.sentiment = assessSentiment(text);

    return analysis;
}

std::vector<std::string> QueryAnalyzer::extractKeywords(const std::string& text) const {
    std::vector<std::string> keywords;
    std::unordered_set<std::string> seen;

    for (const auto& token : tokenize(text)) {
        if (keywords.size() >= m_rules.max_keywords) {
            break;
        }
        if (token.length() < m_rules.min_keyword_length) {
            continue;
        }
        if (m_rules.stop_words.count(token) > 0) {
            continue;
        }
        if (seen.insert(token).second) {
            keywords.push_back(token);
        }
    }

    return keywords;
}

Complexity QueryAnalyzer::assessComplexity(const std::string& text) const {
    double score = computeComplexityScore(text);

    if (score > 8.0) return Complexity::HIGH;
    if (score > 4.0) return Complexity::MEDIUM;
    return Complexity::LOW;
}

double QueryAnalyzer::computeComplexityScore(const std::string& text) const {
    double word_count = static_cast<double>(countWords(text));
    double question_count = static_cast<double>(std::count(text.begin(), text.end(), '?'));
    double technical_count = static_cast<double>(countTechnicalTerms(toLower(text)));

    return (word_count / 10.0) + (question_count * 2.0) + (technical_count * 1.5);
}

int QueryAnalyzer::assessSentiment(const std::string& text) const {
    int positive = 0;
    int negative = 0;

    for (const auto& token : tokenize(text)) {
        if (m_rules.positive_words.count(token) > 0) {
            positive++;
        } else if (m_rules.negative_words.count(token) > 0) {
            negative++;
        }
    }

    return positive - negative;
}

void QueryAnalyzer::updateRules(const AnalyzerRules& rules) {
    m_rules = rules;
}

bool QueryAnalyzer::loadRulesFromFile(const std::string& rules_path) {
    try {
        YAML::Node root = YAML::LoadFile(rules_path);
        AnalyzerRules rules = m_rules;

        auto load_set = [](const YAML::Node& node, std::unordered_set<std::string>& target) {
            target.clear();
            for (const auto& item : node) {
                target.insert(toLower(item.as<std::string>()));
            }
        };

        if (root["stop_words"]) {
            load_set(root["stop_words"], rules.stop_words);
        }
        if (root["positive_words"]) {
            load_set(root["positive_words"], rules.positive_words);
        }
        if (root["negative_words"]) {
            load_set(root["negative_words"], rules.negative_words);
        }
        if (root["technical_terms"]) {
            rules.technical_terms.clear();
            for (const auto& item : root["technical_terms"]) {
                rules.technical_terms.push_back(toLower(item.as<std::string>()));
            }
        }
        if (root["max_keywords"]) {
            rules.max_keywords = root["max_keywords"].as<size_t>();
        }

        m_rules = rules;
        Logger::getInstance().info("QueryAnalyzer", "Loaded analysis rules", rules_path);
        return true;

    } catch (const std::exception& e) {
        Logger::getInstance().error("QueryAnalyzer",
            "Failed to load analysis rules: " + std::string(e.what()), rules_path);
        return false;
    }
}

std::string QueryAnalyzer::toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::vector<std::string> QueryAnalyzer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '_') {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

size_t QueryAnalyzer::countWords(const std::string& text) const {
    std::istringstream iss(text);
    std::string word;
    size_t count = 0;
    while (iss >> word) {
        count++;
    }
    return count;
}

size_t QueryAnalyzer::countTechnicalTerms(const std::string& lower_text) const {
    return static_cast<size_t>(std::count_if(m_rules.technical_terms.begin(), m_rules.technical_terms.end(),
        [&lower_text](const std::string& term) {
            return lower_text.find(term) != std::string::npos;
        }));
}

std::string complexityToString(Complexity complexity) {
    switch (complexity) {
        case Complexity::HIGH:
            return "high";
        case Complexity::MEDIUM:
            return "medium";
        case Complexity::LOW:
        default:
            return "low";
    }
}

Complexity stringToComplexity(const std::string& str) {
    std::string normalized = QueryAnalyzer::toLower(str);
    if (normalized == "high") return Complexity::HIGH;
    if (normalized == "medium") return Complexity::MEDIUM;
    return Complexity::LOW;
}

} // namespace Switchboard
