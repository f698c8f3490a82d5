// =================================================================
// tests/AgentSelectorTest.cpp
// =================================================================
// Unit tests for AgentSelector and EscalationDecider.

#include "Switchboard/AgentSelector.hpp"
#include "Switchboard/EscalationDecider.hpp"
#include "Switchboard/Errors.hpp"
#include <iostream>
#include <cassert>

class AgentSelectorTest {
private:
    static Switchboard::AgentScore makeScore(const std::string& id, double score,
                                             double threshold, double success_rate = 80.0) {
        Switchboard::AgentScore result;
        result.agent_id = id;
        result.agent_name = id;
        result.score = score;
        result.confidence = score;
        result.confidence_threshold = threshold;
        result.historical_success_rate = success_rate;
        return result;
    }

    static Switchboard::QueryAnalysis makeAnalysis(Switchboard::Complexity complexity, int sentiment) {
        Switchboard::QueryAnalysis analysis;
        analysis.complexity = complexity;
        analysis.sentiment = sentiment;
        return analysis;
    }

    static bool hasReason(const Switchboard::EscalationDecision& decision, Switchboard::EscalationReason reason) {
        for (auto r : decision.reasons) {
            if (r == reason) return true;
        }
        return false;
    }

public:
    void testRanking() {
        std::cout << "Testing ranking order..." << std::endl;

        std::vector<Switchboard::AgentScore> scores = {
            makeScore("zeta", 50.0, 0.3, 80.0),
            makeScore("alpha", 50.0, 0.3, 80.0),
            makeScore("beta", 50.0, 0.3, 95.0),
            makeScore("gamma", 70.0, 0.3, 60.0)
        };
        Switchboard::AgentSelector::rankScores(scores);

        assert(scores[0].agent_id == "gamma" && "Highest score should rank first");
        assert(scores[1].agent_id == "beta" && "Ties should break on success rate");
        assert(scores[2].agent_id == "alpha" && "Remaining ties should break on id");
        assert(scores[3].agent_id == "zeta" && "Remaining ties should break on id");

        std::cout << "✓ Ranking order test passed" << std::endl;
    }

    void testRecommendation() {
        std::cout << "Testing recommendation..." << std::endl;

        Switchboard::AgentSelector selector;
        auto selection = selector.select({
            makeScore("technical_support", 74.0, 0.7),
            makeScore("billing_support", 2.0, 0.6),
            makeScore("security_specialist", 2.5, 0.75)
        });

        assert(!selection.fallback_used && "Should not need the fallback");
        assert(selection.recommended.size() == 1 && "Only one agent should qualify");
        assert(selection.selectedAgentIds()[0] == "technical_support" && "Should recommend technical_support");
        assert(selection.ranked.size() == 3 && "Ranked list should keep every score");

        // Triggering alone is not enough, the score must also exceed the minimum
        auto low_bar = selector.select({
            makeScore("eager", 25.0, 0.1),
            makeScore("other", 10.0, 0.5)
        });
        assert(low_bar.fallback_used && "Score below 30 should not be recommended");

        // The minimum is exclusive: exactly 30 does not qualify
        auto at_bar = selector.select({
            makeScore("edge", 30.0, 0.2),
            makeScore("other", 10.0, 0.5)
        });
        assert(at_bar.ranked[0].wouldTrigger() && "Edge agent should trigger");
        assert(at_bar.fallback_used && "Score of exactly 30 should not be recommended");
        assert(at_bar.selection_reason.find("falling back") != std::string::npos);

        auto above_bar = selector.select({
            makeScore("edge", 30.5, 0.2),
            makeScore("other", 10.0, 0.5)
        });
        assert(!above_bar.fallback_used && "Score just above 30 should be recommended");
        assert(above_bar.recommended[0].agent_id == "edge");

        std::cout << "✓ Recommendation test passed" << std::endl;
    }

    void testRecommendationCap() {
        std::cout << "Testing recommendation cap..." << std::endl;

        Switchboard::AgentSelector selector;
        auto selection = selector.select({
            makeScore("a", 90.0, 0.5),
            makeScore("b", 85.0, 0.5),
            makeScore("c", 80.0, 0.5),
            makeScore("d", 75.0, 0.5)
        });

        assert(selection.recommended.size() == 3 && "Should cap at three agents");
        assert(selection.recommended[2].agent_id == "c" && "Should keep the best three");

        Switchboard::SelectorConfig config;
        config.max_recommended = 1;
        selector.setConfig(config);
        auto single = selector.select({makeScore("a", 90.0, 0.5), makeScore("b", 85.0, 0.5)});
        assert(single.recommended.size() == 1 && "Configured cap should apply");

        std::cout << "✓ Recommendation cap test passed" << std::endl;
    }

    void testFallback() {
        std::cout << "Testing fallback selection..." << std::endl;

        Switchboard::AgentSelector selector;

        auto top = selector.select({
            makeScore("account_manager", 1.25, 0.5),
            makeScore("security_specialist", 2.5, 0.75),
            makeScore("general_support", 0.0, 0.3)
        });
        assert(top.fallback_used && "No agent should qualify");
        assert(top.recommended.size() == 1 && "Fallback should pick exactly one agent");
        assert(top.recommended[0].agent_id == "security_specialist" && "Should fall back to the top agent");

        auto all_zero = selector.select({
            makeScore("account_manager", 0.0, 0.5, 90.0),
            makeScore("general_support", 0.0, 0.3, 80.0)
        });
        assert(all_zero.recommended[0].agent_id == "general_support" && "All zero should use the default agent");

        auto no_default = selector.select({
            makeScore("billing_support", 0.0, 0.6, 88.0),
            makeScore("account_manager", 0.0, 0.5, 85.0)
        });
        assert(no_default.recommended[0].agent_id == "billing_support" &&
               "Missing default agent should use the top-ranked agent");

        bool threw = false;
        try {
            selector.select({});
        } catch (const Switchboard::ConfigError&) {
            threw = true;
        }
        assert(threw && "Empty scores should be a configuration error");

        std::cout << "✓ Fallback selection test passed" << std::endl;
    }

    void testEscalationRule() {
        std::cout << "Testing escalation rule..." << std::endl;

        Switchboard::EscalationDecider decider;

        auto calm = decider.decide(makeAnalysis(Switchboard::Complexity::LOW, 0), 1);
        assert(!calm.escalate && calm.reasons.empty() && "Calm single-agent query should not escalate");
        assert(calm.priority == Switchboard::EscalationPriority::LOW);

        auto medium = decider.decide(makeAnalysis(Switchboard::Complexity::MEDIUM, 0), 2);
        assert(!medium.escalate && "Medium complexity with two agents should not escalate");

        auto negative = decider.decide(makeAnalysis(Switchboard::Complexity::LOW, -1), 1);
        assert(negative.escalate && "Sentiment -1 should escalate");
        assert(hasReason(negative, Switchboard::EscalationReason::NEGATIVE_SENTIMENT));
        assert(negative.priority == Switchboard::EscalationPriority::HIGH);

        auto broad = decider.decide(makeAnalysis(Switchboard::Complexity::LOW, 0), 3);
        assert(broad.escalate && "Three agents should escalate");
        assert(hasReason(broad, Switchboard::EscalationReason::BROAD_MATCH));
        assert(broad.priority == Switchboard::EscalationPriority::MEDIUM);

        auto critical = decider.decide(makeAnalysis(Switchboard::Complexity::HIGH, -2), 3);
        assert(critical.reasons.size() == 3 && "Every reason should be reported");
        assert(critical.priority == Switchboard::EscalationPriority::CRITICAL);

        std::cout << "✓ Escalation rule test passed" << std::endl;
    }

    void testEscalationRecord() {
        std::cout << "Testing escalation record..." << std::endl;

        Switchboard::EscalationDecider decider;
        auto decision = decider.decide(makeAnalysis(Switchboard::Complexity::HIGH, 0), 1);

        Switchboard::Query query;
        query.text = "Why does the API integration fail?";
        query.session_id = "session_test";
        auto record = decider.createRecord(decision, query, {"technical_support"});

        assert(record.session_id == "session_test" && "Record should carry the session id");
        assert(record.status == Switchboard::EscalationStatus::PENDING && "New record should be pending");
        assert(record.resolution == Switchboard::EscalationResolution::NONE && "New record should be unresolved");
        assert(record.reasonText() == "COMPLEX_ISSUE" && "Should describe its reasons");
        assert(!record.resolved_at.has_value() && "Pending record has no resolution time");

        std::cout << "✓ Escalation record test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running AgentSelector Tests..." << std::endl;
        std::cout << "==============================" << std::endl << std::endl;

        testRanking();
        std::cout << std::endl;

        testRecommendation();
        std::cout << std::endl;

        testRecommendationCap();
        std::cout << std::endl;

        testFallback();
        std::cout << std::endl;

        testEscalationRule();
        std::cout << std::endl;

        testEscalationRecord();
        std::cout << std::endl;

        std::cout << "All AgentSelector tests passed!" << std::endl;
    }
};

int main() {
    try {
        AgentSelectorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All AgentSelector component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
