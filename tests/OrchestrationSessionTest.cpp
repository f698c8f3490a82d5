// =================================================================
// tests/OrchestrationSessionTest.cpp
// =================================================================
// Unit tests for OrchestrationSession lifecycle, fan-out and escalation.

#include "Switchboard/OrchestrationSession.hpp"
#include "Switchboard/SimulatedExecutionBackend.hpp"
#include "Switchboard/HumanEscalationChannel.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <iostream>
#include <cassert>
#include <mutex>
#include <map>
#include <vector>
#include <thread>
#include <cmath>
#include <algorithm>

namespace {

/**
 * @brief Observer that keeps every published event
 */
class RecordingObserver : public Switchboard::SessionObserver {
public:
    void onSessionEvent(const Switchboard::SessionEvent& event) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
    }

    std::vector<Switchboard::SessionEvent> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    std::vector<Switchboard::AgentStatusUpdateEvent> updatesFor(const std::string& agent_id) const {
        std::vector<Switchboard::AgentStatusUpdateEvent> updates;
        for (const auto& event : events()) {
            if (const auto* update = std::get_if<Switchboard::AgentStatusUpdateEvent>(&event)) {
                if (update->header.agent_name == agent_id) {
                    updates.push_back(*update);
                }
            }
        }
        return updates;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Switchboard::SessionEvent> m_events;
};

/**
 * @brief Observer that always throws
 */
class ThrowingObserver : public Switchboard::SessionObserver {
public:
    void onSessionEvent(const Switchboard::SessionEvent&) override {
        throw std::runtime_error("observer exploded");
    }
};

Switchboard::Query makeQuery(const std::string& text, const std::string& session_id) {
    Switchboard::Query query;
    query.text = text;
    query.session_id = session_id;
    query.created_at = std::chrono::system_clock::now();
    return query;
}

std::shared_ptr<Switchboard::SimulatedExecutionBackend> fastBackend(std::chrono::milliseconds latency =
                                                                        std::chrono::milliseconds(20)) {
    Switchboard::SimulationConfig config;
    config.latency = latency;
    config.steps = 4;
    return std::make_shared<Switchboard::SimulatedExecutionBackend>(config);
}

Switchboard::EscalationRecord makeEscalation(const std::string& session_id) {
    Switchboard::EscalationRecord record;
    record.session_id = session_id;
    record.query_text = "This is terrible";
    record.reasons = {Switchboard::EscalationReason::NEGATIVE_SENTIMENT};
    record.priority = Switchboard::EscalationPriority::HIGH;
    record.triggered_at = std::chrono::system_clock::now();
    return record;
}

} // namespace

class OrchestrationSessionTest {
public:
    void testSuccessfulSession() {
        std::cout << "Testing successful session..." << std::endl;

        auto backend = fastBackend();
        backend->setResponse("technical_support", "Renew the SSL certificate.", 0.9);
        backend->setResponse("account_manager", "Your plan includes webhooks.", 0.7);
        RecordingObserver observer;

        Switchboard::OrchestrationSession session(
            makeQuery("webhook ssl", "session_ok"), {"technical_support", "account_manager"},
            std::nullopt, backend, nullptr, &observer);

        auto result = session.run();

        assert(session.getState() == Switchboard::SessionState::COMPLETED && "Session should complete");
        assert(result.failed_agent_ids.empty() && "No agent should fail");
        assert(result.agent_results.size() == 2 && "Should keep one result per agent");
        assert(result.agent_results[0].agent_id == "technical_support" && "Results keep dispatch order");
        assert(result.combined_content ==
               "[technical_support] Renew the SSL certificate.\n\n[account_manager] Your plan includes webhooks." &&
               "Combined content should join agent blocks");
        assert(std::fabs(result.average_confidence - 0.8) < 1e-9 && "Average confidence over both agents");
        assert(!result.human_response && "No escalation, no human response");

        auto snap = session.snapshot();
        for (const auto& [agent_id, state] : snap.agent_states) {
            assert(state.status == Switchboard::AgentStatus::FINISHED && "Every agent should finish");
            assert(state.progress == 100.0 && "Finished agents are at 100%");
        }
        assert(snap.completed_at.has_value() && "Completion time should be recorded");
        assert(snap.result.has_value() && "Snapshot should carry the result");

        auto events = observer.events();
        assert(std::holds_alternative<Switchboard::SessionStartedEvent>(events.front()) && "First event is start");
        assert(std::holds_alternative<Switchboard::SessionCompleteEvent>(events.back()) && "Last event is completion");
        assert(backend->getCallCount() == 2 && "Backend should be called once per agent");

        std::cout << "✓ Successful session test passed" << std::endl;
    }

    void testEventOrdering() {
        std::cout << "Testing per-agent event ordering..." << std::endl;

        RecordingObserver observer;
        Switchboard::OrchestrationSession session(
            makeQuery("refund please", "session_order"), {"billing_support", "general_support"},
            std::nullopt, fastBackend(), nullptr, &observer);
        session.run();

        for (const std::string agent_id : {"billing_support", "general_support"}) {
            auto updates = observer.updatesFor(agent_id);
            assert(updates.size() >= 7 && "Should publish every lifecycle step");

            for (size_t i = 1; i < updates.size(); ++i) {
                assert(updates[i].header.sequence == updates[i - 1].header.sequence + 1 &&
                       "Sequences should be contiguous per agent");
                assert(static_cast<int>(updates[i].status) >= static_cast<int>(updates[i - 1].status) &&
                       "Status should only move forward");
                if (updates[i].status == updates[i - 1].status) {
                    assert(updates[i].progress >= updates[i - 1].progress &&
                           "Progress should not decrease within a status");
                }
            }
            assert(updates.back().status == Switchboard::AgentStatus::FINISHED && "Last update is FINISHED");
        }

        // Session-level events carry their own sequence
        uint64_t last_session_sequence = 0;
        for (const auto& event : observer.events()) {
            const auto& header = Switchboard::headerOf(event);
            if (header.agent_name.empty()) {
                assert(header.sequence > last_session_sequence && "Session sequence should increase");
                last_session_sequence = header.sequence;
            }
        }

        std::cout << "✓ Per-agent event ordering test passed" << std::endl;
    }

    void testPartialFailure() {
        std::cout << "Testing partial failure..." << std::endl;

        auto backend = fastBackend();
        backend->setFailing("billing_support", true);
        RecordingObserver observer;

        Switchboard::OrchestrationSession session(
            makeQuery("refund for my api plan", "session_partial"), {"technical_support", "billing_support"},
            std::nullopt, backend, nullptr, &observer);
        auto result = session.run();

        assert(session.getState() == Switchboard::SessionState::COMPLETED &&
               "One surviving agent should complete the session");
        assert(result.failed_agent_ids.size() == 1 && result.failed_agent_ids[0] == "billing_support");
        assert(result.combined_content.find("[billing_support]") == std::string::npos &&
               "Failed agent should not contribute content");

        auto snap = session.snapshot();
        const auto& failed = snap.agent_states.at("billing_support");
        assert(failed.status == Switchboard::AgentStatus::ERROR && "Failed agent should be in ERROR");
        assert(failed.error == "simulated backend failure" && "Error text should be kept");
        assert(failed.progress >= 30.0 && "ERROR should keep the last progress");
        assert(snap.agent_states.at("technical_support").status == Switchboard::AgentStatus::FINISHED &&
               "Sibling should not be aborted");

        auto complete = std::get<Switchboard::SessionCompleteEvent>(observer.events().back());
        assert(complete.summary == "1 of 2 agent(s) completed" && "Summary should count survivors");
        assert(complete.failed_agents.size() == 1);

        std::cout << "✓ Partial failure test passed" << std::endl;
    }

    void testAllAgentsFail() {
        std::cout << "Testing total failure..." << std::endl;

        auto backend = fastBackend();
        backend->setFailing("technical_support", true);
        backend->setFailing("security_specialist", true);
        RecordingObserver observer;

        Switchboard::OrchestrationSession session(
            makeQuery("hacked api", "session_failed"), {"technical_support", "security_specialist"},
            std::nullopt, backend, nullptr, &observer);
        auto result = session.run();

        assert(session.getState() == Switchboard::SessionState::FAILED && "Session should fail");
        assert(result.failed_agent_ids.size() == 2 && "Both agents should be reported");
        assert(result.average_confidence == 0.0 && "No confidence without survivors");

        auto events = observer.events();
        assert(std::holds_alternative<Switchboard::SessionErrorEvent>(events.back()) && "Last event is session_error");
        auto error = std::get<Switchboard::SessionErrorEvent>(events.back());
        assert(error.message == "All 2 agent(s) failed");

        std::cout << "✓ Total failure test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing cancellation..." << std::endl;

        RecordingObserver observer;
        Switchboard::OrchestrationSession session(
            makeQuery("slow question", "session_cancel"), {"technical_support", "billing_support"},
            std::nullopt, fastBackend(std::chrono::milliseconds(10000)), nullptr, &observer);

        session.start();
        for (int i = 0; i < 100 && observer.updatesFor("technical_support").size() < 3; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        auto begin = std::chrono::steady_clock::now();
        session.cancel();
        auto result = session.waitForCompletion(std::chrono::milliseconds(3000));
        auto elapsed = std::chrono::steady_clock::now() - begin;

        assert(result.has_value() && "Cancelled session should still settle");
        assert(elapsed < std::chrono::seconds(3) && "Cancellation should be prompt");
        assert(session.isCancelled());
        assert(session.getState() == Switchboard::SessionState::FAILED && "Nothing finished, so FAILED");

        auto snap = session.snapshot();
        for (const auto& [agent_id, state] : snap.agent_states) {
            assert(state.status == Switchboard::AgentStatus::ERROR && "Cancelled agents end in ERROR");
            assert(state.error == "cancelled" && "Error should say cancelled");
        }

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testHumanResponse() {
        std::cout << "Testing escalation with human response..." << std::endl;

        auto channel = std::make_shared<Switchboard::QueuedEscalationChannel>();
        RecordingObserver observer;
        Switchboard::SessionConfig config;
        config.escalation_timeout = std::chrono::milliseconds(5000);

        Switchboard::OrchestrationSession session(
            makeQuery("This is terrible", "session_human"), {"general_support"},
            makeEscalation("session_human"), fastBackend(), channel, &observer, config);
        session.start();

        assert(channel->waitForPending(std::chrono::milliseconds(2000)) && "Escalation should be queued");
        auto pending = channel->getPending();
        assert(pending.size() == 1 && pending[0].session_id == "session_human");
        assert(channel->resolve("session_human", "We are refunding you today.") && "Should resolve pending");

        auto result = session.waitForCompletion(std::chrono::milliseconds(3000));
        assert(result.has_value() && "Session should finish after the human answers");
        assert(result->human_response == std::string("We are refunding you today.") && "Human answer folded in");
        assert(result->agent_results.back().agent_id == "human_operator" && "Human result appended");
        assert(result->combined_content.find("[human_operator] We are refunding you today.") != std::string::npos);

        auto snap = session.snapshot();
        assert(snap.escalation && snap.escalation->status == Switchboard::EscalationStatus::RESOLVED);
        assert(snap.escalation->resolution == Switchboard::EscalationResolution::HUMAN_RESPONSE);
        assert(snap.escalation->resolved_at.has_value());

        bool saw_escalated = false;
        for (const auto& event : observer.events()) {
            if (const auto* phase = std::get_if<Switchboard::PhaseUpdateEvent>(&event)) {
                saw_escalated = saw_escalated || phase->state == Switchboard::SessionState::ESCALATED;
            }
        }
        assert(saw_escalated && "Should pass through ESCALATED");

        std::cout << "✓ Escalation with human response test passed" << std::endl;
    }

    void testEscalationTimeout() {
        std::cout << "Testing escalation timeout..." << std::endl;

        auto channel = std::make_shared<Switchboard::QueuedEscalationChannel>();
        Switchboard::SessionConfig config;
        config.escalation_timeout = std::chrono::milliseconds(50);
        config.timeout_response = "Auto-resolved";

        Switchboard::OrchestrationSession session(
            makeQuery("This is terrible", "session_timeout"), {"general_support"},
            makeEscalation("session_timeout"), fastBackend(), channel, nullptr, config);
        auto result = session.run();

        assert(session.getState() == Switchboard::SessionState::COMPLETED && "Timeout should not fail the session");
        assert(!result.human_response && "No human answered");
        assert(channel->pendingCount() == 0 && "Timed-out escalation should leave the queue");

        auto snap = session.snapshot();
        assert(snap.escalation->resolution == Switchboard::EscalationResolution::TIMEOUT);
        assert(snap.escalation->human_response == "Auto-resolved" && "Timeout response should be recorded");

        // Without a channel the escalation resolves immediately
        Switchboard::OrchestrationSession unattended(
            makeQuery("This is terrible", "session_unattended"), {"general_support"},
            makeEscalation("session_unattended"), fastBackend(), nullptr, nullptr, config);
        unattended.run();
        assert(unattended.snapshot().escalation->resolution == Switchboard::EscalationResolution::TIMEOUT);

        std::cout << "✓ Escalation timeout test passed" << std::endl;
    }

    void testStateUpdateRules() {
        std::cout << "Testing agent state update rules..." << std::endl;

        using Switchboard::AgentStatus;
        Switchboard::AgentRuntimeState state;

        assert(Switchboard::applyAgentUpdate(state, AgentStatus::PROCESSING, 50.0, "Working"));
        assert(Switchboard::applyAgentUpdate(state, AgentStatus::PROCESSING, 40.0, "Still working") &&
               "Same-status update should be accepted");
        assert(state.progress == 50.0 && "Progress should not decrease");
        assert(state.current_task == "Still working");

        assert(!Switchboard::applyAgentUpdate(state, AgentStatus::ANALYZING, 60.0, "Back") &&
               "Backward transition should be rejected");
        assert(state.status == AgentStatus::PROCESSING && state.current_task == "Still working" &&
               "Rejected update leaves the state untouched");

        assert(Switchboard::applyAgentUpdate(state, AgentStatus::COMPLETING, 20.0, "Wrapping up") &&
               "Skipping forward is allowed");
        assert(state.progress == 20.0 && "A new status takes its own progress");

        assert(Switchboard::applyAgentUpdate(state, AgentStatus::FINISHED, 150.0, "Done"));
        assert(state.progress == 100.0 && "Progress should clamp to 100");
        assert(!Switchboard::applyAgentUpdate(state, AgentStatus::ERROR, 0.0, "Late", "late failure") &&
               "Nothing leaves a terminal status");
        assert(state.error.empty() && state.status == AgentStatus::FINISHED);
        assert(state.sequence == 4 && "Only accepted updates count");

        Switchboard::AgentRuntimeState failing;
        Switchboard::applyAgentUpdate(failing, AgentStatus::PROCESSING, 45.0, "Working");
        assert(Switchboard::applyAgentUpdate(failing, AgentStatus::ERROR, 0.0, "Failed", "backend down") &&
               "ERROR is reachable from any non-terminal status");
        assert(failing.progress == 45.0 && "ERROR should keep the last progress");
        assert(failing.error == "backend down" && "Error text should be recorded");

        std::cout << "✓ Agent state update rules test passed" << std::endl;
    }

    void testTerminalStatusesMatchFailedAgents() {
        std::cout << "Testing terminal statuses against failed agents..." << std::endl;

        auto backend = fastBackend(std::chrono::milliseconds(60));
        backend->setFailing("security_specialist", true);
        RecordingObserver observer;

        Switchboard::OrchestrationSession session(
            makeQuery("hacked api refund", "session_consistent"),
            {"technical_support", "billing_support", "security_specialist"},
            std::nullopt, backend, nullptr, &observer);
        auto result = session.run();

        auto snap = session.snapshot();
        size_t errored = 0;
        for (const auto& [agent_id, state] : snap.agent_states) {
            bool listed = std::find(result.failed_agent_ids.begin(), result.failed_agent_ids.end(), agent_id) !=
                          result.failed_agent_ids.end();
            assert(Switchboard::isTerminal(state.status) && "Every agent should settle");
            assert((state.status == Switchboard::AgentStatus::ERROR) == listed &&
                   "ERROR slots and failed agent ids must agree");
            if (listed) errored++;
        }
        assert(errored == 1 && result.failed_agent_ids.size() == 1);
        assert(session.getState() == Switchboard::SessionState::COMPLETED);

        auto complete = std::get<Switchboard::SessionCompleteEvent>(observer.events().back());
        assert(complete.failed_agents == result.failed_agent_ids && "Terminal event should carry the same ids");
        assert(Switchboard::deriveFinalState(result.agent_results) == Switchboard::SessionState::COMPLETED);

        Switchboard::AgentResult failed;
        failed.agent_id = "a";
        assert(Switchboard::deriveFinalState({failed}) == Switchboard::SessionState::FAILED &&
               "No successful result means FAILED");

        std::cout << "✓ Terminal statuses against failed agents test passed" << std::endl;
    }

    void testConstructionErrors() {
        std::cout << "Testing construction errors..." << std::endl;

        auto expectThrow = [](auto make) {
            try {
                make();
            } catch (const Switchboard::SwitchboardError&) {
                return true;
            }
            return false;
        };

        assert(expectThrow([] {
            Switchboard::OrchestrationSession s(makeQuery("q", "s"), {}, std::nullopt, fastBackend(), nullptr, nullptr);
        }) && "Empty agent list should throw");
        assert(expectThrow([] {
            Switchboard::OrchestrationSession s(makeQuery("q", "s"), {"a"}, std::nullopt, nullptr, nullptr, nullptr);
        }) && "Missing backend should throw");
        assert(expectThrow([] {
            Switchboard::OrchestrationSession s(makeQuery("q", "s"), {"a", "a"}, std::nullopt, fastBackend(),
                                                nullptr, nullptr);
        }) && "Duplicate agent should throw");

        Switchboard::OrchestrationSession session(makeQuery("q", "s"), {"a"}, std::nullopt, fastBackend(),
                                                  nullptr, nullptr);
        session.run();
        assert(expectThrow([&session] { session.run(); }) && "A session runs once");

        std::cout << "✓ Construction errors test passed" << std::endl;
    }

    void testObserverFailureIsContained() {
        std::cout << "Testing observer failure isolation..." << std::endl;

        ThrowingObserver observer;
        Switchboard::OrchestrationSession session(
            makeQuery("q", "session_observer"), {"general_support"}, std::nullopt, fastBackend(), nullptr, &observer);
        auto result = session.run();

        assert(session.getState() == Switchboard::SessionState::COMPLETED && "Observer errors should not leak");
        assert(result.failed_agent_ids.empty());

        std::cout << "✓ Observer failure isolation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running OrchestrationSession Tests..." << std::endl;
        std::cout << "=====================================" << std::endl << std::endl;

        testSuccessfulSession();
        std::cout << std::endl;

        testEventOrdering();
        std::cout << std::endl;

        testPartialFailure();
        std::cout << std::endl;

        testAllAgentsFail();
        std::cout << std::endl;

        testCancellation();
        std::cout << std::endl;

        testHumanResponse();
        std::cout << std::endl;

        testEscalationTimeout();
        std::cout << std::endl;

        testStateUpdateRules();
        std::cout << std::endl;

        testTerminalStatusesMatchFailedAgents();
        std::cout << std::endl;

        testConstructionErrors();
        std::cout << std::endl;

        testObserverFailureIsContained();
        std::cout << std::endl;

        std::cout << "All OrchestrationSession tests passed!" << std::endl;
    }
};

int main() {
    try {
        Switchboard::Logger::getInstance().setConsoleLogLevel(Switchboard::LogLevel::ERROR);

        OrchestrationSessionTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All OrchestrationSession component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
