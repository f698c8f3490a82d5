// =================================================================
// tests/BroadcasterTest.cpp
// =================================================================
// Unit tests for the event queue, wire codec and Broadcaster.

#include "Switchboard/Broadcaster.hpp"
#include "Switchboard/BoundedEventQueue.hpp"
#include "Switchboard/EventCodec.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <iostream>
#include <cassert>
#include <mutex>
#include <vector>
#include <thread>
#include <atomic>
#include <stdexcept>

namespace {

/**
 * @brief Sink that records every frame it receives
 */
class RecordingSink : public Switchboard::EventSink {
public:
    explicit RecordingSink(bool fail_sends = false) : m_fail_sends(fail_sends) {}

    bool send(const std::string& frame) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fail_sends) {
            throw Switchboard::TransportError("socket reset");
        }
        m_frames.push_back(frame);
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }

    std::vector<std::string> frames() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_frames;
    }

    size_t countContaining(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (const auto& frame : m_frames) {
            if (frame.find(needle) != std::string::npos) count++;
        }
        return count;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_frames;
    bool m_fail_sends;
    bool m_closed = false;
};

/**
 * @brief Sink whose send throws something other than a TransportError
 */
class FaultySink : public Switchboard::EventSink {
public:
    bool send(const std::string&) override {
        throw std::runtime_error("encoder blew up");
    }

    void close() override { m_closed = true; }

    bool isClosed() const { return m_closed; }

private:
    std::atomic<bool> m_closed{false};
};

Switchboard::SessionEvent agentUpdate(const std::string& session, const std::string& agent,
                                      uint64_t sequence, Switchboard::AgentStatus status, double progress) {
    Switchboard::AgentStatusUpdateEvent event;
    event.header = Switchboard::EventHeader{session, agent, sequence, 1700000000000};
    event.status = status;
    event.progress = progress;
    event.current_task = "Working";
    return event;
}

Switchboard::SessionEvent sessionComplete(const std::string& session, uint64_t sequence) {
    Switchboard::SessionCompleteEvent event;
    event.header = Switchboard::EventHeader{session, "", sequence, 1700000000000};
    event.final_state = Switchboard::SessionState::COMPLETED;
    event.summary = "1 of 1 agent(s) completed";
    event.average_confidence = 0.85;
    return event;
}

} // namespace

class BroadcasterTest {
public:
    void testQueueOverflow() {
        std::cout << "Testing bounded queue overflow..." << std::endl;

        using Switchboard::AgentStatus;
        Switchboard::BoundedEventQueue queue(3);

        queue.push(agentUpdate("s1", "a", 1, AgentStatus::ANALYZING, 10));
        queue.push(agentUpdate("s1", "b", 1, AgentStatus::ANALYZING, 10));
        queue.push(agentUpdate("s1", "a", 2, AgentStatus::PROCESSING, 30));

        // Full: a FINISHED replaces the oldest droppable event of the same agent
        bool kept = queue.push(agentUpdate("s1", "a", 3, AgentStatus::FINISHED, 100));
        assert(!kept && "Overflow should report a drop");
        assert(queue.size() == 3 && "Size should stay at capacity");
        assert(queue.droppedCount() == 1 && "One event should be dropped");

        auto items = queue.items();
        assert(Switchboard::headerOf(items[0]).agent_name == "b" && "Agent b's update should survive");
        assert(Switchboard::isTerminalEvent(items[2]) && "Terminal event should be queued last");

        std::cout << "✓ Bounded queue overflow test passed" << std::endl;
    }

    void testQueueNeverDropsTerminal() {
        std::cout << "Testing terminal events are never dropped..." << std::endl;

        using Switchboard::AgentStatus;
        Switchboard::BoundedEventQueue queue(2);

        queue.push(agentUpdate("s1", "a", 5, AgentStatus::FINISHED, 100));
        queue.push(agentUpdate("s1", "b", 5, AgentStatus::ERROR, 40));

        bool progress_kept = queue.push(agentUpdate("s1", "c", 1, AgentStatus::PROCESSING, 30));
        assert(!progress_kept && "Progress update should be dropped when only terminal events are queued");
        assert(queue.size() == 2 && "Queue should not grow for a droppable event");

        queue.push(sessionComplete("s1", 9));
        assert(queue.size() == 3 && "Terminal event should be kept past capacity");

        auto drained = queue.drain();
        assert(drained.size() == 3 && queue.empty() && "Drain should empty the queue");
        assert(std::holds_alternative<Switchboard::SessionCompleteEvent>(drained.back()) &&
               "Session end should be last");

        std::cout << "✓ Terminal events test passed" << std::endl;
    }

    void testCodec() {
        std::cout << "Testing wire codec..." << std::endl;

        auto event = agentUpdate("session_1", "technical_support", 7, Switchboard::AgentStatus::PROCESSING, 42.5);
        std::string frame = Switchboard::EventCodec::encode(event);

        assert(frame.find("\"type\":\"agent_status_update\"") != std::string::npos && "Should carry its type");
        assert(frame.find("\"status\":\"PROCESSING\"") != std::string::npos && "Should carry the status name");
        assert(frame.find("\"sequence\":7") != std::string::npos && "Should carry the sequence");

        auto decoded = Switchboard::EventCodec::decodeServerMessage(frame);
        assert(decoded && std::holds_alternative<Switchboard::SessionEvent>(*decoded) && "Should decode an event");
        const auto& session_event = std::get<Switchboard::SessionEvent>(*decoded);
        const auto& update = std::get<Switchboard::AgentStatusUpdateEvent>(session_event);
        assert(update.header.agent_name == "technical_support" && "Agent name should survive decoding");
        assert(update.progress == 42.5 && "Progress should survive decoding");

        std::string complete = Switchboard::EventCodec::encode(sessionComplete("session_1", 3));
        assert(complete.find("\"type\":\"session_complete\"") != std::string::npos);
        assert(complete.find("\"status\":\"COMPLETED\"") != std::string::npos);

        auto ping = Switchboard::EventCodec::decodeServerMessage(
            Switchboard::EventCodec::encode(Switchboard::PingMessage{12345}));
        assert(ping && std::get<Switchboard::PingMessage>(*ping).timestamp_ms == 12345 && "Should decode pings");

        auto start = Switchboard::EventCodec::decodeClientMessage(
            R"({"type":"start_log_streaming","session_id":"session_1"})");
        assert(start && std::get<Switchboard::StartLogStreamingMessage>(*start).session_id == "session_1");

        assert(!Switchboard::EventCodec::decodeClientMessage(R"({"type":"start_log_streaming"})") &&
               "Streaming request without a session should be rejected");
        assert(!Switchboard::EventCodec::decodeServerMessage("{not json") && "Malformed frames should be ignored");
        assert(!Switchboard::EventCodec::decodeServerMessage(R"({"type":"mystery"})") &&
               "Unknown frame types should be ignored");

        std::cout << "✓ Wire codec test passed" << std::endl;
    }

    void testSubscriptionRouting() {
        std::cout << "Testing subscription routing..." << std::endl;

        Switchboard::Broadcaster broadcaster;
        auto focused = std::make_shared<RecordingSink>();
        auto watcher = std::make_shared<RecordingSink>();

        broadcaster.connect("focused", focused);
        broadcaster.connect("watcher", watcher);
        broadcaster.handleClientMessage("focused", R"({"type":"start_log_streaming","session_id":"s1"})");

        broadcaster.onSessionEvent(agentUpdate("s1", "a", 1, Switchboard::AgentStatus::ANALYZING, 10));
        broadcaster.onSessionEvent(agentUpdate("s2", "a", 1, Switchboard::AgentStatus::ANALYZING, 10));

        size_t sent = broadcaster.flush();
        assert(sent == 3 && "Should send one frame to focused and two to watcher");
        assert(focused->frames().size() == 1 && "Focused client should only see s1");
        assert(focused->countContaining("\"session_id\":\"s1\"") == 1);
        assert(watcher->frames().size() == 2 && "Unsubscribed client should see every session");

        auto stats = broadcaster.getStats();
        assert(stats.connected_clients == 2 && stats.tracked_sessions == 2 && stats.events_published == 2);

        std::cout << "✓ Subscription routing test passed" << std::endl;
    }

    void testHistoryReplay() {
        std::cout << "Testing history replay..." << std::endl;

        Switchboard::Broadcaster broadcaster;
        broadcaster.onSessionEvent(agentUpdate("s1", "a", 1, Switchboard::AgentStatus::ANALYZING, 10));
        broadcaster.onSessionEvent(agentUpdate("s1", "a", 2, Switchboard::AgentStatus::FINISHED, 100));
        broadcaster.onSessionEvent(sessionComplete("s1", 3));

        auto late = std::make_shared<RecordingSink>();
        broadcaster.connect("late", late);
        assert(broadcaster.subscribe("late", "s1") && "Known client should subscribe");
        assert(broadcaster.queuedFor("late") == 3 && "Late joiner should get the full history");

        broadcaster.flush();
        auto frames = late->frames();
        assert(frames.size() == 3 && "Every replayed event should be sent");
        assert(frames.back().find("session_complete") != std::string::npos && "Replay should keep order");

        assert(!broadcaster.subscribe("ghost", "s1") && "Unknown client cannot subscribe");

        broadcaster.forgetSession("s1");
        assert(broadcaster.getHistory("s1").empty() && "Forgotten session should have no history");

        std::cout << "✓ History replay test passed" << std::endl;
    }

    void testSlowClientKeepsTerminal() {
        std::cout << "Testing slow client overflow..." << std::endl;

        Switchboard::BroadcasterConfig config;
        config.client_queue_capacity = 4;
        Switchboard::Broadcaster broadcaster(config);

        auto slow = std::make_shared<RecordingSink>();
        broadcaster.connect("slow", slow);

        for (uint64_t seq = 1; seq <= 10; ++seq) {
            broadcaster.onSessionEvent(agentUpdate("s1", "a", seq, Switchboard::AgentStatus::PROCESSING,
                                                   static_cast<double>(seq * 5)));
        }
        broadcaster.onSessionEvent(agentUpdate("s1", "a", 11, Switchboard::AgentStatus::FINISHED, 100));
        broadcaster.onSessionEvent(sessionComplete("s1", 1));

        broadcaster.flush();
        assert(slow->frames().size() <= 5 && "Queue should stay near its capacity");
        assert(slow->countContaining("\"status\":\"FINISHED\"") == 1 && "Agent terminal event must arrive");
        assert(slow->countContaining("session_complete") == 1 && "Session end must arrive");
        assert(broadcaster.getStats().events_dropped > 0 && "Drops should be counted");

        std::cout << "✓ Slow client overflow test passed" << std::endl;
    }

    void testSendFailureDisconnects() {
        std::cout << "Testing send failure handling..." << std::endl;

        Switchboard::Broadcaster broadcaster;
        auto broken = std::make_shared<RecordingSink>(true);
        auto healthy = std::make_shared<RecordingSink>();
        broadcaster.connect("broken", broken);
        broadcaster.connect("healthy", healthy);

        broadcaster.onSessionEvent(agentUpdate("s1", "a", 1, Switchboard::AgentStatus::ANALYZING, 10));
        broadcaster.flush();

        assert(!broadcaster.isConnected("broken") && "Failed client should be disconnected");
        assert(broken->isClosed() && "Failed sink should be closed");
        assert(healthy->frames().size() == 1 && "Other clients should be unaffected");
        assert(broadcaster.getStats().disconnects == 1);

        std::cout << "✓ Send failure handling test passed" << std::endl;
    }

    void testUnexpectedSinkErrorDisconnects() {
        std::cout << "Testing unexpected sink errors..." << std::endl;

        Switchboard::BroadcasterConfig config;
        config.pump_interval = std::chrono::milliseconds(10);
        Switchboard::Broadcaster broadcaster(config);
        auto faulty = std::make_shared<FaultySink>();
        auto healthy = std::make_shared<RecordingSink>();
        broadcaster.connect("faulty", faulty);
        broadcaster.connect("healthy", healthy);

        broadcaster.onSessionEvent(agentUpdate("s1", "a", 1, Switchboard::AgentStatus::ANALYZING, 10));
        broadcaster.flush();

        assert(!broadcaster.isConnected("faulty") && "Throwing sink should be disconnected");
        assert(faulty->isClosed() && "Throwing sink should be closed");
        assert(healthy->frames().size() == 1 && "Other clients should be unaffected");

        // The delivery thread survives a throwing sink too
        auto faulty_again = std::make_shared<FaultySink>();
        broadcaster.connect("faulty", faulty_again);
        broadcaster.start();
        broadcaster.onSessionEvent(agentUpdate("s1", "a", 2, Switchboard::AgentStatus::SEARCHING, 20));
        broadcaster.onSessionEvent(sessionComplete("s1", 3));

        for (int i = 0; i < 100 && healthy->frames().size() < 3; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        broadcaster.stop();

        assert(healthy->frames().size() == 3 && "Delivery should continue after a sink throws");
        assert(!broadcaster.isConnected("faulty"));
        assert(broadcaster.getStats().disconnects == 2);

        std::cout << "✓ Unexpected sink errors test passed" << std::endl;
    }

    void testReconnectReplacesSink() {
        std::cout << "Testing connection replacement..." << std::endl;

        Switchboard::Broadcaster broadcaster;
        auto first = std::make_shared<RecordingSink>();
        auto second = std::make_shared<RecordingSink>();

        broadcaster.connect("cli", first);
        broadcaster.connect("cli", second);
        assert(first->isClosed() && "Old sink should be closed");
        assert(broadcaster.getStats().connected_clients == 1 && "Only one connection per client id");

        bool threw = false;
        try {
            broadcaster.connect("cli", nullptr);
        } catch (const Switchboard::SwitchboardError&) {
            threw = true;
        }
        assert(threw && "Null sink should be rejected");

        std::cout << "✓ Connection replacement test passed" << std::endl;
    }

    void testKeepalive() {
        std::cout << "Testing keepalive..." << std::endl;

        Switchboard::Broadcaster broadcaster;
        auto responsive = std::make_shared<RecordingSink>();
        auto silent = std::make_shared<RecordingSink>();
        auto t0 = std::chrono::steady_clock::now();

        broadcaster.connect("responsive", responsive, t0);
        broadcaster.connect("silent", silent, t0);

        broadcaster.checkKeepalive(t0 + std::chrono::seconds(10));
        assert(responsive->frames().empty() && "No ping before the interval");

        broadcaster.checkKeepalive(t0 + std::chrono::seconds(30));
        assert(responsive->countContaining("\"type\":\"ping\"") == 1 && "Ping should be sent after 30s");
        assert(silent->countContaining("\"type\":\"ping\"") == 1);

        broadcaster.handleClientMessage("responsive", R"({"type":"pong","timestamp":1})",
                                        t0 + std::chrono::seconds(31));

        broadcaster.checkKeepalive(t0 + std::chrono::seconds(40));
        assert(!broadcaster.isConnected("silent") && "Missing pong should disconnect after 10s");
        assert(broadcaster.isConnected("responsive") && "Answered ping should keep the client");

        std::cout << "✓ Keepalive test passed" << std::endl;
    }

    void testPumpThread() {
        std::cout << "Testing delivery thread..." << std::endl;

        Switchboard::BroadcasterConfig config;
        config.pump_interval = std::chrono::milliseconds(10);
        Switchboard::Broadcaster broadcaster(config);
        auto sink = std::make_shared<RecordingSink>();
        broadcaster.connect("client", sink);

        broadcaster.start();
        broadcaster.onSessionEvent(agentUpdate("s1", "a", 1, Switchboard::AgentStatus::ANALYZING, 10));
        broadcaster.onSessionEvent(sessionComplete("s1", 1));

        for (int i = 0; i < 100 && sink->frames().size() < 2; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        broadcaster.stop();

        assert(sink->frames().size() == 2 && "Delivery thread should send queued events");

        std::cout << "✓ Delivery thread test passed" << std::endl;
    }

    void testEventsWakeDeliveryThread() {
        std::cout << "Testing delivery thread wake-up..." << std::endl;

        Switchboard::BroadcasterConfig config;
        config.pump_interval = std::chrono::seconds(5);
        Switchboard::Broadcaster broadcaster(config);
        auto sink = std::make_shared<RecordingSink>();
        broadcaster.connect("client", sink);

        broadcaster.start();
        // Let the thread settle into its wait
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        auto published = std::chrono::steady_clock::now();
        broadcaster.onSessionEvent(agentUpdate("s1", "a", 1, Switchboard::AgentStatus::ANALYZING, 10));

        for (int i = 0; i < 200 && sink->frames().empty(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        auto delivered = std::chrono::steady_clock::now();
        assert(sink->frames().size() == 1 && "Event should be delivered");
        assert(delivered - published < std::chrono::seconds(2) && "Publishing should wake the thread early");

        // A subscription with replay wakes it as well
        auto late = std::make_shared<RecordingSink>();
        broadcaster.connect("late", late);
        broadcaster.subscribe("late", "s1", true);
        for (int i = 0; i < 200 && late->frames().empty(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(late->frames().size() == 1 && "Replay should be delivered without waiting a full interval");

        auto stopping = std::chrono::steady_clock::now();
        broadcaster.stop();
        assert(std::chrono::steady_clock::now() - stopping < std::chrono::seconds(2) && "Stop should not wait out the interval");

        std::cout << "✓ Delivery thread wake-up test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Broadcaster Tests..." << std::endl;
        std::cout << "============================" << std::endl << std::endl;

        testQueueOverflow();
        std::cout << std::endl;

        testQueueNeverDropsTerminal();
        std::cout << std::endl;

        testCodec();
        std::cout << std::endl;

        testSubscriptionRouting();
        std::cout << std::endl;

        testHistoryReplay();
        std::cout << std::endl;

        testSlowClientKeepsTerminal();
        std::cout << std::endl;

        testSendFailureDisconnects();
        std::cout << std::endl;

        testUnexpectedSinkErrorDisconnects();
        std::cout << std::endl;

        testReconnectReplacesSink();
        std::cout << std::endl;

        testKeepalive();
        std::cout << std::endl;

        testPumpThread();
        std::cout << std::endl;

        testEventsWakeDeliveryThread();
        std::cout << std::endl;

        std::cout << "All Broadcaster tests passed!" << std::endl;
    }
};

int main() {
    try {
        Switchboard::Logger::getInstance().setConsoleLogLevel(Switchboard::LogLevel::ERROR);

        BroadcasterTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Broadcaster component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
