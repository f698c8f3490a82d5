// =================================================================
// include/Switchboard/Broadcaster.hpp
// =================================================================
// Fans session events out to subscribed realtime clients.

#pragma once

#include "Switchboard/SessionEvents.hpp"
#include "Switchboard/BoundedEventQueue.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <optional>
#include <chrono>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

namespace Switchboard {

/**
 * @brief Server side of one client connection
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    /**
     * @brief Send one text frame
     * @return False if the connection is gone
     * @throws TransportError on a broken connection
     */
    virtual bool send(const std::string& frame) = 0;

    /**
     * @brief Close the connection from the server side
     */
    virtual void close() {}
};

/**
 * @brief Broadcaster limits and keepalive windows
 */
struct BroadcasterConfig {
    size_t client_queue_capacity = 256;                 ///< Per-client pending events
    size_t history_capacity = 512;                      ///< Retained events per session for replay
    std::chrono::milliseconds ping_interval{30000};     ///< Idle time before a ping
    std::chrono::milliseconds pong_timeout{10000};      ///< Time allowed to answer a ping
    std::chrono::milliseconds pump_interval{50};        ///< Delivery thread wake-up period
};

/**
 * @brief Broadcaster counters
 */
struct BroadcasterStats {
    size_t connected_clients = 0;
    size_t tracked_sessions = 0;
    uint64_t events_published = 0;
    uint64_t frames_sent = 0;
    uint64_t events_dropped = 0;
    uint64_t disconnects = 0;
};

/**
 * @brief Realtime event hub
 *
 * Sessions publish into onSessionEvent(). Each event is retained in a bounded
 * per-session history and queued for every client subscribed to its session;
 * a client with no subscriptions receives every session. flush() encodes and
 * sends queued frames outside the registry lock. Terminal events are never
 * dropped from either queue.
 */
class Broadcaster : public SessionObserver {
public:
    explicit Broadcaster(const BroadcasterConfig& config = BroadcasterConfig());
    ~Broadcaster() override;

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    /**
     * @brief Register a client connection, replacing any previous one with the same id
     * @param client_id Client identifier
     * @param sink Connection to send frames through
     * @param now Connection time, used for keepalive
     */
    void connect(const std::string& client_id, std::shared_ptr<EventSink> sink,
                 std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Drop a client and close its sink
     */
    void disconnect(const std::string& client_id, const std::string& reason = "client closed");

    bool isConnected(const std::string& client_id) const;

    /**
     * @brief Subscribe a client to a session
     * @param client_id Connected client
     * @param session_id Session to stream
     * @param replay Queue the retained history of the session
     * @return False if the client is not connected
     */
    bool subscribe(const std::string& client_id, const std::string& session_id, bool replay = true);

    /**
     * @brief Process a control frame sent by a client
     *
     * Accepts start_log_streaming and pong. Anything else is logged and ignored.
     */
    void handleClientMessage(const std::string& client_id, const std::string& frame,
                             std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    void onSessionEvent(const SessionEvent& event) override;

    /**
     * @brief Send every queued frame
     * @return Number of frames sent
     */
    size_t flush();

    /**
     * @brief Send due pings and disconnect clients that missed their pong
     */
    void checkKeepalive(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Start the background delivery thread
     */
    void start();

    /**
     * @brief Stop the background delivery thread
     */
    void stop();

    /**
     * @brief Release the retained history of a session
     */
    void forgetSession(const std::string& session_id);

    std::vector<SessionEvent> getHistory(const std::string& session_id) const;
    size_t queuedFor(const std::string& client_id) const;
    BroadcasterStats getStats() const;
    const BroadcasterConfig& getConfig() const { return m_config; }

private:
    struct ClientState {
        std::shared_ptr<EventSink> sink;
        std::set<std::string> sessions;
        BoundedEventQueue queue;
        std::chrono::steady_clock::time_point last_ping;
        std::optional<std::chrono::steady_clock::time_point> awaiting_pong_since;

        explicit ClientState(size_t capacity) : queue(capacity) {}
    };

    BroadcasterConfig m_config;

    mutable std::mutex m_mutex;
    std::map<std::string, std::unique_ptr<ClientState>> m_clients;
    std::map<std::string, BoundedEventQueue> m_history;
    BroadcasterStats m_stats;

    std::mutex m_flush_mutex;   ///< Serializes sends so frames leave in queue order

    std::unique_ptr<std::thread> m_pump_thread;
    std::atomic<bool> m_stop_pump{false};
    std::mutex m_pump_mutex;
    std::condition_variable m_pump_cv;
    bool m_pump_pending = false; ///< New frames queued since the last wake-up, guarded by m_pump_mutex

    void enqueue(ClientState& client, const SessionEvent& event);
    static bool wantsSession(const ClientState& client, const std::string& session_id);
    void wakePump();
    bool sendFrame(const std::string& client_id, EventSink& sink, const std::string& frame);
    void pumpLoop();
};

} // namespace Switchboard
