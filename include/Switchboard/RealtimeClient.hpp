// =================================================================
// include/Switchboard/RealtimeClient.hpp
// =================================================================
// Client side of the realtime stream: reconnect, keepalive and dedup.

#pragma once

#include "Switchboard/SessionEvents.hpp"
#include "Switchboard/CancellationToken.hpp"
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>
#include <functional>
#include <utility>

namespace Switchboard {

/**
 * @brief Duplex text connection to the broadcaster
 *
 * Every method throws TransportError when the connection cannot be used.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual void connect() = 0;
    virtual void sendText(const std::string& frame) = 0;

    /**
     * @brief Wait for the next frame
     * @param timeout Maximum time to wait
     * @return Frame text, or nullopt on timeout
     */
    virtual std::optional<std::string> receiveText(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @brief Backoff settings
 */
struct ReconnectConfig {
    std::chrono::milliseconds initial_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};
    size_t max_attempts = 5;
};

/**
 * @brief Exponential backoff with an attempt budget
 *
 * Delays are 1s, 2s, 4s, 8s, 16s with the defaults, capped at max_delay.
 */
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(const ReconnectConfig& config = ReconnectConfig());

    /**
     * @brief Delay before the next attempt
     * @return Delay, or nullopt once the attempts are exhausted
     */
    std::optional<std::chrono::milliseconds> nextDelay();

    /**
     * @brief Start over after a successful connection
     */
    void reset();

    size_t attempts() const { return m_attempts; }
    const ReconnectConfig& getConfig() const { return m_config; }

private:
    ReconnectConfig m_config;
    size_t m_attempts = 0;
};

/**
 * @brief Drops events already processed
 *
 * Tracks the highest sequence seen per (session_id, agent_name). Delivery is
 * ordered per agent, so anything at or below it is a redelivery.
 */
class EventDeduplicator {
public:
    /**
     * @brief Record an event
     * @return True the first time an event is seen
     */
    bool accept(const EventHeader& header);

    void forgetSession(const std::string& session_id);
    void clear() { m_last_seen.clear(); }
    size_t trackedStreams() const { return m_last_seen.size(); }

private:
    std::map<std::pair<std::string, std::string>, uint64_t> m_last_seen;
};

/**
 * @brief Client settings
 */
struct RealtimeClientConfig {
    std::string session_id;                                ///< Session to stream
    std::chrono::milliseconds receive_timeout{500};        ///< Poll period for cancellation
    ReconnectConfig reconnect;
};

/**
 * @brief How a client run ended
 */
enum class ClientOutcome {
    COMPLETED,      ///< Session reached a terminal event
    DISCONNECTED,   ///< Reconnect attempts exhausted
    CANCELLED       ///< Caller cancelled
};

std::string clientOutcomeToString(ClientOutcome outcome);

/**
 * @brief Streams one session, surviving connection loss
 *
 * Sends start_log_streaming on every (re)connect so the server replays the
 * retained history, answers pings with pongs and hands each event to the
 * callback exactly once.
 */
class RealtimeClient {
public:
    using EventCallback = std::function<void(const SessionEvent&)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @brief Constructor
     * @param transport Connection to use
     * @param config Client settings
     * @param callback Receives deduplicated events
     * @param sleeper Backoff sleep, defaults to a cancellable wait
     */
    RealtimeClient(std::shared_ptr<Transport> transport,
                   const RealtimeClientConfig& config,
                   EventCallback callback,
                   Sleeper sleeper = nullptr);

    /**
     * @brief Stream until the session ends, reconnects run out or cancellation
     */
    ClientOutcome run(const CancellationToken& cancel);

    size_t getConnectCount() const { return m_connects; }
    size_t getDeliveredCount() const { return m_delivered; }
    size_t getDuplicateCount() const { return m_duplicates; }
    const ReconnectPolicy& getPolicy() const { return m_policy; }

private:
    std::shared_ptr<Transport> m_transport;
    RealtimeClientConfig m_config;
    EventCallback m_callback;
    Sleeper m_sleeper;
    ReconnectPolicy m_policy;
    EventDeduplicator m_dedup;

    size_t m_connects = 0;
    size_t m_delivered = 0;
    size_t m_duplicates = 0;

    bool handleFrame(const std::string& frame);
    void closeQuietly();
};

} // namespace Switchboard
