// =================================================================
// src/Switchboard/RealtimeClient.cpp
// =================================================================
// Implementation of the reconnecting realtime client.

#include "Switchboard/RealtimeClient.hpp"
#include "Switchboard/EventCodec.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <algorithm>

namespace Switchboard {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string clientOutcomeToString(ClientOutcome outcome) {
    switch (outcome) {
        case ClientOutcome::COMPLETED: return "COMPLETED";
        case ClientOutcome::DISCONNECTED: return "DISCONNECTED";
        case ClientOutcome::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

// ReconnectPolicy

ReconnectPolicy::ReconnectPolicy(const ReconnectConfig& config)
    : m_config(config) {
}

std::optional<std::chrono::milliseconds> ReconnectPolicy::nextDelay() {
    if (m_attempts >= m_config.max_attempts) {
        return std::nullopt;
    }

    double delay = static_cast<double>(m_config.initial_delay.count());
    for (size_t i = 0; i < m_attempts; ++i) {
        delay *= m_config.multiplier;
        if (delay >= static_cast<double>(m_config.max_delay.count())) {
            break;
        }
    }
    m_attempts++;

    auto capped = std::min(static_cast<std::chrono::milliseconds::rep>(delay), m_config.max_delay.count());
    return std::chrono::milliseconds(capped);
}

void ReconnectPolicy::reset() {
    m_attempts = 0;
}

// EventDeduplicator

bool EventDeduplicator::accept(const EventHeader& header) {
    auto key = std::make_pair(header.session_id, header.agent_name);
    auto it = m_last_seen.find(key);
    if (it != m_last_seen.end() && header.sequence <= it->second) {
        return false;
    }
    m_last_seen[key] = header.sequence;
    return true;
}

void EventDeduplicator::forgetSession(const std::string& session_id) {
    for (auto it = m_last_seen.begin(); it != m_last_seen.end();) {
        if (it->first.first == session_id) {
            it = m_last_seen.erase(it);
        } else {
            ++it;
        }
    }
}

// RealtimeClient

RealtimeClient::RealtimeClient(std::shared_ptr<Transport> transport,
                               const RealtimeClientConfig& config,
                               EventCallback callback,
                               Sleeper sleeper)
    : m_transport(std::move(transport)),
      m_config(config),
      m_callback(std::move(callback)),
      m_sleeper(std::move(sleeper)),
      m_policy(config.reconnect) {

    if (!m_transport) {
        throw SwitchboardError("Realtime client requires a transport");
    }
}

ClientOutcome RealtimeClient::run(const CancellationToken& cancel) {
    const std::string& session_id = m_config.session_id;
    m_policy.reset();

    while (!cancel.isCancelled()) {
        try {
            m_transport->connect();
            m_connects++;
            m_policy.reset();
            Logger::getInstance().debug("RealtimeClient", "Connected", session_id);

            m_transport->sendText(EventCodec::encode(ClientMessage{StartLogStreamingMessage{session_id}}));

            while (!cancel.isCancelled()) {
                auto frame = m_transport->receiveText(m_config.receive_timeout);
                if (frame && handleFrame(*frame)) {
                    closeQuietly();
                    return ClientOutcome::COMPLETED;
                }
            }

        } catch (const TransportError& e) {
            Logger::getInstance().warning("RealtimeClient", e.what(), session_id);
            closeQuietly();

            auto delay = m_policy.nextDelay();
            if (!delay) {
                Logger::getInstance().error("RealtimeClient",
                    "Giving up after " + std::to_string(m_policy.attempts()) + " reconnect attempts", session_id);
                return ClientOutcome::DISCONNECTED;
            }

            Logger::getInstance().info("RealtimeClient",
                "Reconnecting in " + std::to_string(delay->count()) + "ms",
                "attempt " + std::to_string(m_policy.attempts()));

            if (m_sleeper) {
                m_sleeper(*delay);
            } else {
                cancel.waitFor(*delay);
            }
        }
    }

    closeQuietly();
    return ClientOutcome::CANCELLED;
}

bool RealtimeClient::handleFrame(const std::string& frame) {
    auto message = EventCodec::decodeServerMessage(frame);
    if (!message) {
        return false;
    }

    return std::visit(overloaded{
        [this](const PingMessage& ping) {
            m_transport->sendText(EventCodec::encode(ClientMessage{PongMessage{ping.timestamp_ms}}));
            return false;
        },
        [this](const SessionEvent& event) {
            if (headerOf(event).session_id != m_config.session_id) {
                return false;
            }
            if (!m_dedup.accept(headerOf(event))) {
                m_duplicates++;
                return false;
            }

            m_delivered++;
            if (m_callback) {
                try {
                    m_callback(event);
                } catch (const std::exception& e) {
                    Logger::getInstance().error("RealtimeClient", "Event callback failed", e.what());
                }
            }

            return isSessionEndEvent(event);
        }
    }, *message);
}

void RealtimeClient::closeQuietly() {
    try {
        m_transport->close();
    } catch (const TransportError& e) {
        Logger::getInstance().debug("RealtimeClient", "Close failed", e.what());
    }
}

} // namespace Switchboard
