// =================================================================
// src/Switchboard/Broadcaster.cpp
// =================================================================
// Implementation of the realtime event hub.

#include "Switchboard/Broadcaster.hpp"
#include "Switchboard/EventCodec.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <utility>

namespace Switchboard {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Broadcaster::Broadcaster(const BroadcasterConfig& config)
    : m_config(config) {
}

Broadcaster::~Broadcaster() {
    stop();
}

void Broadcaster::connect(const std::string& client_id, std::shared_ptr<EventSink> sink,
                          std::chrono::steady_clock::time_point now) {
    if (!sink) {
        throw SwitchboardError("Client " + client_id + " connected without a sink");
    }

    std::shared_ptr<EventSink> replaced;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_clients.find(client_id);
        if (it != m_clients.end()) {
            replaced = it->second->sink;
        }

        auto client = std::make_unique<ClientState>(m_config.client_queue_capacity);
        client->sink = std::move(sink);
        client->last_ping = now;
        m_clients[client_id] = std::move(client);
        m_stats.connected_clients = m_clients.size();
    }

    if (replaced) {
        Logger::getInstance().info("Broadcaster", "Replacing existing connection", client_id);
        replaced->close();
    }
    Logger::getInstance().info("Broadcaster", "Client connected", client_id);
}

void Broadcaster::disconnect(const std::string& client_id, const std::string& reason) {
    std::shared_ptr<EventSink> sink;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_clients.find(client_id);
        if (it == m_clients.end()) {
            return;
        }
        sink = it->second->sink;
        m_clients.erase(it);
        m_stats.connected_clients = m_clients.size();
        m_stats.disconnects++;
    }

    Logger::getInstance().info("Broadcaster", "Client disconnected: " + reason, client_id);
    sink->close();
}

bool Broadcaster::isConnected(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clients.count(client_id) > 0;
}

bool Broadcaster::subscribe(const std::string& client_id, const std::string& session_id, bool replay) {
    size_t replayed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_clients.find(client_id);
        if (it == m_clients.end()) {
            return false;
        }

        ClientState& client = *it->second;
        client.sessions.insert(session_id);

        if (replay) {
            auto history = m_history.find(session_id);
            if (history != m_history.end()) {
                for (const auto& event : history->second.items()) {
                    enqueue(client, event);
                    replayed++;
                }
            }
        }
    }

    Logger::getInstance().info("Broadcaster",
        "Client " + client_id + " streaming " + session_id, "replayed " + std::to_string(replayed) + " event(s)");
    wakePump();
    return true;
}

void Broadcaster::handleClientMessage(const std::string& client_id, const std::string& frame,
                                      std::chrono::steady_clock::time_point now) {
    auto message = EventCodec::decodeClientMessage(frame);
    if (!message) {
        return;
    }

    std::visit(overloaded{
        [&](const StartLogStreamingMessage& start) {
            if (!subscribe(client_id, start.session_id, true)) {
                Logger::getInstance().warning("Broadcaster", "start_log_streaming from unknown client", client_id);
            }
        },
        [&](const PongMessage&) {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_clients.find(client_id);
            if (it != m_clients.end()) {
                it->second->awaiting_pong_since.reset();
                it->second->last_ping = now;
            }
        }
    }, *message);
}

void Broadcaster::onSessionEvent(const SessionEvent& event) {
    const std::string& session_id = headerOf(event).session_id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto history = m_history.find(session_id);
        if (history == m_history.end()) {
            history = m_history.emplace(session_id, BoundedEventQueue(m_config.history_capacity)).first;
        }
        history->second.push(event);
        m_stats.tracked_sessions = m_history.size();
        m_stats.events_published++;

        for (auto& [client_id, client] : m_clients) {
            if (wantsSession(*client, session_id)) {
                enqueue(*client, event);
            }
        }
    }
    wakePump();
}

size_t Broadcaster::flush() {
    std::lock_guard<std::mutex> flush_lock(m_flush_mutex);

    std::vector<std::pair<std::string, std::shared_ptr<EventSink>>> targets;
    std::vector<std::vector<std::string>> frames;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [client_id, client] : m_clients) {
            if (client->queue.empty()) {
                continue;
            }
            std::vector<std::string> encoded;
            for (const auto& event : client->queue.drain()) {
                encoded.push_back(EventCodec::encode(event));
            }
            targets.emplace_back(client_id, client->sink);
            frames.push_back(std::move(encoded));
        }
    }

    size_t sent = 0;
    std::vector<std::string> broken;
    for (size_t i = 0; i < targets.size(); ++i) {
        for (const auto& frame : frames[i]) {
            if (!sendFrame(targets[i].first, *targets[i].second, frame)) {
                broken.push_back(targets[i].first);
                break;
            }
            sent++;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.frames_sent += sent;
    }

    for (const auto& client_id : broken) {
        disconnect(client_id, "send failed");
    }
    return sent;
}

void Broadcaster::checkKeepalive(std::chrono::steady_clock::time_point now) {
    std::vector<std::string> expired;
    std::vector<std::pair<std::string, std::shared_ptr<EventSink>>> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [client_id, client] : m_clients) {
            if (client->awaiting_pong_since) {
                if (now - *client->awaiting_pong_since >= m_config.pong_timeout) {
                    expired.push_back(client_id);
                }
            } else if (now - client->last_ping >= m_config.ping_interval) {
                client->awaiting_pong_since = now;
                client->last_ping = now;
                due.emplace_back(client_id, client->sink);
            }
        }
    }

    for (const auto& client_id : expired) {
        disconnect(client_id, "pong timeout");
    }

    if (due.empty()) {
        return;
    }

    PingMessage ping{currentTimestampMs()};
    std::string frame = EventCodec::encode(ping);
    std::lock_guard<std::mutex> flush_lock(m_flush_mutex);
    for (const auto& [client_id, sink] : due) {
        if (!sendFrame(client_id, *sink, frame)) {
            disconnect(client_id, "ping failed");
        }
    }
}

void Broadcaster::start() {
    if (m_pump_thread && m_pump_thread->joinable()) {
        return; // Already running
    }

    m_stop_pump = false;
    m_pump_thread = std::make_unique<std::thread>(&Broadcaster::pumpLoop, this);
    Logger::getInstance().info("Broadcaster", "Started delivery thread");
}

void Broadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(m_pump_mutex);
        m_stop_pump = true;
    }
    m_pump_cv.notify_all();
    if (m_pump_thread && m_pump_thread->joinable()) {
        m_pump_thread->join();
        Logger::getInstance().info("Broadcaster", "Stopped delivery thread");
    }
}

void Broadcaster::forgetSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.erase(session_id);
    m_stats.tracked_sessions = m_history.size();
}

std::vector<SessionEvent> Broadcaster::getHistory(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_history.find(session_id);
    if (it == m_history.end()) {
        return {};
    }
    return it->second.items();
}

size_t Broadcaster::queuedFor(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_clients.find(client_id);
    return it == m_clients.end() ? 0 : it->second->queue.size();
}

BroadcasterStats Broadcaster::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void Broadcaster::enqueue(ClientState& client, const SessionEvent& event) {
    size_t dropped_before = client.queue.droppedCount();
    client.queue.push(event);
    m_stats.events_dropped += client.queue.droppedCount() - dropped_before;
}

bool Broadcaster::wantsSession(const ClientState& client, const std::string& session_id) {
    return client.sessions.empty() || client.sessions.count(session_id) > 0;
}

void Broadcaster::wakePump() {
    {
        std::lock_guard<std::mutex> lock(m_pump_mutex);
        m_pump_pending = true;
    }
    m_pump_cv.notify_all();
}

bool Broadcaster::sendFrame(const std::string& client_id, EventSink& sink, const std::string& frame) {
    try {
        return sink.send(frame);
    } catch (const TransportError& e) {
        Logger::getInstance().warning("Broadcaster", e.what(), client_id);
        return false;
    } catch (const std::exception& e) {
        // Any sink failure ends the connection, the delivery thread keeps running
        Logger::getInstance().error("Broadcaster", "Sink threw: " + std::string(e.what()), client_id);
        return false;
    }
}

void Broadcaster::pumpLoop() {
    while (!m_stop_pump) {
        {
            std::unique_lock<std::mutex> lock(m_pump_mutex);
            m_pump_cv.wait_for(lock, m_config.pump_interval, [this] {
                return m_stop_pump.load() || m_pump_pending;
            });
            m_pump_pending = false;
        }

        if (m_stop_pump) {
            break;
        }

        flush();
        checkKeepalive();
    }

    // Deliver what is left, terminal events included
    flush();
}

} // namespace Switchboard
