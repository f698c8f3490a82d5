// =================================================================
// include/Switchboard/EventCodec.hpp
// =================================================================
// JSON wire format for realtime frames.

#pragma once

#include "Switchboard/SessionEvents.hpp"
#include <string>
#include <optional>
#include <variant>
#include <cstdint>

namespace Switchboard {

/**
 * @brief Server keepalive probe
 */
struct PingMessage {
    int64_t timestamp_ms = 0;
};

/**
 * @brief Client answer to a ping
 */
struct PongMessage {
    int64_t timestamp_ms = 0;
};

/**
 * @brief Client request to stream a session and replay its history
 */
struct StartLogStreamingMessage {
    std::string session_id;
};

/**
 * @brief Frames a client may send
 */
using ClientMessage = std::variant<StartLogStreamingMessage, PongMessage>;

/**
 * @brief Frames a server may send
 */
using ServerMessage = std::variant<SessionEvent, PingMessage>;

/**
 * @brief Encodes and decodes realtime frames
 *
 * Every event frame carries {type, session_id, agent_name, status, progress,
 * current_task, timestamp, sequence} plus fields specific to its kind.
 */
class EventCodec {
public:
    static std::string encode(const SessionEvent& event);
    static std::string encode(const PingMessage& ping);
    static std::string encode(const ClientMessage& message);

    /**
     * @brief Decode a frame received from the server
     * @param frame JSON text
     * @return Decoded message, or nullopt for malformed or unknown frames
     */
    static std::optional<ServerMessage> decodeServerMessage(const std::string& frame);

    /**
     * @brief Decode a frame received from a client
     * @param frame JSON text
     * @return Decoded message, or nullopt for malformed or unknown frames
     */
    static std::optional<ClientMessage> decodeClientMessage(const std::string& frame);
};

} // namespace Switchboard
