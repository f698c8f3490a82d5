// =================================================================
// src/Switchboard/EventCodec.cpp
// =================================================================
// Implementation of the realtime JSON wire format.

#include "Switchboard/EventCodec.hpp"
#include "Switchboard/Logger.hpp"
#include "nlohmann/json.hpp"

namespace Switchboard {

using json = nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

json baseFrame(const std::string& type, const EventHeader& header, const std::string& status,
               double progress, const std::string& current_task) {
    return json{
        {"type", type},
        {"session_id", header.session_id},
        {"agent_name", header.agent_name},
        {"status", status},
        {"progress", progress},
        {"current_task", current_task},
        {"timestamp", header.timestamp_ms},
        {"sequence", header.sequence}
    };
}

EventHeader readHeader(const json& frame) {
    EventHeader header;
    header.session_id = frame.value("session_id", "");
    header.agent_name = frame.value("agent_name", "");
    header.sequence = frame.value("sequence", static_cast<uint64_t>(0));
    header.timestamp_ms = frame.value("timestamp", static_cast<int64_t>(0));
    return header;
}

std::vector<std::string> readStrings(const json& frame, const char* key) {
    if (frame.contains(key) && frame[key].is_array()) {
        return frame[key].get<std::vector<std::string>>();
    }
    return {};
}

} // namespace

std::string EventCodec::encode(const SessionEvent& event) {
    json frame = std::visit(overloaded{
        [](const SessionStartedEvent& e) {
            json f = baseFrame("session_started", e.header, "STARTED", 0.0, "Session started");
            f["query"] = e.query_text;
            f["agents"] = e.agent_ids;
            f["escalation_required"] = e.escalation_required;
            return f;
        },
        [](const AgentStatusUpdateEvent& e) {
            json f = baseFrame("agent_status_update", e.header, agentStatusToString(e.status),
                               e.progress, e.current_task);
            if (!e.error.empty()) {
                f["error"] = e.error;
            }
            return f;
        },
        [](const PhaseUpdateEvent& e) {
            return baseFrame("phase_update", e.header, sessionStateToString(e.state),
                             e.progress, e.description);
        },
        [](const SessionCompleteEvent& e) {
            json f = baseFrame("session_complete", e.header, sessionStateToString(e.final_state),
                               100.0, e.summary);
            f["failed_agents"] = e.failed_agents;
            f["average_confidence"] = e.average_confidence;
            if (e.human_response) {
                f["human_response"] = *e.human_response;
            }
            return f;
        },
        [](const SessionErrorEvent& e) {
            json f = baseFrame("session_error", e.header, "FAILED", 100.0, e.message);
            f["message"] = e.message;
            f["failed_agents"] = e.failed_agents;
            return f;
        }
    }, event);

    return frame.dump();
}

std::string EventCodec::encode(const PingMessage& ping) {
    return json{{"type", "ping"}, {"timestamp", ping.timestamp_ms}}.dump();
}

std::string EventCodec::encode(const ClientMessage& message) {
    json frame = std::visit(overloaded{
        [](const StartLogStreamingMessage& m) {
            return json{{"type", "start_log_streaming"}, {"session_id", m.session_id}};
        },
        [](const PongMessage& m) {
            return json{{"type", "pong"}, {"timestamp", m.timestamp_ms}};
        }
    }, message);

    return frame.dump();
}

std::optional<ServerMessage> EventCodec::decodeServerMessage(const std::string& frame) {
    try {
        json parsed = json::parse(frame);
        std::string type = parsed.value("type", "");

        if (type == "ping") {
            return ServerMessage{PingMessage{parsed.value("timestamp", static_cast<int64_t>(0))}};
        }

        EventHeader header = readHeader(parsed);
        std::string status = parsed.value("status", "");
        double progress = parsed.value("progress", 0.0);
        std::string current_task = parsed.value("current_task", "");

        if (type == "session_started") {
            SessionStartedEvent e;
            e.header = header;
            e.query_text = parsed.value("query", "");
            e.agent_ids = readStrings(parsed, "agents");
            e.escalation_required = parsed.value("escalation_required", false);
            return ServerMessage{SessionEvent{e}};
        }
        if (type == "agent_status_update") {
            AgentStatusUpdateEvent e;
            e.header = header;
            e.status = stringToAgentStatus(status);
            e.progress = progress;
            e.current_task = current_task;
            e.error = parsed.value("error", "");
            return ServerMessage{SessionEvent{e}};
        }
        if (type == "phase_update") {
            PhaseUpdateEvent e;
            e.header = header;
            e.state = stringToSessionState(status);
            e.progress = progress;
            e.description = current_task;
            return ServerMessage{SessionEvent{e}};
        }
        if (type == "session_complete") {
            SessionCompleteEvent e;
            e.header = header;
            e.final_state = stringToSessionState(status);
            e.summary = current_task;
            e.failed_agents = readStrings(parsed, "failed_agents");
            e.average_confidence = parsed.value("average_confidence", 0.0);
            if (parsed.contains("human_response") && parsed["human_response"].is_string()) {
                e.human_response = parsed["human_response"].get<std::string>();
            }
            return ServerMessage{SessionEvent{e}};
        }
        if (type == "session_error") {
            SessionErrorEvent e;
            e.header = header;
            e.message = parsed.value("message", current_task);
            e.failed_agents = readStrings(parsed, "failed_agents");
            return ServerMessage{SessionEvent{e}};
        }

        Logger::getInstance().warning("EventCodec", "Ignoring unknown server frame type", type);
        return std::nullopt;

    } catch (const json::exception& e) {
        Logger::getInstance().warning("EventCodec", "Malformed server frame", e.what());
        return std::nullopt;
    }
}

std::optional<ClientMessage> EventCodec::decodeClientMessage(const std::string& frame) {
    try {
        json parsed = json::parse(frame);
        std::string type = parsed.value("type", "");

        if (type == "start_log_streaming") {
            std::string session_id = parsed.value("session_id", "");
            if (session_id.empty()) {
                Logger::getInstance().warning("EventCodec", "start_log_streaming without session_id");
                return std::nullopt;
            }
            return ClientMessage{StartLogStreamingMessage{session_id}};
        }
        if (type == "pong") {
            return ClientMessage{PongMessage{parsed.value("timestamp", static_cast<int64_t>(0))}};
        }

        Logger::getInstance().warning("EventCodec", "Ignoring unknown client message type", type);
        return std::nullopt;

    } catch (const json::exception& e) {
        Logger::getInstance().warning("EventCodec", "Malformed client frame", e.what());
        return std::nullopt;
    }
}

} // namespace Switchboard
