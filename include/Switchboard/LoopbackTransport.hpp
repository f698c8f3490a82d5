// =================================================================
// include/Switchboard/LoopbackTransport.hpp
// =================================================================
// In-process transport joining a RealtimeClient to a Broadcaster.

#pragma once

#include "Switchboard/RealtimeClient.hpp"
#include "Switchboard/Broadcaster.hpp"
#include <memory>
#include <string>

namespace Switchboard {

/**
 * @brief Transport whose far end is a Broadcaster in the same process
 *
 * connect() registers an inbox sink with the broadcaster under client_id.
 * When the broadcaster drops the client (failed send, missed pong) the next
 * receive throws TransportError, exactly like a network connection.
 */
class LoopbackTransport : public Transport {
public:
    LoopbackTransport(Broadcaster& broadcaster, std::string client_id);
    ~LoopbackTransport() override;

    void connect() override;
    void sendText(const std::string& frame) override;
    std::optional<std::string> receiveText(std::chrono::milliseconds timeout) override;
    void close() override;

    const std::string& getClientId() const { return m_client_id; }

private:
    class Inbox;

    Broadcaster& m_broadcaster;
    std::string m_client_id;
    std::shared_ptr<Inbox> m_inbox;
};

} // namespace Switchboard
