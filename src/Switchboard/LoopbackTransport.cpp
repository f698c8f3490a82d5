// =================================================================
// src/Switchboard/LoopbackTransport.cpp
// =================================================================
// Implementation of the in-process transport.

#include "Switchboard/LoopbackTransport.hpp"
#include "Switchboard/Errors.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>

namespace Switchboard {

class LoopbackTransport::Inbox : public EventSink {
public:
    bool send(const std::string& frame) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_frames.push_back(frame);
        }
        m_cv.notify_all();
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    /**
     * @return Next frame, nullopt on timeout
     * @throws TransportError once closed and drained
     */
    std::optional<std::string> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return m_closed || !m_frames.empty(); });

        if (!m_frames.empty()) {
            std::string frame = std::move(m_frames.front());
            m_frames.pop_front();
            return frame;
        }
        if (m_closed) {
            throw TransportError("loopback connection closed by server");
        }
        return std::nullopt;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_frames;
    bool m_closed = false;
};

LoopbackTransport::LoopbackTransport(Broadcaster& broadcaster, std::string client_id)
    : m_broadcaster(broadcaster), m_client_id(std::move(client_id)) {
}

LoopbackTransport::~LoopbackTransport() {
    close();
}

void LoopbackTransport::connect() {
    close();
    m_inbox = std::make_shared<Inbox>();
    m_broadcaster.connect(m_client_id, m_inbox);
}

void LoopbackTransport::sendText(const std::string& frame) {
    if (!m_inbox || m_inbox->isClosed()) {
        throw TransportError("loopback connection is not open");
    }
    m_broadcaster.handleClientMessage(m_client_id, frame);
}

std::optional<std::string> LoopbackTransport::receiveText(std::chrono::milliseconds timeout) {
    if (!m_inbox) {
        throw TransportError("loopback connection is not open");
    }
    return m_inbox->pop(timeout);
}

void LoopbackTransport::close() {
    if (!m_inbox) {
        return;
    }
    if (!m_inbox->isClosed()) {
        m_broadcaster.disconnect(m_client_id, "client closed");
    }
    m_inbox.reset();
}

} // namespace Switchboard
