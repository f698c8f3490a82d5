// =================================================================
// src/Switchboard/AsyncLineReader.cpp
// =================================================================
// Implementation of the background line reader.

#include "Switchboard/AsyncLineReader.hpp"
#include <thread>

namespace Switchboard {

AsyncLineReader::AsyncLineReader(std::istream& input)
    : m_input(input), m_state(std::make_shared<State>()) {
}

bool AsyncLineReader::request() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->eof) {
            return false;
        }
        if (m_state->reading || m_state->line) {
            return true;
        }
        m_state->reading = true;
    }

    std::thread([state = m_state, &input = m_input]() {
        std::string line;
        bool ok = static_cast<bool>(std::getline(input, line));
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->reading = false;
            state->eof = !ok;
            state->line = ok ? line : std::string();
        }
        state->cv.notify_all();
    }).detach();
    return true;
}

std::optional<std::string> AsyncLineReader::poll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    m_state->cv.wait_for(lock, timeout, [this] { return m_state->line.has_value(); });

    std::optional<std::string> line;
    line.swap(m_state->line);
    return line;
}

bool AsyncLineReader::isReading() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->reading;
}

} // namespace Switchboard
