// =================================================================
// src/Switchboard/BoundedEventQueue.cpp
// =================================================================
// Implementation of the bounded event queue.

#include "Switchboard/BoundedEventQueue.hpp"
#include <algorithm>
#include <iterator>

namespace Switchboard {

BoundedEventQueue::BoundedEventQueue(size_t capacity)
    : m_capacity(std::max<size_t>(1, capacity)) {
}

bool BoundedEventQueue::push(const SessionEvent& event) {
    if (m_events.size() < m_capacity) {
        m_events.push_back(event);
        return true;
    }

    const EventHeader& incoming = headerOf(event);

    auto same_agent = std::find_if(m_events.begin(), m_events.end(), [&incoming](const SessionEvent& queued) {
        const EventHeader& header = headerOf(queued);
        return isDroppable(queued) &&
               header.session_id == incoming.session_id &&
               header.agent_name == incoming.agent_name;
    });

    auto victim = same_agent != m_events.end()
        ? same_agent
        : std::find_if(m_events.begin(), m_events.end(), isDroppable);

    if (victim != m_events.end()) {
        m_events.erase(victim);
        m_dropped++;
        m_events.push_back(event);
        return false;
    }

    // Only terminal or structural events are queued
    if (isDroppable(event)) {
        m_dropped++;
        return false;
    }

    m_events.push_back(event);
    return true;
}

std::optional<SessionEvent> BoundedEventQueue::pop() {
    if (m_events.empty()) {
        return std::nullopt;
    }
    SessionEvent event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

std::vector<SessionEvent> BoundedEventQueue::drain() {
    std::vector<SessionEvent> events(std::make_move_iterator(m_events.begin()),
                                     std::make_move_iterator(m_events.end()));
    m_events.clear();
    return events;
}

std::vector<SessionEvent> BoundedEventQueue::items() const {
    return std::vector<SessionEvent>(m_events.begin(), m_events.end());
}

void BoundedEventQueue::clear() {
    m_events.clear();
}

bool BoundedEventQueue::isDroppable(const SessionEvent& event) {
    if (const auto* update = std::get_if<AgentStatusUpdateEvent>(&event)) {
        return !isTerminal(update->status);
    }
    return std::holds_alternative<PhaseUpdateEvent>(event);
}

} // namespace Switchboard
