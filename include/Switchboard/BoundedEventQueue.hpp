// =================================================================
// include/Switchboard/BoundedEventQueue.hpp
// =================================================================
// Bounded FIFO of session events that never drops terminal events.

#pragma once

#include "Switchboard/SessionEvents.hpp"
#include <deque>
#include <optional>
#include <vector>

namespace Switchboard {

/**
 * @brief Bounded event queue with a terminal-preserving overflow policy
 *
 * On overflow the oldest droppable event is removed, preferring one from the
 * same session and agent as the incoming event. Agent status updates that are
 * not FINISHED/ERROR and phase updates are droppable. Everything else,
 * terminal events in particular, is kept even if the queue must grow past its
 * capacity. Not thread-safe; the owner serializes access.
 */
class BoundedEventQueue {
public:
    explicit BoundedEventQueue(size_t capacity = 256);

    /**
     * @brief Append an event, applying the overflow policy
     * @param event Event to append
     * @return False if an event (possibly the incoming one) was dropped
     */
    bool push(const SessionEvent& event);

    /**
     * @brief Remove and return the oldest event
     */
    std::optional<SessionEvent> pop();

    /**
     * @brief Remove and return every queued event, oldest first
     */
    std::vector<SessionEvent> drain();

    /**
     * @brief Copy of the queued events, oldest first
     */
    std::vector<SessionEvent> items() const;

    void clear();

    size_t size() const { return m_events.size(); }
    bool empty() const { return m_events.empty(); }
    size_t capacity() const { return m_capacity; }
    size_t droppedCount() const { return m_dropped; }

    /**
     * @brief Whether the overflow policy may discard this event
     */
    static bool isDroppable(const SessionEvent& event);

private:
    std::deque<SessionEvent> m_events;
    size_t m_capacity;
    size_t m_dropped = 0;
};

} // namespace Switchboard
