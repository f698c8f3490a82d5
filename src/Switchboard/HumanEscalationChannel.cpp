// =================================================================
// src/Switchboard/HumanEscalationChannel.cpp
// =================================================================
// Implementation of the queued human escalation channel.

#include "Switchboard/HumanEscalationChannel.hpp"
#include "Switchboard/Logger.hpp"
#include <algorithm>

namespace Switchboard {

std::optional<std::string> QueuedEscalationChannel::escalate(const EscalationRecord& record,
                                                             const CancellationToken& cancel,
                                                             std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(m_mutex);
    m_pending[record.session_id] = PendingEntry{record, std::nullopt};
    m_cv.notify_all();

    Logger::getInstance().info("EscalationChannel", "Escalation queued for " + record.session_id,
        "Priority: " + escalationPriorityToString(record.priority) + ", Reasons: " + record.reasonText());

    std::optional<std::string> response;
    while (true) {
        auto it = m_pending.find(record.session_id);
        if (it != m_pending.end() && it->second.response) {
            response = it->second.response;
            break;
        }
        if (cancel.isCancelled()) {
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        // Poll so the session's cancellation token is observed too
        m_cv.wait_for(lock, std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now));
    }

    m_pending.erase(record.session_id);
    return response;
}

bool QueuedEscalationChannel::resolve(const std::string& session_id, const std::string& response) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pending.find(session_id);
        if (it == m_pending.end() || it->second.response) {
            Logger::getInstance().warning("EscalationChannel", "No pending escalation to resolve", session_id);
            return false;
        }
        it->second.response = response;
    }
    m_cv.notify_all();

    Logger::getInstance().info("EscalationChannel", "Escalation resolved by operator", session_id);
    return true;
}

std::vector<EscalationRecord> QueuedEscalationChannel::getPending() const {
    std::vector<EscalationRecord> records;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [session_id, entry] : m_pending) {
            if (!entry.response) {
                records.push_back(entry.record);
            }
        }
    }

    std::sort(records.begin(), records.end(), [](const EscalationRecord& a, const EscalationRecord& b) {
        if (a.priority != b.priority) {
            return static_cast<int>(a.priority) > static_cast<int>(b.priority);
        }
        return a.triggered_at < b.triggered_at;
    });
    return records;
}

size_t QueuedEscalationChannel::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_pending.begin(), m_pending.end(),
        [](const auto& item) { return !item.second.response; }));
}

bool QueuedEscalationChannel::waitForPending(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] {
        return std::any_of(m_pending.begin(), m_pending.end(),
            [](const auto& item) { return !item.second.response; });
    });
}

} // namespace Switchboard
