// =================================================================
// include/Switchboard/HumanEscalationChannel.hpp
// =================================================================
// Channel through which escalated sessions reach a human operator.

#pragma once

#include "Switchboard/SessionTypes.hpp"
#include "Switchboard/CancellationToken.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <map>
#include <mutex>
#include <condition_variable>

namespace Switchboard {

/**
 * @brief Hands an escalation to a human and waits for the answer
 */
class HumanEscalationChannel {
public:
    virtual ~HumanEscalationChannel() = default;

    /**
     * @brief Escalate and wait for a human response
     * @param record Pending escalation
     * @param cancel Session cancellation token
     * @param timeout Maximum time to wait
     * @return Human response, or nullopt on timeout or cancellation
     */
    virtual std::optional<std::string> escalate(const EscalationRecord& record,
                                                const CancellationToken& cancel,
                                                std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Keeps pending escalations in a queue that an operator works through
 *
 * escalate() blocks the calling session until resolve() is called for the
 * same session id, the session is cancelled, or the timeout passes.
 */
class QueuedEscalationChannel : public HumanEscalationChannel {
public:
    QueuedEscalationChannel() = default;

    std::optional<std::string> escalate(const EscalationRecord& record,
                                        const CancellationToken& cancel,
                                        std::chrono::milliseconds timeout) override;

    /**
     * @brief Answer a pending escalation
     * @param session_id Escalated session
     * @param response Human response text
     * @return False if nothing is pending for the session
     */
    bool resolve(const std::string& session_id, const std::string& response);

    /**
     * @brief Pending escalations, highest priority first then oldest first
     */
    std::vector<EscalationRecord> getPending() const;

    size_t pendingCount() const;

    /**
     * @brief Block until something is pending or the timeout passes
     * @return True if at least one escalation is pending
     */
    bool waitForPending(std::chrono::milliseconds timeout) const;

private:
    struct PendingEntry {
        EscalationRecord record;
        std::optional<std::string> response;
    };

    std::map<std::string, PendingEntry> m_pending;
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;

    static constexpr std::chrono::milliseconds kPollInterval{50};
};

} // namespace Switchboard
