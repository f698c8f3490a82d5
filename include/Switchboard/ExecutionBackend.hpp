// =================================================================
// include/Switchboard/ExecutionBackend.hpp
// =================================================================
// Abstract interface to the service that runs an agent's reasoning.

#pragma once

#include "Switchboard/SessionTypes.hpp"
#include "Switchboard/CancellationToken.hpp"
#include <string>
#include <functional>

namespace Switchboard {

/**
 * @brief Content and confidence returned by one agent
 */
struct ExecutionResult {
    std::string content;        ///< Agent answer
    double confidence = 0.0;    ///< Backend confidence in [0,1]
};

/**
 * @brief Progress report from the backend
 * @param fraction Completed fraction in [0,1]
 * @param task Human-readable description of the current step
 */
using ProgressCallback = std::function<void(double fraction, const std::string& task)>;

/**
 * @brief Opaque execution backend invoked once per dispatched agent
 *
 * Implementations are called concurrently from several agent tasks and must
 * be thread-safe. Failures are reported by throwing AgentTaskError.
 */
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    /**
     * @brief Run one agent against a query
     * @param agent_id Agent to run
     * @param query Query being answered
     * @param cancel Session cancellation token
     * @param on_progress Progress callback, may be empty
     * @return Agent result
     * @throws AgentTaskError on failure or cancellation
     */
    virtual ExecutionResult execute(const std::string& agent_id,
                                    const Query& query,
                                    const CancellationToken& cancel,
                                    const ProgressCallback& on_progress) = 0;

    /**
     * @brief Get backend name for logging
     */
    virtual std::string getName() const = 0;
};

} // namespace Switchboard
