// =================================================================
// include/Switchboard/HttpExecutionBackend.hpp
// =================================================================
// Execution backend that calls a remote agent service over HTTP.

#pragma once

#include "Switchboard/ExecutionBackend.hpp"
#include <string>

namespace Switchboard {

/**
 * @brief HTTP backend configuration
 */
struct HttpBackendConfig {
    std::string base_url = "http://localhost:8000"; ///< scheme://host:port of the agent service
    int connection_timeout_sec = 10;                ///< Connect timeout
    int read_timeout_sec = 120;                     ///< Read timeout
    std::string api_key;                            ///< Sent as a bearer token when set
};

/**
 * @brief Posts {agent_id, query, session_id} to <base_url>/agents/<agent_id>/execute
 *
 * The service answers with {"content": "...", "confidence": 0.87}.
 */
class HttpExecutionBackend : public ExecutionBackend {
public:
    explicit HttpExecutionBackend(const HttpBackendConfig& config = HttpBackendConfig());

    ExecutionResult execute(const std::string& agent_id,
                            const Query& query,
                            const CancellationToken& cancel,
                            const ProgressCallback& on_progress) override;

    std::string getName() const override { return "http"; }

    /**
     * @brief Request path for an agent
     */
    static std::string endpointFor(const std::string& agent_id);

    /**
     * @brief JSON request body
     */
    static std::string buildRequestBody(const std::string& agent_id, const Query& query);

    /**
     * @brief Parse a JSON response body
     *
     * A missing confidence reads as 0. Confidence is clamped to [0, 1].
     *
     * @throws AgentTaskError if the body is malformed, has no string content
     *         or has a non-numeric confidence
     */
    static ExecutionResult parseResponseBody(const std::string& agent_id, const std::string& body);

private:
    HttpBackendConfig m_config;
};

} // namespace Switchboard
