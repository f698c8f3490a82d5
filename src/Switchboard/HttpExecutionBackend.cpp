// =================================================================
// src/Switchboard/HttpExecutionBackend.cpp
// =================================================================
// Implementation of the HTTP execution backend.

#include "Switchboard/HttpExecutionBackend.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <algorithm>

namespace Switchboard {

HttpExecutionBackend::HttpExecutionBackend(const HttpBackendConfig& config)
    : m_config(config) {
    Logger::getInstance().info("HttpExecutionBackend", "Configured agent service", m_config.base_url);
}

ExecutionResult HttpExecutionBackend::execute(const std::string& agent_id,
                                              const Query& query,
                                              const CancellationToken& cancel,
                                              const ProgressCallback& on_progress) {
    if (cancel.isCancelled()) {
        throw AgentTaskError(agent_id, "cancelled");
    }

    if (on_progress) {
        on_progress(0.0, "Sending request to agent service");
    }

    httplib::Client client(m_config.base_url.c_str());
    client.set_connection_timeout(m_config.connection_timeout_sec);
    client.set_read_timeout(m_config.read_timeout_sec);

    httplib::Headers headers = {{"Accept", "application/json"}};
    if (!m_config.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + m_config.api_key);
    }

    auto res = client.Post(endpointFor(agent_id).c_str(), headers,
                           buildRequestBody(agent_id, query), "application/json");

    if (!res) {
        throw AgentTaskError(agent_id, "failed to connect to agent service at " + m_config.base_url);
    }

    if (res->status != 200) {
        throw AgentTaskError(agent_id, "agent service returned status " +
                             std::to_string(res->status) + ": " + res->body);
    }

    if (cancel.isCancelled()) {
        throw AgentTaskError(agent_id, "cancelled");
    }

    ExecutionResult result = parseResponseBody(agent_id, res->body);

    if (on_progress) {
        on_progress(1.0, "Response received");
    }

    return result;
}

std::string HttpExecutionBackend::endpointFor(const std::string& agent_id) {
    return "/agents/" + agent_id + "/execute";
}

std::string HttpExecutionBackend::buildRequestBody(const std::string& agent_id, const Query& query) {
    nlohmann::json body = {
        {"agent_id", agent_id},
        {"query", query.text},
        {"session_id", query.session_id}
    };
    if (!query.context.empty()) {
        body["context"] = query.context;
    }
    return body.dump();
}

ExecutionResult HttpExecutionBackend::parseResponseBody(const std::string& agent_id, const std::string& body) {
    try {
        auto json = nlohmann::json::parse(body);

        if (!json.contains("content") || !json["content"].is_string()) {
            throw AgentTaskError(agent_id, "response has no content");
        }

        if (json.contains("confidence") && !json["confidence"].is_number()) {
            throw AgentTaskError(agent_id, "response confidence is not a number");
        }

        ExecutionResult result;
        result.content = json["content"].get<std::string>();
        result.confidence = std::max(0.0, std::min(1.0, json.value("confidence", 0.0)));
        return result;

    } catch (const nlohmann::json::exception& e) {
        throw AgentTaskError(agent_id, "malformed response: " + std::string(e.what()));
    }
}

} // namespace Switchboard
