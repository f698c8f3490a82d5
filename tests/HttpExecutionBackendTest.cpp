// =================================================================
// tests/HttpExecutionBackendTest.cpp
// =================================================================
// Unit tests for the HTTP execution backend payloads and error mapping.

#include "Switchboard/HttpExecutionBackend.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <cassert>
#include <cmath>

class HttpExecutionBackendTest {
private:
    static Switchboard::Query makeQuery() {
        Switchboard::Query query;
        query.text = "My webhook is failing";
        query.session_id = "session_http";
        return query;
    }

    // Returns the AgentTaskError reason, or an empty string if nothing was thrown
    static std::string parseFailure(const std::string& body) {
        try {
            Switchboard::HttpExecutionBackend::parseResponseBody("technical_support", body);
        } catch (const Switchboard::AgentTaskError& e) {
            assert(e.agentId() == "technical_support" && "Error should name the agent");
            return e.reason();
        }
        return "";
    }

public:
    void testEndpoint() {
        std::cout << "Testing endpoint path..." << std::endl;

        assert(Switchboard::HttpExecutionBackend::endpointFor("billing_support") == "/agents/billing_support/execute");

        std::cout << "✓ Endpoint path test passed" << std::endl;
    }

    void testRequestBody() {
        std::cout << "Testing request body..." << std::endl;

        auto query = makeQuery();
        auto body = nlohmann::json::parse(
            Switchboard::HttpExecutionBackend::buildRequestBody("technical_support", query));

        assert(body["agent_id"] == "technical_support" && "Body should carry the agent id");
        assert(body["query"] == "My webhook is failing" && "Body should carry the query text");
        assert(body["session_id"] == "session_http" && "Body should carry the session id");
        assert(!body.contains("context") && "Empty context should be omitted");

        query.context = {{"customer_id", "c-42"}, {"plan", "pro"}};
        auto with_context = nlohmann::json::parse(
            Switchboard::HttpExecutionBackend::buildRequestBody("technical_support", query));
        assert(with_context["context"]["customer_id"] == "c-42" && "Context should be forwarded");
        assert(with_context["context"]["plan"] == "pro");

        std::cout << "✓ Request body test passed" << std::endl;
    }

    void testResponseParsing() {
        std::cout << "Testing response parsing..." << std::endl;

        auto result = Switchboard::HttpExecutionBackend::parseResponseBody(
            "technical_support", R"({"content": "Renew the certificate", "confidence": 0.87})");
        assert(result.content == "Renew the certificate" && "Content should be read");
        assert(std::fabs(result.confidence - 0.87) < 1e-9 && "Confidence should be read");

        auto no_confidence = Switchboard::HttpExecutionBackend::parseResponseBody(
            "technical_support", R"({"content": "Done"})");
        assert(no_confidence.confidence == 0.0 && "Missing confidence reads as zero");

        auto high = Switchboard::HttpExecutionBackend::parseResponseBody(
            "technical_support", R"({"content": "Sure", "confidence": 3.5})");
        assert(high.confidence == 1.0 && "Confidence should clamp to 1");

        auto low = Switchboard::HttpExecutionBackend::parseResponseBody(
            "technical_support", R"({"content": "Maybe", "confidence": -0.4})");
        assert(low.confidence == 0.0 && "Confidence should clamp to 0");

        std::cout << "✓ Response parsing test passed" << std::endl;
    }

    void testMalformedResponses() {
        std::cout << "Testing malformed responses..." << std::endl;

        assert(parseFailure(R"({"confidence": 0.9})") == "response has no content" && "Missing content");
        assert(parseFailure(R"({"content": 42, "confidence": 0.9})") == "response has no content" &&
               "Non-string content");
        assert(parseFailure(R"({"content": "ok", "confidence": "high"})") == "response confidence is not a number" &&
               "Non-numeric confidence");
        assert(parseFailure("not json at all").rfind("malformed response", 0) == 0 && "Broken JSON");
        assert(parseFailure("").rfind("malformed response", 0) == 0 && "Empty body");
        assert(parseFailure(R"(["content", "ok"])") == "response has no content" && "Array body");

        std::cout << "✓ Malformed responses test passed" << std::endl;
    }

    void testCancelledBeforeRequest() {
        std::cout << "Testing cancellation before the request..." << std::endl;

        Switchboard::HttpBackendConfig config;
        config.base_url = "http://127.0.0.1:1";
        Switchboard::HttpExecutionBackend backend(config);
        assert(backend.getName() == "http");

        Switchboard::CancellationToken cancel;
        cancel.cancel();

        bool progressed = false;
        std::string reason;
        try {
            backend.execute("technical_support", makeQuery(), cancel,
                [&progressed](double, const std::string&) { progressed = true; });
        } catch (const Switchboard::AgentTaskError& e) {
            reason = e.reason();
        }
        assert(reason == "cancelled" && "Cancelled call should fail fast");
        assert(!progressed && "No progress before the request is sent");

        std::cout << "✓ Cancellation before the request test passed" << std::endl;
    }

    void testUnreachableService() {
        std::cout << "Testing unreachable service..." << std::endl;

        Switchboard::HttpBackendConfig config;
        config.base_url = "http://127.0.0.1:1";
        config.connection_timeout_sec = 1;
        config.read_timeout_sec = 1;
        Switchboard::HttpExecutionBackend backend(config);

        Switchboard::CancellationToken cancel;
        std::string reason;
        try {
            backend.execute("technical_support", makeQuery(), cancel, nullptr);
        } catch (const Switchboard::AgentTaskError& e) {
            reason = e.reason();
        }
        assert(reason.find("failed to connect") != std::string::npos && "Connection failure should be reported");

        std::cout << "✓ Unreachable service test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running HttpExecutionBackend Tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;

        testEndpoint();
        std::cout << std::endl;

        testRequestBody();
        std::cout << std::endl;

        testResponseParsing();
        std::cout << std::endl;

        testMalformedResponses();
        std::cout << std::endl;

        testCancelledBeforeRequest();
        std::cout << std::endl;

        testUnreachableService();
        std::cout << std::endl;

        std::cout << "All HttpExecutionBackend tests passed!" << std::endl;
    }
};

int main() {
    try {
        Switchboard::Logger::getInstance().setConsoleLogLevel(Switchboard::LogLevel::ERROR);

        HttpExecutionBackendTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All HttpExecutionBackend component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
