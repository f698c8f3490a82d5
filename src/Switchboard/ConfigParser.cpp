// =================================================================
// src/Switchboard/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Switchboard/ConfigParser.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Switchboard {

namespace {

template <typename T>
void readValue(const YAML::Node& section, const char* key, T& target) {
    if (section && section[key]) {
        target = section[key].as<T>();
    }
}

void readSeconds(const YAML::Node& section, const char* key, std::chrono::seconds& target) {
    if (section && section[key]) {
        target = std::chrono::seconds(section[key].as<long>());
    }
}

void readMillis(const YAML::Node& section, const char* key, std::chrono::milliseconds& target) {
    if (section && section[key]) {
        target = std::chrono::milliseconds(section[key].as<long>());
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path)
    : m_path(config_path) {

    if (!std::filesystem::exists(config_path)) {
        // Defaults apply until `init` writes a file
        return;
    }

    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        throw ConfigError("cannot open " + config_path);
    }

    std::stringstream buffer;
    buffer << config_file.rdbuf();
    m_raw_text = buffer.str();

    m_config = parseString(m_raw_text);
    m_loaded = true;

    Logger::getInstance().debug("ConfigParser", "Loaded configuration", config_path);
}

SwitchboardConfig ConfigParser::parseString(const std::string& yaml_text) {
    SwitchboardConfig config;

    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return config;
        }
        require(root.IsMap(), "configuration root must be a mapping");

        YAML::Node agents = root["agents"];
        readValue(agents, "file", config.index.agents_file);
        readSeconds(agents, "refresh_ttl_seconds", config.index.refresh_ttl);
        readValue(agents, "background_refresh", config.index.enable_background_refresh);
        readValue(agents, "fallback_profile", config.index.enable_fallback_profile);

        YAML::Node routing = root["routing"];
        readValue(routing, "max_recommended", config.orchestrator.selector.max_recommended);
        readValue(routing, "min_recommended_score", config.orchestrator.selector.min_recommended_score);
        readValue(routing, "default_agent", config.orchestrator.selector.default_agent_id);
        readValue(routing, "analyzer_rules", config.analyzer_rules_file);

        YAML::Node escalation = root["escalation"];
        readValue(escalation, "negative_sentiment_threshold",
                  config.orchestrator.escalation.negative_sentiment_threshold);
        readValue(escalation, "broad_match_limit", config.orchestrator.escalation.broad_match_limit);
        if (escalation && escalation["timeout_seconds"]) {
            config.orchestrator.session.escalation_timeout =
                std::chrono::seconds(escalation["timeout_seconds"].as<long>());
        }
        readValue(escalation, "timeout_response", config.orchestrator.session.timeout_response);

        YAML::Node sessions = root["sessions"];
        readSeconds(sessions, "retention_seconds", config.orchestrator.session_retention);

        YAML::Node realtime = root["realtime"];
        readValue(realtime, "client_queue_capacity", config.realtime.client_queue_capacity);
        readValue(realtime, "history_capacity", config.realtime.history_capacity);
        if (realtime && realtime["ping_interval_seconds"]) {
            config.realtime.ping_interval = std::chrono::seconds(realtime["ping_interval_seconds"].as<long>());
        }
        if (realtime && realtime["pong_timeout_seconds"]) {
            config.realtime.pong_timeout = std::chrono::seconds(realtime["pong_timeout_seconds"].as<long>());
        }

        YAML::Node backend = root["backend"];
        readValue(backend, "type", config.backend_type);
        readValue(backend, "url", config.http.base_url);
        readValue(backend, "api_key", config.http.api_key);
        readValue(backend, "connection_timeout_seconds", config.http.connection_timeout_sec);
        readValue(backend, "read_timeout_seconds", config.http.read_timeout_sec);
        readMillis(backend, "simulated_latency_ms", config.simulation.latency);

        YAML::Node logging = root["logging"];
        readValue(logging, "directory", config.log_dir);
        readValue(logging, "level", config.log_level);

    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid YAML: ") + e.what());
    }

    require(config.orchestrator.selector.max_recommended >= 1, "routing.max_recommended must be at least 1");
    require(config.orchestrator.selector.min_recommended_score >= 0.0 &&
            config.orchestrator.selector.min_recommended_score <= 100.0,
            "routing.min_recommended_score must be within [0, 100]");
    require(!config.orchestrator.selector.default_agent_id.empty(), "routing.default_agent must not be empty");
    require(config.orchestrator.session.escalation_timeout.count() > 0, "escalation.timeout_seconds must be positive");
    require(config.realtime.client_queue_capacity > 0, "realtime.client_queue_capacity must be positive");
    require(config.realtime.history_capacity > 0, "realtime.history_capacity must be positive");
    require(config.backend_type == "http" || config.backend_type == "simulated",
            "backend.type must be 'http' or 'simulated', got '" + config.backend_type + "'");

    return config;
}

std::string ConfigParser::defaultConfigYaml() {
    return
        "# Switchboard configuration\n"
        "\n"
        "agents:\n"
        "  file: config/agents.yml\n"
        "  refresh_ttl_seconds: 300\n"
        "  background_refresh: false\n"
        "  fallback_profile: true\n"
        "\n"
        "routing:\n"
        "  max_recommended: 3\n"
        "  min_recommended_score: 30\n"
        "  default_agent: general_support\n"
        "  # analyzer_rules: config/analyzer.yml\n"
        "\n"
        "escalation:\n"
        "  negative_sentiment_threshold: -1\n"
        "  broad_match_limit: 2\n"
        "  timeout_seconds: 300\n"
        "\n"
        "sessions:\n"
        "  retention_seconds: 600\n"
        "\n"
        "realtime:\n"
        "  client_queue_capacity: 256\n"
        "  history_capacity: 512\n"
        "  ping_interval_seconds: 30\n"
        "  pong_timeout_seconds: 10\n"
        "\n"
        "backend:\n"
        "  type: simulated\n"
        "  url: http://localhost:8000\n"
        "  connection_timeout_seconds: 10\n"
        "  read_timeout_seconds: 120\n"
        "  simulated_latency_ms: 400\n"
        "\n"
        "logging:\n"
        "  directory: .switchboard/logs\n"
        "  level: INFO\n";
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    if (m_raw_text.empty()) {
        return "";
    }

    try {
        YAML::Node node = YAML::Load(m_raw_text);
        std::stringstream path(key);
        std::string part;
        while (std::getline(path, part, '.')) {
            if (!node.IsMap()) {
                return "";
            }
            // reset() rebinds; operator= would overwrite the parent's value
            YAML::Node child = static_cast<const YAML::Node&>(node)[part];
            if (!child) {
                return "";
            }
            node.reset(child);
        }
        return node.IsScalar() ? node.as<std::string>() : "";
    } catch (const YAML::Exception& e) {
        Logger::getInstance().warning("ConfigParser", "Lookup failed for " + key, e.what());
        return "";
    }
}

} // namespace Switchboard
