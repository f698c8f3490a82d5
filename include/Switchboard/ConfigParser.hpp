// =================================================================
// include/Switchboard/ConfigParser.hpp
// =================================================================
// Reads .switchboard/config.yml into a SwitchboardConfig.

#pragma once

#include "Switchboard/AgentIndex.hpp"
#include "Switchboard/Orchestrator.hpp"
#include "Switchboard/Broadcaster.hpp"
#include "Switchboard/HttpExecutionBackend.hpp"
#include "Switchboard/SimulatedExecutionBackend.hpp"
#include <string>

namespace Switchboard {

/**
 * @brief Complete application configuration
 */
struct SwitchboardConfig {
    IndexConfig index;                      ///< Agent index source and refresh
    OrchestratorConfig orchestrator;        ///< Routing, escalation and session settings
    BroadcasterConfig realtime;             ///< Realtime queues and keepalive
    std::string analyzer_rules_file;        ///< Optional analyzer lexicon override

    std::string backend_type = "simulated"; ///< "http" or "simulated"
    HttpBackendConfig http;                 ///< Used when backend_type is "http"
    SimulationConfig simulation;            ///< Used when backend_type is "simulated"

    std::string log_dir = ".switchboard/logs";
    std::string log_level = "INFO";
};

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * A missing file leaves every setting at its default, e.g. before `init`.
     *
     * @param config_path The path to the config.yml file.
     * @throws ConfigError if the file exists but is not valid
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Parse configuration from YAML text
     * @throws ConfigError on malformed YAML or invalid values
     */
    static SwitchboardConfig parseString(const std::string& yaml_text);

    /**
     * @brief Contents written by `switchboard init`
     */
    static std::string defaultConfigYaml();

    const SwitchboardConfig& getConfig() const { return m_config; }

    /**
     * @brief Retrieves a raw value by dotted key, e.g. "backend.url".
     * @return The value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    bool isLoaded() const { return m_loaded; }
    const std::string& getPath() const { return m_path; }

private:
    std::string m_path;
    std::string m_raw_text;
    SwitchboardConfig m_config;
    bool m_loaded = false;
};

} // namespace Switchboard
