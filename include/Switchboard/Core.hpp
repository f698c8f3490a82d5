// =================================================================
// include/Switchboard/Core.hpp
// =================================================================
// Defines the core application object behind the CLI.

#pragma once

#include "Switchboard/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Switchboard {
    class ConfigParser;
    class ExecutionBackend;
    class AgentIndex;
    struct RoutingDecision;
}

namespace Switchboard {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @throws ConfigError if the configuration file is invalid
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleRoute();
    int handleAsk();
    int handleAgents();

    std::shared_ptr<ExecutionBackend> createBackend() const;
    std::unique_ptr<AgentIndex> createIndex() const;
    static void printRoutingDecision(const RoutingDecision& decision);

    const Commands& m_commands;
    std::unique_ptr<ConfigParser> m_config;
};

} // namespace Switchboard
