// =================================================================
// include/Switchboard/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Switchboard {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path = ".switchboard/config.yml";
    bool verbose = false;

    // Options for 'route' and 'ask'
    std::string query;

    // Options for 'ask'
    bool simulate = false;           // Force the simulated backend
    int timeout_sec = 0;             // Overall wait, 0 uses the escalation timeout plus a margin
    bool no_stream = false;          // Do not print live agent updates
    std::vector<std::string> fail_agents; // Simulated agents that always fail

    // Options for 'agents' command
    std::string agents_subcommand;   // list, info, reload
    std::string agent_id;            // For the info subcommand
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInitCommand(CLI::App& app);
    void setupRouteCommand(CLI::App& app);
    void setupAskCommand(CLI::App& app);
    void setupAgentsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Switchboard
