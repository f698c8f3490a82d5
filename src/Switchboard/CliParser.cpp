// =================================================================
// src/Switchboard/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Switchboard/CliParser.hpp"

namespace Switchboard {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Switchboard: routes support queries to specialist agents and tracks them live.");
    m_app->require_subcommand(0, 1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the configuration file.");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print debug logs to the console.");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupInitCommand(*m_app);
    setupRouteCommand(*m_app);
    setupAskCommand(*m_app);
    setupAgentsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInitCommand(CLI::App& app) {
    app.add_subcommand("init", "Writes a default configuration and agent catalog.");
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Shows the routing decision for a query without dispatching it.");
    sub->add_option("query", m_commands.query, "The customer query.")->required();
}

void CliParser::setupAskCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("ask", "Dispatches a query to its agents and streams their progress.");
    sub->add_option("query", m_commands.query, "The customer query.")->required();
    sub->add_flag("--simulate", m_commands.simulate, "Use the simulated backend regardless of configuration.");
    sub->add_option("--timeout", m_commands.timeout_sec, "Seconds to wait for the session before ending it.")
        ->check(CLI::NonNegativeNumber);
    sub->add_flag("--no-stream", m_commands.no_stream, "Only print the final result.");
    sub->add_option("--fail", m_commands.fail_agents, "Agent ids the simulated backend should fail.");
}

void CliParser::setupAgentsCommand(CLI::App& app) {
    auto* agents_cmd = app.add_subcommand("agents", "Inspect the agent catalog");
    agents_cmd->require_subcommand(1);

    // List subcommand
    auto* list_cmd = agents_cmd->add_subcommand("list", "List all indexed agents");
    list_cmd->callback([this]() { m_commands.agents_subcommand = "list"; });

    // Info subcommand
    auto* info_cmd = agents_cmd->add_subcommand("info", "Show detailed information about an agent");
    info_cmd->add_option("agent", m_commands.agent_id, "Agent id")->required();
    info_cmd->callback([this]() { m_commands.agents_subcommand = "info"; });

    // Reload subcommand
    auto* reload_cmd = agents_cmd->add_subcommand("reload", "Validate and reload the agent catalog");
    reload_cmd->callback([this]() { m_commands.agents_subcommand = "reload"; });

    // Make agents command trigger active_command
    agents_cmd->callback([this]() { m_commands.active_command = "agents"; });
}

} // namespace Switchboard
