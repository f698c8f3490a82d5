// =================================================================
// src/Switchboard/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Switchboard/Core.hpp"
#include "Switchboard/ConfigParser.hpp"
#include "Switchboard/Orchestrator.hpp"
#include "Switchboard/Broadcaster.hpp"
#include "Switchboard/RealtimeClient.hpp"
#include "Switchboard/LoopbackTransport.hpp"
#include "Switchboard/HttpExecutionBackend.hpp"
#include "Switchboard/SimulatedExecutionBackend.hpp"
#include "Switchboard/HumanEscalationChannel.hpp"
#include "Switchboard/AsyncLineReader.hpp"
#include "Switchboard/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <future>
#include <mutex>

namespace Switchboard {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const std::string COLOR_RED = "\033[31m";
const std::string COLOR_GREEN = "\033[32m";
const std::string COLOR_YELLOW = "\033[33m";
const std::string COLOR_RESET = "\033[0m";

const std::string kDefaultAgentCatalog = R"(# Switchboard agent catalog
agents:
  technical_support:
    name: Technical Support Specialist
    category: technical
    keywords: [webhook, ssl, certificate, api, endpoint, timeout, integration]
    expertise: [SSL troubleshooting, Webhook debugging, API integration]
    confidence_threshold: 0.7
    historical_success_rate: 92
  billing_support:
    name: Billing Specialist
    category: billing
    keywords: [billing, invoice, payment, refund, charge, charged, subscription]
    expertise: [Refund processing, Invoice disputes, Payment failures]
    confidence_threshold: 0.6
    historical_success_rate: 88
  security_specialist:
    name: Security Specialist
    category: security
    keywords: [security, breach, fraud, password, hacked, suspicious, unauthorized]
    expertise: [Fraud investigation, Breach response, Password resets]
    confidence_threshold: 0.75
    historical_success_rate: 90
  account_manager:
    name: Account Manager
    category: account
    keywords: [account, login, profile, upgrade, plan, downgrade]
    expertise: [Account changes, Plan upgrades]
    confidence_threshold: 0.5
    historical_success_rate: 85
  general_support:
    name: General Support
    category: general
    keywords: [help, question, information, hours, contact]
    expertise: [General inquiries]
    confidence_threshold: 0.3
    historical_success_rate: 80
)";

std::string joinIds(const std::vector<std::string>& ids) {
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << ids[i];
    }
    return oss.str();
}

bool writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

void printEvent(const SessionEvent& event) {
    std::visit(overloaded{
        [](const SessionStartedEvent& e) {
            std::cout << "Session " << e.header.session_id << " started with: " << joinIds(e.agent_ids);
            if (e.escalation_required) {
                std::cout << COLOR_YELLOW << " (escalation required)" << COLOR_RESET;
            }
            std::cout << std::endl;
        },
        [](const AgentStatusUpdateEvent& e) {
            const std::string& color = e.status == AgentStatus::ERROR ? COLOR_RED
                                     : e.status == AgentStatus::FINISHED ? COLOR_GREEN : COLOR_RESET;
            std::cout << "  " << color << "[" << e.header.agent_name << "] "
                      << std::left << std::setw(13) << agentStatusToString(e.status)
                      << std::right << std::setw(4) << std::fixed << std::setprecision(0) << e.progress << "%  "
                      << e.current_task << COLOR_RESET;
            if (!e.error.empty()) {
                std::cout << " (" << e.error << ")";
            }
            std::cout << std::endl;
        },
        [](const PhaseUpdateEvent& e) {
            std::cout << "  >> " << sessionStateToString(e.state) << ": " << e.description << std::endl;
        },
        [](const SessionCompleteEvent& e) {
            std::cout << COLOR_GREEN << "Session " << sessionStateToString(e.final_state) << ": "
                      << e.summary << COLOR_RESET << std::endl;
        },
        [](const SessionErrorEvent& e) {
            std::cout << COLOR_RED << "Session FAILED: " << e.message << COLOR_RESET << std::endl;
        }
    }, event);
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(std::make_unique<ConfigParser>(commands.config_path))
{
    const SwitchboardConfig& settings = m_config->getConfig();

    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
    logger.setFileLogLevel(Logger::getLevelFromName(settings.log_level));
    if (m_commands.active_command != "init" && !m_commands.active_command.empty()) {
        logger.initialize(settings.log_dir);
    }
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command == "route") {
        return handleRoute();
    } else if (m_commands.active_command == "ask") {
        return handleAsk();
    } else if (m_commands.active_command == "agents") {
        return handleAgents();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

int Core::handleInit() {
    std::cout << "Initializing Switchboard configuration..." << std::endl;

    const std::filesystem::path configFile = m_commands.config_path;
    const std::filesystem::path configDir = configFile.parent_path();

    std::error_code ec;
    if (!configDir.empty() && !std::filesystem::exists(configDir)) {
        if (!std::filesystem::create_directories(configDir, ec)) {
            std::cerr << "Error: Failed to create configuration directory '" << configDir.string() << "'." << std::endl;
            return 1;
        }
        std::cout << "Created configuration directory: " << configDir.string() << std::endl;
    }

    if (std::filesystem::exists(configFile)) {
        std::cout << "Configuration file '" << configFile.string() << "' already exists. Skipping." << std::endl;
    } else if (writeTextFile(configFile.string(), ConfigParser::defaultConfigYaml())) {
        std::cout << "Created default configuration file: " << configFile.string() << std::endl;
    } else {
        std::cerr << "Error: Failed to write configuration file '" << configFile.string() << "'." << std::endl;
        return 1;
    }

    // The catalog path comes from the (possibly pre-existing) configuration
    const std::filesystem::path catalogFile = ConfigParser(configFile.string()).getConfig().index.agents_file;
    if (std::filesystem::exists(catalogFile)) {
        std::cout << "Agent catalog '" << catalogFile.string() << "' already exists. Skipping." << std::endl;
        return 0;
    }

    if (!catalogFile.parent_path().empty()) {
        std::filesystem::create_directories(catalogFile.parent_path(), ec);
    }
    if (!writeTextFile(catalogFile.string(), kDefaultAgentCatalog)) {
        std::cerr << "Error: Failed to write agent catalog '" << catalogFile.string() << "'." << std::endl;
        return 1;
    }
    std::cout << "Created default agent catalog: " << catalogFile.string() << std::endl;
    std::cout << "\nEdit " << catalogFile.string() << " to describe your own agents." << std::endl;
    return 0;
}

int Core::handleRoute() {
    auto index = createIndex();
    Orchestrator orchestrator(*index, createBackend(), nullptr, nullptr, m_config->getConfig().orchestrator);

    const std::string& rules_file = m_config->getConfig().analyzer_rules_file;
    if (!rules_file.empty()) {
        orchestrator.getAnalyzer().loadRulesFromFile(rules_file);
    }

    printRoutingDecision(orchestrator.routeQuery(m_commands.query));
    return 0;
}

int Core::handleAsk() {
    const SwitchboardConfig& settings = m_config->getConfig();

    auto index = createIndex();
    auto channel = std::make_shared<QueuedEscalationChannel>();

    Broadcaster broadcaster(settings.realtime);
    broadcaster.start();

    Orchestrator orchestrator(*index, createBackend(), channel, &broadcaster, settings.orchestrator);
    orchestrator.setSessionPurgedCallback([&broadcaster](const std::string& session_id) {
        broadcaster.forgetSession(session_id);
    });
    if (!settings.analyzer_rules_file.empty()) {
        orchestrator.getAnalyzer().loadRulesFromFile(settings.analyzer_rules_file);
    }

    std::string session_id = orchestrator.submitQuery(m_commands.query);

    std::mutex output_mutex;
    CancellationToken stream_cancel;
    std::future<ClientOutcome> stream;

    if (!m_commands.no_stream) {
        RealtimeClientConfig client_config;
        client_config.session_id = session_id;
        auto transport = std::make_shared<LoopbackTransport>(broadcaster, "cli");

        stream = std::async(std::launch::async, [transport, client_config, &stream_cancel, &output_mutex]() {
            RealtimeClient client(transport, client_config, [&output_mutex](const SessionEvent& event) {
                std::lock_guard<std::mutex> lock(output_mutex);
                printEvent(event);
            });
            return client.run(stream_cancel);
        });
    } else {
        std::cout << "Session " << session_id << " submitted." << std::endl;
    }

    std::chrono::milliseconds budget = m_commands.timeout_sec > 0
        ? std::chrono::milliseconds(std::chrono::seconds(m_commands.timeout_sec))
        : settings.orchestrator.session.escalation_timeout + std::chrono::seconds(60);
    auto deadline = std::chrono::steady_clock::now() + budget;

    std::optional<AggregatedResult> result;
    AsyncLineReader operator_input(std::cin);
    try {
        bool prompt_pending = true;
        bool awaiting_operator = false;
        while (!(result = orchestrator.waitForResult(session_id, std::chrono::milliseconds(200)))) {
            // The deadline also covers time spent waiting for the operator
            if (std::chrono::steady_clock::now() >= deadline) {
                std::cout << COLOR_YELLOW << "Timed out after " << budget.count() / 1000
                          << "s, ending session." << COLOR_RESET << std::endl;
                orchestrator.endSession(session_id);
                result = orchestrator.waitForResult(session_id, std::chrono::seconds(10));
                break;
            }

            if (awaiting_operator) {
                auto response = operator_input.poll(std::chrono::milliseconds(0));
                if (!response) {
                    continue;
                }
                awaiting_operator = false;
                if (!response->empty() && !channel->resolve(session_id, *response)) {
                    std::cout << "Escalation was already resolved." << std::endl;
                }
                continue;
            }

            if (!prompt_pending) {
                continue;
            }

            for (const auto& record : channel->getPending()) {
                if (record.session_id != session_id) {
                    continue;
                }

                {
                    std::lock_guard<std::mutex> lock(output_mutex);
                    std::cout << "\n" << COLOR_YELLOW << "[ESCALATION] Priority "
                              << escalationPriorityToString(record.priority) << ": "
                              << record.reasonText() << COLOR_RESET << std::endl;
                    std::cout << "Operator response (empty to let it time out): " << std::flush;
                }
                prompt_pending = false;
                awaiting_operator = operator_input.request();
                break;
            }
        }
    } catch (const std::exception&) {
        stream_cancel.cancel();
        throw;
    }

    if (stream.valid()) {
        if (stream.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            stream_cancel.cancel();
        }
        ClientOutcome outcome = stream.get();
        Logger::getInstance().debug("Core", "Stream ended: " + clientOutcomeToString(outcome), session_id);
    }

    if (!result) {
        std::cerr << "Error: session " << session_id << " did not finish." << std::endl;
        return 1;
    }

    auto snapshot = orchestrator.getSessionSnapshot(session_id);
    SessionState final_state = snapshot ? snapshot->state : SessionState::FAILED;

    std::cout << "\n--- Result (" << sessionStateToString(final_state) << ") ---" << std::endl;
    std::cout << (result->combined_content.empty() ? "(no agent produced an answer)" : result->combined_content)
              << std::endl;
    std::cout << "------------------------" << std::endl;
    std::cout << "Average confidence: " << std::fixed << std::setprecision(2) << result->average_confidence << std::endl;
    if (!result->failed_agent_ids.empty()) {
        std::cout << COLOR_RED << "Failed agents: " << joinIds(result->failed_agent_ids) << COLOR_RESET << std::endl;
    }
    if (snapshot && snapshot->escalation) {
        std::cout << "Escalation: " << escalationResolutionToString(snapshot->escalation->resolution);
        if (!snapshot->escalation->human_response.empty()) {
            std::cout << " - " << snapshot->escalation->human_response;
        }
        std::cout << std::endl;
    }

    return final_state == SessionState::COMPLETED ? 0 : 1;
}

int Core::handleAgents() {
    auto index = createIndex();

    if (m_commands.agents_subcommand == "list") {
        std::cout << index->getAllAgentsInfo() << std::endl;
        return 0;

    } else if (m_commands.agents_subcommand == "info") {
        if (!index->getProfile(m_commands.agent_id)) {
            std::cerr << "Agent not found: " << m_commands.agent_id << std::endl;
            return 1;
        }
        std::cout << index->getAgentInfo(m_commands.agent_id) << std::endl;
        return 0;

    } else if (m_commands.agents_subcommand == "reload") {
        IndexLoadResult load_result = index->refresh();

        for (const auto& rejection : load_result.rejected) {
            std::cout << "✗ " << rejection << std::endl;
        }
        if (load_result.success) {
            std::cout << "✓ Loaded " << load_result.loaded << " agent(s) from "
                      << index->getConfig().agents_file << std::endl;
            return load_result.rejected.empty() ? 0 : 1;
        }

        std::cout << "✗ " << load_result.error_message << std::endl;
        if (load_result.used_fallback) {
            std::cout << "Using the built-in fallback agent." << std::endl;
        }
        return 1;
    }

    std::cerr << "Error: Unknown agents subcommand '" << m_commands.agents_subcommand << "'." << std::endl;
    return 1;
}

std::shared_ptr<ExecutionBackend> Core::createBackend() const {
    const SwitchboardConfig& settings = m_config->getConfig();

    if (m_commands.simulate || settings.backend_type == "simulated") {
        SimulationConfig simulation = settings.simulation;
        simulation.failing_agents.insert(m_commands.fail_agents.begin(), m_commands.fail_agents.end());
        return std::make_shared<SimulatedExecutionBackend>(simulation);
    }

    return std::make_shared<HttpExecutionBackend>(settings.http);
}

std::unique_ptr<AgentIndex> Core::createIndex() const {
    IndexConfig config = m_config->getConfig().index;
    config.enable_background_refresh = false; // Disable for CLI commands
    return std::make_unique<AgentIndex>(config);
}

void Core::printRoutingDecision(const RoutingDecision& decision) {
    const QueryAnalysis& analysis = decision.analysis;

    std::cout << "Query: " << decision.query_text << "\n" << std::endl;

    std::cout << "--- Analysis ---" << std::endl;
    std::cout << "Keywords: " << joinIds(analysis.keywords) << std::endl;
    std::cout << "Complexity: " << complexityToString(analysis.complexity)
              << " (" << std::fixed << std::setprecision(1) << analysis.complexity_score << ")" << std::endl;
    std::cout << "Sentiment: " << analysis.sentiment << std::endl;

    std::cout << "\n--- Agent Scores ---" << std::endl;
    for (const auto& score : decision.selection.ranked) {
        std::cout << (score.wouldTrigger() ? COLOR_GREEN + "* " : "  ")
                  << std::left << std::setw(22) << score.agent_id << std::right
                  << " score " << std::setw(5) << std::setprecision(1) << score.score
                  << "  confidence " << std::setw(5) << score.confidence
                  << "  threshold " << std::setprecision(0) << score.confidence_threshold * 100.0;
        if (!score.matched_keywords.empty()) {
            std::cout << "  [" << joinIds(score.matched_keywords) << "]";
        }
        std::cout << COLOR_RESET << std::endl;
    }

    std::cout << "\n--- Selection ---" << std::endl;
    std::cout << "Recommended: " << joinIds(decision.selectedAgentIds()) << std::endl;
    std::cout << "Reason: " << decision.selection.selection_reason << std::endl;

    std::cout << "\n--- Escalation ---" << std::endl;
    if (!decision.escalation.escalate) {
        std::cout << "Not required" << std::endl;
        return;
    }

    std::vector<std::string> reasons;
    for (auto reason : decision.escalation.reasons) {
        reasons.push_back(escalationReasonToString(reason));
    }
    std::cout << COLOR_YELLOW << "Required (" << escalationPriorityToString(decision.escalation.priority)
              << "): " << joinIds(reasons) << COLOR_RESET << std::endl;
}

} // namespace Switchboard
