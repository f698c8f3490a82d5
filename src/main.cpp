#include "Switchboard/CliParser.hpp"
#include "Switchboard/Core.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Switchboard::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    try {
        // The Core class dispatches to the handler of the parsed command.
        Switchboard::Core core(parser.getCommands());
        return core.run();
    } catch (const Switchboard::InputError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const Switchboard::ConfigError& e) {
        Switchboard::Logger::getInstance().critical("Main", e.what());
        std::cerr << e.what() << std::endl;
        std::cerr << "Run 'switchboard init' or fix the configuration file." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Switchboard::Logger::getInstance().critical("Main", "Error during execution", e.what());
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
