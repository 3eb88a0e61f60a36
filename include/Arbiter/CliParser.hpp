// =================================================================
// include/Arbiter/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Arbiter {

// Parsed command and its options.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Shared
    std::string config_path = "config/engine.yml";
    std::string log_level;

    // Options for 'validate'
    std::string policy_path;
    std::string models_path;

    // Options for 'route'
    std::string app;
    std::string tenant;
    std::string team;
    std::string role;
    std::string sensitivity = "low";
    std::vector<std::string> tags;
    std::string firewall;
    std::string language;
    std::string request_key;
    size_t tokens = 0;
    size_t max_tokens = 0;
    std::string input;
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
    void setupValidateCommand(CLI::App& app);
    void setupRouteCommand(CLI::App& app);
    void setupModelsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Arbiter
