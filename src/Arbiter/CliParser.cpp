// =================================================================
// src/Arbiter/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Arbiter/CliParser.hpp"

namespace Arbiter {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Arbiter: request routing and governance engine for model providers.");
    m_app->require_subcommand(1);
    m_app->add_option("--log-level", m_commands.log_level, "Console log level (debug, info, warning, error)");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupValidateCommand(*m_app);
    setupRouteCommand(*m_app);
    setupModelsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupValidateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("validate", "Loads a policy file and validates it against a model registry.");
    sub->add_option("policy", m_commands.policy_path, "The policy YAML file to validate.")->required()->check(CLI::ExistingFile);
    sub->add_option("-m,--models", m_commands.models_path, "The model registry YAML file.")->required()->check(CLI::ExistingFile);
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Routes one request through the engine and prints the response as JSON.");
    sub->add_option("input", m_commands.input, "The request input text.")->required();
    sub->add_option("-c,--config", m_commands.config_path, "Engine configuration file.")->check(CLI::ExistingFile);
    sub->add_option("--app", m_commands.app, "Application id; selects the policy.")->required();
    sub->add_option("--tenant", m_commands.tenant, "Tenant id.")->required();
    sub->add_option("--team", m_commands.team, "Team id.");
    sub->add_option("--role", m_commands.role, "Role of the calling user.");
    sub->add_option("--sensitivity", m_commands.sensitivity, "Data sensitivity (public, low, medium, high, restricted).")
        ->check(CLI::IsMember({"public", "low", "medium", "high", "restricted"}));
    sub->add_option("--tag", m_commands.tags, "Request tag; may be repeated.");
    sub->add_option("--firewall", m_commands.firewall, "Firewall action override (none, flag, redraft).")
        ->check(CLI::IsMember({"none", "flag", "redraft"}));
    sub->add_option("--language", m_commands.language, "Input language code.");
    sub->add_option("--tokens", m_commands.tokens, "Estimated input tokens (default: derived from input length).");
    sub->add_option("--max-tokens", m_commands.max_tokens, "Output token cap.");
    sub->add_option("--key", m_commands.request_key, "Stable request key for experiment bucketing.");
}

void CliParser::setupModelsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("models", "Lists the models in the registry.");
    sub->add_option("-c,--config", m_commands.config_path, "Engine configuration file.")->check(CLI::ExistingFile);
}

} // namespace Arbiter
