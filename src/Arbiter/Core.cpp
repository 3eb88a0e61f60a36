// =================================================================
// src/Arbiter/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Arbiter/Core.hpp"
#include "Arbiter/BudgetGate.hpp"
#include "Arbiter/EngineConfig.hpp"
#include "Arbiter/Errors.hpp"
#include "Arbiter/ExperimentOverlay.hpp"
#include "Arbiter/HealthTracker.hpp"
#include "Arbiter/Lineage.hpp"
#include "Arbiter/Logger.hpp"
#include "Arbiter/Metrics.hpp"
#include "Arbiter/ModelRegistry.hpp"
#include "Arbiter/PolicyStore.hpp"
#include "Arbiter/RoutingEngine.hpp"
#include "Arbiter/Subscription.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>

namespace Arbiter {

Core::Core(const Commands& commands)
    : m_commands(commands) {
    Logger& logger = Logger::getInstance();
    if (!m_commands.log_level.empty()) {
        logger.setConsoleLogLevel(Logger::parseLevel(m_commands.log_level));
    } else {
        logger.setConsoleLogLevel(LogLevel::WARNING);
    }
}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.config_path);

    int exit_code = 1;
    try {
        if (m_commands.active_command == "validate") {
            exit_code = handleValidate();
        } else if (m_commands.active_command == "route") {
            exit_code = handleRoute();
        } else if (m_commands.active_command == "models") {
            exit_code = handleModels();
        } else {
            std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
        }
    } catch (const ArbiterError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, duration.count());
    Logger::getInstance().flush();
    return exit_code;
}

void Core::loadEngine() {
    m_config = std::make_unique<EngineConfig>(ConfigLoader::loadFile(m_commands.config_path));

    Logger& logger = Logger::getInstance();
    logger.setFileLogging(m_config->log_to_file);
    logger.setFileLogLevel(Logger::parseLevel(m_config->log_level));
    logger.initialize(m_config->log_dir);

    if (m_config->models_file.empty()) {
        throw ConfigError("Engine config does not name a models file (files.models)");
    }

    m_registry = std::make_unique<ModelRegistry>();
    RegistryStatus status = m_registry->loadFromConfig(m_config->models_file);
    for (const auto& result : status.load_results) {
        if (!result.success) {
            std::cerr << "[WARN] Model '" << result.model_id << "' rejected: " << result.error_message << std::endl;
        }
    }

    m_subscriptions = std::make_unique<SubscriptionStore>();
    if (!m_config->subscriptions_file.empty()) {
        m_subscriptions->loadFromConfig(m_config->subscriptions_file);
    }

    m_policies = std::make_unique<PolicyStore>(*m_registry);
    for (const auto& policy_file : m_config->policy_files) {
        m_policies->publishFile(policy_file);
    }

    m_experiments = std::make_unique<ExperimentOverlay>(m_config->experiment_defaults);
    if (!m_config->experiments_file.empty()) {
        m_experiments->loadFromConfig(m_config->experiments_file);
    }

    m_health = std::make_unique<HealthTracker>(m_config->health);
    m_budget = std::make_unique<BudgetLedger>();
    m_metrics = std::make_shared<InMemoryMetricsSink>();

    auto lineage = std::make_shared<JsonlFileLineageSink>(m_config->lineage_path);
    m_engine = std::make_unique<RoutingEngine>(*m_config, *m_registry, *m_policies, *m_subscriptions,
                                               *m_health, *m_budget, *m_experiments, lineage, m_metrics);
}

int Core::handleValidate() {
    ModelRegistry registry;
    RegistryStatus status = registry.loadFromConfig(m_commands.models_path);
    std::cout << "Registry: " << status.accepted << " accepted, " << status.rejected << " rejected" << std::endl;

    Policy policy = PolicyLoader::loadFile(m_commands.policy_path);
    try {
        PolicyValidator::validate(policy, *registry.snapshot());
    } catch (const PolicyValidationError& e) {
        std::cout << "INVALID  " << m_commands.policy_path << std::endl;
        std::cout << "  " << e.what() << std::endl;
        return 1;
    }

    std::cout << "VALID    " << m_commands.policy_path << std::endl;
    std::cout << "  policy " << policy.id << " version " << policy.version << " for app " << policy.app_id
              << ": " << policy.rules.size() << " rules, " << policy.fallback_chains.size() << " fallback chains"
              << std::endl;
    return 0;
}

int Core::handleRoute() {
    loadEngine();

    RoutingRequest request;
    RequestContext& context = request.context;
    context.tenant_id = m_commands.tenant;
    context.app_id = m_commands.app;
    if (!m_commands.team.empty()) {
        context.team_id = m_commands.team;
    }
    context.user_role = m_commands.role;
    context.sensitivity = parseSensitivity(m_commands.sensitivity);
    context.language = m_commands.language;
    context.tags = m_commands.tags;
    context.input = m_commands.input;
    // Roughly four characters per token when the caller gives no estimate
    context.token_estimate = m_commands.tokens > 0 ? m_commands.tokens : (m_commands.input.size() + 3) / 4;
    context.request_key = m_commands.request_key.empty()
        ? m_commands.tenant + "/" + m_commands.app + "/" + m_commands.input
        : m_commands.request_key;
    if (!m_commands.firewall.empty()) {
        context.options.firewall_override = parseFirewallAction(m_commands.firewall);
    }
    if (m_commands.max_tokens > 0) {
        context.options.max_tokens = m_commands.max_tokens;
    }

    RoutingResponse response = m_engine->route(request);
    m_engine->flushLineage();

    nlohmann::json output = response;
    std::cout << output.dump(2) << std::endl;
    return response.success() ? 0 : 2;
}

int Core::handleModels() {
    EngineConfig config = ConfigLoader::loadFile(m_commands.config_path);
    if (config.models_file.empty()) {
        throw ConfigError("Engine config does not name a models file (files.models)");
    }

    ModelRegistry registry;
    registry.loadFromConfig(config.models_file);
    std::cout << registry.getAllModelsInfo();
    return 0;
}

} // namespace Arbiter
