// =================================================================
// include/Arbiter/Core.hpp
// =================================================================
// Defines the core application object behind the command line.

#pragma once

#include "Arbiter/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Arbiter {
    struct EngineConfig;
    class ModelRegistry;
    class PolicyStore;
    class SubscriptionStore;
    class HealthTracker;
    class BudgetLedger;
    class ExperimentOverlay;
    class InMemoryMetricsSink;
    class RoutingEngine;
}

namespace Arbiter {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor is defined in the .cpp file because the members
     * are unique_ptrs to forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleValidate();
    int handleRoute();
    int handleModels();

    /**
     * @brief Load the engine configuration and every file it references
     * @throws ArbiterError when a file is missing or invalid
     */
    void loadEngine();

    const Commands& m_commands;
    std::unique_ptr<EngineConfig> m_config;
    std::unique_ptr<ModelRegistry> m_registry;
    std::unique_ptr<PolicyStore> m_policies;
    std::unique_ptr<SubscriptionStore> m_subscriptions;
    std::unique_ptr<HealthTracker> m_health;
    std::unique_ptr<BudgetLedger> m_budget;
    std::unique_ptr<ExperimentOverlay> m_experiments;
    std::shared_ptr<InMemoryMetricsSink> m_metrics;
    std::unique_ptr<RoutingEngine> m_engine;
};

} // namespace Arbiter
