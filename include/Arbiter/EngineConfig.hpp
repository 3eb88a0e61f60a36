// =================================================================
// include/Arbiter/EngineConfig.hpp
// =================================================================
// Engine configuration and its YAML loader.

#pragma once

#include "Arbiter/ExperimentOverlay.hpp"
#include "Arbiter/HealthTracker.hpp"
#include "Arbiter/InvocationOrchestrator.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Arbiter {

/**
 * @brief Engine settings; every field has a usable default
 */
struct EngineConfig {
    RetryConfig retry;                                      ///< Retry policy
    HealthConfig health;                                    ///< Circuit breaker thresholds
    GuardrailConfig experiment_defaults;                    ///< Experiment guardrail defaults

    std::chrono::milliseconds provider_timeout{30000};      ///< Bound on each provider call
    std::chrono::milliseconds sanitizer_timeout{10000};     ///< Bound on the sanitizing call
    std::chrono::milliseconds contextual_timeout{500};      ///< Bound on the contextual detector
    std::chrono::milliseconds lineage_write_timeout{200};   ///< Bound on each lineage write
    size_t lineage_buffer_limit = 10000;                    ///< Traces buffered while the sink fails

    std::string lineage_path = ".arbiter/lineage.jsonl";    ///< JSON-lines trace file
    std::string models_file;                                ///< Registry YAML
    std::vector<std::string> policy_files;                  ///< Policy YAML files, published in order
    std::string subscriptions_file;                         ///< Subscriptions YAML
    std::string experiments_file;                           ///< Experiments YAML, optional
    std::string contextual_model;                           ///< Model used by the contextual detector

    std::string log_dir = ".arbiter/logs";                  ///< Log directory
    std::string log_level = "info";                         ///< Console log level
    bool log_to_file = true;                                ///< Write rotating log files

    size_t max_parallel_requests = 8;                       ///< Concurrency cap for batch routing
    size_t max_outstanding_calls = 16;                      ///< Calls per provider model still running at once
};

/**
 * @brief Reads EngineConfig from YAML
 *
 * Missing keys keep their defaults. Relative file paths are resolved against
 * the directory of the configuration file.
 */
class ConfigLoader {
public:
    /**
     * @throws ConfigError if the file is unreadable or a value is malformed
     */
    static EngineConfig loadFile(const std::string& path);

    /**
     * @param base_dir Directory relative paths are resolved against
     * @throws ConfigError if a value is malformed
     */
    static EngineConfig loadString(const std::string& yaml_text, const std::string& base_dir = ".");

private:
    static EngineConfig parse(const YAML::Node& root, const std::string& base_dir);
    static std::string resolvePath(const std::string& base_dir, const std::string& path);
};

} // namespace Arbiter
