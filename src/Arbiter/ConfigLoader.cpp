// =================================================================
// src/Arbiter/ConfigLoader.cpp
// =================================================================
// Implementation of the engine configuration loader.

#include "Arbiter/EngineConfig.hpp"
#include "Arbiter/Errors.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace Arbiter {

namespace {

std::chrono::milliseconds millis(const YAML::Node& node, std::chrono::milliseconds fallback) {
    if (!node) {
        return fallback;
    }
    long value = node.as<long>();
    if (value < 0) {
        throw ConfigError("Durations must be non-negative: " + node.as<std::string>());
    }
    return std::chrono::milliseconds(value);
}

} // namespace

EngineConfig ConfigLoader::loadFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to read engine config " + path + ": " + e.what());
    }

    std::string base_dir = std::filesystem::path(path).parent_path().string();
    return parse(root, base_dir.empty() ? "." : base_dir);
}

EngineConfig ConfigLoader::loadString(const std::string& yaml_text, const std::string& base_dir) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse engine config: " + std::string(e.what()));
    }
    return parse(root, base_dir);
}

std::string ConfigLoader::resolvePath(const std::string& base_dir, const std::string& path) {
    if (path.empty()) {
        return path;
    }
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return path;
    }
    return (std::filesystem::path(base_dir) / candidate).lexically_normal().string();
}

EngineConfig ConfigLoader::parse(const YAML::Node& root, const std::string& base_dir) {
    EngineConfig config;

    try {
        if (YAML::Node retry = root["retry"]) {
            config.retry.max_attempts = retry["max_attempts"].as<size_t>(config.retry.max_attempts);
            config.retry.base_backoff = millis(retry["base_backoff_ms"], config.retry.base_backoff);
            config.retry.max_backoff = millis(retry["max_backoff_ms"], config.retry.max_backoff);
            config.retry.jitter = retry["jitter"].as<double>(config.retry.jitter);
            if (config.retry.max_attempts == 0) {
                throw ConfigError("retry.max_attempts must be at least 1");
            }
            if (config.retry.jitter < 0.0 || config.retry.jitter > 1.0) {
                throw ConfigError("retry.jitter must be within [0, 1]");
            }
        }

        if (YAML::Node timeouts = root["timeouts"]) {
            config.provider_timeout = millis(timeouts["provider_ms"], config.provider_timeout);
            config.sanitizer_timeout = millis(timeouts["sanitizer_ms"], config.sanitizer_timeout);
            config.contextual_timeout = millis(timeouts["contextual_ms"], config.contextual_timeout);
            config.lineage_write_timeout = millis(timeouts["lineage_write_ms"], config.lineage_write_timeout);
        }

        if (YAML::Node health = root["health"]) {
            HealthConfig& h = config.health;
            h.window = millis(health["window_ms"], h.window);
            h.failure_threshold = health["failure_threshold"].as<size_t>(h.failure_threshold);
            h.latency_p95_threshold = millis(health["latency_p95_ms"], h.latency_p95_threshold);
            h.latency_sustain = millis(health["latency_sustain_ms"], h.latency_sustain);
            h.min_latency_samples = health["min_latency_samples"].as<size_t>(h.min_latency_samples);
            h.cool_down = millis(health["cool_down_ms"], h.cool_down);
        }

        if (YAML::Node experiments = root["experiment_defaults"]) {
            GuardrailConfig& g = config.experiment_defaults;
            g.latency_ratio = experiments["latency_ratio"].as<double>(g.latency_ratio);
            g.success_margin = experiments["success_margin"].as<double>(g.success_margin);
            g.min_samples = experiments["min_samples"].as<size_t>(g.min_samples);
            g.window_size = experiments["window_size"].as<size_t>(g.window_size);
            g.cool_down = millis(experiments["cool_down_ms"], g.cool_down);
            g.auto_resume = experiments["auto_resume"].as<bool>(g.auto_resume);
        }

        if (YAML::Node lineage = root["lineage"]) {
            config.lineage_path = resolvePath(base_dir, lineage["path"].as<std::string>(config.lineage_path));
            config.lineage_buffer_limit = lineage["buffer_limit"].as<size_t>(config.lineage_buffer_limit);
        }

        if (YAML::Node files = root["files"]) {
            config.models_file = resolvePath(base_dir, files["models"].as<std::string>(""));
            config.subscriptions_file = resolvePath(base_dir, files["subscriptions"].as<std::string>(""));
            config.experiments_file = resolvePath(base_dir, files["experiments"].as<std::string>(""));
            if (YAML::Node policies = files["policies"]) {
                if (policies.IsSequence()) {
                    for (const auto& policy : policies) {
                        config.policy_files.push_back(resolvePath(base_dir, policy.as<std::string>()));
                    }
                } else {
                    config.policy_files.push_back(resolvePath(base_dir, policies.as<std::string>()));
                }
            }
        }

        if (YAML::Node firewall = root["firewall"]) {
            config.contextual_model = firewall["contextual_model"].as<std::string>("");
        }

        if (YAML::Node logging = root["logging"]) {
            config.log_dir = resolvePath(base_dir, logging["dir"].as<std::string>(config.log_dir));
            config.log_level = logging["level"].as<std::string>(config.log_level);
            config.log_to_file = logging["file"].as<bool>(config.log_to_file);
        }

        if (YAML::Node engine = root["engine"]) {
            config.max_parallel_requests = engine["max_parallel_requests"].as<size_t>(config.max_parallel_requests);
            if (config.max_parallel_requests == 0) {
                throw ConfigError("engine.max_parallel_requests must be at least 1");
            }
            config.max_outstanding_calls = engine["max_outstanding_calls"].as<size_t>(config.max_outstanding_calls);
            if (config.max_outstanding_calls == 0) {
                throw ConfigError("engine.max_outstanding_calls must be at least 1");
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed engine config: " + std::string(e.what()));
    }

    return config;
}

} // namespace Arbiter
