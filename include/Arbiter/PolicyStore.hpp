// =================================================================
// include/Arbiter/PolicyStore.hpp
// =================================================================
// Loading, static validation and versioned publication of policies.

#pragma once

#include "Arbiter/Policy.hpp"
#include "Arbiter/ModelRegistry.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>

namespace YAML {
class Node;
}

namespace Arbiter {

/**
 * @brief Parses policy documents
 */
class PolicyLoader {
public:
    /**
     * @brief Parse a policy YAML file
     * @throws ConfigError on unreadable or structurally malformed input
     */
    static Policy loadFile(const std::string& path);

    /**
     * @brief Parse a policy from YAML text
     * @throws ConfigError on malformed input
     */
    static Policy loadString(const std::string& yaml_text);

private:
    static Policy parse(const YAML::Node& root);
    static PolicyRule parseRule(const YAML::Node& node, size_t index);
    static Condition parseCondition(const YAML::Node& node);
};

/**
 * @brief Static checks run before a policy can become active
 */
class PolicyValidator {
public:
    /// Tolerance for the weighted-choice sum
    static constexpr double kWeightTolerance = 1e-6;

    /**
     * @brief Validate a policy against a registry snapshot
     *
     * Referenced models must exist and be enabled, weighted directives must
     * have positive weights summing to 1, rule ids must be unique, condition
     * operators must fit their fields, and fallback chains must reference
     * known chains or models without cycles.
     *
     * @throws PolicyValidationError describing the first violation
     */
    static void validate(const Policy& policy, const RegistrySnapshot& registry);

private:
    static void validateCondition(const Policy& policy, const PolicyRule& rule, const Condition& condition);
    static void validateModelReference(const Policy& policy, const RegistrySnapshot& registry,
                                       const std::string& model_id, const std::string& where);
    static void validateFallbackChains(const Policy& policy, const RegistrySnapshot& registry);
};

/**
 * @brief Versioned policy store addressable by (app, version)
 *
 * Published policies are immutable; publishing a new version makes it the
 * active one for its app. Requests hold the PolicyPtr they started with.
 */
class PolicyStore {
public:
    explicit PolicyStore(ModelRegistry& registry);

    /**
     * @brief Validate and publish a policy, making it active
     * @throws PolicyValidationError if validation fails or the version exists
     */
    PolicyPtr publish(const Policy& policy);

    /**
     * @brief Load a YAML file and publish it
     */
    PolicyPtr publishFile(const std::string& path);

    /**
     * @brief Re-activate a previously published version
     * @return False if the version is unknown
     */
    bool activate(const std::string& app_id, const std::string& version);

    /**
     * @brief Active policy for an app, or nullptr
     */
    PolicyPtr active(const std::string& app_id) const;

    /**
     * @brief Specific version, or nullptr
     */
    PolicyPtr get(const std::string& app_id, const std::string& version) const;

    /**
     * @brief Published versions of an app in publication order
     */
    std::vector<std::string> versions(const std::string& app_id) const;

private:
    struct AppPolicies {
        std::map<std::string, PolicyPtr> by_version;
        std::vector<std::string> order;
        PolicyPtr active;
    };

    ModelRegistry& m_registry;
    std::map<std::string, AppPolicies> m_apps;
    mutable std::mutex m_mutex;
};

} // namespace Arbiter
