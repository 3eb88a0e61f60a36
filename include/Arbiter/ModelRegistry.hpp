// =================================================================
// include/Arbiter/ModelRegistry.hpp
// =================================================================
// Read-only registry of model descriptors published as immutable snapshots.

#pragma once

#include "Arbiter/ModelDescriptor.hpp"
#include "Arbiter/ProviderAdapter.hpp"
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <functional>
#include <mutex>
#include <cstdint>

namespace Arbiter {

/**
 * @brief Immutable view of the registry at one point in time
 */
class RegistrySnapshot {
public:
    RegistrySnapshot() = default;
    RegistrySnapshot(std::vector<ModelDescriptorPtr> models, uint64_t generation);

    /**
     * @brief Find a model by registry id
     * @return Descriptor or nullptr if not registered
     */
    ModelDescriptorPtr find(const std::string& model_id) const;

    /**
     * @brief All models in registration order
     */
    const std::vector<ModelDescriptorPtr>& all() const { return m_models; }

    size_t size() const { return m_models.size(); }
    uint64_t generation() const { return m_generation; }

private:
    std::vector<ModelDescriptorPtr> m_models;
    std::unordered_map<std::string, ModelDescriptorPtr> m_by_id;
    uint64_t m_generation = 0;
};

using RegistrySnapshotPtr = std::shared_ptr<const RegistrySnapshot>;

/**
 * @brief Model loading result
 */
struct ModelLoadResult {
    bool success = false;                  ///< Whether the descriptor was accepted
    std::string model_id;                  ///< Model identifier
    std::string error_message;             ///< Error message if rejected
};

/**
 * @brief Registry status information
 */
struct RegistryStatus {
    size_t total_configured = 0;           ///< Total models in config
    size_t accepted = 0;                   ///< Descriptors that passed validation
    size_t rejected = 0;                   ///< Descriptors that failed validation
    size_t enabled = 0;                    ///< Accepted and enabled
    std::chrono::system_clock::time_point last_update; ///< Last publish time
    std::vector<ModelLoadResult> load_results; ///< Individual results
};

/**
 * @brief Adapter factory function type
 */
using AdapterFactory = std::function<ProviderAdapterPtr(const ModelDescriptor&)>;

/**
 * @brief Centralized model registry
 *
 * Requests read a snapshot once at the start and keep it for their whole
 * lifetime; reloads publish a new snapshot without disturbing readers.
 */
class ModelRegistry {
public:
    ModelRegistry();
    virtual ~ModelRegistry() = default;

    /**
     * @brief Load models from a YAML file and publish a new snapshot
     * @param config_path Path to YAML file with a `models:` map
     * @return Registry status after loading
     * @throws ConfigError if the file cannot be read or parsed
     */
    virtual RegistryStatus loadFromConfig(const std::string& config_path);

    /**
     * @brief Reload the last loaded file
     */
    virtual RegistryStatus reloadConfiguration();

    /**
     * @brief Publish descriptors directly (used by tests and embedders)
     * @return Registry status after publishing
     */
    virtual RegistryStatus publish(const std::vector<ModelDescriptor>& models);

    /**
     * @brief Current snapshot; never null
     */
    virtual RegistrySnapshotPtr snapshot() const;

    /**
     * @brief Register an adapter factory for an adapter type
     */
    virtual void registerAdapterFactory(const std::string& adapter_type, AdapterFactory factory);

    /**
     * @brief Adapter for a model, created once per adapter type and cached
     * @return Adapter or nullptr if no factory is registered for the type
     */
    virtual ProviderAdapterPtr adapterFor(const ModelDescriptor& model);

    /**
     * @brief Validate a single descriptor
     * @param error Receives the reason when invalid
     */
    virtual bool validateDescriptor(const ModelDescriptor& model, std::string& error) const;

    virtual RegistryStatus getStatus() const;

    /**
     * @brief Formatted listing of all models (for the CLI)
     */
    virtual std::string getAllModelsInfo() const;

protected:
    /**
     * @brief Parse YAML configuration file
     */
    virtual std::vector<ModelDescriptor> parseConfigFile(const std::string& config_path);

private:
    std::string m_config_path;
    RegistrySnapshotPtr m_snapshot;
    RegistryStatus m_status;
    uint64_t m_generation = 0;
    std::unordered_map<std::string, AdapterFactory> m_factories;
    std::unordered_map<std::string, ProviderAdapterPtr> m_adapters;
    mutable std::mutex m_registry_mutex;
};

} // namespace Arbiter
