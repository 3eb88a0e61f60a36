// =================================================================
// src/Arbiter/ModelRegistry.cpp
// =================================================================
// Implementation of the model registry.

#include "Arbiter/ModelRegistry.hpp"
#include "Arbiter/HttpProviderAdapter.hpp"
#include "Arbiter/Errors.hpp"
#include "Arbiter/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <sstream>

namespace Arbiter {

RegistrySnapshot::RegistrySnapshot(std::vector<ModelDescriptorPtr> models, uint64_t generation)
    : m_models(std::move(models)), m_generation(generation) {
    for (const auto& model : m_models) {
        m_by_id[model->id] = model;
    }
}

ModelDescriptorPtr RegistrySnapshot::find(const std::string& model_id) const {
    auto it = m_by_id.find(model_id);
    return it != m_by_id.end() ? it->second : nullptr;
}

ModelRegistry::ModelRegistry()
    : m_snapshot(std::make_shared<RegistrySnapshot>()) {

    registerAdapterFactory("http", [](const ModelDescriptor&) {
        return std::make_shared<HttpProviderAdapter>();
    });

    m_status.last_update = std::chrono::system_clock::now();
}

RegistryStatus ModelRegistry::loadFromConfig(const std::string& config_path) {
    Logger::getInstance().info("ModelRegistry", "Loading models from configuration: " + config_path);

    auto models = parseConfigFile(config_path);
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        m_config_path = config_path;
    }
    return publish(models);
}

RegistryStatus ModelRegistry::reloadConfiguration() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        path = m_config_path;
    }
    if (path.empty()) {
        Logger::getInstance().warning("ModelRegistry", "No configuration file path set");
        return getStatus();
    }
    return loadFromConfig(path);
}

RegistryStatus ModelRegistry::publish(const std::vector<ModelDescriptor>& models) {
    RegistryStatus status;
    status.total_configured = models.size();

    std::vector<ModelDescriptorPtr> accepted;
    std::unordered_map<std::string, bool> seen;

    for (const auto& model : models) {
        ModelLoadResult result;
        result.model_id = model.id;

        std::string error;
        if (seen.count(model.id)) {
            error = "Duplicate model id";
        } else if (!validateDescriptor(model, error)) {
            // error already set
        } else {
            seen[model.id] = true;
            accepted.push_back(std::make_shared<const ModelDescriptor>(model));
            result.success = true;
            status.accepted++;
            if (model.enabled) {
                status.enabled++;
            }
        }

        if (!result.success) {
            result.error_message = error;
            status.rejected++;
            Logger::getInstance().error("ModelRegistry",
                "Rejected model '" + model.id + "': " + error);
        }
        status.load_results.push_back(result);
    }

    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_snapshot = std::make_shared<const RegistrySnapshot>(std::move(accepted), ++m_generation);
    status.last_update = std::chrono::system_clock::now();
    m_status = status;

    Logger::getInstance().info("ModelRegistry",
        "Published registry generation " + std::to_string(m_generation) +
        ". Accepted: " + std::to_string(status.accepted) +
        "/" + std::to_string(status.total_configured));

    return status;
}

RegistrySnapshotPtr ModelRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_snapshot;
}

void ModelRegistry::registerAdapterFactory(const std::string& adapter_type, AdapterFactory factory) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_factories[adapter_type] = std::move(factory);
    m_adapters.erase(adapter_type);
    Logger::getInstance().debug("ModelRegistry", "Registered adapter factory for type: " + adapter_type);
}

ProviderAdapterPtr ModelRegistry::adapterFor(const ModelDescriptor& model) {
    std::lock_guard<std::mutex> lock(m_registry_mutex);

    auto cached = m_adapters.find(model.adapter_type);
    if (cached != m_adapters.end()) {
        return cached->second;
    }

    auto factory_it = m_factories.find(model.adapter_type);
    if (factory_it == m_factories.end()) {
        Logger::getInstance().error("ModelRegistry",
            "No adapter factory registered for type: " + model.adapter_type);
        return nullptr;
    }

    auto adapter = factory_it->second(model);
    if (adapter) {
        m_adapters[model.adapter_type] = adapter;
    }
    return adapter;
}

bool ModelRegistry::validateDescriptor(const ModelDescriptor& model, std::string& error) const {
    if (model.id.empty()) {
        error = "Model configuration missing id";
        return false;
    }
    if (model.provider.empty()) {
        error = "Model configuration missing provider";
        return false;
    }
    if (model.name.empty()) {
        error = "Model configuration missing name";
        return false;
    }
    if (model.price_per_1k_input < 0.0 || model.price_per_1k_output < 0.0) {
        error = "Prices must be non-negative";
        return false;
    }
    if (model.adapter_type == "http" && model.endpoint.empty()) {
        error = "HTTP model missing endpoint";
        return false;
    }
    return true;
}

RegistryStatus ModelRegistry::getStatus() const {
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    return m_status;
}

std::string ModelRegistry::getAllModelsInfo() const {
    std::stringstream ss;
    auto status = getStatus();
    auto snap = snapshot();

    ss << "Model Registry Status\n";
    ss << "=====================\n";
    ss << "Generation: " << snap->generation() << "\n";
    ss << "Total Configured: " << status.total_configured << "\n";
    ss << "Accepted: " << status.accepted << "\n";
    ss << "Rejected: " << status.rejected << "\n";
    ss << "Enabled: " << status.enabled << "\n";

    if (snap->size() == 0) {
        ss << "\nNo models registered.\n";
        return ss.str();
    }

    ss << "\nModels:\n";
    for (const auto& model : snap->all()) {
        ss << "  " << ModelDescriptorUtils::describe(*model) << "\n";
        if (!model->capabilities.empty()) {
            ss << "    Capabilities: ";
            for (size_t i = 0; i < model->capabilities.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << model->capabilities[i];
            }
            ss << "\n";
        }
    }
    return ss.str();
}

std::vector<ModelDescriptor> ModelRegistry::parseConfigFile(const std::string& config_path) {
    std::vector<ModelDescriptor> models;

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse model configuration " + config_path + ": " + e.what());
    }

    if (!root["models"]) {
        Logger::getInstance().warning("ModelRegistry", "No 'models' section in configuration file");
        return models;
    }

    try {
        YAML::Node models_node = root["models"];
        for (YAML::const_iterator it = models_node.begin(); it != models_node.end(); ++it) {
            ModelDescriptor model;
            model.id = it->first.as<std::string>();

            YAML::Node node = it->second;
            model.provider = node["provider"].as<std::string>("");
            model.name = node["name"].as<std::string>(model.id);
            model.version = node["version"].as<std::string>("");
            model.adapter_type = node["adapter"].as<std::string>("http");
            model.endpoint = node["endpoint"].as<std::string>("");
            model.enabled = node["enabled"].as<bool>(true);

            if (node["compliance"]) {
                model.compliance = ModelDescriptorUtils::stringToCompliance(
                    node["compliance"].as<std::string>());
            }

            if (node["pricing"]) {
                YAML::Node pricing = node["pricing"];
                model.price_per_1k_input = pricing["input_per_1k"].as<double>(0.0);
                model.price_per_1k_output = pricing["output_per_1k"].as<double>(0.0);
            }

            if (node["capabilities"]) {
                for (const auto& cap : node["capabilities"]) {
                    model.capabilities.push_back(cap.as<std::string>());
                }
            }

            if (node["custom_attributes"]) {
                for (YAML::const_iterator attr_it = node["custom_attributes"].begin();
                     attr_it != node["custom_attributes"].end(); ++attr_it) {
                    model.custom_attributes[attr_it->first.as<std::string>()] =
                        attr_it->second.as<std::string>();
                }
            }

            models.push_back(model);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed model entry in " + config_path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid model entry in " + config_path + ": " + e.what());
    }

    return models;
}

} // namespace Arbiter
