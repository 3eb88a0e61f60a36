// =================================================================
// src/Arbiter/PolicyStore.cpp
// =================================================================
// Implementation of the versioned policy store.

#include "Arbiter/PolicyStore.hpp"
#include "Arbiter/Errors.hpp"
#include "Arbiter/Logger.hpp"

namespace Arbiter {

PolicyStore::PolicyStore(ModelRegistry& registry)
    : m_registry(registry) {
}

PolicyPtr PolicyStore::publish(const Policy& policy) {
    try {
        PolicyValidator::validate(policy, *m_registry.snapshot());
    } catch (const PolicyValidationError& e) {
        Logger::getInstance().logPolicyLoad(policy.app_id, policy.version, policy.rules.size(), false, e.what());
        throw;
    }

    auto published = std::make_shared<const Policy>(policy);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        AppPolicies& app = m_apps[policy.app_id];
        if (app.by_version.count(policy.version)) {
            Logger::getInstance().logPolicyLoad(policy.app_id, policy.version, policy.rules.size(), false,
                                                "version already published");
            throw PolicyValidationError(policy.id, "version " + policy.version +
                                        " already published for app " + policy.app_id);
        }
        app.by_version[policy.version] = published;
        app.order.push_back(policy.version);
        app.active = published;
    }

    Logger::getInstance().logPolicyLoad(policy.app_id, policy.version, policy.rules.size(), true);
    return published;
}

PolicyPtr PolicyStore::publishFile(const std::string& path) {
    return publish(PolicyLoader::loadFile(path));
}

bool PolicyStore::activate(const std::string& app_id, const std::string& version) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto app_it = m_apps.find(app_id);
    if (app_it == m_apps.end()) {
        return false;
    }
    auto version_it = app_it->second.by_version.find(version);
    if (version_it == app_it->second.by_version.end()) {
        return false;
    }
    app_it->second.active = version_it->second;
    Logger::getInstance().info("PolicyStore", "Activated policy version " + version, "app=" + app_id);
    return true;
}

PolicyPtr PolicyStore::active(const std::string& app_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_apps.find(app_id);
    return it == m_apps.end() ? nullptr : it->second.active;
}

PolicyPtr PolicyStore::get(const std::string& app_id, const std::string& version) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto app_it = m_apps.find(app_id);
    if (app_it == m_apps.end()) {
        return nullptr;
    }
    auto version_it = app_it->second.by_version.find(version);
    return version_it == app_it->second.by_version.end() ? nullptr : version_it->second;
}

std::vector<std::string> PolicyStore::versions(const std::string& app_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_apps.find(app_id);
    return it == m_apps.end() ? std::vector<std::string>{} : it->second.order;
}

} // namespace Arbiter
