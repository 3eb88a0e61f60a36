// =================================================================
// src/Arbiter/Subscription.cpp
// =================================================================
// Implementation of the subscription store.

#include "Arbiter/Subscription.hpp"
#include "Arbiter/Errors.hpp"
#include "Arbiter/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace Arbiter {

std::string subscriptionScopeToString(SubscriptionScope scope) {
    switch (scope) {
        case SubscriptionScope::TENANT: return "tenant";
        case SubscriptionScope::APP: return "app";
        case SubscriptionScope::TEAM: return "team";
        default: return "unknown";
    }
}

SubscriptionScope parseSubscriptionScope(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "tenant") return SubscriptionScope::TENANT;
    if (lower == "app") return SubscriptionScope::APP;
    if (lower == "team") return SubscriptionScope::TEAM;
    throw std::invalid_argument("Unknown subscription scope: " + name);
}

SubscriptionSnapshot::SubscriptionSnapshot(std::vector<Subscription> subscriptions, uint64_t version)
    : m_subscriptions(std::move(subscriptions)), m_version(version) {
}

std::vector<const Subscription*> SubscriptionSnapshot::lookup(SubscriptionScope scope,
                                                              const std::string& target_id) const {
    std::vector<const Subscription*> matches;
    for (const auto& subscription : m_subscriptions) {
        if (subscription.scope == scope && subscription.target_id == target_id) {
            matches.push_back(&subscription);
        }
    }
    return matches;
}

SubscriptionStore::SubscriptionStore()
    : m_snapshot(std::make_shared<SubscriptionSnapshot>()) {
}

void SubscriptionStore::loadFromConfig(const std::string& config_path) {
    std::vector<Subscription> subscriptions;

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        YAML::Node list = root["subscriptions"];
        if (!list) {
            Logger::getInstance().warning("SubscriptionStore",
                "No 'subscriptions' section in " + config_path + "; every request will be denied");
        }

        for (const auto& node : list ? list : YAML::Node(YAML::NodeType::Sequence)) {
            Subscription subscription;
            subscription.scope = parseSubscriptionScope(node["scope"].as<std::string>());
            subscription.target_id = node["target"].as<std::string>();
            subscription.enabled = node["enabled"].as<bool>(true);
            if (node["models"]) {
                for (const auto& model : node["models"]) {
                    subscription.models.insert(model.as<std::string>());
                }
            }
            subscriptions.push_back(subscription);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load subscriptions from " + config_path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid subscription in " + config_path + ": " + e.what());
    }

    publish(std::move(subscriptions));
}

void SubscriptionStore::publish(std::vector<Subscription> subscriptions) {
    size_t count = subscriptions.size();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot = std::make_shared<const SubscriptionSnapshot>(std::move(subscriptions), ++m_version);
    Logger::getInstance().info("SubscriptionStore",
        "Published subscription version " + std::to_string(m_version),
        std::to_string(count) + " subscriptions");
}

SubscriptionSnapshotPtr SubscriptionStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

} // namespace Arbiter
