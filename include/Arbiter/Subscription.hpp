// =================================================================
// include/Arbiter/Subscription.hpp
// =================================================================
// Subscriptions (model allow-lists) and their versioned store.

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <cstdint>

namespace Arbiter {

/**
 * @brief Scope a subscription applies to
 */
enum class SubscriptionScope {
    TENANT,
    APP,
    TEAM
};

std::string subscriptionScopeToString(SubscriptionScope scope);

/**
 * @brief Parse "tenant", "app" or "team"
 * @throws std::invalid_argument for unknown names
 */
SubscriptionScope parseSubscriptionScope(const std::string& name);

/**
 * @brief Allow-list of models for one tenant, app or team
 */
struct Subscription {
    SubscriptionScope scope = SubscriptionScope::APP;   ///< Scope kind
    std::string target_id;                              ///< Tenant, app or team id
    std::unordered_set<std::string> models;             ///< Permitted model ids
    bool enabled = true;                                ///< Disabled entries are ignored
};

/**
 * @brief Immutable set of subscriptions
 */
class SubscriptionSnapshot {
public:
    SubscriptionSnapshot() = default;
    SubscriptionSnapshot(std::vector<Subscription> subscriptions, uint64_t version);

    /**
     * @brief Subscriptions for a scope and target, enabled or not
     */
    std::vector<const Subscription*> lookup(SubscriptionScope scope, const std::string& target_id) const;

    const std::vector<Subscription>& all() const { return m_subscriptions; }
    uint64_t version() const { return m_version; }

private:
    std::vector<Subscription> m_subscriptions;
    uint64_t m_version = 0;
};

using SubscriptionSnapshotPtr = std::shared_ptr<const SubscriptionSnapshot>;

/**
 * @brief Publishes subscription snapshots; readers keep the one they took
 */
class SubscriptionStore {
public:
    SubscriptionStore();

    /**
     * @brief Load subscriptions from YAML and publish them
     * @throws ConfigError on unreadable or malformed files
     */
    void loadFromConfig(const std::string& config_path);

    /**
     * @brief Replace the published subscriptions
     */
    void publish(std::vector<Subscription> subscriptions);

    SubscriptionSnapshotPtr snapshot() const;

private:
    SubscriptionSnapshotPtr m_snapshot;
    uint64_t m_version = 0;
    mutable std::mutex m_mutex;
};

} // namespace Arbiter
