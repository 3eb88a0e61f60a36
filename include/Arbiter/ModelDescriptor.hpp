// =================================================================
// include/Arbiter/ModelDescriptor.hpp
// =================================================================
// Defines model descriptors and compliance metadata read from the registry.

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

namespace Arbiter {

/**
 * @brief Where a model is hosted, for data-handling decisions
 */
enum class ComplianceTag {
    INTERNAL,   ///< Hosted inside the organisation's boundary
    EXTERNAL    ///< Hosted by a third-party provider
};

/**
 * @brief Snapshot of one routable model (provider, name, version)
 */
struct ModelDescriptor {
    std::string id;                          ///< Registry key used by policies and subscriptions
    std::string provider;                    ///< Provider identifier (e.g., "openai", "onprem")
    std::string name;                        ///< Provider-side model name
    std::string version;                     ///< Model version
    std::string adapter_type = "http";       ///< Adapter factory used to reach the provider
    std::string endpoint;                    ///< Base URL for remote adapters
    double price_per_1k_input = 0.0;         ///< Price per 1000 input tokens
    double price_per_1k_output = 0.0;        ///< Price per 1000 output tokens
    std::vector<std::string> capabilities;   ///< Capability tags
    ComplianceTag compliance = ComplianceTag::INTERNAL; ///< Hosting compliance tag
    bool enabled = true;                     ///< Disabled models are never routed to
    std::unordered_map<std::string, std::string> custom_attributes; ///< Adapter-specific settings

    /**
     * @brief Key of the health record and circuit for this model
     */
    std::string healthKey() const { return provider + "/" + name; }

    /**
     * @brief Combined unit price used for cost ordering
     */
    double unitPrice() const { return price_per_1k_input + price_per_1k_output; }

    bool isExternal() const { return compliance == ComplianceTag::EXTERNAL; }
};

using ModelDescriptorPtr = std::shared_ptr<const ModelDescriptor>;

/**
 * @brief Utility functions for descriptor fields
 */
class ModelDescriptorUtils {
public:
    static std::string complianceToString(ComplianceTag tag);

    /**
     * @brief Convert string to compliance tag
     * @return ComplianceTag or throws if invalid
     */
    static ComplianceTag stringToCompliance(const std::string& str);

    static bool hasCapability(const ModelDescriptor& model, const std::string& capability);

    /**
     * @brief One-line description for logs and the CLI
     */
    static std::string describe(const ModelDescriptor& model);
};

} // namespace Arbiter
