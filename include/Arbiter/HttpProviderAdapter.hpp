// =================================================================
// include/Arbiter/HttpProviderAdapter.hpp
// =================================================================
// Provider adapter for OpenAI-compatible chat completion endpoints.

#pragma once

#include "Arbiter/ProviderAdapter.hpp"
#include <string>
#include <chrono>
#include <optional>

namespace Arbiter {

class HttpProviderAdapter : public ProviderAdapter {
public:
    /**
     * @brief Constructs the HTTP client adapter.
     * @param completion_path Path of the chat completion endpoint on every model's server.
     */
    explicit HttpProviderAdapter(const std::string& completion_path = "/v1/chat/completions");

    InvocationResult invoke(const ModelDescriptor& model,
                            const std::string& input,
                            const InvocationOptions& options) override;

    std::string getName() const override;

    /**
     * @brief Map an HTTP status code to a provider error class
     */
    static ProviderErrorClass classifyStatus(int status);

    /**
     * @brief Parse a Retry-After header holding delta-seconds
     */
    static std::optional<std::chrono::milliseconds> parseRetryAfter(const std::string& value);

private:
    std::string m_completion_path;

    /**
     * @brief Build the JSON request body for a model
     */
    std::string buildRequestBody(const ModelDescriptor& model,
                                 const std::string& input,
                                 const InvocationOptions& options) const;

    /**
     * @brief Resolve the bearer token from the model's api_key_env attribute
     */
    std::string resolveApiKey(const ModelDescriptor& model) const;
};

} // namespace Arbiter
