// =================================================================
// include/Arbiter/ProviderAdapter.hpp
// =================================================================
// Abstract interface the engine uses to call a model provider.

#pragma once

#include "Arbiter/ModelDescriptor.hpp"
#include <string>
#include <chrono>
#include <optional>
#include <memory>

namespace Arbiter {

/**
 * @brief Provider failure classes; the retry decision is derived from these
 */
enum class ProviderErrorClass {
    NONE,               ///< No error
    TIMEOUT,            ///< Call exceeded its deadline (retryable)
    RATE_LIMITED,       ///< Provider throttled the request (retryable)
    SERVER_ERROR,       ///< 5xx-equivalent provider failure (retryable)
    UNAVAILABLE,        ///< Connection could not be established (retryable)
    AUTH_FAILURE,       ///< Credentials rejected (terminal)
    MALFORMED_REQUEST,  ///< Provider rejected the payload (terminal)
    CANCELLED           ///< Caller cancelled before the call completed (terminal)
};

/**
 * @brief Whether a failure of this class should be retried on the same model
 */
bool isRetryable(ProviderErrorClass error_class);

std::string providerErrorClassToString(ProviderErrorClass error_class);

/**
 * @brief Token counts reported by a provider
 */
struct TokenUsage {
    size_t input_tokens = 0;    ///< Prompt tokens
    size_t output_tokens = 0;   ///< Completion tokens

    size_t total() const { return input_tokens + output_tokens; }

    TokenUsage& operator+=(const TokenUsage& other) {
        input_tokens += other.input_tokens;
        output_tokens += other.output_tokens;
        return *this;
    }
};

/**
 * @brief Per-call options passed to an adapter
 */
struct InvocationOptions {
    size_t max_tokens = 1024;                   ///< Output token cap
    double temperature = 0.7;                   ///< Sampling temperature
    std::string system_instruction;             ///< Optional system instruction
    std::chrono::milliseconds timeout{30000};   ///< Deadline for the call
};

/**
 * @brief Structured provider failure
 */
struct ProviderError {
    ProviderErrorClass error_class = ProviderErrorClass::NONE; ///< Failure class
    std::string message;                                       ///< Provider message
    std::optional<std::chrono::milliseconds> retry_after;      ///< Provider-supplied retry hint
};

/**
 * @brief Result of one adapter call: text and usage, or an error
 */
struct InvocationResult {
    bool success = false;                   ///< Whether the call produced output
    std::string text;                       ///< Generated text
    TokenUsage usage;                       ///< Token usage
    std::chrono::milliseconds latency{0};   ///< Provider-reported or measured latency
    ProviderError error;                    ///< Failure details when !success

    static InvocationResult ok(const std::string& text, const TokenUsage& usage,
                               std::chrono::milliseconds latency);
    static InvocationResult failure(ProviderErrorClass error_class, const std::string& message,
                                    std::chrono::milliseconds latency = std::chrono::milliseconds(0));
};

/**
 * @brief Narrow provider contract
 *
 * Implementations must classify every failure into a ProviderErrorClass
 * rather than throwing; exceptions escaping invoke() are treated as
 * SERVER_ERROR by the orchestrator.
 */
class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    /**
     * @brief Call the model
     * @param model Model to invoke
     * @param input Normalized input text
     * @param options Call options
     * @return Output or classified error
     */
    virtual InvocationResult invoke(const ModelDescriptor& model,
                                    const std::string& input,
                                    const InvocationOptions& options) = 0;

    /**
     * @brief Adapter name for logs
     */
    virtual std::string getName() const = 0;
};

using ProviderAdapterPtr = std::shared_ptr<ProviderAdapter>;

} // namespace Arbiter
