// =================================================================
// src/Arbiter/ProviderAdapter.cpp
// =================================================================

#include "Arbiter/ProviderAdapter.hpp"

namespace Arbiter {

bool isRetryable(ProviderErrorClass error_class) {
    switch (error_class) {
        case ProviderErrorClass::TIMEOUT:
        case ProviderErrorClass::RATE_LIMITED:
        case ProviderErrorClass::SERVER_ERROR:
        case ProviderErrorClass::UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

std::string providerErrorClassToString(ProviderErrorClass error_class) {
    switch (error_class) {
        case ProviderErrorClass::NONE: return "none";
        case ProviderErrorClass::TIMEOUT: return "timeout";
        case ProviderErrorClass::RATE_LIMITED: return "rate_limited";
        case ProviderErrorClass::SERVER_ERROR: return "server_error";
        case ProviderErrorClass::UNAVAILABLE: return "unavailable";
        case ProviderErrorClass::AUTH_FAILURE: return "auth_failure";
        case ProviderErrorClass::MALFORMED_REQUEST: return "malformed_request";
        case ProviderErrorClass::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

InvocationResult InvocationResult::ok(const std::string& text, const TokenUsage& usage,
                                      std::chrono::milliseconds latency) {
    InvocationResult result;
    result.success = true;
    result.text = text;
    result.usage = usage;
    result.latency = latency;
    return result;
}

InvocationResult InvocationResult::failure(ProviderErrorClass error_class, const std::string& message,
                                           std::chrono::milliseconds latency) {
    InvocationResult result;
    result.success = false;
    result.latency = latency;
    result.error.error_class = error_class;
    result.error.message = message;
    return result;
}

} // namespace Arbiter
