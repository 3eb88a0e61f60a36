// =================================================================
// include/Arbiter/Errors.hpp
// =================================================================
// Error taxonomy, reason codes and load-time exceptions.

#pragma once

#include <string>
#include <stdexcept>

namespace Arbiter {

/**
 * @brief Classification of request and load-time failures
 */
enum class ErrorKind {
    NONE,                ///< No error
    POLICY_DENY,         ///< No eligible model, budget exceeded, compliance block
    PROVIDER_TRANSIENT,  ///< Timeout or rate limit; retried, then falls back
    PROVIDER_TERMINAL,   ///< Auth failure or malformed request; falls back immediately
    FIREWALL_DEGRADED,   ///< Detector or sanitizer failure; recovered locally
    EXHAUSTED_FALLBACK,  ///< Every candidate failed
    INVALID_POLICY,      ///< Rejected at load time
    CLIENT_CANCELLED     ///< Caller went away mid-request
};

/**
 * @brief Reason codes reported to callers and used as metric tags
 */
namespace Reason {
    inline constexpr const char* NO_ELIGIBLE_MODEL = "no_eligible_model";
    inline constexpr const char* BUDGET_EXCEEDED = "budget_exceeded";
    inline constexpr const char* COMPLIANCE_BLOCK = "compliance_block";
    inline constexpr const char* NO_ACTIVE_POLICY = "no_active_policy";
    inline constexpr const char* EXHAUSTED_FALLBACK = "exhausted_fallback";
    inline constexpr const char* CLIENT_CANCELLED = "client_cancelled";
    inline constexpr const char* FIREWALL_DEGRADED = "firewall_degraded";
    inline constexpr const char* INTERNAL_ERROR = "internal_error";
}

std::string errorKindToString(ErrorKind kind);

/**
 * @brief Base class for exceptions raised by the engine at load time
 */
class ArbiterError : public std::runtime_error {
public:
    explicit ArbiterError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A policy failed static validation and was not published
 */
class PolicyValidationError : public ArbiterError {
public:
    PolicyValidationError(const std::string& policy_id, const std::string& message)
        : ArbiterError("Invalid policy '" + policy_id + "': " + message), m_policy_id(policy_id) {}

    const std::string& policyId() const { return m_policy_id; }

private:
    std::string m_policy_id;
};

/**
 * @brief A configuration file is missing required data or is malformed
 */
class ConfigError : public ArbiterError {
public:
    explicit ConfigError(const std::string& message) : ArbiterError(message) {}
};

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::POLICY_DENY: return "policy_deny";
        case ErrorKind::PROVIDER_TRANSIENT: return "provider_transient";
        case ErrorKind::PROVIDER_TERMINAL: return "provider_terminal";
        case ErrorKind::FIREWALL_DEGRADED: return "firewall_degraded";
        case ErrorKind::EXHAUSTED_FALLBACK: return "exhausted_fallback";
        case ErrorKind::INVALID_POLICY: return "invalid_policy";
        case ErrorKind::CLIENT_CANCELLED: return "client_cancelled";
        default: return "unknown";
    }
}

} // namespace Arbiter
