// =================================================================
// include/Arbiter/OutputFirewall.hpp
// =================================================================
// Screens model output for sensitive content before it reaches the caller.

#pragma once

#include "Arbiter/Deadline.hpp"
#include "Arbiter/ModelDescriptor.hpp"
#include "Arbiter/Policy.hpp"
#include "Arbiter/ProviderAdapter.hpp"
#include "Arbiter/RequestContext.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace Arbiter {

/**
 * @brief Firewall outcome
 */
enum class FirewallState {
    CLEAN,      ///< No detector fired (or screening disabled)
    FLAGGED,    ///< Original output returned with masked annotations
    REDRAFTED   ///< Output replaced by a sanitized rewrite
};

std::string firewallStateToString(FirewallState state);

/**
 * @brief Raw detector hit; never leaves the firewall unmasked
 */
struct DetectorMatch {
    size_t offset = 0;      ///< Byte offset in the scanned text
    size_t length = 0;      ///< Span length
};

/**
 * @brief Result of one detector over a text
 */
struct DetectionResult {
    std::vector<DetectorMatch> matches;   ///< Confirmed hits
    bool inconclusive = false;            ///< Something resembled a hit but failed validation
};

/**
 * @brief One reported violation
 */
struct FirewallViolation {
    std::string detector;         ///< Detector name
    std::string masked_sample;    ///< Masked span, at most 4 trailing characters visible
    size_t offset = 0;            ///< Byte offset in the screened output
};

/**
 * @brief Firewall annotations carried by the response and the trace
 */
struct FirewallReport {
    FirewallState state = FirewallState::CLEAN;     ///< Outcome
    FirewallAction action = FirewallAction::FLAG;   ///< Effective action
    std::vector<FirewallViolation> violations;      ///< Masked violations
    bool redrafted = false;                         ///< Output was replaced
    std::string sanitizing_model;                   ///< Model that produced the redraft
    bool degraded = false;                          ///< Redraft or contextual check fell back
    std::string degrade_reason;                     ///< Why it degraded
    bool contextual_ran = false;                    ///< Contextual detector was consulted
    TokenUsage sanitizer_usage;                     ///< Tokens used by the sanitizer
    std::chrono::milliseconds sanitizer_latency{0}; ///< Sanitizer latency
};

/**
 * @brief Screened output plus its report
 */
struct FirewallResult {
    std::string output;       ///< Text to return to the caller
    FirewallReport report;    ///< Annotations
};

/**
 * @brief Deterministic detector base class
 */
class Detector {
public:
    virtual ~Detector() = default;
    virtual DetectionResult scan(const std::string& text) const = 0;
    virtual std::string getName() const = 0;
};

/**
 * @brief Detector backed by a single regular expression
 */
class PatternDetector : public Detector {
public:
    PatternDetector(const std::string& name, const std::string& pattern,
                    std::regex_constants::syntax_option_type flags = std::regex_constants::ECMAScript);

    DetectionResult scan(const std::string& text) const override;
    std::string getName() const override { return m_name; }

private:
    std::string m_name;
    std::regex m_pattern;
};

/**
 * @brief Card numbers: 13-19 digits with optional separators, Luhn checked
 *
 * Digit runs of card length that fail the Luhn check mark the scan as
 * inconclusive instead of firing.
 */
class CreditCardDetector : public Detector {
public:
    CreditCardDetector();

    DetectionResult scan(const std::string& text) const override;
    std::string getName() const override { return "credit_card"; }

private:
    std::regex m_pattern;
};

/**
 * @brief Model-judged detector consulted only when deterministic detectors are inconclusive
 */
class ContextualDetector {
public:
    virtual ~ContextualDetector() = default;
    virtual std::vector<DetectorMatch> judge(const std::string& text) = 0;
    virtual std::string getName() const = 0;
};

/**
 * @brief Contextual detector that asks a model for a YES/NO verdict
 */
class AdapterContextualDetector : public ContextualDetector {
public:
    AdapterContextualDetector(ProviderAdapterPtr adapter, ModelDescriptorPtr model);

    std::vector<DetectorMatch> judge(const std::string& text) override;
    std::string getName() const override { return "contextual"; }

private:
    ProviderAdapterPtr m_adapter;
    ModelDescriptorPtr m_model;
};

/**
 * @brief Runs the detector chain and applies the flag/redraft action
 */
class OutputFirewall {
public:
    /// Instruction sent to the sanitizing model
    static const char* const kSanitizeInstruction;

    /**
     * @param sanitizer_timeout Bound on the sanitizing call
     * @param contextual_timeout Bound on the contextual detector
     */
    OutputFirewall(std::chrono::milliseconds sanitizer_timeout = std::chrono::milliseconds(10000),
                   std::chrono::milliseconds contextual_timeout = std::chrono::milliseconds(500));

    /**
     * @brief Screen output
     * @param output Raw model output
     * @param policy Policy held by the request
     * @param override Request-level action override
     * @param sanitizer Adapter for the sanitizing model, may be null
     * @param sanitizer_model Sanitizing model, may be null
     * @param contextual Contextual detector, may be null
     */
    FirewallResult screen(const std::string& output,
                          const Policy& policy,
                          const std::optional<FirewallAction>& override,
                          ProviderAdapterPtr sanitizer = nullptr,
                          ModelDescriptorPtr sanitizer_model = nullptr,
                          std::shared_ptr<ContextualDetector> contextual = nullptr) const;

    /**
     * @brief Run the deterministic chain
     * @param inconclusive Set when any detector was inconclusive and none fired
     */
    std::vector<FirewallViolation> detect(const std::string& text, const DetectorConfig& config,
                                          bool& inconclusive) const;

    /**
     * @brief Names of built-in detectors in chain order
     */
    static std::vector<std::string> builtinDetectorNames();

    /**
     * @brief Mask a span, revealing at most min(4, len/2) trailing characters
     */
    static std::string maskSample(const std::string& span);

    /**
     * @brief Luhn checksum over a string of digits
     */
    static bool luhnValid(const std::string& digits);

private:
    std::chrono::milliseconds m_sanitizer_timeout;
    std::chrono::milliseconds m_contextual_timeout;
    WorkerBudget m_sanitizer_calls;
    WorkerBudget m_contextual_calls;
    std::vector<std::shared_ptr<Detector>> m_builtins;

    std::vector<std::shared_ptr<Detector>> chainFor(const DetectorConfig& config) const;
    bool redraft(const std::string& output, ProviderAdapterPtr sanitizer, ModelDescriptorPtr sanitizer_model,
                 FirewallResult& result) const;
};

} // namespace Arbiter
