// =================================================================
// src/Arbiter/OutputFirewall.cpp
// =================================================================
// Implementation of the sensitive-output firewall.

#include "Arbiter/OutputFirewall.hpp"
#include "Arbiter/Deadline.hpp"
#include "Arbiter/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Arbiter {

namespace {
constexpr size_t kMaxOutstandingCalls = 16;
}

std::string firewallStateToString(FirewallState state) {
    switch (state) {
        case FirewallState::CLEAN: return "clean";
        case FirewallState::FLAGGED: return "flagged";
        case FirewallState::REDRAFTED: return "redrafted";
        default: return "unknown";
    }
}

const char* const OutputFirewall::kSanitizeInstruction =
    "Rewrite the following text so that it conveys the same information without any personal data, "
    "payment card numbers, government identifiers, credentials, contact details or network addresses. "
    "Replace such values with a neutral placeholder. Return only the rewritten text.";

// =================================================================
// Detectors
// =================================================================

PatternDetector::PatternDetector(const std::string& name, const std::string& pattern,
                                 std::regex_constants::syntax_option_type flags)
    : m_name(name), m_pattern(pattern, flags) {
}

DetectionResult PatternDetector::scan(const std::string& text) const {
    DetectionResult result;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), m_pattern); it != std::sregex_iterator(); ++it) {
        if (it->length() == 0) {
            continue;
        }
        result.matches.push_back({static_cast<size_t>(it->position()), static_cast<size_t>(it->length())});
    }
    return result;
}

CreditCardDetector::CreditCardDetector()
    : m_pattern(R"(\b(?:\d[ -]?){12,18}\d\b)") {
}

DetectionResult CreditCardDetector::scan(const std::string& text) const {
    DetectionResult result;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), m_pattern); it != std::sregex_iterator(); ++it) {
        std::string digits;
        for (char c : it->str()) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                digits.push_back(c);
            }
        }
        if (digits.size() < 13 || digits.size() > 19) {
            continue;
        }
        if (OutputFirewall::luhnValid(digits)) {
            result.matches.push_back({static_cast<size_t>(it->position()), static_cast<size_t>(it->length())});
        } else {
            result.inconclusive = true;
        }
    }
    return result;
}

AdapterContextualDetector::AdapterContextualDetector(ProviderAdapterPtr adapter, ModelDescriptorPtr model)
    : m_adapter(std::move(adapter)), m_model(std::move(model)) {
}

std::vector<DetectorMatch> AdapterContextualDetector::judge(const std::string& text) {
    InvocationOptions options;
    options.max_tokens = 4;
    options.temperature = 0.0;
    options.system_instruction =
        "Answer YES if the following text contains personal data, payment data or secrets, otherwise answer NO.";

    InvocationResult verdict = m_adapter->invoke(*m_model, text, options);
    if (!verdict.success) {
        throw std::runtime_error("contextual detector call failed: " + verdict.error.message);
    }

    std::string answer = verdict.text;
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (answer.find("YES") != std::string::npos) {
        return {DetectorMatch{0, text.size()}};
    }
    return {};
}

// =================================================================
// OutputFirewall
// =================================================================

OutputFirewall::OutputFirewall(std::chrono::milliseconds sanitizer_timeout,
                               std::chrono::milliseconds contextual_timeout)
    : m_sanitizer_timeout(sanitizer_timeout),
      m_contextual_timeout(contextual_timeout),
      m_sanitizer_calls(kMaxOutstandingCalls),
      m_contextual_calls(kMaxOutstandingCalls) {
    m_builtins.push_back(std::make_shared<CreditCardDetector>());
    m_builtins.push_back(std::make_shared<PatternDetector>(
        "email", R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})"));
    m_builtins.push_back(std::make_shared<PatternDetector>(
        "ssn", R"(\b\d{3}-\d{2}-\d{4}\b)"));
    m_builtins.push_back(std::make_shared<PatternDetector>(
        "phone", R"((?:\+\d{1,3}[ .-]?)?\(?\b\d{3}\)?[ .-]?\d{3}[ .-]\d{4}\b)"));
    m_builtins.push_back(std::make_shared<PatternDetector>(
        "api_key",
        R"(\b(?:sk|pk|rk|ghp|gho|xox[abp]|AKIA)[-_A-Za-z0-9]{16,}|(?:api[_-]?key|secret|token|password)\s*[:=]\s*['"]?[A-Za-z0-9_\-]{8,})",
        std::regex_constants::ECMAScript | std::regex_constants::icase));
    m_builtins.push_back(std::make_shared<PatternDetector>(
        "ipv4", R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)"));
}

std::vector<std::string> OutputFirewall::builtinDetectorNames() {
    return {"credit_card", "email", "ssn", "phone", "api_key", "ipv4"};
}

std::string OutputFirewall::maskSample(const std::string& span) {
    size_t visible = std::min<size_t>(4, span.size() / 2);
    return std::string(span.size() - visible, '*') + span.substr(span.size() - visible);
}

bool OutputFirewall::luhnValid(const std::string& digits) {
    if (digits.empty()) {
        return false;
    }
    int sum = 0;
    bool double_digit = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (!std::isdigit(static_cast<unsigned char>(*it))) {
            return false;
        }
        int value = *it - '0';
        if (double_digit) {
            value *= 2;
            if (value > 9) {
                value -= 9;
            }
        }
        sum += value;
        double_digit = !double_digit;
    }
    return sum % 10 == 0;
}

std::vector<std::shared_ptr<Detector>> OutputFirewall::chainFor(const DetectorConfig& config) const {
    std::vector<std::shared_ptr<Detector>> chain;
    for (const auto& detector : m_builtins) {
        if (config.enabled.empty() ||
            std::find(config.enabled.begin(), config.enabled.end(), detector->getName()) != config.enabled.end()) {
            chain.push_back(detector);
        }
    }
    for (const auto& custom : config.custom) {
        try {
            chain.push_back(std::make_shared<PatternDetector>(custom.name, custom.pattern));
        } catch (const std::regex_error& e) {
            // Unreachable for published policies; patterns are compiled during validation
            Logger::getInstance().error("OutputFirewall", "Custom detector pattern rejected: " + custom.name,
                                        e.what());
        }
    }
    return chain;
}

std::vector<FirewallViolation> OutputFirewall::detect(const std::string& text, const DetectorConfig& config,
                                                      bool& inconclusive) const {
    std::vector<FirewallViolation> violations;
    std::vector<DetectorMatch> claimed;
    inconclusive = false;

    auto overlaps = [&claimed](const DetectorMatch& match) {
        return std::any_of(claimed.begin(), claimed.end(), [&match](const DetectorMatch& other) {
            return match.offset < other.offset + other.length && other.offset < match.offset + match.length;
        });
    };

    for (const auto& detector : chainFor(config)) {
        DetectionResult result = detector->scan(text);
        inconclusive = inconclusive || result.inconclusive;
        for (const auto& match : result.matches) {
            if (overlaps(match)) {
                continue;
            }
            claimed.push_back(match);
            violations.push_back({detector->getName(), maskSample(text.substr(match.offset, match.length)),
                                  match.offset});
        }
    }

    std::sort(violations.begin(), violations.end(),
              [](const FirewallViolation& a, const FirewallViolation& b) { return a.offset < b.offset; });

    if (!violations.empty()) {
        inconclusive = false;
    }
    return violations;
}

FirewallResult OutputFirewall::screen(const std::string& output,
                                      const Policy& policy,
                                      const std::optional<FirewallAction>& override,
                                      ProviderAdapterPtr sanitizer,
                                      ModelDescriptorPtr sanitizer_model,
                                      std::shared_ptr<ContextualDetector> contextual) const {
    FirewallResult result;
    result.output = output;
    result.report.action = override.value_or(policy.default_firewall_action);

    bool inconclusive = false;
    result.report.violations = detect(output, policy.detectors, inconclusive);

    if (result.report.violations.empty() && inconclusive && policy.detectors.contextual && contextual) {
        result.report.contextual_ran = true;
        try {
            std::string text = output;
            auto matches = runWithDeadline<std::vector<DetectorMatch>>(
                [contextual, text]() { return contextual->judge(text); }, m_contextual_timeout,
                m_contextual_calls);
            if (!matches) {
                result.report.degraded = true;
                result.report.degrade_reason = "contextual detector timed out";
            } else {
                for (const auto& match : *matches) {
                    size_t length = std::min(match.length, output.size() - std::min(match.offset, output.size()));
                    result.report.violations.push_back({contextual->getName(),
                        maskSample(output.substr(std::min(match.offset, output.size()), length)), match.offset});
                }
            }
        } catch (const std::exception& e) {
            result.report.degraded = true;
            result.report.degrade_reason = std::string("contextual detector failed: ") + e.what();
        }
        if (result.report.degraded) {
            Logger::getInstance().warning("OutputFirewall", "Contextual detector degraded to deterministic results",
                                          result.report.degrade_reason);
        }
    }

    if (result.report.violations.empty() || result.report.action == FirewallAction::NONE) {
        result.report.state = FirewallState::CLEAN;
        return result;
    }

    if (result.report.action == FirewallAction::REDRAFT && redraft(output, sanitizer, sanitizer_model, result)) {
        result.report.state = FirewallState::REDRAFTED;
        result.report.redrafted = true;
        return result;
    }

    result.report.state = FirewallState::FLAGGED;
    return result;
}

bool OutputFirewall::redraft(const std::string& output, ProviderAdapterPtr sanitizer,
                             ModelDescriptorPtr sanitizer_model, FirewallResult& result) const {
    auto degrade = [&result](const std::string& reason) {
        result.report.degraded = true;
        result.report.degrade_reason = reason;
        Logger::getInstance().warning("OutputFirewall", "Redraft degraded to flag", reason);
        return false;
    };

    if (!sanitizer || !sanitizer_model) {
        return degrade("no sanitizing model configured");
    }

    InvocationOptions options;
    options.temperature = 0.0;
    options.system_instruction = kSanitizeInstruction;
    options.timeout = m_sanitizer_timeout;

    ModelDescriptor model = *sanitizer_model;
    std::string text = output;

    try {
        auto sanitized = runWithDeadline<InvocationResult>(
            [sanitizer, model, text, options]() { return sanitizer->invoke(model, text, options); },
            m_sanitizer_timeout, m_sanitizer_calls);
        if (!sanitized) {
            return degrade("sanitizer timed out");
        }
        if (!sanitized->success) {
            return degrade("sanitizer failed: " + sanitized->error.message);
        }

        result.output = sanitized->text;
        result.report.sanitizing_model = sanitizer_model->id;
        result.report.sanitizer_usage = sanitized->usage;
        result.report.sanitizer_latency = sanitized->latency;
        return true;
    } catch (const std::exception& e) {
        return degrade(std::string("sanitizer threw: ") + e.what());
    }
}

} // namespace Arbiter
