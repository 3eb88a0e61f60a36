// =================================================================
// src/Arbiter/RequestContext.cpp
// =================================================================

#include "Arbiter/RequestContext.hpp"
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace Arbiter {

static std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool RequestContext::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::string sensitivityToString(SensitivityLevel level) {
    switch (level) {
        case SensitivityLevel::PUBLIC: return "public";
        case SensitivityLevel::LOW: return "low";
        case SensitivityLevel::MEDIUM: return "medium";
        case SensitivityLevel::HIGH: return "high";
        case SensitivityLevel::RESTRICTED: return "restricted";
        default: return "unknown";
    }
}

SensitivityLevel parseSensitivity(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "public") return SensitivityLevel::PUBLIC;
    if (lower == "low") return SensitivityLevel::LOW;
    if (lower == "medium") return SensitivityLevel::MEDIUM;
    if (lower == "high") return SensitivityLevel::HIGH;
    if (lower == "restricted") return SensitivityLevel::RESTRICTED;
    throw std::invalid_argument("Unknown sensitivity level: " + name);
}

std::string firewallActionToString(FirewallAction action) {
    switch (action) {
        case FirewallAction::NONE: return "none";
        case FirewallAction::FLAG: return "flag";
        case FirewallAction::REDRAFT: return "redraft";
        default: return "unknown";
    }
}

FirewallAction parseFirewallAction(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "none") return FirewallAction::NONE;
    if (lower == "flag") return FirewallAction::FLAG;
    if (lower == "redraft") return FirewallAction::REDRAFT;
    throw std::invalid_argument("Unknown firewall action: " + name);
}

} // namespace Arbiter
