// =================================================================
// src/Arbiter/ModelDescriptor.cpp
// =================================================================
// Implementation of model descriptor utilities.

#include "Arbiter/ModelDescriptor.hpp"
#include <algorithm>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace Arbiter {

std::string ModelDescriptorUtils::complianceToString(ComplianceTag tag) {
    switch (tag) {
        case ComplianceTag::INTERNAL: return "internal";
        case ComplianceTag::EXTERNAL: return "external";
        default: return "unknown";
    }
}

ComplianceTag ModelDescriptorUtils::stringToCompliance(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "internal") return ComplianceTag::INTERNAL;
    if (lower == "external") return ComplianceTag::EXTERNAL;

    throw std::invalid_argument("Unknown compliance tag: " + str);
}

bool ModelDescriptorUtils::hasCapability(const ModelDescriptor& model, const std::string& capability) {
    return std::find(model.capabilities.begin(), model.capabilities.end(), capability)
        != model.capabilities.end();
}

std::string ModelDescriptorUtils::describe(const ModelDescriptor& model) {
    std::ostringstream ss;
    ss << model.id << " (" << model.provider << "/" << model.name;
    if (!model.version.empty()) {
        ss << ":" << model.version;
    }
    ss << ", " << complianceToString(model.compliance);
    ss << ", " << std::fixed << std::setprecision(4) << model.unitPrice() << "/1k";
    if (!model.enabled) {
        ss << ", disabled";
    }
    ss << ")";
    return ss.str();
}

} // namespace Arbiter
