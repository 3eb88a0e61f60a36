// =================================================================
// src/Arbiter/Policy.cpp
// =================================================================
// Policy value helpers.

#include "Arbiter/Policy.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <unordered_set>

namespace Arbiter {

std::string conditionOpToString(ConditionOp op) {
    switch (op) {
        case ConditionOp::EQ: return "eq";
        case ConditionOp::NE: return "ne";
        case ConditionOp::LT: return "lt";
        case ConditionOp::GE: return "ge";
        case ConditionOp::IN: return "in";
        case ConditionOp::CONTAINS: return "contains";
        default: return "unknown";
    }
}

ConditionOp parseConditionOp(const std::string& name) {
    if (name == "eq" || name == "==") return ConditionOp::EQ;
    if (name == "ne" || name == "!=") return ConditionOp::NE;
    if (name == "lt" || name == "<") return ConditionOp::LT;
    if (name == "ge" || name == ">=") return ConditionOp::GE;
    if (name == "in") return ConditionOp::IN;
    if (name == "contains") return ConditionOp::CONTAINS;
    throw std::invalid_argument("Unknown condition operator: " + name);
}

DirectiveKind directiveKind(const Directive& directive) {
    if (std::holds_alternative<SingleChoice>(directive)) return DirectiveKind::SINGLE;
    if (std::holds_alternative<WeightedChoice>(directive)) return DirectiveKind::WEIGHTED;
    return DirectiveKind::ORDERED;
}

std::string directiveKindToString(DirectiveKind kind) {
    switch (kind) {
        case DirectiveKind::SINGLE: return "single";
        case DirectiveKind::WEIGHTED: return "weighted";
        case DirectiveKind::ORDERED: return "ordered";
        default: return "unknown";
    }
}

std::vector<std::string> directiveModels(const Directive& directive) {
    std::vector<std::string> models;
    switch (directiveKind(directive)) {
        case DirectiveKind::SINGLE:
            models.push_back(std::get<SingleChoice>(directive).model);
            break;
        case DirectiveKind::WEIGHTED:
            for (const auto& entry : std::get<WeightedChoice>(directive).entries) {
                models.push_back(entry.model);
            }
            break;
        case DirectiveKind::ORDERED:
            models = std::get<OrderedChoice>(directive).models;
            break;
    }
    return models;
}

std::vector<std::string> Policy::expandFallbackChain(const std::string& chain_name) const {
    std::vector<std::string> expanded;
    std::unordered_set<std::string> seen_models;
    std::unordered_set<std::string> visiting;

    std::function<void(const std::string&)> expand = [&](const std::string& name) {
        auto it = fallback_chains.find(name);
        if (it == fallback_chains.end() || visiting.count(name)) {
            return;
        }
        visiting.insert(name);
        for (const auto& entry : it->second) {
            if (!entry.empty() && entry[0] == '@') {
                expand(entry.substr(1));
            } else if (seen_models.insert(entry).second) {
                expanded.push_back(entry);
            }
        }
        visiting.erase(name);
    };

    expand(chain_name);
    return expanded;
}

} // namespace Arbiter
