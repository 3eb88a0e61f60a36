// =================================================================
// src/Arbiter/PolicyEvaluator.cpp
// =================================================================
// Implementation of first-match policy evaluation.

#include "Arbiter/PolicyEvaluator.hpp"
#include "Arbiter/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace Arbiter {

EvaluationResult PolicyEvaluator::evaluate(const Policy& policy,
                                           const RequestContext& context,
                                           const RegistrySnapshot& registry) {
    EvaluationResult result;

    for (const auto& rule : policy.rules) {
        if (!ruleMatches(rule, context)) {
            continue;
        }

        result.matched = true;
        result.rule_id = rule.id;
        result.candidates.rule_id = rule.id;
        result.candidates.kind = directiveKind(rule.directive);

        std::vector<std::pair<std::string, double>> entries;
        switch (result.candidates.kind) {
            case DirectiveKind::SINGLE:
                entries.emplace_back(std::get<SingleChoice>(rule.directive).model, 1.0);
                break;
            case DirectiveKind::WEIGHTED:
                for (const auto& entry : std::get<WeightedChoice>(rule.directive).entries) {
                    entries.emplace_back(entry.model, entry.weight);
                }
                break;
            case DirectiveKind::ORDERED:
                for (const auto& model_id : std::get<OrderedChoice>(rule.directive).models) {
                    entries.emplace_back(model_id, 1.0);
                }
                break;
        }

        for (const auto& [model_id, weight] : entries) {
            auto model = registry.find(model_id);
            if (!model || !model->enabled) {
                result.dropped.push_back(model_id);
                continue;
            }
            result.candidates.candidates.push_back({model, weight, rule.id, false});
        }

        result.fallback.rule_id = rule.id;
        result.fallback.kind = DirectiveKind::ORDERED;
        if (!rule.fallback_chain.empty()) {
            for (const auto& model_id : policy.expandFallbackChain(rule.fallback_chain)) {
                auto model = registry.find(model_id);
                if (!model || !model->enabled) {
                    result.dropped.push_back(model_id);
                    continue;
                }
                result.fallback.candidates.push_back({model, 1.0, rule.id, false});
            }
        }

        if (!result.dropped.empty()) {
            Logger::getInstance().warning("PolicyEvaluator",
                "Rule '" + rule.id + "' references models missing from the registry snapshot",
                std::to_string(result.dropped.size()) + " dropped");
        }
        return result;
    }

    Logger::getInstance().debug("PolicyEvaluator", "No rule matched",
                                "policy=" + policy.id + " version=" + policy.version);
    return result;
}

bool PolicyEvaluator::ruleMatches(const PolicyRule& rule, const RequestContext& context) {
    return std::all_of(rule.conditions.begin(), rule.conditions.end(),
                       [&context](const Condition& condition) {
                           return conditionMatches(condition, context);
                       });
}

bool PolicyEvaluator::conditionMatches(const Condition& condition, const RequestContext& context) {
    const std::string& field = condition.field;

    if (field == "tenant") return compareString(condition, context.tenant_id);
    if (field == "app") return compareString(condition, context.app_id);
    if (field == "role") return compareString(condition, context.user_role);
    if (field == "language") return compareString(condition, context.language);
    if (field == "team") {
        return context.team_id.has_value() && compareString(condition, *context.team_id);
    }
    if (field == "tokens") return compareNumber(condition, static_cast<double>(context.token_estimate));
    if (field == "tags") return compareTags(condition, context.tags);

    if (field == "sensitivity") {
        // Compare ordinals; a value that does not parse fails closed
        Condition ordinal = condition;
        try {
            for (auto& value : ordinal.values) {
                value = std::to_string(static_cast<int>(parseSensitivity(value)));
            }
        } catch (const std::invalid_argument&) {
            return false;
        }
        return compareNumber(ordinal, static_cast<double>(context.sensitivity));
    }

    return false;
}

bool PolicyEvaluator::compareString(const Condition& condition, const std::string& actual) {
    if (condition.values.empty()) {
        return false;
    }
    switch (condition.op) {
        case ConditionOp::EQ:
            return actual == condition.values.front();
        case ConditionOp::NE:
            return actual != condition.values.front();
        case ConditionOp::IN:
            return std::find(condition.values.begin(), condition.values.end(), actual) != condition.values.end();
        default:
            return false;
    }
}

bool PolicyEvaluator::compareNumber(const Condition& condition, double actual) {
    if (condition.values.empty()) {
        return false;
    }

    std::vector<double> operands;
    try {
        for (const auto& value : condition.values) {
            operands.push_back(std::stod(value));
        }
    } catch (const std::exception&) {
        return false;
    }

    switch (condition.op) {
        case ConditionOp::EQ: return actual == operands.front();
        case ConditionOp::NE: return actual != operands.front();
        case ConditionOp::LT: return actual < operands.front();
        case ConditionOp::GE: return actual >= operands.front();
        case ConditionOp::IN:
            return std::find(operands.begin(), operands.end(), actual) != operands.end();
        default:
            return false;
    }
}

bool PolicyEvaluator::compareTags(const Condition& condition, const std::vector<std::string>& tags) {
    if (condition.values.empty()) {
        return false;
    }
    auto has = [&tags](const std::string& tag) {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    };

    switch (condition.op) {
        case ConditionOp::CONTAINS:
            return has(condition.values.front());
        case ConditionOp::IN:
            return std::any_of(condition.values.begin(), condition.values.end(), has);
        case ConditionOp::NE:
            return !has(condition.values.front());
        default:
            return false;
    }
}

} // namespace Arbiter
