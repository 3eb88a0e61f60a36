// =================================================================
// src/Arbiter/PolicyLoader.cpp
// =================================================================
// YAML parsing and static validation of policies.

#include "Arbiter/PolicyStore.hpp"
#include "Arbiter/OutputFirewall.hpp"
#include "Arbiter/Errors.hpp"
#include "Arbiter/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace Arbiter {

namespace {

const std::unordered_set<std::string> kStringFields = {"tenant", "app", "team", "role", "language"};

bool isKnownField(const std::string& field) {
    return kStringFields.count(field) || field == "sensitivity" || field == "tokens" || field == "tags";
}

std::vector<std::string> scalarOrList(const YAML::Node& node) {
    std::vector<std::string> values;
    if (!node) {
        return values;
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            values.push_back(item.as<std::string>());
        }
    } else {
        values.push_back(node.as<std::string>());
    }
    return values;
}

} // namespace

// =================================================================
// PolicyLoader
// =================================================================

Policy PolicyLoader::loadFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to read policy file " + path + ": " + e.what());
    }
    return parse(root);
}

Policy PolicyLoader::loadString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse policy: " + std::string(e.what()));
    }
    return parse(root);
}

Policy PolicyLoader::parse(const YAML::Node& root) {
    YAML::Node node = root["policy"] ? root["policy"] : root;
    Policy policy;

    try {
        policy.id = node["id"].as<std::string>("");
        policy.app_id = node["app"].as<std::string>("");
        policy.version = node["version"].as<std::string>("");
        policy.sanitizer_model = node["sanitizer_model"].as<std::string>("");

        if (node["default_firewall_action"]) {
            policy.default_firewall_action = parseFirewallAction(node["default_firewall_action"].as<std::string>());
        }

        if (node["degrade_mode"]) {
            std::string mode = node["degrade_mode"].as<std::string>();
            if (mode == "minimal_completion") {
                policy.degrade_mode = DegradeMode::MINIMAL_COMPLETION;
            } else if (mode == "none") {
                policy.degrade_mode = DegradeMode::NONE;
            } else {
                throw ConfigError("Unknown degrade_mode: " + mode);
            }
        }

        if (node["subscription_precedence"]) {
            policy.subscription_precedence.clear();
            for (const auto& scope : node["subscription_precedence"]) {
                policy.subscription_precedence.push_back(parseSubscriptionScope(scope.as<std::string>()));
            }
        }

        if (node["compliance"]) {
            YAML::Node compliance = node["compliance"];
            if (compliance["external_max_sensitivity"]) {
                policy.compliance.external_max_sensitivity =
                    parseSensitivity(compliance["external_max_sensitivity"].as<std::string>());
            }
            policy.compliance.blocked_tags = scalarOrList(compliance["blocked_tags"]);
        }

        if (node["budget"]) {
            YAML::Node budget = node["budget"];
            policy.budget.monthly_limit = budget["monthly_limit"].as<double>(0.0);
            policy.budget.low_water_mark = budget["low_water_mark"].as<double>(0.0);
            policy.budget.minimal_cost_threshold = budget["minimal_cost_threshold"].as<double>(0.0);
        }

        if (node["detectors"]) {
            YAML::Node detectors = node["detectors"];
            policy.detectors.enabled = scalarOrList(detectors["enabled"]);
            policy.detectors.contextual = detectors["contextual"].as<bool>(false);
            if (detectors["custom"]) {
                for (const auto& custom : detectors["custom"]) {
                    CustomDetectorConfig config;
                    config.name = custom["name"].as<std::string>();
                    config.pattern = custom["pattern"].as<std::string>();
                    policy.detectors.custom.push_back(config);
                }
            }
        }

        if (node["fallback_chains"]) {
            for (YAML::const_iterator it = node["fallback_chains"].begin();
                 it != node["fallback_chains"].end(); ++it) {
                policy.fallback_chains[it->first.as<std::string>()] = scalarOrList(it->second);
            }
        }

        if (node["rules"]) {
            size_t index = 0;
            for (const auto& rule_node : node["rules"]) {
                policy.rules.push_back(parseRule(rule_node, index++));
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed policy document: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid policy value: " + std::string(e.what()));
    }

    return policy;
}

PolicyRule PolicyLoader::parseRule(const YAML::Node& node, size_t index) {
    PolicyRule rule;
    rule.id = node["id"].as<std::string>("rule-" + std::to_string(index + 1));
    rule.fallback_chain = node["fallback"].as<std::string>("");

    if (node["when"]) {
        for (const auto& condition_node : node["when"]) {
            rule.conditions.push_back(parseCondition(condition_node));
        }
    }

    int directive_count = 0;
    if (node["single"]) {
        rule.directive = SingleChoice{node["single"].as<std::string>()};
        directive_count++;
    }
    if (node["weighted"]) {
        WeightedChoice weighted;
        for (const auto& entry : node["weighted"]) {
            weighted.entries.push_back({entry["model"].as<std::string>(), entry["weight"].as<double>()});
        }
        rule.directive = weighted;
        directive_count++;
    }
    if (node["ordered"]) {
        rule.directive = OrderedChoice{scalarOrList(node["ordered"])};
        directive_count++;
    }

    if (directive_count != 1) {
        throw ConfigError("Rule '" + rule.id + "' must declare exactly one of single, weighted or ordered");
    }
    return rule;
}

Condition PolicyLoader::parseCondition(const YAML::Node& node) {
    Condition condition;
    condition.field = node["field"].as<std::string>();
    condition.op = parseConditionOp(node["op"].as<std::string>("eq"));
    condition.values = scalarOrList(node["value"] ? node["value"] : node["values"]);
    return condition;
}

// =================================================================
// PolicyValidator
// =================================================================

void PolicyValidator::validate(const Policy& policy, const RegistrySnapshot& registry) {
    const std::string& id = policy.id.empty() ? std::string("<unnamed>") : policy.id;

    if (policy.id.empty()) {
        throw PolicyValidationError(id, "missing policy id");
    }
    if (policy.app_id.empty()) {
        throw PolicyValidationError(id, "missing app");
    }
    if (policy.version.empty()) {
        throw PolicyValidationError(id, "missing version");
    }
    if (policy.rules.empty()) {
        throw PolicyValidationError(id, "policy has no rules");
    }

    std::unordered_set<std::string> rule_ids;
    for (const auto& rule : policy.rules) {
        if (rule.id.empty()) {
            throw PolicyValidationError(id, "rule without id");
        }
        if (!rule_ids.insert(rule.id).second) {
            throw PolicyValidationError(id, "duplicate rule id '" + rule.id + "'");
        }

        for (const auto& condition : rule.conditions) {
            validateCondition(policy, rule, condition);
        }

        switch (directiveKind(rule.directive)) {
            case DirectiveKind::SINGLE:
                break;
            case DirectiveKind::WEIGHTED: {
                const auto& entries = std::get<WeightedChoice>(rule.directive).entries;
                if (entries.empty()) {
                    throw PolicyValidationError(id, "rule '" + rule.id + "' has an empty weighted set");
                }
                double sum = 0.0;
                for (const auto& entry : entries) {
                    if (!(entry.weight > 0.0)) {
                        throw PolicyValidationError(id, "rule '" + rule.id + "' has a non-positive weight for " + entry.model);
                    }
                    sum += entry.weight;
                }
                if (std::fabs(sum - 1.0) > kWeightTolerance) {
                    throw PolicyValidationError(id, "rule '" + rule.id + "' weights sum to " +
                                                std::to_string(sum) + ", expected 1");
                }
                break;
            }
            case DirectiveKind::ORDERED:
                if (std::get<OrderedChoice>(rule.directive).models.empty()) {
                    throw PolicyValidationError(id, "rule '" + rule.id + "' has an empty ordered list");
                }
                break;
        }

        std::unordered_set<std::string> directive_seen;
        for (const auto& model_id : directiveModels(rule.directive)) {
            if (!directive_seen.insert(model_id).second) {
                throw PolicyValidationError(id, "rule '" + rule.id + "' lists " + model_id + " twice");
            }
            validateModelReference(policy, registry, model_id, "rule '" + rule.id + "'");
        }

        if (!rule.fallback_chain.empty() && !policy.fallback_chains.count(rule.fallback_chain)) {
            throw PolicyValidationError(id, "rule '" + rule.id + "' references unknown fallback chain '" +
                                        rule.fallback_chain + "'");
        }
    }

    validateFallbackChains(policy, registry);

    if (!policy.sanitizer_model.empty()) {
        validateModelReference(policy, registry, policy.sanitizer_model, "sanitizer_model");
    }

    if (policy.budget.monthly_limit < 0.0 || policy.budget.low_water_mark < 0.0 ||
        policy.budget.minimal_cost_threshold < 0.0) {
        throw PolicyValidationError(id, "budget values must be non-negative");
    }
    if (policy.budget.monthly_limit > 0.0 && policy.budget.low_water_mark > policy.budget.monthly_limit) {
        throw PolicyValidationError(id, "budget low_water_mark exceeds monthly_limit");
    }

    if (policy.subscription_precedence.empty()) {
        throw PolicyValidationError(id, "subscription_precedence must list at least one scope");
    }

    const auto builtins = OutputFirewall::builtinDetectorNames();
    for (const auto& name : policy.detectors.enabled) {
        if (std::find(builtins.begin(), builtins.end(), name) == builtins.end()) {
            throw PolicyValidationError(id, "unknown detector '" + name + "'");
        }
    }
    for (const auto& custom : policy.detectors.custom) {
        try {
            std::regex compiled(custom.pattern);
        } catch (const std::regex_error& e) {
            throw PolicyValidationError(id, "custom detector '" + custom.name + "' has an invalid pattern: " + e.what());
        }
    }
}

void PolicyValidator::validateCondition(const Policy& policy, const PolicyRule& rule, const Condition& condition) {
    const std::string where = "rule '" + rule.id + "' condition on '" + condition.field + "'";

    if (!isKnownField(condition.field)) {
        throw PolicyValidationError(policy.id, where + ": unknown field");
    }
    if (condition.values.empty()) {
        throw PolicyValidationError(policy.id, where + ": missing value");
    }

    bool single_valued = condition.op == ConditionOp::EQ || condition.op == ConditionOp::NE ||
                         condition.op == ConditionOp::LT || condition.op == ConditionOp::GE ||
                         condition.op == ConditionOp::CONTAINS;
    if (single_valued && condition.values.size() != 1) {
        throw PolicyValidationError(policy.id, where + ": operator " +
                                    conditionOpToString(condition.op) + " takes one value");
    }

    if (condition.op == ConditionOp::CONTAINS && condition.field != "tags") {
        throw PolicyValidationError(policy.id, where + ": contains only applies to tags");
    }
    if (condition.field == "tags" && condition.op == ConditionOp::EQ) {
        throw PolicyValidationError(policy.id, where + ": tags support contains, in and ne");
    }
    if ((condition.op == ConditionOp::LT || condition.op == ConditionOp::GE) &&
        condition.field != "tokens" && condition.field != "sensitivity") {
        throw PolicyValidationError(policy.id, where + ": ordering operators need tokens or sensitivity");
    }

    try {
        if (condition.field == "sensitivity") {
            for (const auto& value : condition.values) {
                parseSensitivity(value);
            }
        } else if (condition.field == "tokens") {
            for (const auto& value : condition.values) {
                size_t consumed = 0;
                std::stod(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
            }
        }
    } catch (const std::exception&) {
        throw PolicyValidationError(policy.id, where + ": value is not valid for the field");
    }
}

void PolicyValidator::validateModelReference(const Policy& policy, const RegistrySnapshot& registry,
                                             const std::string& model_id, const std::string& where) {
    auto model = registry.find(model_id);
    if (!model) {
        throw PolicyValidationError(policy.id, where + " references unknown model '" + model_id + "'");
    }
    if (!model->enabled) {
        throw PolicyValidationError(policy.id, where + " references disabled model '" + model_id + "'");
    }
}

void PolicyValidator::validateFallbackChains(const Policy& policy, const RegistrySnapshot& registry) {
    enum class Mark { UNVISITED, IN_PROGRESS, DONE };
    std::unordered_map<std::string, Mark> marks;

    std::function<void(const std::string&)> visit = [&](const std::string& name) {
        Mark& mark = marks[name];
        if (mark == Mark::DONE) {
            return;
        }
        if (mark == Mark::IN_PROGRESS) {
            throw PolicyValidationError(policy.id, "fallback chain cycle through '" + name + "'");
        }
        mark = Mark::IN_PROGRESS;

        const auto& entries = policy.fallback_chains.at(name);
        for (const auto& entry : entries) {
            if (!entry.empty() && entry[0] == '@') {
                std::string target = entry.substr(1);
                if (!policy.fallback_chains.count(target)) {
                    throw PolicyValidationError(policy.id, "fallback chain '" + name +
                                                "' references unknown chain '" + target + "'");
                }
                visit(target);
            } else {
                validateModelReference(policy, registry, entry, "fallback chain '" + name + "'");
            }
        }

        marks[name] = Mark::DONE;
    };

    for (const auto& [name, entries] : policy.fallback_chains) {
        if (entries.empty()) {
            throw PolicyValidationError(policy.id, "fallback chain '" + name + "' is empty");
        }
        visit(name);
    }
}

} // namespace Arbiter
