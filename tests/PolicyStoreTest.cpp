// =================================================================
// tests/PolicyStoreTest.cpp
// =================================================================
// Unit tests for policy loading, validation and versioned publication.

#include "Arbiter/PolicyStore.hpp"
#include "Arbiter/Errors.hpp"
#include "TestFixtures.hpp"
#include <iostream>
#include <cassert>

using namespace ArbiterTest;

namespace {

const char* kBasePolicy = R"(
policy:
  id: support-routing
  app: support
  version: "1"
  default_firewall_action: redraft
  sanitizer_model: onprem-small
  degrade_mode: minimal_completion
  subscription_precedence: [team, app, tenant]
  compliance:
    external_max_sensitivity: medium
    blocked_tags: [pii, legal-hold]
  budget:
    monthly_limit: 500
    low_water_mark: 50
    minimal_cost_threshold: 0.5
  detectors:
    enabled: [credit_card, email]
    contextual: true
    custom:
      - name: employee_id
        pattern: "EMP-[0-9]{6}"
  fallback_chains:
    internal: [onprem-large, onprem-small]
    everything: [vendor-fast, "@internal"]
  rules:
    - id: high-sensitivity
      when:
        - field: sensitivity
          op: ge
          value: high
      single: onprem-large
      fallback: internal
    - id: long-prompts
      when:
        - field: tokens
          op: ge
          value: 4000
        - field: tags
          op: contains
          value: batch
      ordered: [vendor-long, onprem-large]
    - id: default
      weighted:
        - model: vendor-fast
          weight: 0.7
        - model: onprem-small
          weight: 0.3
      fallback: everything
)";

} // namespace

class PolicyStoreTest {
private:
    Arbiter::ModelRegistry registry;

public:
    PolicyStoreTest() {
        quietLogging();
        auto disabled = makeModel("vendor-retired", "vendor", Arbiter::ComplianceTag::EXTERNAL);
        disabled.enabled = false;
        registry.publish({
            makeModel("onprem-large", "onprem", Arbiter::ComplianceTag::INTERNAL, 0.4, 0.8),
            makeModel("onprem-small", "onprem", Arbiter::ComplianceTag::INTERNAL, 0.1, 0.2),
            makeModel("vendor-fast", "vendor", Arbiter::ComplianceTag::EXTERNAL, 0.5, 1.5),
            makeModel("vendor-long", "vendor", Arbiter::ComplianceTag::EXTERNAL, 2.0, 6.0),
            disabled
        });
    }

    Arbiter::Policy basePolicy() {
        return Arbiter::PolicyLoader::loadString(kBasePolicy);
    }

    template <typename Mutator>
    bool rejected(Mutator mutate, const std::string& expected_fragment = "") {
        Arbiter::Policy policy = basePolicy();
        mutate(policy);
        try {
            Arbiter::PolicyValidator::validate(policy, *registry.snapshot());
        } catch (const Arbiter::PolicyValidationError& e) {
            return expected_fragment.empty() || std::string(e.what()).find(expected_fragment) != std::string::npos;
        }
        return false;
    }

    void testPolicyParsing() {
        std::cout << "Testing policy YAML parsing..." << std::endl;

        Arbiter::Policy policy = basePolicy();
        assert(policy.id == "support-routing" && "Policy id parsed");
        assert(policy.app_id == "support" && "App parsed");
        assert(policy.version == "1" && "Version parsed");
        assert(policy.rules.size() == 3 && "Three rules parsed");
        assert(policy.default_firewall_action == Arbiter::FirewallAction::REDRAFT && "Firewall action parsed");
        assert(policy.degrade_mode == Arbiter::DegradeMode::MINIMAL_COMPLETION && "Degrade mode parsed");
        assert(policy.subscription_precedence.front() == Arbiter::SubscriptionScope::TEAM && "Precedence parsed");
        assert(policy.compliance.external_max_sensitivity == Arbiter::SensitivityLevel::MEDIUM && "Threshold parsed");
        assert(policy.compliance.blocked_tags.size() == 2 && "Blocked tags parsed");
        assert(policy.budget.monthly_limit == 500.0 && "Budget parsed");
        assert(policy.detectors.contextual && policy.detectors.custom.size() == 1 && "Detectors parsed");

        const auto& first = policy.rules[0];
        assert(first.id == "high-sensitivity" && "Rule id parsed");
        assert(Arbiter::directiveKind(first.directive) == Arbiter::DirectiveKind::SINGLE && "Single directive");
        assert(first.conditions.size() == 1 && first.conditions[0].op == Arbiter::ConditionOp::GE && "Condition parsed");
        assert(first.fallback_chain == "internal" && "Fallback chain name parsed");

        const auto& weighted = std::get<Arbiter::WeightedChoice>(policy.rules[2].directive);
        assert(weighted.entries.size() == 2 && weighted.entries[0].weight == 0.7 && "Weighted entries parsed");

        std::cout << "✓ Policy parsing test passed" << std::endl;
    }

    void testFallbackExpansion() {
        std::cout << "Testing fallback chain expansion..." << std::endl;

        Arbiter::Policy policy = basePolicy();
        auto expanded = policy.expandFallbackChain("everything");
        assert(expanded.size() == 3 && "Nested chain is flattened");
        assert(expanded[0] == "vendor-fast" && expanded[1] == "onprem-large" && expanded[2] == "onprem-small" &&
               "Chain references expand in place");
        assert(policy.expandFallbackChain("missing").empty() && "Unknown chain expands to nothing");

        std::cout << "✓ Fallback expansion test passed" << std::endl;
    }

    void testValidPolicyAccepted() {
        std::cout << "Testing validation of a well-formed policy..." << std::endl;

        Arbiter::Policy policy = basePolicy();
        Arbiter::PolicyValidator::validate(policy, *registry.snapshot());

        std::cout << "✓ Valid policy test passed" << std::endl;
    }

    void testWeightValidation() {
        std::cout << "Testing weighted directive validation..." << std::endl;

        assert(rejected([](Arbiter::Policy& p) {
            std::get<Arbiter::WeightedChoice>(p.rules[2].directive).entries[0].weight = 0.6;
        }, "weights sum") && "Weights summing to 0.9 are rejected");

        assert(rejected([](Arbiter::Policy& p) {
            auto& entries = std::get<Arbiter::WeightedChoice>(p.rules[2].directive).entries;
            entries[0].weight = 1.0;
            entries[1].weight = 0.0;
        }, "non-positive") && "Zero weight is rejected");

        assert(!rejected([](Arbiter::Policy& p) {
            auto& entries = std::get<Arbiter::WeightedChoice>(p.rules[2].directive).entries;
            entries[0].weight = 0.7 + 5e-7;
        }) && "Sum within tolerance is accepted");

        std::cout << "✓ Weight validation test passed" << std::endl;
    }

    void testReferenceValidation() {
        std::cout << "Testing model and chain reference validation..." << std::endl;

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].directive = Arbiter::SingleChoice{"ghost"};
        }, "unknown model") && "Unknown model is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].directive = Arbiter::SingleChoice{"vendor-retired"};
        }, "disabled model") && "Disabled model is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].fallback_chain = "nope";
        }, "unknown fallback chain") && "Unknown fallback chain is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.fallback_chains["internal"].push_back("@everything");
        }, "cycle") && "Fallback cycle is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.sanitizer_model = "ghost";
        }, "sanitizer_model") && "Unknown sanitizer is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[1].directive = Arbiter::OrderedChoice{{"onprem-large", "onprem-large"}};
        }, "twice") && "Duplicate model in a directive is rejected");

        std::cout << "✓ Reference validation test passed" << std::endl;
    }

    void testConditionValidation() {
        std::cout << "Testing condition validation..." << std::endl;

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].conditions = {{"weather", Arbiter::ConditionOp::EQ, {"sunny"}}};
        }, "unknown field") && "Unknown field is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].conditions = {{"role", Arbiter::ConditionOp::LT, {"admin"}}};
        }) && "Ordering operator on a string field is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].conditions = {{"role", Arbiter::ConditionOp::CONTAINS, {"admin"}}};
        }) && "Contains on a non-tag field is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].conditions = {{"sensitivity", Arbiter::ConditionOp::GE, {"secret"}}};
        }) && "Unknown sensitivity is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].conditions = {{"tokens", Arbiter::ConditionOp::GE, {"12abc"}}};
        }) && "Non-numeric token bound is rejected");

        assert(rejected([](Arbiter::Policy& p) {
            p.rules[0].conditions = {{"tenant", Arbiter::ConditionOp::EQ, {"a", "b"}}};
        }) && "eq with two values is rejected");

        assert(!rejected([](Arbiter::Policy& p) {
            p.rules[0].conditions = {{"tenant", Arbiter::ConditionOp::IN, {"a", "b"}}};
        }) && "in with several values is accepted");

        std::cout << "✓ Condition validation test passed" << std::endl;
    }

    void testStructuralValidation() {
        std::cout << "Testing structural validation..." << std::endl;

        assert(rejected([](Arbiter::Policy& p) { p.rules[1].id = "default"; }, "duplicate rule id") &&
               "Duplicate rule ids are rejected");
        assert(rejected([](Arbiter::Policy& p) { p.rules.clear(); }, "no rules") && "Empty policy is rejected");
        assert(rejected([](Arbiter::Policy& p) { p.version.clear(); }, "version") && "Missing version is rejected");
        assert(rejected([](Arbiter::Policy& p) { p.budget.low_water_mark = 600; }, "low_water_mark") &&
               "Low-water mark above the limit is rejected");
        assert(rejected([](Arbiter::Policy& p) { p.detectors.enabled.push_back("dna"); }, "unknown detector") &&
               "Unknown detector is rejected");
        assert(rejected([](Arbiter::Policy& p) { p.detectors.custom.push_back({"broken", "([a-z"}); }, "invalid pattern") &&
               "Uncompilable custom pattern is rejected");

        bool threw = false;
        try {
            Arbiter::PolicyLoader::loadString("id: x\napp: y\nversion: 1\nrules:\n  - id: r\n    single: a\n    ordered: [b]\n");
        } catch (const Arbiter::ConfigError&) {
            threw = true;
        }
        assert(threw && "Two directives in one rule is a parse error");

        std::cout << "✓ Structural validation test passed" << std::endl;
    }

    void testVersionedPublication() {
        std::cout << "Testing versioned publication..." << std::endl;

        Arbiter::PolicyStore store(registry);
        assert(store.active("support") == nullptr && "No policy before publishing");

        auto v1 = store.publish(basePolicy());
        assert(store.active("support") == v1 && "Published policy becomes active");

        Arbiter::Policy second = basePolicy();
        second.version = "2";
        second.rules.pop_back();
        auto v2 = store.publish(second);
        assert(store.active("support") == v2 && "New version becomes active");
        assert(v1->rules.size() == 3 && "Earlier version is untouched");

        bool threw = false;
        try {
            store.publish(second);
        } catch (const Arbiter::PolicyValidationError&) {
            threw = true;
        }
        assert(threw && "Republishing an existing version is rejected");

        Arbiter::Policy broken = basePolicy();
        broken.version = "3";
        broken.rules[0].directive = Arbiter::SingleChoice{"ghost"};
        threw = false;
        try {
            store.publish(broken);
        } catch (const Arbiter::PolicyValidationError&) {
            threw = true;
        }
        assert(threw && "Invalid policy is not published");
        assert(store.active("support") == v2 && "Active policy unchanged after a rejected publish");
        assert(store.get("support", "3") == nullptr && "Rejected version is not stored");

        assert(store.activate("support", "1") && "Rollback to an earlier version");
        assert(store.active("support") == v1 && "Earlier version active again");
        assert(!store.activate("support", "9") && "Unknown version cannot be activated");

        auto versions = store.versions("support");
        assert(versions.size() == 2 && versions[0] == "1" && versions[1] == "2" && "Publication order kept");

        std::cout << "✓ Versioned publication test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PolicyStore Tests..." << std::endl;
        std::cout << "============================" << std::endl;

        testPolicyParsing();
        testFallbackExpansion();
        testValidPolicyAccepted();
        testWeightValidation();
        testReferenceValidation();
        testConditionValidation();
        testStructuralValidation();
        testVersionedPublication();

        std::cout << std::endl << "✅ All PolicyStore tests passed!" << std::endl;
    }
};

int main() {
    try {
        PolicyStoreTest test;
        test.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
