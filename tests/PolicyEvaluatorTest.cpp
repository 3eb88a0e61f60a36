// =================================================================
// tests/PolicyEvaluatorTest.cpp
// =================================================================
// Unit tests for rule matching and candidate expansion.

#include "Arbiter/PolicyEvaluator.hpp"
#include "Arbiter/PolicyStore.hpp"
#include "TestFixtures.hpp"
#include <iostream>
#include <cassert>

using namespace ArbiterTest;
using Arbiter::Condition;
using Arbiter::ConditionOp;

class PolicyEvaluatorTest {
private:
    Arbiter::RegistrySnapshotPtr registry;
    Arbiter::Policy policy;

public:
    PolicyEvaluatorTest() {
        quietLogging();

        auto disabled = makeModel("vendor-retired", "vendor", Arbiter::ComplianceTag::EXTERNAL);
        disabled.enabled = false;
        std::vector<Arbiter::ModelDescriptorPtr> models = {
            makeModelPtr("onprem-large", "onprem", Arbiter::ComplianceTag::INTERNAL),
            makeModelPtr("onprem-small", "onprem", Arbiter::ComplianceTag::INTERNAL),
            makeModelPtr("vendor-fast", "vendor", Arbiter::ComplianceTag::EXTERNAL),
            std::make_shared<const Arbiter::ModelDescriptor>(disabled)
        };
        registry = std::make_shared<Arbiter::RegistrySnapshot>(models, 1);

        policy = Arbiter::PolicyLoader::loadString(R"(
id: eval
app: support
version: "1"
fallback_chains:
  safe: [onprem-small, vendor-retired]
rules:
  - id: restricted
    when:
      - {field: sensitivity, op: ge, value: high}
    single: onprem-large
    fallback: safe
  - id: finance-team
    when:
      - {field: team, op: eq, value: finance}
      - {field: tags, op: in, values: [invoice, ledger]}
    ordered: [vendor-retired, vendor-fast, onprem-small]
  - id: short
    when:
      - {field: tokens, op: lt, value: 200}
      - {field: language, op: ne, value: de}
    weighted:
      - {model: vendor-fast, weight: 0.5}
      - {model: onprem-small, weight: 0.5}
  - id: catch-all
    ordered: [onprem-small]
)");
    }

    void testFirstMatchWins() {
        std::cout << "Testing first-match rule evaluation..." << std::endl;

        auto context = makeContext("acme", "support");
        context.sensitivity = Arbiter::SensitivityLevel::RESTRICTED;
        context.token_estimate = 50;

        auto result = Arbiter::PolicyEvaluator::evaluate(policy, context, *registry);
        assert(result.matched && "A rule should match");
        assert(result.rule_id == "restricted" && "Earlier rule wins even though later rules also match");
        assert(result.candidates.kind == Arbiter::DirectiveKind::SINGLE && "Directive kind carried");
        assert(result.candidates.size() == 1 && result.candidates.candidates[0].id() == "onprem-large" &&
               "Single directive yields one candidate");
        assert(result.candidates.candidates[0].rule_id == "restricted" && "Candidates remember their rule");

        std::cout << "✓ First-match test passed" << std::endl;
    }

    void testFallbackCandidates() {
        std::cout << "Testing fallback candidates of the matched rule..." << std::endl;

        auto context = makeContext("acme", "support");
        context.sensitivity = Arbiter::SensitivityLevel::HIGH;

        auto result = Arbiter::PolicyEvaluator::evaluate(policy, context, *registry);
        assert(result.fallback.size() == 1 && result.fallback.candidates[0].id() == "onprem-small" &&
               "Disabled models are dropped from the fallback chain");
        assert(result.fallback.kind == Arbiter::DirectiveKind::ORDERED && "Fallback is an ordered list");
        assert(result.dropped.size() == 1 && result.dropped[0] == "vendor-retired" && "Dropped model reported");

        std::cout << "✓ Fallback candidates test passed" << std::endl;
    }

    void testTeamAndTags() {
        std::cout << "Testing team and tag conditions..." << std::endl;

        auto context = makeContext("acme", "support");
        context.team_id = "finance";
        context.tags = {"ledger"};
        context.token_estimate = 5000;

        auto result = Arbiter::PolicyEvaluator::evaluate(policy, context, *registry);
        assert(result.rule_id == "finance-team" && "Team and tag rule matches");
        auto ids = result.candidates.modelIds();
        assert(ids.size() == 2 && ids[0] == "vendor-fast" && ids[1] == "onprem-small" &&
               "Disabled model removed, order preserved");

        context.team_id.reset();
        result = Arbiter::PolicyEvaluator::evaluate(policy, context, *registry);
        assert(result.rule_id == "catch-all" && "Missing team never matches a team condition");

        std::cout << "✓ Team and tag test passed" << std::endl;
    }

    void testNumericAndNegation() {
        std::cout << "Testing numeric and negated conditions..." << std::endl;

        auto context = makeContext("acme", "support");
        context.token_estimate = 150;
        context.language = "en";

        auto result = Arbiter::PolicyEvaluator::evaluate(policy, context, *registry);
        assert(result.rule_id == "short" && "tokens < 200 and language != de");
        assert(result.candidates.kind == Arbiter::DirectiveKind::WEIGHTED && "Weighted directive carried");
        assert(result.candidates.candidates[0].weight == 0.5 && "Weights carried onto candidates");

        context.language = "de";
        result = Arbiter::PolicyEvaluator::evaluate(policy, context, *registry);
        assert(result.rule_id == "catch-all" && "ne condition rejects the excluded language");

        context.language = "en";
        context.token_estimate = 200;
        result = Arbiter::PolicyEvaluator::evaluate(policy, context, *registry);
        assert(result.rule_id == "catch-all" && "lt is strict");

        std::cout << "✓ Numeric and negation test passed" << std::endl;
    }

    void testConditionPrimitives() {
        std::cout << "Testing individual condition operators..." << std::endl;

        auto context = makeContext("acme", "support");
        context.sensitivity = Arbiter::SensitivityLevel::MEDIUM;
        context.tags = {"pii", "draft"};
        context.user_role = "analyst";

        assert(Arbiter::PolicyEvaluator::conditionMatches({"sensitivity", ConditionOp::GE, {"medium"}}, context) &&
               "ge on equal ordinal");
        assert(!Arbiter::PolicyEvaluator::conditionMatches({"sensitivity", ConditionOp::LT, {"medium"}}, context) &&
               "lt on equal ordinal");
        assert(Arbiter::PolicyEvaluator::conditionMatches({"sensitivity", ConditionOp::IN, {"low", "medium"}}, context) &&
               "in on sensitivity");
        assert(Arbiter::PolicyEvaluator::conditionMatches({"tags", ConditionOp::CONTAINS, {"pii"}}, context) &&
               "contains on tags");
        assert(!Arbiter::PolicyEvaluator::conditionMatches({"tags", ConditionOp::NE, {"draft"}}, context) &&
               "ne on tags means the tag is absent");
        assert(Arbiter::PolicyEvaluator::conditionMatches({"role", ConditionOp::IN, {"admin", "analyst"}}, context) &&
               "in on strings");
        assert(Arbiter::PolicyEvaluator::conditionMatches({"tenant", ConditionOp::EQ, {"acme"}}, context) &&
               "eq on tenant");
        assert(!Arbiter::PolicyEvaluator::conditionMatches({"planet", ConditionOp::EQ, {"earth"}}, context) &&
               "Unknown fields never match");

        Arbiter::PolicyRule empty_rule;
        assert(Arbiter::PolicyEvaluator::ruleMatches(empty_rule, context) && "Empty predicate matches everything");

        std::cout << "✓ Condition primitives test passed" << std::endl;
    }

    void testNoMatch() {
        std::cout << "Testing evaluation without a matching rule..." << std::endl;

        Arbiter::Policy narrow = policy;
        narrow.rules.pop_back();

        auto context = makeContext("acme", "support");
        context.token_estimate = 1000;
        auto result = Arbiter::PolicyEvaluator::evaluate(narrow, context, *registry);
        assert(!result.matched && "Nothing matches");
        assert(result.candidates.empty() && "No candidates without a match");

        std::cout << "✓ No-match test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PolicyEvaluator Tests..." << std::endl;
        std::cout << "================================" << std::endl;

        testFirstMatchWins();
        testFallbackCandidates();
        testTeamAndTags();
        testNumericAndNegation();
        testConditionPrimitives();
        testNoMatch();

        std::cout << std::endl << "✅ All PolicyEvaluator tests passed!" << std::endl;
    }
};

int main() {
    try {
        PolicyEvaluatorTest test;
        test.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
