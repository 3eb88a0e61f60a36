// =================================================================
// tests/ExperimentOverlayTest.cpp
// =================================================================
// Unit tests for experiment enrollment, variants and guardrails.

#include "Arbiter/ExperimentOverlay.hpp"
#include "Arbiter/Errors.hpp"
#include "TestFixtures.hpp"
#include <iostream>
#include <cassert>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;
using namespace ArbiterTest;
using namespace std::chrono_literals;
using Arbiter::ExperimentArm;

class ExperimentOverlayTest {
private:
    std::vector<Arbiter::ModelDescriptorPtr> models;

    Arbiter::Experiment experiment(const std::string& id, double traffic) {
        Arbiter::Experiment result;
        result.id = id;
        result.app_id = "support";
        result.traffic_percent = traffic;
        result.variant.substitute_models = {"vendor-long", "vendor-fast"};
        result.guardrail.min_samples = 5;
        result.guardrail.window_size = 50;
        result.guardrail.latency_ratio = 1.5;
        result.guardrail.success_margin = 0.1;
        result.guardrail.cool_down = 60000ms;
        return result;
    }

public:
    ExperimentOverlayTest() {
        quietLogging();
        models = {
            makeModelPtr("onprem-large", "onprem", Arbiter::ComplianceTag::INTERNAL),
            makeModelPtr("vendor-fast", "vendor", Arbiter::ComplianceTag::EXTERNAL)
        };
    }

    void testBucketDeterminism() {
        std::cout << "Testing bucket determinism..." << std::endl;

        uint32_t first = Arbiter::ExperimentOverlay::bucketOf("acme/support/user-42");
        assert(first == Arbiter::ExperimentOverlay::bucketOf("acme/support/user-42") && "Same key, same bucket");
        assert(first < 10000 && "Bucket range");

        size_t below_half = 0;
        for (int i = 0; i < 2000; ++i) {
            if (Arbiter::ExperimentOverlay::bucketOf("key-" + std::to_string(i)) < 5000) {
                below_half++;
            }
        }
        assert(below_half > 800 && below_half < 1200 && "Buckets spread roughly evenly");

        std::cout << "✓ Bucket determinism test passed" << std::endl;
    }

    void testTrafficExtremes() {
        std::cout << "Testing 0% and 100% traffic..." << std::endl;

        Arbiter::ExperimentOverlay everyone;
        everyone.addExperiment(experiment("all", 100.0));
        Arbiter::ExperimentOverlay nobody;
        nobody.addExperiment(experiment("none", 0.0));

        for (int i = 0; i < 50; ++i) {
            auto context = makeContext("acme", "support");
            context.request_key = "request-" + std::to_string(i);

            auto enrolled = everyone.apply(makeSet(models), context);
            assert(enrolled.assignment && enrolled.assignment->arm == ExperimentArm::VARIANT && "100% enrolls all");
            assert(enrolled.candidates.modelIds() == std::vector<std::string>{"vendor-fast"} &&
                   "Substitution keeps only present models");

            auto control = nobody.apply(makeSet(models), context);
            assert(control.assignment && control.assignment->arm == ExperimentArm::CONTROL && "0% enrolls none");
            assert(control.candidates.size() == 2 && "Control keeps the candidates");
        }

        std::cout << "✓ Traffic extremes test passed" << std::endl;
    }

    void testScopeAndNoWidening() {
        std::cout << "Testing experiment scope and candidate narrowing..." << std::endl;

        Arbiter::ExperimentOverlay overlay;
        auto scoped = experiment("tenant-only", 100.0);
        scoped.tenant_id = "globex";
        scoped.variant.substitute_models = {"vendor-long"};
        overlay.addExperiment(scoped);

        auto other_tenant = overlay.apply(makeSet(models), makeContext("acme", "support"));
        assert(!other_tenant.assignment && "Out-of-scope tenant gets no assignment");

        auto context = makeContext("globex", "support");
        auto result = overlay.apply(makeSet(models), context);
        assert(result.assignment && result.assignment->arm == ExperimentArm::CONTROL &&
               "Variant with no present model stays on control");
        assert(result.candidates.modelIds() == (std::vector<std::string>{"onprem-large", "vendor-fast"}) &&
               "Absent models are never added");

        std::cout << "✓ Scope test passed" << std::endl;
    }

    void testReweighting() {
        std::cout << "Testing weight-only variants..." << std::endl;

        Arbiter::ExperimentOverlay overlay;
        auto reweight = experiment("reweight", 100.0);
        reweight.variant.substitute_models.clear();
        reweight.variant.weights = {{"vendor-fast", 0.9}, {"onprem-large", 0.1}};
        overlay.addExperiment(reweight);

        auto result = overlay.apply(makeSet(models), makeContext("acme", "support"));
        assert(result.assignment->arm == ExperimentArm::VARIANT && "Reweighted arm");
        assert(result.candidates.kind == Arbiter::DirectiveKind::WEIGHTED && "Directive becomes weighted");
        assert(result.candidates.find("vendor-fast")->weight == 0.9 && "Weight replaced");

        std::cout << "✓ Reweighting test passed" << std::endl;
    }

    void testGuardrailRollbackAndResume() {
        std::cout << "Testing guardrail rollback and resume..." << std::endl;

        ManualClock clock;
        Arbiter::ExperimentOverlay overlay(Arbiter::GuardrailConfig(), clock.clock());
        auto config = experiment("latency", 100.0);
        config.guardrail.auto_resume = true;
        overlay.addExperiment(config);

        Arbiter::ExperimentAssignment control{"latency", ExperimentArm::CONTROL, 0};
        Arbiter::ExperimentAssignment variant{"latency", ExperimentArm::VARIANT, 0};
        for (int i = 0; i < 4; ++i) {
            overlay.recordOutcome(control, 100ms, 0.01, true);
            overlay.recordOutcome(variant, 400ms, 0.02, true);
        }
        assert(overlay.status("latency")->state == Arbiter::ExperimentState::ACTIVE &&
               "Guardrails wait for the minimum samples");

        overlay.recordOutcome(control, 100ms, 0.01, true);
        overlay.recordOutcome(variant, 400ms, 0.02, true);
        auto status = overlay.status("latency");
        assert(status->state == Arbiter::ExperimentState::ROLLED_BACK && "Slow variant rolled back");
        assert(status->effective_traffic == 0.0 && status->configured_traffic == 100.0 && "Traffic set to 0%");
        assert(status->variant_p95 == 400ms && status->control_samples == 5 && "Arm metrics reported");

        auto after = overlay.apply(makeSet(models), makeContext("acme", "support"));
        assert(after.assignment->arm == ExperimentArm::CONTROL && "Rolled back experiment routes control");

        clock.advance(60000ms);
        auto resumed = overlay.apply(makeSet(models), makeContext("acme", "support"));
        assert(resumed.assignment->arm == ExperimentArm::VARIANT && "Auto-resume restores traffic");
        assert(overlay.status("latency")->control_samples == 0 && "Metrics reset on resume");

        std::cout << "✓ Guardrail test passed" << std::endl;
    }

    void testSuccessGuardrail() {
        std::cout << "Testing success-rate guardrail..." << std::endl;

        Arbiter::ExperimentOverlay overlay;
        overlay.addExperiment(experiment("errors", 50.0));

        Arbiter::ExperimentAssignment control{"errors", ExperimentArm::CONTROL, 0};
        Arbiter::ExperimentAssignment variant{"errors", ExperimentArm::VARIANT, 0};
        for (int i = 0; i < 5; ++i) {
            overlay.recordOutcome(control, 100ms, 0.0, true);
            overlay.recordOutcome(variant, 100ms, 0.0, i < 3);
        }
        assert(overlay.status("errors")->state == Arbiter::ExperimentState::ROLLED_BACK &&
               "Variant failing 40% is rolled back");

        std::cout << "✓ Success guardrail test passed" << std::endl;
    }

    void testValidationAndLoading() {
        std::cout << "Testing experiment validation and loading..." << std::endl;

        Arbiter::ExperimentOverlay overlay;
        bool threw = false;
        try {
            overlay.addExperiment(experiment("bad", 150.0));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Traffic above 100% rejected");

        std::string path = "test_experiments.yml";
        {
            std::ofstream file(path);
            file << R"(
experiments:
  - id: vendor-trial
    app: support
    traffic_percent: 25
    variant:
      substitute: [vendor-fast]
    guardrail:
      min_samples: 10
      auto_resume: true
)";
        }
        overlay.loadFromConfig(path);
        fs::remove(path);

        auto status = overlay.status("vendor-trial");
        assert(status && status->configured_traffic == 25.0 && "Experiment loaded");
        assert(overlay.allStatuses().size() == 1 && "One experiment registered");

        std::cout << "✓ Validation and loading test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ExperimentOverlay Tests..." << std::endl;
        std::cout << "==================================" << std::endl;

        testBucketDeterminism();
        testTrafficExtremes();
        testScopeAndNoWidening();
        testReweighting();
        testGuardrailRollbackAndResume();
        testSuccessGuardrail();
        testValidationAndLoading();

        std::cout << std::endl << "✅ All ExperimentOverlay tests passed!" << std::endl;
    }
};

int main() {
    try {
        ExperimentOverlayTest test;
        test.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
