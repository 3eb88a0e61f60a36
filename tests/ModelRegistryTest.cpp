// =================================================================
// tests/ModelRegistryTest.cpp
// =================================================================
// Unit tests for ModelRegistry component.

#include "Arbiter/ModelRegistry.hpp"
#include "Arbiter/Errors.hpp"
#include "TestFixtures.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;
using namespace ArbiterTest;

class ModelRegistryTest {
private:
    std::string test_config_path = "test_registry_models.yml";

public:
    ModelRegistryTest() {
        quietLogging();
        createTestConfig();
    }

    ~ModelRegistryTest() {
        if (fs::exists(test_config_path)) {
            fs::remove(test_config_path);
        }
    }

    void createTestConfig() {
        std::ofstream config(test_config_path);
        config << R"(
models:
  onprem-llama:
    provider: "onprem"
    name: "llama-3-70b"
    version: "3.0"
    adapter: "http"
    endpoint: "http://llm.internal:8080"
    compliance: "internal"
    pricing:
      input_per_1k: 0.1
      output_per_1k: 0.2
    capabilities: ["chat", "code"]

  vendor-gpt:
    provider: "vendor"
    name: "gpt-large"
    endpoint: "https://api.vendor.example"
    compliance: "external"
    pricing:
      input_per_1k: 1.0
      output_per_1k: 3.0

  retired:
    provider: "vendor"
    name: "gpt-old"
    endpoint: "https://api.vendor.example"
    compliance: "external"
    enabled: false

  no-provider:
    name: "orphan"
    endpoint: "http://nowhere"
)";
        config.close();
    }

    void testConfigParsing() {
        std::cout << "Testing registry configuration parsing..." << std::endl;

        Arbiter::ModelRegistry registry;
        assert(registry.snapshot()->size() == 0 && "Registry should start empty");

        auto status = registry.loadFromConfig(test_config_path);
        assert(status.total_configured == 4 && "Should see four configured models");
        assert(status.accepted == 3 && "Three descriptors are valid");
        assert(status.rejected == 1 && "Descriptor without provider is rejected");
        assert(status.enabled == 2 && "Disabled model is accepted but not enabled");

        auto snapshot = registry.snapshot();
        auto llama = snapshot->find("onprem-llama");
        assert(llama && "Internal model should be registered");
        assert(llama->provider == "onprem" && "Provider parsed");
        assert(llama->compliance == Arbiter::ComplianceTag::INTERNAL && "Compliance parsed");
        assert(llama->healthKey() == "onprem/llama-3-70b" && "Health key is provider/name");
        assert(std::abs(llama->unitPrice() - 0.3) < 1e-9 && "Unit price sums both prices");

        auto gpt = snapshot->find("vendor-gpt");
        assert(gpt && gpt->isExternal() && "External model parsed");
        assert(snapshot->find("no-provider") == nullptr && "Rejected model is not published");
        assert(!snapshot->find("retired")->enabled && "Disabled flag parsed");

        registry.reloadConfiguration();
        assert(registry.snapshot()->generation() == snapshot->generation() + 1 && "Reload publishes a new generation");
        assert(snapshot->find("onprem-llama") == llama && "Held snapshot is unchanged by a reload");

        std::cout << "✓ Registry configuration parsing test passed" << std::endl;
    }

    void testDescriptorValidation() {
        std::cout << "Testing descriptor validation..." << std::endl;

        Arbiter::ModelRegistry registry;
        std::string error;

        auto valid = makeModel("m1", "onprem", Arbiter::ComplianceTag::INTERNAL);
        assert(registry.validateDescriptor(valid, error) && "Valid descriptor should pass");

        auto no_id = valid;
        no_id.id.clear();
        assert(!registry.validateDescriptor(no_id, error) && "Missing id should fail");

        auto negative = valid;
        negative.price_per_1k_output = -1.0;
        assert(!registry.validateDescriptor(negative, error) && "Negative price should fail");

        auto http = valid;
        http.adapter_type = "http";
        http.endpoint.clear();
        assert(!registry.validateDescriptor(http, error) && "HTTP model without endpoint should fail");
        assert(error.find("endpoint") != std::string::npos && "Error should mention the endpoint");

        std::cout << "✓ Descriptor validation test passed" << std::endl;
    }

    void testSnapshotIsolation() {
        std::cout << "Testing snapshot isolation across publishes..." << std::endl;

        Arbiter::ModelRegistry registry;
        registry.publish({makeModel("a", "p", Arbiter::ComplianceTag::INTERNAL)});
        auto first = registry.snapshot();

        registry.publish({makeModel("b", "p", Arbiter::ComplianceTag::INTERNAL)});
        auto second = registry.snapshot();

        assert(first->find("a") && !first->find("b") && "Old snapshot must be unchanged");
        assert(second->find("b") && !second->find("a") && "New snapshot replaces the model set");
        assert(second->generation() > first->generation() && "Generation increases on publish");

        auto status = registry.publish({makeModel("dup", "p", Arbiter::ComplianceTag::INTERNAL),
                                        makeModel("dup", "p", Arbiter::ComplianceTag::EXTERNAL)});
        assert(status.accepted == 1 && status.rejected == 1 && "Duplicate ids are rejected");
        assert(!registry.snapshot()->find("dup")->isExternal() && "First duplicate wins");

        std::cout << "✓ Snapshot isolation test passed" << std::endl;
    }

    void testAdapterFactories() {
        std::cout << "Testing adapter factory registration..." << std::endl;

        Arbiter::ModelRegistry registry;
        auto model = makeModel("m1", "onprem", Arbiter::ComplianceTag::INTERNAL);
        assert(registry.adapterFor(model) == nullptr && "No factory for the scripted type yet");

        int created = 0;
        auto adapter = std::make_shared<ScriptedAdapter>();
        registry.registerAdapterFactory("scripted", [&created, adapter](const Arbiter::ModelDescriptor&) {
            created++;
            return adapter;
        });

        auto first = registry.adapterFor(model);
        auto second = registry.adapterFor(model);
        assert(first == adapter && second == adapter && "Factory adapter returned");
        assert(created == 1 && "Adapters are cached per adapter type");

        auto http_model = makeModel("h", "vendor", Arbiter::ComplianceTag::EXTERNAL);
        http_model.adapter_type = "http";
        http_model.endpoint = "http://localhost:1";
        assert(registry.adapterFor(http_model) != nullptr && "HTTP adapter is built in");

        std::cout << "✓ Adapter factory test passed" << std::endl;
    }

    void testMalformedConfig() {
        std::cout << "Testing malformed configuration handling..." << std::endl;

        std::string bad_path = "test_registry_bad.yml";
        {
            std::ofstream bad(bad_path);
            bad << "models:\n  broken:\n    provider: x\n    compliance: offshore\n";
        }

        Arbiter::ModelRegistry registry;
        bool threw = false;
        try {
            registry.loadFromConfig(bad_path);
        } catch (const Arbiter::ConfigError&) {
            threw = true;
        }
        fs::remove(bad_path);
        assert(threw && "Unknown compliance tag should raise ConfigError");

        threw = false;
        try {
            registry.loadFromConfig("does_not_exist.yml");
        } catch (const Arbiter::ConfigError&) {
            threw = true;
        }
        assert(threw && "Missing file should raise ConfigError");

        std::cout << "✓ Malformed configuration test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ModelRegistry Tests..." << std::endl;
        std::cout << "==============================" << std::endl;

        testConfigParsing();
        testDescriptorValidation();
        testSnapshotIsolation();
        testAdapterFactories();
        testMalformedConfig();

        std::cout << std::endl << "✅ All ModelRegistry tests passed!" << std::endl;
    }
};

int main() {
    try {
        ModelRegistryTest test;
        test.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
