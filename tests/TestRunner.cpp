// =================================================================
// tests/TestRunner.cpp
// =================================================================
// Runs every test executable built next to this runner.

#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <cstdlib>

struct TestSuite {
    std::string name;
    std::string executable;
};

class TestRunner {
private:
    std::vector<TestSuite> test_suites;
    std::string directory;

    int runSuite(const TestSuite& suite) const {
        std::string command = "\"" + directory + "/" + suite.executable + "\"";
        return std::system(command.c_str());
    }

public:
    explicit TestRunner(const std::string& dir) : directory(dir) {
        // Ordered bottom-up: data model first, full engine last
        test_suites = {
            {"ModelRegistry", "ModelRegistryTest"},
            {"PolicyStore", "PolicyStoreTest"},
            {"PolicyEvaluator", "PolicyEvaluatorTest"},
            {"SubscriptionResolver", "SubscriptionResolverTest"},
            {"ComplianceFilter", "ComplianceFilterTest"},
            {"HealthTracker", "HealthTrackerTest"},
            {"BudgetGate", "BudgetGateTest"},
            {"ExperimentOverlay", "ExperimentOverlayTest"},
            {"CandidateSelector", "CandidateSelectorTest"},
            {"InvocationOrchestrator", "InvocationOrchestratorTest"},
            {"OutputFirewall", "OutputFirewallTest"},
            {"LineageRecorder", "LineageRecorderTest"},
            {"ConfigLoader", "ConfigLoaderTest"},
            {"Integration", "IntegrationTest"}
        };
    }

    int runAllTests() {
        std::cout << "🚀 Starting Arbiter Test Suite" << std::endl;
        std::cout << "==============================" << std::endl << std::endl;

        auto start_time = std::chrono::steady_clock::now();

        int total_tests = test_suites.size();
        int passed_tests = 0;
        int failed_tests = 0;

        for (const auto& suite : test_suites) {
            std::cout << "Running " << suite.name << " tests..." << std::endl;
            std::cout << std::string(40, '-') << std::endl;

            auto suite_start = std::chrono::steady_clock::now();
            int result = runSuite(suite);
            auto suite_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - suite_start);

            if (result == 0) {
                std::cout << "✅ " << suite.name << " tests PASSED";
                std::cout << " (took " << suite_duration.count() << "ms)" << std::endl;
                passed_tests++;
            } else {
                std::cout << "❌ " << suite.name << " tests FAILED";
                std::cout << " (exit code: " << result << ")" << std::endl;
                failed_tests++;
            }

            std::cout << std::endl;
        }

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        // Print summary
        std::cout << "Test Summary" << std::endl;
        std::cout << "============" << std::endl;
        std::cout << "Total test suites: " << total_tests << std::endl;
        std::cout << "Passed: " << passed_tests << std::endl;
        std::cout << "Failed: " << failed_tests << std::endl;
        std::cout << "Total time: " << total_duration.count() << "ms" << std::endl;

        if (failed_tests == 0) {
            std::cout << std::endl << "🎉 All tests passed!" << std::endl;
            return 0;
        }
        std::cout << std::endl << "💥 " << failed_tests << " test suite(s) failed!" << std::endl;
        return 1;
    }

    int runSpecificTest(const std::string& test_name) {
        for (const auto& suite : test_suites) {
            if (suite.name == test_name) {
                std::cout << "Running " << test_name << " tests only..." << std::endl;
                return runSuite(suite) == 0 ? 0 : 1;
            }
        }

        std::cerr << "Test suite '" << test_name << "' not found!" << std::endl;
        listTests(std::cerr);
        return 1;
    }

    void listTests(std::ostream& out = std::cout) const {
        out << "Available test suites:" << std::endl;
        for (const auto& suite : test_suites) {
            out << "  - " << suite.name << std::endl;
        }
    }
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --help, -h          Show this help message" << std::endl;
    std::cout << "  --list, -l          List available test suites" << std::endl;
    std::cout << "  --test <name>       Run specific test suite" << std::endl;
    std::cout << "  --dir <path>        Directory holding the test executables (default: .)" << std::endl;
    std::cout << "  (no arguments)      Run all test suites" << std::endl;
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    std::string directory = ".";
    std::string test_name;
    bool list = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--list" || arg == "-l") {
            list = true;
        } else if (arg == "--test" && i + 1 < argc) {
            test_name = argv[++i];
        } else if (arg == "--dir" && i + 1 < argc) {
            directory = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    TestRunner runner(directory);
    if (list) {
        runner.listTests();
        return 0;
    }
    if (!test_name.empty()) {
        return runner.runSpecificTest(test_name);
    }
    return runner.runAllTests();
}
