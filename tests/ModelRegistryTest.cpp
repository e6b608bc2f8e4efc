// =================================================================
// tests/ModelRegistryTest.cpp
// =================================================================
// Unit tests for ModelRegistry component.

#include "Sitewatch/ModelRegistry.hpp"
#include "Sitewatch/Errors.hpp"
#include "MockEngineClient.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <vector>

using Sitewatch::Capability;
using SitewatchTest::makeModel;

class ModelRegistryTest {
public:
    ModelRegistryTest() {
        SitewatchTest::quietLogs();
    }

    void testRegisterAndList() {
        std::cout << "Testing registration order..." << std::endl;

        Sitewatch::ModelRegistry registry;
        registry.registerModel(makeModel("damage-detector", "v1", Capability::DAMAGE, "http://d1"));
        registry.registerModel(makeModel("damage-detector", "v2", Capability::DAMAGE, "http://d2"));
        registry.registerModel(makeModel("damage-detector", "v3", Capability::DAMAGE, "http://d3", 0.75, false));
        registry.registerModel(makeModel("material-detector", "v1", Capability::MATERIAL, "http://m1"));

        auto damage = registry.list(Capability::DAMAGE);
        assert(damage.size() == 2 && "Disabled versions should not be listed");
        assert(damage[0].version == "v1" && damage[1].version == "v2" && "List should keep insertion order");
        assert(registry.size() == 4 && "Disabled versions are still registered");
        assert(registry.listModels()[Capability::DAMAGE].size() == 3 && "listModels should include disabled");

        std::cout << "✓ Registration order test passed" << std::endl;
    }

    void testIdempotentRegistration() {
        std::cout << "Testing idempotent registration..." << std::endl;

        Sitewatch::ModelRegistry registry;
        registry.registerModel(makeModel("damage-detector", "v1", Capability::DAMAGE, "http://old", 0.6));
        registry.registerModel(makeModel("damage-detector", "v2", Capability::DAMAGE, "http://d2"));
        registry.registerModel(makeModel("damage-detector", "v1", Capability::DAMAGE, "http://new", 0.8));

        auto damage = registry.list(Capability::DAMAGE);
        assert(damage.size() == 2 && "Same (name, version) should leave one entry");
        assert(damage[0].version == "v1" && "Replaced entry should keep its position");
        assert(damage[0].endpoint == "http://new" && "Latest data should win");
        assert(damage[0].confidence_threshold == 0.8 && "Latest threshold should win");

        // Moving a version to another capability
        registry.registerModel(makeModel("damage-detector", "v2", Capability::VOLUME, "http://v2"));
        assert(registry.list(Capability::DAMAGE).size() == 1 && "Moved version should leave its old capability");
        assert(registry.list(Capability::VOLUME).size() == 1 && "Moved version should appear under the new one");

        std::cout << "✓ Idempotent registration test passed" << std::endl;
    }

    void testUnknownCapability() {
        std::cout << "Testing unknown capability..." << std::endl;

        Sitewatch::ModelRegistry registry;
        registry.registerModel(makeModel("damage-detector", "v1", Capability::DAMAGE, "http://d1"));

        bool threw = false;
        try {
            registry.list(Capability::VOLUME);
        } catch (const Sitewatch::UnknownCapabilityError& e) {
            threw = true;
            assert(e.kind() == "UnknownCapability" && "Error should carry its taxonomy name");
        }
        assert(threw && "Listing an unregistered capability should throw");
        assert(!registry.hasCapability(Capability::VOLUME) && "Capability should be unknown");

        std::cout << "✓ Unknown capability test passed" << std::endl;
    }

    void testGetDefaultAndByName() {
        std::cout << "Testing get..." << std::endl;

        Sitewatch::ModelRegistry registry;
        registry.registerModel(makeModel("damage-detector", "v1", Capability::DAMAGE, "http://d1"));
        registry.registerModel(makeModel("damage-lite", "v1", Capability::DAMAGE, "http://lite"));
        registry.registerModel(makeModel("damage-detector", "v2", Capability::DAMAGE, "http://d2", 0.75, false));

        auto latest = registry.get(Capability::DAMAGE);
        assert(latest.name == "damage-lite" && "Default should be the latest enabled registration");

        auto named = registry.get(Capability::DAMAGE, "damage-detector");
        assert(named.version == "v1" && "Disabled v2 should be skipped");

        bool threw = false;
        try {
            registry.get(Capability::DAMAGE, "does-not-exist");
        } catch (const Sitewatch::NoHealthyEngineError&) {
            threw = true;
        }
        assert(threw && "Unknown model name should raise NoHealthyEngine");

        std::cout << "✓ Get test passed" << std::endl;
    }

    void testABTests() {
        std::cout << "Testing A/B test administration..." << std::endl;

        Sitewatch::ModelRegistry registry;
        auto a = makeModel("damage-detector", "v1", Capability::DAMAGE, "http://d1");
        auto b = makeModel("damage-detector", "v2", Capability::DAMAGE, "http://d2");
        auto m = makeModel("material-detector", "v1", Capability::MATERIAL, "http://m1");
        registry.registerModel(a);
        registry.registerModel(b);
        registry.registerModel(m);

        Sitewatch::ABTestConfig test;
        test.experiment_id = "damage-canary";
        test.model_a = a;
        test.model_b = b;
        test.traffic_split = 0.9;
        registry.createABTest(test);

        auto active = registry.activeABTest(Capability::DAMAGE);
        assert(active && active->experiment_id == "damage-canary" && "Experiment should be active");
        assert(!registry.activeABTest(Capability::MATERIAL) && "Other capabilities unaffected");

        Sitewatch::ABTestConfig mismatched = test;
        mismatched.experiment_id = "bad";
        mismatched.model_b = m;
        bool threw = false;
        try {
            registry.createABTest(mismatched);
        } catch (const Sitewatch::OrchestratorError&) {
            threw = true;
        }
        assert(threw && "Cross-capability experiments should be rejected");

        Sitewatch::ABTestConfig bad_split = test;
        bad_split.traffic_split = 1.5;
        threw = false;
        try {
            registry.createABTest(bad_split);
        } catch (const Sitewatch::OrchestratorError&) {
            threw = true;
        }
        assert(threw && "Split outside [0, 1] should be rejected");

        assert(registry.removeABTest("damage-canary") && "Removal should succeed");
        assert(!registry.removeABTest("damage-canary") && "Second removal should report nothing removed");
        assert(!registry.activeABTest(Capability::DAMAGE) && "Removed experiment should be inactive");

        std::cout << "✓ A/B administration test passed" << std::endl;
    }

    void testLoadFromConfig() {
        std::cout << "Testing configuration loading..." << std::endl;

        Sitewatch::ApplicationConfig config;
        config.models = Sitewatch::ConfigParser::defaultModels();
        config.models.push_back(makeModel("damage-detector", "v1.3.0-rc1", Capability::DAMAGE, "http://canary"));

        Sitewatch::ABTestSpec good;
        good.experiment_id = "damage-canary";
        good.model_a_name = "damage-detector";
        good.model_a_version = "v1.2.0";
        good.model_b_name = "damage-detector";
        good.model_b_version = "v1.3.0-rc1";
        good.traffic_split = 0.9;

        Sitewatch::ABTestSpec dangling = good;
        dangling.experiment_id = "dangling";
        dangling.model_b_version = "v9";

        config.ab_tests = {good, dangling};

        Sitewatch::ModelRegistry registry;
        auto status = registry.loadFromConfig(config);

        assert(status.total_configured == 6 && "Four models and two experiments configured");
        assert(status.successfully_loaded == 5 && "Dangling experiment should fail");
        assert(status.failed_to_load == 1 && "One entry should be rejected");
        assert(status.enabled_versions == 4 && "Four enabled versions");
        assert(registry.listABTests().size() == 1 && "Only the valid experiment should exist");

        std::cout << "✓ Configuration loading test passed" << std::endl;
    }

    void testConcurrentReads() {
        std::cout << "Testing concurrent reads and writes..." << std::endl;

        Sitewatch::ModelRegistry registry;
        registry.registerModel(makeModel("damage-detector", "v0", Capability::DAMAGE, "http://d0"));

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&registry]() {
                for (int i = 0; i < 200; ++i) {
                    auto versions = registry.list(Capability::DAMAGE);
                    assert(!versions.empty() && "Readers should always see the first version");
                }
            });
        }
        threads.emplace_back([&registry]() {
            for (int i = 1; i <= 50; ++i) {
                registry.registerModel(makeModel("damage-detector", "v" + std::to_string(i),
                                                 Capability::DAMAGE, "http://d" + std::to_string(i)));
            }
        });
        for (auto& thread : threads) {
            thread.join();
        }

        assert(registry.list(Capability::DAMAGE).size() == 51 && "All writes should be applied");

        std::cout << "✓ Concurrency test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ModelRegistry tests..." << std::endl;
        std::cout << std::endl;

        testRegisterAndList();
        testIdempotentRegistration();
        testUnknownCapability();
        testGetDefaultAndByName();
        testABTests();
        testLoadFromConfig();
        testConcurrentReads();

        std::cout << std::endl;
        std::cout << "All ModelRegistry tests passed!" << std::endl;
    }
};

int main() {
    try {
        ModelRegistryTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
