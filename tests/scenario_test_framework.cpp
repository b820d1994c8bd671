#include "scenario_test_framework.hpp"
#include <chrono>
#include <algorithm>

namespace bayes_period {
namespace test_framework {

// ScenarioTestRegistry implementation
void ScenarioTestRegistry::register_scenario(const std::string& name,
                                             ScenarioBuilderFunction builder_func,
                                             const ScenarioTestMetadata& metadata) {
    auto [it, inserted] = scenarios_.insert_or_assign(name, RegisteredScenario{std::move(builder_func), metadata});
    if (!inserted) {
        for (auto& [category, names] : categories_) {
            names.erase(std::remove(names.begin(), names.end(), name), names.end());
        }
    }
    categories_[it->second.metadata.category].push_back(name);
}

std::optional<ScenarioTestRegistry::RegisteredScenario>
ScenarioTestRegistry::get_scenario(const std::string& name) const {
    auto it = scenarios_.find(name);
    if (it == scenarios_.end()) { return std::nullopt; }
    return it->second;
}

std::vector<std::string>
ScenarioTestRegistry::get_scenarios_in_category(const std::string& category) const {
    auto it = categories_.find(category);
    return it == categories_.end() ? std::vector<std::string>{} : it->second;
}

// ScenarioTestExecutor implementation
ScenarioTestExecutor::TestResults
ScenarioTestExecutor::execute_test(const std::string& scenario_name,
                                   const TestConfiguration& config) {
    auto scenario_opt = registry_.get_scenario(scenario_name);
    if (!scenario_opt) {
        TestResults results;
        results.error_message = "Scenario '" + scenario_name + "' not found in registry";
        return results;
    }

    return execute_test_with_overrides(scenario_name, scenario_opt->metadata, config);
}

ScenarioTestExecutor::TestResults
ScenarioTestExecutor::execute_test_with_overrides(const std::string& scenario_name,
                                                  const ScenarioTestMetadata& metadata,
                                                  const TestConfiguration& config) {
    TestResults results;
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        auto scenario_opt = registry_.get_scenario(scenario_name);
        if (!scenario_opt) {
            results.error_message = "Scenario '" + scenario_name + "' not found in registry";
            return results;
        }

        // Build the problem and synthesize its register histogram
        ScenarioInstance instance = scenario_opt->builder_func();
        const auto& problem = instance.problem;
        results.true_period = instance.true_period;
        results.shots = metadata.shots;

        MeasurementBatch histogram = test_utils::synthetic_period_histogram(
            instance.true_period, problem.phase_bits, metadata.shots, metadata.noise_rate, metadata.seed);
        NoiseModel noise;
        noise.error_rate = metadata.noise_rate;

        auto setup_end = std::chrono::high_resolution_clock::now();
        results.setup_time_ms = std::chrono::duration<double, std::milli>(setup_end - start_time).count();

        // Run the extraction pipeline
        auto extraction = instances::extract_period(problem, histogram, noise, metadata.extraction_config,
                                                    config.inference_config);
        auto extraction_end = std::chrono::high_resolution_clock::now();
        results.extraction_time_ms = std::chrono::duration<double, std::milli>(extraction_end - setup_end).count();

        results.found_period = extraction.period;
        results.method = extraction.method;
        results.confidence = extraction.confidence;

        if (!extraction.period) {
            results.error_message = "No period recovered";
            return results;
        }

        std::int64_t expected = metadata.expected_period.value_or(instance.true_period);
        if (*extraction.period != expected) {
            results.error_message = "Recovered period " + std::to_string(*extraction.period) +
                                    ", expected " + std::to_string(expected);
            return results;
        }

        if (config.check_method && metadata.expected_method && *metadata.expected_method != extraction.method) {
            results.error_message = "Period found by stage " + instances::to_string(extraction.method) +
                                    ", expected " + instances::to_string(*metadata.expected_method);
            return results;
        }

        results.factors = instances::factors_from_period(problem.modulus, problem.base, *extraction.period);
        if (config.check_factors && metadata.expected_factors && results.factors != metadata.expected_factors) {
            results.error_message = "Factorization did not match the expected factor pair";
            return results;
        }

        results.success = true;
    } catch (const std::exception& e) {
        results.error_message = "Exception: " + std::string(e.what());
    }

    return results;
}

std::map<std::string, ScenarioTestExecutor::TestResults>
ScenarioTestExecutor::execute_category_tests(const std::string& category,
                                             const TestConfiguration& config) {
    std::map<std::string, TestResults> all_results;
    for (const auto& name : registry_.get_scenarios_in_category(category)) {
        all_results[name] = execute_test(name, config);
    }
    return all_results;
}

namespace metadata_builders {

ScenarioTestMetadata create_semiprime_metadata(const std::string& name,
                                               const std::string& description,
                                               std::int64_t smaller_factor,
                                               std::int64_t larger_factor) {
    ScenarioTestMetadata metadata;
    metadata.name = name;
    metadata.category = "small_semiprime";
    metadata.description = description;
    metadata.expected_factors = std::make_pair(smaller_factor, larger_factor);
    metadata.expected_method = instances::ExtractionMethod::DivisorSearch;
    metadata.shots = 2000;
    metadata.noise_rate = 0.02;
    return metadata;
}

ScenarioTestMetadata create_noisy_metadata(const std::string& name,
                                           const std::string& description,
                                           double noise_rate,
                                           std::int64_t shots) {
    ScenarioTestMetadata metadata;
    metadata.name = name;
    metadata.category = "noisy";
    metadata.description = description;
    metadata.noise_rate = noise_rate;
    metadata.shots = shots;
    return metadata;
}

} // namespace metadata_builders

// Global registry
static ScenarioTestRegistry global_registry;

ScenarioTestRegistry& get_global_scenario_registry() {
    return global_registry;
}

} // namespace test_framework
} // namespace bayes_period
